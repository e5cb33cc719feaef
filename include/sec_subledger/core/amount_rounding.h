#pragma once

namespace sec_subledger {

// Half-up decimal rounding for reconciliation differences. Values are scaled
// to an integer count of 10^-scale units so that float noise below the
// configured scale collapses to an exact zero.
class AmountRounding {
public:
    static double Round(double value, int scale);
    static bool IsBreak(double difference, double tolerance);
};

}  // namespace sec_subledger
