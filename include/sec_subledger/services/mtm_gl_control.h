#pragma once

#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

// Revaluation-account reconciliations of the MTM journal against the source
// valuation series. Revaluation postings are signed Dr + / Cr -.
class MtmGlControl {
public:
    MtmGlControl(AccountCodes accounts, ControlConfig config = {});

    // One row per source (group, date). The GL balance is the running sum of
    // the group's daily revaluation change; a date without postings carries
    // the previous balance. difference = gl_mtm_balance - fo_mtm.
    std::vector<MtmGlControlRecord> Build(const std::vector<ValuationSnapshot>& series,
                                          const std::vector<GlPosting>& postings) const;

    // Per date, totals of Build() rows across every group.
    std::vector<PortfolioMtmControlRecord> BuildPortfolio(
        const std::vector<MtmGlControlRecord>& level_rows) const;

    // Per (group, date) after the group's first date:
    // difference = (fo_mtm(d) - fo_mtm(prev)) - net revaluation postings on d.
    std::vector<MtmDeltaControlRecord> BuildDelta(const std::vector<ValuationSnapshot>& series,
                                                  const std::vector<GlPosting>& postings) const;

private:
    double RoundDifference(double value) const;

    AccountCodes accounts_;
    ControlConfig config_;
};

}  // namespace sec_subledger
