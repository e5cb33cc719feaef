#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

class ISubledgerRecordSource {
public:
    virtual ~ISubledgerRecordSource() = default;

    virtual bool LoadTrades(std::vector<Trade>* out, std::string* error) const = 0;
    virtual bool LoadPositions(std::vector<PositionSnapshot>* out, std::string* error) const = 0;
    // Single-date position valuations used by the allocator.
    virtual bool LoadValuations(std::vector<ValuationSnapshot>* out, std::string* error) const = 0;
    // Dated valuation series used by the MTM roll-forward poster.
    virtual bool LoadMtmTimeseries(std::vector<ValuationSnapshot>* out,
                                   std::string* error) const = 0;
    virtual bool LoadThinLedger(std::vector<ThinLedgerBalance>* out, std::string* error) const = 0;
};

}  // namespace sec_subledger
