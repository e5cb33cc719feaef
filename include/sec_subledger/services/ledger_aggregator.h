#pragma once

#include <vector>

#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

// Thin ledger: signed (Dr + / Cr -) day change per (account, currency, date)
// over every posting, with a running balance per (account, currency).
// Rows are ordered by (account, currency, date).
std::vector<LedgerBalance> AggregateThinLedger(const std::vector<GlPosting>& postings);

}  // namespace sec_subledger
