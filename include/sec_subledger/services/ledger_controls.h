#pragma once

#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

class LedgerControls {
public:
    explicit LedgerControls(ControlConfig config = {});

    // Each supplied thin-ledger row against the journal balance rebuilt as of
    // its date for the same (account, currency). Accounts with no postings
    // rebuild to 0. difference = balance_thin_ledger - balance_from_journals.
    std::vector<ThinLedgerControlRecord> BuildThinLedgerControl(
        const std::vector<ThinLedgerBalance>& thin_ledger,
        const std::vector<LedgerBalance>& rebuilt) const;

    // Debit and credit totals per (date, currency); a nonzero net is a break.
    std::vector<JournalDailyTotal> BuildJournalDailyTotals(
        const std::vector<GlPosting>& postings) const;

private:
    ControlConfig config_;
};

}  // namespace sec_subledger
