#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "sec_subledger/monitoring/metric_registry.h"
#include "sec_subledger/services/subledger_pipeline.h"

namespace sec_subledger {
namespace {

Trade MakeTrade(const std::string& id,
                const std::string& customer,
                const std::string& isin,
                const std::string& date,
                TradeSide side,
                double quantity,
                double price) {
    Trade trade;
    trade.trade_id = id;
    trade.customer_id = customer;
    trade.instrument_id = isin;
    trade.currency = "GBP";
    trade.trade_date = date;
    trade.side = side;
    trade.quantity = quantity;
    trade.price = price;
    return trade;
}

PositionSnapshot MakePosition(const std::string& customer, const std::string& isin, double qty) {
    return PositionSnapshot{customer, isin, "GBP", "2025-01-06", qty};
}

ValuationSnapshot MakeValuation(const std::string& customer,
                                const std::string& isin,
                                const std::string& date,
                                double mtm) {
    return ValuationSnapshot{customer, isin, "GBP", date, mtm};
}

SubledgerInputs BalancedInputs() {
    SubledgerInputs inputs;
    inputs.trades = {
        MakeTrade("T0003", "CIF001", "GB1", "2025-01-04", TradeSide::kSell, 100.0, 18.0),
        MakeTrade("T0001", "CIF001", "GB1", "2025-01-02", TradeSide::kBuy, 100.0, 10.0),
        MakeTrade("T0002", "CIF001", "GB1", "2025-01-03", TradeSide::kBuy, 100.0, 20.0),
        MakeTrade("T0004", "CIF002", "GB2", "2025-01-02", TradeSide::kBuy, 10.0, 5.0),
        MakeTrade("T0005", "CIF002", "GB2", "2025-01-03", TradeSide::kBuy, 30.0, 5.0),
    };
    inputs.positions = {MakePosition("CIF001", "GB1", 100.0), MakePosition("CIF002", "GB2", 40.0)};
    inputs.valuations = {MakeValuation("CIF001", "GB1", "", 50.0),
                         MakeValuation("CIF002", "GB2", "", -8.0)};
    inputs.mtm_timeseries = {
        MakeValuation("CIF001", "GB1", "2025-01-03", 30.0),
        MakeValuation("CIF001", "GB1", "2025-01-06", 50.0),
        MakeValuation("CIF002", "GB2", "2025-01-03", -2.0),
        MakeValuation("CIF002", "GB2", "2025-01-06", -8.0),
    };
    return inputs;
}

SubledgerConfig QuietConfig(int max_concurrent) {
    SubledgerConfig config;
    config.run.as_of_date = "2025-01-06";
    config.run.max_concurrent = max_concurrent;
    config.logging.level = "error";
    return config;
}

class FakeRecordSource : public ISubledgerRecordSource {
public:
    explicit FakeRecordSource(SubledgerInputs inputs, bool fail_positions = false)
        : inputs_(std::move(inputs)), fail_positions_(fail_positions) {}

    bool LoadTrades(std::vector<Trade>* out, std::string* error) const override {
        (void)error;
        *out = inputs_.trades;
        return true;
    }
    bool LoadPositions(std::vector<PositionSnapshot>* out, std::string* error) const override {
        if (fail_positions_) {
            *error = "positions feed unavailable";
            return false;
        }
        *out = inputs_.positions;
        return true;
    }
    bool LoadValuations(std::vector<ValuationSnapshot>* out, std::string* error) const override {
        (void)error;
        *out = inputs_.valuations;
        return true;
    }
    bool LoadMtmTimeseries(std::vector<ValuationSnapshot>* out,
                           std::string* error) const override {
        (void)error;
        *out = inputs_.mtm_timeseries;
        return true;
    }
    bool LoadThinLedger(std::vector<ThinLedgerBalance>* out, std::string* error) const override {
        (void)error;
        *out = inputs_.thin_ledger;
        return true;
    }

private:
    SubledgerInputs inputs_;
    bool fail_positions_{false};
};

std::string Describe(const GlPosting& posting) {
    return posting.posting_date + "|" + posting.deal_id.value_or("-") + "|" +
           posting.customer_id + "|" + std::to_string(posting.account_code) + "|" +
           ToString(posting.dr_cr) + "|" + std::to_string(posting.amount) + "|" +
           ToString(posting.posting_type);
}

}  // namespace

TEST(SubledgerPipelineTest, ConsistentInputsProduceNoBreaks) {
    const SubledgerPipeline pipeline(QuietConfig(1));
    SubledgerRunResult result;
    std::string error;
    ASSERT_TRUE(pipeline.Process(BalancedInputs(), &result, &error)) << error;

    EXPECT_EQ(result.breaks.total(), 0);
    EXPECT_TRUE(result.oversells.empty());
    EXPECT_TRUE(result.degenerate_sales.empty());

    ASSERT_EQ(result.open_trades.size(), 3U);
    EXPECT_EQ(result.open_trades[0].trade.trade_id, "T0002");
    ASSERT_EQ(result.allocated_trades.size(), 3U);
    EXPECT_DOUBLE_EQ(result.allocated_trades[0].mtm_allocated, 50.0);
    EXPECT_DOUBLE_EQ(result.allocated_trades[1].mtm_allocated, -2.0);
    EXPECT_DOUBLE_EQ(result.allocated_trades[2].mtm_allocated, -6.0);

    // Trade postings come first, then MTM postings.
    ASSERT_EQ(result.gl_postings.size(),
              result.trade_postings.size() + result.mtm_postings.size());
    EXPECT_TRUE(result.gl_postings.front().deal_id.has_value());
    EXPECT_FALSE(result.gl_postings.back().deal_id.has_value());

    double net = 0.0;
    for (const auto& posting : result.gl_postings) {
        net += posting.signed_amount();
    }
    EXPECT_NEAR(net, 0.0, 1e-9);
    EXPECT_EQ(result.position_control.size(), 2U);
    EXPECT_EQ(result.trade_control.buys.size(), 4U);
    EXPECT_EQ(result.trade_control.sells.size(), 1U);
    EXPECT_EQ(result.mtm_delta_control.size(), 2U);
    EXPECT_FALSE(result.thin_ledger.empty());
}

TEST(SubledgerPipelineTest, ResultsDoNotDependOnWorkerCount) {
    SubledgerRunResult serial;
    SubledgerRunResult parallel;
    std::string error;
    ASSERT_TRUE(SubledgerPipeline(QuietConfig(1)).Process(BalancedInputs(), &serial, &error))
        << error;
    ASSERT_TRUE(SubledgerPipeline(QuietConfig(4)).Process(BalancedInputs(), &parallel, &error))
        << error;

    ASSERT_EQ(serial.gl_postings.size(), parallel.gl_postings.size());
    for (std::size_t index = 0; index < serial.gl_postings.size(); ++index) {
        EXPECT_EQ(Describe(serial.gl_postings[index]), Describe(parallel.gl_postings[index]));
    }
    ASSERT_EQ(serial.matched_trades.size(), parallel.matched_trades.size());
    for (std::size_t index = 0; index < serial.matched_trades.size(); ++index) {
        EXPECT_EQ(serial.matched_trades[index].trade.trade_id,
                  parallel.matched_trades[index].trade.trade_id);
        EXPECT_EQ(serial.matched_trades[index].remaining_quantity,
                  parallel.matched_trades[index].remaining_quantity);
    }
    ASSERT_EQ(serial.thin_ledger.size(), parallel.thin_ledger.size());
    for (std::size_t index = 0; index < serial.thin_ledger.size(); ++index) {
        EXPECT_EQ(serial.thin_ledger[index].balance, parallel.thin_ledger[index].balance);
    }
}

TEST(SubledgerPipelineTest, AsOfDateExcludesLaterActivity) {
    SubledgerInputs inputs = BalancedInputs();
    inputs.trades.push_back(
        MakeTrade("T0099", "CIF001", "GB1", "2025-01-09", TradeSide::kBuy, 500.0, 1.0));
    inputs.mtm_timeseries.push_back(MakeValuation("CIF001", "GB1", "2025-01-09", 999.0));
    inputs.thin_ledger.push_back(ThinLedgerBalance{"2025-01-09", 200100, "GBP", 1.0});

    const SubledgerPipeline pipeline(QuietConfig(2));
    SubledgerRunResult result;
    std::string error;
    ASSERT_TRUE(pipeline.Process(inputs, &result, &error)) << error;
    EXPECT_EQ(result.breaks.total(), 0);
    for (const auto& posting : result.gl_postings) {
        EXPECT_LE(posting.posting_date, "2025-01-06");
    }
    EXPECT_TRUE(result.thin_ledger_control.empty());
}

TEST(SubledgerPipelineTest, CountsBreaksAndReportsOversells) {
    SubledgerInputs inputs = BalancedInputs();
    inputs.trades.push_back(
        MakeTrade("T0006", "CIF002", "GB2", "2025-01-05", TradeSide::kSell, 50.0, 6.0));
    inputs.thin_ledger = {ThinLedgerBalance{"2025-01-06", 100000, "GBP", 0.0}};

    const SubledgerPipeline pipeline(QuietConfig(1));
    SubledgerRunResult result;
    std::string error;
    ASSERT_TRUE(pipeline.Process(inputs, &result, &error)) << error;

    ASSERT_EQ(result.oversells.size(), 1U);
    EXPECT_EQ(result.oversells[0].trade_id, "T0006");
    EXPECT_DOUBLE_EQ(result.oversells[0].unmatched_quantity, 10.0);
    // FIFO now holds 0 against a feed of 40.
    EXPECT_EQ(result.breaks.position, 1);
    EXPECT_EQ(result.breaks.thin_ledger, 1);
    EXPECT_EQ(result.breaks.journal_daily, 0);
    EXPECT_EQ(result.breaks.trade_sell, 0);
    EXPECT_GE(result.breaks.total(), 2);
}

TEST(SubledgerPipelineTest, PublishesBreakCountsAsMetrics) {
    SubledgerInputs inputs = BalancedInputs();
    inputs.thin_ledger = {ThinLedgerBalance{"2025-01-06", 100000, "GBP", 0.0}};
    const SubledgerPipeline pipeline(QuietConfig(1));
    SubledgerRunResult result;
    std::string error;
    ASSERT_TRUE(pipeline.Process(inputs, &result, &error)) << error;
    ASSERT_EQ(result.breaks.thin_ledger, 1);

    std::string text;
    if (!MetricRegistry::Enabled()) {
        EXPECT_FALSE(MetricRegistry::Instance().RenderText(&text, &error));
        return;
    }
    ASSERT_TRUE(MetricRegistry::Instance().RenderText(&text, &error)) << error;
    EXPECT_NE(text.find("sec_subledger_control_breaks{control=\"thin_ledger\"} 1"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("sec_subledger_control_breaks{control=\"position\"} 0"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("sec_subledger_run_duration_seconds_count"), std::string::npos);
}

TEST(SubledgerPipelineTest, RejectPolicyFailsTheRun) {
    SubledgerInputs inputs = BalancedInputs();
    inputs.trades.push_back(
        MakeTrade("T0006", "CIF002", "GB2", "2025-01-05", TradeSide::kSell, 50.0, 6.0));
    SubledgerConfig config = QuietConfig(2);
    config.policies.oversell = OversellPolicy::kReject;

    SubledgerRunResult result;
    std::string error;
    EXPECT_FALSE(SubledgerPipeline(config).Process(inputs, &result, &error));
    EXPECT_NE(error.find("T0006"), std::string::npos) << error;
}

TEST(SubledgerPipelineTest, RunPropagatesSourceErrors) {
    const SubledgerPipeline pipeline(QuietConfig(1));
    SubledgerRunResult result;
    std::string error;

    ASSERT_TRUE(pipeline.Run(FakeRecordSource(BalancedInputs()), &result, &error)) << error;
    EXPECT_EQ(result.breaks.total(), 0);

    EXPECT_FALSE(pipeline.Run(FakeRecordSource(BalancedInputs(), true), &result, &error));
    EXPECT_EQ(error, "positions feed unavailable");
}

}  // namespace sec_subledger
