#include "sec_subledger/core/csv_record_writer.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace sec_subledger {
namespace {

std::filesystem::path MakeTempDir(const std::string& stem) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(stamp));
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(CsvRecordWriterTest, EscapesAndFormatsCells) {
    EXPECT_EQ(CsvEscape("plain"), "plain");
    EXPECT_EQ(CsvEscape("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(CsvDouble(1500.0), "1500.00000000");
    EXPECT_EQ(CsvDouble(-0.125), "-0.12500000");
}

TEST(CsvRecordWriterTest, WritesPostingsWithNullDealIdAsEmptyCell) {
    const auto dir = MakeTempDir("csv_writer_postings");
    CsvRecordWriter writer(dir.string());

    GlPosting purchase;
    purchase.posting_date = "2025-01-02";
    purchase.deal_id = "T0001";
    purchase.customer_id = "CIF001";
    purchase.instrument_id = "GB1";
    purchase.currency = "GBP";
    purchase.account_code = 200100;
    purchase.dr_cr = DebitCredit::kDebit;
    purchase.amount = 1000.0;
    purchase.posting_type = PostingType::kPurchase;
    GlPosting mtm = purchase;
    mtm.deal_id.reset();
    mtm.account_code = 400200;
    mtm.dr_cr = DebitCredit::kCredit;
    mtm.amount = 50.0;
    mtm.posting_type = PostingType::kMtmReversal;

    std::string error;
    ASSERT_TRUE(writer.WriteGlPostings("gl_postings.csv", {purchase, mtm}, &error)) << error;
    const auto lines = ReadLines(dir / "gl_postings.csv");
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0],
              "posting_date,deal_id,customer_id,isin,ccy,account_code,dr_cr,amount,posting_type");
    EXPECT_EQ(lines[1], "2025-01-02,T0001,CIF001,GB1,GBP,200100,DR,1000.00000000,PURCHASE");
    EXPECT_EQ(lines[2], "2025-01-02,,CIF001,GB1,GBP,400200,CR,50.00000000,MTM_REVERSAL");
    ASSERT_EQ(writer.written_files().size(), 1U);
    EXPECT_EQ(writer.written_files()[0], (dir / "gl_postings.csv").string());
}

TEST(CsvRecordWriterTest, WritesControlRowsWithMissingValuesBlank) {
    const auto dir = MakeTempDir("csv_writer_controls");
    CsvRecordWriter writer(dir.string());

    AllocationControlRecord missing;
    missing.group = GroupKey{"CIF002", "GB2", "GBP"};
    missing.snapshot_date = "2025-01-06";
    missing.allocated_mtm = 0.0;
    missing.valuation_missing = true;
    missing.is_break = true;

    PositionControlRecord position;
    position.group = GroupKey{"CIF001", "GB1", "GBP"};
    position.fifo_position_qty = 60.0;
    position.position_quantity = 60.0;

    std::string error;
    ASSERT_TRUE(writer.WriteAllocationControl({missing}, &error)) << error;
    ASSERT_TRUE(writer.WritePositionControl({position}, &error)) << error;
    ASSERT_TRUE(writer.WriteOversells({}, &error)) << error;

    const auto allocation = ReadLines(dir / "control_allocation.csv");
    ASSERT_EQ(allocation.size(), 2U);
    EXPECT_EQ(allocation[1], "CIF002,GB2,GBP,2025-01-06,0.00000000,,0.00000000,true,true");

    const auto positions = ReadLines(dir / "control_position.csv");
    ASSERT_EQ(positions.size(), 2U);
    EXPECT_EQ(positions[1], "CIF001,GB1,GBP,60.00000000,60.00000000,0.00000000,false,false");

    // Empty record sets still produce a header-only file.
    const auto oversells = ReadLines(dir / "oversells.csv");
    ASSERT_EQ(oversells.size(), 1U);
    EXPECT_EQ(writer.written_files().size(), 3U);
}

TEST(CsvRecordWriterTest, FailsWithoutOutputDirectory) {
    CsvRecordWriter writer("");
    std::string error;
    EXPECT_FALSE(writer.WriteThinLedger({}, &error));
    EXPECT_NE(error.find("output directory"), std::string::npos) << error;
    EXPECT_TRUE(writer.written_files().empty());
}

}  // namespace
}  // namespace sec_subledger
