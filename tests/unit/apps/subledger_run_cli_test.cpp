#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/wait.h>

#ifndef SEC_SUBLEDGER_BUILD_DIR
#error "SEC_SUBLEDGER_BUILD_DIR is required"
#endif
#ifndef SEC_SUBLEDGER_SOURCE_DIR
#error "SEC_SUBLEDGER_SOURCE_DIR is required"
#endif

namespace {

std::filesystem::path BinaryPath() {
    return std::filesystem::path(SEC_SUBLEDGER_BUILD_DIR) / "subledger_run_cli";
}

std::filesystem::path SampleConfig() {
    return std::filesystem::path(SEC_SUBLEDGER_SOURCE_DIR) / "configs" / "subledger.yaml";
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

int RunCommandCapture(const std::string& command, const std::filesystem::path& output_file) {
    const std::string shell_command = command + " > \"" + output_file.string() + "\" 2>&1";
    const int status = std::system(shell_command.c_str());
    if (status == -1) {
        return -1;
    }
    return WEXITSTATUS(status);
}

std::filesystem::path MakeTempDir(const std::string& suffix) {
    const auto base =
        std::filesystem::temp_directory_path() / ("sec_subledger_cli_test_" + suffix);
    std::filesystem::remove_all(base);
    std::filesystem::create_directories(base);
    return base;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(SubledgerRunCli, SampleDataReconcilesCleanly) {
    const auto dir = MakeTempDir("sample");
    const auto out_dir = dir / "out";
    const std::string command = "\"" + BinaryPath().string() + "\" --config \"" +
                                SampleConfig().string() + "\" --output-dir \"" +
                                out_dir.string() + "\" --log-level error --fail-on-break";
    const int rc = RunCommandCapture(command, dir / "stdout.log");

    EXPECT_EQ(rc, 0) << ReadFile(dir / "stdout.log");
    EXPECT_TRUE(std::filesystem::exists(out_dir / "gl_postings.csv"));
    EXPECT_TRUE(std::filesystem::exists(out_dir / "control_mtm_gl.csv"));
    const std::string summary = ReadFile(out_dir / "run_summary.json");
    EXPECT_NE(summary.find("\"total\": 0"), std::string::npos) << summary;
    EXPECT_NE(ReadFile(dir / "stdout.log").find("control breaks"), std::string::npos);
}

TEST(SubledgerRunCli, FailOnBreakExitsWithTwo) {
    const auto dir = MakeTempDir("breaks");
    WriteFile(dir / "data" / "sec_trades.csv",
              "trade_id,customer_id,isin,ccy,trade_date,side,quantity,price\n"
              "T1,CIF001,GB1,GBP,2025-01-02,BUY,10,10\n");
    WriteFile(dir / "data" / "sec_positions.csv",
              "customer_id,isin,ccy,as_of_date,position_quantity\n"
              "CIF001,GB1,GBP,2025-01-06,7\n");
    WriteFile(dir / "subledger.yaml",
              "run:\n  as_of_date: 2025-01-06\nlogging:\n  level: error\n"
              "inputs:\n  data_dir: data\noutputs:\n  dir: out\n");
    const std::string base = "\"" + BinaryPath().string() + "\" --config \"" +
                             (dir / "subledger.yaml").string() + "\"";

    EXPECT_EQ(RunCommandCapture(base, dir / "plain.log"), 0) << ReadFile(dir / "plain.log");
    EXPECT_EQ(RunCommandCapture(base + " --fail-on-break", dir / "strict.log"), 2)
        << ReadFile(dir / "strict.log");
    const std::string control = ReadFile(dir / "out" / "control_position.csv");
    EXPECT_NE(control.find("CIF001,GB1,GBP,10.00000000,7.00000000,3.00000000,false,true"),
              std::string::npos)
        << control;
}

TEST(SubledgerRunCli, MissingConfigFails) {
    const auto dir = MakeTempDir("usage");
    EXPECT_EQ(RunCommandCapture("\"" + BinaryPath().string() + "\"", dir / "usage.log"), 1);
    EXPECT_NE(ReadFile(dir / "usage.log").find("--config is required"), std::string::npos);
    EXPECT_EQ(RunCommandCapture("\"" + BinaryPath().string() + "\" --config \"" +
                                    (dir / "absent.yaml").string() + "\"",
                                dir / "absent.log"),
              1);
    EXPECT_EQ(RunCommandCapture("\"" + BinaryPath().string() + "\" --config a.yaml --dry-run",
                                dir / "unknown.log"),
              1);
    EXPECT_NE(ReadFile(dir / "unknown.log").find("unknown option: --dry-run"), std::string::npos);
}

}  // namespace
