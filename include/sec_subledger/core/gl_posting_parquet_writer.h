#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

// Buffers GL postings and writes them as one Parquet file on Close(). The
// file appears atomically (written to "<path>.tmp", then renamed). Without
// SEC_SUBLEDGER_ENABLE_ARROW_PARQUET every call except a no-op Close fails.
class GlPostingParquetWriter {
   public:
    GlPostingParquetWriter() = default;
    ~GlPostingParquetWriter() = default;

    bool Open(const std::string& output_path, std::string* error);
    bool Append(const GlPosting& row, std::string* error);
    bool Close(std::string* error);

    std::int64_t rows_written() const noexcept { return rows_written_; }
    const std::string& output_path() const noexcept { return output_path_; }
    bool is_open() const noexcept { return is_open_; }

   private:
    bool is_open_{false};
    std::int64_t rows_written_{0};
    std::string output_path_;

#if SEC_SUBLEDGER_ENABLE_ARROW_PARQUET
    std::vector<GlPosting> rows_;
#endif
};

}  // namespace sec_subledger
