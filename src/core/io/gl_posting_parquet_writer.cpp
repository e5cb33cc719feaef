#include "sec_subledger/core/gl_posting_parquet_writer.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#if SEC_SUBLEDGER_ENABLE_ARROW_PARQUET
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#endif

namespace sec_subledger {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

#if SEC_SUBLEDGER_ENABLE_ARROW_PARQUET
bool ExpectArrowStatus(const arrow::Status& status, const std::string& prefix, std::string* error) {
    if (status.ok()) {
        return true;
    }
    return SetError(prefix + ": " + status.ToString(), error);
}

template <typename BuilderT>
bool FinishArray(BuilderT* builder, const std::string& name, std::shared_ptr<arrow::Array>* out,
                 std::string* error) {
    const auto status = builder->Finish(out);
    return ExpectArrowStatus(status, "failed to finalize gl posting field '" + name + "'", error);
}
#endif

}  // namespace

bool GlPostingParquetWriter::Open(const std::string& output_path, std::string* error) {
    if (is_open_) {
        return SetError("gl posting parquet writer is already open", error);
    }
    if (output_path.empty()) {
        return SetError("gl posting parquet output path is empty", error);
    }

#if !SEC_SUBLEDGER_ENABLE_ARROW_PARQUET
    (void)output_path;
    return SetError("gl posting parquet output requires SEC_SUBLEDGER_ENABLE_ARROW_PARQUET=ON",
                    error);
#else
    try {
        const std::filesystem::path path(output_path);
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::exception& ex) {
        return SetError(std::string("failed to prepare gl posting parquet path: ") + ex.what(),
                        error);
    }

    output_path_ = output_path;
    rows_written_ = 0;
    rows_.clear();
    is_open_ = true;
    return true;
#endif
}

bool GlPostingParquetWriter::Append(const GlPosting& row, std::string* error) {
    if (!is_open_) {
        return SetError("gl posting parquet writer is not open", error);
    }
    if (row.posting_date.empty()) {
        return SetError("gl posting row posting_date is empty", error);
    }

#if !SEC_SUBLEDGER_ENABLE_ARROW_PARQUET
    (void)row;
    return SetError("gl posting parquet output requires SEC_SUBLEDGER_ENABLE_ARROW_PARQUET=ON",
                    error);
#else
    rows_.push_back(row);
    ++rows_written_;
    return true;
#endif
}

bool GlPostingParquetWriter::Close(std::string* error) {
    if (!is_open_) {
        return true;
    }

#if !SEC_SUBLEDGER_ENABLE_ARROW_PARQUET
    return SetError("gl posting parquet output requires SEC_SUBLEDGER_ENABLE_ARROW_PARQUET=ON",
                    error);
#else
    arrow::StringBuilder posting_date_builder;
    arrow::StringBuilder deal_id_builder;
    arrow::StringBuilder customer_id_builder;
    arrow::StringBuilder isin_builder;
    arrow::StringBuilder ccy_builder;
    arrow::Int64Builder account_code_builder;
    arrow::StringBuilder dr_cr_builder;
    arrow::DoubleBuilder amount_builder;
    arrow::StringBuilder posting_type_builder;

    for (const auto& row : rows_) {
        const auto append_deal_id = [&]() {
            if (!row.deal_id.has_value()) {
                return ExpectArrowStatus(deal_id_builder.AppendNull(),
                                         "failed appending null deal_id", error);
            }
            return ExpectArrowStatus(deal_id_builder.Append(*row.deal_id),
                                     "failed appending deal_id", error);
        };
        if (!ExpectArrowStatus(posting_date_builder.Append(row.posting_date),
                               "failed appending posting_date", error) ||
            !append_deal_id() ||
            !ExpectArrowStatus(customer_id_builder.Append(row.customer_id),
                               "failed appending customer_id", error) ||
            !ExpectArrowStatus(isin_builder.Append(row.instrument_id), "failed appending isin",
                               error) ||
            !ExpectArrowStatus(ccy_builder.Append(row.currency), "failed appending ccy", error) ||
            !ExpectArrowStatus(account_code_builder.Append(row.account_code),
                               "failed appending account_code", error) ||
            !ExpectArrowStatus(dr_cr_builder.Append(ToString(row.dr_cr)),
                               "failed appending dr_cr", error) ||
            !ExpectArrowStatus(amount_builder.Append(row.amount), "failed appending amount",
                               error) ||
            !ExpectArrowStatus(posting_type_builder.Append(ToString(row.posting_type)),
                               "failed appending posting_type", error)) {
            return false;
        }
    }

    std::shared_ptr<arrow::Array> posting_date_array;
    std::shared_ptr<arrow::Array> deal_id_array;
    std::shared_ptr<arrow::Array> customer_id_array;
    std::shared_ptr<arrow::Array> isin_array;
    std::shared_ptr<arrow::Array> ccy_array;
    std::shared_ptr<arrow::Array> account_code_array;
    std::shared_ptr<arrow::Array> dr_cr_array;
    std::shared_ptr<arrow::Array> amount_array;
    std::shared_ptr<arrow::Array> posting_type_array;

    if (!FinishArray(&posting_date_builder, "posting_date", &posting_date_array, error) ||
        !FinishArray(&deal_id_builder, "deal_id", &deal_id_array, error) ||
        !FinishArray(&customer_id_builder, "customer_id", &customer_id_array, error) ||
        !FinishArray(&isin_builder, "isin", &isin_array, error) ||
        !FinishArray(&ccy_builder, "ccy", &ccy_array, error) ||
        !FinishArray(&account_code_builder, "account_code", &account_code_array, error) ||
        !FinishArray(&dr_cr_builder, "dr_cr", &dr_cr_array, error) ||
        !FinishArray(&amount_builder, "amount", &amount_array, error) ||
        !FinishArray(&posting_type_builder, "posting_type", &posting_type_array, error)) {
        return false;
    }

    auto schema = arrow::schema({
        arrow::field("posting_date", arrow::utf8(), false),
        arrow::field("deal_id", arrow::utf8(), true),
        arrow::field("customer_id", arrow::utf8(), false),
        arrow::field("isin", arrow::utf8(), false),
        arrow::field("ccy", arrow::utf8(), false),
        arrow::field("account_code", arrow::int64(), false),
        arrow::field("dr_cr", arrow::utf8(), false),
        arrow::field("amount", arrow::float64(), false),
        arrow::field("posting_type", arrow::utf8(), false),
    });

    auto table = arrow::Table::Make(schema, {posting_date_array, deal_id_array, customer_id_array,
                                             isin_array, ccy_array, account_code_array,
                                             dr_cr_array, amount_array, posting_type_array});

    const std::filesystem::path output_path(output_path_);
    const std::filesystem::path tmp_path(output_path_ + ".tmp");

    auto file_result = arrow::io::FileOutputStream::Open(tmp_path.string());
    if (!file_result.ok()) {
        return SetError(
            "failed to open gl posting parquet output: " + file_result.status().ToString(), error);
    }
    std::shared_ptr<arrow::io::FileOutputStream> output_stream = file_result.ValueOrDie();

    parquet::WriterProperties::Builder writer_props_builder;
    writer_props_builder.compression(parquet::Compression::SNAPPY);
    std::shared_ptr<parquet::WriterProperties> writer_props = writer_props_builder.build();
    parquet::ArrowWriterProperties::Builder arrow_props_builder;
    std::shared_ptr<parquet::ArrowWriterProperties> arrow_props = arrow_props_builder.build();

    const auto write_status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), output_stream,
        std::max<std::int64_t>(1, rows_written_), writer_props, arrow_props);
    if (!write_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to write gl posting parquet: " + write_status.ToString(), error);
    }

    const auto close_status = output_stream->Close();
    if (!close_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to close gl posting parquet file: " + close_status.ToString(),
                        error);
    }

    try {
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        std::filesystem::rename(tmp_path, output_path);
    } catch (const std::exception& ex) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError(std::string("failed to finalize gl posting parquet: ") + ex.what(), error);
    }

    rows_.clear();
    is_open_ = false;
    return true;
#endif
}

}  // namespace sec_subledger
