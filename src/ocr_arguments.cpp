#include "ocr_arguments.hpp"
#include "ocr_settings.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"

namespace duckdb {
namespace bankgiro {

OcrArguments::OcrArguments(DataChunk &args)
    : input_vector(LogicalType::VARCHAR, args.size()),
      has_format(args.ColumnCount() >= 3),
      has_bounds(args.ColumnCount() >= 5),
      defaults(OcrSettings::GetInstance().GetScanOptions()) {
    auto count = args.size();

    // BIGINT / UBIGINT overloads are handled as their decimal text
    if (args.data[0].GetType().id() == LogicalTypeId::VARCHAR) {
        input_vector.Reference(args.data[0]);
    } else {
        VectorOperations::DefaultCast(args.data[0], input_vector, count);
    }
    input_vector.ToUnifiedFormat(count, input_data);

    if (has_format) {
        args.data[1].ToUnifiedFormat(count, length_digit_data);
        args.data[2].ToUnifiedFormat(count, pad_data);
    }
    if (has_bounds) {
        args.data[3].ToUnifiedFormat(count, min_length_data);
        args.data[4].ToUnifiedFormat(count, max_length_data);
    }
}

bool OcrArguments::GetRow(idx_t row, std::string &input, ocr::ScanOptions &options) const {
    auto input_idx = input_data.sel->get_index(row);
    if (!input_data.validity.RowIsValid(input_idx)) {
        return false;
    }
    input = UnifiedVectorFormat::GetData<string_t>(input_data)[input_idx].GetString();

    options = defaults;

    if (has_format) {
        auto length_digit_idx = length_digit_data.sel->get_index(row);
        if (length_digit_data.validity.RowIsValid(length_digit_idx)) {
            options.length_digit = UnifiedVectorFormat::GetData<bool>(length_digit_data)[length_digit_idx];
        }

        auto pad_idx = pad_data.sel->get_index(row);
        if (pad_data.validity.RowIsValid(pad_idx)) {
            options.pad = UnifiedVectorFormat::GetData<string_t>(pad_data)[pad_idx].GetString();
        }
    }

    if (has_bounds) {
        auto min_idx = min_length_data.sel->get_index(row);
        if (min_length_data.validity.RowIsValid(min_idx)) {
            options.min_length = UnifiedVectorFormat::GetData<int32_t>(min_length_data)[min_idx];
        }

        auto max_idx = max_length_data.sel->get_index(row);
        if (max_length_data.validity.RowIsValid(max_idx)) {
            options.max_length = UnifiedVectorFormat::GetData<int32_t>(max_length_data)[max_idx];
        }
    }

    return true;
}

} // namespace bankgiro
} // namespace duckdb
