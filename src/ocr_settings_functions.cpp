#include "ocr_functions.hpp"
#include "ocr_settings.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <iostream>
#include <stdexcept>

namespace duckdb {
namespace bankgiro {

static std::string DescribeScanBounds(const OcrSettings &settings) {
    return std::to_string(settings.GetMinLength()) + ".." + std::to_string(settings.GetMaxLength());
}

static std::string DescribeFormat(const OcrSettings &settings) {
    return std::string("length_digit=") + (settings.GetLengthDigit() ? "true" : "false") + ", pad='" +
           settings.GetPad() + "'";
}

static void SetConstantString(Vector &result, const std::string &value) {
    result.SetVectorType(VectorType::CONSTANT_VECTOR);
    auto result_data = ConstantVector::GetData<string_t>(result);
    result_data[0] = StringVector::AddString(result, value);
}

// bankgiro_set_ocr_scan_bounds(min_length INTEGER, max_length INTEGER) -> VARCHAR
static void SetOcrScanBoundsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<int32_t, int32_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](int32_t min_length, int32_t max_length) {
            auto &settings = OcrSettings::GetInstance();
            try {
                settings.SetScanBounds(min_length, max_length);
            } catch (const std::invalid_argument &e) {
                throw InvalidInputException("bankgiro_set_ocr_scan_bounds: %s", e.what());
            }
            std::cout << "OCR scan bounds set to " << DescribeScanBounds(settings) << std::endl;
            return StringVector::AddString(result, "OCR scan bounds set to: " + DescribeScanBounds(settings));
        });
}

static void GetOcrScanBoundsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    SetConstantString(result, DescribeScanBounds(OcrSettings::GetInstance()));
}

// bankgiro_set_ocr_format(length_digit BOOLEAN, pad VARCHAR) -> VARCHAR
static void SetOcrFormatFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<bool, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](bool length_digit, string_t pad) {
            auto &settings = OcrSettings::GetInstance();
            try {
                settings.SetFormat(length_digit, pad.GetString());
            } catch (const std::invalid_argument &e) {
                throw InvalidInputException("bankgiro_set_ocr_format: %s", e.what());
            }
            std::cout << "OCR format set to " << DescribeFormat(settings) << std::endl;
            return StringVector::AddString(result, "OCR format set to: " + DescribeFormat(settings));
        });
}

static void GetOcrFormatFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    SetConstantString(result, DescribeFormat(OcrSettings::GetInstance()));
}

static void ResetOcrSettingsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &settings = OcrSettings::GetInstance();
    settings.Reset();
    SetConstantString(result, "OCR settings reset: bounds " + DescribeScanBounds(settings) + ", " +
                                  DescribeFormat(settings));
}

void RegisterOcrSettingsFunctions(ExtensionLoader &loader) {
    ScalarFunction set_bounds("bankgiro_set_ocr_scan_bounds", {LogicalType::INTEGER, LogicalType::INTEGER},
                              LogicalType::VARCHAR, SetOcrScanBoundsFunction);
    set_bounds.stability = FunctionStability::VOLATILE;
    loader.RegisterFunction(set_bounds);

    ScalarFunction get_bounds("bankgiro_get_ocr_scan_bounds", {}, LogicalType::VARCHAR, GetOcrScanBoundsFunction);
    get_bounds.stability = FunctionStability::VOLATILE;
    loader.RegisterFunction(get_bounds);

    ScalarFunction set_format("bankgiro_set_ocr_format", {LogicalType::BOOLEAN, LogicalType::VARCHAR},
                              LogicalType::VARCHAR, SetOcrFormatFunction);
    set_format.stability = FunctionStability::VOLATILE;
    loader.RegisterFunction(set_format);

    ScalarFunction get_format("bankgiro_get_ocr_format", {}, LogicalType::VARCHAR, GetOcrFormatFunction);
    get_format.stability = FunctionStability::VOLATILE;
    loader.RegisterFunction(get_format);

    ScalarFunction reset("bankgiro_reset_ocr_settings", {}, LogicalType::VARCHAR, ResetOcrSettingsFunction);
    reset.stability = FunctionStability::VOLATILE;
    loader.RegisterFunction(reset);
}

} // namespace bankgiro
} // namespace duckdb
