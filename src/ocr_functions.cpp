#include "ocr_functions.hpp"
#include "ocr_arguments.hpp"
#include "ocr/ocr_number.hpp"
#include "shared/digit_string.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <string>

namespace duckdb {
namespace bankgiro {

// What a verifying function returns for each row
enum class VerifyOutput {
    PAYLOAD,     // payload, throws on rejection
    TRY_PAYLOAD, // payload, NULL on rejection
    IS_VALID,    // BOOLEAN
    RESULT_NAME  // 'OK', 'BadChecksum', ...
};

// bankgiro_ocr_from_number(number [, length_digit BOOLEAN, pad VARCHAR]) -> VARCHAR
static void OcrFromNumberFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    OcrArguments arguments(args);
    auto result_data = FlatVector::GetData<string_t>(result);
    auto &result_validity = FlatVector::Validity(result);

    for (idx_t i = 0; i < args.size(); i++) {
        std::string number;
        ocr::ScanOptions options;
        if (!arguments.GetRow(i, number, options)) {
            result_validity.SetInvalid(i);
            continue;
        }

        std::string ocr_number;
        auto check_result = ocr::OcrNumber::FromNumber(number, options, ocr_number);
        if (check_result != ocr::OcrResult::OK) {
            throw InvalidInputException("bankgiro_ocr_from_number: %s for input '%s'",
                                        ocr::OcrNumber::ResultName(check_result), number);
        }

        result_data[i] = StringVector::AddString(result, ocr_number);
    }
}

template <VerifyOutput OUTPUT>
static void OcrVerifyFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    OcrArguments arguments(args);
    auto &result_validity = FlatVector::Validity(result);

    for (idx_t i = 0; i < args.size(); i++) {
        std::string ocr_number;
        ocr::ScanOptions options;
        if (!arguments.GetRow(i, ocr_number, options)) {
            result_validity.SetInvalid(i);
            continue;
        }

        std::string payload;
        auto check_result = ocr::OcrNumber::ToNumber(ocr_number, options, payload);

        switch (OUTPUT) {
            case VerifyOutput::PAYLOAD:
                if (check_result != ocr::OcrResult::OK) {
                    throw InvalidInputException("bankgiro_ocr_to_number: %s for input '%s'",
                                                ocr::OcrNumber::ResultName(check_result), ocr_number);
                }
                FlatVector::GetData<string_t>(result)[i] = StringVector::AddString(result, payload);
                break;
            case VerifyOutput::TRY_PAYLOAD:
                if (check_result != ocr::OcrResult::OK) {
                    result_validity.SetInvalid(i);
                } else {
                    FlatVector::GetData<string_t>(result)[i] = StringVector::AddString(result, payload);
                }
                break;
            case VerifyOutput::IS_VALID:
                FlatVector::GetData<bool>(result)[i] = (check_result == ocr::OcrResult::OK);
                break;
            case VerifyOutput::RESULT_NAME:
                FlatVector::GetData<string_t>(result)[i] =
                    StringVector::AddString(result, ocr::OcrNumber::ResultName(check_result));
                break;
        }
    }
}

// bankgiro_ocr_check_digit(digits VARCHAR) -> INTEGER, NULL for non-digit input
static void OcrCheckDigitFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, int32_t>(
        args.data[0], result, args.size(),
        [&](string_t input, ValidityMask &mask, idx_t idx) {
            std::string digits = input.GetString();
            if (!::bankgiro::shared::DigitString::IsDigitString(digits)) {
                mask.SetInvalid(idx);
                return int32_t(0);
            }
            return int32_t(ocr::OcrNumber::CheckDigit(digits));
        });
}

// Adds the (input), (input, length_digit, pad) overloads for VARCHAR, BIGINT and UBIGINT inputs.
// NULL options are resolved per row by OcrArguments, so DuckDB's NULL folding is disabled.
// Omitted options come from OcrSettings, so results must not be folded or cached.
static void AddOcrOverloads(ScalarFunctionSet &set, const LogicalType &return_type, scalar_function_t function,
                            const std::string &description) {
    vector<LogicalType> input_types = {LogicalType::VARCHAR, LogicalType::BIGINT, LogicalType::UBIGINT};
    for (auto &input_type : input_types) {
        ScalarFunction simple({input_type}, return_type, function);
        simple.description = description;
        simple.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
        simple.stability = FunctionStability::VOLATILE;
        set.AddFunction(simple);

        ScalarFunction with_format({input_type, LogicalType::BOOLEAN, LogicalType::VARCHAR}, return_type, function);
        with_format.description = description;
        with_format.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
        with_format.stability = FunctionStability::VOLATILE;
        set.AddFunction(with_format);
    }
}

void RegisterOcrFunctions(ExtensionLoader &loader) {
    ScalarFunctionSet from_number_set("bankgiro_ocr_from_number");
    AddOcrOverloads(from_number_set, LogicalType::VARCHAR, OcrFromNumberFunction,
                    "Appends optional pad, length digit and the mod-10 check digit to a number.\n"
                    "Usage: SELECT bankgiro_ocr_from_number('1234567890', true, '0');\n"
                    "Returns: VARCHAR ('1234567890037'). Throws MustBeNumeric / OverlongOCR");
    loader.RegisterFunction(from_number_set);

    ScalarFunctionSet to_number_set("bankgiro_ocr_to_number");
    AddOcrOverloads(to_number_set, LogicalType::VARCHAR, OcrVerifyFunction<VerifyOutput::PAYLOAD>,
                    "Verifies an OCR reference and strips check digit, length digit and pad.\n"
                    "Usage: SELECT bankgiro_ocr_to_number('1234567890037', true, '0');\n"
                    "Returns: VARCHAR ('1234567890'). Throws MustBeNumeric / TooShortOCR / BadChecksum / "
                    "BadLengthDigit / BadPadding");
    loader.RegisterFunction(to_number_set);

    ScalarFunctionSet try_to_number_set("bankgiro_ocr_try_to_number");
    AddOcrOverloads(try_to_number_set, LogicalType::VARCHAR, OcrVerifyFunction<VerifyOutput::TRY_PAYLOAD>,
                    "Like bankgiro_ocr_to_number but returns NULL for an invalid OCR.\n"
                    "Usage: SELECT bankgiro_ocr_try_to_number('1231');\n"
                    "Returns: VARCHAR or NULL");
    loader.RegisterFunction(try_to_number_set);

    ScalarFunctionSet is_valid_set("bankgiro_ocr_is_valid");
    AddOcrOverloads(is_valid_set, LogicalType::BOOLEAN, OcrVerifyFunction<VerifyOutput::IS_VALID>,
                    "Checks an OCR reference (check digit, optional length digit and pad).\n"
                    "Usage: SELECT bankgiro_ocr_is_valid('1230');\n"
                    "Returns: BOOLEAN");
    loader.RegisterFunction(is_valid_set);

    ScalarFunctionSet result_set("bankgiro_ocr_result");
    AddOcrOverloads(result_set, LogicalType::VARCHAR, OcrVerifyFunction<VerifyOutput::RESULT_NAME>,
                    "Checks an OCR reference and returns the detailed result.\n"
                    "Usage: SELECT bankgiro_ocr_result('12369', true, '');\n"
                    "Returns: VARCHAR (one of: 'OK', 'MustBeNumeric', 'TooShortOCR', 'BadChecksum', "
                    "'BadLengthDigit', 'BadPadding')");
    loader.RegisterFunction(result_set);

    ScalarFunction check_digit_function("bankgiro_ocr_check_digit", {LogicalType::VARCHAR}, LogicalType::INTEGER,
                                        OcrCheckDigitFunction);
    check_digit_function.description = "Computes the mod-10 check digit of a digit string.\n"
                                       "Usage: SELECT bankgiro_ocr_check_digit('123');\n"
                                       "Returns: INTEGER (0), NULL for non-digit input";
    loader.RegisterFunction(check_digit_function);
}

} // namespace bankgiro
} // namespace duckdb
