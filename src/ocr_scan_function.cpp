#include "ocr_functions.hpp"
#include "ocr_arguments.hpp"
#include "ocr_settings.hpp"
#include "ocr/ocr_scanner.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {
namespace bankgiro {

// bankgiro_ocr_find_all(text [, length_digit, pad [, min_length, max_length]]) -> VARCHAR[]
static void OcrFindAllFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    OcrArguments arguments(args);

    auto list_entries = FlatVector::GetData<list_entry_t>(result);
    auto &list_validity = FlatVector::Validity(result);
    idx_t current_list_offset = ListVector::GetListSize(result);

    for (idx_t row = 0; row < args.size(); row++) {
        std::string text;
        ocr::ScanOptions options;
        if (!arguments.GetRow(row, text, options)) {
            list_validity.SetInvalid(row);
            continue;
        }

        auto found = ocr::OcrScanner::FindAllInString(text, options);

        list_entries[row].offset = current_list_offset;
        list_entries[row].length = found.size();

        for (const auto &ocr_number : found) {
            ListVector::PushBack(result, Value(ocr_number));
        }

        current_list_offset += found.size();
    }
}

// ========== bankgiro_ocr_matches() table function ==========

struct OcrMatchesBindData : public TableFunctionData {
    std::string text;
    ocr::ScanOptions options;
};

struct OcrMatchesGlobalState : public GlobalTableFunctionState {
    std::vector<ocr::OcrMatch> matches;
    idx_t offset = 0;

    idx_t MaxThreads() const override {
        return 1;
    }
};

static unique_ptr<FunctionData> OcrMatchesBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = make_uniq<OcrMatchesBindData>();

    if (input.inputs.empty()) {
        throw BinderException("bankgiro_ocr_matches requires a text parameter");
    }
    if (!input.inputs[0].IsNull()) {
        bind_data->text = StringValue::Get(input.inputs[0]);
    }

    bind_data->options = OcrSettings::GetInstance().GetScanOptions();

    // Named parameters
    for (auto &kv : input.named_parameters) {
        if (kv.second.IsNull()) {
            continue;
        }
        if (kv.first == "length_digit") {
            bind_data->options.length_digit = BooleanValue::Get(kv.second);
        } else if (kv.first == "pad") {
            bind_data->options.pad = StringValue::Get(kv.second);
        } else if (kv.first == "min_length") {
            bind_data->options.min_length = IntegerValue::Get(kv.second);
        } else if (kv.first == "max_length") {
            bind_data->options.max_length = IntegerValue::Get(kv.second);
        }
    }

    names.emplace_back("ocr");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("payload");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("length");
    return_types.emplace_back(LogicalType::INTEGER);

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> OcrMatchesInit(ClientContext &context, TableFunctionInitInput &input) {
    auto &bind_data = input.bind_data->Cast<OcrMatchesBindData>();
    auto result = make_uniq<OcrMatchesGlobalState>();

    result->matches = ocr::OcrScanner::FindMatches(bind_data.text, bind_data.options);

    return std::move(result);
}

static void OcrMatchesFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
    auto &state = data_p.global_state->Cast<OcrMatchesGlobalState>();

    idx_t count = 0;

    while (state.offset < state.matches.size() && count < STANDARD_VECTOR_SIZE) {
        auto &match = state.matches[state.offset];

        output.SetValue(0, count, Value(match.ocr));
        output.SetValue(1, count, Value(match.payload));
        output.SetValue(2, count, Value::INTEGER(static_cast<int32_t>(match.ocr.length())));

        state.offset++;
        count++;
    }

    output.SetCardinality(count);
}

void RegisterOcrScanFunctions(ExtensionLoader &loader) {
    auto return_type = LogicalType::LIST(LogicalType::VARCHAR);

    ScalarFunctionSet find_all_set("bankgiro_ocr_find_all");

    // bankgiro_ocr_find_all(text VARCHAR) -> VARCHAR[]
    vector<vector<LogicalType>> signatures = {
        // (text VARCHAR)
        {LogicalType::VARCHAR},
        // (text VARCHAR, length_digit BOOLEAN, pad VARCHAR)
        {LogicalType::VARCHAR, LogicalType::BOOLEAN, LogicalType::VARCHAR},
        // (text, length_digit, pad, min_length INTEGER, max_length INTEGER)
        {LogicalType::VARCHAR, LogicalType::BOOLEAN, LogicalType::VARCHAR, LogicalType::INTEGER,
         LogicalType::INTEGER}};

    for (auto &arguments : signatures) {
        ScalarFunction find_all(arguments, return_type, OcrFindAllFunction);
        find_all.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
        find_all.stability = FunctionStability::VOLATILE;
        find_all.description = "Finds every valid OCR reference in free text.\n"
                               "Usage: SELECT bankgiro_ocr_find_all('REF 11230', false, '', 4, 18);\n"
                               "Returns: VARCHAR[] in order of first occurrence, without duplicates";
        find_all_set.AddFunction(find_all);
    }

    loader.RegisterFunction(find_all_set);

    TableFunction matches_func("bankgiro_ocr_matches", {LogicalType::VARCHAR}, OcrMatchesFunction, OcrMatchesBind,
                               OcrMatchesInit);
    matches_func.named_parameters["length_digit"] = LogicalType::BOOLEAN;
    matches_func.named_parameters["pad"] = LogicalType::VARCHAR;
    matches_func.named_parameters["min_length"] = LogicalType::INTEGER;
    matches_func.named_parameters["max_length"] = LogicalType::INTEGER;
    loader.RegisterFunction(matches_func);
}

} // namespace bankgiro
} // namespace duckdb
