#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "ocr/ocr_scanner.hpp"
#include <string>

namespace duckdb {
namespace bankgiro {

// Row access to the common OCR function arguments:
//   (input [, length_digit BOOLEAN, pad VARCHAR [, min_length INTEGER, max_length INTEGER]])
// Integer inputs are read through their VARCHAR cast. Omitted or NULL options
// fall back to the OcrSettings defaults captured at construction.
struct OcrArguments {
    explicit OcrArguments(DataChunk &args);

    // Returns false if the input of this row is NULL
    bool GetRow(idx_t row, std::string &input, ocr::ScanOptions &options) const;

    Vector input_vector;
    UnifiedVectorFormat input_data;
    UnifiedVectorFormat length_digit_data;
    UnifiedVectorFormat pad_data;
    UnifiedVectorFormat min_length_data;
    UnifiedVectorFormat max_length_data;
    bool has_format;
    bool has_bounds;
    ocr::ScanOptions defaults;
};

} // namespace bankgiro
} // namespace duckdb
