#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace bankgiro {

// bankgiro_ocr_from_number / to_number / try_to_number / is_valid / result / check_digit
void RegisterOcrFunctions(ExtensionLoader &loader);

// bankgiro_ocr_find_all (scalar, LIST) and bankgiro_ocr_matches (table)
void RegisterOcrScanFunctions(ExtensionLoader &loader);

// bankgiro_set_* / bankgiro_get_* / bankgiro_reset_ocr_settings
void RegisterOcrSettingsFunctions(ExtensionLoader &loader);

} // namespace bankgiro
} // namespace duckdb
