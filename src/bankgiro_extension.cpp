#define DUCKDB_EXTENSION_MAIN
#include "bankgiro_extension.hpp"
#include "ocr_functions.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

void BankgiroExtension::Load(ExtensionLoader &loader) {
    // OCR generation and verification
    bankgiro::RegisterOcrFunctions(loader);

    // OCR search in free text
    bankgiro::RegisterOcrScanFunctions(loader);

    // Defaults for calls without explicit options
    bankgiro::RegisterOcrSettingsFunctions(loader);
}

std::string BankgiroExtension::Name() {
    return "bankgiro";
}

std::string BankgiroExtension::Version() const {
#ifdef EXT_VERSION
    return EXT_VERSION;
#else
    return "v1.0.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(bankgiro, loader) {
    duckdb::BankgiroExtension ext;
    ext.Load(loader);
}
}
