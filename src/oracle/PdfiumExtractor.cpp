#include "oracle/BinaryExtractor.hpp"
#include "preview/pdf.hpp"
#include "logging/LogRegistry.hpp"

using namespace px::oracle;
using namespace px::logging;

PdfiumExtractor::PdfiumExtractor() { preview::pdf::init(); }

std::string PdfiumExtractor::extractText(const std::filesystem::path& absPath) {
    try {
        return preview::pdf::extract_text(absPath);
    } catch (const std::exception& e) {
        LogRegistry::oracle()->warn("[PdfiumExtractor] {}", e.what());
        throw;
    }
}
