#include "preview/pdf.hpp"

#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>
#include <pdfium/fpdfview.h>
#include <pdfium/fpdf_text.h>

namespace px::preview::pdf {

namespace {

std::mutex pdfiumMutex;
bool initialized = false;

struct DocumentCloser { void operator()(fpdf_document_t__* doc) const { FPDF_CloseDocument(doc); } };
struct PageCloser { void operator()(fpdf_page_t__* page) const { FPDF_ClosePage(page); } };
struct TextPageCloser { void operator()(fpdf_textpage_t__* text) const { FPDFText_ClosePage(text); } };

std::string lastErrorMessage() {
    switch (FPDF_GetLastError()) {
        case FPDF_ERR_FILE: return "file not found or could not be opened";
        case FPDF_ERR_FORMAT: return "file is not a PDF or is corrupted";
        case FPDF_ERR_PASSWORD: return "password required";
        case FPDF_ERR_SECURITY: return "unsupported security scheme";
        case FPDF_ERR_PAGE: return "page not found or content error";
        default: return "unknown error";
    }
}

void appendUtf8(std::string& out, const char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf16ToUtf8(const std::vector<unsigned short>& units, const size_t count) {
    std::string out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        char32_t cp = units[i];
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < count && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (units[i + 1] - 0xDC00);
            ++i;
        }
        appendUtf8(out, cp);
    }
    return out;
}

void initLocked() {
    if (initialized) return;

    FPDF_LIBRARY_CONFIG config{};
    config.version = 3;
    config.m_pUserFontPaths = nullptr;
    config.m_pIsolate = nullptr;
    config.m_v8EmbedderSlot = 0;
    FPDF_InitLibraryWithConfig(&config);
    initialized = true;
}

}

void init() {
    std::scoped_lock lock(pdfiumMutex);
    initLocked();
}

void shutdown() {
    std::scoped_lock lock(pdfiumMutex);
    if (!initialized) return;
    FPDF_DestroyLibrary();
    initialized = false;
}

std::string extract_text(const std::filesystem::path& path) {
    // pdfium is not thread safe
    std::scoped_lock lock(pdfiumMutex);
    initLocked();

    const std::unique_ptr<fpdf_document_t__, DocumentCloser> doc(FPDF_LoadDocument(path.c_str(), nullptr));
    if (!doc) throw std::runtime_error(std::format("Failed to load PDF {}: {}", path.string(), lastErrorMessage()));

    const int pageCount = FPDF_GetPageCount(doc.get());
    std::string text;

    for (int i = 0; i < pageCount; ++i) {
        const std::unique_ptr<fpdf_page_t__, PageCloser> page(FPDF_LoadPage(doc.get(), i));
        if (!page) throw std::runtime_error(std::format("Failed to load page {} of {}", i + 1, path.string()));

        const std::unique_ptr<fpdf_textpage_t__, TextPageCloser> textPage(FPDFText_LoadPage(page.get()));
        if (!textPage) throw std::runtime_error(std::format("Failed to load text of page {} of {}", i + 1, path.string()));

        const int chars = FPDFText_CountChars(textPage.get());
        if (chars < 0) throw std::runtime_error(std::format("Failed to count characters on page {} of {}", i + 1, path.string()));

        std::vector<unsigned short> buffer(static_cast<size_t>(chars) + 1, 0);
        const int written = FPDFText_GetText(textPage.get(), 0, chars, buffer.data());

        if (i > 0) text += "\n\n";
        // written includes the terminating NUL
        if (written > 1) text += utf16ToUtf8(buffer, static_cast<size_t>(written - 1));
    }

    return text;
}

}
