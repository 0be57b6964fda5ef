#include "context/model/FileType.hpp"
#include "context/model/FileUpdate.hpp"

namespace px::context::model {

std::string_view to_string(const FileCategory category) {
    switch (category) {
        case FileCategory::Text: return "text";
        case FileCategory::Image: return "image";
        case FileCategory::Pdf: return "pdf";
        case FileCategory::Unsupported: return "unsupported";
    }
    return "unknown";
}

std::string_view to_string(const SyncErrorKind kind) {
    switch (kind) {
        case SyncErrorKind::Conflict: return "conflict";
        case SyncErrorKind::IoError: return "io-error";
        case SyncErrorKind::ExtractionFailed: return "extraction-failed";
    }
    return "unknown";
}

}
