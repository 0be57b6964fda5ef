#pragma once

#include <filesystem>
#include <string>

namespace px::oracle {

// Turns a binary document into text the agent can read. Throws
// std::runtime_error when the document cannot be extracted.
class BinaryExtractor {
public:
    virtual ~BinaryExtractor() = default;

    virtual std::string extractText(const std::filesystem::path& absPath) = 0;
};

class PdfiumExtractor final : public BinaryExtractor {
public:
    PdfiumExtractor();

    std::string extractText(const std::filesystem::path& absPath) override;
};

}
