#include "diff/DiffEngine.hpp"
#include "logging/LogRegistry.hpp"

#include <format>
#include <regex>
#include <stdexcept>

using namespace px::diff;
using namespace px::logging;

namespace {

std::vector<std::string_view> splitPatchLines(const std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

std::vector<std::string_view> sourceLines(const std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto nl = text.find('\n', pos);
        const auto len = nl == std::string_view::npos ? text.size() - pos : nl - pos + 1;
        lines.push_back(text.substr(pos, len));
        pos += len;
    }
    return lines;
}

std::string labelFrom(const std::string_view line, const size_t prefixLen) {
    auto rest = line.substr(prefixLen);
    if (const auto tab = rest.find('\t'); tab != std::string_view::npos) rest = rest.substr(0, tab);
    return std::string(rest);
}

}

Patch px::diff::parsePatch(const std::string_view text) {
    static const std::regex hunkHeader(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@)");

    Patch patch;
    const auto lines = splitPatchLines(text);

    size_t i = 0;
    while (i < lines.size()) {
        const auto line = lines[i];

        if (line.starts_with("Index: ")) {
            patch.label = labelFrom(line, 7);
            ++i;
            continue;
        }
        if (line.starts_with("--- ") && patch.label.empty()) {
            patch.label = labelFrom(line, 4);
            ++i;
            continue;
        }
        if (!line.starts_with("@@")) {
            ++i;
            continue;
        }

        std::cmatch match;
        if (!std::regex_search(line.data(), line.data() + line.size(), match, hunkHeader))
            throw std::runtime_error(std::format("Malformed hunk header: {}", line));

        Hunk hunk;
        hunk.oldStart = std::stoul(match[1].str());
        hunk.oldLines = match[2].matched ? std::stoul(match[2].str()) : 1;
        hunk.newStart = std::stoul(match[3].str());
        hunk.newLines = match[4].matched ? std::stoul(match[4].str()) : 1;
        ++i;

        size_t oldSeen = 0, newSeen = 0;
        while (i < lines.size() && (oldSeen < hunk.oldLines || newSeen < hunk.newLines)) {
            const auto body = lines[i];
            const char kind = body.empty() ? ' ' : body.front();
            switch (kind) {
                case ' ': ++oldSeen; ++newSeen; break;
                case '-': ++oldSeen; break;
                case '+': ++newSeen; break;
                case '\\': break;
                default:
                    throw std::runtime_error(std::format("Unexpected line in hunk {}: {}", hunk.header(), body));
            }
            hunk.lines.emplace_back(body.empty() ? std::string(" ") : std::string(body));
            ++i;
        }

        if (oldSeen != hunk.oldLines || newSeen != hunk.newLines)
            throw std::runtime_error(std::format("Truncated hunk {}", hunk.header()));

        if (i < lines.size() && lines[i].starts_with('\\')) hunk.lines.emplace_back(lines[i++]);

        patch.hunks.push_back(std::move(hunk));
    }

    return patch;
}

std::string px::diff::applyPatch(const std::string_view source, const Patch& patch) {
    const auto src = sourceLines(source);
    std::string out;
    out.reserve(source.size());

    size_t pos = 0;
    for (const auto& hunk : patch.hunks) {
        const size_t start = hunk.oldLines == 0 ? hunk.oldStart : hunk.oldStart - 1;
        if (start < pos || start > src.size())
            throw std::runtime_error(std::format("Hunk {} out of range for {}", hunk.header(), patch.label));

        for (; pos < start; ++pos) out += src[pos];

        for (size_t i = 0; i < hunk.lines.size(); ++i) {
            const auto& line = hunk.lines[i];
            if (line.starts_with('\\')) continue;

            const bool noNewline = i + 1 < hunk.lines.size() && hunk.lines[i + 1].starts_with('\\');
            std::string token = line.substr(1);
            if (!noNewline) token += '\n';

            switch (line.front()) {
                case ' ':
                case '-':
                    if (pos >= src.size() || src[pos] != token) {
                        LogRegistry::diff()->warn("[DiffEngine] {} does not apply: mismatch at line {}", patch.label, pos + 1);
                        throw std::runtime_error(std::format("Patch for {} does not apply at line {}", patch.label, pos + 1));
                    }
                    if (line.front() == ' ') out += token;
                    ++pos;
                    break;
                case '+':
                    out += token;
                    break;
                default:
                    throw std::runtime_error(std::format("Unexpected line in hunk {}: {}", hunk.header(), line));
            }
        }
    }

    for (; pos < src.size(); ++pos) out += src[pos];
    return out;
}
