#include "util/contentEdits.hpp"

#include <format>
#include <stdexcept>

namespace px::util {

std::string applyInsert(const std::string_view content, const std::string_view insertAfter, const std::string_view text) {
    if (insertAfter.empty()) return std::string(text) + std::string(content);

    const auto pos = content.find(insertAfter);
    if (pos == std::string_view::npos)
        throw std::runtime_error(std::format("Unable to find insert location \"{}\" in file", insertAfter));

    const auto split = pos + insertAfter.size();
    std::string out;
    out.reserve(content.size() + text.size());
    out.append(content.substr(0, split));
    out.append(text);
    out.append(content.substr(split));
    return out;
}

std::string applyReplace(const std::string_view content, const std::string_view find, const std::string_view replace) {
    if (find.empty()) throw std::runtime_error("Replace requires non-empty find text");

    const auto pos = content.find(find);
    if (pos == std::string_view::npos)
        throw std::runtime_error(std::format("Unable to find text \"{}\" in file", find));

    std::string out;
    out.reserve(content.size() - find.size() + replace.size());
    out.append(content.substr(0, pos));
    out.append(replace);
    out.append(content.substr(pos + find.size()));
    return out;
}

}
