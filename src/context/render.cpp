#include "context/render.hpp"
#include "diff/DiffEngine.hpp"
#include "util/variant.hpp"

#include <algorithm>
#include <format>
#include <vector>

#include <boost/algorithm/string/join.hpp>

using namespace px::context;
using namespace px::context::model;
using namespace px::util;

namespace {

constexpr auto* CONTEXT_INTRO =
    "These files are part of your context. This is the latest information about the content of each file.\n"
    "From now on, whenever any of these files are updated by the user, you will get a message letting you know.\n";

std::string changeIndicator(const SyncResult& result, const FileUpdate& update) {
    return std::visit(Overloaded{
        [](const Diff& d) {
            const auto summary = px::diff::summarize(px::diff::parsePatch(d.patch));
            return std::format("[ +{} / -{} ]", summary.added, summary.removed);
        },
        [&](const WholeFile& w) {
            if (result.typeInfo.category == FileCategory::Image) return std::string("[ image ]");
            const auto lines = std::ranges::count(w.content, '\n') + 1;
            return std::format("[ +{} ]", lines);
        },
        [](const Deleted&) { return std::string("[ deleted ]"); }
    }, update);
}

std::string fenced(const std::string& rel, const std::string& lang, const std::string& body) {
    return std::format("- `{}`\n```{}\n{}\n```", rel, lang, body);
}

}

std::string px::context::renderSummary(const SyncResults& results) {
    std::string lines;

    for (const auto& [absPath, result] : results) {
        std::visit(Overloaded{
            [&](const Updated& u) {
                lines += std::format("- `{}` {}\n", result.relPath.string(), changeIndicator(result, u.update));
            },
            [](const Unchanged&) {},
            [&](const SyncError& e) {
                lines += std::format("- `{}` [Error: {}]\n", absPath.string(), e.message);
            }
        }, result.outcome);
    }

    if (lines.empty()) return {};
    return "Context Updates:\n" + lines + "\n";
}

nlohmann::json px::context::toProviderContent(const SyncResults& results) {
    auto content = nlohmann::json::array();
    std::vector<std::string> textUpdates;

    for (const auto& [absPath, result] : results) {
        const auto rel = result.relPath.string();

        std::visit(Overloaded{
            [&](const Updated& u) {
                std::visit(Overloaded{
                    [&](const WholeFile& w) {
                        switch (result.typeInfo.category) {
                            case FileCategory::Text:
                            case FileCategory::Pdf:
                                textUpdates.push_back(fenced(rel, "", w.content));
                                break;
                            case FileCategory::Image:
                                content.push_back(nlohmann::json{
                                    {"type", "image"},
                                    {"source", {
                                        {"type", "base64"},
                                        {"media_type", result.typeInfo.mimeType},
                                        {"data", w.content}
                                    }}
                                });
                                textUpdates.push_back(std::format("- `{}`\nImage file updated (see attached image).", rel));
                                break;
                            case FileCategory::Unsupported:
                                textUpdates.push_back(std::format("- `{}`\nFile content updated.", rel));
                                break;
                        }
                    },
                    [&](const Diff& d) { textUpdates.push_back(fenced(rel, "diff", d.patch)); },
                    [&](const Deleted&) {
                        textUpdates.push_back(std::format("- `{}`\nThis file has been deleted and removed from context.", rel));
                    }
                }, u.update);
            },
            [](const Unchanged&) {},
            [&](const SyncError& e) {
                textUpdates.push_back(std::format("- `{}`\nError fetching update: {}", rel, e.message));
            }
        }, result.outcome);
    }

    if (!textUpdates.empty()) {
        const nlohmann::json textBlock = {
            {"type", "text"},
            {"text", std::string(CONTEXT_INTRO) + boost::algorithm::join(textUpdates, "\n")}
        };
        content.insert(content.begin(), textBlock);
    }

    return content;
}
