#include "util/glob.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <set>

namespace fs = std::filesystem;
using namespace px::logging;

namespace {

std::vector<std::string> splitPattern(const std::string_view pattern) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= pattern.size()) {
        const auto slash = pattern.find('/', pos);
        const auto part = pattern.substr(pos, slash == std::string_view::npos ? std::string_view::npos : slash - pos);
        if (!part.empty() && part != ".") parts.emplace_back(part);
        if (slash == std::string_view::npos) break;
        pos = slash + 1;
    }
    return parts;
}

std::vector<std::string> splitPath(const fs::path& path) {
    std::vector<std::string> parts;
    for (const auto& part : path.lexically_normal())
        if (!part.empty() && part != ".") parts.push_back(part.string());
    return parts;
}

bool matchFrom(const std::vector<std::string>& pat, const size_t pi,
               const std::vector<std::string>& path, const size_t si) {
    if (pi == pat.size()) return si == path.size();

    if (pat[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (matchFrom(pat, pi + 1, path, k)) return true;
            if (k < path.size() && path[k].starts_with('.')) break;
        }
        return false;
    }

    if (si == path.size()) return false;
    if (::fnmatch(pat[pi].c_str(), path[si].c_str(), FNM_CASEFOLD | FNM_PERIOD) != 0) return false;
    return matchFrom(pat, pi + 1, path, si + 1);
}

bool wantsDotDirectories(const std::vector<std::string>& patterns) {
    return std::ranges::any_of(patterns, [](const std::string& p) {
        return p.starts_with('.') || p.find("/.") != std::string::npos;
    });
}

}

bool px::util::globMatch(const std::string_view pattern, const fs::path& relPath) {
    return matchFrom(splitPattern(pattern), 0, splitPath(relPath), 0);
}

std::vector<fs::path> px::util::globFiles(const fs::path& root, const std::vector<std::string>& patterns) {
    std::vector<fs::path> matches;
    if (patterns.empty()) return matches;

    const bool descendIntoDots = wantsDotDirectories(patterns);
    std::set<fs::path> seen;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::not_a_directory);
        throw fs::filesystem_error("Failed to scan directory", root, ec);
    }

    // directory symlinks are not followed, so the walk cannot cycle
    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            LogRegistry::context()->warn("[glob] Skipping unreadable directory {}: {}", dir.string(), ec.message());
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                LogRegistry::context()->warn("[glob] Stopped listing {} early: {}", dir.string(), ec.message());
                break;
            }

            const auto& entry = *it;
            const auto name = entry.path().filename().string();

            const auto linkStatus = entry.symlink_status(ec);
            if (ec) {
                LogRegistry::context()->warn("[glob] Skipping {}: {}", entry.path().string(), ec.message());
                continue;
            }

            if (fs::is_directory(linkStatus)) {
                if (descendIntoDots || !name.starts_with('.')) pending.push_back(entry.path());
                continue;
            }

            // a dangling link or anything else that is not a file is passed over quietly
            if (!entry.is_regular_file(ec) || ec) continue;

            const auto rel = entry.path().lexically_relative(root);
            const bool matched = std::ranges::any_of(patterns, [&](const std::string& p) { return globMatch(p, rel); });
            if (!matched) continue;

            // symlinks and case variants collapse onto one canonical file
            auto canonical = fs::weakly_canonical(entry.path(), ec);
            if (ec) canonical = entry.path().lexically_normal();
            if (seen.insert(canonical).second) matches.push_back(entry.path().lexically_normal());
        }
    }

    std::ranges::sort(matches);
    return matches;
}
