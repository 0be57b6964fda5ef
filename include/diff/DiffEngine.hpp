#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace px::diff {

constexpr unsigned int DEFAULT_CONTEXT_LINES = 2;
constexpr std::string_view NO_NEWLINE_MARKER = "\\ No newline at end of file";

struct Hunk {
    std::size_t oldStart = 0, oldLines = 0;
    std::size_t newStart = 0, newLines = 0;
    // Each line carries its ' ', '-', '+' or '\' prefix.
    std::vector<std::string> lines;

    [[nodiscard]] std::string header() const;
};

struct Patch {
    std::string label;
    std::vector<Hunk> hunks;

    [[nodiscard]] bool empty() const { return hunks.empty(); }
    [[nodiscard]] std::string str() const;
};

struct Summary {
    std::size_t added = 0;
    std::size_t removed = 0;
};

/**
 * Unified diff of two snapshots, labelled "previous" and "current".
 *
 * Contents that differ only by a newline at end of file produce an empty
 * patch. Otherwise the patch is exact: a missing final newline is marked so
 * that applyPatch(previous, patch) == current.
 */
Patch createPatch(std::string_view previous, std::string_view current,
                  const std::string& label, unsigned int context = DEFAULT_CONTEXT_LINES);

Patch parsePatch(std::string_view text);

// Throws std::runtime_error when a context or removed line does not match source.
std::string applyPatch(std::string_view source, const Patch& patch);

Summary summarize(const Patch& patch);

}
