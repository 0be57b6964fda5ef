#include "diff/DiffEngine.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

using namespace px::diff;
using namespace px::logging;

namespace {

// Bounds the Myers trace. Past this the middle section is emitted as a full
// replacement, which is still exact, only not minimal.
constexpr long MAX_EDIT_DISTANCE = 2000;

enum class Op : uint8_t { Equal, Delete, Insert };

// oldIdx/newIdx are the line positions in each side at this edit.
struct Edit {
    Op op;
    size_t oldIdx;
    size_t newIdx;
};

using Lines = std::vector<std::string_view>;

// Lines keep their trailing '\n' so a final line without one never equals a
// line that has it.
Lines tokenize(const std::string_view text) {
    Lines lines;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos + 1));
        pos = nl + 1;
    }
    return lines;
}

bool onlyFinalNewlineDiffers(const std::string_view a, const std::string_view b) {
    const auto check = [](const std::string_view shorter, const std::string_view longer) {
        return longer.size() == shorter.size() + 1 && longer.back() == '\n' && longer.starts_with(shorter);
    };
    return check(a, b) || check(b, a);
}

void replaceRange(std::vector<Edit>& edits, const size_t aBegin, const size_t aEnd,
                  const size_t bBegin, const size_t bEnd) {
    for (size_t i = aBegin; i < aEnd; ++i) edits.push_back({Op::Delete, i, bBegin});
    for (size_t j = bBegin; j < bEnd; ++j) edits.push_back({Op::Insert, aEnd, j});
}

// Myers O((N+M)D) shortest edit script over a[aBegin, aEnd) and b[bBegin, bEnd).
void myers(const Lines& a, const size_t aBegin, const size_t aEnd,
           const Lines& b, const size_t bBegin, const size_t bEnd,
           std::vector<Edit>& edits) {
    const long n = static_cast<long>(aEnd - aBegin);
    const long m = static_cast<long>(bEnd - bBegin);
    if (n == 0 && m == 0) return;

    const long max = std::min(n + m, MAX_EDIT_DISTANCE);
    const long offset = max + 1;
    std::vector<long> v(static_cast<size_t>(2 * max + 3), 0);
    std::vector<std::vector<long>> trace;

    // trace[d] holds v[-d-1, d+1] as it stood before round d.
    long found = -1;
    for (long d = 0; d <= max && found < 0; ++d) {
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
        for (long k = -d; k <= d; k += 2) {
            long x = (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1]))
                         ? v[offset + k + 1]
                         : v[offset + k - 1] + 1;
            long y = x - k;
            while (x < n && y < m && a[aBegin + x] == b[bBegin + y]) { ++x; ++y; }
            v[offset + k] = x;
            if (x >= n && y >= m) {
                found = d;
                break;
            }
        }
    }

    if (found < 0) {
        LogRegistry::diff()->debug("[DiffEngine] Edit distance exceeds {}, emitting full replacement", MAX_EDIT_DISTANCE);
        replaceRange(edits, aBegin, aEnd, bBegin, bEnd);
        return;
    }

    std::vector<Edit> reversed;
    long x = n, y = m;
    for (long d = found; d > 0; --d) {
        const auto& vd = trace[static_cast<size_t>(d)];
        const auto at = [&](const long k) { return vd[static_cast<size_t>(k + d + 1)]; };
        const long k = x - y;
        const long prevK = (k == -d || (k != d && at(k - 1) < at(k + 1))) ? k + 1 : k - 1;
        const long prevX = at(prevK);
        const long prevY = prevX - prevK;

        while (x > prevX && y > prevY) {
            --x; --y;
            reversed.push_back({Op::Equal, aBegin + x, bBegin + y});
        }

        if (x == prevX) reversed.push_back({Op::Insert, aBegin + x, bBegin + y - 1});
        else reversed.push_back({Op::Delete, aBegin + x - 1, bBegin + y});

        x = prevX;
        y = prevY;
    }

    while (x > 0 && y > 0) {
        --x; --y;
        reversed.push_back({Op::Equal, aBegin + x, bBegin + y});
    }

    edits.insert(edits.end(), reversed.rbegin(), reversed.rend());
}

std::vector<Edit> diffLines(const Lines& a, const Lines& b) {
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) ++prefix;

    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) ++suffix;

    std::vector<Edit> edits;
    edits.reserve(std::max(a.size(), b.size()));

    for (size_t i = 0; i < prefix; ++i) edits.push_back({Op::Equal, i, i});
    myers(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix, edits);
    for (size_t i = 0; i < suffix; ++i)
        edits.push_back({Op::Equal, a.size() - suffix + i, b.size() - suffix + i});

    return edits;
}

void appendLine(std::vector<std::string>& out, const char prefix, const std::string_view token) {
    const bool hasNewline = !token.empty() && token.back() == '\n';
    std::string line(1, prefix);
    line.append(hasNewline ? token.substr(0, token.size() - 1) : token);
    out.push_back(std::move(line));
    if (!hasNewline) out.emplace_back(NO_NEWLINE_MARKER);
}

Hunk makeHunk(const std::vector<Edit>& edits, const size_t begin, const size_t end,
              const Lines& a, const Lines& b) {
    Hunk hunk;
    for (size_t i = begin; i < end; ++i) {
        const auto& e = edits[i];
        switch (e.op) {
            case Op::Equal:
                ++hunk.oldLines;
                ++hunk.newLines;
                appendLine(hunk.lines, ' ', a[e.oldIdx]);
                break;
            case Op::Delete:
                ++hunk.oldLines;
                appendLine(hunk.lines, '-', a[e.oldIdx]);
                break;
            case Op::Insert:
                ++hunk.newLines;
                appendLine(hunk.lines, '+', b[e.newIdx]);
                break;
        }
    }

    // An empty side reports the line it follows.
    hunk.oldStart = edits[begin].oldIdx + (hunk.oldLines ? 1 : 0);
    hunk.newStart = edits[begin].newIdx + (hunk.newLines ? 1 : 0);
    return hunk;
}

std::vector<Hunk> buildHunks(const std::vector<Edit>& edits, const Lines& a, const Lines& b, const size_t context) {
    std::vector<Hunk> hunks;

    size_t i = 0;
    while (i < edits.size()) {
        if (edits[i].op == Op::Equal) {
            ++i;
            continue;
        }

        const size_t begin = i >= context ? i - context : 0;
        size_t lastChange = i;
        size_t j = i;
        while (j < edits.size()) {
            if (edits[j].op != Op::Equal) {
                lastChange = j++;
                continue;
            }
            size_t k = j;
            while (k < edits.size() && edits[k].op == Op::Equal) ++k;
            if (k < edits.size() && k - j <= 2 * context) {
                j = k;
                continue;
            }
            break;
        }

        const size_t end = std::min(edits.size(), lastChange + 1 + context);
        hunks.push_back(makeHunk(edits, begin, end, a, b));
        i = end;
    }

    return hunks;
}

}

std::string Hunk::header() const {
    return std::format("@@ -{},{} +{},{} @@", oldStart, oldLines, newStart, newLines);
}

std::string Patch::str() const {
    std::string out;
    out += "Index: " + label + "\n";
    out += "===================================================================\n";
    out += "--- " + label + "\tprevious\n";
    out += "+++ " + label + "\tcurrent\n";
    for (const auto& hunk : hunks) {
        out += hunk.header();
        out += '\n';
        for (const auto& line : hunk.lines) {
            out += line;
            out += '\n';
        }
    }
    return out;
}

Patch px::diff::createPatch(const std::string_view previous, const std::string_view current,
                            const std::string& label, const unsigned int context) {
    Patch patch{.label = label, .hunks = {}};
    if (previous == current || onlyFinalNewlineDiffers(previous, current)) return patch;

    const auto a = tokenize(previous);
    const auto b = tokenize(current);
    patch.hunks = buildHunks(diffLines(a, b), a, b, context);
    return patch;
}

Summary px::diff::summarize(const Patch& patch) {
    Summary summary;
    for (const auto& hunk : patch.hunks)
        for (const auto& line : hunk.lines) {
            if (line.starts_with('+')) ++summary.added;
            else if (line.starts_with('-')) ++summary.removed;
        }
    return summary;
}
