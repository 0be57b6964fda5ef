#pragma once

#include <cstdint>
#include <optional>

namespace px::oracle {

// Milliseconds since the Unix epoch.
using Mtime = std::int64_t;

using BufferId = std::int64_t;
using ChangeCounter = std::uint64_t;

struct FileStat {
    Mtime mtime{};
};

// What the editor recorded the last time this buffer and the disk agreed.
struct BufferSyncInfo {
    BufferId bufferId{};
    Mtime lastMtime{};
    ChangeCounter lastChangeCounter{};
};

// Zero-based, end exclusive. An unset end means "through the last line".
struct LineRange {
    std::size_t start = 0;
    std::optional<std::size_t> end;
};

}
