#pragma once

#include "oracle/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace px::oracle {

// Live view of the editor's buffers. Implementations talk to the editor and
// throw std::runtime_error when it cannot be reached.
class BufferOracle {
public:
    virtual ~BufferOracle() = default;

    // Empty when no buffer is open for the path.
    virtual std::optional<BufferSyncInfo> syncInfo(const std::filesystem::path& absPath) = 0;

    virtual ChangeCounter changeCounter(BufferId buffer) = 0;

    virtual std::vector<std::string> lines(BufferId buffer, const LineRange& range) = 0;

    virtual void reloadFromDisk(BufferId buffer) = 0;
};

}
