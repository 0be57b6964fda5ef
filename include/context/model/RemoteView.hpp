#pragma once

#include "oracle/types.hpp"

#include <string>
#include <variant>

namespace px::context::model {

// The agent has never been shown this file.
struct NotSeen {
    bool operator==(const NotSeen&) const = default;
};

struct TextView {
    std::string content;
    bool operator==(const TextView&) const = default;
};

struct BinaryView {
    oracle::Mtime mtime{};
    bool operator==(const BinaryView&) const = default;
};

using RemoteView = std::variant<NotSeen, TextView, BinaryView>;

}
