#pragma once

#include "context/ContextManager.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace px::context {

// "Context Updates:" followed by one line per changed or failed file; empty
// when nothing changed.
std::string renderSummary(const SyncResults& results);

// Provider message content blocks: a text block describing every update,
// followed by one base64 image block per updated image.
nlohmann::json toProviderContent(const SyncResults& results);

}
