#pragma once

#include <memory>

namespace px::context::model { struct SyncResult; }

typedef std::shared_ptr<px::context::model::SyncResult> ExpectedFuture;
