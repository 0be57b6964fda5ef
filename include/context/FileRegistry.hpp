#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace px::context {

namespace model {
struct TrackedFile;
}

// Path-keyed table of tracked files. The map itself is guarded; each entry is
// owned by whichever reconciliation looked it up for the current pass.
class FileRegistry {
public:
    FileRegistry() = default;

    // Replaces any existing entry for the same absolute path.
    void add(const std::shared_ptr<model::TrackedFile>& file);

    // Inserts only when the path is not tracked yet; returns the entry in the map.
    std::shared_ptr<model::TrackedFile> addIfAbsent(const std::shared_ptr<model::TrackedFile>& file);

    bool remove(const std::filesystem::path& absPath);

    // Removes the path only while it still maps to this exact entry.
    bool remove(const std::shared_ptr<model::TrackedFile>& file);

    [[nodiscard]] std::shared_ptr<model::TrackedFile> get(const std::filesystem::path& absPath) const;
    [[nodiscard]] bool contains(const std::filesystem::path& absPath) const;

    // Snapshot sorted by path.
    [[nodiscard]] std::vector<std::shared_ptr<model::TrackedFile>> all() const;

    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::filesystem::path, std::shared_ptr<model::TrackedFile>> files_;
};

}
