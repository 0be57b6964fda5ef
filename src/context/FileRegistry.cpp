#include "context/FileRegistry.hpp"
#include "context/model/TrackedFile.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <stdexcept>

using namespace px::context;
using namespace px::context::model;
using namespace px::logging;

void FileRegistry::add(const std::shared_ptr<TrackedFile>& file) {
    if (!file) throw std::invalid_argument("[FileRegistry] Cannot track a null file");

    std::unique_lock lock(mutex_);
    files_[file->absPath] = file;
    LogRegistry::context()->debug("[FileRegistry] Tracking {} ({})", file->absPath.string(), to_string(file->typeInfo.category));
}

std::shared_ptr<TrackedFile> FileRegistry::addIfAbsent(const std::shared_ptr<TrackedFile>& file) {
    if (!file) throw std::invalid_argument("[FileRegistry] Cannot track a null file");

    std::unique_lock lock(mutex_);
    const auto [it, inserted] = files_.try_emplace(file->absPath, file);
    if (inserted)
        LogRegistry::context()->debug("[FileRegistry] Tracking {} ({})", file->absPath.string(), to_string(file->typeInfo.category));
    return it->second;
}

bool FileRegistry::remove(const std::filesystem::path& absPath) {
    std::unique_lock lock(mutex_);
    const bool removed = files_.erase(absPath) > 0;
    if (removed) LogRegistry::context()->debug("[FileRegistry] Untracked {}", absPath.string());
    return removed;
}

bool FileRegistry::remove(const std::shared_ptr<TrackedFile>& file) {
    if (!file) return false;

    std::unique_lock lock(mutex_);
    const auto it = files_.find(file->absPath);
    if (it == files_.end() || it->second != file) return false;
    files_.erase(it);
    LogRegistry::context()->debug("[FileRegistry] Untracked {}", file->absPath.string());
    return true;
}

std::shared_ptr<TrackedFile> FileRegistry::get(const std::filesystem::path& absPath) const {
    std::shared_lock lock(mutex_);
    if (const auto it = files_.find(absPath); it != files_.end()) return it->second;
    return nullptr;
}

bool FileRegistry::contains(const std::filesystem::path& absPath) const {
    std::shared_lock lock(mutex_);
    return files_.contains(absPath);
}

std::vector<std::shared_ptr<TrackedFile>> FileRegistry::all() const {
    std::vector<std::shared_ptr<TrackedFile>> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(files_.size());
        for (const auto& file : files_ | std::views::values) out.push_back(file);
    }
    std::ranges::sort(out, {}, [](const auto& f) { return f->absPath; });
    return out;
}

bool FileRegistry::empty() const {
    std::shared_lock lock(mutex_);
    return files_.empty();
}

size_t FileRegistry::size() const {
    std::shared_lock lock(mutex_);
    return files_.size();
}
