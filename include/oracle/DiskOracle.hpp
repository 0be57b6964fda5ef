#pragma once

#include "oracle/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace px::oracle {

// Missing files are reported as std::filesystem::filesystem_error carrying
// std::errc::no_such_file_or_directory.
class DiskOracle {
public:
    virtual ~DiskOracle() = default;

    virtual bool exists(const std::filesystem::path& absPath) = 0;
    virtual FileStat stat(const std::filesystem::path& absPath) = 0;
    virtual std::string readText(const std::filesystem::path& absPath) = 0;
    virtual std::vector<uint8_t> readBytes(const std::filesystem::path& absPath) = 0;
};

class LocalDisk final : public DiskOracle {
public:
    bool exists(const std::filesystem::path& absPath) override;
    FileStat stat(const std::filesystem::path& absPath) override;
    std::string readText(const std::filesystem::path& absPath) override;
    std::vector<uint8_t> readBytes(const std::filesystem::path& absPath) override;
};

[[nodiscard]] bool isNotFound(const std::filesystem::filesystem_error& e);

}
