#include "oracle/DiskOracle.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <sys/stat.h>
#include <system_error>

using namespace px::oracle;
namespace fs = std::filesystem;

bool px::oracle::isNotFound(const fs::filesystem_error& e) {
    return e.code() == std::errc::no_such_file_or_directory;
}

bool LocalDisk::exists(const fs::path& absPath) {
    std::error_code ec;
    const bool found = fs::exists(absPath, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw fs::filesystem_error("Failed to check existence", absPath, ec);
    return found;
}

FileStat LocalDisk::stat(const fs::path& absPath) {
    struct ::stat st{};
    if (::stat(absPath.c_str(), &st) != 0)
        throw fs::filesystem_error("Failed to stat file", absPath, std::error_code(errno, std::generic_category()));

    return FileStat{
        .mtime = static_cast<Mtime>(st.st_mtim.tv_sec) * 1000 + static_cast<Mtime>(st.st_mtim.tv_nsec / 1'000'000)
    };
}

std::string LocalDisk::readText(const fs::path& absPath) {
    return util::readFileToString(absPath);
}

std::vector<uint8_t> LocalDisk::readBytes(const fs::path& absPath) {
    return util::readFileToVector(absPath);
}
