#include "util/files.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwIoFailure(const std::string& what, const fs::path& path, const int err) {
    throw fs::filesystem_error(what, path, std::error_code(err, std::generic_category()));
}

// Opens a regular file positioned at its end and returns its size.
std::streamsize openForRead(std::ifstream& in, const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) throwIoFailure("Failed to stat file", path, ec.value());
    if (status.type() == fs::file_type::not_found) throwIoFailure("No such file", path, ENOENT);
    if (status.type() == fs::file_type::directory) throwIoFailure("Cannot read a directory", path, EISDIR);
    if (status.type() != fs::file_type::regular) throwIoFailure("Not a regular file", path, EINVAL);

    errno = 0;
    in.open(path, std::ios::binary | std::ios::ate);
    if (!in) throwIoFailure("Failed to open file", path, errno ? errno : EIO);

    const std::streamsize size = in.tellg();
    if (size < 0) throwIoFailure("Failed to determine file size", path, EIO);

    in.seekg(0, std::ios::beg);
    return size;
}

}

std::vector<uint8_t> px::util::readFileToVector(const fs::path& path) {
    std::ifstream in;
    const auto size = openForRead(in, path);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!in.read(reinterpret_cast<char*>(buffer.data()), size))
        throwIoFailure("Failed to read file", path, EIO);

    return buffer;
}

std::string px::util::readFileToString(const fs::path& path) {
    std::ifstream in;
    const auto size = openForRead(in, path);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throwIoFailure("Failed to read file", path, EIO);

    return buffer;
}

fs::path px::util::relativeTo(const fs::path& cwd, const fs::path& absPath) {
    const auto rel = absPath.lexically_normal().lexically_relative(cwd.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") return absPath;
    return rel;
}

fs::path px::util::resolveAgainst(const fs::path& cwd, const fs::path& path) {
    if (path.is_absolute()) return path.lexically_normal();
    return (cwd / path).lexically_normal();
}
