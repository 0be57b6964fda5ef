#include "util/Magic.hpp"

#include <mutex>
#include <stdexcept>

using namespace px::util;

namespace {

// A magic cookie is not safe to share between threads.
std::mutex& magicMutex() {
    static std::mutex m;
    return m;
}

}

Magic::Magic() {
    cookie = magic_open(MAGIC_MIME_TYPE);
    if (!cookie) throw std::runtime_error("Failed to create magic cookie");

    // Let libmagic find its own database
    if (magic_load(cookie, nullptr) != 0) {
        std::string err = magic_error(cookie) ? magic_error(cookie) : "Unknown error";
        magic_close(cookie);
        throw std::runtime_error("Failed to load magic database: " + err);
    }
}

Magic::~Magic() {
    if (cookie) magic_close(cookie);
}

std::string Magic::mime_type(const std::string& path) const {
    if (path.empty()) throw std::invalid_argument("Cannot detect MIME type of empty path");

    const char* result = magic_file(cookie, path.c_str());
    if (!result) {
        std::string err = magic_error(cookie) ? magic_error(cookie) : "Unknown error";
        throw std::runtime_error("magic_file failed: " + err);
    }
    return {result};
}

// Static interface
std::string Magic::get_mime_type(const std::string& path) {
    static Magic instance;
    std::scoped_lock lock(magicMutex());
    return instance.mime_type(path);
}
