#pragma once

#include <string>
#include <magic.h>

namespace px::util {

class Magic {
public:
    Magic();
    ~Magic();

    Magic(const Magic&) = delete;
    Magic& operator=(const Magic&) = delete;

    std::string mime_type(const std::string& path) const;

    static std::string get_mime_type(const std::string& path);

private:
    magic_t cookie;
};

}
