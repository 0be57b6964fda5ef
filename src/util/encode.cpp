#include "util/encode.hpp"

#include <sodium.h>
#include <stdexcept>

namespace px::util {

namespace {

void ensureSodium() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");
}

}

std::string base64Encode(const std::vector<uint8_t>& data) {
    ensureSodium();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(encoded_len - 1); // drop the terminating NUL
    return result;
}

}
