#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace px::util {

std::string base64Encode(const std::vector<uint8_t>& data);

}
