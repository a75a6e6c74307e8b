#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tsforecast::utils {

/// Standard (RFC 4648) base64 with '=' padding.
std::string base64Encode(const std::vector<std::uint8_t> &data);

} // namespace tsforecast::utils
