#pragma once

#include <string>
#include <string_view>

namespace takoa::core {

// sha256_hex returns the FIPS 180-4 SHA-256 digest of input as 64 lower-case hex characters.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace takoa::core
