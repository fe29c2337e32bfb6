#pragma once

#include "gigvault/byte_source.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gigvault {

/// Lowercase hex SHA-256 of a byte string.
std::string sha256_hex(const std::vector<uint8_t>& data);
std::string sha256_hex(const std::string& data);

/// Lowercase hex SHA-256 of everything the source yields from offset 0.
/// Opens and closes the source. @throws IoError if it cannot be read.
std::string sha256_hex(ByteSource& source);

}  // namespace gigvault
