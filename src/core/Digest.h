#pragma once
#include <string>

namespace secret_guard {

// Lowercase hex SHA256 of data (OpenSSL EVP). Empty string if the digest cannot be computed.
std::string sha256_hex(const std::string& data);

} // namespace secret_guard
