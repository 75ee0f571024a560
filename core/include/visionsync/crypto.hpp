#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace visionsync::crypto {

std::string base64_encode(const std::vector<uint8_t> &in);
std::vector<uint8_t> base64_decode(const std::string &in);

// Cryptographically random bytes (OpenSSL RAND_bytes). Throws on RNG failure.
std::vector<uint8_t> random_bytes(size_t n);

std::vector<uint8_t> sha1(const std::string &data);

// Random RFC 4122 version 4 identifier, upper-case hex.
std::string new_uuid();

} // namespace visionsync::crypto
