#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace tarb {
namespace crypto {

/**
 * Raw HMAC-SHA256 digest (32 bytes).
 */
std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& message);

/**
 * Standard base64 (RFC 4648 section 4) with padding.
 * Decoding throws std::invalid_argument on malformed input.
 */
std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

/**
 * URL-safe base64 (`-` and `_`), padded. Decoding also accepts the
 * standard alphabet and missing padding.
 */
std::string base64url_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64url_decode(const std::string& encoded);

/**
 * Polymarket L2 request signature:
 * base64url(HMAC-SHA256(base64url_decode(secret), timestamp + method + path + body)).
 */
std::string l2_signature(const std::string& secret, const std::string& timestamp,
                         const std::string& method, const std::string& path,
                         const std::string& body);

/**
 * Cryptographically random bytes.
 */
std::vector<uint8_t> random_bytes(size_t count);

} // namespace crypto
} // namespace tarb
