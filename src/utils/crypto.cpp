#include "utils/crypto.hpp"
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace tarb {
namespace crypto {

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& message) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (HMAC(EVP_sha256(),
             key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(message.data()), message.size(),
             hash, &hash_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty()) return {};
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length is not a multiple of 4");
    }

    std::vector<uint8_t> out(3 * encoded.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("malformed base64 input");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') padding++;
    if (encoded[encoded.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string s = base64_encode(data);
    std::replace(s.begin(), s.end(), '+', '-');
    std::replace(s.begin(), s.end(), '/', '_');
    return s;
}

std::vector<uint8_t> base64url_decode(const std::string& encoded) {
    std::string s = encoded;
    std::replace(s.begin(), s.end(), '-', '+');
    std::replace(s.begin(), s.end(), '_', '/');
    while (s.size() % 4 != 0) s.push_back('=');
    return base64_decode(s);
}

std::string l2_signature(const std::string& secret, const std::string& timestamp,
                         const std::string& method, const std::string& path,
                         const std::string& body) {
    auto key = base64url_decode(secret);
    return base64url_encode(hmac_sha256(key, timestamp + method + path + body));
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

} // namespace crypto
} // namespace tarb
