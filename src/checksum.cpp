#include "gigvault/checksum.hpp"

#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace gigvault {

namespace {

std::string to_hex(const unsigned char* hash, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

}  // namespace

std::string sha256_hex(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(ByteSource& source) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IoError("cannot initialise SHA-256");
    }

    SourceGuard guard(source);
    source.seek(0);
    std::vector<uint8_t> buf(1024 * 1024);
    while (true) {
        size_t n = source.read(buf.data(), buf.size());
        if (n == 0) break;
        EVP_DigestUpdate(ctx.get(), buf.data(), n);
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx.get(), hash, &len);
    return to_hex(hash, len);
}

}  // namespace gigvault
