#include "hash_utils.h"
#include "errors.h"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace texq {

namespace {

std::string to_hex(const unsigned char* bytes, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)bytes[i];
    }
    return ss.str();
}

} // namespace

std::string compute_hash(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return to_hex(digest, sizeof(digest));
}

std::string compute_file_hash(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return "";
    }

    // Streamed in 64 KiB chunks
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    char buf[64 * 1024];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        SHA256_Update(&ctx, buf, static_cast<size_t>(in.gcount()));
    }
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256_Final(digest, &ctx);
    return to_hex(digest, sizeof(digest));
}

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw InfrastructureUnavailable("OpenSSL random generator unavailable");
    }
    bytes[6] = (bytes[6] & 0x0f) | 0x40;
    bytes[8] = (bytes[8] & 0x3f) | 0x80;

    std::string hex = to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

} // namespace texq
