#include "common/checksum.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

bool calculateChecksum(const std::string& filePath, std::string& digest, std::string& error) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        error = "Failed to open " + filePath;
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        error = "Failed to create OpenSSL context";
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to initialize digest";
        return false;
    }

    char buffer[65536];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                error = "Failed to update digest for " + filePath;
                return false;
            }
        }
    }

    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        error = "Read error on " + filePath;
        return false;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to finalize digest for " + filePath;
        return false;
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    digest = ss.str();
    return true;
}
