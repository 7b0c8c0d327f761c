/**
 * @file ContentAddress.cpp
 * @brief SHA-256 content address (OpenSSL)
 */

#include "ContentAddress.h"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

std::string contentAddress(const std::string& path) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(path.data()), path.size(), digest);

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned char byte : digest) {
        hex << std::setw(2) << static_cast<int>(byte);
    }
    return hex.str();
}
