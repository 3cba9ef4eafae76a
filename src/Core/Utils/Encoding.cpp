/**
 * @file Encoding.cpp
 * @brief Base64, hex, digest and machine identity implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Encoding.hpp>
#include <Lectern/Core/Logger.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <unistd.h>
#include <climits>
#include <fstream>
#include <sstream>

namespace Lectern::Encoding {

std::string toBase64(ByteSpan data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    if (!b64 || !bmem) {
        BIO_free(b64);
        BIO_free(bmem);
        return "";
    }
    b64 = BIO_push(b64, bmem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(b64);

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);

    BIO_free_all(b64);

    return result;
}

Result<ByteBuffer> fromBase64(const std::string& base64) {
    if (base64.empty()) {
        return ByteBuffer{};
    }

    // EVP_DecodeBlock rejects anything outside the alphabet
    if (base64.size() % 4 != 0) {
        return ErrorCode::InvalidBase64;
    }

    ByteBuffer buffer(base64.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(base64.data()),
                                  static_cast<int>(base64.size()));
    if (decoded < 0) {
        return ErrorCode::InvalidBase64;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (base64[base64.size() - 1] == '=') padding++;
    if (base64[base64.size() - 2] == '=') padding++;

    buffer.resize(static_cast<size_t>(decoded) - padding);
    return buffer;
}

std::string toHex(ByteSpan data) {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);

    for (Byte b : data) {
        result.push_back(hexChars[(b >> 4) & 0x0F]);
        result.push_back(hexChars[b & 0x0F]);
    }

    return result;
}

Result<ByteBuffer> sha256(ByteSpan data) {
    ByteBuffer digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &length,
                   EVP_sha256(), nullptr) != 1) {
        return ErrorCode::HashFailed;
    }

    digest.resize(length);
    return digest;
}

Result<ByteBuffer> randomBytes(size_t size) {
    ByteBuffer buffer(size);
    if (size > 0 && RAND_bytes(buffer.data(), static_cast<int>(size)) != 1) {
        return ErrorCode::RandomGenerationFailed;
    }
    return buffer;
}

std::string machineIdentifier() {
    std::string material;

    for (const char* path : {"/etc/machine-id", "/var/lib/dbus/machine-id"}) {
        std::ifstream file(path);
        if (file) {
            std::getline(file, material);
            if (!material.empty()) {
                break;
            }
        }
    }

    char host[HOST_NAME_MAX + 1] = {};
    if (gethostname(host, sizeof(host) - 1) == 0) {
        material += "|";
        material += host;
    }

    if (!material.empty()) {
        auto digest = sha256(asBytes(material));
        if (digest.isSuccess()) {
            const ByteBuffer& bytes = digest.value();
            return toHex(ByteSpan(bytes.data(), 16));
        }
    }

    LECTERN_LOG_WARNING("No host identity available, using a random machine id");
    auto random = randomBytes(16);
    if (random.isSuccess()) {
        return toHex(random.value());
    }
    return "unknown-host";
}

} // namespace Lectern::Encoding
