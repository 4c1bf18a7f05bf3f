/**
 * @file Crypto.cpp
 *
 * This module contains the implementation of the cryptographic
 * helper functions used by the AsyncHttp library.
 *
 * © 2018 by Richard Walters
 */

#include "Crypto.hpp"

#include <functional>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace {

    /**
     * These are the digits used in base-16 encodings.
     */
    const char HEX_DIGITS[] = "0123456789abcdef";

    /**
     * This function computes the MD5 message digest of the given raw data.
     *
     * @param[in] data
     *     This points to the data to digest.
     *
     * @param[in] length
     *     This is the number of bytes to digest.
     *
     * @return
     *     The MD5 digest is returned.  It is empty if OpenSSL
     *     could not compute the digest.
     */
    std::vector< uint8_t > Md5Raw(
        const void* data,
        size_t length
    ) {
        std::unique_ptr< EVP_MD_CTX, std::function< void(EVP_MD_CTX*) > > context(
            EVP_MD_CTX_new(),
            [](EVP_MD_CTX* c) {
                EVP_MD_CTX_free(c);
            }
        );
        if (context == nullptr) {
            return {};
        }
        std::vector< uint8_t > digest(EVP_MAX_MD_SIZE);
        unsigned int digestLength = 0;
        if (
            (EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1)
            || (EVP_DigestUpdate(context.get(), data, length) != 1)
            || (EVP_DigestFinal_ex(context.get(), digest.data(), &digestLength) != 1)
        ) {
            return {};
        }
        digest.resize(digestLength);
        return digest;
    }

}

namespace AsyncHttp {

    std::vector< uint8_t > Md5(const std::string& input) {
        return Md5Raw(input.data(), input.length());
    }

    std::vector< uint8_t > Md5(const std::vector< uint8_t >& input) {
        return Md5Raw(input.data(), input.size());
    }

    void AppendHex(
        std::string& output,
        const std::vector< uint8_t >& bytes
    ) {
        output.reserve(output.length() + bytes.size() * 2);
        for (const auto byte: bytes) {
            output += HEX_DIGITS[(byte >> 4) & 0x0F];
            output += HEX_DIGITS[byte & 0x0F];
        }
    }

    std::string ToHex(const std::vector< uint8_t >& bytes) {
        std::string output;
        AppendHex(output, bytes);
        return output;
    }

    bool GenerateRandomBytes(
        std::vector< uint8_t >& bytes,
        size_t count
    ) {
        bytes.resize(count);
        if (count == 0) {
            return true;
        }
        return (RAND_bytes(bytes.data(), (int)count) == 1);
    }

    std::string Base64Encode(const std::vector< uint8_t >& bytes) {
        if (bytes.empty()) {
            return "";
        }
        std::vector< unsigned char > encoded(4 * ((bytes.size() + 2) / 3) + 1);
        const auto length = EVP_EncodeBlock(
            encoded.data(),
            bytes.data(),
            (int)bytes.size()
        );
        return std::string(
            (const char*)encoded.data(),
            (size_t)length
        );
    }

    std::string Base64Encode(const std::string& input) {
        return Base64Encode(std::vector< uint8_t >(input.begin(), input.end()));
    }

}
