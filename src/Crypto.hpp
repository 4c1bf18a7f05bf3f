#ifndef ASYNC_HTTP_CRYPTO_HPP
#define ASYNC_HTTP_CRYPTO_HPP

/**
 * @file Crypto.hpp
 *
 * This module declares the cryptographic helper functions used
 * by the AsyncHttp library.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace AsyncHttp {

    /**
     * This function computes the MD5 message digest of the given string.
     *
     * @param[in] input
     *     This is the data to digest.
     *
     * @return
     *     The 16-byte MD5 digest of the input is returned.
     */
    std::vector< uint8_t > Md5(const std::string& input);

    /**
     * This function computes the MD5 message digest of the given bytes.
     *
     * @param[in] input
     *     This is the data to digest.
     *
     * @return
     *     The 16-byte MD5 digest of the input is returned.
     */
    std::vector< uint8_t > Md5(const std::vector< uint8_t >& input);

    /**
     * This function appends the lowercase base-16 encoding of the given
     * bytes to the given string.
     *
     * @param[in,out] output
     *     This is the string to which to append the encoding.
     *
     * @param[in] bytes
     *     These are the bytes to encode.
     */
    void AppendHex(
        std::string& output,
        const std::vector< uint8_t >& bytes
    );

    /**
     * This function returns the lowercase base-16 encoding
     * of the given bytes.
     */
    std::string ToHex(const std::vector< uint8_t >& bytes);

    /**
     * This function fills the given buffer with cryptographically
     * strong random bytes.
     *
     * @param[out] bytes
     *     This is where to store the random bytes.
     *
     * @param[in] count
     *     This is the number of random bytes to generate.
     *
     * @return
     *     An indication of whether or not the random source
     *     delivered the requested bytes is returned.
     */
    bool GenerateRandomBytes(
        std::vector< uint8_t >& bytes,
        size_t count
    );

    /**
     * This function returns the standard base64 encoding
     * (with padding) of the given bytes.
     */
    std::string Base64Encode(const std::vector< uint8_t >& bytes);

    /**
     * This function returns the standard base64 encoding
     * (with padding) of the given string.
     */
    std::string Base64Encode(const std::string& input);

}

#endif /* ASYNC_HTTP_CRYPTO_HPP */
