#ifndef ASYNC_HTTP_DIGEST_HPP
#define ASYNC_HTTP_DIGEST_HPP

/**
 * @file Digest.hpp
 *
 * This module declares the functions which compute the
 * fields of an HTTP Digest Access Authentication credential, as
 * described in [RFC 2617](https://tools.ietf.org/html/rfc2617).
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <vector>

namespace AsyncHttp {

    namespace Digest {

        /**
         * This is the nonce count sent with every digest credential.
         *
         * @note
         *     The count is never incremented when the same server nonce
         *     is reused, which is a known deviation from RFC 2617.
         */
        extern const std::string DEFAULT_NONCE_COUNT;

        /**
         * This is the lowercase hexadecimal MD5 digest of the empty string,
         * used as H(entity-body) for the "auth-int" quality of protection.
         */
        extern const std::string EMPTY_ENTITY_MD5;

        /**
         * These are the possible outcomes of a digest computation.
         */
        enum class Result {
            /**
             * The value was computed.
             */
            Success,

            /**
             * The "algorithm" parameter is neither unset, "MD5",
             * nor "MD5-sess".
             */
            UnsupportedAlgorithm,

            /**
             * The "qop" parameter is neither unset, "auth",
             * nor "auth-int".
             */
            UnsupportedQop,
        };

        /**
         * This holds all of the inputs to the request-digest computation.
         * Empty strings stand for unset parameters.
         */
        struct Parameters {
            std::string principal;
            std::string password;
            std::string realmName;
            std::string algorithm;
            std::string nonce;
            std::string cnonce;
            std::string nc = DEFAULT_NONCE_COUNT;
            std::string qop;
            std::string method = "GET";
            std::string digestUri;
        };

        /**
         * This function computes H(A1).
         *
         * @param[in] parameters
         *     These are the inputs to the computation.
         *
         * @param[in,out] scratch
         *     This is the working buffer.  It must be empty on entry
         *     and is left empty on return.  It is exclusively owned by
         *     the caller for the duration of the call, so the function
         *     is not reentrant with respect to it.
         *
         * @param[out] ha1
         *     This is where to store the digest.
         *
         * @return
         *     The outcome of the computation is returned.
         */
        Result ComputeHa1(
            const Parameters& parameters,
            std::string& scratch,
            std::vector< uint8_t >& ha1
        );

        /**
         * This function computes H(A2).
         *
         * @param[in] parameters
         *     These are the inputs to the computation.
         *
         * @param[in,out] scratch
         *     This is the working buffer.  It must be empty on entry
         *     and is left empty on return.
         *
         * @param[out] ha2
         *     This is where to store the digest.
         *
         * @return
         *     The outcome of the computation is returned.
         */
        Result ComputeHa2(
            const Parameters& parameters,
            std::string& scratch,
            std::vector< uint8_t >& ha2
        );

        /**
         * This function computes the request-digest value sent as the
         * "response" parameter of a digest credential.  H(A1) is computed,
         * then H(A2), in the same scratch buffer, strictly in that order.
         *
         * @param[in] parameters
         *     These are the inputs to the computation.
         *
         * @param[in,out] scratch
         *     This is the working buffer shared by all stages.
         *
         * @param[out] response
         *     This is where to store the lowercase hexadecimal
         *     request-digest.
         *
         * @return
         *     The outcome of the computation is returned.
         */
        Result ComputeResponse(
            const Parameters& parameters,
            std::string& scratch,
            std::string& response
        );

        /**
         * This function generates a new client nonce: the lowercase
         * hexadecimal MD5 digest of 8 cryptographically random bytes.
         *
         * @param[out] cnonce
         *     This is where to store the client nonce.
         *
         * @return
         *     An indication of whether or not the random source
         *     could be used is returned.
         */
        bool NewCnonce(std::string& cnonce);

        /**
         * This function returns the lowercase hexadecimal MD5 digest
         * of the given string.
         */
        std::string Md5Hex(const std::string& input);

    }

}

#endif /* ASYNC_HTTP_DIGEST_HPP */
