/**
 * @file Digest.cpp
 *
 * This module contains the implementation of the HTTP Digest
 * Access Authentication computations.
 *
 * © 2018 by Richard Walters
 */

#include "Crypto.hpp"

#include <AsyncHttp/Digest.hpp>

namespace {

    /**
     * This is the number of random bytes digested to form a client nonce.
     */
    constexpr size_t CNONCE_RANDOM_BYTES = 8;

    /**
     * This function digests the contents of the scratch buffer
     * and then clears it, so that the next stage can reuse it.
     */
    std::vector< uint8_t > Md5AndRecycle(std::string& scratch) {
        const auto digest = AsyncHttp::Md5(scratch);
        scratch.clear();
        return digest;
    }

    /**
     * This function returns an indication of whether or not the given
     * quality of protection adds the nc/cnonce/qop segment to the
     * request-digest.
     */
    bool QopProtectsRequest(const std::string& qop) {
        return (
            (qop == "auth")
            || (qop == "auth-int")
        );
    }

}

namespace AsyncHttp {

    namespace Digest {

        const std::string DEFAULT_NONCE_COUNT = "00000001";

        const std::string EMPTY_ENTITY_MD5 = "d41d8cd98f00b204e9800998ecf8427e";

        Result ComputeHa1(
            const Parameters& parameters,
            std::string& scratch,
            std::vector< uint8_t >& ha1
        ) {
            scratch += parameters.principal;
            scratch += ':';
            scratch += parameters.realmName;
            scratch += ':';
            scratch += parameters.password;
            const auto core = Md5AndRecycle(scratch);
            if (
                parameters.algorithm.empty()
                || (parameters.algorithm == "MD5")
            ) {
                ha1 = core;
                return Result::Success;
            }
            if (parameters.algorithm == "MD5-sess") {
                AppendHex(scratch, core);
                scratch += ':';
                scratch += parameters.nonce;
                scratch += ':';
                scratch += parameters.cnonce;
                ha1 = Md5AndRecycle(scratch);
                return Result::Success;
            }
            return Result::UnsupportedAlgorithm;
        }

        Result ComputeHa2(
            const Parameters& parameters,
            std::string& scratch,
            std::vector< uint8_t >& ha2
        ) {
            if (
                !parameters.qop.empty()
                && !QopProtectsRequest(parameters.qop)
            ) {
                return Result::UnsupportedQop;
            }
            scratch += parameters.method;
            scratch += ':';
            scratch += parameters.digestUri;
            if (parameters.qop == "auth-int") {
                // The request body is not available here, so H(entity-body)
                // is always the digest of an empty body.
                scratch += ':';
                scratch += EMPTY_ENTITY_MD5;
            }
            ha2 = Md5AndRecycle(scratch);
            return Result::Success;
        }

        Result ComputeResponse(
            const Parameters& parameters,
            std::string& scratch,
            std::string& response
        ) {
            std::vector< uint8_t > ha1;
            auto result = ComputeHa1(parameters, scratch, ha1);
            if (result != Result::Success) {
                return result;
            }
            std::vector< uint8_t > ha2;
            result = ComputeHa2(parameters, scratch, ha2);
            if (result != Result::Success) {
                return result;
            }
            AppendHex(scratch, ha1);
            scratch += ':';
            scratch += parameters.nonce;
            scratch += ':';
            if (QopProtectsRequest(parameters.qop)) {
                scratch += parameters.nc;
                scratch += ':';
                scratch += parameters.cnonce;
                scratch += ':';
                scratch += parameters.qop;
                scratch += ':';
            }
            AppendHex(scratch, ha2);
            response = ToHex(Md5AndRecycle(scratch));
            return Result::Success;
        }

        bool NewCnonce(std::string& cnonce) {
            std::vector< uint8_t > randomBytes;
            if (!GenerateRandomBytes(randomBytes, CNONCE_RANDOM_BYTES)) {
                return false;
            }
            cnonce = ToHex(Md5(randomBytes));
            return true;
        }

        std::string Md5Hex(const std::string& input) {
            return ToHex(Md5(input));
        }

    }

}
