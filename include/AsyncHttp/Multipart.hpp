#ifndef ASYNC_HTTP_MULTIPART_HPP
#define ASYNC_HTTP_MULTIPART_HPP

/**
 * @file Multipart.hpp
 *
 * This module declares the AsyncHttp::Part structure and the functions
 * used to encode a multipart/form-data request body, as described in
 * [RFC 7578](https://tools.ietf.org/html/rfc7578).
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <vector>

namespace AsyncHttp {

    /**
     * This represents one part of a multipart/form-data body.
     */
    struct Part {
        /**
         * This is the name of the form field.
         */
        std::string name;

        /**
         * This is the name of the file the part came from, if any.
         */
        std::string fileName;

        /**
         * This is the media type of the part, if it should be given.
         */
        std::string contentType;

        /**
         * This is the content of the part.
         */
        std::vector< uint8_t > content;
    };

    /**
     * This function extracts the boundary parameter from the given
     * Content-Type header value.
     *
     * @param[in] contentType
     *     This is the Content-Type header value to search.
     *
     * @param[out] boundary
     *     This is where to store the boundary.
     *
     * @return
     *     An indication of whether or not a boundary was found is returned.
     */
    bool ExtractBoundary(
        const std::string& contentType,
        std::string& boundary
    );

    /**
     * This function generates a new random multipart boundary.
     *
     * @param[out] boundary
     *     This is where to store the boundary.
     *
     * @return
     *     An indication of whether or not the random source
     *     could be used is returned.
     */
    bool NewBoundary(std::string& boundary);

    /**
     * This function encodes the given parts as a sequence of byte
     * blocks which, concatenated, form a multipart body.
     *
     * @param[in] parts
     *     These are the parts to encode.
     *
     * @param[in] boundary
     *     This is the boundary delimiting the parts.
     *
     * @return
     *     The encoded body, in blocks, is returned.
     */
    std::vector< std::vector< uint8_t > > EncodeMultipart(
        const std::vector< Part >& parts,
        const std::string& boundary
    );

}

#endif /* ASYNC_HTTP_MULTIPART_HPP */
