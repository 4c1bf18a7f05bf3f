#ifndef ASYNC_HTTP_FORM_ENCODING_HPP
#define ASYNC_HTTP_FORM_ENCODING_HPP

/**
 * @file FormEncoding.hpp
 *
 * This module declares the AsyncHttp::Param structure and the functions
 * used to encode text and form parameters into request body bytes.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <vector>

namespace AsyncHttp {

    /**
     * This represents one name/value pair of a form or query.
     */
    struct Param {
        std::string name;
        std::string value;
    };

    /**
     * This function encodes the given UTF-8 text in the given character set.
     * "UTF-8" is passed through, while "US-ASCII" and "ISO-8859-1" are
     * transcoded, with characters that cannot be represented replaced
     * by '?'.
     *
     * @param[in] text
     *     This is the UTF-8 text to encode.
     *
     * @param[in] charset
     *     This is the name of the character set to use.
     *
     * @param[out] encoded
     *     This is where to store the encoded bytes.  If the character
     *     set is not recognized, the text is stored unchanged.
     *
     * @return
     *     An indication of whether or not the character set
     *     was recognized is returned.
     */
    bool EncodeText(
        const std::string& text,
        const std::string& charset,
        std::vector< uint8_t >& encoded
    );

    /**
     * This function percent-encodes the given string for use as a name
     * or value of an application/x-www-form-urlencoded body.  Spaces
     * become '+', and all but the unreserved characters are escaped.
     */
    std::string FormUrlEncode(const std::string& input);

    /**
     * This function encodes the given form parameters as the body of an
     * application/x-www-form-urlencoded request.
     *
     * @param[in] params
     *     These are the form parameters to encode.
     *
     * @param[in] charset
     *     This is the character set in which names and values
     *     are encoded before they are percent-encoded.
     *
     * @return
     *     The encoded form is returned.
     */
    std::string UrlEncodeFormParams(
        const std::vector< Param >& params,
        const std::string& charset
    );

}

#endif /* ASYNC_HTTP_FORM_ENCODING_HPP */
