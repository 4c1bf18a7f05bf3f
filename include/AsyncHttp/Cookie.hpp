#ifndef ASYNC_HTTP_COOKIE_HPP
#define ASYNC_HTTP_COOKIE_HPP

/**
 * @file Cookie.hpp
 *
 * This module declares the AsyncHttp::Cookie structure and the
 * function used to encode cookies into a Cookie request header.
 *
 * © 2018 by Richard Walters
 */

#include <string>
#include <vector>

namespace AsyncHttp {

    /**
     * This represents a cookie to be returned to a server.
     */
    struct Cookie {
        /**
         * This is the name of the cookie.
         */
        std::string name;

        /**
         * This is the value of the cookie.
         */
        std::string value;

        /**
         * This flag indicates whether or not the value should be
         * surrounded by double quotes when it is sent.
         */
        bool wrap = false;

        /**
         * This is the path attribute the server gave the cookie.
         * It is only used to order cookies.
         */
        std::string path;
    };

    /**
     * This function encodes the given cookies as the value of a
     * Cookie request header, as described in
     * [RFC 6265](https://tools.ietf.org/html/rfc6265) section 5.4.
     *
     * @param[in] cookies
     *     These are the cookies to encode.
     *
     * @param[in] strict
     *     This flag indicates whether or not cookies with names or values
     *     which are not valid according to the RFC should be left out, and
     *     cookies with longer paths should be listed first.  If not set,
     *     all cookies are encoded in the order given.
     *
     * @return
     *     The Cookie header value is returned.  It is empty
     *     if no cookie was encoded.
     */
    std::string EncodeCookies(
        const std::vector< Cookie >& cookies,
        bool strict
    );

}

#endif /* ASYNC_HTTP_COOKIE_HPP */
