/**
 * @file Cookie.cpp
 *
 * This module contains the implementation of the cookie encoder.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <AsyncHttp/Cookie.hpp>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * These are the separator characters which may not appear
     * in a token, as listed in section 3.2.6 of RFC 7230.
     */
    const std::string TOKEN_SEPARATORS = "()<>@,;:\\\"/[]?={} \t";

    /**
     * This function returns an indication of whether or not the given
     * string is a valid cookie-name (an RFC 7230 token).
     */
    bool IsValidCookieName(const std::string& name) {
        if (name.empty()) {
            return false;
        }
        for (const auto c: name) {
            if (
                (c <= 0x20)
                || (c >= 0x7F)
                || (TOKEN_SEPARATORS.find(c) != std::string::npos)
            ) {
                return false;
            }
        }
        return true;
    }

    /**
     * This function returns an indication of whether or not the given
     * string is made only of cookie-octets, as defined in section 4.1.1
     * of RFC 6265.
     */
    bool IsValidCookieValue(const std::string& value) {
        for (const auto c: value) {
            const auto octet = (unsigned char)c;
            if (
                (octet < 0x21)
                || (octet > 0x7E)
                || (octet == '"')
                || (octet == ',')
                || (octet == ';')
                || (octet == '\\')
            ) {
                return false;
            }
        }
        return true;
    }

}

namespace AsyncHttp {

    std::string EncodeCookies(
        const std::vector< Cookie >& cookies,
        bool strict
    ) {
        std::vector< const Cookie* > selected;
        for (const auto& cookie: cookies) {
            if (
                strict
                && (
                    !IsValidCookieName(cookie.name)
                    || !IsValidCookieValue(cookie.value)
                )
            ) {
                continue;
            }
            selected.push_back(&cookie);
        }
        if (strict) {
            std::stable_sort(
                selected.begin(),
                selected.end(),
                [](const Cookie* lhs, const Cookie* rhs){
                    return lhs->path.length() > rhs->path.length();
                }
            );
        }
        std::vector< std::string > pairs;
        for (const auto cookie: selected) {
            if (cookie->wrap) {
                pairs.push_back(cookie->name + "=\"" + cookie->value + "\"");
            } else {
                pairs.push_back(cookie->name + "=" + cookie->value);
            }
        }
        return SystemAbstractions::Join(pairs, "; ");
    }

}
