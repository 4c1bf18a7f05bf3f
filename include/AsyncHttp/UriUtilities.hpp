#ifndef ASYNC_HTTP_URI_UTILITIES_HPP
#define ASYNC_HTTP_URI_UTILITIES_HPP

/**
 * @file UriUtilities.hpp
 *
 * This module declares helper functions which derive the various
 * string forms of a request target from a Uri::Uri.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <Uri/Uri.hpp>

namespace AsyncHttp {

    /**
     * This function returns an indication of whether or not the given
     * URI uses a scheme that is carried over TLS ("https" or "wss").
     */
    bool IsSecured(const Uri::Uri& uri);

    /**
     * This function returns an indication of whether or not the given
     * URI uses a WebSocket scheme ("ws" or "wss").
     */
    bool IsWebSocket(const Uri::Uri& uri);

    /**
     * This function returns the default port number for the scheme
     * of the given URI: 443 for secured schemes, otherwise 80.
     */
    uint16_t GetSchemeDefaultPort(const Uri::Uri& uri);

    /**
     * This function returns the port number given explicitly in the URI,
     * or the scheme default port if the URI has no port.
     */
    uint16_t GetExplicitPort(const Uri::Uri& uri);

    /**
     * This function returns the path of the given URI, substituting
     * the root path ("/") if the URI has an empty path.
     */
    std::string GetNonEmptyPath(const Uri::Uri& uri);

    /**
     * This function returns the absolute URL form of the given URI,
     * which is the URI without any fragment.
     *
     * @param[in] uri
     *     This is the URI to format.
     *
     * @param[in] includeQuery
     *     This flag indicates whether or not to keep the query.
     *
     * @return
     *     The absolute URL form of the URI is returned.
     */
    std::string ToUrl(
        const Uri::Uri& uri,
        bool includeQuery = true
    );

    /**
     * This function returns the origin-form of the given URI
     * (path and query only).
     */
    std::string ToRelativeUrl(const Uri::Uri& uri);

    /**
     * This function returns the authority-form of the given URI
     * ("host:port"), always including the port.
     */
    std::string GetAuthority(const Uri::Uri& uri);

    /**
     * This function returns the value to use for the Host header of
     * a request made to the given URI.  The port is included only if
     * it is given and differs from the scheme default port.
     */
    std::string HostHeader(const Uri::Uri& uri);

    /**
     * This function returns the value to use for the Origin header of
     * a WebSocket opening handshake made to the given URI.
     */
    std::string OriginHeader(const Uri::Uri& uri);

}

#endif /* ASYNC_HTTP_URI_UTILITIES_HPP */
