/**
 * @file UriUtilities.cpp
 *
 * This module contains the implementation of the helper functions
 * which derive string forms of request targets.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/UriUtilities.hpp>
#include <inttypes.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>

namespace {

    /**
     * This is the default port number associated with
     * the HTTP protocol and scheme.
     */
    constexpr uint16_t DEFAULT_HTTP_PORT_NUMBER = 80;

    /**
     * This is the default port number associated with
     * the HTTPS protocol and scheme.
     */
    constexpr uint16_t DEFAULT_HTTPS_PORT_NUMBER = 443;

    /**
     * This function returns a copy of the given URI which
     * has at least the root path segment.
     */
    Uri::Uri WithNonEmptyPath(const Uri::Uri& uri) {
        auto copy = uri;
        if (copy.GetPath().empty()) {
            copy.SetPath({""});
        }
        return copy;
    }

    /**
     * This function returns the host of the given URI as it must
     * appear in an authority, with IPv6 literals in brackets.
     */
    std::string HostLiteral(const Uri::Uri& uri) {
        const auto& host = uri.GetHost();
        if (
            (host.find(':') == std::string::npos)
            || (!host.empty() && (host[0] == '['))
        ) {
            return host;
        }
        return "[" + host + "]";
    }

}

namespace AsyncHttp {

    bool IsSecured(const Uri::Uri& uri) {
        const auto& scheme = uri.GetScheme();
        return (
            (scheme == "https")
            || (scheme == "wss")
        );
    }

    bool IsWebSocket(const Uri::Uri& uri) {
        const auto& scheme = uri.GetScheme();
        return (
            (scheme == "ws")
            || (scheme == "wss")
        );
    }

    uint16_t GetSchemeDefaultPort(const Uri::Uri& uri) {
        return IsSecured(uri) ? DEFAULT_HTTPS_PORT_NUMBER : DEFAULT_HTTP_PORT_NUMBER;
    }

    uint16_t GetExplicitPort(const Uri::Uri& uri) {
        if (uri.HasPort()) {
            return uri.GetPort();
        } else {
            return GetSchemeDefaultPort(uri);
        }
    }

    std::string GetNonEmptyPath(const Uri::Uri& uri) {
        Uri::Uri pathOnly;
        pathOnly.SetPath(WithNonEmptyPath(uri).GetPath());
        const auto path = pathOnly.GenerateString();
        return path.empty() ? "/" : path;
    }

    std::string ToUrl(
        const Uri::Uri& uri,
        bool includeQuery
    ) {
        auto url = WithNonEmptyPath(uri);
        url.ClearFragment();
        if (!includeQuery) {
            url.ClearQuery();
        }
        return url.GenerateString();
    }

    std::string ToRelativeUrl(const Uri::Uri& uri) {
        Uri::Uri relative;
        relative.SetPath(WithNonEmptyPath(uri).GetPath());
        if (uri.HasQuery()) {
            relative.SetQuery(uri.GetQuery());
        }
        const auto target = relative.GenerateString();
        if (target.empty() || (target[0] == '?')) {
            return "/" + target;
        }
        return target;
    }

    std::string GetAuthority(const Uri::Uri& uri) {
        return SystemAbstractions::sprintf(
            "%s:%" PRIu16,
            HostLiteral(uri).c_str(),
            GetExplicitPort(uri)
        );
    }

    std::string HostHeader(const Uri::Uri& uri) {
        if (
            !uri.HasPort()
            || (uri.GetPort() == GetSchemeDefaultPort(uri))
        ) {
            return HostLiteral(uri);
        }
        return GetAuthority(uri);
    }

    std::string OriginHeader(const Uri::Uri& uri) {
        std::string origin = IsSecured(uri) ? "https://" : "http://";
        origin += HostLiteral(uri);
        if (
            uri.HasPort()
            && (uri.GetPort() != GetSchemeDefaultPort(uri))
        ) {
            origin += SystemAbstractions::sprintf(":%" PRIu16, uri.GetPort());
        }
        return origin;
    }

}
