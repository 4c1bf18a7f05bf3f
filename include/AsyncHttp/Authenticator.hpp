#ifndef ASYNC_HTTP_AUTHENTICATOR_HPP
#define ASYNC_HTTP_AUTHENTICATOR_HPP

/**
 * @file Authenticator.hpp
 *
 * This module declares the functions which turn a realm into the value
 * of an Authorization or Proxy-Authorization header.
 *
 * © 2018 by Richard Walters
 */

#include "Realm.hpp"
#include "Request.hpp"

#include <memory>
#include <string>
#include <Uri/Uri.hpp>

namespace AsyncHttp {

    /**
     * This function computes the "digest-uri" value of a digest
     * credential for a request made to the given URI.
     *
     * @param[in] uri
     *     This is the target of the request.
     *
     * @param[in] useAbsoluteUri
     *     This flag indicates whether to use the absolute URL rather
     *     than the path and query.
     *
     * @param[in] omitQuery
     *     This flag indicates whether or not to leave out the query.
     *
     * @return
     *     The digest-uri value is returned.
     */
    std::string ComputeRealmUri(
        const Uri::Uri& uri,
        bool useAbsoluteUri,
        bool omitQuery
    );

    /**
     * This function returns the Basic credentials of the given realm,
     * in the form "Basic <base64(principal:password)>".
     */
    std::string ComputeBasicAuthentication(const Realm& realm);

    /**
     * This function serializes the Digest credentials of the given realm.
     *
     * @param[in] realm
     *     This is the realm holding the credentials.  Its response should
     *     already have been computed by Realm::Builder.
     *
     * @param[in] requestUri
     *     This is the target of the request, used for the "uri" parameter
     *     if the realm was built without a URI.
     *
     * @return
     *     The header value, beginning with "Digest ", is returned.
     */
    std::string ComputeDigestAuthentication(
        const Realm& realm,
        const Uri::Uri& requestUri
    );

    /**
     * This function computes the Authorization header value to send with
     * the given request, if any.  Only preemptive Basic realms, and
     * preemptive Digest realms having a nonce, produce a value here;
     * the connection-oriented schemes (NTLM, SPNEGO, Kerberos) never do.
     *
     * @param[in] request
     *     This is the request to be authorized.
     *
     * @param[in] realm
     *     This is the origin server realm, or nullptr if there is none.
     *
     * @param[out] header
     *     This is where to store the header value.
     *
     * @return
     *     An indication of whether or not a header value was
     *     computed is returned.
     */
    bool PerRequestAuthorizationHeader(
        const Request& request,
        std::shared_ptr< const Realm > realm,
        std::string& header
    );

    /**
     * This function computes the Proxy-Authorization header value to send
     * with the given request, if any, following the same rules as
     * PerRequestAuthorizationHeader.
     *
     * @param[in] request
     *     This is the request to be authorized.
     *
     * @param[in] proxyRealm
     *     This is the proxy realm, or nullptr if there is none.
     *
     * @param[out] header
     *     This is where to store the header value.
     *
     * @return
     *     An indication of whether or not a header value was
     *     computed is returned.
     */
    bool PerRequestProxyAuthorizationHeader(
        const Request& request,
        std::shared_ptr< const Realm > proxyRealm,
        std::string& header
    );

}

#endif /* ASYNC_HTTP_AUTHENTICATOR_HPP */
