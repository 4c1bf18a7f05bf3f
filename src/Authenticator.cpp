/**
 * @file Authenticator.cpp
 *
 * This module contains the implementation of the functions which turn
 * a realm into the value of an authorization header.
 *
 * © 2018 by Richard Walters
 */

#include "Crypto.hpp"

#include <AsyncHttp/Authenticator.hpp>
#include <AsyncHttp/UriUtilities.hpp>

namespace {

    /**
     * This function appends one parameter of a digest credential
     * to the given header value.
     *
     * @param[in,out] builder
     *     This is the header value being built.
     *
     * @param[in] name
     *     This is the name of the parameter.
     *
     * @param[in] value
     *     This is the value of the parameter.
     *
     * @param[in] quoted
     *     This flag indicates whether or not to surround the value
     *     with double quotes.
     */
    void AppendParameter(
        std::string& builder,
        const std::string& name,
        const std::string& value,
        bool quoted
    ) {
        builder += name;
        builder += '=';
        if (quoted) {
            builder += '"';
            builder += value;
            builder += '"';
        } else {
            builder += value;
        }
        builder += ", ";
    }

    /**
     * This function applies the rules common to the origin and proxy
     * variants of the per-request authorization header.
     */
    bool ComputePerRequestHeader(
        const AsyncHttp::Request& request,
        const std::shared_ptr< const AsyncHttp::Realm >& realm,
        std::string& header
    ) {
        if (
            (realm == nullptr)
            || !realm->IsUsePreemptiveAuth()
        ) {
            return false;
        }
        switch (realm->GetScheme()) {
            case AsyncHttp::Realm::AuthScheme::Basic: {
                header = AsyncHttp::ComputeBasicAuthentication(*realm);
            } return true;

            case AsyncHttp::Realm::AuthScheme::Digest: {
                if (realm->GetNonce().empty()) {
                    return false;
                }
                AsyncHttp::Realm::Builder builder(*realm);
                const auto perRequestRealm = builder
                    .SetUri(request.target)
                    .SetMethodName(request.method)
                    .Build();
                if (perRequestRealm == nullptr) {
                    return false;
                }
                header = AsyncHttp::ComputeDigestAuthentication(*perRequestRealm, request.target);
            } return true;

            case AsyncHttp::Realm::AuthScheme::Ntlm:
            case AsyncHttp::Realm::AuthScheme::Spnego:
            case AsyncHttp::Realm::AuthScheme::Kerberos:
            default: {
                // These schemes authenticate the connection, through a
                // handshake which takes place outside of this library.
            } return false;
        }
    }

}

namespace AsyncHttp {

    std::string ComputeRealmUri(
        const Uri::Uri& uri,
        bool useAbsoluteUri,
        bool omitQuery
    ) {
        if (useAbsoluteUri) {
            return ToUrl(uri, !omitQuery);
        }
        auto realmUri = GetNonEmptyPath(uri);
        if (
            !omitQuery
            && uri.HasQuery()
            && !uri.GetQuery().empty()
        ) {
            realmUri += '?';
            realmUri += uri.GetQuery();
        }
        return realmUri;
    }

    std::string ComputeBasicAuthentication(const Realm& realm) {
        return "Basic " + Base64Encode(realm.GetPrincipal() + ":" + realm.GetPassword());
    }

    std::string ComputeDigestAuthentication(
        const Realm& realm,
        const Uri::Uri& requestUri
    ) {
        const auto& uri = realm.HasUri() ? realm.GetUri() : requestUri;
        std::string builder = "Digest ";
        AppendParameter(builder, "username", realm.GetPrincipal(), true);
        AppendParameter(builder, "realm", realm.GetRealmName(), true);
        AppendParameter(builder, "nonce", realm.GetNonce(), true);
        AppendParameter(
            builder,
            "uri",
            ComputeRealmUri(uri, realm.IsUseAbsoluteUri(), realm.IsOmitQuery()),
            true
        );
        if (!realm.GetAlgorithm().empty()) {
            AppendParameter(builder, "algorithm", realm.GetAlgorithm(), false);
        }
        AppendParameter(builder, "response", realm.GetResponse(), true);
        if (!realm.GetOpaque().empty()) {
            AppendParameter(builder, "opaque", realm.GetOpaque(), true);
        }
        if (!realm.GetQop().empty()) {
            AppendParameter(builder, "qop", realm.GetQop(), false);
            AppendParameter(builder, "nc", realm.GetNc(), false);
            AppendParameter(builder, "cnonce", realm.GetCnonce(), true);
        }

        // Remove the trailing ", ".
        builder.resize(builder.length() - 2);
        return builder;
    }

    bool PerRequestAuthorizationHeader(
        const Request& request,
        std::shared_ptr< const Realm > realm,
        std::string& header
    ) {
        return ComputePerRequestHeader(request, realm, header);
    }

    bool PerRequestProxyAuthorizationHeader(
        const Request& request,
        std::shared_ptr< const Realm > proxyRealm,
        std::string& header
    ) {
        return ComputePerRequestHeader(request, proxyRealm, header);
    }

}
