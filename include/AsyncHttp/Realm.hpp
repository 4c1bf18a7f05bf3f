#ifndef ASYNC_HTTP_REALM_HPP
#define ASYNC_HTTP_REALM_HPP

/**
 * @file Realm.hpp
 *
 * This module declares the AsyncHttp::Realm class.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <Uri/Uri.hpp>

namespace AsyncHttp {

    /**
     * This is an immutable bundle of the parameters needed to
     * authenticate with an origin server or a proxy.  It supports
     * the Basic and Digest schemes, and carries the configuration of the
     * NTLM, SPNEGO, and Kerberos schemes.
     *
     * Realm values are made using Realm::Builder.  Once built, a realm
     * may be shared freely between threads.
     */
    class Realm {
        // Types
    public:
        /**
         * These are the authentication schemes a realm may use.
         */
        enum class AuthScheme {
            Basic,
            Digest,
            Ntlm,
            Spnego,
            Kerberos,
        };

        /**
         * These are the possible outcomes of building a realm.
         */
        enum class BuildResult {
            /**
             * The realm was built.
             */
            Success,

            /**
             * No authentication scheme was set on the builder.
             */
            MissingScheme,

            /**
             * The digest "algorithm" parameter is not supported.
             */
            UnsupportedAlgorithm,

            /**
             * The digest "qop" parameter is not supported.
             */
            UnsupportedQop,

            /**
             * The cryptographic random source could not supply
             * the bytes needed for a client nonce.
             */
            RandomSourceFailure,
        };

        class Builder;

        // Lifecycle management
    public:
        ~Realm() noexcept;
        Realm(const Realm&) = delete;
        Realm(Realm&&) noexcept = delete;
        Realm& operator=(const Realm&) = delete;
        Realm& operator=(Realm&&) noexcept = delete;

        // Public methods
    public:
        const std::string& GetPrincipal() const;
        const std::string& GetPassword() const;
        AuthScheme GetScheme() const;
        const std::string& GetRealmName() const;
        const std::string& GetNonce() const;
        const std::string& GetAlgorithm() const;

        /**
         * This method returns the digest request-digest computed when
         * the realm was built, or an empty string if none was computed.
         */
        const std::string& GetResponse() const;

        const std::string& GetOpaque() const;
        const std::string& GetQop() const;
        const std::string& GetNc() const;
        const std::string& GetCnonce() const;

        /**
         * This method returns an indication of whether or not the realm
         * was built with a request URI.  Realms built for preemptive
         * authentication may not have one.
         */
        bool HasUri() const;

        const Uri::Uri& GetUri() const;
        bool IsUsePreemptiveAuth() const;
        const std::string& GetCharset() const;
        const std::string& GetNtlmDomain() const;
        const std::string& GetNtlmHost() const;
        bool IsUseAbsoluteUri() const;
        bool IsOmitQuery() const;
        const std::string& GetServicePrincipalName() const;
        bool IsUseCanonicalHostname() const;
        const std::string& GetLoginContextName() const;
        const std::map< std::string, std::string >& GetCustomLoginConfig() const;

        // Private methods
    private:
        /**
         * This is the constructor used by Realm::Builder.
         */
        Realm();

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

    /**
     * This is used to accumulate the parameters of a realm and then
     * produce the immutable Realm value.
     *
     * @note
     *     A builder owns mutable state, including the scratch buffer used
     *     to compute digest credentials, and so must not be used from
     *     more than one thread at a time.
     */
    class Realm::Builder {
        // Lifecycle management
    public:
        ~Builder() noexcept;
        Builder(const Builder&) = delete;
        Builder(Builder&&) noexcept = delete;
        Builder& operator=(const Builder&) = delete;
        Builder& operator=(Builder&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs a builder with no principal or password.
         */
        Builder();

        /**
         * This constructs a builder for the given principal and password.
         *
         * @param[in] principal
         *     This is the user name to present to the server.
         *
         * @param[in] password
         *     This is the secret shared with the server.
         */
        Builder(
            const std::string& principal,
            const std::string& password
        );

        /**
         * This constructs a builder holding every value of the given
         * realm, so that a variation of it can be built.
         *
         * @param[in] prototype
         *     This is the realm whose values are copied.
         */
        explicit Builder(const Realm& prototype);

        Builder& SetScheme(AuthScheme scheme);
        Builder& SetRealmName(const std::string& realmName);
        Builder& SetNonce(const std::string& nonce);
        Builder& SetAlgorithm(const std::string& algorithm);
        Builder& SetResponse(const std::string& response);
        Builder& SetOpaque(const std::string& opaque);

        /**
         * This method sets the digest quality of protection.
         * An empty value is ignored, leaving any previous value in place.
         */
        Builder& SetQop(const std::string& qop);

        Builder& SetNc(const std::string& nc);
        Builder& SetUri(const Uri::Uri& uri);

        /**
         * This method sets the request method used in the digest
         * H(A2) computation.  The default is "GET".
         */
        Builder& SetMethodName(const std::string& methodName);

        Builder& SetUsePreemptiveAuth(bool usePreemptiveAuth);
        Builder& SetUseAbsoluteUri(bool useAbsoluteUri);
        Builder& SetOmitQuery(bool omitQuery);
        Builder& SetCharset(const std::string& charset);
        Builder& SetNtlmDomain(const std::string& ntlmDomain);
        Builder& SetNtlmHost(const std::string& ntlmHost);
        Builder& SetServicePrincipalName(const std::string& servicePrincipalName);
        Builder& SetUseCanonicalHostname(bool useCanonicalHostname);
        Builder& SetLoginContextName(const std::string& loginContextName);
        Builder& SetCustomLoginConfig(const std::map< std::string, std::string >& customLoginConfig);

        /**
         * This method extracts the realm, nonce, opaque, algorithm, and qop
         * parameters from the given WWW-Authenticate header value, and
         * selects the Digest scheme if a nonce was found, otherwise Basic.
         *
         * If the server offers several qop values, "auth" is preferred over
         * "auth-int".  If neither is offered, qop is left unset.
         *
         * @param[in] headerLine
         *     This is the raw challenge given by the server.
         *
         * @return
         *     A reference to the builder is returned.
         */
        Builder& ParseWwwAuthenticateHeader(const std::string& headerLine);

        /**
         * This method is the Proxy-Authenticate counterpart of
         * ParseWwwAuthenticateHeader.
         *
         * @note
         *     The qop value is taken as given by the proxy, without
         *     preferring "auth" among several values.
         *
         * @param[in] headerLine
         *     This is the raw challenge given by the proxy.
         *
         * @return
         *     A reference to the builder is returned.
         */
        Builder& ParseProxyAuthenticateHeader(const std::string& headerLine);

        /**
         * This method produces the immutable realm.  If a nonce was set,
         * a fresh client nonce is generated and the digest request-digest
         * is computed, over the root path if no URI was set.
         *
         * @param[out] result
         *     This is where to store the outcome of building the realm.
         *
         * @return
         *     The realm is returned.
         *
         * @retval nullptr
         *     This is returned if the realm could not be built.
         */
        std::shared_ptr< const Realm > Build(BuildResult& result);

        /**
         * This method produces the immutable realm.
         *
         * @return
         *     The realm is returned.
         *
         * @retval nullptr
         *     This is returned if the realm could not be built.
         */
        std::shared_ptr< const Realm > Build();

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Realm::AuthScheme class.
     *
     * @param[in] scheme
     *     This is the authentication scheme value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     authentication scheme value.
     */
    void PrintTo(
        const Realm::AuthScheme& scheme,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Realm::BuildResult class.
     *
     * @param[in] result
     *     This is the build result value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     build result value.
     */
    void PrintTo(
        const Realm::BuildResult& result,
        std::ostream* os
    );

}

#endif /* ASYNC_HTTP_REALM_HPP */
