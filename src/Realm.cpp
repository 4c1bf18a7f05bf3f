/**
 * @file Realm.cpp
 *
 * This module contains the implementation of the AsyncHttp::Realm class.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/Authenticator.hpp>
#include <AsyncHttp/Digest.hpp>
#include <AsyncHttp/Realm.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>

namespace {

    /**
     * This function returns an indication of whether or not the character
     * at the given position of a challenge begins a new parameter.
     */
    bool IsParameterBoundary(
        const std::string& headerLine,
        size_t position
    ) {
        if (position == 0) {
            return true;
        }
        const auto previous = headerLine[position - 1];
        return (
            (previous == ' ')
            || (previous == '\t')
            || (previous == ',')
        );
    }

    /**
     * This function finds the value of the given parameter in the given
     * raw challenge.  The value extends to the next comma which is not
     * inside a quoted string, and one layer of surrounding double quotes
     * is removed.
     *
     * @param[in] headerLine
     *     This is the raw challenge to search.
     *
     * @param[in] token
     *     This is the name of the parameter to find.
     *
     * @param[out] value
     *     This is where to store the value of the parameter.
     *
     * @return
     *     An indication of whether or not the parameter was found
     *     is returned.
     */
    bool Match(
        const std::string& headerLine,
        const std::string& token,
        std::string& value
    ) {
        const auto needle = token + "=";
        size_t match = headerLine.find(needle);
        while (
            (match != std::string::npos)
            && !IsParameterBoundary(headerLine, match)
        ) {
            match = headerLine.find(needle, match + 1);
        }
        if (match == std::string::npos) {
            return false;
        }
        const auto valueStart = match + needle.length();
        auto valueEnd = valueStart;
        bool quoted = false;
        while (valueEnd < headerLine.length()) {
            const auto c = headerLine[valueEnd];
            if (c == '"') {
                quoted = !quoted;
            } else if (
                (c == ',')
                && !quoted
            ) {
                break;
            }
            ++valueEnd;
        }
        value = SystemAbstractions::Trim(headerLine.substr(valueStart, valueEnd - valueStart));
        if (
            !value.empty()
            && (value.back() == '"')
        ) {
            value.pop_back();
        }
        if (
            !value.empty()
            && (value.front() == '"')
        ) {
            value.erase(0, 1);
        }
        return true;
    }

    /**
     * This function selects a quality of protection from the
     * comma-separated list offered by a server, preferring "auth" over
     * "auth-int".
     *
     * @param[in] rawQop
     *     This is the list of values offered by the server.
     *
     * @return
     *     The selected value is returned, or an empty string if the server
     *     offered neither "auth" nor "auth-int".
     */
    std::string ParseRawQop(const std::string& rawQop) {
        std::vector< std::string > serverSupportedQops;
        size_t start = 0;
        for (;;) {
            const auto delimiter = rawQop.find(',', start);
            serverSupportedQops.push_back(
                SystemAbstractions::Trim(
                    rawQop.substr(
                        start,
                        (delimiter == std::string::npos) ? std::string::npos : delimiter - start
                    )
                )
            );
            if (delimiter == std::string::npos) {
                break;
            }
            start = delimiter + 1;
        }
        for (const auto& qop: serverSupportedQops) {
            if (qop == "auth") {
                return qop;
            }
        }
        for (const auto& qop: serverSupportedQops) {
            if (qop == "auth-int") {
                return qop;
            }
        }
        return "";
    }

}

namespace AsyncHttp {

    /**
     * This contains the private properties of a Realm instance.
     */
    struct Realm::Impl {
        std::string principal;
        std::string password;
        AuthScheme scheme = AuthScheme::Basic;
        std::string realmName;
        std::string nonce;
        std::string algorithm;
        std::string response;
        std::string opaque;
        std::string qop;
        std::string nc;
        std::string cnonce;
        bool hasUri = false;
        Uri::Uri uri;
        bool usePreemptiveAuth = false;
        std::string charset;
        std::string ntlmDomain;
        std::string ntlmHost;
        bool useAbsoluteUri = false;
        bool omitQuery = false;
        std::string servicePrincipalName;
        bool useCanonicalHostname = false;
        std::string loginContextName;
        std::map< std::string, std::string > customLoginConfig;
    };

    /**
     * This contains the private properties of a Realm::Builder instance.
     */
    struct Realm::Builder::Impl {
        // Properties

        /**
         * These are the values which the built realm will carry.
         */
        Realm::Impl fields;

        /**
         * This flag indicates whether or not a scheme was set.
         */
        bool hasScheme = false;

        /**
         * This is the request method used in the H(A2) computation.
         */
        std::string methodName = "GET";

        /**
         * This is the working buffer shared by the H(A1), H(A2) and
         * request-digest stages.  It belongs to this builder alone.
         */
        std::string scratch;

        // Methods

        /**
         * This method computes the request-digest for the builder's
         * current parameters and stores it in the fields.
         *
         * @return
         *     The outcome of the computation is returned.
         */
        Digest::Result NewResponse() {
            // Compute the digest URI before the scratch buffer is
            // used for anything else.
            Digest::Parameters parameters;
            parameters.digestUri = ComputeRealmUri(
                fields.uri,
                fields.useAbsoluteUri,
                fields.omitQuery
            );
            parameters.principal = fields.principal;
            parameters.password = fields.password;
            parameters.realmName = fields.realmName;
            parameters.algorithm = fields.algorithm;
            parameters.nonce = fields.nonce;
            parameters.cnonce = fields.cnonce;
            parameters.nc = fields.nc;
            parameters.qop = fields.qop;
            parameters.method = methodName;
            scratch.clear();
            return Digest::ComputeResponse(parameters, scratch, fields.response);
        }
    };

    Realm::~Realm() noexcept = default;

    Realm::Realm()
        : impl_(new Impl)
    {
    }

    const std::string& Realm::GetPrincipal() const {
        return impl_->principal;
    }

    const std::string& Realm::GetPassword() const {
        return impl_->password;
    }

    auto Realm::GetScheme() const -> AuthScheme {
        return impl_->scheme;
    }

    const std::string& Realm::GetRealmName() const {
        return impl_->realmName;
    }

    const std::string& Realm::GetNonce() const {
        return impl_->nonce;
    }

    const std::string& Realm::GetAlgorithm() const {
        return impl_->algorithm;
    }

    const std::string& Realm::GetResponse() const {
        return impl_->response;
    }

    const std::string& Realm::GetOpaque() const {
        return impl_->opaque;
    }

    const std::string& Realm::GetQop() const {
        return impl_->qop;
    }

    const std::string& Realm::GetNc() const {
        return impl_->nc;
    }

    const std::string& Realm::GetCnonce() const {
        return impl_->cnonce;
    }

    bool Realm::HasUri() const {
        return impl_->hasUri;
    }

    const Uri::Uri& Realm::GetUri() const {
        return impl_->uri;
    }

    bool Realm::IsUsePreemptiveAuth() const {
        return impl_->usePreemptiveAuth;
    }

    const std::string& Realm::GetCharset() const {
        return impl_->charset;
    }

    const std::string& Realm::GetNtlmDomain() const {
        return impl_->ntlmDomain;
    }

    const std::string& Realm::GetNtlmHost() const {
        return impl_->ntlmHost;
    }

    bool Realm::IsUseAbsoluteUri() const {
        return impl_->useAbsoluteUri;
    }

    bool Realm::IsOmitQuery() const {
        return impl_->omitQuery;
    }

    const std::string& Realm::GetServicePrincipalName() const {
        return impl_->servicePrincipalName;
    }

    bool Realm::IsUseCanonicalHostname() const {
        return impl_->useCanonicalHostname;
    }

    const std::string& Realm::GetLoginContextName() const {
        return impl_->loginContextName;
    }

    const std::map< std::string, std::string >& Realm::GetCustomLoginConfig() const {
        return impl_->customLoginConfig;
    }

    Realm::Builder::~Builder() noexcept = default;

    Realm::Builder::Builder()
        : impl_(new Impl)
    {
        impl_->fields.nc = Digest::DEFAULT_NONCE_COUNT;
        impl_->fields.charset = "UTF-8";
        impl_->fields.ntlmHost = "localhost";
    }

    Realm::Builder::Builder(
        const std::string& principal,
        const std::string& password
    )
        : Builder()
    {
        impl_->fields.principal = principal;
        impl_->fields.password = password;
    }

    Realm::Builder::Builder(const Realm& prototype)
        : impl_(new Impl)
    {
        impl_->fields = *prototype.impl_;
        impl_->hasScheme = true;
    }

    auto Realm::Builder::SetScheme(AuthScheme scheme) -> Builder& {
        impl_->fields.scheme = scheme;
        impl_->hasScheme = true;
        return *this;
    }

    auto Realm::Builder::SetRealmName(const std::string& realmName) -> Builder& {
        impl_->fields.realmName = realmName;
        return *this;
    }

    auto Realm::Builder::SetNonce(const std::string& nonce) -> Builder& {
        impl_->fields.nonce = nonce;
        return *this;
    }

    auto Realm::Builder::SetAlgorithm(const std::string& algorithm) -> Builder& {
        impl_->fields.algorithm = algorithm;
        return *this;
    }

    auto Realm::Builder::SetResponse(const std::string& response) -> Builder& {
        impl_->fields.response = response;
        return *this;
    }

    auto Realm::Builder::SetOpaque(const std::string& opaque) -> Builder& {
        impl_->fields.opaque = opaque;
        return *this;
    }

    auto Realm::Builder::SetQop(const std::string& qop) -> Builder& {
        if (!qop.empty()) {
            impl_->fields.qop = qop;
        }
        return *this;
    }

    auto Realm::Builder::SetNc(const std::string& nc) -> Builder& {
        impl_->fields.nc = nc;
        return *this;
    }

    auto Realm::Builder::SetUri(const Uri::Uri& uri) -> Builder& {
        impl_->fields.uri = uri;
        impl_->fields.hasUri = true;
        return *this;
    }

    auto Realm::Builder::SetMethodName(const std::string& methodName) -> Builder& {
        impl_->methodName = methodName;
        return *this;
    }

    auto Realm::Builder::SetUsePreemptiveAuth(bool usePreemptiveAuth) -> Builder& {
        impl_->fields.usePreemptiveAuth = usePreemptiveAuth;
        return *this;
    }

    auto Realm::Builder::SetUseAbsoluteUri(bool useAbsoluteUri) -> Builder& {
        impl_->fields.useAbsoluteUri = useAbsoluteUri;
        return *this;
    }

    auto Realm::Builder::SetOmitQuery(bool omitQuery) -> Builder& {
        impl_->fields.omitQuery = omitQuery;
        return *this;
    }

    auto Realm::Builder::SetCharset(const std::string& charset) -> Builder& {
        impl_->fields.charset = charset;
        return *this;
    }

    auto Realm::Builder::SetNtlmDomain(const std::string& ntlmDomain) -> Builder& {
        impl_->fields.ntlmDomain = ntlmDomain;
        return *this;
    }

    auto Realm::Builder::SetNtlmHost(const std::string& ntlmHost) -> Builder& {
        impl_->fields.ntlmHost = ntlmHost;
        return *this;
    }

    auto Realm::Builder::SetServicePrincipalName(const std::string& servicePrincipalName) -> Builder& {
        impl_->fields.servicePrincipalName = servicePrincipalName;
        return *this;
    }

    auto Realm::Builder::SetUseCanonicalHostname(bool useCanonicalHostname) -> Builder& {
        impl_->fields.useCanonicalHostname = useCanonicalHostname;
        return *this;
    }

    auto Realm::Builder::SetLoginContextName(const std::string& loginContextName) -> Builder& {
        impl_->fields.loginContextName = loginContextName;
        return *this;
    }

    auto Realm::Builder::SetCustomLoginConfig(
        const std::map< std::string, std::string >& customLoginConfig
    ) -> Builder& {
        impl_->fields.customLoginConfig = customLoginConfig;
        return *this;
    }

    auto Realm::Builder::ParseWwwAuthenticateHeader(const std::string& headerLine) -> Builder& {
        std::string value;
        (void)SetRealmName(Match(headerLine, "realm", value) ? value : "");
        (void)SetNonce(Match(headerLine, "nonce", value) ? value : "");
        (void)SetOpaque(Match(headerLine, "opaque", value) ? value : "");
        (void)SetScheme(impl_->fields.nonce.empty() ? AuthScheme::Basic : AuthScheme::Digest);
        if (
            Match(headerLine, "algorithm", value)
            && !value.empty()
        ) {
            (void)SetAlgorithm(value);
        }
        if (Match(headerLine, "qop", value)) {
            (void)SetQop(ParseRawQop(value));
        }
        return *this;
    }

    auto Realm::Builder::ParseProxyAuthenticateHeader(const std::string& headerLine) -> Builder& {
        std::string value;
        (void)SetRealmName(Match(headerLine, "realm", value) ? value : "");
        (void)SetNonce(Match(headerLine, "nonce", value) ? value : "");
        (void)SetOpaque(Match(headerLine, "opaque", value) ? value : "");
        (void)SetScheme(impl_->fields.nonce.empty() ? AuthScheme::Basic : AuthScheme::Digest);
        if (
            Match(headerLine, "algorithm", value)
            && !value.empty()
        ) {
            (void)SetAlgorithm(value);
        }
        (void)SetQop(Match(headerLine, "qop", value) ? value : "");
        return *this;
    }

    auto Realm::Builder::Build(BuildResult& result) -> std::shared_ptr< const Realm > {
        if (!impl_->hasScheme) {
            result = BuildResult::MissingScheme;
            return nullptr;
        }
        if (!impl_->fields.nonce.empty()) {
            if (!Digest::NewCnonce(impl_->fields.cnonce)) {
                result = BuildResult::RandomSourceFailure;
                return nullptr;
            }
            switch (impl_->NewResponse()) {
                case Digest::Result::Success: {
                } break;

                case Digest::Result::UnsupportedAlgorithm: {
                    result = BuildResult::UnsupportedAlgorithm;
                } return nullptr;

                case Digest::Result::UnsupportedQop:
                default: {
                    result = BuildResult::UnsupportedQop;
                } return nullptr;
            }
        }
        std::shared_ptr< Realm > realm(new Realm());
        *realm->impl_ = impl_->fields;
        result = BuildResult::Success;
        return realm;
    }

    auto Realm::Builder::Build() -> std::shared_ptr< const Realm > {
        BuildResult result;
        return Build(result);
    }

    void PrintTo(
        const Realm::AuthScheme& scheme,
        std::ostream* os
    ) {
        switch (scheme) {
            case Realm::AuthScheme::Basic: {
                *os << "Basic";
            } break;
            case Realm::AuthScheme::Digest: {
                *os << "Digest";
            } break;
            case Realm::AuthScheme::Ntlm: {
                *os << "NTLM";
            } break;
            case Realm::AuthScheme::Spnego: {
                *os << "SPNEGO";
            } break;
            case Realm::AuthScheme::Kerberos: {
                *os << "Kerberos";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    void PrintTo(
        const Realm::BuildResult& result,
        std::ostream* os
    ) {
        switch (result) {
            case Realm::BuildResult::Success: {
                *os << "Success";
            } break;
            case Realm::BuildResult::MissingScheme: {
                *os << "MISSING SCHEME";
            } break;
            case Realm::BuildResult::UnsupportedAlgorithm: {
                *os << "UNSUPPORTED ALGORITHM";
            } break;
            case Realm::BuildResult::UnsupportedQop: {
                *os << "UNSUPPORTED QOP";
            } break;
            case Realm::BuildResult::RandomSourceFailure: {
                *os << "RANDOM SOURCE FAILURE";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
