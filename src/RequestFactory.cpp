/**
 * @file RequestFactory.cpp
 *
 * This module contains the implementation of the AsyncHttp::RequestFactory
 * class.
 *
 * © 2018 by Richard Walters
 */

#include "Crypto.hpp"

#include <algorithm>
#include <AsyncHttp/Authenticator.hpp>
#include <AsyncHttp/RequestFactory.hpp>
#include <AsyncHttp/UriUtilities.hpp>
#include <inttypes.h>
#include <map>
#include <mutex>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>

namespace {

    /**
     * This is the number of random bytes in a WebSocket key.
     */
    constexpr size_t WEBSOCKET_KEY_RANDOM_BYTES = 16;

    /**
     * This is the media type of a URL-encoded form body.
     */
    const std::string FORM_URL_ENCODED = "application/x-www-form-urlencoded";

    /**
     * These are the content codings the client can't decode itself,
     * and so must not ask for when it decompresses responses.
     */
    const std::vector< std::string > UNSUPPORTED_CODINGS{
        "br",
        "zstd",
    };

    /**
     * This function returns the given text in lowercase.
     */
    std::string Lowercase(const std::string& text) {
        std::string lowercase(text);
        std::transform(
            lowercase.begin(),
            lowercase.end(),
            lowercase.begin(),
            [](char c){ return (char)tolower((unsigned char)c); }
        );
        return lowercase;
    }

    /**
     * This function removes from the given Accept-Encoding header
     * values any content codings the client can't decode.
     *
     * @param[in] codings
     *     These are the elements of the Accept-Encoding header.
     *
     * @return
     *     The elements which remain are returned.
     */
    std::vector< std::string > FilterUnsupportedCodings(
        const std::vector< std::string >& codings
    ) {
        std::vector< std::string > supported;
        for (const auto& element: codings) {
            const auto coding = Lowercase(
                SystemAbstractions::Trim(element.substr(0, element.find(';')))
            );
            if (
                std::find(
                    UNSUPPORTED_CODINGS.begin(),
                    UNSUPPORTED_CODINGS.end(),
                    coding
                ) == UNSUPPORTED_CODINGS.end()
            ) {
                supported.push_back(element);
            }
        }
        return supported;
    }

    /**
     * This function returns the request-target to use for a request
     * made to the given URI.
     *
     * @param[in] uri
     *     This is the target of the request.
     *
     * @param[in] proxy
     *     If not null, this is the proxy through which the request is routed.
     *
     * @param[in] connect
     *     This flag indicates whether or not the request opens a tunnel
     *     through the proxy.
     *
     * @return
     *     The request-target is returned.
     */
    std::string RequestTarget(
        const Uri::Uri& uri,
        const std::shared_ptr< const AsyncHttp::ProxyServer >& proxy,
        bool connect
    ) {
        if (connect) {
            return AsyncHttp::GetAuthority(uri);
        } else if (
            (proxy != nullptr)
            && !AsyncHttp::IsSecured(uri)
            && proxy->IsHttp()
        ) {
            return AsyncHttp::ToUrl(uri);
        } else {
            return AsyncHttp::ToRelativeUrl(uri);
        }
    }

    /**
     * This function returns an indication of whether or not the given
     * text is one of the values accepted for a boolean configuration item.
     *
     * @param[in] value
     *     This is the text to parse.
     *
     * @param[out] flag
     *     This is where to store the parsed value.
     *
     * @return
     *     An indication of whether or not the text was parsed is returned.
     */
    bool ParseFlag(
        const std::string& value,
        bool& flag
    ) {
        const auto normalized = Lowercase(SystemAbstractions::Trim(value));
        if (normalized == "true") {
            flag = true;
        } else if (normalized == "false") {
            flag = false;
        } else {
            return false;
        }
        return true;
    }

    /**
     * This function returns the text form of the given flag.
     */
    std::string FlagToString(bool flag) {
        return flag ? "true" : "false";
    }

}

namespace AsyncHttp {

    /**
     * This contains the private properties of a RequestFactory instance.
     */
    struct RequestFactory::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This holds all configuration items for the factory.
         */
        std::map< std::string, std::string > configurationItems;

        /**
         * This is the configuration used to assemble requests.
         */
        Configuration configuration;

        /**
         * This is used to synchronize access to the configuration.
         */
        mutable std::mutex mutex;

        // Methods

        /**
         * This is the constructor for the structure.
         *
         * @param[in] configuration
         *     This is the initial configuration.
         */
        explicit Impl(const Configuration& configuration)
            : diagnosticsSender("AsyncHttp::RequestFactory")
            , configuration(configuration)
        {
            configurationItems["KeepAlive"] = FlagToString(configuration.keepAlive);
            configurationItems["CompressionEnforced"] = FlagToString(configuration.compressionEnforced);
            configurationItems["AutomaticDecompression"] = FlagToString(configuration.enableAutomaticDecompression);
            configurationItems["UserAgent"] = configuration.userAgent;
            configurationItems["LaxCookieEncoder"] = FlagToString(configuration.useLaxCookieEncoder);
            configurationItems["ProtocolVersion"] = configuration.protocolVersion;
        }

        /**
         * This method parses a boolean configuration item and sets it
         * if the parsing is successful.
         *
         * @param[in,out] item
         *     This is the configuration item to set.
         *
         * @param[in] description
         *     This is the string to display in diagnostic messages about
         *     the configuration item.
         *
         * @param[in] value
         *     This is the value to parse to be the new value of the item.
         *
         * @return
         *     An indication of whether or not the value was accepted
         *     is returned.
         */
        bool ParseFlagConfigurationItem(
            bool& item,
            const char* const description,
            const std::string& value
        ) {
            bool newItem;
            if (!ParseFlag(value, newItem)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    5,
                    "%s not changed; \"%s\" is not a valid flag",
                    description,
                    value.c_str()
                );
                return false;
            }
            if (item != newItem) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    3,
                    "%s changed from %s to %s",
                    description,
                    FlagToString(item).c_str(),
                    FlagToString(newItem).c_str()
                );
                item = newItem;
            }
            return true;
        }

        /**
         * This method sets a text configuration item.
         *
         * @param[in,out] item
         *     This is the configuration item to set.
         *
         * @param[in] description
         *     This is the string to display in diagnostic messages about
         *     the configuration item.
         *
         * @param[in] value
         *     This is the new value of the item.
         */
        void SetTextConfigurationItem(
            std::string& item,
            const char* const description,
            const std::string& value
        ) {
            if (item != value) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    3,
                    "%s changed from \"%s\" to \"%s\"",
                    description,
                    item.c_str(),
                    value.c_str()
                );
                item = value;
            }
        }

        /**
         * This method selects and builds the body of the given request.
         *
         * @param[in] request
         *     This is the request whose body is to be built.
         *
         * @param[out] body
         *     This is where to store the body, or nullptr if the
         *     request has no body.
         *
         * @return
         *     An indication of whether or not the body could be
         *     built is returned.
         */
        bool SelectBody(
            const Request& request,
            std::shared_ptr< RequestBody >& body
        ) {
            body = nullptr;
            if (request.byteData != nullptr) {
                body = std::make_shared< ByteArrayBody >(
                    RequestBody::Kind::Bytes,
                    std::vector< std::vector< uint8_t > >{*request.byteData}
                );
            } else if (request.compositeByteData != nullptr) {
                body = std::make_shared< ByteArrayBody >(
                    RequestBody::Kind::CompositeBytes,
                    *request.compositeByteData
                );
            } else if (request.stringData != nullptr) {
                std::vector< uint8_t > encoded;
                if (!EncodeText(*request.stringData, request.charset, encoded)) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        5,
                        "character set \"%s\" not supported; text body sent as UTF-8",
                        request.charset.c_str()
                    );
                }
                body = std::make_shared< ByteArrayBody >(
                    RequestBody::Kind::Buffer,
                    std::vector< std::vector< uint8_t > >{std::move(encoded)}
                );
            } else if (request.byteBufferData != nullptr) {
                body = std::make_shared< ByteArrayBody >(
                    RequestBody::Kind::Buffer,
                    std::vector< std::vector< uint8_t > >{*request.byteBufferData}
                );
            } else if (request.streamData != nullptr) {
                body = std::make_shared< InputStreamBody >(request.streamData);
            } else if (!request.formParams.empty()) {
                const auto encoded = UrlEncodeFormParams(request.formParams, request.charset);
                body = std::make_shared< ByteArrayBody >(
                    RequestBody::Kind::Buffer,
                    std::vector< std::vector< uint8_t > >{
                        std::vector< uint8_t >(encoded.begin(), encoded.end())
                    },
                    request.headers.HasHeader("Content-Type") ? "" : FORM_URL_ENCODED
                );
            } else if (!request.bodyParts.empty()) {
                std::string contentType;
                std::string boundary;
                if (request.headers.HasHeader("Content-Type")) {
                    contentType = request.headers.GetHeaderValue("Content-Type");
                }
                if (!ExtractBoundary(contentType, boundary)) {
                    if (!NewBoundary(boundary)) {
                        diagnosticsSender.SendDiagnosticInformationString(
                            10,
                            "unable to generate multipart boundary"
                        );
                        return false;
                    }
                    if (contentType.empty()) {
                        contentType = "multipart/form-data";
                    }
                    contentType += "; boundary=" + boundary;
                }
                body = std::make_shared< ByteArrayBody >(
                    RequestBody::Kind::Multipart,
                    EncodeMultipart(request.bodyParts, boundary),
                    contentType
                );
            } else if (!request.file.empty()) {
                body = std::make_shared< FileBody >(request.file);
            } else if (request.bodyGenerator != nullptr) {
                const auto fileGenerator = std::dynamic_pointer_cast< FileBodyGenerator >(request.bodyGenerator);
                const auto streamGenerator = std::dynamic_pointer_cast< InputStreamBodyGenerator >(request.bodyGenerator);
                if (fileGenerator != nullptr) {
                    body = std::make_shared< FileBody >(
                        fileGenerator->GetPath(),
                        fileGenerator->GetRegionSeek(),
                        fileGenerator->GetRegionLength()
                    );
                } else if (streamGenerator != nullptr) {
                    body = std::make_shared< InputStreamBody >(
                        streamGenerator->GetStream(),
                        streamGenerator->GetContentLength()
                    );
                } else {
                    body = std::make_shared< GeneratedBody >(request.bodyGenerator->CreateBody());
                }
            }
            if (
                (body != nullptr)
                && (body->GetKind() == RequestBody::Kind::File)
                && (body->GetContentLength() < 0)
            ) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    5,
                    "unable to determine size of file \"%s\"",
                    std::static_pointer_cast< FileBody >(body)->GetPath().c_str()
                );
            }
            return true;
        }
    };

    RequestFactory::~RequestFactory() noexcept = default;

    RequestFactory::RequestFactory()
        : impl_(new Impl(Configuration()))
    {
    }

    RequestFactory::RequestFactory(const Configuration& configuration)
        : impl_(new Impl(configuration))
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate RequestFactory::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    std::string RequestFactory::GetConfigurationItem(const std::string& key) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto entry = impl_->configurationItems.find(key);
        if (entry == impl_->configurationItems.end()) {
            return "";
        } else {
            return entry->second;
        }
    }

    void RequestFactory::SetConfigurationItem(
        const std::string& key,
        const std::string& value
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto& configuration = impl_->configuration;
        bool accepted = true;
        if (key == "KeepAlive") {
            accepted = impl_->ParseFlagConfigurationItem(configuration.keepAlive, "Keep alive", value);
        } else if (key == "CompressionEnforced") {
            accepted = impl_->ParseFlagConfigurationItem(configuration.compressionEnforced, "Compression enforced", value);
        } else if (key == "AutomaticDecompression") {
            accepted = impl_->ParseFlagConfigurationItem(configuration.enableAutomaticDecompression, "Automatic decompression", value);
        } else if (key == "UserAgent") {
            impl_->SetTextConfigurationItem(configuration.userAgent, "User agent", value);
        } else if (key == "LaxCookieEncoder") {
            accepted = impl_->ParseFlagConfigurationItem(configuration.useLaxCookieEncoder, "Lax cookie encoder", value);
        } else if (key == "ProtocolVersion") {
            if (
                (value == "HTTP/1.1")
                || (value == "HTTP/1.0")
            ) {
                impl_->SetTextConfigurationItem(configuration.protocolVersion, "Protocol version", value);
            } else {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    5,
                    "Protocol version not changed; \"%s\" is not supported",
                    value.c_str()
                );
                accepted = false;
            }
        }
        if (accepted) {
            impl_->configurationItems[key] = value;
        }
    }

    auto RequestFactory::GetConfiguration() const -> Configuration {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->configuration;
    }

    std::shared_ptr< const WireRequest > RequestFactory::Assemble(
        const Request& request,
        bool performConnectRequest,
        std::shared_ptr< const ProxyServer > proxy,
        std::shared_ptr< const Realm > realm,
        std::shared_ptr< const Realm > proxyRealm
    ) const {
        const auto configuration = GetConfiguration();
        const auto& uri = request.target;
        const bool connect = performConnectRequest;
        const auto wireRequest = std::make_shared< WireRequest >();
        wireRequest->method = connect ? "CONNECT" : request.method;
        wireRequest->target = RequestTarget(uri, proxy, connect);
        wireRequest->protocol = configuration.protocolVersion;
        if (
            !connect
            && !impl_->SelectBody(request, wireRequest->body)
        ) {
            return nullptr;
        }
        const auto& body = wireRequest->body;
        auto& headers = wireRequest->headers;

        // Caller headers, cookies, and content coding.
        if (connect) {
            for (const auto& header: request.headers.GetAll()) {
                if (
                    (header.name == "Proxy-Authorization")
                    || (header.name == "User-Agent")
                ) {
                    headers.AddHeader(header.name, header.value);
                }
            }
        } else {
            for (const auto& header: request.headers.GetAll()) {
                headers.AddHeader(header.name, header.value);
            }
            if (!request.cookies.empty()) {
                const auto cookieHeader = EncodeCookies(
                    request.cookies,
                    !configuration.useLaxCookieEncoder
                );
                if (!cookieHeader.empty()) {
                    headers.SetHeader("Cookie", cookieHeader);
                }
            }
            if (headers.HasHeader("Accept-Encoding")) {
                if (configuration.enableAutomaticDecompression) {
                    const auto codings = FilterUnsupportedCodings(
                        headers.GetHeaderMultiValue("Accept-Encoding")
                    );
                    if (codings.empty()) {
                        headers.RemoveHeader("Accept-Encoding");
                    } else {
                        headers.SetHeader("Accept-Encoding", SystemAbstractions::Join(codings, ", "));
                    }
                }
            } else if (configuration.compressionEnforced) {
                headers.SetHeader("Accept-Encoding", "gzip, deflate");
            }
        }

        // Message framing.
        if (!headers.HasHeader("Content-Length")) {
            if (body != nullptr) {
                const auto contentLength = body->GetContentLength();
                if (contentLength < 0) {
                    headers.SetHeader("Transfer-Encoding", "chunked");
                } else {
                    headers.SetHeader(
                        "Content-Length",
                        SystemAbstractions::sprintf("%" PRId64, contentLength)
                    );
                }
            } else if (
                (wireRequest->method == "POST")
                || (wireRequest->method == "PUT")
                || (wireRequest->method == "PATCH")
            ) {
                headers.SetHeader("Content-Length", "0");
            }
        }
        if (
            (body != nullptr)
            && !body->GetContentTypeOverride().empty()
        ) {
            headers.SetHeader("Content-Type", body->GetContentTypeOverride());
        }

        // Connection management.
        if (
            !connect
            && IsWebSocket(uri)
        ) {
            std::vector< uint8_t > keyBytes;
            if (!GenerateRandomBytes(keyBytes, WEBSOCKET_KEY_RANDOM_BYTES)) {
                impl_->diagnosticsSender.SendDiagnosticInformationString(
                    10,
                    "unable to generate WebSocket key"
                );
                return nullptr;
            }
            headers.SetHeader("Upgrade", "websocket");
            headers.SetHeader("Connection", "Upgrade");
            headers.SetHeader("Sec-WebSocket-Key", Base64Encode(keyBytes));
            headers.SetHeader("Sec-WebSocket-Version", "13");
            if (!headers.HasHeader("Origin")) {
                headers.SetHeader("Origin", OriginHeader(uri));
            }
        } else if (!headers.HasHeader("Connection")) {
            const bool keepAliveByDefault = (configuration.protocolVersion == "HTTP/1.1");
            if (keepAliveByDefault) {
                if (!configuration.keepAlive) {
                    headers.SetHeader("Connection", "close");
                }
            } else {
                if (configuration.keepAlive) {
                    headers.SetHeader("Connection", "keep-alive");
                }
            }
        }
        if (!headers.HasHeader("Host")) {
            headers.SetHeader(
                "Host",
                request.hasVirtualHost ? request.virtualHost : HostHeader(uri)
            );
        }

        // Authentication.
        std::string authorization;
        if (PerRequestAuthorizationHeader(request, realm, authorization)) {
            headers.AddHeader("Authorization", authorization);
        }
        if (
            !IsSecured(uri)
            || connect
        ) {
            std::string proxyAuthorization;
            if (PerRequestProxyAuthorizationHeader(request, proxyRealm, proxyAuthorization)) {
                headers.SetHeader("Proxy-Authorization", proxyAuthorization);
            }
        }

        // Defaults.
        if (!headers.HasHeader("Accept")) {
            headers.SetHeader("Accept", "*/*");
        }
        if (
            !headers.HasHeader("User-Agent")
            && !configuration.userAgent.empty()
        ) {
            headers.SetHeader("User-Agent", configuration.userAgent);
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            0,
            "%s %s %s",
            wireRequest->method.c_str(),
            wireRequest->target.c_str(),
            wireRequest->protocol.c_str()
        );
        return wireRequest;
    }

}
