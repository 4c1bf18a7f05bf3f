#ifndef ASYNC_HTTP_REQUEST_FACTORY_HPP
#define ASYNC_HTTP_REQUEST_FACTORY_HPP

/**
 * @file RequestFactory.hpp
 *
 * This module declares the AsyncHttp::RequestFactory class.
 *
 * © 2018 by Richard Walters
 */

#include "ProxyServer.hpp"
#include "Realm.hpp"
#include "Request.hpp"
#include "WireRequest.hpp"

#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace AsyncHttp {

    /**
     * This turns declarative requests into wire requests ready to be
     * handed to the transport.  It applies the client configuration to
     * decide on default headers, and computes any preemptive
     * authorization headers.
     *
     * Assemble may be called concurrently from any number of threads.
     */
    class RequestFactory {
        // Types
    public:
        /**
         * This holds the client settings which affect how
         * requests are assembled.
         */
        struct Configuration {
            /**
             * This flag indicates whether or not connections should
             * be kept open between requests.
             */
            bool keepAlive = true;

            /**
             * This flag indicates whether or not requests which do not
             * mention Accept-Encoding should ask for a compressed response.
             */
            bool compressionEnforced = false;

            /**
             * This flag indicates whether or not the client decompresses
             * responses itself, in which case codings it can't decode are
             * removed from Accept-Encoding.
             */
            bool enableAutomaticDecompression = true;

            /**
             * If not empty, this is sent as the User-Agent header in
             * requests which do not set one.
             */
            std::string userAgent;

            /**
             * This flag indicates whether or not cookies are encoded
             * without validating or ordering them.
             */
            bool useLaxCookieEncoder = false;

            /**
             * This is the protocol version sent in the request line.
             * It must be "HTTP/1.1" or "HTTP/1.0".
             */
            std::string protocolVersion = "HTTP/1.1";
        };

        // Lifecycle management
    public:
        ~RequestFactory() noexcept;
        RequestFactory(const RequestFactory&) = delete;
        RequestFactory(RequestFactory&&) noexcept = delete;
        RequestFactory& operator=(const RequestFactory&) = delete;
        RequestFactory& operator=(RequestFactory&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This is the default constructor, which uses the
         * default configuration.
         */
        RequestFactory();

        /**
         * This constructs the factory with the given configuration.
         *
         * @param[in] configuration
         *     This is the configuration to use.
         */
        explicit RequestFactory(const Configuration& configuration);

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the factory.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * This method returns the value of the given configuration item.
         *
         * @param[in] key
         *     This is the name of the configuration item.
         *
         * @return
         *     The value of the configuration item is returned, or an
         *     empty string if the item is not known.
         */
        std::string GetConfigurationItem(const std::string& key);

        /**
         * This method changes one item of the configuration.
         * Boolean items take the values "true" and "false".
         *
         * @param[in] key
         *     This is the name of the configuration item.  It is one of
         *     "KeepAlive", "CompressionEnforced", "AutomaticDecompression",
         *     "UserAgent", "LaxCookieEncoder", or "ProtocolVersion".
         *
         * @param[in] value
         *     This is the new value of the configuration item.
         */
        void SetConfigurationItem(
            const std::string& key,
            const std::string& value
        );

        /**
         * This method returns a copy of the current configuration.
         */
        Configuration GetConfiguration() const;

        /**
         * This method builds the wire request for the given request.
         *
         * @param[in] request
         *     This is the request to assemble.
         *
         * @param[in] performConnectRequest
         *     This flag indicates whether to build a CONNECT request,
         *     which opens a tunnel through the proxy to the request's
         *     target, rather than the request itself.
         *
         * @param[in] proxy
         *     If not null, this is the proxy through which the request
         *     is routed.
         *
         * @param[in] realm
         *     If not null, this is used to authenticate with the
         *     origin server.
         *
         * @param[in] proxyRealm
         *     If not null, this is used to authenticate with the proxy.
         *
         * @return
         *     The wire request is returned.  If the random source
         *     needed for a WebSocket key or multipart boundary fails,
         *     nullptr is returned.
         */
        std::shared_ptr< const WireRequest > Assemble(
            const Request& request,
            bool performConnectRequest,
            std::shared_ptr< const ProxyServer > proxy,
            std::shared_ptr< const Realm > realm,
            std::shared_ptr< const Realm > proxyRealm
        ) const;

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

}

#endif /* ASYNC_HTTP_REQUEST_FACTORY_HPP */
