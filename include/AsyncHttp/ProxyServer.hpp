#ifndef ASYNC_HTTP_PROXY_SERVER_HPP
#define ASYNC_HTTP_PROXY_SERVER_HPP

/**
 * @file ProxyServer.hpp
 *
 * This module declares the AsyncHttp::ProxyServer structure.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>

namespace AsyncHttp {

    /**
     * This describes a proxy through which requests are routed.
     */
    struct ProxyServer {
        // Types

        /**
         * These are the kinds of proxy supported.
         */
        enum class Type {
            Http,
            Https,
            SocksV4,
            SocksV5,
        };

        // Properties

        /**
         * This is the host name or address of the proxy.
         */
        std::string host;

        /**
         * This is the port number of the proxy.
         */
        uint16_t port = 0;

        /**
         * This is the kind of proxy.
         */
        Type type = Type::Http;

        // Methods

        /**
         * This method indicates whether or not the proxy speaks HTTP,
         * and so accepts absolute-form request targets.
         */
        bool IsHttp() const {
            return (
                (type == Type::Http)
                || (type == Type::Https)
            );
        }
    };

}

#endif /* ASYNC_HTTP_PROXY_SERVER_HPP */
