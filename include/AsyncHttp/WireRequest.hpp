#ifndef ASYNC_HTTP_WIRE_REQUEST_HPP
#define ASYNC_HTTP_WIRE_REQUEST_HPP

/**
 * @file WireRequest.hpp
 *
 * This module declares the AsyncHttp::WireRequest structure.
 *
 * © 2018 by Richard Walters
 */

#include "RequestBody.hpp"

#include <memory>
#include <MessageHeaders/MessageHeaders.hpp>
#include <string>

namespace AsyncHttp {

    /**
     * This represents an HTTP request fully resolved for the transport:
     * the request line, every header to send, and the body, if any.
     */
    struct WireRequest {
        // Properties

        /**
         * This is the request method token.
         */
        std::string method;

        /**
         * This is the request-target, in the form required by the
         * way the request is routed.
         */
        std::string target;

        /**
         * This is the protocol version sent in the request line.
         */
        std::string protocol = "HTTP/1.1";

        /**
         * These are the headers to send with the request.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * This is the body to send after the headers.  If null,
         * the request has no body.
         */
        std::shared_ptr< RequestBody > body;

        // Methods

        /**
         * This method generates the request line and header block
         * of the request, ready to be sent to the transport.
         *
         * @return
         *     The request line and headers are returned, ending with
         *     the empty line which separates them from the body.
         */
        std::string GenerateHead() const;
    };

}

#endif /* ASYNC_HTTP_WIRE_REQUEST_HPP */
