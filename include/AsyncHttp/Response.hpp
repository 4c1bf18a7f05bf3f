#ifndef ASYNC_HTTP_RESPONSE_HPP
#define ASYNC_HTTP_RESPONSE_HPP

/**
 * @file Response.hpp
 *
 * This module declares the AsyncHttp::Response structure.
 *
 * © 2018 by Richard Walters
 */

#include <MessageHeaders/MessageHeaders.hpp>
#include <string>
#include <Uri/Uri.hpp>

namespace AsyncHttp {

    /**
     * This represents an HTTP response received by the client, as
     * accumulated from the events delivered by the transport.
     */
    struct Response {
        // Properties

        /**
         * This indicates whether or not the request was understood
         * and satisfied.
         */
        unsigned int statusCode = 0;

        /**
         * This is a textual description of the status code.
         */
        std::string reasonPhrase;

        /**
         * This identifies the resource which gave the response.
         */
        Uri::Uri uri;

        /**
         * These are the headers of the response, including any
         * trailing headers received after the body.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * This is the part of the response body which was kept.
         */
        std::string body;
    };

}

#endif /* ASYNC_HTTP_RESPONSE_HPP */
