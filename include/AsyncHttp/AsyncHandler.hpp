#ifndef ASYNC_HTTP_ASYNC_HANDLER_HPP
#define ASYNC_HTTP_ASYNC_HANDLER_HPP

/**
 * @file AsyncHandler.hpp
 *
 * This module declares the AsyncHttp::AsyncHandler interface, which
 * receives the events of a response as the transport delivers them.
 *
 * © 2018 by Richard Walters
 */

#include "Response.hpp"

#include <memory>
#include <MessageHeaders/MessageHeaders.hpp>
#include <ostream>
#include <stdint.h>
#include <string>
#include <Uri/Uri.hpp>
#include <vector>

namespace AsyncHttp {

    /**
     * This is the status line of a response, along with the
     * resource which gave it.
     */
    struct ResponseStatus {
        /**
         * This is the status code of the response.
         */
        unsigned int statusCode = 0;

        /**
         * This is the reason phrase of the response.
         */
        std::string reasonPhrase;

        /**
         * This identifies the resource which gave the response.
         */
        Uri::Uri uri;
    };

    /**
     * This is implemented by objects which consume the events of a
     * response.  The transport delivers the status, then the headers,
     * then zero or more body parts, then any trailing headers, and
     * finally either completion or failure.
     */
    class AsyncHandler {
        // Types
    public:
        /**
         * These are the ways a handler can tell the transport
         * how to proceed after an event.
         */
        enum class State {
            /**
             * Keep delivering events for the response.
             */
            Continue,

            /**
             * Stop receiving the response.
             */
            Abort,
        };

        // Lifecycle management
    public:
        virtual ~AsyncHandler() noexcept = default;

        // Methods
    public:
        /**
         * This method is called when the status line of the
         * response is received.
         *
         * @param[in] status
         *     This is the status of the response.
         *
         * @return
         *     An indication of how to proceed is returned.
         */
        virtual State OnStatusReceived(const ResponseStatus& status) = 0;

        /**
         * This method is called when the headers of the response
         * are received.
         *
         * @param[in] headers
         *     These are the headers of the response.
         *
         * @return
         *     An indication of how to proceed is returned.
         */
        virtual State OnHeadersReceived(const MessageHeaders::MessageHeaders& headers) = 0;

        /**
         * This method is called when the next piece of the body
         * of the response is received.
         *
         * @param[in] bodyPart
         *     This is the piece of the body which was received.
         *
         * @return
         *     An indication of how to proceed is returned.
         */
        virtual State OnBodyPartReceived(const std::vector< uint8_t >& bodyPart) = 0;

        /**
         * This method is called when headers are received in the
         * trailer of a chunked response.
         *
         * @param[in] headers
         *     These are the trailing headers.
         *
         * @return
         *     An indication of how to proceed is returned.
         */
        virtual State OnTrailingHeadersReceived(const MessageHeaders::MessageHeaders& headers) = 0;

        /**
         * This method is called if the response could not be
         * received in full.
         *
         * @param[in] reason
         *     This describes what went wrong.
         */
        virtual void OnFailure(const std::string& reason) = 0;

        /**
         * This method is called once the whole response is received.
         *
         * @return
         *     The response built by the handler is returned,
         *     or nullptr if the handler builds no response.
         */
        virtual std::shared_ptr< Response > OnCompleted() = 0;
    };

    /**
     * This handler ignores every event and asks for the rest of
     * the response.
     */
    class NullAsyncHandler
        : public AsyncHandler
    {
        // AsyncHandler
    public:
        virtual State OnStatusReceived(const ResponseStatus& status) override;
        virtual State OnHeadersReceived(const MessageHeaders::MessageHeaders& headers) override;
        virtual State OnBodyPartReceived(const std::vector< uint8_t >& bodyPart) override;
        virtual State OnTrailingHeadersReceived(const MessageHeaders::MessageHeaders& headers) override;
        virtual void OnFailure(const std::string& reason) override;
        virtual std::shared_ptr< Response > OnCompleted() override;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the AsyncHandler::State class.
     *
     * @param[in] state
     *     This is the handler state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     handler state value.
     */
    void PrintTo(
        const AsyncHandler::State& state,
        std::ostream* os
    );

}

#endif /* ASYNC_HTTP_ASYNC_HANDLER_HPP */
