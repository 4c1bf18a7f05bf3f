#ifndef ASYNC_HTTP_RESUMABLE_HANDLER_HPP
#define ASYNC_HTTP_RESUMABLE_HANDLER_HPP

/**
 * @file ResumableHandler.hpp
 *
 * This module declares the AsyncHttp::ResumableHandler class.
 *
 * © 2018 by Richard Walters
 */

#include "AsyncHandler.hpp"
#include "Request.hpp"
#include "ResumableListener.hpp"
#include "ResumableProcessor.hpp"
#include "ResumableSession.hpp"

#include <memory>
#include <ostream>
#include <stddef.h>
#include <stdint.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace AsyncHttp {

    /**
     * This handler tracks how much of a resource has been downloaded,
     * so that an interrupted download can be resumed with a Range
     * request.  It passes every event on to another handler.
     *
     * Events for one download must be delivered one at a time.
     */
    class ResumableHandler
        : public AsyncHandler
    {
        // Types
    public:
        /**
         * These are the stages of a download.
         */
        enum class TransferState {
            /**
             * No status has been received yet.
             */
            Idle,

            /**
             * A successful status was received, and the body
             * is being tracked.
             */
            Receiving,

            /**
             * The whole response was received.
             */
            Completed,

            /**
             * The download was given up.  No further events are tracked.
             */
            Aborted,
        };

        /**
         * These are the choices of when to record progress.
         */
        enum class PersistencePolicy {
            /**
             * Record progress after every body part, even one which the
             * decorated handler rejected.
             */
            RecordEveryChunk,

            /**
             * Record progress only after body parts which the
             * decorated handler accepted.
             */
            RecordAcceptedChunksOnly,
        };

        /**
         * These are the settings of a handler.
         */
        struct Options {
            /**
             * This is the store to which progress is recorded.
             * If null, progress is only kept in the session.
             */
            std::shared_ptr< ResumableProcessor > processor;

            /**
             * This is the handler to which every event is passed.
             * If null, events are passed to a handler which ignores them.
             */
            std::shared_ptr< AsyncHandler > decoratedHandler;

            /**
             * This flag indicates whether or not the body is kept
             * in the response returned on completion.
             */
            bool accumulateBody = false;

            /**
             * This is the number of bytes already downloaded.
             */
            int64_t initialByteCount = 0;

            /**
             * This selects when progress is recorded.
             */
            PersistencePolicy persistencePolicy = PersistencePolicy::RecordEveryChunk;
        };

        // Lifecycle management
    public:
        ~ResumableHandler() noexcept;
        ResumableHandler(const ResumableHandler&) = delete;
        ResumableHandler(ResumableHandler&&) noexcept = delete;
        ResumableHandler& operator=(const ResumableHandler&) = delete;
        ResumableHandler& operator=(ResumableHandler&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This is the constructor.  The offsets held by the processor are
         * loaded into the session, and the processor is registered with
         * the session to be saved when it shuts down.
         *
         * @param[in] session
         *     This is the session holding the shared index of offsets.
         *     It must outlive the handler.
         *
         * @param[in] options
         *     These are the settings of the handler.
         */
        explicit ResumableHandler(
            ResumableSession& session,
            const Options& options = Options()
        );

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the handler.
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
         * This method sets the listener which consumes the body.
         *
         * @param[in] listener
         *     This is the listener to use.  If null, a listener which
         *     only counts bytes is used.
         */
        void SetResumableListener(std::shared_ptr< ResumableListener > listener);

        /**
         * This method returns a copy of the given request which asks
         * only for the part of the resource not yet downloaded.
         *
         * The offset recorded for the request's URL, if any, becomes the
         * handler's byte count, unless the listener already has a
         * different, non-zero number of bytes, in which case that is used.
         * A Range header is added unless the request already has one or
         * the byte count is zero.
         *
         * @param[in] request
         *     This is the request to adjust.
         *
         * @return
         *     The adjusted request is returned.
         */
        Request AdjustRequestRange(const Request& request);

        /**
         * This method returns the stage the download has reached.
         */
        TransferState GetTransferState() const;

        /**
         * This method returns the number of bytes downloaded so far,
         * including any downloaded by earlier attempts.
         */
        int64_t GetBytesTransferred() const;

        // AsyncHandler
    public:
        virtual State OnStatusReceived(const ResponseStatus& status) override;
        virtual State OnHeadersReceived(const MessageHeaders::MessageHeaders& headers) override;
        virtual State OnBodyPartReceived(const std::vector< uint8_t >& bodyPart) override;
        virtual State OnTrailingHeadersReceived(const MessageHeaders::MessageHeaders& headers) override;
        virtual void OnFailure(const std::string& reason) override;
        virtual std::shared_ptr< Response > OnCompleted() override;

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
     * values of the ResumableHandler::TransferState class.
     *
     * @param[in] state
     *     This is the transfer state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     transfer state value.
     */
    void PrintTo(
        const ResumableHandler::TransferState& state,
        std::ostream* os
    );

}

#endif /* ASYNC_HTTP_RESUMABLE_HANDLER_HPP */
