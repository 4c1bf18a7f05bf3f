/**
 * @file ResumableHandler.cpp
 *
 * This module contains the implementation of the AsyncHttp::ResumableHandler
 * class.
 *
 * © 2018 by Richard Walters
 */

#include <atomic>
#include <AsyncHttp/ResumableHandler.hpp>
#include <AsyncHttp/UriUtilities.hpp>
#include <inttypes.h>
#include <SystemAbstractions/StringExtensions.hpp>

namespace AsyncHttp {

    /**
     * This contains the private properties of a ResumableHandler instance.
     */
    struct ResumableHandler::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is the session holding the shared index of offsets.
         */
        ResumableSession& session;

        /**
         * This is the store to which progress is recorded.
         */
        std::shared_ptr< ResumableProcessor > processor;

        /**
         * This is the handler to which every event is passed.
         */
        std::shared_ptr< AsyncHandler > decoratedHandler;

        /**
         * This consumes the body.
         */
        std::shared_ptr< ResumableListener > listener;

        /**
         * This flag indicates whether or not the body is kept
         * in the response.
         */
        bool accumulateBody;

        /**
         * This selects when progress is recorded.
         */
        PersistencePolicy persistencePolicy;

        /**
         * This is the number of bytes downloaded so far.
         */
        std::atomic< int64_t > bytesTransferred;

        /**
         * This is the stage the download has reached.
         */
        std::atomic< TransferState > transferState;

        /**
         * This identifies the resource being downloaded.
         */
        std::string url;

        /**
         * This is the response built from the events received.
         */
        Response response;

        // Methods

        /**
         * This is the constructor for the structure.
         *
         * @param[in] session
         *     This is the session holding the shared index of offsets.
         *
         * @param[in] options
         *     These are the settings of the handler.
         */
        Impl(
            ResumableSession& session,
            const Options& options
        )
            : diagnosticsSender("AsyncHttp::ResumableHandler")
            , session(session)
            , processor(options.processor)
            , decoratedHandler(options.decoratedHandler)
            , listener(std::make_shared< NullResumableListener >())
            , accumulateBody(options.accumulateBody)
            , persistencePolicy(options.persistencePolicy)
            , bytesTransferred(options.initialByteCount)
            , transferState(TransferState::Idle)
        {
            if (processor == nullptr) {
                processor = std::make_shared< NullResumableProcessor >();
            }
            if (decoratedHandler == nullptr) {
                decoratedHandler = std::make_shared< NullAsyncHandler >();
            }
        }

        /**
         * This method gives up the download.
         *
         * @param[in] reason
         *     This describes why the download was given up.
         *
         * @return
         *     The Abort state is returned, for convenience.
         */
        State Abort(const std::string& reason) {
            transferState = TransferState::Aborted;
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Download of \"%s\" aborted: %s",
                url.c_str(),
                reason.c_str()
            );
            return State::Abort;
        }

        /**
         * This method adds the given headers to the response.
         */
        void AccumulateHeaders(const MessageHeaders::MessageHeaders& headers) {
            for (const auto& header: headers.GetAll()) {
                response.headers.AddHeader(header.name, header.value);
            }
        }
    };

    ResumableHandler::~ResumableHandler() noexcept = default;

    ResumableHandler::ResumableHandler(
        ResumableSession& session,
        const Options& options
    )
        : impl_(new Impl(session, options))
    {
        session.Load(impl_->processor->Load());
        session.Register(impl_->processor);
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate ResumableHandler::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void ResumableHandler::SetResumableListener(std::shared_ptr< ResumableListener > listener) {
        if (listener == nullptr) {
            impl_->listener = std::make_shared< NullResumableListener >();
        } else {
            impl_->listener = listener;
        }
    }

    Request ResumableHandler::AdjustRequestRange(const Request& request) {
        int64_t offset;
        if (impl_->session.Find(request.GetUrl(), offset)) {
            impl_->bytesTransferred = offset;
        }
        const auto listenerLength = impl_->listener->GetLength();
        if (
            (listenerLength > 0)
            && (listenerLength != impl_->bytesTransferred)
        ) {
            impl_->bytesTransferred = listenerLength;
        }
        Request adjusted(request);
        const int64_t bytesTransferred = impl_->bytesTransferred;
        if (
            !adjusted.headers.HasHeader("Range")
            && (bytesTransferred != 0)
        ) {
            adjusted.headers.SetHeader(
                "Range",
                SystemAbstractions::sprintf("bytes=%" PRId64 "-", bytesTransferred)
            );
        }
        return adjusted;
    }

    auto ResumableHandler::GetTransferState() const -> TransferState {
        return impl_->transferState;
    }

    int64_t ResumableHandler::GetBytesTransferred() const {
        return impl_->bytesTransferred;
    }

    auto ResumableHandler::OnStatusReceived(const ResponseStatus& status) -> State {
        if (impl_->transferState == TransferState::Aborted) {
            return State::Abort;
        }
        impl_->response.statusCode = status.statusCode;
        impl_->response.reasonPhrase = status.reasonPhrase;
        impl_->response.uri = status.uri;
        if (
            (status.statusCode != 200)
            && (status.statusCode != 206)
        ) {
            return impl_->Abort(
                SystemAbstractions::sprintf("unexpected status %u", status.statusCode)
            );
        }
        impl_->url = ToUrl(status.uri);
        impl_->transferState = TransferState::Receiving;
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            0,
            "Receiving \"%s\" from offset %" PRId64,
            impl_->url.c_str(),
            (int64_t)impl_->bytesTransferred
        );
        const auto state = impl_->decoratedHandler->OnStatusReceived(status);
        if (state == State::Abort) {
            return impl_->Abort("rejected by decorated handler");
        }
        return state;
    }

    auto ResumableHandler::OnHeadersReceived(const MessageHeaders::MessageHeaders& headers) -> State {
        if (impl_->transferState == TransferState::Aborted) {
            return State::Abort;
        }
        impl_->AccumulateHeaders(headers);
        if (headers.HasHeader("Content-Length")) {
            intmax_t contentLength;
            if (
                SystemAbstractions::ToInteger(
                    headers.GetHeaderValue("Content-Length"),
                    contentLength
                ) != SystemAbstractions::ToIntegerResult::Success
            ) {
                return impl_->Abort("malformed Content-Length");
            }
            if (contentLength == -1) {
                return impl_->Abort("unknown Content-Length");
            }
        }
        const auto state = impl_->decoratedHandler->OnHeadersReceived(headers);
        if (state == State::Abort) {
            return impl_->Abort("rejected by decorated handler");
        }
        return state;
    }

    auto ResumableHandler::OnBodyPartReceived(const std::vector< uint8_t >& bodyPart) -> State {
        if (impl_->transferState == TransferState::Aborted) {
            return State::Abort;
        }
        if (impl_->accumulateBody) {
            impl_->response.body.append(bodyPart.begin(), bodyPart.end());
        }
        if (!impl_->listener->OnBytesReceived(bodyPart)) {
            return impl_->Abort("listener unable to consume body");
        }
        const auto state = impl_->decoratedHandler->OnBodyPartReceived(bodyPart);
        const int64_t bytesTransferred = (
            impl_->bytesTransferred += (int64_t)bodyPart.size()
        );
        if (
            (impl_->persistencePolicy == PersistencePolicy::RecordEveryChunk)
            || (state == State::Continue)
        ) {
            impl_->session.Put(impl_->url, bytesTransferred);
            impl_->processor->Put(impl_->url, bytesTransferred);
        }
        if (state == State::Abort) {
            return impl_->Abort("rejected by decorated handler");
        }
        return state;
    }

    auto ResumableHandler::OnTrailingHeadersReceived(const MessageHeaders::MessageHeaders& headers) -> State {
        if (impl_->transferState == TransferState::Aborted) {
            return State::Abort;
        }
        impl_->AccumulateHeaders(headers);
        return State::Continue;
    }

    void ResumableHandler::OnFailure(const std::string& reason) {
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Download of \"%s\" failed: %s",
            impl_->url.c_str(),
            reason.c_str()
        );
        impl_->decoratedHandler->OnFailure(reason);
    }

    std::shared_ptr< Response > ResumableHandler::OnCompleted() {
        if (impl_->transferState != TransferState::Aborted) {
            impl_->processor->Remove(impl_->url);
            impl_->session.Remove(impl_->url);
            impl_->listener->OnAllBytesReceived();
            impl_->transferState = TransferState::Completed;
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Download of \"%s\" completed (%" PRId64 " bytes)",
                impl_->url.c_str(),
                (int64_t)impl_->bytesTransferred
            );
        }
        (void)impl_->decoratedHandler->OnCompleted();
        return std::make_shared< Response >(impl_->response);
    }

    void PrintTo(
        const ResumableHandler::TransferState& state,
        std::ostream* os
    ) {
        switch (state) {
            case ResumableHandler::TransferState::Idle: {
                *os << "Idle";
            } break;
            case ResumableHandler::TransferState::Receiving: {
                *os << "Receiving";
            } break;
            case ResumableHandler::TransferState::Completed: {
                *os << "COMPLETED";
            } break;
            case ResumableHandler::TransferState::Aborted: {
                *os << "ABORTED";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
