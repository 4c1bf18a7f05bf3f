/**
 * @file AsyncHandler.cpp
 *
 * This module contains the implementation of the AsyncHttp::NullAsyncHandler
 * class.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/AsyncHandler.hpp>

namespace AsyncHttp {

    auto NullAsyncHandler::OnStatusReceived(const ResponseStatus& status) -> State {
        return State::Continue;
    }

    auto NullAsyncHandler::OnHeadersReceived(const MessageHeaders::MessageHeaders& headers) -> State {
        return State::Continue;
    }

    auto NullAsyncHandler::OnBodyPartReceived(const std::vector< uint8_t >& bodyPart) -> State {
        return State::Continue;
    }

    auto NullAsyncHandler::OnTrailingHeadersReceived(const MessageHeaders::MessageHeaders& headers) -> State {
        return State::Continue;
    }

    void NullAsyncHandler::OnFailure(const std::string& reason) {
    }

    std::shared_ptr< Response > NullAsyncHandler::OnCompleted() {
        return nullptr;
    }

    void PrintTo(
        const AsyncHandler::State& state,
        std::ostream* os
    ) {
        switch (state) {
            case AsyncHandler::State::Continue: {
                *os << "CONTINUE";
            } break;
            case AsyncHandler::State::Abort: {
                *os << "ABORT";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
