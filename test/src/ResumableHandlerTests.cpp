/**
 * @file ResumableHandlerTests.cpp
 *
 * This module contains the unit tests of the
 * AsyncHttp::ResumableHandler class.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/ResumableHandler.hpp>
#include <gtest/gtest.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <utility>

namespace {

    /**
     * This is the URL of the resource downloaded in these tests.
     */
    const std::string DOWNLOAD_URL = "http://www.example.com/files/big.iso";

    /**
     * This is a processor which records what it's asked to do.
     */
    struct RecordingProcessor
        : public AsyncHttp::ResumableProcessor
    {
        // Properties

        /**
         * These are the offsets given to the processor, in order.
         */
        std::vector< std::pair< std::string, int64_t > > puts;

        /**
         * These are the keys removed from the processor, in order.
         */
        std::vector< std::string > removes;

        /**
         * This is what the processor returns when loaded.
         */
        std::map< std::string, int64_t > stored;

        // AsyncHttp::ResumableProcessor

        virtual void Put(
            const std::string& key,
            int64_t transferredBytes
        ) override {
            puts.push_back(std::make_pair(key, transferredBytes));
        }

        virtual void Remove(const std::string& key) override {
            removes.push_back(key);
        }

        virtual bool Save(const std::map< std::string, int64_t >& offsets) override {
            stored = offsets;
            return true;
        }

        virtual std::map< std::string, int64_t > Load() override {
            return stored;
        }
    };

    /**
     * This is a handler which counts the events it receives and
     * answers body parts with a chosen state.
     */
    struct RecordingHandler
        : public AsyncHttp::AsyncHandler
    {
        // Properties

        /**
         * This is the state returned for every body part.
         */
        State bodyPartState = State::Continue;

        /**
         * This is the number of body parts received.
         */
        size_t bodyParts = 0;

        /**
         * This is the number of completion events received.
         */
        size_t completions = 0;

        /**
         * These are the failures reported.
         */
        std::vector< std::string > failures;

        // AsyncHttp::AsyncHandler

        virtual State OnStatusReceived(const AsyncHttp::ResponseStatus& status) override {
            return State::Continue;
        }

        virtual State OnHeadersReceived(const MessageHeaders::MessageHeaders& headers) override {
            return State::Continue;
        }

        virtual State OnBodyPartReceived(const std::vector< uint8_t >& bodyPart) override {
            ++bodyParts;
            return bodyPartState;
        }

        virtual State OnTrailingHeadersReceived(const MessageHeaders::MessageHeaders& headers) override {
            return State::Continue;
        }

        virtual void OnFailure(const std::string& reason) override {
            failures.push_back(reason);
        }

        virtual std::shared_ptr< AsyncHttp::Response > OnCompleted() override {
            ++completions;
            return nullptr;
        }
    };

    /**
     * This is a listener which refuses every byte.
     */
    struct FailingListener
        : public AsyncHttp::ResumableListener
    {
        virtual bool OnBytesReceived(const std::vector< uint8_t >& bytes) override {
            return false;
        }

        virtual void OnAllBytesReceived() override {
        }

        virtual int64_t GetLength() override {
            return 0;
        }
    };

    /**
     * This is a listener which reports a fixed amount already stored.
     */
    struct PrefilledListener
        : public AsyncHttp::ResumableListener
    {
        virtual bool OnBytesReceived(const std::vector< uint8_t >& bytes) override {
            return true;
        }

        virtual void OnAllBytesReceived() override {
        }

        virtual int64_t GetLength() override {
            return 500;
        }
    };

    /**
     * This function makes a response status with the given code
     * for the download URL.
     */
    AsyncHttp::ResponseStatus MakeStatus(unsigned int statusCode) {
        AsyncHttp::ResponseStatus status;
        status.statusCode = statusCode;
        status.reasonPhrase = (statusCode == 404) ? "Not Found" : "OK";
        (void)status.uri.ParseFromString(DOWNLOAD_URL);
        return status;
    }

    /**
     * This function makes a request for the download URL.
     */
    AsyncHttp::Request MakeRequest() {
        AsyncHttp::Request request;
        (void)request.target.ParseFromString(DOWNLOAD_URL);
        return request;
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct ResumableHandlerTests
    : public ::testing::Test
{
    // Properties

    /**
     * This holds the shared index of offsets.
     */
    AsyncHttp::ResumableSession session;

    /**
     * This records what the unit under test persists.
     */
    std::shared_ptr< RecordingProcessor > processor = std::make_shared< RecordingProcessor >();

    /**
     * This is the handler decorated by the unit under test.
     */
    std::shared_ptr< RecordingHandler > decoratedHandler = std::make_shared< RecordingHandler >();

    /**
     * These are the diagnostic messages that have been
     * received from the unit under test.
     */
    std::vector< std::string > diagnosticMessages;

    /**
     * This is the delegate obtained when subscribing
     * to receive diagnostic messages from the unit under test.
     * It's called to terminate the subscription.
     */
    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;

    // Methods

    /**
     * This method returns the options used to make the unit under test.
     */
    AsyncHttp::ResumableHandler::Options MakeOptions() {
        AsyncHttp::ResumableHandler::Options options;
        options.processor = processor;
        options.decoratedHandler = decoratedHandler;
        return options;
    }

    /**
     * This method subscribes to diagnostic messages published
     * by the given handler.
     */
    void Monitor(AsyncHttp::ResumableHandler& handler) {
        diagnosticsUnsubscribeDelegate = handler.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                diagnosticMessages.push_back(
                    SystemAbstractions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            1
        );
    }

    // ::testing::Test

    virtual void TearDown() {
        if (diagnosticsUnsubscribeDelegate != nullptr) {
            diagnosticsUnsubscribeDelegate();
        }
    }
};

TEST_F(ResumableHandlerTests, CompletedDownloadRecordsProgressThenForgetsIt) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Idle, handler.GetTransferState());
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnStatusReceived(MakeStatus(200)));
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Receiving, handler.GetTransferState());
    MessageHeaders::MessageHeaders headers;
    headers.SetHeader("Content-Length", "60");
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnHeadersReceived(headers));
    for (size_t size: {10, 20, 30}) {
        EXPECT_EQ(
            AsyncHttp::AsyncHandler::State::Continue,
            handler.OnBodyPartReceived(std::vector< uint8_t >(size, 'x'))
        );
    }
    EXPECT_EQ(
        (std::vector< std::pair< std::string, int64_t > >{
            {DOWNLOAD_URL, 10},
            {DOWNLOAD_URL, 30},
            {DOWNLOAD_URL, 60},
        }),
        processor->puts
    );
    int64_t offset = 0;
    ASSERT_TRUE(session.Find(DOWNLOAD_URL, offset));
    EXPECT_EQ(60, offset);
    EXPECT_EQ(3u, decoratedHandler->bodyParts);
    const auto response = handler.OnCompleted();
    ASSERT_FALSE(response == nullptr);
    EXPECT_EQ(200u, response->statusCode);
    EXPECT_EQ("60", response->headers.GetHeaderValue("Content-Length"));
    EXPECT_TRUE(response->body.empty());
    EXPECT_EQ(std::vector< std::string >{DOWNLOAD_URL}, processor->removes);
    EXPECT_FALSE(session.Find(DOWNLOAD_URL, offset));
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Completed, handler.GetTransferState());
    EXPECT_EQ(60, handler.GetBytesTransferred());
    EXPECT_EQ(1u, decoratedHandler->completions);
}

TEST_F(ResumableHandlerTests, PartialContentAccepted) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnStatusReceived(MakeStatus(206)));
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Receiving, handler.GetTransferState());
}

TEST_F(ResumableHandlerTests, UnexpectedStatusAborts) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Abort, handler.OnStatusReceived(MakeStatus(404)));
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Aborted, handler.GetTransferState());
    EXPECT_EQ(
        AsyncHttp::AsyncHandler::State::Abort,
        handler.OnBodyPartReceived(std::vector< uint8_t >(10, 'x'))
    );
    EXPECT_TRUE(processor->puts.empty());
    EXPECT_EQ(0u, decoratedHandler->bodyParts);
    (void)handler.OnCompleted();
    EXPECT_TRUE(processor->removes.empty());
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Aborted, handler.GetTransferState());
}

TEST_F(ResumableHandlerTests, UnknownContentLengthAborts) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    (void)handler.OnStatusReceived(MakeStatus(200));
    MessageHeaders::MessageHeaders headers;
    headers.SetHeader("Content-Length", "-1");
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Abort, handler.OnHeadersReceived(headers));
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Aborted, handler.GetTransferState());
}

TEST_F(ResumableHandlerTests, MissingContentLengthAccepted) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    (void)handler.OnStatusReceived(MakeStatus(200));
    MessageHeaders::MessageHeaders headers;
    headers.SetHeader("Content-Type", "application/octet-stream");
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnHeadersReceived(headers));
}

TEST_F(ResumableHandlerTests, ListenerFailureAbortsWithoutPersisting) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    Monitor(handler);
    handler.SetResumableListener(std::make_shared< FailingListener >());
    (void)handler.OnStatusReceived(MakeStatus(200));
    EXPECT_EQ(
        AsyncHttp::AsyncHandler::State::Abort,
        handler.OnBodyPartReceived(std::vector< uint8_t >(10, 'x'))
    );
    EXPECT_TRUE(processor->puts.empty());
    EXPECT_EQ(0u, decoratedHandler->bodyParts);
    int64_t offset;
    EXPECT_FALSE(session.Find(DOWNLOAD_URL, offset));
    EXPECT_EQ(
        (std::vector< std::string >{
            "AsyncHttp::ResumableHandler[1]: Download of \"" + DOWNLOAD_URL + "\" aborted: listener unable to consume body",
        }),
        diagnosticMessages
    );
}

TEST_F(ResumableHandlerTests, DecoratedAbortStillRecordedByDefault) {
    decoratedHandler->bodyPartState = AsyncHttp::AsyncHandler::State::Abort;
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    (void)handler.OnStatusReceived(MakeStatus(200));
    EXPECT_EQ(
        AsyncHttp::AsyncHandler::State::Abort,
        handler.OnBodyPartReceived(std::vector< uint8_t >(10, 'x'))
    );
    EXPECT_EQ(
        (std::vector< std::pair< std::string, int64_t > >{
            {DOWNLOAD_URL, 10},
        }),
        processor->puts
    );
    EXPECT_EQ(AsyncHttp::ResumableHandler::TransferState::Aborted, handler.GetTransferState());
}

TEST_F(ResumableHandlerTests, DecoratedAbortNotRecordedWhenOnlyAcceptedChunksCount) {
    decoratedHandler->bodyPartState = AsyncHttp::AsyncHandler::State::Abort;
    auto options = MakeOptions();
    options.persistencePolicy = AsyncHttp::ResumableHandler::PersistencePolicy::RecordAcceptedChunksOnly;
    AsyncHttp::ResumableHandler handler(session, options);
    (void)handler.OnStatusReceived(MakeStatus(200));
    EXPECT_EQ(
        AsyncHttp::AsyncHandler::State::Abort,
        handler.OnBodyPartReceived(std::vector< uint8_t >(10, 'x'))
    );
    EXPECT_TRUE(processor->puts.empty());
    EXPECT_EQ(10, handler.GetBytesTransferred());
}

TEST_F(ResumableHandlerTests, AdjustRequestRangeFromStoredOffset) {
    session.Put(DOWNLOAD_URL, 4096);
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    const auto request = MakeRequest();
    const auto adjusted = handler.AdjustRequestRange(request);
    EXPECT_EQ("bytes=4096-", adjusted.headers.GetHeaderValue("Range"));
    EXPECT_EQ(4096, handler.GetBytesTransferred());
    const auto adjustedAgain = handler.AdjustRequestRange(adjusted);
    EXPECT_EQ("bytes=4096-", adjustedAgain.headers.GetHeaderValue("Range"));
    EXPECT_FALSE(request.headers.HasHeader("Range"));
}

TEST_F(ResumableHandlerTests, AdjustRequestRangeAfterInterruptedAttemptUsesTotalCount) {
    session.Put(DOWNLOAD_URL, 4096);
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    const auto request = MakeRequest();
    EXPECT_EQ("bytes=4096-", handler.AdjustRequestRange(request).headers.GetHeaderValue("Range"));
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnStatusReceived(MakeStatus(200)));
    EXPECT_EQ(
        AsyncHttp::AsyncHandler::State::Continue,
        handler.OnBodyPartReceived(std::vector< uint8_t >(100, 'x'))
    );
    EXPECT_EQ("bytes=4196-", handler.AdjustRequestRange(request).headers.GetHeaderValue("Range"));
    EXPECT_EQ(4196, handler.GetBytesTransferred());
}

TEST_F(ResumableHandlerTests, AdjustRequestRangeKeepsCallerRange) {
    session.Put(DOWNLOAD_URL, 4096);
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    auto request = MakeRequest();
    request.headers.SetHeader("Range", "bytes=0-99");
    EXPECT_EQ("bytes=0-99", handler.AdjustRequestRange(request).headers.GetHeaderValue("Range"));
}

TEST_F(ResumableHandlerTests, AdjustRequestRangeWithNothingStored) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    EXPECT_FALSE(handler.AdjustRequestRange(MakeRequest()).headers.HasHeader("Range"));
}

TEST_F(ResumableHandlerTests, AdjustRequestRangePrefersListenerLength) {
    session.Put(DOWNLOAD_URL, 4096);
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    handler.SetResumableListener(std::make_shared< PrefilledListener >());
    EXPECT_EQ("bytes=500-", handler.AdjustRequestRange(MakeRequest()).headers.GetHeaderValue("Range"));
    EXPECT_EQ(500, handler.GetBytesTransferred());
}

TEST_F(ResumableHandlerTests, ConstructionLoadsStoredOffsets) {
    processor->stored[DOWNLOAD_URL] = 100;
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    int64_t offset = 0;
    ASSERT_TRUE(session.Find(DOWNLOAD_URL, offset));
    EXPECT_EQ(100, offset);
    EXPECT_EQ("bytes=100-", handler.AdjustRequestRange(MakeRequest()).headers.GetHeaderValue("Range"));
}

TEST_F(ResumableHandlerTests, InitialByteCountContinuesCounting) {
    auto options = MakeOptions();
    options.initialByteCount = 1000;
    AsyncHttp::ResumableHandler handler(session, options);
    (void)handler.OnStatusReceived(MakeStatus(206));
    (void)handler.OnBodyPartReceived(std::vector< uint8_t >(24, 'x'));
    EXPECT_EQ(1024, handler.GetBytesTransferred());
    ASSERT_EQ(1u, processor->puts.size());
    EXPECT_EQ(1024, processor->puts[0].second);
}

TEST_F(ResumableHandlerTests, AccumulatedBodyAndTrailers) {
    auto options = MakeOptions();
    options.accumulateBody = true;
    AsyncHttp::ResumableHandler handler(session, options);
    (void)handler.OnStatusReceived(MakeStatus(200));
    (void)handler.OnBodyPartReceived({'a', 'b'});
    (void)handler.OnBodyPartReceived({'c'});
    MessageHeaders::MessageHeaders trailers;
    trailers.SetHeader("X-Checksum", "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnTrailingHeadersReceived(trailers));
    const auto response = handler.OnCompleted();
    ASSERT_FALSE(response == nullptr);
    EXPECT_EQ("abc", response->body);
    EXPECT_EQ("900150983cd24fb0d6963f7d28e17f72", response->headers.GetHeaderValue("X-Checksum"));
}

TEST_F(ResumableHandlerTests, FailureIsPassedOn) {
    AsyncHttp::ResumableHandler handler(session, MakeOptions());
    (void)handler.OnStatusReceived(MakeStatus(200));
    handler.OnFailure("connection reset");
    EXPECT_EQ(std::vector< std::string >{"connection reset"}, decoratedHandler->failures);
}

TEST_F(ResumableHandlerTests, DefaultsWorkWithoutProcessorOrDecoratedHandler) {
    AsyncHttp::ResumableHandler handler(session);
    EXPECT_EQ(AsyncHttp::AsyncHandler::State::Continue, handler.OnStatusReceived(MakeStatus(200)));
    EXPECT_EQ(
        AsyncHttp::AsyncHandler::State::Continue,
        handler.OnBodyPartReceived(std::vector< uint8_t >(5, 'x'))
    );
    int64_t offset = 0;
    ASSERT_TRUE(session.Find(DOWNLOAD_URL, offset));
    EXPECT_EQ(5, offset);
    EXPECT_FALSE(handler.OnCompleted() == nullptr);
}

TEST_F(ResumableHandlerTests, SessionShutdownSavesProgress) {
    {
        AsyncHttp::ResumableHandler handler(session, MakeOptions());
        (void)handler.OnStatusReceived(MakeStatus(200));
        (void)handler.OnBodyPartReceived(std::vector< uint8_t >(42, 'x'));
    }
    session.Shutdown();
    EXPECT_EQ(
        (std::map< std::string, int64_t >{
            {DOWNLOAD_URL, 42},
        }),
        processor->stored
    );
}
