/**
 * @file BodyGenerator.cpp
 *
 * This module contains the implementation of the body generators
 * which the request assembler recognizes specially.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/BodyGenerator.hpp>
#include <AsyncHttp/RequestBody.hpp>

namespace {

    /**
     * This presents a wire request body through the generic Body
     * interface, so that the specially recognized generators can still
     * be used by code which only knows about BodyGenerator.
     */
    class RequestBodyAdapter
        : public AsyncHttp::Body
    {
    public:
        explicit RequestBodyAdapter(std::shared_ptr< AsyncHttp::RequestBody > body)
            : body_(body)
        {
        }

        // AsyncHttp::Body
    public:
        virtual int64_t GetContentLength() override {
            return body_->GetContentLength();
        }

        virtual size_t Read(
            uint8_t* buffer,
            size_t maxBytes
        ) override {
            return body_->Read(buffer, maxBytes);
        }

    private:
        std::shared_ptr< AsyncHttp::RequestBody > body_;
    };

}

namespace AsyncHttp {

    FileBodyGenerator::FileBodyGenerator(const std::string& path)
        : path_(path)
    {
    }

    FileBodyGenerator::FileBodyGenerator(
        const std::string& path,
        int64_t regionSeek,
        int64_t regionLength
    )
        : path_(path)
        , regionSeek_(regionSeek)
        , regionLength_(regionLength)
    {
    }

    const std::string& FileBodyGenerator::GetPath() const {
        return path_;
    }

    int64_t FileBodyGenerator::GetRegionSeek() const {
        return regionSeek_;
    }

    int64_t FileBodyGenerator::GetRegionLength() const {
        return regionLength_;
    }

    std::shared_ptr< Body > FileBodyGenerator::CreateBody() {
        return std::make_shared< RequestBodyAdapter >(
            std::make_shared< FileBody >(path_, regionSeek_, regionLength_)
        );
    }

    InputStreamBodyGenerator::InputStreamBodyGenerator(
        std::shared_ptr< std::istream > stream,
        int64_t contentLength
    )
        : stream_(stream)
        , contentLength_(contentLength)
    {
    }

    std::shared_ptr< std::istream > InputStreamBodyGenerator::GetStream() const {
        return stream_;
    }

    int64_t InputStreamBodyGenerator::GetContentLength() const {
        return contentLength_;
    }

    std::shared_ptr< Body > InputStreamBodyGenerator::CreateBody() {
        return std::make_shared< RequestBodyAdapter >(
            std::make_shared< InputStreamBody >(stream_, contentLength_)
        );
    }

}
