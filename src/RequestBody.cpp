/**
 * @file RequestBody.cpp
 *
 * This module contains the implementation of the AsyncHttp::RequestBody
 * class and the concrete body representations.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <AsyncHttp/RequestBody.hpp>
#include <string.h>

namespace AsyncHttp {

    RequestBody::RequestBody(const std::string& contentTypeOverride)
        : contentTypeOverride_(contentTypeOverride)
    {
    }

    const std::string& RequestBody::GetContentTypeOverride() const {
        return contentTypeOverride_;
    }

    ByteArrayBody::ByteArrayBody(
        Kind kind,
        std::vector< std::vector< uint8_t > > blocks,
        const std::string& contentTypeOverride
    )
        : RequestBody(contentTypeOverride)
        , kind_(kind)
        , blocks_(std::move(blocks))
    {
        for (const auto& block: blocks_) {
            contentLength_ += (int64_t)block.size();
        }
    }

    auto ByteArrayBody::GetBlocks() const -> const std::vector< std::vector< uint8_t > >& {
        return blocks_;
    }

    auto ByteArrayBody::GetKind() const -> Kind {
        return kind_;
    }

    int64_t ByteArrayBody::GetContentLength() const {
        return contentLength_;
    }

    size_t ByteArrayBody::Read(
        uint8_t* buffer,
        size_t maxBytes
    ) {
        size_t amountRead = 0;
        while (
            (amountRead < maxBytes)
            && (block_ < blocks_.size())
        ) {
            const auto& block = blocks_[block_];
            const auto amountToCopy = std::min(
                maxBytes - amountRead,
                block.size() - offset_
            );
            if (amountToCopy > 0) {
                (void)memcpy(buffer + amountRead, block.data() + offset_, amountToCopy);
            }
            amountRead += amountToCopy;
            offset_ += amountToCopy;
            if (offset_ >= block.size()) {
                ++block_;
                offset_ = 0;
            }
        }
        return amountRead;
    }

    InputStreamBody::InputStreamBody(
        std::shared_ptr< std::istream > stream,
        int64_t contentLength
    )
        : stream_(stream)
        , contentLength_(contentLength)
    {
    }

    auto InputStreamBody::GetKind() const -> Kind {
        return Kind::Stream;
    }

    int64_t InputStreamBody::GetContentLength() const {
        return contentLength_;
    }

    size_t InputStreamBody::Read(
        uint8_t* buffer,
        size_t maxBytes
    ) {
        if (
            (stream_ == nullptr)
            || !stream_->good()
        ) {
            return 0;
        }
        (void)stream_->read((char*)buffer, (std::streamsize)maxBytes);
        return (size_t)stream_->gcount();
    }

    FileBody::FileBody(
        const std::string& path,
        int64_t regionSeek,
        int64_t regionLength
    )
        : path_(path)
        , regionSeek_(regionSeek)
    {
        std::ifstream sizeFile(path_, std::ios::binary | std::ios::ate);
        if (!sizeFile.is_open()) {
            return;
        }
        const auto fileSize = (int64_t)sizeFile.tellg();
        if (
            (fileSize < 0)
            || (regionSeek_ > fileSize)
        ) {
            return;
        }
        const auto available = fileSize - regionSeek_;
        if (regionLength < 0) {
            contentLength_ = available;
        } else {
            contentLength_ = std::min(regionLength, available);
        }
    }

    const std::string& FileBody::GetPath() const {
        return path_;
    }

    int64_t FileBody::GetRegionSeek() const {
        return regionSeek_;
    }

    auto FileBody::GetKind() const -> Kind {
        return Kind::File;
    }

    int64_t FileBody::GetContentLength() const {
        return contentLength_;
    }

    size_t FileBody::Read(
        uint8_t* buffer,
        size_t maxBytes
    ) {
        if (!opened_) {
            opened_ = true;
            file_.open(path_, std::ios::binary);
            if (!file_.is_open()) {
                return 0;
            }
            (void)file_.seekg((std::streamoff)regionSeek_);
            remaining_ = (contentLength_ < 0) ? 0 : contentLength_;
        }
        if (
            !file_.good()
            || (remaining_ <= 0)
        ) {
            return 0;
        }
        const auto amountToRead = (size_t)std::min((int64_t)maxBytes, remaining_);
        (void)file_.read((char*)buffer, (std::streamsize)amountToRead);
        const auto amountRead = (size_t)file_.gcount();
        remaining_ -= (int64_t)amountRead;
        return amountRead;
    }

    GeneratedBody::GeneratedBody(std::shared_ptr< Body > body)
        : body_(body)
    {
    }

    auto GeneratedBody::GetKind() const -> Kind {
        return Kind::Generated;
    }

    int64_t GeneratedBody::GetContentLength() const {
        if (body_ == nullptr) {
            return 0;
        }
        return body_->GetContentLength();
    }

    size_t GeneratedBody::Read(
        uint8_t* buffer,
        size_t maxBytes
    ) {
        if (body_ == nullptr) {
            return 0;
        }
        return body_->Read(buffer, maxBytes);
    }

    void PrintTo(
        const RequestBody::Kind& kind,
        std::ostream* os
    ) {
        switch (kind) {
            case RequestBody::Kind::Bytes: {
                *os << "Bytes";
            } break;
            case RequestBody::Kind::CompositeBytes: {
                *os << "Composite Bytes";
            } break;
            case RequestBody::Kind::Buffer: {
                *os << "Buffer";
            } break;
            case RequestBody::Kind::Stream: {
                *os << "Stream";
            } break;
            case RequestBody::Kind::Multipart: {
                *os << "Multipart";
            } break;
            case RequestBody::Kind::File: {
                *os << "File";
            } break;
            case RequestBody::Kind::Generated: {
                *os << "Generated";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
