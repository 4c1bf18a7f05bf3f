#ifndef ASYNC_HTTP_REQUEST_BODY_HPP
#define ASYNC_HTTP_REQUEST_BODY_HPP

/**
 * @file RequestBody.hpp
 *
 * This module declares the AsyncHttp::RequestBody class and the concrete
 * body representations carried by a wire request.
 *
 * © 2018 by Richard Walters
 */

#include "BodyGenerator.hpp"

#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace AsyncHttp {

    /**
     * This is the body of a wire request, which the transport drains
     * with Read.  A body whose content length is unknown must be sent
     * with chunked transfer coding.
     */
    class RequestBody {
        // Types
    public:
        /**
         * These are the different representations a body can have.
         */
        enum class Kind {
            /**
             * A single sequence of bytes.
             */
            Bytes,

            /**
             * Several sequences of bytes, sent one after another.
             */
            CompositeBytes,

            /**
             * Bytes buffered from text, a byte buffer, or form parameters.
             */
            Buffer,

            /**
             * Bytes read from an input stream.
             */
            Stream,

            /**
             * An encoded multipart/form-data body.
             */
            Multipart,

            /**
             * A whole file or a region of a file.
             */
            File,

            /**
             * A body created by a generic body generator.
             */
            Generated,
        };

        // Lifecycle management
    public:
        virtual ~RequestBody() noexcept = default;

        // Public methods
    public:
        /**
         * This method returns the media type the body requires the
         * request to declare, or an empty string if it requires none.
         */
        const std::string& GetContentTypeOverride() const;

        /**
         * This method returns the representation of the body.
         */
        virtual Kind GetKind() const = 0;

        /**
         * This method returns the number of bytes in the body, or -1 if
         * it is not known in advance.
         */
        virtual int64_t GetContentLength() const = 0;

        /**
         * This method produces the next piece of the body.
         *
         * @param[out] buffer
         *     This is where to store the next piece of the body.
         *
         * @param[in] maxBytes
         *     This is the maximum number of bytes to produce.
         *
         * @return
         *     The number of bytes stored in the buffer is returned.
         *     Zero is returned once the body is exhausted.
         */
        virtual size_t Read(
            uint8_t* buffer,
            size_t maxBytes
        ) = 0;

        // Protected methods
    protected:
        /**
         * This is the constructor for use by derived classes.
         *
         * @param[in] contentTypeOverride
         *     This is the media type the body requires the request to
         *     declare, or an empty string if it requires none.
         */
        explicit RequestBody(const std::string& contentTypeOverride = "");

        // Private properties
    private:
        /**
         * This is the media type the body requires the request to declare.
         */
        std::string contentTypeOverride_;
    };

    /**
     * This body sends one or more sequences of bytes held in memory.
     */
    class ByteArrayBody
        : public RequestBody
    {
        // Lifecycle management
    public:
        /**
         * This is the constructor.
         *
         * @param[in] kind
         *     This is the representation the body reports.
         *
         * @param[in] blocks
         *     These are the byte sequences to send, in order.
         *
         * @param[in] contentTypeOverride
         *     This is the media type the body requires the request to
         *     declare, or an empty string if it requires none.
         */
        ByteArrayBody(
            Kind kind,
            std::vector< std::vector< uint8_t > > blocks,
            const std::string& contentTypeOverride = ""
        );

        // Public methods
    public:
        /**
         * This method returns the byte sequences the body sends.
         */
        const std::vector< std::vector< uint8_t > >& GetBlocks() const;

        // RequestBody
    public:
        virtual Kind GetKind() const override;
        virtual int64_t GetContentLength() const override;
        virtual size_t Read(
            uint8_t* buffer,
            size_t maxBytes
        ) override;

        // Private properties
    private:
        Kind kind_;
        std::vector< std::vector< uint8_t > > blocks_;
        int64_t contentLength_ = 0;
        size_t block_ = 0;
        size_t offset_ = 0;
    };

    /**
     * This body sends the bytes read from an input stream.
     */
    class InputStreamBody
        : public RequestBody
    {
        // Lifecycle management
    public:
        /**
         * This is the constructor.
         *
         * @param[in] stream
         *     This is the stream from which to read the body.
         *
         * @param[in] contentLength
         *     This is the number of bytes the stream will deliver,
         *     or -1 if it is not known.
         */
        InputStreamBody(
            std::shared_ptr< std::istream > stream,
            int64_t contentLength = -1
        );

        // RequestBody
    public:
        virtual Kind GetKind() const override;
        virtual int64_t GetContentLength() const override;
        virtual size_t Read(
            uint8_t* buffer,
            size_t maxBytes
        ) override;

        // Private properties
    private:
        std::shared_ptr< std::istream > stream_;
        int64_t contentLength_;
    };

    /**
     * This body sends a file, or a region of a file.  The file is not
     * opened until the first call to Read.
     */
    class FileBody
        : public RequestBody
    {
        // Lifecycle management
    public:
        /**
         * This is the constructor.
         *
         * @param[in] path
         *     This is the path of the file to send.
         *
         * @param[in] regionSeek
         *     This is the offset of the first byte to send.
         *
         * @param[in] regionLength
         *     This is the number of bytes to send, or -1 to send
         *     everything after regionSeek.
         */
        FileBody(
            const std::string& path,
            int64_t regionSeek = 0,
            int64_t regionLength = -1
        );

        // Public methods
    public:
        const std::string& GetPath() const;
        int64_t GetRegionSeek() const;

        // RequestBody
    public:
        virtual Kind GetKind() const override;

        /**
         * This method returns the number of bytes of the file to send.
         * It is -1 if the file could not be examined.
         */
        virtual int64_t GetContentLength() const override;

        virtual size_t Read(
            uint8_t* buffer,
            size_t maxBytes
        ) override;

        // Private properties
    private:
        std::string path_;
        int64_t regionSeek_;
        int64_t contentLength_ = -1;
        int64_t remaining_ = 0;
        bool opened_ = false;
        std::ifstream file_;
    };

    /**
     * This body sends the bytes produced by a body created by
     * a generic body generator.
     */
    class GeneratedBody
        : public RequestBody
    {
        // Lifecycle management
    public:
        explicit GeneratedBody(std::shared_ptr< Body > body);

        // RequestBody
    public:
        virtual Kind GetKind() const override;
        virtual int64_t GetContentLength() const override;
        virtual size_t Read(
            uint8_t* buffer,
            size_t maxBytes
        ) override;

        // Private properties
    private:
        std::shared_ptr< Body > body_;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the RequestBody::Kind class.
     *
     * @param[in] kind
     *     This is the body representation value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     body representation value.
     */
    void PrintTo(
        const RequestBody::Kind& kind,
        std::ostream* os
    );

}

#endif /* ASYNC_HTTP_REQUEST_BODY_HPP */
