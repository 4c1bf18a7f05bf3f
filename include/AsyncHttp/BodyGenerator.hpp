#ifndef ASYNC_HTTP_BODY_GENERATOR_HPP
#define ASYNC_HTTP_BODY_GENERATOR_HPP

/**
 * @file BodyGenerator.hpp
 *
 * This module declares the AsyncHttp::Body and AsyncHttp::BodyGenerator
 * interfaces, along with the generators the request assembler
 * recognizes specially.
 *
 * © 2018 by Richard Walters
 */

#include <istream>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace AsyncHttp {

    /**
     * This represents a request body which is produced on demand,
     * a piece at a time.
     */
    class Body {
    public:
        // Lifecycle management

        virtual ~Body() noexcept = default;

        // Methods

        /**
         * This method returns the number of bytes in the body.
         *
         * @return
         *     The number of bytes in the body is returned, or -1
         *     if it is not known in advance.
         */
        virtual int64_t GetContentLength() = 0;

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
    };

    /**
     * This is the interface to an object which creates request bodies.
     */
    class BodyGenerator {
    public:
        // Lifecycle management

        virtual ~BodyGenerator() noexcept = default;

        // Methods

        /**
         * This method creates a new body to be sent with a request.
         */
        virtual std::shared_ptr< Body > CreateBody() = 0;
    };

    /**
     * This generator sends a region of a file as the request body.
     * The request assembler reads the file directly instead of
     * calling CreateBody.
     */
    class FileBodyGenerator
        : public BodyGenerator
    {
        // Lifecycle management
    public:
        /**
         * This constructs a generator which sends a whole file.
         *
         * @param[in] path
         *     This is the path of the file to send.
         */
        explicit FileBodyGenerator(const std::string& path);

        /**
         * This constructs a generator which sends part of a file.
         *
         * @param[in] path
         *     This is the path of the file to send.
         *
         * @param[in] regionSeek
         *     This is the offset of the first byte to send.
         *
         * @param[in] regionLength
         *     This is the number of bytes to send.
         */
        FileBodyGenerator(
            const std::string& path,
            int64_t regionSeek,
            int64_t regionLength
        );

        // Public methods
    public:
        const std::string& GetPath() const;
        int64_t GetRegionSeek() const;

        /**
         * This method returns the number of bytes of the file to send,
         * or -1 to send everything after the region seek offset.
         */
        int64_t GetRegionLength() const;

        // BodyGenerator
    public:
        virtual std::shared_ptr< Body > CreateBody() override;

        // Private properties
    private:
        std::string path_;
        int64_t regionSeek_ = 0;
        int64_t regionLength_ = -1;
    };

    /**
     * This generator sends the contents of an input stream as the
     * request body.
     */
    class InputStreamBodyGenerator
        : public BodyGenerator
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
        explicit InputStreamBodyGenerator(
            std::shared_ptr< std::istream > stream,
            int64_t contentLength = -1
        );

        // Public methods
    public:
        std::shared_ptr< std::istream > GetStream() const;
        int64_t GetContentLength() const;

        // BodyGenerator
    public:
        virtual std::shared_ptr< Body > CreateBody() override;

        // Private properties
    private:
        std::shared_ptr< std::istream > stream_;
        int64_t contentLength_ = -1;
    };

}

#endif /* ASYNC_HTTP_BODY_GENERATOR_HPP */
