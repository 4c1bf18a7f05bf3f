#ifndef ASYNC_HTTP_RESUMABLE_LISTENER_HPP
#define ASYNC_HTTP_RESUMABLE_LISTENER_HPP

/**
 * @file ResumableListener.hpp
 *
 * This module declares the AsyncHttp::ResumableListener interface and
 * its implementations, which consume the body of a resumable download.
 *
 * © 2018 by Richard Walters
 */

#include <fstream>
#include <stdint.h>
#include <string>
#include <vector>

namespace AsyncHttp {

    /**
     * This is implemented by objects which consume the body of a
     * resumable download, and which know how much of it they
     * already have.
     */
    class ResumableListener {
        // Lifecycle management
    public:
        virtual ~ResumableListener() noexcept = default;

        // Methods
    public:
        /**
         * This method is called with the next piece of the body.
         *
         * @param[in] bytes
         *     This is the next piece of the body.
         *
         * @return
         *     An indication of whether or not the bytes were
         *     consumed is returned.
         */
        virtual bool OnBytesReceived(const std::vector< uint8_t >& bytes) = 0;

        /**
         * This method is called once the whole body was received.
         */
        virtual void OnAllBytesReceived() = 0;

        /**
         * This method returns the number of bytes of the body which
         * the listener already has.
         */
        virtual int64_t GetLength() = 0;
    };

    /**
     * This listener discards the body.  Since it keeps nothing, it
     * always reports a length of zero, leaving the resume offset to
     * the byte counter of the handler.
     */
    class NullResumableListener
        : public ResumableListener
    {
        // ResumableListener
    public:
        virtual bool OnBytesReceived(const std::vector< uint8_t >& bytes) override;
        virtual void OnAllBytesReceived() override;
        virtual int64_t GetLength() override;
    };

    /**
     * This listener appends the body to a file.  Its length is the
     * size of the file, so a download can resume from whatever an
     * earlier attempt left in the file.
     */
    class ResumableFileListener
        : public ResumableListener
    {
        // Lifecycle management
    public:
        /**
         * This is the constructor.
         *
         * @param[in] path
         *     This is the path of the file to which to append the body.
         */
        explicit ResumableFileListener(const std::string& path);

        // ResumableListener
    public:
        virtual bool OnBytesReceived(const std::vector< uint8_t >& bytes) override;
        virtual void OnAllBytesReceived() override;
        virtual int64_t GetLength() override;

        // Private properties
    private:
        std::string path_;
        std::ofstream file_;
    };

}

#endif /* ASYNC_HTTP_RESUMABLE_LISTENER_HPP */
