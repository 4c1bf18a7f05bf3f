#ifndef ASYNC_HTTP_RESUMABLE_PROCESSOR_HPP
#define ASYNC_HTTP_RESUMABLE_PROCESSOR_HPP

/**
 * @file ResumableProcessor.hpp
 *
 * This module declares the AsyncHttp::ResumableProcessor interface and
 * its implementations, which store how much of each resumable download
 * has been received.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <memory>
#include <stdint.h>
#include <string>

namespace AsyncHttp {

    /**
     * This is implemented by objects which keep the number of bytes
     * received for resumable downloads, so that the downloads can
     * resume after the process restarts.
     */
    class ResumableProcessor {
        // Lifecycle management
    public:
        virtual ~ResumableProcessor() noexcept = default;

        // Methods
    public:
        /**
         * This method records the number of bytes received so far
         * for the given resource.
         *
         * @param[in] key
         *     This identifies the resource, normally by its URL.
         *
         * @param[in] transferredBytes
         *     This is the number of bytes received so far.
         */
        virtual void Put(
            const std::string& key,
            int64_t transferredBytes
        ) = 0;

        /**
         * This method forgets the given resource.
         *
         * @param[in] key
         *     This identifies the resource.
         */
        virtual void Remove(const std::string& key) = 0;

        /**
         * This method stores the given offsets where they can be
         * loaded again later.  It is called once, at shutdown.
         *
         * @param[in] offsets
         *     These are the numbers of bytes received for every
         *     resource still being downloaded.
         *
         * @return
         *     An indication of whether or not the offsets were
         *     stored is returned.
         */
        virtual bool Save(const std::map< std::string, int64_t >& offsets) = 0;

        /**
         * This method returns the offsets stored previously.
         */
        virtual std::map< std::string, int64_t > Load() = 0;
    };

    /**
     * This processor remembers nothing.
     */
    class NullResumableProcessor
        : public ResumableProcessor
    {
        // ResumableProcessor
    public:
        virtual void Put(
            const std::string& key,
            int64_t transferredBytes
        ) override;
        virtual void Remove(const std::string& key) override;
        virtual bool Save(const std::map< std::string, int64_t >& offsets) override;
        virtual std::map< std::string, int64_t > Load() override;
    };

    /**
     * This processor stores offsets in a properties file, with one
     * "key=offset" line per resource.  Since keys are URLs, which may
     * contain '=', the last '=' on a line separates the key from
     * the offset.
     */
    class PropertiesResumableProcessor
        : public ResumableProcessor
    {
        // Lifecycle management
    public:
        ~PropertiesResumableProcessor() noexcept;
        PropertiesResumableProcessor(const PropertiesResumableProcessor&) = delete;
        PropertiesResumableProcessor(PropertiesResumableProcessor&&) noexcept = delete;
        PropertiesResumableProcessor& operator=(const PropertiesResumableProcessor&) = delete;
        PropertiesResumableProcessor& operator=(PropertiesResumableProcessor&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] directory
         *     This is the existing directory in which to keep the file.
         *
         * @param[in] fileName
         *     This is the name of the file.
         */
        explicit PropertiesResumableProcessor(
            const std::string& directory,
            const std::string& fileName = "resumable.properties"
        );

        /**
         * This method returns the path of the properties file.
         */
        std::string GetPath() const;

        // ResumableProcessor
    public:
        virtual void Put(
            const std::string& key,
            int64_t transferredBytes
        ) override;
        virtual void Remove(const std::string& key) override;
        virtual bool Save(const std::map< std::string, int64_t >& offsets) override;
        virtual std::map< std::string, int64_t > Load() override;

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

}

#endif /* ASYNC_HTTP_RESUMABLE_PROCESSOR_HPP */
