#ifndef ASYNC_HTTP_RESUMABLE_SESSION_HPP
#define ASYNC_HTTP_RESUMABLE_SESSION_HPP

/**
 * @file ResumableSession.hpp
 *
 * This module declares the AsyncHttp::ResumableSession class.
 *
 * © 2018 by Richard Walters
 */

#include "ResumableProcessor.hpp"

#include <map>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace AsyncHttp {

    /**
     * This holds the state shared by all the resumable downloads of a
     * client: the index of how many bytes were received for each
     * resource, and the processors to which the index is saved when
     * the client shuts down.
     *
     * The index may be used from any number of threads at once.
     * A session must outlive every ResumableHandler using it.
     */
    class ResumableSession {
        // Lifecycle management
    public:
        /**
         * This is the destructor.  It shuts the session down,
         * if that was not done already.
         */
        ~ResumableSession() noexcept;
        ResumableSession(const ResumableSession&) = delete;
        ResumableSession(ResumableSession&&) noexcept = delete;
        ResumableSession& operator=(const ResumableSession&) = delete;
        ResumableSession& operator=(ResumableSession&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        ResumableSession();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the session.
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
         * This method adds the given offsets to the index, replacing
         * any offsets already held for the same resources.
         *
         * @param[in] offsets
         *     These are the offsets to add.
         */
        void Load(const std::map< std::string, int64_t >& offsets);

        /**
         * This method adds the given processor to those which are
         * given the index when the session shuts down.
         *
         * @param[in] processor
         *     This is the processor to add.
         */
        void Register(std::shared_ptr< ResumableProcessor > processor);

        /**
         * This method records the number of bytes received for
         * the given resource.
         *
         * @param[in] key
         *     This identifies the resource.
         *
         * @param[in] offset
         *     This is the number of bytes received.
         */
        void Put(
            const std::string& key,
            int64_t offset
        );

        /**
         * This method forgets the given resource.
         *
         * @param[in] key
         *     This identifies the resource.
         */
        void Remove(const std::string& key);

        /**
         * This method looks up the number of bytes received for
         * the given resource.
         *
         * @param[in] key
         *     This identifies the resource.
         *
         * @param[out] offset
         *     This is where to store the number of bytes received.
         *
         * @return
         *     An indication of whether or not the resource is in the
         *     index is returned.
         */
        bool Find(
            const std::string& key,
            int64_t& offset
        ) const;

        /**
         * This method returns a copy of the whole index.
         */
        std::map< std::string, int64_t > GetSnapshot() const;

        /**
         * This method gives a snapshot of the index to every registered
         * processor, once per registration.  Only the first call
         * does anything.
         */
        void Shutdown();

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

#endif /* ASYNC_HTTP_RESUMABLE_SESSION_HPP */
