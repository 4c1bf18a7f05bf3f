/**
 * @file ResumableSession.cpp
 *
 * This module contains the implementation of the AsyncHttp::ResumableSession
 * class.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/ResumableSession.hpp>
#include <functional>
#include <mutex>
#include <vector>

namespace {

    /**
     * This is the number of independently locked pieces
     * into which the index is divided.
     */
    constexpr size_t NUM_SHARDS = 16;

    /**
     * This is one independently locked piece of the index.
     */
    struct Shard {
        /**
         * These are the offsets of the resources whose keys
         * hash to this piece.
         */
        std::map< std::string, int64_t > offsets;

        /**
         * This is used to synchronize access to the piece.
         */
        std::mutex mutex;
    };

}

namespace AsyncHttp {

    /**
     * This contains the private properties of a ResumableSession instance.
     */
    struct ResumableSession::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * These are the pieces of the index.
         */
        mutable Shard shards[NUM_SHARDS];

        /**
         * These are the processors to which the index is given
         * when the session shuts down.
         */
        std::vector< std::shared_ptr< ResumableProcessor > > processors;

        /**
         * This flag indicates whether or not the session has shut down.
         */
        bool shutDown = false;

        /**
         * This is used to synchronize access to the registry
         * of processors.
         */
        std::mutex registryMutex;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("AsyncHttp::ResumableSession")
        {
        }

        /**
         * This method returns the piece of the index which holds
         * the given key.
         */
        Shard& GetShard(const std::string& key) const {
            return shards[std::hash< std::string >()(key) % NUM_SHARDS];
        }
    };

    ResumableSession::~ResumableSession() noexcept {
        Shutdown();
    }

    ResumableSession::ResumableSession()
        : impl_(new Impl())
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate ResumableSession::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void ResumableSession::Load(const std::map< std::string, int64_t >& offsets) {
        for (const auto& entry: offsets) {
            Put(entry.first, entry.second);
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            0,
            "Loaded %zu resumable offset(s)",
            offsets.size()
        );
    }

    void ResumableSession::Register(std::shared_ptr< ResumableProcessor > processor) {
        if (processor == nullptr) {
            return;
        }
        std::lock_guard< decltype(impl_->registryMutex) > lock(impl_->registryMutex);
        if (impl_->shutDown) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                5,
                "processor registered after shutdown will not be saved"
            );
            return;
        }
        impl_->processors.push_back(processor);
    }

    void ResumableSession::Put(
        const std::string& key,
        int64_t offset
    ) {
        auto& shard = impl_->GetShard(key);
        std::lock_guard< decltype(shard.mutex) > lock(shard.mutex);
        shard.offsets[key] = offset;
    }

    void ResumableSession::Remove(const std::string& key) {
        auto& shard = impl_->GetShard(key);
        std::lock_guard< decltype(shard.mutex) > lock(shard.mutex);
        (void)shard.offsets.erase(key);
    }

    bool ResumableSession::Find(
        const std::string& key,
        int64_t& offset
    ) const {
        auto& shard = impl_->GetShard(key);
        std::lock_guard< decltype(shard.mutex) > lock(shard.mutex);
        const auto entry = shard.offsets.find(key);
        if (entry == shard.offsets.end()) {
            return false;
        }
        offset = entry->second;
        return true;
    }

    std::map< std::string, int64_t > ResumableSession::GetSnapshot() const {
        std::map< std::string, int64_t > snapshot;
        for (auto& shard: impl_->shards) {
            std::lock_guard< decltype(shard.mutex) > lock(shard.mutex);
            snapshot.insert(shard.offsets.begin(), shard.offsets.end());
        }
        return snapshot;
    }

    void ResumableSession::Shutdown() {
        std::vector< std::shared_ptr< ResumableProcessor > > processors;
        {
            std::lock_guard< decltype(impl_->registryMutex) > lock(impl_->registryMutex);
            if (impl_->shutDown) {
                return;
            }
            impl_->shutDown = true;
            processors.swap(impl_->processors);
        }
        const auto snapshot = GetSnapshot();
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Saving %zu resumable offset(s) to %zu processor(s)",
            snapshot.size(),
            processors.size()
        );
        for (const auto& processor: processors) {
            if (!processor->Save(snapshot)) {
                impl_->diagnosticsSender.SendDiagnosticInformationString(
                    5,
                    "unable to save resumable offsets"
                );
            }
        }
    }

}
