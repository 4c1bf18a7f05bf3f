/**
 * @file ResumableProcessor.cpp
 *
 * This module contains the implementations of the
 * AsyncHttp::ResumableProcessor interface.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/ResumableProcessor.hpp>
#include <fstream>
#include <inttypes.h>
#include <mutex>
#include <stdio.h>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This function parses one line of a properties file.
     *
     * @param[in] line
     *     This is the line to parse.
     *
     * @param[out] key
     *     This is where to store the key of the entry.
     *
     * @param[out] offset
     *     This is where to store the offset of the entry.
     *
     * @return
     *     An indication of whether or not the line holds a valid
     *     entry is returned.
     */
    bool ParsePropertiesLine(
        const std::string& line,
        std::string& key,
        int64_t& offset
    ) {
        const auto delimiter = line.rfind('=');
        if (
            (delimiter == std::string::npos)
            || (delimiter == 0)
        ) {
            return false;
        }
        key = line.substr(0, delimiter);
        intmax_t offsetAsInt;
        if (
            SystemAbstractions::ToInteger(
                SystemAbstractions::Trim(line.substr(delimiter + 1)),
                offsetAsInt
            ) != SystemAbstractions::ToIntegerResult::Success
        ) {
            return false;
        }
        if (offsetAsInt < 0) {
            return false;
        }
        offset = (int64_t)offsetAsInt;
        return true;
    }

}

namespace AsyncHttp {

    void NullResumableProcessor::Put(
        const std::string& key,
        int64_t transferredBytes
    ) {
    }

    void NullResumableProcessor::Remove(const std::string& key) {
    }

    bool NullResumableProcessor::Save(const std::map< std::string, int64_t >& offsets) {
        return true;
    }

    std::map< std::string, int64_t > NullResumableProcessor::Load() {
        return std::map< std::string, int64_t >();
    }

    /**
     * This contains the private properties of a
     * PropertiesResumableProcessor instance.
     */
    struct PropertiesResumableProcessor::Impl {
        /**
         * This is the path of the properties file.
         */
        std::string path;

        /**
         * These are the offsets recorded since the file was last
         * loaded or saved.
         */
        std::map< std::string, int64_t > properties;

        /**
         * This is used to synchronize access to the properties.
         */
        std::mutex mutex;
    };

    PropertiesResumableProcessor::~PropertiesResumableProcessor() noexcept = default;

    PropertiesResumableProcessor::PropertiesResumableProcessor(
        const std::string& directory,
        const std::string& fileName
    )
        : impl_(new Impl())
    {
        if (
            directory.empty()
            || (directory.back() == '/')
        ) {
            impl_->path = directory + fileName;
        } else {
            impl_->path = directory + "/" + fileName;
        }
    }

    std::string PropertiesResumableProcessor::GetPath() const {
        return impl_->path;
    }

    void PropertiesResumableProcessor::Put(
        const std::string& key,
        int64_t transferredBytes
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->properties[key] = transferredBytes;
    }

    void PropertiesResumableProcessor::Remove(const std::string& key) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        (void)impl_->properties.erase(key);
    }

    bool PropertiesResumableProcessor::Save(const std::map< std::string, int64_t >& offsets) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto temporaryPath = impl_->path + ".tmp";
        {
            std::ofstream file(temporaryPath, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return false;
            }
            for (const auto& entry: offsets) {
                if (entry.first.find_first_of("\r\n") != std::string::npos) {
                    continue;
                }
                file << entry.first << '=' << entry.second << '\n';
            }
            file.flush();
            if (!file.good()) {
                return false;
            }
        }
        if (rename(temporaryPath.c_str(), impl_->path.c_str()) != 0) {
            (void)remove(temporaryPath.c_str());
            return false;
        }
        impl_->properties = offsets;
        return true;
    }

    std::map< std::string, int64_t > PropertiesResumableProcessor::Load() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        std::ifstream file(impl_->path, std::ios::binary);
        if (file.is_open()) {
            std::string line;
            while (std::getline(file, line)) {
                if (
                    !line.empty()
                    && (line.back() == '\r')
                ) {
                    line.pop_back();
                }
                std::string key;
                int64_t offset;
                if (ParsePropertiesLine(line, key, offset)) {
                    impl_->properties[key] = offset;
                }
            }
        }
        return impl_->properties;
    }

}
