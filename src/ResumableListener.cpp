/**
 * @file ResumableListener.cpp
 *
 * This module contains the implementations of the
 * AsyncHttp::ResumableListener interface.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/ResumableListener.hpp>

namespace AsyncHttp {

    bool NullResumableListener::OnBytesReceived(const std::vector< uint8_t >& bytes) {
        return true;
    }

    void NullResumableListener::OnAllBytesReceived() {
    }

    int64_t NullResumableListener::GetLength() {
        return 0;
    }

    ResumableFileListener::ResumableFileListener(const std::string& path)
        : path_(path)
    {
    }

    bool ResumableFileListener::OnBytesReceived(const std::vector< uint8_t >& bytes) {
        if (!file_.is_open()) {
            file_.open(path_, std::ios::binary | std::ios::app);
            if (!file_.is_open()) {
                return false;
            }
        }
        (void)file_.write((const char*)bytes.data(), (std::streamsize)bytes.size());
        file_.flush();
        return file_.good();
    }

    void ResumableFileListener::OnAllBytesReceived() {
        if (file_.is_open()) {
            file_.close();
        }
    }

    int64_t ResumableFileListener::GetLength() {
        if (file_.is_open()) {
            file_.flush();
        }
        std::ifstream file(path_, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            return 0;
        }
        const auto size = (int64_t)file.tellg();
        return (size < 0) ? 0 : size;
    }

}
