/**
 * @file Multipart.cpp
 *
 * This module contains the implementation of the multipart/form-data
 * body encoder.
 *
 * © 2018 by Richard Walters
 */

#include "Crypto.hpp"

#include <AsyncHttp/Multipart.hpp>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This is the character sequence corresponding to a carriage return (CR)
     * followed by a line feed (LF).
     */
    const std::string CRLF("\r\n");

    /**
     * This is the number of random bytes encoded in a generated boundary.
     */
    constexpr size_t BOUNDARY_RANDOM_BYTES = 16;

    /**
     * This function appends the given string to the given block.
     */
    void Append(
        std::vector< uint8_t >& block,
        const std::string& text
    ) {
        block.insert(block.end(), text.begin(), text.end());
    }

}

namespace AsyncHttp {

    bool ExtractBoundary(
        const std::string& contentType,
        std::string& boundary
    ) {
        const auto parameter = contentType.find("boundary=");
        if (parameter == std::string::npos) {
            return false;
        }
        const auto valueStart = parameter + 9;
        const auto valueEnd = contentType.find(';', valueStart);
        boundary = SystemAbstractions::Trim(
            contentType.substr(
                valueStart,
                (valueEnd == std::string::npos) ? std::string::npos : valueEnd - valueStart
            )
        );
        if (
            (boundary.length() >= 2)
            && (boundary.front() == '"')
            && (boundary.back() == '"')
        ) {
            boundary = boundary.substr(1, boundary.length() - 2);
        }
        return !boundary.empty();
    }

    bool NewBoundary(std::string& boundary) {
        std::vector< uint8_t > randomBytes;
        if (!GenerateRandomBytes(randomBytes, BOUNDARY_RANDOM_BYTES)) {
            return false;
        }
        boundary = ToHex(randomBytes);
        return true;
    }

    std::vector< std::vector< uint8_t > > EncodeMultipart(
        const std::vector< Part >& parts,
        const std::string& boundary
    ) {
        std::vector< std::vector< uint8_t > > blocks;
        for (const auto& part: parts) {
            std::vector< uint8_t > head;
            Append(head, "--" + boundary + CRLF);
            Append(head, "Content-Disposition: form-data; name=\"" + part.name + "\"");
            if (!part.fileName.empty()) {
                Append(head, "; filename=\"" + part.fileName + "\"");
            }
            Append(head, CRLF);
            if (!part.contentType.empty()) {
                Append(head, "Content-Type: " + part.contentType + CRLF);
            }
            Append(head, CRLF);
            blocks.push_back(std::move(head));
            blocks.push_back(part.content);
            blocks.push_back(std::vector< uint8_t >(CRLF.begin(), CRLF.end()));
        }
        std::vector< uint8_t > tail;
        Append(tail, "--" + boundary + "--" + CRLF);
        blocks.push_back(std::move(tail));
        return blocks;
    }

}
