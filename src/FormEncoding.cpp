/**
 * @file FormEncoding.cpp
 *
 * This module contains the implementation of the text and form
 * body encoding functions.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <AsyncHttp/FormEncoding.hpp>
#include <ctype.h>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This function returns the given character set name in lowercase,
     * for comparison.
     */
    std::string NormalizeCharsetName(const std::string& charset) {
        std::string normalized = SystemAbstractions::Trim(charset);
        std::transform(
            normalized.begin(),
            normalized.end(),
            normalized.begin(),
            [](char c){ return (char)tolower((unsigned char)c); }
        );
        return normalized;
    }

    /**
     * This function decodes the next code point from the given UTF-8 text.
     *
     * @param[in] text
     *     This is the UTF-8 text to decode.
     *
     * @param[in,out] position
     *     This is the position of the next code point, which is advanced
     *     past the code point decoded.
     *
     * @return
     *     The decoded code point is returned.  A malformed sequence
     *     decodes as U+FFFD.
     */
    uint32_t DecodeUtf8(
        const std::string& text,
        size_t& position
    ) {
        const auto lead = (uint8_t)text[position++];
        if (lead < 0x80) {
            return lead;
        }
        size_t continuationBytes;
        uint32_t codePoint;
        if ((lead & 0xE0) == 0xC0) {
            continuationBytes = 1;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuationBytes = 2;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuationBytes = 3;
            codePoint = lead & 0x07;
        } else {
            return 0xFFFD;
        }
        for (size_t i = 0; i < continuationBytes; ++i) {
            if (
                (position >= text.length())
                || (((uint8_t)text[position] & 0xC0) != 0x80)
            ) {
                return 0xFFFD;
            }
            codePoint = (codePoint << 6) | ((uint8_t)text[position++] & 0x3F);
        }
        return codePoint;
    }

    /**
     * This function transcodes UTF-8 text to a single-byte character set
     * whose code points coincide with the first code points of Unicode.
     *
     * @param[in] text
     *     This is the UTF-8 text to transcode.
     *
     * @param[in] highestCodePoint
     *     This is the highest code point the character set can represent.
     *
     * @param[out] encoded
     *     This is where to store the transcoded bytes.
     */
    void TranscodeToSingleByte(
        const std::string& text,
        uint32_t highestCodePoint,
        std::vector< uint8_t >& encoded
    ) {
        encoded.clear();
        size_t position = 0;
        while (position < text.length()) {
            const auto codePoint = DecodeUtf8(text, position);
            if (codePoint <= highestCodePoint) {
                encoded.push_back((uint8_t)codePoint);
            } else {
                encoded.push_back('?');
            }
        }
    }

}

namespace AsyncHttp {

    bool EncodeText(
        const std::string& text,
        const std::string& charset,
        std::vector< uint8_t >& encoded
    ) {
        const auto charsetName = NormalizeCharsetName(charset);
        if (
            (charsetName == "iso-8859-1")
            || (charsetName == "latin1")
        ) {
            TranscodeToSingleByte(text, 0xFF, encoded);
            return true;
        } else if (
            (charsetName == "us-ascii")
            || (charsetName == "ascii")
        ) {
            TranscodeToSingleByte(text, 0x7F, encoded);
            return true;
        }
        encoded.assign(text.begin(), text.end());
        return (
            (charsetName == "utf-8")
            || (charsetName == "utf8")
        );
    }

    std::string FormUrlEncode(const std::string& input) {
        std::string output;
        for (const auto c: input) {
            const auto octet = (uint8_t)c;
            if (
                isalnum(octet)
                || (octet == '-')
                || (octet == '.')
                || (octet == '_')
                || (octet == '*')
            ) {
                output += c;
            } else if (octet == ' ') {
                output += '+';
            } else {
                output += SystemAbstractions::sprintf("%%%02X", octet);
            }
        }
        return output;
    }

    std::string UrlEncodeFormParams(
        const std::vector< Param >& params,
        const std::string& charset
    ) {
        std::vector< std::string > pairs;
        for (const auto& param: params) {
            std::vector< uint8_t > name;
            (void)EncodeText(param.name, charset, name);
            std::vector< uint8_t > value;
            (void)EncodeText(param.value, charset, value);
            pairs.push_back(
                FormUrlEncode(std::string(name.begin(), name.end()))
                + "="
                + FormUrlEncode(std::string(value.begin(), value.end()))
            );
        }
        return SystemAbstractions::Join(pairs, "&");
    }

}
