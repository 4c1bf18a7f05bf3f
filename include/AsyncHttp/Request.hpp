#ifndef ASYNC_HTTP_REQUEST_HPP
#define ASYNC_HTTP_REQUEST_HPP

/**
 * @file Request.hpp
 *
 * This module declares the AsyncHttp::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include "BodyGenerator.hpp"
#include "Cookie.hpp"
#include "FormEncoding.hpp"
#include "Multipart.hpp"

#include <istream>
#include <memory>
#include <MessageHeaders/MessageHeaders.hpp>
#include <stdint.h>
#include <string>
#include <Uri/Uri.hpp>
#include <vector>

namespace AsyncHttp {

    /**
     * This represents an HTTP request a client wants to make, described
     * declaratively.  It is turned into a wire request by
     * RequestFactory::Assemble.
     *
     * At most one body source is expected to be set.  If several are set,
     * the first one, in the order declared below, is used.
     */
    struct Request {
        // Properties

        /**
         * This indicates the request method to be performed on the
         * target resource.
         */
        std::string method = "GET";

        /**
         * This identifies the target resource upon which to apply
         * the request.
         */
        Uri::Uri target;

        /**
         * These are the headers the caller wants sent with the request.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * These are the cookies to send with the request.
         */
        std::vector< Cookie > cookies;

        /**
         * This is the character set used to encode text and form
         * parameter bodies.
         */
        std::string charset = "UTF-8";

        /**
         * This flag indicates whether or not the virtualHost
         * property should be sent as the Host header.
         */
        bool hasVirtualHost = false;

        /**
         * This is the value to send as the Host header, if hasVirtualHost
         * is set.
         */
        std::string virtualHost;

        /**
         * If set, this is the body of the request, as bytes.
         */
        std::shared_ptr< std::vector< uint8_t > > byteData;

        /**
         * If set, this is the body of the request, as several byte
         * sequences to be sent one after another.
         */
        std::shared_ptr< std::vector< std::vector< uint8_t > > > compositeByteData;

        /**
         * If set, this is the body of the request, as UTF-8 text which
         * is encoded using the request character set.
         */
        std::shared_ptr< std::string > stringData;

        /**
         * If set, this is the body of the request, as a byte buffer.
         */
        std::shared_ptr< std::vector< uint8_t > > byteBufferData;

        /**
         * If set, this is the stream from which to read the body
         * of the request.  Its length is not known in advance.
         */
        std::shared_ptr< std::istream > streamData;

        /**
         * These are the form parameters to send as the body of the request.
         */
        std::vector< Param > formParams;

        /**
         * These are the parts to send as a multipart/form-data body.
         */
        std::vector< Part > bodyParts;

        /**
         * If not empty, this is the path of a file to send as the body
         * of the request.
         */
        std::string file;

        /**
         * If set, this is used to make the body of the request.
         */
        std::shared_ptr< BodyGenerator > bodyGenerator;

        // Methods

        /**
         * This method returns the URL of the target resource,
         * without any fragment.  It is used to identify the resource
         * when a download is resumed.
         *
         * @return
         *     The URL of the target resource is returned.
         */
        std::string GetUrl() const;
    };

}

#endif /* ASYNC_HTTP_REQUEST_HPP */
