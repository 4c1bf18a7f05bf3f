/**
 * @file WireRequest.cpp
 *
 * This module contains the implementation of the AsyncHttp::WireRequest
 * structure.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/WireRequest.hpp>
#include <sstream>

namespace AsyncHttp {

    std::string WireRequest::GenerateHead() const {
        std::ostringstream builder;
        builder << method << ' ' << target << ' ' << protocol << "\r\n";
        builder << headers.GenerateRawHeaders();
        return builder.str();
    }

}
