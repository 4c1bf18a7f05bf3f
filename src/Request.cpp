/**
 * @file Request.cpp
 *
 * This module contains the implementation of the AsyncHttp::Request
 * structure.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/Request.hpp>
#include <AsyncHttp/UriUtilities.hpp>

namespace AsyncHttp {

    std::string Request::GetUrl() const {
        return ToUrl(target);
    }

}
