/*****************************************************************************
 * Alpine Pyramid Builder
 * Copyright (C) 2024 alpinemaps.org
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *****************************************************************************/

#ifndef HTTP_H
#define HTTP_H

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "TileImageSource.h"

namespace http {

/// curl_global_init / curl_global_cleanup. Create one instance in main before any thread issues requests.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct Response {
    long status = 0;
    std::string content_type;
    std::vector<uint8_t> body;

    [[nodiscard]] bool is_image() const { return content_type.starts_with("image"); }
    [[nodiscard]] std::string text() const { return { body.begin(), body.end() }; }
};

using QueryParameters = std::vector<std::pair<std::string, std::string>>;

/// GET with a total timeout. error status codes (>= 400) are reported as FetchErrorKind::HttpStatus.
[[nodiscard]] tl::expected<Response, FetchError> get(const std::string& url, std::chrono::milliseconds timeout);

/// appends url encoded query parameters to base. throws Exception if base is not a valid url.
[[nodiscard]] std::string build_url(const std::string& base, const QueryParameters& query);

}

#endif // HTTP_H
