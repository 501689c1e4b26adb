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

#include "http.h"

#include <memory>

#include <curl/curl.h>
#include <fmt/core.h>

#include "Exception.h"

namespace {
struct EasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};
struct UrlDeleter {
    void operator()(CURLU* url) const noexcept { curl_url_cleanup(url); }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& body = *static_cast<std::vector<uint8_t>*>(userdata);
    const size_t total_size = size * nmemb;
    body.insert(body.end(), reinterpret_cast<const uint8_t*>(ptr), reinterpret_cast<const uint8_t*>(ptr) + total_size);
    return total_size;
}
}

http::CurlGlobal::CurlGlobal()
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        throw Exception("curl_global_init failed");
}

http::CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

tl::expected<http::Response, FetchError> http::get(const std::string& url, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
        return tl::unexpected(FetchError(FetchErrorKind::Timeout, fmt::format("deadline passed before requesting {}", url)));

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl)
        return tl::unexpected(FetchError(FetchErrorKind::Transport, "curl_easy_init failed"));

    Response response;
    char error_buffer[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "alpine-pyramid-builder");
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // required for multi threaded use
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, long(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        const auto message = fmt::format("[{}] {} ({})", static_cast<unsigned int>(res), error_buffer[0] ? error_buffer : curl_easy_strerror(res), url);
        if (res == CURLE_OPERATION_TIMEDOUT)
            return tl::unexpected(FetchError(FetchErrorKind::Timeout, message));
        return tl::unexpected(FetchError(FetchErrorKind::Transport, message));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type != nullptr)
        response.content_type = content_type;

    if (response.status >= 400)
        return tl::unexpected(FetchError(FetchErrorKind::HttpStatus, fmt::format("status {} for {}", response.status, url)));

    return response;
}

std::string http::build_url(const std::string& base, const QueryParameters& query)
{
    std::unique_ptr<CURLU, UrlDeleter> url(curl_url());
    if (!url)
        throw Exception("curl_url failed");
    if (curl_url_set(url.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK)
        throw Exception(fmt::format("Invalid url '{}'", base));

    for (const auto& [key, value] : query) {
        const auto parameter = fmt::format("{}={}", key, value);
        if (curl_url_set(url.get(), CURLUPART_QUERY, parameter.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE) != CURLUE_OK)
            throw Exception(fmt::format("Could not append query parameter '{}' to '{}'", parameter, base));
    }

    char* result = nullptr;
    if (curl_url_get(url.get(), CURLUPART_URL, &result, 0) != CURLUE_OK)
        throw Exception(fmt::format("Could not assemble url from '{}'", base));
    std::string url_string = result;
    curl_free(result);
    return url_string;
}
