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

#include "ImageServiceClient.h"

#include <utility>

#include "Exception.h"
#include "http.h"
#include "log.h"

namespace {
std::chrono::milliseconds remaining(esri::ImageServiceClient::Clock::time_point deadline)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - esri::ImageServiceClient::Clock::now());
}
}

esri::ImageServiceClient::ImageServiceClient(std::string endpoint)
    : m_endpoint(std::move(endpoint))
{
    while (m_endpoint.ends_with('/'))
        m_endpoint.pop_back();
    if (m_endpoint.empty())
        throw Exception("The image service endpoint must not be empty.");
}

const std::string& esri::ImageServiceClient::endpoint() const
{
    return m_endpoint;
}

std::string esri::ImageServiceClient::detailsUrl() const
{
    return http::build_url(m_endpoint, { { "f", "json" } });
}

std::string esri::ImageServiceClient::exportImageUrl(const ExportImageInput& input) const
{
    return http::build_url(m_endpoint + "/exportImage", export_image_query(input));
}

tl::expected<esri::ServiceDetails, FetchError> esri::ImageServiceClient::details(std::chrono::milliseconds timeout) const
{
    const auto url = detailsUrl();
    LOG_DEBUG("Requesting service details from {}", url);
    return http::get(url, timeout).and_then([](const http::Response& response) {
        return parse_service_details(response.text());
    });
}

tl::expected<TileImage, FetchError> esri::ImageServiceClient::exportImage(const ExportImageInput& input, Clock::time_point deadline) const
{
    const auto url = exportImageUrl(input);
    LOG_TRACE("exportImage {}", url);
    auto response = http::get(url, remaining(deadline));
    if (!response)
        return tl::unexpected(response.error());

    auto reply = image_or_href(std::move(*response));
    if (!reply)
        return tl::unexpected(reply.error());
    if (reply->image)
        return std::move(*reply->image);
    return download(reply->href, deadline);
}

tl::expected<TileImage, FetchError> esri::ImageServiceClient::download(const std::string& href, Clock::time_point deadline) const
{
    auto response = http::get(href, remaining(deadline));
    if (!response)
        return tl::unexpected(response.error());
    return downloaded_image(std::move(*response), href);
}
