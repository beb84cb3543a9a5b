/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/celestrak.hpp>

#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Exception.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>

#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;

namespace skywatch::celestrak {

// CelesTrak GP data URL
// Documentation: https://celestrak.org/NORAD/documentation/gp-data-formats.php
constexpr std::string_view BASE_URI = "https://celestrak.org/NORAD/elements/gp.php";

namespace {

std::string doGet(const std::string& url) {
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    debug("GET {}", url);

    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::FollowLocation(true));

    std::ostringstream responseStream;
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    long status = 0;
    try {
        request.perform();
        status = curlpp::infos::ResponseCode::get(request);
    } catch (curlpp::RuntimeError& e) {
        throw std::runtime_error(std::string("HTTP request failed: ") + e.what());
    } catch (curlpp::LogicError& e) {
        throw std::runtime_error(std::string("HTTP logic error: ") + e.what());
    }

    if (status >= 400) {
        throw std::runtime_error("HTTP request failed with status " + std::to_string(status) + ": " + url);
    }

    std::string response = responseStream.str();
    debug("Response length: {} bytes", response.length());
    return response;
}

std::string_view trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace

std::string groupURL(std::string_view group) {
    std::ostringstream url;
    url << BASE_URI << "?GROUP=" << group << "&FORMAT=tle";
    return url.str();
}

std::vector<std::string> parseTLEResponse(std::string_view response) {
    std::vector<std::string> entries;
    std::string entry;

    while (!response.empty()) {
        auto newline = response.find('\n');
        std::string_view line = trim(response.substr(0, newline));
        response = newline == std::string_view::npos ? "" : response.substr(newline + 1);
        if (line.empty()) {
            continue;
        }

        entry.append(line);
        entry.push_back('\n');
        if (line.starts_with("2 ")) {
            entries.push_back(std::move(entry));
            entry.clear();
        }
    }
    return entries;
}

TLEResponse getTLE(const std::string& group) {
    std::string groupName = group.empty() ? std::string(DEFAULT_GROUP) : group;

    std::string response = doGet(groupURL(groupName));

    if (response.find("No GP data found") != std::string::npos) {
        throw std::runtime_error("CelesTrak error: No GP data found for group '" + groupName + "'");
    }

    std::vector<std::string> entries = parseTLEResponse(response);
    if (entries.empty()) {
        throw std::runtime_error("Failed to parse TLE data from CelesTrak response for group '" + groupName + "'");
    }
    info("Downloaded {} element sets for group '{}'", entries.size(), groupName);

    return TLEResponse{
        .group = groupName,
        .entries = std::move(entries)
    };
}

} // namespace skywatch::celestrak
