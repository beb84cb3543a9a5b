/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_CELESTRAK_HPP
#define __SKYWATCH_CELESTRAK_HPP

#include <string>
#include <string_view>
#include <vector>

namespace skywatch::celestrak {

constexpr std::string_view DEFAULT_GROUP = "active";

/**
 * TLE entries downloaded for one GP group. Each entry is the text of a
 * single element set, title line included when the source had one.
 */
struct TLEResponse {
    std::string group;
    std::vector<std::string> entries;
};

/**
 * Download TLE data for a satellite group from CelesTrak
 * @param group The group name (e.g., "active", "stations", "weather", etc.)
 *              Defaults to "active" if empty
 * @return TLE data for all satellites in the group
 * @throws std::runtime_error if the download fails or the group is unknown
 */
TLEResponse getTLE(const std::string& group = std::string(DEFAULT_GROUP));

/**
 * GP query URL for a group in TLE format.
 */
std::string groupURL(std::string_view group);

/**
 * Split a TLE format response into one string per element set. An entry
 * ends at its second data line; blank lines are ignored.
 */
std::vector<std::string> parseTLEResponse(std::string_view response);

} // namespace skywatch::celestrak

#endif
