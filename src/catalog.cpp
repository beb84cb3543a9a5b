/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/catalog.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;

namespace skywatch {

namespace {

std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

// A finite number filling the whole field, otherwise nothing
std::optional<double> toNumber(std::string_view field) {
    std::string value = trim(field);
    if (value.empty()) {
        return std::nullopt;
    }
    const char* begin = value.data();
    if (*begin == '+') {
        ++begin;
    }
    double result;
    auto [ptr, ec] = std::from_chars(begin, value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || !std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

std::optional<int> toIdentifier(std::string_view field) {
    auto value = toNumber(field);
    if (!value || *value != std::floor(*value) || *value < 0 || *value > 999999999) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

/**
 * Column positions, resolved from the header row.
 */
struct Columns {
    std::optional<std::size_t> noradID;
    std::optional<std::size_t> name;
    std::optional<std::size_t> rcs;
    std::optional<std::size_t> inclination;
    std::optional<std::size_t> period;
    std::optional<std::size_t> designator;
    std::optional<std::size_t> objectType;
    std::optional<std::size_t> owner;
    std::optional<std::size_t> launchDate;
    std::optional<std::size_t> apogee;
    std::optional<std::size_t> perigee;
};

Columns resolveColumns(const std::vector<std::string>& header) {
    Columns columns;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string& h = header[i];
        if (h == "NORAD_CAT_ID") columns.noradID = i;
        else if (h == "OBJECT_NAME" || (h == "SATNAME" && !columns.name)) columns.name = i;
        else if (h == "RCS") columns.rcs = i;
        else if (h == "INCLINATION") columns.inclination = i;
        else if (h == "PERIOD") columns.period = i;
        else if (h == "OBJECT_ID" || (h == "INTLDES" && !columns.designator)) columns.designator = i;
        else if (h == "OBJECT_TYPE") columns.objectType = i;
        else if (h == "OWNER" || (h == "COUNTRY" && !columns.owner)) columns.owner = i;
        else if (h == "LAUNCH_DATE" || (h == "LAUNCH" && !columns.launchDate)) columns.launchDate = i;
        else if (h == "APOGEE") columns.apogee = i;
        else if (h == "PERIGEE") columns.perigee = i;
    }
    return columns;
}

std::string_view field(const std::vector<std::string>& row, std::optional<std::size_t> column) {
    if (!column || *column >= row.size()) {
        return {};
    }
    return row[*column];
}

std::optional<std::string> textField(const std::vector<std::string>& row, std::optional<std::size_t> column) {
    std::string value = trim(field(row, column));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

double clampRadarCrossSection(double rcs) {
    if (!std::isfinite(rcs)) {
        return DEFAULT_RADAR_CROSS_SECTION;
    }
    return std::clamp(rcs, MIN_RADAR_CROSS_SECTION, MAX_RADAR_CROSS_SECTION);
}

std::vector<std::string> splitCSVLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r' && c != '\n') {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

CatalogStore loadCatalog(const std::string &filepath) {
    info("Loading catalog from file: {}", filepath);
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open catalog file: " + filepath);
    }
    return loadCatalog(file);
}

CatalogStore loadCatalog(std::istream &s) {
    std::string line;
    if (!std::getline(s, line)) {
        throw std::runtime_error("Catalog is empty");
    }

    // Drop a UTF-8 byte order mark
    if (line.starts_with("\xEF\xBB\xBF")) {
        line.erase(0, 3);
    }

    std::vector<std::string> header = splitCSVLine(line);
    for (auto& name : header) {
        name = toUpper(trim(name));
    }
    Columns columns = resolveColumns(header);
    if (!columns.noradID) {
        throw std::runtime_error("Catalog has no NORAD_CAT_ID column");
    }

    CatalogStore catalog;
    int dropped = 0;
    while (std::getline(s, line)) {
        if (trim(line).empty()) continue;

        std::vector<std::string> row = splitCSVLine(line);
        auto id = toIdentifier(field(row, columns.noradID));
        if (!id) {
            dropped++;
            continue;
        }

        CatalogRecord record;
        record.noradID = *id;
        record.name = trim(field(row, columns.name));
        record.radarCrossSection = clampRadarCrossSection(
            toNumber(field(row, columns.rcs)).value_or(DEFAULT_RADAR_CROSS_SECTION));
        record.inclination = toNumber(field(row, columns.inclination));
        record.period = toNumber(field(row, columns.period));
        record.designator = textField(row, columns.designator);
        record.objectType = textField(row, columns.objectType);
        record.owner = textField(row, columns.owner);
        record.launchDate = textField(row, columns.launchDate);
        record.apogee = toNumber(field(row, columns.apogee));
        record.perigee = toNumber(field(row, columns.perigee));

        int noradID = record.noradID;
        catalog.insert_or_assign(noradID, std::move(record));
    }

    info("Loaded {} catalog records.", catalog.size());
    if (dropped > 0) {
        debug("Dropped {} catalog rows without a valid NORAD_CAT_ID.", dropped);
    }
    return catalog;
}

} // namespace skywatch
