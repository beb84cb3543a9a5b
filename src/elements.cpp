/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/elements.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <date/date.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace skywatch {

namespace {

// Shortest line that still holds every field we read
constexpr std::size_t MIN_TLE_LINE_LENGTH = 68;

std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(" \r\t");
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

template <typename T>
T toNumber(std::string_view str) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Couldn't convert value: '" + std::string(str) + "'");
    }
    return value;
}

// Numbers like " .00008010" or "-.00000023" that from_chars won't take as is
double toSignedDecimal(std::string_view str) {
    str = trimLeft(str);
    bool negative = false;
    if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
        negative = str[0] == '-';
        str.remove_prefix(1);
    }
    std::string digits(str);
    if (digits.starts_with('.')) {
        digits.insert(digits.begin(), '0');
    }
    double value = toNumber<double>(digits);
    return negative ? -value : value;
}

// Example input: "11606-4" -> 0.11606e-4, "-11606-4" -> -0.11606e-4
double fromExponentialString(std::string_view str) {
    str = trimLeft(str);
    bool negativeMantissa = false;
    if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
        negativeMantissa = str[0] == '-';
        str.remove_prefix(1);
    }

    auto pos = str.find_last_of("+-");
    if (pos == std::string_view::npos || pos == 0) {
        throw std::invalid_argument("Invalid exponential format: '" + std::string(str) + "'");
    }

    bool negativeExponent = str[pos] == '-';
    double base = toNumber<double>("0." + std::string(str.substr(0, pos)));
    int exponent = toNumber<int>(str.substr(pos + 1));
    double value = base * std::pow(10.0, negativeExponent ? -exponent : exponent);
    return negativeMantissa ? -value : value;
}

// Epoch in TLE format (YYDDD.DDDDDDDD)
time_point parseEpoch(std::string_view epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)));
    double dayOfYear = toNumber<double>(trimLeft(epochStr.substr(2)));

    // Two-digit years from 57 on are 1957 through 1999
    y += y < 57 ? 2000 : 1900;

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

std::string formatEpoch(time_point epoch) {
    using namespace std::chrono;

    auto epochDays = floor<days>(epoch);
    year_month_day ymd{epochDays};
    int twoDigitYear = static_cast<int>(ymd.year()) % 100;
    int dayOfYear = (epochDays - sys_days{ymd.year()/January/1}).count() + 1;
    double fracDay = duration_cast<duration<double, std::ratio<86400>>>(epoch - epochDays).count();
    long fraction = std::min(static_cast<long>(std::round(fracDay * 100000000)), 99999999L);

    return fmt::format("{:02d}{:03d}.{:08d}", twoDigitYear, dayOfYear, fraction);
}

} // namespace

ElementSet::ElementSet(int noradID, std::string name, time_point epoch, const MeanElements& elements)
    : noradID(noradID), name(std::move(name)), epoch(epoch), elements(elements) {}

bool ElementSet::isPropagatable() const {
    const MeanElements& e = elements;
    for (double value : {e.inclination, e.rightAscensionOfAscendingNode, e.eccentricity,
                         e.argumentOfPerigee, e.meanAnomaly, e.meanMotion,
                         e.firstDerivativeMeanMotion, e.secondDerivativeMeanMotion, e.bstarDragTerm}) {
        if (!std::isfinite(value)) {
            return false;
        }
    }
    return e.eccentricity >= 0.0 && e.eccentricity < 1.0 && e.meanMotion > 0.0;
}

sgp4::Elements ElementSet::toSGP4Elements() const {
    return sgp4::Elements{
        .epochJD = toJulianDate(epoch),
        .bstar = elements.bstarDragTerm,
        .inclination = elements.inclination * DEGREES_TO_RADIANS,
        .raan = elements.rightAscensionOfAscendingNode * DEGREES_TO_RADIANS,
        .eccentricity = elements.eccentricity,
        .argPerigee = elements.argumentOfPerigee * DEGREES_TO_RADIANS,
        .meanAnomaly = elements.meanAnomaly * DEGREES_TO_RADIANS,
        .meanMotion = elements.meanMotion * sgp4::TWO_PI / sgp4::MINUTES_PER_DAY
    };
}

// Parse a TLE, taking fields from their fixed columns
ElementSet parseElementSet(std::string_view tle) {
    ElementSet set;
    bool firstLineParsed = false;
    bool secondLineParsed = false;

    for (auto line : tle | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trimLeft(trimRight(lineStr));

        if (lineView.starts_with("1 ")) {
            if (lineView.size() < MIN_TLE_LINE_LENGTH) {
                throw std::invalid_argument("TLE line 1 is too short: '" + std::string(lineView) + "'");
            }
            set.noradID = toNumber<int>(trimLeft(lineView.substr(2, 5)));
            set.classification = lineView[7];
            set.designator = std::string(trimRight(lineView.substr(9, 8)));
            set.epoch = parseEpoch(lineView.substr(18, 14));
            set.elements.firstDerivativeMeanMotion = toSignedDecimal(lineView.substr(33, 10));
            set.elements.secondDerivativeMeanMotion = fromExponentialString(lineView.substr(44, 8));
            set.elements.bstarDragTerm = fromExponentialString(lineView.substr(53, 8));
            set.elementSetNumber = toNumber<int>(trimLeft(lineView.substr(64, 4)));
            set.line1 = std::string(lineView);
            firstLineParsed = true;
        } else if (lineView.starts_with("2 ")) {
            if (lineView.size() < MIN_TLE_LINE_LENGTH) {
                throw std::invalid_argument("TLE line 2 is too short: '" + std::string(lineView) + "'");
            }
            set.elements.inclination = toNumber<double>(trimLeft(lineView.substr(8, 8)));
            set.elements.rightAscensionOfAscendingNode = toNumber<double>(trimLeft(lineView.substr(17, 8)));
            // Decimal point is implied
            set.elements.eccentricity = toNumber<double>("0." + std::string(trimLeft(lineView.substr(26, 7))));
            set.elements.argumentOfPerigee = toNumber<double>(trimLeft(lineView.substr(34, 8)));
            set.elements.meanAnomaly = toNumber<double>(trimLeft(lineView.substr(43, 8)));
            set.elements.meanMotion = toNumber<double>(trimLeft(lineView.substr(52, 11)));
            set.revolutionNumberAtEpoch = toNumber<int>(trimLeft(lineView.substr(63, 5)));
            set.line2 = std::string(lineView);
            secondLineParsed = true;
        } else if (!firstLineParsed && !secondLineParsed && !lineView.empty()) {
            // Titles in 3LE files may carry a leading "0 "
            set.name = std::string(lineView.starts_with("0 ") ? lineView.substr(2) : lineView);
        }

        if (firstLineParsed && secondLineParsed) {
            break;
        }
    }

    if (!firstLineParsed || !secondLineParsed) {
        throw std::invalid_argument("TLE is missing line " + std::string(firstLineParsed ? "2" : "1"));
    }
    if (set.name.empty()) {
        set.name = std::to_string(set.noradID);
    }
    return set;
}

void ElementSet::printInfo(std::ostream &os) const {
    os << getName() << std::endl;
    os << "  NORAD ID: " << getNoradID() << std::endl;
    os << "  Classification: " << getClassification() << std::endl;
    os << "  Designator: " << getDesignator() << std::endl;
    auto epochSeconds = std::chrono::floor<std::chrono::seconds>(getEpoch());
    os << "  Epoch: " << date::format("%F %T UTC", epochSeconds) << std::endl;
    os << "  Inclination: " << elements.inclination << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << elements.rightAscensionOfAscendingNode << " deg" << std::endl;
    os << "  Eccentricity: " << elements.eccentricity << std::endl;
    os << "  Argument of Perigee: " << elements.argumentOfPerigee << " deg" << std::endl;
    os << "  Mean Anomaly: " << elements.meanAnomaly << " deg" << std::endl;
    os << "  Mean Motion: " << elements.meanMotion << " revs per day" << std::endl;
    os << "  Bstar Drag Term: " << elements.bstarDragTerm << std::endl;
    os << "  Revolution Number at Epoch: " << getRevolutionNumberAtEpoch() << std::endl;
}

// Mod 10 sum of the digits, with '-' counting as 1
int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

// Format a value in TLE exponential notation (e.g. " 15237-3" or "-12345-6")
std::string toTLEExponential(double value) {
    if (value == 0.0) {
        return " 00000+0";
    }

    char sign = value >= 0 ? ' ' : '-';
    value = std::abs(value);

    int exponent = static_cast<int>(std::floor(std::log10(value))) + 1;
    int mantissa = static_cast<int>(std::round(value / std::pow(10.0, exponent) * 100000));
    if (mantissa >= 100000) {
        mantissa = 10000;
        exponent++;
    }

    return fmt::format("{}{:05d}{}{}", sign, mantissa, exponent >= 0 ? '+' : '-', std::abs(exponent));
}

// Format first derivative of mean motion (e.g. " .00008010" or "-.00012345")
std::string formatFirstDerivative(double value) {
    char sign = value >= 0 ? ' ' : '-';
    return fmt::format("{}.{:08d}", sign, static_cast<long>(std::round(std::abs(value) * 100000000)));
}

std::string ElementSet::getTLE() const {
    if (!line1.empty() && !line2.empty()) {
        return fmt::format("{}\n{}\n{}\n", name, line1, line2);
    }

    std::string first = fmt::format("1 {:05d}{} {:<8} {} {} {} {} 0 {:>4}",
        noradID, classification, designator, formatEpoch(epoch),
        formatFirstDerivative(elements.firstDerivativeMeanMotion),
        toTLEExponential(elements.secondDerivativeMeanMotion),
        toTLEExponential(elements.bstarDragTerm),
        elementSetNumber % 10000);

    std::string second = fmt::format("2 {:05d} {:8.4f} {:8.4f} {:07d} {:8.4f} {:8.4f} {:11.8f}{:05d}",
        noradID, elements.inclination, elements.rightAscensionOfAscendingNode,
        static_cast<int>(std::round(elements.eccentricity * 10000000)),
        elements.argumentOfPerigee, elements.meanAnomaly, elements.meanMotion,
        revolutionNumberAtEpoch % 100000);

    return fmt::format("{}\n{}{}\n{}{}\n", name, first, calculateChecksum(first),
                       second, calculateChecksum(second));
}

// ============================================================================
// TLE Database
// ============================================================================

int loadTLEDatabase(const std::string &filepath, ElementSetStore &store) {
    info("Loading TLE database from file: {}", filepath);
    if (!std::filesystem::exists(filepath)) {
        warn("TLE database file does not exist: {}", filepath);
        return 0;
    }
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open TLE database file: " + filepath);
    }
    return loadTLEDatabase(file, store);
}

int loadTLEDatabase(std::istream &s, ElementSetStore &store) {
    std::string line, line1, line2, nameLine;
    int entriesLoaded = 0;
    int entriesSkipped = 0;

    while (std::getline(s, line)) {
        std::string_view trimmed = trimRight(line);
        if (trimmed.empty()) continue;

        if (trimmed.starts_with("1 ")) {
            line1 = trimmed;
        } else if (trimmed.starts_with("2 ")) {
            line2 = trimmed;
        } else {
            nameLine = trimmed;
            line1.clear();
            line2.clear();
        }

        if (!line1.empty() && !line2.empty()) {
            try {
                ElementSet set = parseElementSet(nameLine + '\n' + line1 + '\n' + line2);
                int id = set.getNoradID();
                store.insert_or_assign(id, std::move(set));
                entriesLoaded++;
            } catch (const std::invalid_argument& e) {
                warn("Skipping malformed TLE entry '{}': {}", nameLine, e.what());
                entriesSkipped++;
            }
            line1.clear();
            line2.clear();
            nameLine.clear();
        }
    }

    info("Loaded {} TLE entries.", entriesLoaded);
    if (entriesSkipped > 0) {
        debug("Skipped {} malformed TLE entries.", entriesSkipped);
    }
    return entriesLoaded;
}

void saveTLEDatabase(const std::string &filepath, const ElementSetStore &store) {
    info("Saving TLE database to file: {}", filepath);
    auto parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    saveTLEDatabase(file, store);
}

void saveTLEDatabase(std::ostream &s, const ElementSetStore &store) {
    for (const auto &[id, set] : store) {
        s << set.getTLE();
    }
    info("Saved {} TLE entries.", store.size());
}

} // namespace skywatch
