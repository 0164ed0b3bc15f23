// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLock a distributed lock manager for conditional-write stores.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "common/Util.hpp"
#include "common/Error.hpp"
#include <algorithm>
#include <random>
#include <string_view>
#include <cstring>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <unistd.h>

namespace zlock {

std::string generate_random_alphanumeric_string(std::size_t len) {
    static constexpr auto chars =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution{{}, std::strlen(chars) - 1};
    auto result = std::string(len, '\0');
    std::generate_n(begin(result), len, [&]() { return chars[dist(rng)]; });
    return result;
}

std::string localHostname() {
    std::array<char, 256> buf{};
    if (gethostname(buf.data(), buf.size() - 1) != 0) {
        return "unknown-host";
    }
    return std::string{buf.data()};
}

Owner makeOwnerId(const std::string& hint) {
    const auto base = hint.empty() ? localHostname() : hint;
    return base + ":" + std::to_string(getpid()) + ":" + generate_random_alphanumeric_string(16);
}

int64_t toMicros(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

Timestamp fromMicros(int64_t micros) {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds{micros})};
}

Timestamp truncateToMicros(Timestamp t) {
    return fromMicros(toMicros(t));
}

std::string formatTimestamp(Timestamp t) {
    const auto micros = toMicros(t);
    auto seconds = static_cast<std::time_t>(micros / 1000000);
    auto fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        --seconds;
    }
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::array<char, 32> date{};
    std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &tm);
    std::array<char, 48> out{};
    std::snprintf(out.data(), out.size(), "%s.%06lldZ", date.data(), static_cast<long long>(fraction));
    return std::string{out.data()};
}

std::string formatDuration(std::chrono::microseconds d) {
    using namespace std::chrono;
    if (d >= hours{1} && d % hours{1} == microseconds::zero()) {
        return std::to_string(duration_cast<hours>(d).count()) + "h";
    }
    if (d >= minutes{1} && d % minutes{1} == microseconds::zero()) {
        return std::to_string(duration_cast<minutes>(d).count()) + "m";
    }
    if (d >= seconds{1} && d % seconds{1} == microseconds::zero()) {
        return std::to_string(duration_cast<seconds>(d).count()) + "s";
    }
    if (d >= milliseconds{1} && d % milliseconds{1} == microseconds::zero()) {
        return std::to_string(duration_cast<milliseconds>(d).count()) + "ms";
    }
    return std::to_string(d.count()) + "us";
}

std::expected<std::chrono::microseconds, Error> parseDuration(const std::string& text) {
    using namespace std::chrono;
    const auto digitsEnd = std::find_if(text.begin(), text.end(), [](char c) { return c < '0' || c > '9'; });
    if (digitsEnd == text.begin()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Duration must start with a number: '" + text + "'"}};
    }
    const std::string number{text.begin(), digitsEnd};
    const std::string_view unit{digitsEnd, text.end()};
    if (number.size() > 9) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Duration out of range: '" + text + "'"}};
    }
    const auto n = std::stoll(number);
    if (unit == "us") {
        return microseconds{n};
    }
    if (unit == "ms") {
        return milliseconds{n};
    }
    if (unit == "s") {
        return seconds{n};
    }
    if (unit == "m") {
        return minutes{n};
    }
    if (unit == "h") {
        return hours{n};
    }
    if (unit.empty() && n == 0) {
        return microseconds::zero();
    }
    return std::unexpected {Error{ErrorCode::InvalidArg, "Unknown duration unit in '" + text + "' (use us, ms, s, m or h)"}};
}

} // namespace zlock
