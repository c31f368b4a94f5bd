#include "lattice/helpers.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include "lattice/errors.hpp"

namespace lattice {
namespace helpers {

std::string generate_uuid() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[nibble(engine)];
    }
    // Set version (4) and variant (8, 9, a, or b)
    uuid[14] = '4';
    uuid[19] = hex[(nibble(engine) % 4) + 8];
    return uuid;
}

std::string format_time(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds).count();
    if (millis < 0) millis = 0;

    auto time_t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_time(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        throw InvalidArgumentError("invalid timestamp: " + text);
    }

    std::chrono::nanoseconds fraction{0};
    if (in.peek() == '.') {
        in.get();
        long long scale = 100000000;
        while (std::isdigit(in.peek())) {
            int digit = in.get() - '0';
            fraction += std::chrono::nanoseconds(digit * scale);
            scale /= 10;
        }
    }

    long offset_seconds = 0;
    int zone = in.get();
    if (zone == 'Z' || zone == 'z') {
        offset_seconds = 0;
    } else if (zone == '+' || zone == '-') {
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        in >> hours >> colon >> minutes;
        if (in.fail() || colon != ':') {
            throw InvalidArgumentError("invalid timestamp offset: " + text);
        }
        offset_seconds = (hours * 3600L + minutes * 60L) * (zone == '-' ? -1 : 1);
    } else {
        throw InvalidArgumentError("timestamp is missing a zone designator: " + text);
    }

    std::time_t utc = timegm(&tm);
    auto point = std::chrono::system_clock::from_time_t(utc) - std::chrono::seconds(offset_seconds);
    return point + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

} // namespace helpers
} // namespace lattice
