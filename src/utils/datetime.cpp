#include "utils/datetime.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#if !defined(_WIN32)
#include <time.h>
#endif

namespace trivium {
namespace utils {

namespace {

time_t portableMkgmtime(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

void portableGmtime(const time_t* t, std::tm* out) {
#ifdef _WIN32
    gmtime_s(out, t);
#else
    gmtime_r(t, out);
#endif
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

std::string formatIso8601(int64_t epoch_ms) {
    const int64_t secs = floorDiv(epoch_ms, 1000);
    const int millis = static_cast<int>(epoch_ms - secs * 1000);
    time_t t = static_cast<time_t>(secs);
    std::tm tm{};
    portableGmtime(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

std::optional<int64_t> parseIso8601(const std::string& s) {
    if (s.size() < 10) return std::nullopt;

    std::tm tm{};
    std::istringstream ss(s);
    if (s.size() == 10) {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }
    if (ss.fail()) return std::nullopt;

    int millis = 0;
    std::string rest;
    std::getline(ss, rest);
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && rest[pos] >= '0' && rest[pos] <= '9') {
            if (digits < 3) millis = millis * 10 + (rest[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (pos < rest.size() && rest[pos] == 'Z') ++pos;
    if (pos != rest.size()) return std::nullopt;

    tm.tm_isdst = 0;
    const std::tm parsed = tm;
    const time_t t = portableMkgmtime(&tm);
    // timegm normalisiert (2024-02-31 -> 2024-03-02); solche Daten ablehnen
    if (tm.tm_year != parsed.tm_year || tm.tm_mon != parsed.tm_mon || tm.tm_mday != parsed.tm_mday ||
        tm.tm_hour != parsed.tm_hour || tm.tm_min != parsed.tm_min || tm.tm_sec != parsed.tm_sec) {
        return std::nullopt;
    }
    return static_cast<int64_t>(t) * 1000 + millis;
}

int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace utils
} // namespace trivium
