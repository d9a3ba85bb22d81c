#include "parse_util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <vector>

#include "cmdtree/utils.hpp"

namespace cmdtree::detail {

namespace {

using utils::trimWs;

struct ParsedIP {
    bool v4{false};
    std::array<std::uint8_t, 16> bytes{};
};

bool parseDigits(std::string_view s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    int v = 0;
    for (const char ch : s) {
        if (ch < '0' || ch > '9') return false;
        v = v * 10 + (ch - '0');
    }
    out = v;
    return true;
}

bool isLeapYear(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int daysInMonth(int y, int m) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return days[m - 1];
}

std::string pad2(int v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d", v);
    return buf;
}

bool tryParseIPv4(std::string_view s, ParsedIP& out) {
    const auto sv = trimWs(s);
    if (sv.empty()) return false;
    if (sv.find(':') != std::string_view::npos) return false;

    std::array<std::uint8_t, 4> octets{};
    std::size_t octetIdx = 0;
    std::size_t start = 0;
    for (;;) {
        const auto dot = sv.find('.', start);
        const auto part = (dot == std::string_view::npos) ? sv.substr(start) : sv.substr(start, dot - start);
        if (part.empty()) return false;
        if (octetIdx >= octets.size()) return false;
        std::uint32_t value = 0;
        for (const char ch : part) {
            if (ch < '0' || ch > '9') return false;
            value = value * 10u + static_cast<std::uint32_t>(ch - '0');
            if (value > 255u) return false;
        }
        octets[octetIdx++] = static_cast<std::uint8_t>(value);
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    if (octetIdx != 4) return false;

    out.v4 = true;
    out.bytes.fill(0);
    for (std::size_t i = 0; i < 4; ++i) out.bytes[i] = octets[i];
    return true;
}

bool tryParseHextet(std::string_view s, std::uint16_t& out) {
    if (s.empty() || s.size() > 4) return false;
    std::uint32_t v = 0;
    for (const char ch : s) {
        std::uint32_t digit = 0;
        if (ch >= '0' && ch <= '9') digit = static_cast<std::uint32_t>(ch - '0');
        else if (ch >= 'a' && ch <= 'f') digit = 10u + static_cast<std::uint32_t>(ch - 'a');
        else if (ch >= 'A' && ch <= 'F') digit = 10u + static_cast<std::uint32_t>(ch - 'A');
        else return false;
        v = (v << 4) | digit;
    }
    out = static_cast<std::uint16_t>(v);
    return true;
}

std::vector<std::string_view> splitOnChar(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    for (;;) {
        const auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

bool parseHextetGroups(const std::vector<std::string_view>& parts, bool allowV4Tail, std::vector<std::uint16_t>& groups) {
    groups.clear();
    for (std::size_t idx = 0; idx < parts.size(); ++idx) {
        const auto part = parts[idx];
        if (part.empty()) return false;
        const bool isLast = (idx + 1 == parts.size());
        if (part.find('.') != std::string_view::npos) {
            if (!allowV4Tail || !isLast) return false;
            ParsedIP ip4{};
            if (!tryParseIPv4(part, ip4)) return false;
            groups.push_back(static_cast<std::uint16_t>((ip4.bytes[0] << 8) | ip4.bytes[1]));
            groups.push_back(static_cast<std::uint16_t>((ip4.bytes[2] << 8) | ip4.bytes[3]));
            continue;
        }
        std::uint16_t g{};
        if (!tryParseHextet(part, g)) return false;
        groups.push_back(g);
    }
    return true;
}

bool tryParseIPv6(std::string_view s, ParsedIP& out) {
    const auto sv = trimWs(s);
    if (sv.empty()) return false;
    if (sv.find('%') != std::string_view::npos) return false; // zone IDs not supported

    const auto dbl = sv.find("::");
    const bool hasDbl = (dbl != std::string_view::npos);
    if (hasDbl && sv.find("::", dbl + 2) != std::string_view::npos) return false;

    const auto head = hasDbl ? sv.substr(0, dbl) : sv;
    const auto tail = hasDbl ? sv.substr(dbl + 2) : std::string_view{};

    std::vector<std::string_view> headParts;
    std::vector<std::string_view> tailParts;
    if (!head.empty()) headParts = splitOnChar(head, ':');
    if (!tail.empty()) tailParts = splitOnChar(tail, ':');

    std::vector<std::uint16_t> headGroups;
    std::vector<std::uint16_t> tailGroups;
    if (!parseHextetGroups(headParts, !hasDbl, headGroups)) return false;
    if (!parseHextetGroups(tailParts, true, tailGroups)) return false;

    const std::size_t total = headGroups.size() + tailGroups.size();
    std::vector<std::uint16_t> all;
    all.reserve(8);
    all.insert(all.end(), headGroups.begin(), headGroups.end());
    if (hasDbl) {
        if (total >= 8) return false; // "::" must compress at least one 0 group
        all.insert(all.end(), 8 - total, 0);
    } else if (total != 8) {
        return false;
    }
    all.insert(all.end(), tailGroups.begin(), tailGroups.end());

    out.v4 = false;
    out.bytes.fill(0);
    for (std::size_t j = 0; j < 8; ++j) {
        out.bytes[j * 2] = static_cast<std::uint8_t>((all[j] >> 8) & 0xFFu);
        out.bytes[j * 2 + 1] = static_cast<std::uint8_t>(all[j] & 0xFFu);
    }
    return true;
}

std::string formatIPv4(const ParsedIP& ip) {
    return std::to_string(ip.bytes[0]) + "." + std::to_string(ip.bytes[1]) + "." + std::to_string(ip.bytes[2]) + "." +
           std::to_string(ip.bytes[3]);
}

std::string hexNoLeading(std::uint16_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%x", static_cast<unsigned>(v));
    return buf;
}

std::string formatIPv6(const ParsedIP& ip) {
    std::array<std::uint16_t, 8> groups{};
    for (std::size_t i = 0; i < 8; ++i) {
        groups[i] = static_cast<std::uint16_t>((ip.bytes[i * 2] << 8) | ip.bytes[i * 2 + 1]);
    }

    // Longest run of two or more zero groups collapses to "::".
    std::size_t bestStart = 0;
    std::size_t bestLen = 0;
    for (std::size_t i = 0; i < 8;) {
        if (groups[i] != 0) {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < 8 && groups[j] == 0) ++j;
        if (j - i >= 2 && j - i > bestLen) {
            bestStart = i;
            bestLen = j - i;
        }
        i = j;
    }

    std::string out;
    for (std::size_t i = 0; i < 8; ++i) {
        if (bestLen >= 2 && i == bestStart) {
            out += "::";
            i += bestLen - 1;
            continue;
        }
        if (!out.empty() && out.back() != ':') out.push_back(':');
        out += hexNoLeading(groups[i]);
    }
    return out.empty() ? "::" : out;
}

} // namespace

bool tryParseBool(std::string_view s, bool& out) {
    const auto t = utils::toLower(trimWs(s));
    if (t == "1" || t == "true" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

namespace {

// Decimal, or hexadecimal behind an explicit 0x. Leading zeros never mean octal.
int integerBase(const std::string& digits) {
    std::size_t i = 0;
    if (i < digits.size() && (digits[i] == '+' || digits[i] == '-')) ++i;
    if (i + 1 < digits.size() && digits[i] == '0' && (digits[i + 1] == 'x' || digits[i + 1] == 'X')) return 16;
    return 10;
}

} // namespace

bool tryParseInt64(std::string_view s, std::int64_t min, std::int64_t max, std::int64_t& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, integerBase(tmp));
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < min || v > max) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

bool tryParseUint64(std::string_view s, std::uint64_t max, std::uint64_t& out) {
    const auto t = trimWs(s);
    if (t.empty() || t.front() == '-') return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, integerBase(tmp));
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v > max) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool tryParseDouble(std::string_view s, double& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

bool tryParseFloat(std::string_view s, float& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const float v = std::strtof(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

std::string formatFloat(float v) {
    char buf[64];
    for (int precision = 6; precision <= 9; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, static_cast<double>(v));
        float back = 0.0f;
        if (tryParseFloat(buf, back) && back == v) break;
    }
    return buf;
}

std::string formatDouble(double v) {
    char buf[64];
    for (int precision = 6; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        double back = 0.0;
        if (tryParseDouble(buf, back) && back == v) break;
    }
    return buf;
}

bool tryParseDuration(std::string_view s, std::chrono::milliseconds& out) {
    const auto sv = trimWs(s);
    if (sv.empty()) return false;

    std::size_t pos = 0;
    int sign = 1;
    if (sv[pos] == '+' || sv[pos] == '-') {
        if (sv[pos] == '-') sign = -1;
        ++pos;
    }
    if (pos >= sv.size()) return false;

    // Go-style: unitless "0" is allowed.
    if (sv.substr(pos) == "0") {
        out = std::chrono::milliseconds(0);
        return true;
    }

    double totalMs = 0.0;
    while (pos < sv.size()) {
        const std::size_t numStart = pos;
        bool seenDigit = false;
        bool seenDot = false;
        for (; pos < sv.size(); ++pos) {
            const char ch = sv[pos];
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                seenDigit = true;
                continue;
            }
            if (ch == '.' && !seenDot) {
                seenDot = true;
                continue;
            }
            break;
        }
        if (!seenDigit) return false;
        const std::size_t numEnd = pos;
        if (pos >= sv.size()) return false; // unit required

        double multiplier = 0.0; // ms
        std::string_view unit;
        const auto rest = sv.substr(pos);
        if (rest.rfind("ns", 0) == 0) {
            unit = "ns";
            multiplier = 0.000001;
        } else if (rest.rfind("us", 0) == 0) {
            unit = "us";
            multiplier = 0.001;
        } else if (rest.rfind("ms", 0) == 0) {
            unit = "ms";
            multiplier = 1.0;
        } else if (rest.rfind("s", 0) == 0) {
            unit = "s";
            multiplier = 1000.0;
        } else if (rest.rfind("m", 0) == 0) {
            unit = "m";
            multiplier = 60.0 * 1000.0;
        } else if (rest.rfind("h", 0) == 0) {
            unit = "h";
            multiplier = 60.0 * 60.0 * 1000.0;
        } else {
            return false;
        }

        double value = 0.0;
        if (!tryParseDouble(sv.substr(numStart, numEnd - numStart), value)) return false;
        totalMs += value * multiplier;
        pos += unit.size();
    }

    totalMs *= static_cast<double>(sign);
    if (totalMs > static_cast<double>(std::numeric_limits<std::int64_t>::max())) return false;
    if (totalMs < static_cast<double>(std::numeric_limits<std::int64_t>::min())) return false;
    const auto asInt = static_cast<std::int64_t>(totalMs >= 0 ? (totalMs + 0.5) : (totalMs - 0.5));
    out = std::chrono::milliseconds(asInt);
    return true;
}

std::string formatDuration(std::chrono::milliseconds d) {
    std::int64_t ms = d.count();
    if (ms == 0) return "0s";
    std::string out;
    if (ms < 0) {
        out.push_back('-');
        ms = -ms;
    }
    const std::int64_t h = ms / 3600000;
    ms %= 3600000;
    const std::int64_t m = ms / 60000;
    ms %= 60000;
    const std::int64_t s = ms / 1000;
    ms %= 1000;
    if (h) out += std::to_string(h) + "h";
    if (m) out += std::to_string(m) + "m";
    if (s) out += std::to_string(s) + "s";
    if (ms) out += std::to_string(ms) + "ms";
    return out;
}

bool tryParseTimeSpan(std::string_view s, std::chrono::milliseconds& out) {
    auto sv = trimWs(s);
    if (sv.empty()) return false;
    bool negative = false;
    if (sv.front() == '-') {
        negative = true;
        sv.remove_prefix(1);
    }

    int days = 0;
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos) {
        // A bare integer is a number of days.
        if (!parseDigits(sv, days)) return false;
        out = std::chrono::milliseconds(static_cast<std::int64_t>(days) * 86400000LL * (negative ? -1 : 1));
        return true;
    }

    const auto dot = sv.find('.');
    if (dot != std::string_view::npos && dot < colon) {
        if (!parseDigits(sv.substr(0, dot), days)) return false;
        sv.remove_prefix(dot + 1);
    }

    const auto parts = splitOnChar(sv, ':');
    if (parts.size() < 2 || parts.size() > 3) return false;

    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    int millis = 0;
    if (!parseDigits(parts[0], hours) || hours > 23) return false;
    if (!parseDigits(parts[1], minutes) || minutes > 59) return false;
    if (parts.size() == 3) {
        auto secPart = parts[2];
        const auto frac = secPart.find('.');
        if (frac != std::string_view::npos) {
            auto fracDigits = secPart.substr(frac + 1);
            if (fracDigits.empty() || fracDigits.size() > 7) return false;
            std::string padded(fracDigits.substr(0, std::min<std::size_t>(3, fracDigits.size())));
            while (padded.size() < 3) padded.push_back('0');
            int extra = 0;
            if (fracDigits.size() > 3 && !parseDigits(fracDigits.substr(3), extra)) return false;
            if (!parseDigits(padded, millis)) return false;
            secPart = secPart.substr(0, frac);
        }
        if (!parseDigits(secPart, seconds) || seconds > 59) return false;
    }

    const std::int64_t total = static_cast<std::int64_t>(days) * 86400000LL + static_cast<std::int64_t>(hours) * 3600000LL +
                               static_cast<std::int64_t>(minutes) * 60000LL + static_cast<std::int64_t>(seconds) * 1000LL + millis;
    out = std::chrono::milliseconds(negative ? -total : total);
    return true;
}

std::string formatTimeSpan(std::chrono::milliseconds d) {
    std::int64_t ms = d.count();
    std::string out;
    if (ms < 0) {
        out.push_back('-');
        ms = -ms;
    }
    const std::int64_t days = ms / 86400000LL;
    ms %= 86400000LL;
    const int h = static_cast<int>(ms / 3600000LL);
    ms %= 3600000LL;
    const int m = static_cast<int>(ms / 60000LL);
    ms %= 60000LL;
    const int s = static_cast<int>(ms / 1000LL);
    ms %= 1000LL;
    if (days) out += std::to_string(days) + ".";
    out += pad2(h) + ":" + pad2(m) + ":" + pad2(s);
    if (ms) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), ".%03d", static_cast<int>(ms));
        out += buf;
    }
    return out;
}

bool tryParseDateTime(std::string_view s, DateTime& out) {
    auto sv = trimWs(s);
    if (sv.size() < 10) return false;
    if (sv[4] != '-' || sv[7] != '-') return false;

    DateTime dt;
    if (!parseDigits(sv.substr(0, 4), dt.year)) return false;
    if (!parseDigits(sv.substr(5, 2), dt.month) || dt.month < 1 || dt.month > 12) return false;
    if (!parseDigits(sv.substr(8, 2), dt.day) || dt.day < 1 || dt.day > daysInMonth(dt.year, dt.month)) return false;

    sv.remove_prefix(10);
    if (!sv.empty()) {
        if (sv.front() != 'T' && sv.front() != 't' && sv.front() != ' ') return false;
        sv.remove_prefix(1);
        if (!sv.empty() && (sv.back() == 'Z' || sv.back() == 'z')) sv.remove_suffix(1);
        const auto parts = splitOnChar(sv, ':');
        if (parts.size() < 2 || parts.size() > 3) return false;
        if (!parseDigits(parts[0], dt.hour) || parts[0].size() != 2 || dt.hour > 23) return false;
        if (!parseDigits(parts[1], dt.minute) || parts[1].size() != 2 || dt.minute > 59) return false;
        if (parts.size() == 3 && (!parseDigits(parts[2], dt.second) || parts[2].size() != 2 || dt.second > 59)) return false;
        dt.hasTime = true;
    }
    out = dt;
    return true;
}

std::string formatDateTime(const DateTime& dt) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", dt.year, dt.month, dt.day);
    std::string out = buf;
    if (dt.hasTime) out += "T" + pad2(dt.hour) + ":" + pad2(dt.minute) + ":" + pad2(dt.second);
    return out;
}

bool tryParseBytes(std::string_view s, std::uint64_t& out) {
    const auto sv = trimWs(s);
    if (sv.empty() || sv.front() == '-') return false;

    // Base-0 integer forms (0x10, 077) need no unit.
    std::uint64_t parsed{};
    if (tryParseUint64(sv, std::numeric_limits<std::uint64_t>::max(), parsed)) {
        out = parsed;
        return true;
    }

    const std::string tmp(sv);
    const char* start = tmp.c_str();
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(start, &end);
    if (errno != 0 || !end || end == start) return false;

    const std::string unit = utils::toLower(trimWs(std::string_view(end)));
    std::uint64_t multiplier = 1;
    if (unit.empty() || unit == "b") {
        multiplier = 1ULL;
    } else if (unit == "k" || unit == "kb" || unit == "ki" || unit == "kib") {
        multiplier = 1ULL << 10;
    } else if (unit == "m" || unit == "mb" || unit == "mi" || unit == "mib") {
        multiplier = 1ULL << 20;
    } else if (unit == "g" || unit == "gb" || unit == "gi" || unit == "gib") {
        multiplier = 1ULL << 30;
    } else if (unit == "t" || unit == "tb" || unit == "ti" || unit == "tib") {
        multiplier = 1ULL << 40;
    } else if (unit == "p" || unit == "pb" || unit == "pi" || unit == "pib") {
        multiplier = 1ULL << 50;
    } else if (unit == "e" || unit == "eb" || unit == "ei" || unit == "eib") {
        multiplier = 1ULL << 60;
    } else {
        return false;
    }

    const long double bytes = static_cast<long double>(value) * static_cast<long double>(multiplier);
    if (!(bytes >= 0.0L)) return false;
    if (bytes > static_cast<long double>(std::numeric_limits<std::uint64_t>::max())) return false;
    out = static_cast<std::uint64_t>(bytes + 0.5L);
    return true;
}

std::string formatBytes(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    std::size_t unit = 0;
    while (unit + 1 < std::size(units) && bytes != 0 && bytes % 1024 == 0) {
        bytes /= 1024;
        ++unit;
    }
    return std::to_string(bytes) + units[unit];
}

bool tryParseIP(std::string_view s, std::string& canonical) {
    ParsedIP ip{};
    if (s.find(':') != std::string_view::npos) {
        if (!tryParseIPv6(s, ip)) return false;
        canonical = formatIPv6(ip);
        return true;
    }
    if (!tryParseIPv4(s, ip)) return false;
    canonical = formatIPv4(ip);
    return true;
}

bool tryParseIPMask(std::string_view s, std::string& canonical) {
    const auto sv = trimWs(s);
    if (sv.find(':') != std::string_view::npos) return false; // IPv4 masks only

    ParsedIP ip{};
    if (!tryParseIPv4(sv, ip)) return false;

    const std::uint32_t mask = (static_cast<std::uint32_t>(ip.bytes[0]) << 24) | (static_cast<std::uint32_t>(ip.bytes[1]) << 16) |
                               (static_cast<std::uint32_t>(ip.bytes[2]) << 8) | static_cast<std::uint32_t>(ip.bytes[3]);
    const std::uint32_t inv = ~mask;
    if ((static_cast<std::uint64_t>(inv) & (static_cast<std::uint64_t>(inv) + 1ULL)) != 0ULL) return false; // requires contiguous bits

    canonical = formatIPv4(ip);
    return true;
}

bool tryParseCIDR(std::string_view s, std::string& canonical) {
    const auto sv = trimWs(s);
    const auto slash = sv.find('/');
    if (slash == std::string_view::npos) return false;

    const auto ipPart = trimWs(sv.substr(0, slash));
    const auto prefixPart = trimWs(sv.substr(slash + 1));
    if (ipPart.empty() || prefixPart.empty()) return false;

    ParsedIP ip{};
    if (ipPart.find(':') != std::string_view::npos) {
        if (!tryParseIPv6(ipPart, ip)) return false;
    } else if (!tryParseIPv4(ipPart, ip)) {
        return false;
    }

    int prefix = 0;
    if (!parseDigits(prefixPart, prefix)) return false;
    const int maxBits = ip.v4 ? 32 : 128;
    if (prefix > maxBits) return false;

    const std::size_t bytesLen = ip.v4 ? 4 : 16;
    for (std::size_t idx = 0; idx < bytesLen; ++idx) {
        const int bits = prefix - static_cast<int>(idx * 8);
        if (bits >= 8) continue;
        if (bits <= 0) {
            ip.bytes[idx] = 0;
            continue;
        }
        const auto mask = static_cast<std::uint8_t>(0xFFu << (8 - bits));
        ip.bytes[idx] = static_cast<std::uint8_t>(ip.bytes[idx] & mask);
    }

    canonical = (ip.v4 ? formatIPv4(ip) : formatIPv6(ip)) + "/" + std::to_string(prefix);
    return true;
}

bool tryParseURL(std::string_view s, std::string& canonical) {
    const auto sv = trimWs(s);
    if (sv.empty()) return false;
    for (const auto ch : sv) {
        if (std::isspace(static_cast<unsigned char>(ch))) return false;
    }

    const std::string text(sv);
    const auto schemeSep = text.find("://");
    if (schemeSep == std::string::npos) return false;

    const std::string_view scheme(text.data(), schemeSep);
    auto isAlpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    if (scheme.empty() || !isAlpha(scheme.front())) return false;
    for (const auto ch : scheme) {
        if (!(isAlpha(ch) || (ch >= '0' && ch <= '9') || ch == '+' || ch == '-' || ch == '.')) return false;
    }

    const std::size_t authorityStart = schemeSep + 3;
    std::size_t authorityEnd = text.find_first_of("/?#", authorityStart);
    if (authorityEnd == std::string::npos) authorityEnd = text.size();

    const std::string_view authority(text.data() + authorityStart, authorityEnd - authorityStart);
    if (authority.empty()) return false;
    const std::string_view rest(text.data() + authorityEnd, text.size() - authorityEnd);

    std::string_view userinfo;
    std::string_view hostport = authority;
    const auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        userinfo = authority.substr(0, at + 1);
        hostport = authority.substr(at + 1);
    }
    if (hostport.empty()) return false;

    std::string host;
    std::string_view portSuffix;
    if (hostport.front() == '[') {
        const auto close = hostport.find(']');
        if (close == std::string_view::npos) return false;
        host = "[" + utils::toLower(hostport.substr(1, close - 1)) + "]";
        portSuffix = hostport.substr(close + 1);
    } else {
        const auto colon = hostport.find(':');
        if (colon != std::string_view::npos && colon == hostport.rfind(':')) {
            const auto portPart = hostport.substr(colon + 1);
            int port = 0;
            if (!parseDigits(portPart, port) || port > 65535) return false;
            host = utils::toLower(hostport.substr(0, colon));
            portSuffix = hostport.substr(colon);
        } else {
            host = utils::toLower(hostport);
        }
    }
    if (host.empty()) return false;

    canonical = utils::toLower(scheme) + "://" + std::string(userinfo) + host + std::string(portSuffix) + std::string(rest);
    return true;
}

bool tryParseUUID(std::string_view s, std::string& canonical) {
    auto sv = trimWs(s);
    if (sv.size() >= 2 && sv.front() == '{' && sv.back() == '}') sv = sv.substr(1, sv.size() - 2);

    std::string hex;
    hex.reserve(32);
    if (sv.size() == 36) {
        for (std::size_t i = 0; i < sv.size(); ++i) {
            const bool dashPos = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dashPos) {
                if (sv[i] != '-') return false;
                continue;
            }
            hex.push_back(sv[i]);
        }
    } else if (sv.size() == 32) {
        hex.assign(sv);
    } else {
        return false;
    }

    for (auto& ch : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(ch))) return false;
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    canonical = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
    return true;
}

} // namespace cmdtree::detail
