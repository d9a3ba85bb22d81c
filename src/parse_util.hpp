#ifndef CMDTREE_SRC_PARSE_UTIL_HPP
#define CMDTREE_SRC_PARSE_UTIL_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "cmdtree/types.hpp"

namespace cmdtree::detail {

bool tryParseBool(std::string_view s, bool& out);
bool tryParseInt64(std::string_view s, std::int64_t min, std::int64_t max, std::int64_t& out);
bool tryParseUint64(std::string_view s, std::uint64_t max, std::uint64_t& out);
bool tryParseDouble(std::string_view s, double& out);
bool tryParseFloat(std::string_view s, float& out);

bool tryParseDuration(std::string_view s, std::chrono::milliseconds& out);
std::string formatDuration(std::chrono::milliseconds d);

bool tryParseTimeSpan(std::string_view s, std::chrono::milliseconds& out);
std::string formatTimeSpan(std::chrono::milliseconds d);

bool tryParseDateTime(std::string_view s, DateTime& out);
std::string formatDateTime(const DateTime& dt);

bool tryParseBytes(std::string_view s, std::uint64_t& out);
std::string formatBytes(std::uint64_t bytes);

bool tryParseIP(std::string_view s, std::string& canonical);
bool tryParseIPMask(std::string_view s, std::string& canonical);
bool tryParseCIDR(std::string_view s, std::string& canonical);
bool tryParseURL(std::string_view s, std::string& canonical);
bool tryParseUUID(std::string_view s, std::string& canonical);

std::string formatFloat(float v);
std::string formatDouble(double v);

} // namespace cmdtree::detail

#endif // CMDTREE_SRC_PARSE_UTIL_HPP
