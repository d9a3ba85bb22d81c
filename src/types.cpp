#include "cmdtree/types.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <limits>

#include "cmdtree/utils.hpp"
#include "parse_util.hpp"

namespace cmdtree {

namespace {

std::optional<std::string> invalid(std::string_view what) { return "not a valid " + std::string(what); }

template <typename T>
std::optional<std::string> parseSigned(std::string_view token, T& out, const char* what) {
    std::int64_t v{};
    if (!detail::tryParseInt64(token, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), v)) return invalid(what);
    out = static_cast<T>(v);
    return std::nullopt;
}

template <typename T>
std::optional<std::string> parseUnsigned(std::string_view token, T& out, const char* what) {
    std::uint64_t v{};
    if (!detail::tryParseUint64(token, std::numeric_limits<T>::max(), v)) return invalid(what);
    out = static_cast<T>(v);
    return std::nullopt;
}

template <typename T>
std::optional<std::string> parseCanonical(bool (*fn)(std::string_view, std::string&), std::string_view token, T& out, const char* what) {
    std::string canonical;
    if (!fn(token, canonical)) return invalid(what);
    out = std::move(canonical);
    return std::nullopt;
}

std::string identity(const std::string& s) { return s; }

} // namespace

std::optional<std::string> EnumConverter::convert(std::string_view token, Value& out) const {
    const auto fail = [this]() -> std::optional<std::string> { return "expected " + expected(); };

    const auto matchOne = [this](std::string_view segment, std::int64_t& v) {
        if (const auto* m = findMember(segment)) {
            v = m->value;
            return true;
        }
        std::int64_t numeric{};
        if (!detail::tryParseInt64(segment, std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max(), numeric)) {
            return false;
        }
        if (spec_.flags) {
            std::int64_t known = 0;
            for (const auto& member : spec_.members) known |= member.value;
            if ((numeric & ~known) != 0) return false;
            v = numeric;
            return true;
        }
        for (const auto& member : spec_.members) {
            if (member.value == numeric) {
                v = numeric;
                return true;
            }
        }
        return false;
    };

    std::int64_t result = 0;
    if (spec_.flags) {
        const auto segments = utils::splitTrimmed(token, ',');
        if (segments.empty()) return fail();
        for (const auto& segment : segments) {
            std::int64_t v{};
            if (!matchOne(segment, v)) return fail();
            result |= v;
        }
    } else if (!matchOne(utils::trimWs(token), result)) {
        return fail();
    }

    out = Value::of(EnumValue{spec_.name, result});
    return std::nullopt;
}

std::string EnumConverter::format(const Value& value) const {
    const auto* ev = value.as<EnumValue>();
    if (!ev) return {};

    for (const auto& member : spec_.members) {
        if (member.value == ev->value) return member.name;
    }
    if (!spec_.flags) return std::to_string(ev->value);

    std::vector<std::string> names;
    std::int64_t covered = 0;
    for (const auto& member : spec_.members) {
        if (member.value == 0) continue;
        if ((ev->value & member.value) == member.value && (covered & member.value) != member.value) {
            names.push_back(member.name);
            covered |= member.value;
        }
    }
    if (covered != ev->value || names.empty()) return std::to_string(ev->value);
    return utils::join(names, ", ");
}

std::string EnumConverter::expected() const {
    std::vector<std::string> names;
    names.reserve(spec_.members.size());
    for (const auto& member : spec_.members) names.push_back(member.name);
    return std::string(spec_.flags ? "any of: " : "one of: ") + utils::join(names, ", ");
}

const EnumMember* EnumConverter::findMember(std::string_view name) const {
    for (const auto& member : spec_.members) {
        if (utils::iequals(member.name, name)) return &member;
    }
    return nullptr;
}

ConversionRegistry::ConversionRegistry() { registerBuiltins(); }

ConversionRegistry& ConversionRegistry::add(std::shared_ptr<const TypeConverter> converter) {
    if (!converter) return *this;
    converters_[utils::toLower(converter->type())] = std::move(converter);
    return *this;
}

ConversionRegistry& ConversionRegistry::addEnum(EnumSpec spec) {
    return add(std::make_shared<EnumConverter>(std::move(spec)));
}

const TypeConverter* ConversionRegistry::find(std::string_view type) const {
    const auto it = converters_.find(utils::toLower(type));
    return it == converters_.end() ? nullptr : it->second.get();
}

std::optional<std::string> ConversionRegistry::convertOne(const TypeDescriptor& td, std::string_view token, Value& out) const {
    const auto* converter = find(td.type);
    if (!converter) return "no converter registered for type '" + td.type + "'";
    // User converters may throw; the reason becomes a conversion failure.
    try {
        return converter->convert(token, out);
    } catch (const std::exception& ex) {
        return std::string(ex.what());
    }
}

std::optional<std::string> ConversionRegistry::convert(const TypeDescriptor& td,
                                                       const std::vector<std::string>& tokens,
                                                       Value& out) const {
    if (!td.collection) {
        if (tokens.empty()) return std::string("no value");
        return convertOne(td, tokens.back(), out);
    }

    std::vector<Value> items;
    for (const auto& token : tokens) {
        for (const auto& part : utils::splitTrimmed(token, ',')) {
            Value item;
            if (auto err = convertOne(td, part, item)) return err;
            items.push_back(std::move(item));
        }
    }
    out = Value::list(std::move(items));
    return std::nullopt;
}

std::string ConversionRegistry::format(const TypeDescriptor& td, const Value& value) const {
    const auto* converter = find(td.type);
    if (!converter) return {};
    if (!value.isList()) return converter->format(value);

    std::vector<std::string> parts;
    parts.reserve(value.items().size());
    for (const auto& item : value.items()) parts.push_back(converter->format(item));
    return utils::join(parts, ",");
}

std::string ConversionRegistry::describe(const TypeDescriptor& td) const {
    const auto* converter = find(td.type);
    const std::string base = converter ? converter->expected() : td.type;
    return td.collection ? "list of " + base : base;
}

void ConversionRegistry::registerBuiltins() {
    using std::chrono::milliseconds;

    add<bool>(
        types::Bool,
        [](std::string_view t, bool& out) -> std::optional<std::string> {
            if (!detail::tryParseBool(t, out)) return invalid("bool");
            return std::nullopt;
        },
        [](const bool& v) { return std::string(v ? "true" : "false"); });

    add<char>(
        types::Char,
        [](std::string_view t, char& out) -> std::optional<std::string> {
            if (t.size() != 1) return std::string("expected a single character");
            out = t.front();
            return std::nullopt;
        },
        [](const char& v) { return std::string(1, v); });

    add<int>(
        types::Int, [](std::string_view t, int& out) { return parseSigned(t, out, "int"); },
        [](const int& v) { return std::to_string(v); });
    add<std::int64_t>(
        types::Int64, [](std::string_view t, std::int64_t& out) { return parseSigned(t, out, "int64"); },
        [](const std::int64_t& v) { return std::to_string(v); });
    add<std::uint32_t>(
        types::Uint32, [](std::string_view t, std::uint32_t& out) { return parseUnsigned(t, out, "uint32"); },
        [](const std::uint32_t& v) { return std::to_string(v); });
    add<std::uint64_t>(
        types::Uint64, [](std::string_view t, std::uint64_t& out) { return parseUnsigned(t, out, "uint64"); },
        [](const std::uint64_t& v) { return std::to_string(v); });

    add<float>(
        types::Float,
        [](std::string_view t, float& out) -> std::optional<std::string> {
            if (!detail::tryParseFloat(t, out)) return invalid("float");
            return std::nullopt;
        },
        [](const float& v) { return detail::formatFloat(v); });
    add<double>(
        types::Double,
        [](std::string_view t, double& out) -> std::optional<std::string> {
            if (!detail::tryParseDouble(t, out)) return invalid("double");
            return std::nullopt;
        },
        [](const double& v) { return detail::formatDouble(v); });

    add<std::string>(
        types::String,
        [](std::string_view t, std::string& out) -> std::optional<std::string> {
            out.assign(t);
            return std::nullopt;
        },
        identity);

    add<milliseconds>(
        types::Duration,
        [](std::string_view t, milliseconds& out) -> std::optional<std::string> {
            if (!detail::tryParseDuration(t, out)) return invalid("duration");
            return std::nullopt;
        },
        [](const milliseconds& v) { return detail::formatDuration(v); });
    add<milliseconds>(
        types::TimeSpan,
        [](std::string_view t, milliseconds& out) -> std::optional<std::string> {
            if (!detail::tryParseTimeSpan(t, out)) return invalid("timespan");
            return std::nullopt;
        },
        [](const milliseconds& v) { return detail::formatTimeSpan(v); });
    add<DateTime>(
        types::DateTime,
        [](std::string_view t, DateTime& out) -> std::optional<std::string> {
            if (!detail::tryParseDateTime(t, out)) return invalid("datetime");
            return std::nullopt;
        },
        [](const DateTime& v) { return detail::formatDateTime(v); });
    add<std::uint64_t>(
        types::Bytes,
        [](std::string_view t, std::uint64_t& out) -> std::optional<std::string> {
            if (!detail::tryParseBytes(t, out)) return invalid("byte size");
            return std::nullopt;
        },
        [](const std::uint64_t& v) { return detail::formatBytes(v); });

    add<std::string>(
        types::IP, [](std::string_view t, std::string& out) { return parseCanonical(detail::tryParseIP, t, out, "IP address"); },
        identity);
    add<std::string>(
        types::IPMask, [](std::string_view t, std::string& out) { return parseCanonical(detail::tryParseIPMask, t, out, "IP mask"); },
        identity);
    add<std::string>(
        types::CIDR, [](std::string_view t, std::string& out) { return parseCanonical(detail::tryParseCIDR, t, out, "CIDR"); },
        identity);
    add<std::string>(
        types::URL, [](std::string_view t, std::string& out) { return parseCanonical(detail::tryParseURL, t, out, "URL"); },
        identity);
    add<std::string>(
        types::UUID, [](std::string_view t, std::string& out) { return parseCanonical(detail::tryParseUUID, t, out, "UUID"); },
        identity);

    add<std::filesystem::path>(
        types::Path,
        [](std::string_view t, std::filesystem::path& out) -> std::optional<std::string> {
            if (t.empty()) return std::string("empty path");
            out = std::filesystem::path(std::string(t));
            return std::nullopt;
        },
        [](const std::filesystem::path& v) { return v.string(); });
}

} // namespace cmdtree
