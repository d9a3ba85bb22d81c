#ifndef CMDTREE_TYPES_HPP
#define CMDTREE_TYPES_HPP

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "value.hpp"

namespace cmdtree {

// Names of the converters every registry starts with.
namespace types {
inline constexpr const char* Bool = "bool";
inline constexpr const char* Char = "char";
inline constexpr const char* Int = "int";
inline constexpr const char* Int64 = "int64";
inline constexpr const char* Uint32 = "uint32";
inline constexpr const char* Uint64 = "uint64";
inline constexpr const char* Float = "float";
inline constexpr const char* Double = "double";
inline constexpr const char* String = "string";
inline constexpr const char* Duration = "duration";   // Go-style: 1h30m, 250ms
inline constexpr const char* TimeSpan = "timespan";   // [d.]hh:mm[:ss[.fff]]
inline constexpr const char* DateTime = "datetime";   // YYYY-MM-DD[THH:MM[:SS]]
inline constexpr const char* Bytes = "bytes";         // 512, 4KiB, 1.5G
inline constexpr const char* IP = "ip";
inline constexpr const char* IPMask = "ipmask";
inline constexpr const char* CIDR = "cidr";
inline constexpr const char* URL = "url";
inline constexpr const char* UUID = "uuid";
inline constexpr const char* Path = "path";
} // namespace types

// Calendar value produced by the "datetime" converter.
struct DateTime {
    int year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
    bool hasTime{false};

    bool operator==(const DateTime& o) const {
        return year == o.year && month == o.month && day == o.day && hour == o.hour && minute == o.minute &&
               second == o.second && hasTime == o.hasTime;
    }
    bool operator!=(const DateTime& o) const { return !(*this == o); }
};

struct TypeDescriptor {
    std::string type{types::String};
    bool collection{false};

    static TypeDescriptor scalar(std::string t) { return TypeDescriptor{std::move(t), false}; }
    static TypeDescriptor listOf(std::string t) { return TypeDescriptor{std::move(t), true}; }

    [[nodiscard]] bool isBool() const { return !collection && type == types::Bool; }
};

struct EnumMember {
    std::string name;
    std::int64_t value{0};
};

struct EnumSpec {
    std::string name;
    std::vector<EnumMember> members;
    bool flags{false};

    template <typename E>
    static EnumSpec of(std::string name, std::initializer_list<std::pair<const char*, E>> members, bool flags = false) {
        static_assert(std::is_enum_v<E>, "enum type required");
        EnumSpec spec;
        spec.name = std::move(name);
        spec.flags = flags;
        for (const auto& [n, v] : members) spec.members.push_back({n, static_cast<std::int64_t>(v)});
        return spec;
    }
};

// Converts one string token into a Value and formats it back.
class TypeConverter {
public:
    virtual ~TypeConverter() = default;

    [[nodiscard]] virtual std::string type() const = 0;
    // Returns a reason on failure; empty optional indicates success.
    [[nodiscard]] virtual std::optional<std::string> convert(std::string_view token, Value& out) const = 0;
    [[nodiscard]] virtual std::string format(const Value& value) const = 0;
    // Human-readable form shown in diagnostics ("int", "one of: Low, High").
    [[nodiscard]] virtual std::string expected() const { return type(); }
};

template <typename T>
class FunctionConverter final : public TypeConverter {
public:
    using ParseFunc = std::function<std::optional<std::string>(std::string_view, T&)>;
    using FormatFunc = std::function<std::string(const T&)>;

    FunctionConverter(std::string type, ParseFunc parse, FormatFunc format)
        : type_(std::move(type)), parse_(std::move(parse)), format_(std::move(format)) {}

    [[nodiscard]] std::string type() const override { return type_; }

    [[nodiscard]] std::optional<std::string> convert(std::string_view token, Value& out) const override {
        T parsed{};
        if (auto err = parse_(token, parsed)) return err;
        out = Value::of<T>(std::move(parsed));
        return std::nullopt;
    }

    [[nodiscard]] std::string format(const Value& value) const override {
        const auto* v = value.as<T>();
        if (!v || !format_) return {};
        return format_(*v);
    }

private:
    std::string type_;
    ParseFunc parse_;
    FormatFunc format_;
};

class EnumConverter final : public TypeConverter {
public:
    explicit EnumConverter(EnumSpec spec) : spec_(std::move(spec)) {}

    [[nodiscard]] std::string type() const override { return spec_.name; }
    [[nodiscard]] std::optional<std::string> convert(std::string_view token, Value& out) const override;
    [[nodiscard]] std::string format(const Value& value) const override;
    [[nodiscard]] std::string expected() const override;

    [[nodiscard]] const EnumSpec& spec() const { return spec_; }

private:
    const EnumMember* findMember(std::string_view name) const;

    EnumSpec spec_;
};

class ConversionRegistry {
public:
    // Starts with every converter named in cmdtree::types.
    ConversionRegistry();

    ConversionRegistry& add(std::shared_ptr<const TypeConverter> converter);

    template <typename T>
    ConversionRegistry& add(std::string type,
                            typename FunctionConverter<T>::ParseFunc parse,
                            typename FunctionConverter<T>::FormatFunc format = {}) {
        return add(std::make_shared<FunctionConverter<T>>(std::move(type), std::move(parse), std::move(format)));
    }

    ConversionRegistry& addEnum(EnumSpec spec);

    [[nodiscard]] const TypeConverter* find(std::string_view type) const;
    [[nodiscard]] bool contains(std::string_view type) const { return find(type) != nullptr; }

    // Converts the raw occurrences of one parameter. Collections split each occurrence on commas
    // and convert element-wise; scalars convert the last occurrence.
    [[nodiscard]] std::optional<std::string> convert(const TypeDescriptor& td,
                                                     const std::vector<std::string>& tokens,
                                                     Value& out) const;

    [[nodiscard]] std::optional<std::string> convertOne(const TypeDescriptor& td, std::string_view token, Value& out) const;

    [[nodiscard]] std::string format(const TypeDescriptor& td, const Value& value) const;
    [[nodiscard]] std::string describe(const TypeDescriptor& td) const;

private:
    void registerBuiltins();

    std::unordered_map<std::string, std::shared_ptr<const TypeConverter>> converters_;
};

} // namespace cmdtree

#endif // CMDTREE_TYPES_HPP
