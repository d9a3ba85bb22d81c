#ifndef CMDTREE_VALUE_HPP
#define CMDTREE_VALUE_HPP

#include <any>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cmdtree {

// Result of converting an enum token. `value` is the OR of all matched members for flag enums.
struct EnumValue {
    std::string type;
    std::int64_t value{0};

    template <typename E>
    [[nodiscard]] E as() const {
        static_assert(std::is_enum_v<E>, "enum type required");
        return static_cast<E>(value);
    }

    bool operator==(const EnumValue& o) const { return type == o.type && value == o.value; }
    bool operator!=(const EnumValue& o) const { return !(*this == o); }
};

// A converted parameter value: a scalar held by type, or a list of scalars.
class Value {
public:
    Value() = default;

    template <typename T>
    static Value of(T v) {
        static_assert(!std::is_same_v<std::decay_t<T>, Value>, "nested Value");
        Value out;
        out.data_ = std::move(v);
        return out;
    }

    static Value list(std::vector<Value> items) {
        Value out;
        out.isList_ = true;
        out.items_ = std::move(items);
        return out;
    }

    [[nodiscard]] bool empty() const { return !isList_ && !data_.has_value(); }
    [[nodiscard]] bool isList() const { return isList_; }
    [[nodiscard]] const std::vector<Value>& items() const { return items_; }
    [[nodiscard]] const std::any& raw() const { return data_; }

    template <typename T>
    [[nodiscard]] const T* as() const {
        return std::any_cast<T>(&data_);
    }

    template <typename T>
    [[nodiscard]] bool holds() const {
        return as<T>() != nullptr;
    }

    // Throws std::bad_any_cast when the held type differs.
    template <typename T>
    [[nodiscard]] T get() const {
        return std::any_cast<T>(data_);
    }

    template <typename T>
    [[nodiscard]] std::vector<T> getList() const {
        std::vector<T> out;
        if (!isList_) {
            if (data_.has_value()) out.push_back(std::any_cast<T>(data_));
            return out;
        }
        out.reserve(items_.size());
        for (const auto& v : items_) out.push_back(v.get<T>());
        return out;
    }

private:
    std::any data_;
    std::vector<Value> items_;
    bool isList_{false};
};

// Where a bound value came from, highest precedence first.
enum class ValueSource {
    CommandLine,
    Environment,
    Prompt,
    Default,
};

inline const char* sourceName(ValueSource s) {
    switch (s) {
        case ValueSource::CommandLine: return "command line";
        case ValueSource::Environment: return "environment";
        case ValueSource::Prompt: return "prompt";
        case ValueSource::Default: return "default";
    }
    return "default";
}

class ParameterValues {
public:
    struct Entry {
        Value value;
        ValueSource source{ValueSource::Default};
        std::vector<std::string> raw;
    };

    void set(std::string name, Value value, ValueSource source, std::vector<std::string> raw = {}) {
        entries_[std::move(name)] = Entry{std::move(value), source, std::move(raw)};
    }

    [[nodiscard]] bool has(const std::string& name) const { return entries_.find(name) != entries_.end(); }

    [[nodiscard]] const Entry* find(const std::string& name) const {
        const auto it = entries_.find(name);
        return it == entries_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] std::optional<ValueSource> source(const std::string& name) const {
        const auto* e = find(name);
        if (!e) return std::nullopt;
        return e->source;
    }

    [[nodiscard]] const Value& value(const std::string& name) const {
        const auto* e = find(name);
        if (!e) throw std::out_of_range("no value bound for parameter '" + name + "'");
        return e->value;
    }

    template <typename T>
    [[nodiscard]] T get(const std::string& name) const {
        return value(name).get<T>();
    }

    template <typename T>
    [[nodiscard]] T getOr(const std::string& name, T fallback) const {
        const auto* e = find(name);
        if (!e) return fallback;
        if (const auto* v = e->value.as<T>()) return *v;
        return fallback;
    }

    template <typename T>
    [[nodiscard]] std::vector<T> getList(const std::string& name) const {
        const auto* e = find(name);
        if (!e) return {};
        return e->value.getList<T>();
    }

    template <typename E>
    [[nodiscard]] E getEnum(const std::string& name) const {
        return get<EnumValue>(name).as<E>();
    }

    [[nodiscard]] const std::map<std::string, Entry>& entries() const { return entries_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, Entry> entries_;
};

} // namespace cmdtree

#endif // CMDTREE_VALUE_HPP
