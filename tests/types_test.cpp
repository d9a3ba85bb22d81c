#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cmdtree/types.hpp"

using namespace cmdtree;
using std::chrono::milliseconds;

namespace {

enum class Level { Low, Medium, High };
enum class Perm { None = 0, Read = 1, Write = 2, Exec = 4 };

class ConversionTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.addEnum(EnumSpec::of<Level>("level", {{"Low", Level::Low}, {"Medium", Level::Medium}, {"High", Level::High}}));
        registry.addEnum(EnumSpec::of<Perm>(
            "perm", {{"None", Perm::None}, {"Read", Perm::Read}, {"Write", Perm::Write}, {"Exec", Perm::Exec}}, true));
    }

    // Converts one token and returns the formatted result, or "!" + reason on failure.
    std::string roundTrip(const std::string& type, const std::string& token) {
        Value v;
        const auto td = TypeDescriptor::scalar(type);
        if (auto err = registry.convertOne(td, token, v)) return "!" + *err;
        return registry.format(td, v);
    }

    ConversionRegistry registry;
};

} // namespace

TEST_F(ConversionTest, BuiltinsAreRegistered) {
    for (const char* t : {types::Bool, types::Char, types::Int, types::Int64, types::Uint32, types::Uint64, types::Float,
                          types::Double, types::String, types::Duration, types::TimeSpan, types::DateTime, types::Bytes,
                          types::IP, types::IPMask, types::CIDR, types::URL, types::UUID, types::Path}) {
        EXPECT_TRUE(registry.contains(t)) << t;
    }
    EXPECT_TRUE(registry.contains("INT"));
    EXPECT_FALSE(registry.contains("complex"));
}

TEST_F(ConversionTest, Booleans) {
    for (const char* yes : {"true", "TRUE", "1", "on", "yes"}) EXPECT_EQ(roundTrip(types::Bool, yes), "true") << yes;
    for (const char* no : {"false", "0", "off", "No"}) EXPECT_EQ(roundTrip(types::Bool, no), "false") << no;
    EXPECT_EQ(roundTrip(types::Bool, "maybe"), "!not a valid bool");
}

TEST_F(ConversionTest, Integers) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Int), "42", v));
    EXPECT_EQ(v.get<int>(), 42);
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Int), "0x10", v));
    EXPECT_EQ(v.get<int>(), 16);
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Int64), "-9000000000", v));
    EXPECT_EQ(v.get<std::int64_t>(), -9000000000LL);

    EXPECT_EQ(roundTrip(types::Int, "010"), "10");
    EXPECT_EQ(roundTrip(types::Int, "0089"), "89");
    EXPECT_EQ(roundTrip(types::Int, "-007"), "-7");
    EXPECT_EQ(roundTrip(types::Uint64, "0010"), "10");
    EXPECT_EQ(roundTrip(types::Int, "abc"), "!not a valid int");
    EXPECT_EQ(roundTrip(types::Int, "3000000000"), "!not a valid int");
    EXPECT_EQ(roundTrip(types::Uint32, "-1"), "!not a valid uint32");
    EXPECT_EQ(roundTrip(types::Uint64, "18446744073709551615"), "18446744073709551615");
}

TEST_F(ConversionTest, FloatingPoint) {
    EXPECT_EQ(roundTrip(types::Double, "0.1"), "0.1");
    EXPECT_EQ(roundTrip(types::Double, "2.5e3"), "2500");
    EXPECT_EQ(roundTrip(types::Float, "1.5"), "1.5");
    EXPECT_EQ(roundTrip(types::Float, "3.14159"), "3.14159");
    EXPECT_EQ(roundTrip(types::Float, "0.1"), "0.1");
    EXPECT_EQ(roundTrip(types::Double, "1.2.3"), "!not a valid double");
}

TEST_F(ConversionTest, ThrowingConverterReportsReason) {
    registry.add<std::string>("email", [](std::string_view t, std::string& out) -> std::optional<std::string> {
        if (t.find('@') == std::string_view::npos) throw std::invalid_argument("bad email");
        out = std::string(t);
        return std::nullopt;
    });
    EXPECT_EQ(roundTrip("email", "nobody"), "!bad email");
    EXPECT_EQ(roundTrip("email", "a@b.c"), "a@b.c");
}

TEST_F(ConversionTest, CharAndString) {
    EXPECT_EQ(roundTrip(types::Char, "x"), "x");
    EXPECT_EQ(roundTrip(types::Char, "xy"), "!expected a single character");
    EXPECT_EQ(roundTrip(types::String, "hello world"), "hello world");
}

TEST_F(ConversionTest, Durations) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Duration), "1h30m", v));
    EXPECT_EQ(v.get<milliseconds>(), milliseconds(90 * 60 * 1000));
    EXPECT_EQ(roundTrip(types::Duration, "250ms"), "250ms");
    EXPECT_EQ(roundTrip(types::Duration, "90s"), "1m30s");
    EXPECT_EQ(roundTrip(types::Duration, "1.5h"), "1h30m");
    EXPECT_EQ(roundTrip(types::Duration, "0"), "0s");
    EXPECT_EQ(roundTrip(types::Duration, "10"), "!not a valid duration");
    EXPECT_EQ(roundTrip(types::Duration, "5x"), "!not a valid duration");
}

TEST_F(ConversionTest, TimeSpans) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::TimeSpan), "1.02:03:04.5", v));
    EXPECT_EQ(v.get<milliseconds>(), milliseconds(86400000LL + 2 * 3600000LL + 3 * 60000LL + 4000 + 500));
    EXPECT_EQ(roundTrip(types::TimeSpan, "01:30"), "01:30:00");
    EXPECT_EQ(roundTrip(types::TimeSpan, "2"), "2.00:00:00");
    EXPECT_EQ(roundTrip(types::TimeSpan, "-00:00:01"), "-00:00:01");
    EXPECT_EQ(roundTrip(types::TimeSpan, "25:00"), "!not a valid timespan");
}

TEST_F(ConversionTest, DateTimes) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::DateTime), "2024-02-29T13:45", v));
    const auto dt = v.get<DateTime>();
    EXPECT_EQ(dt.year, 2024);
    EXPECT_EQ(dt.month, 2);
    EXPECT_EQ(dt.day, 29);
    EXPECT_EQ(dt.hour, 13);
    EXPECT_TRUE(dt.hasTime);

    EXPECT_EQ(roundTrip(types::DateTime, "2024-01-05"), "2024-01-05");
    EXPECT_EQ(roundTrip(types::DateTime, "2024-01-05 08:09:10Z"), "2024-01-05T08:09:10");
    EXPECT_EQ(roundTrip(types::DateTime, "2023-02-29"), "!not a valid datetime");
    EXPECT_EQ(roundTrip(types::DateTime, "yesterday"), "!not a valid datetime");
}

TEST_F(ConversionTest, ByteSizes) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Bytes), "4KiB", v));
    EXPECT_EQ(v.get<std::uint64_t>(), 4096u);
    EXPECT_EQ(roundTrip(types::Bytes, "512"), "512B");
    EXPECT_EQ(roundTrip(types::Bytes, "1.5k"), "1536B");
    EXPECT_EQ(roundTrip(types::Bytes, "2 MB"), "2MiB");
    EXPECT_EQ(roundTrip(types::Bytes, "1g"), "1GiB");
    EXPECT_EQ(roundTrip(types::Bytes, "-1k"), "!not a valid byte size");
    EXPECT_EQ(roundTrip(types::Bytes, "10 parsecs"), "!not a valid byte size");
}

TEST_F(ConversionTest, NetworkTypesCanonicalize) {
    EXPECT_EQ(roundTrip(types::IP, "192.168.001.010"), "192.168.1.10");
    EXPECT_EQ(roundTrip(types::IP, "2001:0DB8:0000:0000:0000:0000:0000:0001"), "2001:db8::1");
    EXPECT_EQ(roundTrip(types::IP, "::"), "::");
    EXPECT_EQ(roundTrip(types::IP, "256.0.0.1"), "!not a valid IP address");

    EXPECT_EQ(roundTrip(types::IPMask, "255.255.255.0"), "255.255.255.0");
    EXPECT_EQ(roundTrip(types::IPMask, "255.0.255.0"), "!not a valid IP mask");

    EXPECT_EQ(roundTrip(types::CIDR, "10.1.2.3/8"), "10.0.0.0/8");
    EXPECT_EQ(roundTrip(types::CIDR, "2001:db8::1/32"), "2001:db8::/32");
    EXPECT_EQ(roundTrip(types::CIDR, "10.0.0.0/33"), "!not a valid CIDR");

    EXPECT_EQ(roundTrip(types::URL, "HTTPS://Example.COM:8443/Path?q=1"), "https://example.com:8443/Path?q=1");
    EXPECT_EQ(roundTrip(types::URL, "example.com"), "!not a valid URL");

    EXPECT_EQ(roundTrip(types::UUID, "{123E4567-E89B-12D3-A456-426614174000}"), "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_EQ(roundTrip(types::UUID, "123e4567e89b12d3a456426614174000"), "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_EQ(roundTrip(types::UUID, "not-a-uuid"), "!not a valid UUID");
}

TEST_F(ConversionTest, Paths) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Path), "/tmp/out.txt", v));
    EXPECT_EQ(v.get<std::filesystem::path>(), std::filesystem::path("/tmp/out.txt"));
    EXPECT_EQ(roundTrip(types::Path, ""), "!empty path");
}

TEST_F(ConversionTest, EnumsAreCaseInsensitive) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar("level"), "high", v));
    EXPECT_EQ(v.get<EnumValue>().as<Level>(), Level::High);
    EXPECT_EQ(roundTrip("level", "MEDIUM"), "Medium");
    EXPECT_EQ(roundTrip("level", "1"), "Medium");
    EXPECT_EQ(roundTrip("level", "7"), "!expected one of: Low, Medium, High");
    EXPECT_EQ(roundTrip("level", "extreme"), "!expected one of: Low, Medium, High");
}

TEST_F(ConversionTest, FlagEnumsCombineMembers) {
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar("perm"), "read, write", v));
    EXPECT_EQ(v.get<EnumValue>().value, 3);
    EXPECT_EQ(roundTrip("perm", "Read,Exec"), "Read, Exec");
    EXPECT_EQ(roundTrip("perm", "6"), "Write, Exec");
    EXPECT_EQ(roundTrip("perm", "none"), "None");
    EXPECT_EQ(roundTrip("perm", "8"), "!expected any of: None, Read, Write, Exec");
    EXPECT_EQ(roundTrip("perm", "read,delete"), "!expected any of: None, Read, Write, Exec");
}

TEST_F(ConversionTest, CollectionsSplitOnCommas) {
    Value v;
    const auto td = TypeDescriptor::listOf(types::Int);
    ASSERT_FALSE(registry.convert(td, {"1,2", "3"}, v));
    EXPECT_EQ(v.getList<int>(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(registry.format(td, v), "1,2,3");

    const auto err = registry.convert(td, {"1,x"}, v);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "not a valid int");
}

TEST_F(ConversionTest, ScalarsUseLastOccurrence) {
    Value v;
    ASSERT_FALSE(registry.convert(TypeDescriptor::scalar(types::String), {"first", "second"}, v));
    EXPECT_EQ(v.get<std::string>(), "second");
    EXPECT_EQ(registry.convert(TypeDescriptor::scalar(types::String), {}, v), std::optional<std::string>("no value"));
}

TEST_F(ConversionTest, UnknownTypeIsReported) {
    Value v;
    const auto err = registry.convertOne(TypeDescriptor::scalar("color"), "red", v);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "no converter registered for type 'color'");
}

TEST_F(ConversionTest, CustomConverterOverridesBuiltin) {
    registry.add<int>("int", [](std::string_view t, int& out) -> std::optional<std::string> {
        if (t == "answer") {
            out = 42;
            return std::nullopt;
        }
        return std::string("only 'answer' is accepted");
    });
    Value v;
    ASSERT_FALSE(registry.convertOne(TypeDescriptor::scalar(types::Int), "answer", v));
    EXPECT_EQ(v.get<int>(), 42);
    EXPECT_EQ(roundTrip(types::Int, "1"), "!only 'answer' is accepted");
}

TEST_F(ConversionTest, Describe) {
    EXPECT_EQ(registry.describe(TypeDescriptor::scalar(types::Int)), "int");
    EXPECT_EQ(registry.describe(TypeDescriptor::listOf(types::String)), "list of string");
    EXPECT_EQ(registry.describe(TypeDescriptor::scalar("level")), "one of: Low, Medium, High");
}
