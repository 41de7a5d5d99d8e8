#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "plume/util/result.hpp"

#include "plume/escape_wrapper.hpp"
#include "plume/format.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {
namespace {

using namespace std::literals;

struct User final : Object {
    [[nodiscard]]
    Result<Value, Text_Error> representation() const final
    {
        return Value::string(u8"<User>");
    }

    [[nodiscard]]
    Result<Value, Text_Error> get_attribute(std::u8string_view name) const final
    {
        if (name == u8"name") {
            return Value::string(u8"<script>");
        }
        if (name == u8"role") {
            return Value::safe_text(Safe_Text::trusted(u8"<em>admin</em>"));
        }
        return Text_Error::format_key;
    }
};

[[nodiscard]]
std::vector<Wrapped_Argument> wrap_all(std::initializer_list<Value> values)
{
    std::vector<Wrapped_Argument> result;
    for (const Value& v : values) {
        result.push_back(wrap(v));
    }
    return result;
}

/// @brief Formats `format` with percent syntax and returns the result,
/// or the error id if formatting failed.
[[nodiscard]]
Result<std::u8string, Text_Error>
percent(std::u8string_view format, std::initializer_list<Value> args)
{
    const std::vector<Wrapped_Argument> wrapped = wrap_all(args);
    std::u8string out;
    if (auto r = format_percent(out, format, wrapped); !r) {
        return r.error();
    }
    return out;
}

[[nodiscard]]
Result<std::u8string, Text_Error>
braced(std::u8string_view format, std::initializer_list<Value> args)
{
    const std::vector<Wrapped_Argument> wrapped = wrap_all(args);
    std::u8string out;
    if (auto r = format_braced(out, format, wrapped); !r) {
        return r.error();
    }
    return out;
}

[[nodiscard]]
Value str(std::u8string_view text)
{
    return Value::string(text);
}

[[nodiscard]]
Value num(Integer x)
{
    return Value::integer(x);
}

[[nodiscard]]
Value flt(Float x)
{
    return Value::floating(x);
}

constexpr Float inf = std::numeric_limits<Float>::infinity();
constexpr Float nan = std::numeric_limits<Float>::quiet_NaN();

TEST(Format_Percent, strings)
{
    EXPECT_EQ(u8"a b"sv, *percent(u8"%s %s", { str(u8"a"), str(u8"b") }));
    EXPECT_EQ(u8"&lt;i&gt;"sv, *percent(u8"%s", { str(u8"<i>") }));
    EXPECT_EQ(u8"<b>"sv, *percent(u8"%s", { Value::safe_text(Safe_Text::trusted(u8"<b>")) }));
    EXPECT_EQ(u8"True"sv, *percent(u8"%s", { Value::true_ }));
    EXPECT_EQ(u8"100%"sv, *percent(u8"%d%%", { num(100) }));
}

TEST(Format_Percent, width_and_precision)
{
    EXPECT_EQ(u8"   ab|cd   |"sv, *percent(u8"%5s|%-5s|", { str(u8"ab"), str(u8"cd") }));
    EXPECT_EQ(u8"ab"sv, *percent(u8"%.2s", { str(u8"abc") }));
    EXPECT_EQ(u8"   42"sv, *percent(u8"%*d", { num(5), num(42) }));
    EXPECT_EQ(u8"42   |"sv, *percent(u8"%*d|", { num(-5), num(42) }));
    EXPECT_EQ(u8"3.1"sv, *percent(u8"%.*f", { num(1), flt(3.14159) }));
}

TEST(Format_Percent, entities_are_single_characters)
{
    EXPECT_EQ(u8"&lt;&lt;"sv, *percent(u8"%.2s", { str(u8"<<<") }));
    EXPECT_EQ(u8"a&amp;"sv, *percent(u8"%.2s", { str(u8"a&b") }));
    EXPECT_EQ(u8"    &lt;"sv, *percent(u8"%5s", { str(u8"<") }));
}

TEST(Format_Percent, integers)
{
    EXPECT_EQ(u8"42"sv, *percent(u8"%d", { num(42) }));
    EXPECT_EQ(u8"42"sv, *percent(u8"%i", { num(42) }));
    EXPECT_EQ(u8"+5 5| 5"sv, *percent(u8"%+d %d|% d", { num(5), num(5), num(5) }));
    EXPECT_EQ(u8"-0042"sv, *percent(u8"%05d", { num(-42) }));
    EXPECT_EQ(u8"005"sv, *percent(u8"%.3d", { num(5) }));
    EXPECT_EQ(u8"3"sv, *percent(u8"%d", { flt(3.9) }));
    EXPECT_EQ(u8"1"sv, *percent(u8"%d", { Value::true_ }));
    EXPECT_EQ(
        u8"12300000000000000000"sv,
        *percent(u8"%d", { Value::big_integer(Big_Integer("12300000000000000000")) })
    );
}

TEST(Format_Percent, bases)
{
    EXPECT_EQ(u8"ff FF 0xff 0XFF"sv,
              *percent(u8"%x %X %#x %#X", { num(255), num(255), num(255), num(255) }));
    EXPECT_EQ(u8"10 0o10"sv, *percent(u8"%o %#o", { num(8), num(8) }));
    EXPECT_EQ(u8"-ff"sv, *percent(u8"%x", { num(-255) }));
}

TEST(Format_Percent, floats)
{
    EXPECT_EQ(u8"3.14"sv, *percent(u8"%.2f", { flt(3.14159) }));
    EXPECT_EQ(u8"10.0"sv, *percent(u8"%.1f", { num(10) }));
    EXPECT_EQ(u8"1.234568e+04"sv, *percent(u8"%e", { flt(12345.678) }));
    EXPECT_EQ(u8"1.234568E+04"sv, *percent(u8"%E", { flt(12345.678) }));
    EXPECT_EQ(u8"0.0001 1e-05"sv, *percent(u8"%g %g", { flt(0.0001), flt(0.00001) }));
    EXPECT_EQ(u8"inf -inf nan"sv,
              *percent(u8"%f %f %f", { flt(inf), flt(-inf), flt(nan) }));
    EXPECT_EQ(u8"  inf"sv, *percent(u8"%05f", { flt(inf) }));
}

TEST(Format_Percent, characters)
{
    EXPECT_EQ(u8"A"sv, *percent(u8"%c", { num(65) }));
    EXPECT_EQ(u8"&lt;"sv, *percent(u8"%c", { num(0x3c) }));
    EXPECT_EQ(u8"&lt;"sv, *percent(u8"%c", { str(u8"<") }));
    EXPECT_EQ(Text_Error::format_argument_type, percent(u8"%c", { str(u8"ab") }).error());
    EXPECT_EQ(Text_Error::format_argument_type, percent(u8"%c", { num(-1) }).error());
}

TEST(Format_Percent, representations)
{
    EXPECT_EQ(u8"'&lt;b&gt;'"sv, *percent(u8"%r", { str(u8"<b>") }));
    EXPECT_EQ(u8"'\\xe4'"sv, *percent(u8"%a", { str(u8"ä") }));
    EXPECT_EQ(u8"&lt;User&gt;"sv, *percent(u8"%r", { Value::object(std::make_shared<User>()) }));
    EXPECT_EQ(u8"42"sv, *percent(u8"%r", { num(42) }));
}

TEST(Format_Percent, length_modifiers_are_ignored)
{
    EXPECT_EQ(u8"7"sv, *percent(u8"%ld", { num(7) }));
    EXPECT_EQ(u8"7"sv, *percent(u8"%hd", { num(7) }));
}

TEST(Format_Percent, errors)
{
    EXPECT_EQ(Text_Error::format_syntax, percent(u8"%", {}).error());
    EXPECT_EQ(Text_Error::format_syntax, percent(u8"%y", { num(1) }).error());
    EXPECT_EQ(Text_Error::format_arity, percent(u8"%s %s", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_arity, percent(u8"%s", { str(u8"a"), str(u8"b") }).error());
    EXPECT_EQ(Text_Error::format_argument_type, percent(u8"%d", { str(u8"x") }).error());
    EXPECT_EQ(Text_Error::format_argument_type, percent(u8"%x", { flt(1.5) }).error());
    EXPECT_EQ(Text_Error::format_argument_type, percent(u8"%*d", { flt(1.5), num(1) }).error());
    EXPECT_EQ(Text_Error::format_argument_type, percent(u8"%(a)s", { num(1) }).error());
    EXPECT_EQ(Text_Error::format_specifier, percent(u8"%.999f", { flt(1) }).error());
}

TEST(Format_Percent, failure_leaves_output_unchanged)
{
    const std::vector<Wrapped_Argument> args = wrap_all({ str(u8"a"), str(u8"b") });
    std::u8string out = u8"abc";
    EXPECT_FALSE(format_percent(out, u8"%s %d", args));
    EXPECT_EQ(u8"abc"sv, out);
}

TEST(Format_Percent, mapping)
{
    const Wrapped_Argument mapping = wrap(Value::dict({
        { u8"name", str(u8"<x>") },
        { u8"count", num(3) },
    }));
    std::u8string out;
    ASSERT_TRUE(format_percent(out, u8"%(name)s has %(count)03d", {}, &mapping));
    EXPECT_EQ(u8"&lt;x&gt; has 003"sv, out);

    out.clear();
    EXPECT_EQ(Text_Error::format_key, format_percent(out, u8"%(nope)s", {}, &mapping).error());
    EXPECT_EQ(Text_Error::format_syntax, format_percent(out, u8"%(name", {}, &mapping).error());
}

TEST(Format_Percent, named)
{
    const std::vector<Named_Argument> named {
        { .name = u8"a", .value = Wrapped_Argument { Safe_Text::trusted(u8"<b>") } },
        { .name = u8"b", .value = Wrapped_Argument::integer(1) },
        { .name = u8"b", .value = Wrapped_Argument::integer(2) },
    };
    std::u8string out;
    ASSERT_TRUE(format_percent(out, u8"%(a)s %(b)d", named));
    EXPECT_EQ(u8"<b> 2"sv, out);

    out.clear();
    EXPECT_EQ(Text_Error::format_key, format_percent(out, u8"%(c)s", named).error());
    EXPECT_EQ(Text_Error::format_arity, format_percent(out, u8"%s", named).error());
}

TEST(Format_Braced, numbering)
{
    EXPECT_EQ(u8"a b"sv, *braced(u8"{} {}", { str(u8"a"), str(u8"b") }));
    EXPECT_EQ(u8"ba"sv, *braced(u8"{1}{0}", { str(u8"a"), str(u8"b") }));
    EXPECT_EQ(u8"aa"sv, *braced(u8"{0}{0}", { str(u8"a") }));
    EXPECT_EQ(Text_Error::format_numbering, braced(u8"{}{0}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_numbering, braced(u8"{0}{}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_arity, braced(u8"{}", {}).error());
    EXPECT_EQ(Text_Error::format_arity, braced(u8"{3}", { str(u8"a") }).error());
}

TEST(Format_Braced, literal_braces)
{
    EXPECT_EQ(u8"{x}"sv, *braced(u8"{{{}}}", { str(u8"x") }));
    EXPECT_EQ(Text_Error::format_syntax, braced(u8"}", {}).error());
    EXPECT_EQ(Text_Error::format_syntax, braced(u8"{", {}).error());
    EXPECT_EQ(Text_Error::format_syntax, braced(u8"{0", { str(u8"a") }).error());
}

TEST(Format_Braced, escaping)
{
    EXPECT_EQ(u8"<b>&lt;i&gt;</b>"sv, *braced(u8"<b>{}</b>", { str(u8"<i>") }));
    EXPECT_EQ(u8"'&lt;b&gt;'"sv, *braced(u8"{!r}", { str(u8"<b>") }));
    EXPECT_EQ(u8"&lt;b&gt;"sv, *braced(u8"{!s}", { str(u8"<b>") }));
    EXPECT_EQ(u8"'\\xe4'"sv, *braced(u8"{!a}", { str(u8"ä") }));
}

TEST(Format_Braced, text_alignment)
{
    EXPECT_EQ(u8"   ab"sv, *braced(u8"{:>5}", { str(u8"ab") }));
    EXPECT_EQ(u8"ab   "sv, *braced(u8"{:5}", { str(u8"ab") }));
    EXPECT_EQ(u8"**ab**"sv, *braced(u8"{:*^6}", { str(u8"ab") }));
    EXPECT_EQ(u8"ab  |"sv, *braced(u8"{:<4}|", { str(u8"ab") }));
    EXPECT_EQ(u8"&lt;&lt;"sv, *braced(u8"{:.2}", { str(u8"<<<") }));
    EXPECT_EQ(u8"  &amp;"sv, *braced(u8"{:>3}", { str(u8"&") }));
}

TEST(Format_Braced, nested_spec)
{
    const std::vector<Wrapped_Argument> positional = wrap_all({ str(u8"ab") });
    const std::vector<Named_Argument> named {
        { .name = u8"w", .value = Wrapped_Argument::integer(5) },
    };
    std::u8string out;
    ASSERT_TRUE(format_braced(out, u8"{0:>{w}}", positional, named));
    EXPECT_EQ(u8"   ab"sv, out);

    out.clear();
    EXPECT_EQ(
        Text_Error::format_specifier,
        format_braced(out, u8"{0:{w:{w}}}", positional, named).error()
    );
}

TEST(Format_Braced, integers)
{
    EXPECT_EQ(u8"42"sv, *braced(u8"{:d}", { num(42) }));
    EXPECT_EQ(u8"+42"sv, *braced(u8"{:+d}", { num(42) }));
    EXPECT_EQ(u8"   42"sv, *braced(u8"{:5}", { num(42) }));
    EXPECT_EQ(u8"-0042"sv, *braced(u8"{:05}", { num(-42) }));
    EXPECT_EQ(u8"1,234,567"sv, *braced(u8"{:,}", { num(1234567) }));
    EXPECT_EQ(u8"dead_beef"sv, *braced(u8"{:_x}", { num(0xdeadbeef) }));
    EXPECT_EQ(u8"0b101"sv, *braced(u8"{:#b}", { num(5) }));
    EXPECT_EQ(u8"0o17 0XFF"sv, *braced(u8"{:#o} {:#X}", { num(15), num(255) }));
    EXPECT_EQ(u8"1"sv, *braced(u8"{:d}", { Value::true_ }));
    EXPECT_EQ(u8"True"sv, *braced(u8"{}", { Value::true_ }));
}

TEST(Format_Braced, floats)
{
    EXPECT_EQ(u8"1.0"sv, *braced(u8"{}", { flt(1.0) }));
    EXPECT_EQ(u8"3.14"sv, *braced(u8"{:.3}", { flt(3.14159) }));
    EXPECT_EQ(u8"1.23e+03"sv, *braced(u8"{:.3}", { flt(1234.5) }));
    EXPECT_EQ(u8"-003.142"sv, *braced(u8"{:08.3f}", { flt(-3.14159) }));
    EXPECT_EQ(u8"25.6%"sv, *braced(u8"{:.1%}", { flt(0.256) }));
    EXPECT_EQ(u8"0.000000e+00"sv, *braced(u8"{:e}", { flt(0.0) }));
    EXPECT_EQ(u8"1,234.5"sv, *braced(u8"{:,}", { flt(1234.5) }));
    EXPECT_EQ(u8"2.00"sv, *braced(u8"{:.2f}", { num(2) }));
}

TEST(Format_Braced, negative_zero)
{
    EXPECT_EQ(u8"-0.0"sv, *braced(u8"{:.1f}", { flt(-0.01) }));
    EXPECT_EQ(u8"0.0"sv, *braced(u8"{:z.1f}", { flt(-0.01) }));
    EXPECT_EQ(u8"-0.1"sv, *braced(u8"{:z.1f}", { flt(-0.1) }));
    EXPECT_EQ(u8"-inf"sv, *braced(u8"{:zf}", { flt(-inf) }));
}

TEST(Format_Braced, characters)
{
    EXPECT_EQ(u8"A"sv, *braced(u8"{:c}", { num(65) }));
    EXPECT_EQ(u8"&lt;"sv, *braced(u8"{:c}", { num(0x3c) }));
    EXPECT_EQ(u8"  A"sv, *braced(u8"{:3c}", { num(65) }));
}

TEST(Format_Braced, access)
{
    const Value user = Value::object(std::make_shared<User>());
    EXPECT_EQ(u8"&lt;script&gt;"sv, *braced(u8"{0.name}", { user }));
    EXPECT_EQ(u8"<em>admin</em>"sv, *braced(u8"{0.role}", { user }));
    EXPECT_EQ(Text_Error::format_key, braced(u8"{0.age}", { user }).error());

    const Value list = Value::list({ str(u8"a"), str(u8"<b>") });
    EXPECT_EQ(u8"&lt;b&gt;"sv, *braced(u8"{0[1]}", { list }));
    EXPECT_EQ(Text_Error::format_key, braced(u8"{0[2]}", { list }).error());

    const Value dict = Value::dict({ { u8"key", str(u8"&") } });
    EXPECT_EQ(u8"&amp;"sv, *braced(u8"{0[key]}", { dict }));
    EXPECT_EQ(Text_Error::format_key, braced(u8"{0[nope]}", { dict }).error());

    EXPECT_EQ(Text_Error::format_key, braced(u8"{0.upper}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_argument_type, braced(u8"{0[0]}", { num(1) }).error());
}

TEST(Format_Braced, named)
{
    const std::vector<Named_Argument> named {
        { .name = u8"a", .value = wrap(str(u8"foo&")) },
        { .name = u8"b", .value = wrap(Value::safe_text(Safe_Text::trusted(u8"bar&"))) },
    };
    std::u8string out;
    ASSERT_TRUE(format_braced(out, u8"{a} {b}", {}, named));
    EXPECT_EQ(u8"foo&amp; bar&"sv, out);

    out.clear();
    EXPECT_EQ(Text_Error::format_key, format_braced(out, u8"{c}", {}, named).error());
}

TEST(Format_Braced, spec_errors)
{
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{!x}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:q}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:d}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:+}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:=5}", { str(u8"a") }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:.2d}", { num(1) }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:,x}", { num(1) }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:d}", { flt(1.5) }).error());
    EXPECT_EQ(Text_Error::format_specifier, braced(u8"{:.999}", { flt(1.5) }).error());
}

TEST(Format_Braced, failure_leaves_output_unchanged)
{
    const std::vector<Wrapped_Argument> args = wrap_all({ str(u8"a") });
    std::u8string out = u8"abc";
    EXPECT_FALSE(format_braced(out, u8"{} {}", args));
    EXPECT_EQ(u8"abc"sv, out);
}

} // namespace
} // namespace plume
