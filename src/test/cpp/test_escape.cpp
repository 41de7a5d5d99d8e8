#include <memory>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "plume/util/result.hpp"

#include "plume/escape.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {
namespace {

using namespace std::literals;

struct Failing_Object final : Object {
    [[nodiscard]]
    Result<Value, Text_Error> representation() const final
    {
        return Text_Error::format_key;
    }
};

struct Number_Object final : Object {
    [[nodiscard]]
    Result<Value, Text_Error> representation() const final
    {
        return Value::integer(5);
    }
};

struct Point final : Object {
    [[nodiscard]]
    Result<Value, Text_Error> representation() const final
    {
        return Value::string(u8"Point(1, 2)");
    }

    [[nodiscard]]
    Result<Value, Text_Error> to_text() const final
    {
        return Value::string(u8"<1, 2>");
    }
};

TEST(Escape, markup_characters)
{
    EXPECT_EQ(u8"&amp;&lt;&gt;&quot;"sv, escape(u8"&<>\""sv));
    EXPECT_EQ(u8"a &amp; b"sv, escape(u8"a & b"sv));
    EXPECT_EQ(u8"&lt;script&gt;"sv, escape(u8"<script>"sv));
}

TEST(Escape, apostrophe_is_kept)
{
    EXPECT_EQ(u8"don't"sv, escape(u8"don't"sv));
}

TEST(Escape, nothing_to_escape)
{
    EXPECT_EQ(u8""sv, escape(u8""sv));
    EXPECT_EQ(u8"plain text"sv, escape(u8"plain text"sv));
    EXPECT_EQ(u8"\u00e4\u00f6\u00fc \U0001F600"sv, escape(u8"\u00e4\u00f6\u00fc \U0001F600"sv));
}

TEST(Escape, is_not_idempotent)
{
    EXPECT_EQ(u8"&amp;amp;"sv, escape(escape(u8"&"sv)));
}

TEST(Escape, wide_strings)
{
    EXPECT_EQ(u"&lt;b&gt;"sv, escape(u"<b>"sv));
    EXPECT_EQ(U"&quot;x&quot;"sv, escape(U"\"x\""sv));
}

TEST(Escape, value)
{
    EXPECT_EQ(u8"&lt;i&gt;"sv, escape(Value::string(u8"<i>")));
    EXPECT_EQ(Text_Error::input_type, escape(Value::integer(1)).error());
    EXPECT_EQ(Text_Error::input_type, escape(Value::null).error());
    EXPECT_EQ(
        Text_Error::input_type, escape(Value::safe_text(Safe_Text::trusted(u8"&amp;"))).error()
    );
}

TEST(Escape, append_escaped)
{
    std::u8string out = u8"x";
    append_escaped(out, u8"a<b>c&"sv);
    EXPECT_EQ(u8"xa&lt;b&gt;c&amp;"sv, out);

    append_escaped(out, u8""sv);
    EXPECT_EQ(u8"xa&lt;b&gt;c&amp;"sv, out);
}

TEST(Stringify, scalars)
{
    EXPECT_EQ(u8"None"sv, *stringify(Value::null));
    EXPECT_EQ(u8"True"sv, *stringify(Value::true_));
    EXPECT_EQ(u8"False"sv, *stringify(Value::false_));
    EXPECT_EQ(u8"-123"sv, *stringify(Value::integer(-123)));
    EXPECT_EQ(
        u8"12300000000000000000"sv,
        *stringify(Value::big_integer(Big_Integer("12300000000000000000")))
    );
    EXPECT_EQ(u8"1.5"sv, *stringify(Value::floating(1.5)));
    EXPECT_EQ(u8"10.0"sv, *stringify(Value::floating(10.0)));
    EXPECT_EQ(u8"1e+16"sv, *stringify(Value::floating(1e16)));
}

TEST(Stringify, text)
{
    EXPECT_EQ(u8"<b>"sv, *stringify(Value::string(u8"<b>")));
    EXPECT_EQ(u8"&amp;"sv, *stringify(Value::safe_text(Safe_Text::trusted(u8"&amp;"))));
}

TEST(Stringify, containers)
{
    const Value list = Value::list({ Value::integer(1), Value::string(u8"x"), Value::null });
    EXPECT_EQ(u8"[1, 'x', None]"sv, *stringify(list));

    const Value dict = Value::dict({ { u8"a", Value::string(u8"foo&") } });
    EXPECT_EQ(u8"{'a': 'foo&'}"sv, *stringify(dict));
}

TEST(Stringify, objects)
{
    EXPECT_EQ(u8"<1, 2>"sv, *stringify(Value::object(std::make_shared<Point>())));
    EXPECT_EQ(
        Text_Error::conversion, stringify(Value::object(std::make_shared<Failing_Object>())).error()
    );
    EXPECT_EQ(
        Text_Error::conversion, stringify(Value::object(std::make_shared<Number_Object>())).error()
    );
}

TEST(Stringify, failure_appends_nothing)
{
    std::u8string out = u8"abc";
    const Value list = Value::list({ Value::integer(1),
                                     Value::object(std::make_shared<Failing_Object>()) });
    EXPECT_FALSE(append_stringified(out, list));
    EXPECT_EQ(u8"abc"sv, out);
}

TEST(Representation, strings)
{
    EXPECT_EQ(u8"'abc'"sv, *representation(Value::string(u8"abc")));
    EXPECT_EQ(u8"\"it's\""sv, *representation(Value::string(u8"it's")));
    EXPECT_EQ(u8"'\\'\"'"sv, *representation(Value::string(u8"'\"")));
    EXPECT_EQ(u8"'a\\nb\\tc\\\\'"sv, *representation(Value::string(u8"a\nb\tc\\")));
    EXPECT_EQ(u8"'\\x00\\x7f'"sv, *representation(Value::string(u8"\0\x7f"sv)));
}

TEST(Representation, non_ascii)
{
    const Value text = Value::string(u8"\u00e4\u20ac\U0001F600");
    EXPECT_EQ(u8"'\u00e4\u20ac\U0001F600'"sv, *representation(text));
    EXPECT_EQ(u8"'\\xe4\\u20ac\\U0001f600'"sv, *representation(text, true));
}

TEST(Representation, safe_text)
{
    EXPECT_EQ(
        u8"<safe_text 'a&amp;b'>"sv,
        *representation(Value::safe_text(Safe_Text::escaped(u8"a&b")))
    );
}

TEST(Representation, objects)
{
    EXPECT_EQ(u8"Point(1, 2)"sv, *representation(Value::object(std::make_shared<Point>())));
}

TEST(String_Representation, single_quotes)
{
    std::u8string out;
    append_string_representation(out, u8"it's"sv, Quote_Style::single);
    EXPECT_EQ(u8"'it\\'s'"sv, out);
}

TEST(String_Representation, invalid_utf8)
{
    std::u8string out;
    append_string_representation(out, u8"a\xff"sv);
    EXPECT_EQ(u8"'a\\xff'"sv, out);
}

} // namespace
} // namespace plume
