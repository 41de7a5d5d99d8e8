#include <cstddef>
#include <memory>
#include <string_view>

#include <gtest/gtest.h>

#include "plume/util/result.hpp"

#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {
namespace {

using namespace std::literals;

struct Record final : Object {
    [[nodiscard]]
    Result<Value, Text_Error> representation() const final
    {
        return Value::string(u8"Record()");
    }

    [[nodiscard]]
    Result<Value, Text_Error> get_attribute(std::u8string_view name) const final
    {
        if (name == u8"id") {
            return Value::integer(7);
        }
        return Text_Error::format_key;
    }
};

TEST(Value, kinds)
{
    EXPECT_EQ(Value_Kind::null, Value::null.get_kind());
    EXPECT_EQ(Value_Kind::null, Value {}.get_kind());
    EXPECT_EQ(Value_Kind::boolean, Value::true_.get_kind());
    EXPECT_EQ(Value_Kind::integer, Value::integer(1).get_kind());
    EXPECT_EQ(Value_Kind::big_integer, Value::big_integer(Big_Integer(1)).get_kind());
    EXPECT_EQ(Value_Kind::floating, Value::floating(1).get_kind());
    EXPECT_EQ(Value_Kind::string, Value::string(u8"").get_kind());
    EXPECT_EQ(Value_Kind::safe_text, Value::safe_text(Safe_Text {}).get_kind());
    EXPECT_EQ(Value_Kind::list, Value::list({}).get_kind());
    EXPECT_EQ(Value_Kind::dict, Value::dict({}).get_kind());
    EXPECT_EQ(Value_Kind::object, Value::object(std::make_shared<Record>()).get_kind());
}

TEST(Value, kind_names)
{
    EXPECT_EQ(u8"null"sv, value_kind_name(Value_Kind::null));
    EXPECT_EQ(u8"big_integer"sv, value_kind_name(Value_Kind::big_integer));
    EXPECT_EQ(u8"safe_text"sv, value_kind_name(Value_Kind::safe_text));
}

TEST(Value, classification)
{
    EXPECT_TRUE(Value::null.is_null());
    EXPECT_TRUE(Value::string(u8"x").is_textual());
    EXPECT_TRUE(Value::safe_text(Safe_Text {}).is_textual());
    EXPECT_FALSE(Value::integer(1).is_textual());
    EXPECT_TRUE(Value::false_.is_numeric());
    EXPECT_TRUE(Value::floating(0.5).is_numeric());
    EXPECT_FALSE(Value::string(u8"1").is_numeric());
}

TEST(Dict, find_last_wins)
{
    const Dict dict { { { u8"a", Value::integer(1) }, { u8"a", Value::integer(2) } } };
    ASSERT_NE(nullptr, dict.find(u8"a"));
    EXPECT_EQ(2, dict.find(u8"a")->as_integer());
    EXPECT_EQ(nullptr, dict.find(u8"b"));
    EXPECT_TRUE(dict.contains(u8"a"));
    EXPECT_FALSE(dict.contains(u8"A"));
}

TEST(Get_Item, list)
{
    const Value list = Value::list({ Value::integer(10), Value::integer(20), Value::integer(30) });
    EXPECT_EQ(10, get_item(list, Value::integer(0))->as_integer());
    EXPECT_EQ(30, get_item(list, Value::integer(-1))->as_integer());
    EXPECT_EQ(10, get_item(list, Value::integer(-3))->as_integer());
    EXPECT_EQ(20, get_item(list, Value::true_)->as_integer());
    EXPECT_EQ(30, get_item(list, Value::big_integer(Big_Integer(2)))->as_integer());

    EXPECT_EQ(Text_Error::format_key, get_item(list, Value::integer(3)).error());
    EXPECT_EQ(Text_Error::format_key, get_item(list, Value::integer(-4)).error());
    EXPECT_EQ(
        Text_Error::format_key,
        get_item(list, Value::big_integer(Big_Integer("100000000000000000000000"))).error()
    );
    EXPECT_EQ(Text_Error::format_argument_type, get_item(list, Value::string(u8"0")).error());
    EXPECT_EQ(Text_Error::format_argument_type, get_item(list, Value::floating(0)).error());
}

TEST(Get_Item, dict)
{
    const Value dict = Value::dict({ { u8"name", Value::string(u8"<b>") } });
    EXPECT_EQ(u8"<b>"sv, get_item(dict, Value::string(u8"name"))->as_string());
    EXPECT_EQ(Text_Error::format_key, get_item(dict, Value::string(u8"nope")).error());
    EXPECT_EQ(Text_Error::format_key, get_item(dict, Value::integer(0)).error());
}

TEST(Get_Item, string)
{
    const Value text = Value::string(u8"aä€");
    EXPECT_EQ(u8"a"sv, get_item(text, Value::integer(0))->as_string());
    EXPECT_EQ(u8"ä"sv, get_item(text, Value::integer(1))->as_string());
    EXPECT_EQ(u8"€"sv, get_item(text, Value::integer(-1))->as_string());
    EXPECT_EQ(Text_Error::format_key, get_item(text, Value::integer(3)).error());
    EXPECT_EQ(Text_Error::format_argument_type, get_item(text, Value::string(u8"a")).error());
}

TEST(Get_Item, not_indexable)
{
    EXPECT_EQ(
        Text_Error::format_argument_type,
        get_item(Value::safe_text(Safe_Text::trusted(u8"&amp;")), Value::integer(0)).error()
    );
    EXPECT_EQ(Text_Error::format_argument_type, get_item(Value::integer(5), Value::integer(0)).error());
    EXPECT_EQ(Text_Error::format_argument_type, get_item(Value::null, Value::integer(0)).error());
    EXPECT_EQ(
        Text_Error::format_argument_type,
        get_item(Value::object(std::make_shared<Record>()), Value::integer(0)).error()
    );
}

TEST(Get_Attribute, objects)
{
    const Value record = Value::object(std::make_shared<Record>());
    EXPECT_EQ(7, get_attribute(record, u8"id")->as_integer());
    EXPECT_EQ(Text_Error::format_key, get_attribute(record, u8"name").error());
    EXPECT_EQ(Text_Error::format_key, get_attribute(Value::string(u8"x"), u8"upper").error());
}

} // namespace
} // namespace plume
