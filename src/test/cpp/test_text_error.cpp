#include <string_view>

#include <gtest/gtest.h>

#include "plume/text_error.hpp"

namespace plume {
namespace {

using namespace std::literals;

static_assert(text_error_category(Text_Error::input_type) == Text_Error_Category::input_type);
static_assert(text_error_category(Text_Error::conversion) == Text_Error_Category::conversion);
static_assert(text_error_category(Text_Error::format_syntax) == Text_Error_Category::format);
static_assert(text_error_category(Text_Error::format_numbering) == Text_Error_Category::format);
static_assert(
    text_error_category(Text_Error::unsupported_operation)
    == Text_Error_Category::unsupported_operation
);

constexpr Text_Error all_errors[] {
    Text_Error::input_type,
    Text_Error::conversion,
    Text_Error::format_syntax,
    Text_Error::format_arity,
    Text_Error::format_key,
    Text_Error::format_argument_type,
    Text_Error::format_specifier,
    Text_Error::format_numbering,
    Text_Error::unsupported_operation,
};

TEST(Text_Error, ids)
{
    EXPECT_EQ(u8"format.arity"sv, text_error_id(Text_Error::format_arity));
    EXPECT_EQ(u8"text.input-type"sv, text_error_id(Text_Error::input_type));

    for (const Text_Error error : all_errors) {
        EXPECT_NE(u8"text.unknown"sv, text_error_id(error));
        const Text_Error_Category category = text_error_category(error);
        EXPECT_EQ(
            category == Text_Error_Category::format, text_error_id(error).starts_with(u8"format.")
        );
    }
}

TEST(Text_Error, messages)
{
    for (const Text_Error error : all_errors) {
        const std::u8string_view message = text_error_message(error);
        EXPECT_NE(u8"Unknown error."sv, message);
        EXPECT_TRUE(message.ends_with(u8'.'));
    }
}

} // namespace
} // namespace plume
