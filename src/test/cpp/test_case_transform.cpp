#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "plume/util/case_transform.hpp"

namespace plume {
namespace {

using namespace std::literals;

[[nodiscard]]
std::u8string transformed(std::u8string_view str, Text_Transformation transform)
{
    std::u8string result;
    append_case_transformed(result, str, transform);
    return result;
}

TEST(Case_Transform, simple_mappings)
{
    EXPECT_EQ(U'A', simple_to_upper(U'a'));
    EXPECT_EQ(U'a', simple_to_lower(U'A'));
    EXPECT_EQ(U'1', simple_to_upper(U'1'));
    EXPECT_EQ(U'Ä', simple_to_upper(U'ä'));
    EXPECT_EQ(U'×', simple_to_lower(U'×'));
    EXPECT_EQ(U'Ÿ', simple_to_upper(U'ÿ'));
    EXPECT_EQ(U'ā', simple_to_lower(U'Ā'));
    EXPECT_EQ(U'Ł', simple_to_upper(U'ł'));
    EXPECT_EQ(U'Σ', simple_to_upper(U'ς'));
    EXPECT_EQ(U'ж', simple_to_lower(U'Ж'));
    EXPECT_EQ(U'Ё', simple_to_upper(U'ё'));
    EXPECT_EQ(U'中', simple_to_upper(U'中'));
}

TEST(Case_Transform, other_blocks)
{
    EXPECT_EQ(U'Ǆ', simple_to_upper(U'ǆ'));
    EXPECT_EQ(U'Ƀ', simple_to_upper(U'ƀ'));
    EXPECT_EQ(U'Ș', simple_to_upper(U'ș'));
    EXPECT_EQ(U'Ａ', simple_to_upper(U'ａ'));
    EXPECT_EQ(U'Ԁ', simple_to_upper(U'ԁ'));
    EXPECT_EQ(U'Ა', simple_to_upper(U'ა'));
    EXPECT_EQ(U'ἀ', simple_to_lower(U'Ἀ'));
}

TEST(Case_Transform, uppercase)
{
    EXPECT_EQ(u8"HELLO, WÖRLD!"sv, transformed(u8"Hello, Wörld!", Text_Transformation::uppercase));
    EXPECT_EQ(u8"ПРИВЕТ"sv, transformed(u8"Привет", Text_Transformation::uppercase));
    EXPECT_EQ(u8"TIẾNG VIỆT"sv, transformed(u8"tiếng việt", Text_Transformation::uppercase));
    EXPECT_EQ(u8"ＡＢＣ"sv, transformed(u8"ａｂｃ", Text_Transformation::uppercase));
}

TEST(Case_Transform, lowercase)
{
    EXPECT_EQ(u8"àé <b>"sv, transformed(u8"ÀÉ <B>", Text_Transformation::lowercase));
    EXPECT_EQ(u8"αβγ"sv, transformed(u8"ΑΒΓ", Text_Transformation::lowercase));
    EXPECT_EQ(u8"ἀἐ"sv, transformed(u8"ἈἘ", Text_Transformation::lowercase));
}

TEST(Case_Transform, capitalize)
{
    EXPECT_EQ(u8"Hello world"sv, transformed(u8"hELLO WORLD", Text_Transformation::capitalize));
    EXPECT_EQ(u8"Élan"sv, transformed(u8"éLAN", Text_Transformation::capitalize));
    EXPECT_EQ(u8""sv, transformed(u8"", Text_Transformation::capitalize));
}

TEST(Case_Transform, invalid_utf8_is_kept)
{
    EXPECT_EQ(u8"A\xff" "B"sv, transformed(u8"a\xff" "b"sv, Text_Transformation::uppercase));
}

} // namespace
} // namespace plume
