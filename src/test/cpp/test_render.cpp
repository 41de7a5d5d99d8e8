#include <cstddef>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "plume/util/result.hpp"

#include "plume/format.hpp"
#include "plume/output_accumulator.hpp"
#include "plume/output_language.hpp"
#include "plume/render.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {
namespace {

using namespace std::literals;

[[nodiscard]]
std::vector<Template_Variable> variables()
{
    std::vector<Template_Variable> result;
    result.emplace_back(u8"name", Value::string(u8"<Tom & Jerry>"));
    result.emplace_back(u8"bold", Value::safe_text(Safe_Text::trusted(u8"<b>hi</b>")));
    result.emplace_back(u8"n", Value::integer(3));
    return result;
}

TEST(Render_Template, percent_html)
{
    Output_Accumulator out { Output_Language::html };
    ASSERT_TRUE(render_template(
        out, u8"<p>%(name)s %(bold)s %(n)03d</p>", variables(), Format_Syntax::percent
    ));
    EXPECT_EQ(u8"<p>&lt;Tom &amp; Jerry&gt; <b>hi</b> 003</p>"sv, out.get_text());
    EXPECT_EQ(std::size_t(1), out.size());
    EXPECT_TRUE(out.finalize().is_safe_text());
}

TEST(Render_Template, percent_text)
{
    Output_Accumulator out { Output_Language::text };
    ASSERT_TRUE(render_template(
        out, u8"%(name)s %(bold)s %(n)d", variables(), Format_Syntax::percent
    ));
    EXPECT_EQ(u8"<Tom & Jerry> <b>hi</b> 3"sv, out.get_text());
}

TEST(Render_Template, brace_html)
{
    Output_Accumulator out { Output_Language::html };
    ASSERT_TRUE(render_template(
        out, u8"<p>{name} {bold} {n:>3}</p>", variables(), Format_Syntax::brace
    ));
    EXPECT_EQ(u8"<p>&lt;Tom &amp; Jerry&gt; <b>hi</b>   3</p>"sv, out.get_text());
}

TEST(Render_Template, brace_text)
{
    Output_Accumulator out { Output_Language::text };
    ASSERT_TRUE(render_template(out, u8"{name}!", variables(), Format_Syntax::brace));
    EXPECT_EQ(u8"<Tom & Jerry>!"sv, out.get_text());
}

TEST(Render_Template, unnamed_directives_fail_in_both_languages)
{
    for (const Output_Language language : { Output_Language::html, Output_Language::text }) {
        Output_Accumulator out { language };
        const Result<void, Text_Error> percent
            = render_template(out, u8"a %s b", variables(), Format_Syntax::percent);
        ASSERT_FALSE(percent);
        EXPECT_EQ(Text_Error::format_arity, percent.error());

        const Result<void, Text_Error> brace
            = render_template(out, u8"a {} b", variables(), Format_Syntax::brace);
        ASSERT_FALSE(brace);
        EXPECT_EQ(Text_Error::format_arity, brace.error());

        EXPECT_TRUE(out.empty());
    }
}

TEST(Render_Template, missing_names_fail_in_both_languages)
{
    for (const Output_Language language : { Output_Language::html, Output_Language::text }) {
        Output_Accumulator out { language };
        const Result<void, Text_Error> percent
            = render_template(out, u8"%(x)s", variables(), Format_Syntax::percent);
        ASSERT_FALSE(percent);
        EXPECT_EQ(Text_Error::format_key, percent.error());

        const Result<void, Text_Error> brace
            = render_template(out, u8"{x}", variables(), Format_Syntax::brace);
        ASSERT_FALSE(brace);
        EXPECT_EQ(Text_Error::format_key, brace.error());
    }
}

TEST(Render_Template, no_variables)
{
    Output_Accumulator out { Output_Language::html };
    ASSERT_TRUE(render_template(out, u8"100%% <i>plain</i>", {}, Format_Syntax::percent));
    EXPECT_EQ(u8"100% <i>plain</i>"sv, out.get_text());
}

} // namespace
} // namespace plume
