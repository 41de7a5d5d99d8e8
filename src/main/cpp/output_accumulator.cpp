#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "plume/util/result.hpp"
#include "plume/util/severity.hpp"
#include "plume/util/to_chars.hpp"

#include "plume/diagnostic.hpp"
#include "plume/escape.hpp"
#include "plume/output_accumulator.hpp"
#include "plume/safe_text.hpp"
#include "plume/services.hpp"
#include "plume/settings.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

Output_Accumulator::Output_Accumulator(
    Output_Language language,
    std::pmr::memory_resource* memory,
    Logger& logger
)
    : m_language { language }
    , m_fragments { memory }
    , m_logger { logger }
{
    m_fragments.reserve(default_fragment_capacity);
}

Result<void, Text_Error> Output_Accumulator::append(const Value& value)
{
    if (value.is_null()) {
        return {};
    }
    if (value.is_safe_text()) {
        append(value.as_safe_text());
        return {};
    }
    if (value.is_string()) {
        append(value.as_string());
        return {};
    }

    std::u8string text;
    const Result<void, Text_Error> r = m_language == Output_Language::html
        ? append_stringified_escaped(text, value)
        : append_stringified(text, value);
    if (!r) {
        if (m_logger.can_log(Severity::debug)) {
            m_logger(Diagnostic {
                .severity = Severity::debug,
                .id = text_error_id(r.error()),
                .message = text_error_message(r.error()),
            });
        }
        return r;
    }
    m_fragments.emplace_back(std::u8string_view { text });
    return {};
}

void Output_Accumulator::append(std::u8string_view text)
{
    std::pmr::u8string& fragment = m_fragments.emplace_back();
    if (m_language == Output_Language::html) {
        fragment.reserve(text.size() + escaped_extra_length(text));
        for (const char8_t c : text) {
            const std::u8string_view entity = html_entity_of(c);
            if (entity.empty()) {
                fragment.push_back(c);
            }
            else {
                fragment += entity;
            }
        }
    }
    else {
        fragment = text;
    }
}

void Output_Accumulator::append(const Safe_Text& text)
{
    m_fragments.emplace_back(text.get_text());
}

std::u8string Output_Accumulator::get_text() const
{
    std::size_t total = 0;
    for (const std::pmr::u8string& fragment : m_fragments) {
        total += fragment.size();
    }
    std::u8string result;
    result.reserve(total);
    for (const std::pmr::u8string& fragment : m_fragments) {
        result += fragment;
    }
    return result;
}

Value Output_Accumulator::finalize() const
{
    std::u8string text = get_text();
    if (m_language == Output_Language::html) {
        return Value::safe_text(Safe_Text::trusted(std::move(text)));
    }
    return Value::string(std::move(text));
}

std::u8string Output_Accumulator::representation() const
{
    std::u8string result = u8"<Output_Accumulator: ";
    append_integer(result, Integer(m_fragments.size()));
    result += m_fragments.size() == 1 ? u8" fragment>" : u8" fragments>";
    return result;
}

} // namespace plume
