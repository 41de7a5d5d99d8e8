#ifndef PLUME_OUTPUT_ACCUMULATOR_HPP
#define PLUME_OUTPUT_ACCUMULATOR_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "plume/util/result.hpp"

#include "plume/fwd.hpp"
#include "plume/output_language.hpp"
#include "plume/services.hpp"
#include "plume/text_error.hpp"

namespace plume {

/// @brief Collects the fragments of a page (or any other output) in order,
/// and joins them into a single result.
///
/// In `Output_Language::html`, every fragment which is not already `Safe_Text` is escaped,
/// and the result is `Safe_Text`.
/// In `Output_Language::text`, fragments are kept as they are,
/// and the result is a plain string.
///
/// Finalizing does not consume the fragments,
/// so more fragments may be appended afterwards and the accumulator finalized again.
struct Output_Accumulator {
private:
    Output_Language m_language;
    std::pmr::vector<std::pmr::u8string> m_fragments;
    Logger& m_logger;

public:
    [[nodiscard]]
    explicit Output_Accumulator(
        Output_Language language,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource(),
        Logger& logger = ignorant_logger
    );

    [[nodiscard]]
    Output_Language get_language() const noexcept
    {
        return m_language;
    }

    /// @brief Returns the number of fragments appended so far.
    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_fragments.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_fragments.empty();
    }

    /// @brief Appends `value` as a new fragment.
    /// Null values are ignored.
    /// In HTML mode, `Safe_Text` is appended as-is and anything else is converted to text
    /// and escaped (see `append_stringified_escaped`).
    /// In text mode, `value` is converted to text without escaping.
    ///
    /// If the conversion fails, the error is returned (and logged at debug severity),
    /// and no fragment is appended.
    [[nodiscard]]
    Result<void, Text_Error> append(const Value& value);

    /// @brief Appends raw `text`, escaped in HTML mode.
    void append(std::u8string_view text);

    /// @brief Appends `text` as-is in either mode.
    void append(const Safe_Text& text);

    /// @brief Returns the joined fragments,
    /// which is `Safe_Text` in HTML mode and a string in text mode.
    [[nodiscard]]
    Value finalize() const;

    /// @brief Returns the joined fragments as a string.
    [[nodiscard]]
    std::u8string get_text() const;

    /// @brief Returns a diagnostic representation, like `<Output_Accumulator: 3 fragments>`.
    [[nodiscard]]
    std::u8string representation() const;
};

} // namespace plume

#endif
