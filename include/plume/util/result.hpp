#ifndef PLUME_RESULT_HPP
#define PLUME_RESULT_HPP

#include <expected>
#include <type_traits>

namespace plume {

/// @brief The result of an operation which either succeeds with a value of type `T`
/// or fails with an error of type `E`.
///
/// Unlike `std::expected`, an error can be returned directly without wrapping it in
/// `std::unexpected`, which keeps failure paths short:
/// ```
/// Result<int, Error> f() {
///     if (bad) return Error::bad;
///     return 123;
/// }
/// ```
template <typename T, typename E>
struct [[nodiscard]] Result : std::expected<T, E> {
    static_assert(!std::is_convertible_v<E, T> && !std::is_convertible_v<T, E>);

    using Base = std::expected<T, E>;
    using Base::Base;

    constexpr Result() = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : Base { std::unexpect, error }
    {
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> : std::expected<void, E> {
    using Base = std::expected<void, E>;
    using Base::Base;

    constexpr Result() = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : Base { std::unexpect, error }
    {
    }
};

} // namespace plume

#endif
