#include <cstddef>
#include <new>
#include <string>
#include <string_view>

#include "plume/util/strings.hpp"
#include "plume/util/unicode.hpp"

namespace plume {

[[nodiscard]]
std::u8string repeat(std::u8string_view str, std::size_t n)
{
    std::u8string result;
    if (str.empty() || n == 0) {
        return result;
    }
    if (n > result.max_size() / str.size()) {
        throw std::bad_alloc {};
    }
    result.reserve(str.size() * n);
    for (std::size_t i = 0; i < n; ++i) {
        result.append(str);
    }
    return result;
}

[[nodiscard]]
std::u8string replace_all(
    std::u8string_view haystack,
    std::u8string_view needle,
    std::u8string_view replacement,
    long long limit
)
{
    std::u8string result;
    result.reserve(haystack.size());

    if (needle.empty()) {
        while (limit != 0) {
            result.append(replacement);
            --limit;
            if (haystack.empty()) {
                break;
            }
            const auto [_, length] = utf8::decode_and_length_or_replacement(haystack);
            result.append(haystack.substr(0, std::size_t(length)));
            haystack.remove_prefix(std::size_t(length));
        }
        result.append(haystack);
        return result;
    }

    while (limit != 0) {
        const std::size_t pos = haystack.find(needle);
        if (pos == std::u8string_view::npos) {
            break;
        }
        result.append(haystack.substr(0, pos));
        result.append(replacement);
        haystack.remove_prefix(pos + needle.size());
        --limit;
    }
    result.append(haystack);
    return result;
}

} // namespace plume
