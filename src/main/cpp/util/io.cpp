#include <cstddef>
#include <cstdio>
#include <cstring>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "plume/util/io.hpp"
#include "plume/util/result.hpp"
#include "plume/util/strings.hpp"
#include "plume/util/unicode.hpp"

#include "plume/fwd.hpp"

namespace plume {

Result<void, IO_Error_Code> load_utf8_file(std::pmr::vector<char8_t>& out, std::u8string_view path)
{
    constexpr std::size_t block_size = BUFSIZ;
    char buffer[block_size] {};

    // fopen needs a null-terminated path
    const std::string path_string { as_string_view(path) };
    const Unique_File stream = fopen_unique(path_string.c_str(), "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    const std::size_t initial_size = out.size();
    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        const std::size_t old_size = out.size();
        out.resize(old_size + read_size);
        std::memcpy(out.data() + old_size, buffer, read_size);
    } while (read_size == block_size);

    const std::u8string_view str { out.data() + initial_size, out.size() - initial_size };
    if (!utf8::is_valid(str)) {
        return IO_Error_Code::corrupted;
    }
    return {};
}

Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory)
{
    std::pmr::vector<char8_t> result { memory };
    if (auto r = load_utf8_file(result, path); !r) {
        return r.error();
    }
    return result;
}

Result<void, IO_Error_Code> write_file(std::u8string_view path, std::u8string_view text)
{
    const std::string path_string { as_string_view(path) };
    const Unique_File stream = fopen_unique(path_string.c_str(), "wb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }
    const std::size_t written = std::fwrite(text.data(), 1, text.size(), stream.get());
    if (written != text.size()) {
        return IO_Error_Code::write_error;
    }
    return {};
}

} // namespace plume
