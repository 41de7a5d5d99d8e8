#ifndef PLUME_IO_HPP
#define PLUME_IO_HPP

#include <cstdio>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include "plume/util/result.hpp"

#include "plume/fwd.hpp"

namespace plume {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief An error occurred while writing a file.
    write_error,
    /// @brief The file is not properly encoded.
    /// For example, if an attempt is made to read a text file as UTF-8 that is not encoded as such.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_message(IO_Error_Code error)
{
    switch (error) {
    case IO_Error_Code::cannot_open: return u8"Failed to open file.";
    case IO_Error_Code::read_error: return u8"Failed to read file.";
    case IO_Error_Code::write_error: return u8"Failed to write file.";
    case IO_Error_Code::corrupted: return u8"File is not valid UTF-8.";
    }
    return u8"Unknown I/O error.";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    constexpr Unique_File& operator=(Unique_File&& other) noexcept
    {
        std::swap(m_file, other.m_file);
        other.close();
        return *this;
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(std::exchange(m_file, nullptr));
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
inline Unique_File fopen_unique(const char* path, const char* mode) noexcept
{
    return std::fopen(path, mode);
}

/// @brief Reads all bytes from a file and appends them to `out`.
/// Fails with `IO_Error_Code::corrupted` if the appended bytes are not valid UTF-8,
/// in which case `out` still contains them.
Result<void, IO_Error_Code> load_utf8_file(std::pmr::vector<char8_t>& out, std::u8string_view path);

Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory);

/// @brief Writes `text` to the file at `path`, replacing any previous contents.
Result<void, IO_Error_Code> write_file(std::u8string_view path, std::u8string_view text);

} // namespace plume

#endif
