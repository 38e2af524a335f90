#ifndef MPINT_STRINGS_HPP
#define MPINT_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string_view>

namespace mpint {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::string_view as_string_view(std::span<const char> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::string_view as_string_view(std::span<const std::byte> bytes)
{
    return { reinterpret_cast<const char*>(bytes.data()), bytes.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Returns the object representation of `text` as a span of bytes.
[[nodiscard]]
inline std::span<const std::byte> as_bytes(std::string_view text)
{
    return { reinterpret_cast<const std::byte*>(text.data()), text.size() };
}

} // namespace mpint

#endif
