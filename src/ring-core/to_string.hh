#pragma once

#include <ring-core/fwd.hh>

#include <concepts>
#include <string>
#include <string_view>

// Textual rendering of single values.
// ring_list renders its elements through these overloads (or a user overload found by ADL).

namespace rc
{
// in hex
[[nodiscard]] std::string to_string(void const* ptr);

// true/false
[[nodiscard]] std::string to_string(bool b);

// 0xFF
[[nodiscard]] std::string to_string(byte b);

// simply the char, no quotes
[[nodiscard]] std::string to_string(char c);

// integer types
// note: does not use the sized versions because this style is _complete_ for users
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// shortest representation that round-trips
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string s);
[[nodiscard]] std::string to_string(std::string_view s);

namespace impl
{
// unqualified call so that user types are found via ADL next to the rc overloads
template <class T>
[[nodiscard]] std::string to_string_adl(T const& v)
{
    using rc::to_string;
    return to_string(v);
}
} // namespace impl

/// T can be rendered by rc::to_string or an ADL-visible to_string(T)
template <class T>
concept stringable = requires(T const& v) {
    { to_string(v) } -> std::convertible_to<std::string>;
};
} // namespace rc
