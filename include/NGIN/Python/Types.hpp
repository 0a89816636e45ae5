// Types.hpp
// Small vocabulary types shared by the binding headers
#pragma once

#include <NGIN/Primitives.hpp>

#include <cstddef>
#include <string_view>

namespace NGIN::Python
{

  using ModuleId = NGIN::UInt64;

  template <class T>
  struct Tag
  {
    using type = T;
  };

  /**
   * String literal usable as a non-type template parameter, e.g.
   * `AddFunction<&Scale, "value, factor=2.0">(...)`. The characters live in the
   * template parameter object, so views into it have static storage duration.
   */
  template <std::size_t N>
  struct FixedString
  {
    char data[N]{};

    consteval FixedString(const char (&text)[N]) noexcept
    {
      for (std::size_t i = 0; i < N; ++i)
        data[i] = text[i];
    }

    [[nodiscard]] constexpr std::string_view View() const noexcept { return {data, N - 1}; }
    [[nodiscard]] constexpr std::size_t Size() const noexcept { return N - 1; }
  };

} // namespace NGIN::Python
