// NameUtils.hpp
// Utilities to derive function names from function-pointer constants using compiler signatures.
#pragma once

#include <string_view>

namespace NGIN::Python::detail {

template<auto FnPtr>
consteval std::string_view FunctionNameFromPretty() noexcept {
#if defined(_MSC_VER)
  constexpr std::string_view sig = __FUNCSIG__;
  // Example: "std::string_view __cdecl NGIN::Python::detail::FunctionNameFromPretty<&Scale>(void) noexcept"
  constexpr std::string_view key = "FunctionNameFromPretty<";
  auto kpos = sig.find(key);
  if (kpos == std::string_view::npos) return {};
  auto start = kpos + key.size();
  auto end = sig.find(">(void)", start);
  if (end == std::string_view::npos || end <= start) return {};
  auto full = sig.substr(start, end - start);
#elif defined(__clang__)
  constexpr std::string_view sig = __PRETTY_FUNCTION__;
  // Example: "std::string_view NGIN::Python::detail::FunctionNameFromPretty() [FnPtr = &Scale]"
  constexpr std::string_view key = "[FnPtr = ";
  auto kpos = sig.find(key);
  if (kpos == std::string_view::npos) return {};
  auto start = kpos + key.size();
  auto end = sig.rfind(']');
  if (end == std::string_view::npos || end <= start) return {};
  auto full = sig.substr(start, end - start);
#elif defined(__GNUC__)
  constexpr std::string_view sig = __PRETTY_FUNCTION__;
  // Example: "consteval std::string_view NGIN::Python::detail::FunctionNameFromPretty() [with auto FnPtr = Scale; ...]"
  constexpr std::string_view key = "[with auto FnPtr = ";
  auto kpos = sig.find(key);
  if (kpos == std::string_view::npos) return {};
  auto start = kpos + key.size();
  auto end = sig.find_first_of(";]", start);
  if (end == std::string_view::npos || end <= start) return {};
  auto full = sig.substr(start, end - start);
#else
  return {};
#endif
  // Compilers spell function pointers as "&Name", "&ns::Name" or "Name".
  while (!full.empty() && (full.front() == '&' || full.front() == ' ' || full.front() == '('))
    full.remove_prefix(1);
  while (!full.empty() && (full.back() == ' ' || full.back() == ')'))
    full.remove_suffix(1);
  auto dc = full.rfind("::");
  if (dc == std::string_view::npos) return full;
  return full.substr(dc + 2);
}

} // namespace NGIN::Python::detail
