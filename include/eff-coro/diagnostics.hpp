#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <typeinfo>
#include <variant>

#include "eff-coro/effect.hpp"
#include "fmt/core.h"

template <>
struct fmt::formatter<unit_t> : formatter<string_view> {
  // parse is inherited from formatter<string_view>.

  auto format(unit_t c, format_context& ctx) const -> format_context::iterator;
};

std::string demangle(const char* name);

// Walks the current stack with libunwind and prints one line per frame.
void print_frames(const char* prefix);

/** Reports a broken runtime guarantee and aborts.

    Used for misuse that the types could not rule out: resuming a completed
    or running computation, a request escaping a computation that cannot
    yield, a missing effect result. None of these is recoverable.
*/
[[noreturn]] void contract_violation(std::string_view what);

template <typename T>
std::string describe(const T& value);

namespace detail {

template <typename Effect>
std::string describe_one(const raised<Effect>& request) {
  return fmt::format(
      "{}({})", demangle(typeid(Effect).name()), describe(request.value));
}

template <typename T>
std::string describe_one(const T& value) {
  if constexpr (fmt::is_formattable<T>::value) {
    return fmt::format("{}", value);
  } else {
    return fmt::format("<{}>", demangle(typeid(T).name()));
  }
}

template <typename... Ts>
std::string describe_one(const std::variant<Ts...>& value) {
  return std::visit(
      [](const auto& alternative) { return describe(alternative); }, value);
}

template <typename... Effects>
std::string describe_one(const effect_result<Effects...>& result) {
  return std::visit(
      [](const auto& alternative) { return describe(alternative); },
      result.value());
}

}  // namespace detail

// Kind of the result a sum currently holds.
template <typename... Effects>
std::string kind_of(const effect_result<Effects...>& result) {
  const char* names[] = {typeid(Effects).name()...};
  return demangle(names[result.index()]);
}

// Best-effort text for traces and fatal messages: fmt where a formatter
// exists, the demangled type name otherwise.
template <typename T>
std::string describe(const T& value) {
  return detail::describe_one(value);
}
