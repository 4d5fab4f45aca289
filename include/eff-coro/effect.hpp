#pragma once

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

class unit_t {
 public:
  friend bool operator==(unit_t, unit_t) { return true; }
};

// Uninhabited: a computation yielding `never` can only complete.
struct never {
  never() = delete;
};

template <typename Raise, typename Resume>
class effect {
 public:
  typedef Raise raise_t;
  typedef Resume resume_t;
};

template <typename T>
concept is_effect =
    std::is_base_of_v<effect<typename T::raise_t, typename T::resume_t>, T>;

// One concrete request of kind `Effect`.
template <typename Effect>
  requires is_effect<Effect>
struct raised {
  typename Effect::raise_t value;
};

namespace detail {

template <typename T, typename... Ts>
inline constexpr bool contains_v = (std::is_same_v<T, Ts> || ...);

template <typename T, typename... Ts>
struct index_of;

template <typename T, typename... Ts>
struct index_of<T, T, Ts...> : std::integral_constant<std::size_t, 0> {};

template <typename T, typename U, typename... Ts>
struct index_of<T, U, Ts...>
    : std::integral_constant<std::size_t, 1 + index_of<T, Ts...>::value> {};

template <typename T, typename... Ts>
inline constexpr std::size_t index_of_v = index_of<T, Ts...>::value;

template <typename... Ts>
struct distinct : std::true_type {};

template <typename T, typename... Ts>
struct distinct<T, Ts...>
    : std::bool_constant<!contains_v<T, Ts...> && distinct<Ts...>::value> {};

}  // namespace detail

/** Index-aligned result of an `effect_set`: alternative i holds the
    `resume_t` of kind i. Alternatives may share a type, so access goes
    through the kind, never through the value type. */
template <typename... Effects>
  requires(sizeof...(Effects) > 0 && (is_effect<Effects> && ...))
class effect_result {
 public:
  using variant_t = std::variant<typename Effects::resume_t...>;

  template <std::size_t I, typename... Args>
  explicit effect_result(std::in_place_index_t<I> tag, Args&&... args)
      : value_(tag, std::forward<Args>(args)...) {}

  template <typename Effect>
    requires detail::contains_v<Effect, Effects...>
  static effect_result make(typename Effect::resume_t value) {
    return effect_result(
        std::in_place_index<detail::index_of_v<Effect, Effects...>>,
        std::move(value));
  }

  template <typename Effect>
    requires detail::contains_v<Effect, Effects...>
  bool holds() const noexcept {
    return value_.index() == detail::index_of_v<Effect, Effects...>;
  }

  template <typename Effect>
    requires detail::contains_v<Effect, Effects...>
  typename Effect::resume_t& get() & {
    return std::get<detail::index_of_v<Effect, Effects...>>(value_);
  }

  template <typename Effect>
    requires detail::contains_v<Effect, Effects...>
  typename Effect::resume_t get() && {
    return std::get<detail::index_of_v<Effect, Effects...>>(std::move(value_));
  }

  std::size_t index() const noexcept { return value_.index(); }

  const variant_t& value() const noexcept { return value_; }

 private:
  variant_t value_;
};

template <typename... Effects>
  requires((is_effect<Effects> && ...) && detail::distinct<Effects...>::value)
struct effect_set {
  using request_t = std::variant<raised<Effects>...>;
  using result_t = effect_result<Effects...>;
};

template <>
struct effect_set<> {
  using request_t = never;
  using result_t = never;
};

template <typename... Effects>
using requests = typename effect_set<Effects...>::request_t;

template <typename... Effects>
using results = typename effect_set<Effects...>::result_t;

namespace detail {

// Recovers the kinds from a request or result sum.
template <typename T>
struct set_of;

template <>
struct set_of<never> {
  using type = effect_set<>;
};

template <typename... Effects>
struct set_of<std::variant<raised<Effects>...>> {
  using type = effect_set<Effects...>;
};

template <typename... Effects>
struct set_of<effect_result<Effects...>> {
  using type = effect_set<Effects...>;
};

}  // namespace detail

template <typename T>
using set_of_t = typename detail::set_of<T>::type;
