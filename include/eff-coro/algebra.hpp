#pragma once

#include <cstddef>
#include <cstdlib>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "eff-coro/effect.hpp"

// Select / CoSelect: classification of a request sum against one slice of
// it, and reconstruction of composite results from partial ones. Everything
// here is resolved by kind, so the position of a kind inside a set never
// matters.

/** What a handler for `Part` consumes and produces.

    A single kind is handled on its bare values (`raise_t` in, `resume_t`
    out); a subset is handled on its request variant and `effect_result`.
*/
template <typename Part>
struct part_traits;

template <typename Effect>
  requires is_effect<Effect>
struct part_traits<Effect> {
  using set = effect_set<Effect>;
  using request_t = typename Effect::raise_t;
  using result_t = typename Effect::resume_t;

  static request_t unwrap(raised<Effect>&& request) {
    return std::move(request.value);
  }
  static raised<Effect> wrap(request_t&& request) {
    return raised<Effect>{std::move(request)};
  }
  static typename set::result_t as_set_result(result_t&& result) {
    return set::result_t::template make<Effect>(std::move(result));
  }
};

template <typename... Effects>
struct part_traits<effect_set<Effects...>> {
  using set = effect_set<Effects...>;
  using request_t = typename set::request_t;
  using result_t = typename set::result_t;

  template <typename Effect>
  static request_t unwrap(raised<Effect>&& request) {
    return request_t(std::move(request));
  }
  static typename set::result_t as_set_result(result_t&& result) {
    return std::move(result);
  }
};

template <typename Request>
struct declined {
  Request request;
};

// A handler that may decline returns either its result or the request it
// was given, untouched.
template <typename Part>
using outcome = std::variant<typename part_traits<Part>::result_t,
    declined<typename part_traits<Part>::request_t>>;

template <typename Inner, typename Outer>
struct is_subset : std::false_type {};

template <typename... Inner, typename... Outer>
struct is_subset<effect_set<Inner...>, effect_set<Outer...>>
    : std::bool_constant<(detail::contains_v<Inner, Outer...> && ...)> {};

template <typename Whole, typename Part>
concept selects = requires { typename part_traits<Part>::set; } &&
    is_subset<typename part_traits<Part>::set, Whole>::value;

/** CoSelect: embeds requests and results of `Inner` into the enclosing
    `Outer` set. */
template <typename Inner, typename Outer>
struct coselect;

template <typename... Outer>
struct coselect<effect_set<>, effect_set<Outer...>> {
  using outer_request_t = typename effect_set<Outer...>::request_t;
  using outer_result_t = typename effect_set<Outer...>::result_t;

  [[noreturn]] static outer_request_t restore(never&&) { std::abort(); }
  [[noreturn]] static outer_result_t reconstruct(never&&) { std::abort(); }
};

template <typename... Inner, typename... Outer>
  requires(sizeof...(Inner) > 0 &&
      is_subset<effect_set<Inner...>, effect_set<Outer...>>::value)
struct coselect<effect_set<Inner...>, effect_set<Outer...>> {
  using inner_request_t = std::variant<raised<Inner>...>;
  using inner_result_t = effect_result<Inner...>;
  using outer_request_t = std::variant<raised<Outer>...>;
  using outer_result_t = effect_result<Outer...>;

  static outer_request_t restore(inner_request_t&& request) {
    return std::visit(
        [](auto&& alternative) -> outer_request_t {
          return outer_request_t(std::move(alternative));
        },
        std::move(request));
  }

  static outer_result_t reconstruct(inner_result_t&& result) {
    if constexpr (std::is_same_v<inner_result_t, outer_result_t>) {
      return std::move(result);
    } else {
      return reconstruct_at<0>(std::move(result));
    }
  }

 private:
  template <std::size_t I>
  static outer_result_t reconstruct_at(inner_result_t&& result) {
    using effect_t = std::tuple_element_t<I, std::tuple<Inner...>>;
    if constexpr (I + 1 < sizeof...(Inner)) {
      if (result.index() != I) {
        return reconstruct_at<I + 1>(std::move(result));
      }
    }
    return outer_result_t::template make<effect_t>(
        std::move(result).template get<effect_t>());
  }
};

namespace detail {

template <typename T, typename Set>
struct set_contains : std::false_type {};

template <typename T, typename... Effects>
struct set_contains<T, effect_set<Effects...>>
    : std::bool_constant<contains_v<T, Effects...>> {};

template <typename PartSet, typename Acc, typename... Effects>
struct rest_of;

template <typename... Parts, typename... Acc>
struct rest_of<effect_set<Parts...>, effect_set<Acc...>> {
  using type = effect_set<Acc...>;
};

template <typename... Parts, typename... Acc, typename Effect,
    typename... Effects>
struct rest_of<effect_set<Parts...>, effect_set<Acc...>, Effect, Effects...>
    : rest_of<effect_set<Parts...>,
          std::conditional_t<contains_v<Effect, Parts...>,
              effect_set<Acc...>,
              effect_set<Acc..., Effect>>,
          Effects...> {};

}  // namespace detail

/** Select: splits `Whole` into `Part` and the remainder.

    Every concrete request of `Whole` classifies as exactly one of the two.
    When `Part` covers all of `Whole` the remainder is `effect_set<>`, whose
    request type is `never`, so nothing can fall through.
*/
template <typename Part, typename Whole>
struct partition;

template <typename Part, typename... Whole>
  requires selects<effect_set<Whole...>, Part>
struct partition<Part, effect_set<Whole...>> {
  using traits = part_traits<Part>;
  using whole_set = effect_set<Whole...>;
  using part_set = typename traits::set;
  using rest_set =
      typename detail::rest_of<part_set, effect_set<>, Whole...>::type;

  using whole_request_t = typename whole_set::request_t;
  using whole_result_t = typename whole_set::result_t;
  using part_request_t = typename traits::request_t;
  using part_result_t = typename traits::result_t;
  using rest_request_t = typename rest_set::request_t;
  using rest_result_t = typename rest_set::result_t;

  // Index 0: handled by `Part`; index 1: the remainder.
  using split_t = std::variant<part_request_t, rest_request_t>;

  static split_t classify(whole_request_t&& request) {
    return std::visit(
        [](auto&& alternative) -> split_t {
          return route(std::move(alternative));
        },
        std::move(request));
  }

  static whole_result_t reconstruct(part_result_t&& result) {
    return coselect<part_set, whole_set>::reconstruct(
        traits::as_set_result(std::move(result)));
  }

  // A declined part request goes back into the whole, unchanged.
  static whole_request_t restore(part_request_t&& request) {
    if constexpr (is_effect<Part>) {
      return whole_request_t(traits::wrap(std::move(request)));
    } else {
      return coselect<part_set, whole_set>::restore(std::move(request));
    }
  }

  static whole_result_t co_reconstruct(rest_result_t&& result) {
    return coselect<rest_set, whole_set>::reconstruct(std::move(result));
  }

 private:
  template <typename Effect>
  static split_t route(raised<Effect>&& request) {
    if constexpr (detail::set_contains<Effect, part_set>::value) {
      return split_t(
          std::in_place_index<0>, traits::unwrap(std::move(request)));
    } else {
      return split_t(
          std::in_place_index<1>, rest_request_t(std::move(request)));
    }
  }
};

// What is left of the request sum `Yield` once `Part` is handled.
template <typename Part, typename Yield>
using remainder_t =
    typename partition<Part, set_of_t<Yield>>::rest_request_t;
