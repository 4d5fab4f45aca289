#pragma once

#include <functional>
#include <typeinfo>
#include <utility>
#include <variant>

#include "eff-coro/algebra.hpp"
#include "eff-coro/computation.hpp"
#include "eff-coro/diagnostics.hpp"

#ifdef EFF_CORO_TRACE
#include "fmt/core.h"
#endif

// A handler layer drives the computation it wraps. Requests of kind `Part`
// are answered in place: the handler runs, its result is widened to the
// mailbox type (Select, then CoSelect) and the inner computation is resumed
// again without the caller seeing anything. Everything else surfaces as the
// layer's own request. Whatever the handler throws passes through as is.

namespace detail {

template <typename Part, typename Yield, typename Inbox, typename Handler>
routine<remainder_t<Part, Yield>> handle_all(
    computation<Yield, Inbox> inner, Handler handler) {
  using select = partition<Part, set_of_t<Yield>>;
  using widen = coselect<set_of_t<Yield>, set_of_t<Inbox>>;

  auto inbox = inner.inbox();
  while (auto request = inner.resume()) {
    auto split = select::classify(std::move(*request));
    if (split.index() == 0) {
#ifdef EFF_CORO_TRACE
      fmt::print("[{}] handle {}\n", demangle(typeid(Part).name()),
          describe(std::get<0>(split)));
#endif
      auto result = std::invoke(handler, std::get<0>(std::move(split)));
      inbox.put(widen::reconstruct(select::reconstruct(std::move(result))));
    } else {
#ifdef EFF_CORO_TRACE
      fmt::print("[{}] pass {}\n", demangle(typeid(Part).name()),
          describe(std::get<1>(split)));
#endif
      co_yield std::get<1>(std::move(split));
    }
  }
}

// Same, for a handler that may decline. A declined request is put back
// together and surfaces unchanged, so the yield type stays `Yield`.
template <typename Part, typename Yield, typename Inbox, typename Handler>
routine<Yield> handle_some(computation<Yield, Inbox> inner, Handler handler) {
  using select = partition<Part, set_of_t<Yield>>;
  using widen = coselect<set_of_t<Yield>, set_of_t<Inbox>>;
  using rest = coselect<typename select::rest_set, set_of_t<Yield>>;

  auto inbox = inner.inbox();
  while (auto request = inner.resume()) {
    auto split = select::classify(std::move(*request));
    if (split.index() == 1) {
      co_yield rest::restore(std::get<1>(std::move(split)));
      continue;
    }

    outcome<Part> result = std::invoke(handler, std::get<0>(std::move(split)));
    if (result.index() == 0) {
#ifdef EFF_CORO_TRACE
      fmt::print("[{}] handled\n", demangle(typeid(Part).name()));
#endif
      inbox.put(widen::reconstruct(
          select::reconstruct(std::get<0>(std::move(result)))));
    } else {
#ifdef EFF_CORO_TRACE
      fmt::print("[{}] declined {}\n", demangle(typeid(Part).name()),
          describe(std::get<1>(result).request));
#endif
      co_yield select::restore(std::move(std::get<1>(result).request));
    }
  }
}

}  // namespace detail

template <typename Part, typename Yield, typename Inbox, typename Handler>
  requires is_handler_of<Part, Yield, Handler>
computation<handled_yield_t<Part, Yield, Handler>, Inbox> attach_handler(
    computation<Yield, Inbox> inner, Handler handler) {
  auto inbox = inner.inbox();
  if constexpr (is_total_handler_of<Part, Yield, Handler>) {
    return computation<handled_yield_t<Part, Yield, Handler>, Inbox>(inbox,
        detail::handle_all<Part>(std::move(inner), std::move(handler)));
  } else {
    return computation<handled_yield_t<Part, Yield, Handler>, Inbox>(inbox,
        detail::handle_some<Part>(std::move(inner), std::move(handler)));
  }
}
