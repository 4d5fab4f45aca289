#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <functional>
#include <optional>
#include <scope_guard.hpp>
#include <type_traits>
#include <utility>

#include "eff-coro/algebra.hpp"
#include "eff-coro/diagnostics.hpp"
#include "eff-coro/effect.hpp"
#include "eff-coro/mailbox.hpp"
#include "eff-coro/task.hpp"

/** Coroutine type of a computation body.

    The body starts suspended; every `resume()` runs it to the next
    `co_yield` (a pending request) or to its end. An exception escaping the
    body is rethrown from the `resume()` that ran into it.
*/
template <typename Yield>
class routine {
 public:
  struct promise_type {
    std::optional<Yield> current;
    std::exception_ptr exception;
    bool running = false;

    routine get_return_object() {
      return routine(std::coroutine_handle<promise_type>::from_promise(*this));
    }
    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }
    std::suspend_always yield_value(Yield value) {
      current.emplace(std::move(value));
      return {};
    }
    void return_void() noexcept {}
    void unhandled_exception() { exception = std::current_exception(); }
  };

  using handle_type = std::coroutine_handle<promise_type>;

  routine() = default;

  explicit routine(handle_type handle) noexcept : handle(handle) {}

  routine(routine&& other) noexcept
      : handle(std::exchange(other.handle, {})) {}

  routine& operator=(routine&& other) noexcept {
    if (this != &other) {
      if (handle) {
        handle.destroy();
      }
      handle = std::exchange(other.handle, {});
    }
    return *this;
  }

  routine(const routine&) = delete;
  routine& operator=(const routine&) = delete;

  ~routine() {
    if (handle) {
      handle.destroy();
    }
  }

  std::optional<Yield> resume() {
    if (!handle) {
      contract_violation("resume of an empty computation");
    }
    if (handle.done()) {
      contract_violation("resume after completion");
    }
    auto& promise = handle.promise();
    if (promise.running) {
      contract_violation("resume of a computation that is already running");
    }
    promise.running = true;
    auto guard =
        sg::make_scope_guard([&promise]() noexcept { promise.running = false; });

    handle.resume();

    if (promise.exception) {
      std::rethrow_exception(std::exchange(promise.exception, nullptr));
    }
    if (handle.done()) {
      return std::nullopt;
    }
    if (!promise.current) {
      contract_violation("computation suspended without an effect request");
    }
    return std::exchange(promise.current, std::nullopt);
  }

  bool done() const noexcept { return !handle || handle.done(); }

 private:
  handle_type handle;
};

template <typename Yield, typename Inbox>
class computation;

template <typename Part, typename Yield, typename Handler>
concept is_total_handler_of = selects<set_of_t<Yield>, Part> &&
    std::is_invocable_v<Handler&, typename part_traits<Part>::request_t> &&
    std::is_same_v<std::invoke_result_t<Handler&,
                       typename part_traits<Part>::request_t>,
        typename part_traits<Part>::result_t>;

template <typename Part, typename Yield, typename Handler>
concept is_partial_handler_of = selects<set_of_t<Yield>, Part> &&
    std::is_invocable_v<Handler&, typename part_traits<Part>::request_t> &&
    std::is_same_v<std::invoke_result_t<Handler&,
                       typename part_traits<Part>::request_t>,
        outcome<Part>>;

template <typename Part, typename Yield, typename Handler>
concept is_handler_of = is_total_handler_of<Part, Yield, Handler> ||
    is_partial_handler_of<Part, Yield, Handler>;

namespace detail {

// A total handler removes `Part` from the yield; a partial one cannot.
template <typename Part, typename Yield, typename Handler>
struct handled_yield {
  using type = Yield;
};

template <typename Part, typename Yield, typename Handler>
  requires is_total_handler_of<Part, Yield, Handler>
struct handled_yield<Part, Yield, Handler> {
  using type = remainder_t<Part, Yield>;
};

}  // namespace detail

template <typename Part, typename Yield, typename Handler>
using handled_yield_t =
    typename detail::handled_yield<Part, Yield, Handler>::type;

template <typename Yield, typename Constructor>
concept is_task_constructor_of =
    std::is_invocable_v<Constructor&, typename detail::forwarded<Yield>::task_t>;

// Defined in eff-coro/handler.hpp.
template <typename Part, typename Yield, typename Inbox, typename Handler>
  requires is_handler_of<Part, Yield, Handler>
computation<handled_yield_t<Part, Yield, Handler>, Inbox> attach_handler(
    computation<Yield, Inbox> inner, Handler handler);

// Defined in eff-coro/spawn.hpp.
template <typename Task, typename Request, typename Inbox, typename Constructor>
  requires is_task<Task>
computation<Request, Inbox> spawn_tasks(
    computation<root_request<Task, Request>, Inbox> root,
    Constructor make_task,
    spawn_options options);

/** A restartable unit of control flow paired with its mailbox.

    `Yield` is the request sum it may suspend with, `Inbox` the value type
    of the mailbox handlers answer through. Every `&&` member consumes the
    computation and returns the wrapped one; the mailbox is shared between
    all of them.
*/
template <typename Yield, typename Inbox>
class computation {
 public:
  typedef Yield yield_t;
  typedef Inbox inbox_t;

  computation(mailbox<Inbox> inbox, routine<Yield> body)
      : shared_inbox(std::move(inbox)), body(std::move(body)) {}

  // Runs to the next request, or returns empty once the body has completed.
  std::optional<Yield> resume() { return body.resume(); }

  void put(Inbox value) { shared_inbox.put(std::move(value)); }

  mailbox<Inbox> inbox() const { return shared_inbox; }

  bool done() const noexcept { return body.done(); }

  template <typename Part, typename Handler>
    requires is_handler_of<Part, Yield, Handler>
  computation<handled_yield_t<Part, Yield, Handler>, Inbox> handle(
      Handler handler) && {
    return attach_handler<Part>(std::move(*this), std::move(handler));
  }

  template <typename Constructor, typename Root = Yield>
    requires is_task_constructor_of<Root, Constructor>
  computation<forwarded_t<Root>, Inbox> spawn(
      Constructor make_task, spawn_options options = {}) && {
    return spawn_tasks(std::move(*this), std::move(make_task), options);
  }

  // Any request that still surfaces is fatal.
  computation<never, Inbox> assert_handled() &&;

  void run() &&
    requires std::is_same_v<Yield, never>
  {
    auto completed = std::move(body);
    if (completed.resume()) {
      contract_violation("a computation that cannot yield produced a request");
    }
  }

 private:
  mailbox<Inbox> shared_inbox;
  routine<Yield> body;
};

/** Builder entry point: creates the mailbox, hands it to `builder` and pairs
    it with the routine the builder returns.

    The routine outlives the builder, so a builder written as a coroutine
    lambda must not capture anything; pass state in as parameters.
*/
template <typename Inbox, typename Builder>
  requires std::is_invocable_v<Builder&, mailbox<Inbox>>
auto make_computation(Builder builder) {
  using routine_t = std::invoke_result_t<Builder&, mailbox<Inbox>>;
  using yield_t = std::remove_cvref_t<decltype(
      *std::declval<routine_t&>().resume())>;
  mailbox<Inbox> inbox;
  return computation<yield_t, Inbox>(inbox, std::invoke(builder, inbox));
}

// `co_await raise<E>(inbox, value)`: suspends with `raised<E>{value}` and
// resumes with the result the handler left in the mailbox.
template <typename Effect, typename Inbox>
  requires is_effect<Effect>
class raise_awaiter {
  mailbox<Inbox> inbox;
  raised<Effect> request;

 public:
  raise_awaiter(mailbox<Inbox> inbox, typename Effect::raise_t value)
      : inbox(std::move(inbox)), request{std::move(value)} {}

  bool await_ready() const noexcept { return false; }

  template <typename Promise>
  void await_suspend(std::coroutine_handle<Promise> caller) {
    caller.promise().current.emplace(std::move(request));
  }

  typename Effect::resume_t await_resume() {
    auto result = inbox.take();
    if (!result) {
      contract_violation(fmt::format("no result delivered for {}",
          demangle(typeid(Effect).name())));
    }
    if (!result->template holds<Effect>()) {
      contract_violation(fmt::format("expected a result for {}, got {}({})",
          demangle(typeid(Effect).name()), kind_of(*result),
          describe(*result)));
    }
    return std::move(*result).template get<Effect>();
  }
};

template <typename Effect, typename Inbox>
  requires is_effect<Effect>
raise_awaiter<Effect, Inbox> raise(
    mailbox<Inbox> inbox, typename Effect::raise_t value) {
  return raise_awaiter<Effect, Inbox>(std::move(inbox), std::move(value));
}

// ===== implementation =====

namespace detail {

template <typename Yield, typename Inbox>
routine<never> unhandled_guard(computation<Yield, Inbox> inner) {
  while (auto request = inner.resume()) {
    contract_violation(
        fmt::format("unhandled effect request: {}", describe(*request)));
  }
  co_return;
}

}  // namespace detail

template <typename Yield, typename Inbox>
computation<never, Inbox> computation<Yield, Inbox>::assert_handled() && {
  auto inbox = shared_inbox;
  return computation<never, Inbox>(
      inbox, detail::unhandled_guard(std::move(*this)));
}
