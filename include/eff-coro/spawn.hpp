#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <scope_guard.hpp>
#include <type_traits>
#include <utility>
#include <variant>

#include "eff-coro/computation.hpp"
#include "eff-coro/diagnostics.hpp"
#include "eff-coro/task.hpp"
#include "fmt/core.h"

// Cooperative scheduler: one root computation plus the tasks it spawns, all
// on the caller's thread. A tick resumes the root once, then polls every
// live task once in ascending id order. At most one forwarded request is
// outstanding at any time; surfacing it suspends the whole scheduler until
// the outer handler has answered. Answers to task requests land in the
// root's mailbox unless `spawn_options::answers` routes them to the task.

namespace detail {

template <typename Task, typename TaskComputation, typename Constructor>
void admit(std::map<task_id_t<Task>, TaskComputation>& tasks,
    Task task,
    Constructor& make_task,
    const spawn_options& options) {
  auto id = task.task_id();
  auto found = tasks.find(id);
  if (found == tasks.end()) {
#ifdef EFF_CORO_TRACE
    fmt::print("[spawn] task {}\n", describe(id));
#endif
    tasks.emplace(std::move(id), std::invoke(make_task, std::move(task)));
    return;
  }

  switch (options.on_duplicate) {
    case duplicate_policy::replace:
#ifdef EFF_CORO_TRACE
      fmt::print("[spawn] task {} replaced\n", describe(id));
#endif
      found->second = std::invoke(make_task, std::move(task));
      return;
    case duplicate_policy::ignore:
#ifdef EFF_CORO_TRACE
      fmt::print("[spawn] task {} already running, ignored\n", describe(id));
#endif
      return;
    case duplicate_policy::reject:
      throw duplicate_task(
          fmt::format("task {} is already running", describe(id)));
  }
}

template <typename Task, typename Request, typename Inbox, typename Constructor>
routine<Request> schedule(computation<root_request<Task, Request>, Inbox> root,
    Constructor make_task,
    spawn_options options) {
  using task_computation = std::invoke_result_t<Constructor&, Task>;
  using table = std::map<task_id_t<Task>, task_computation>;

  auto inbox = root.inbox();
  bool root_alive = true;
  table tasks;
#ifdef EFF_CORO_TRACE
  std::uint64_t tick = 0;
#endif

  while (true) {
#ifdef EFF_CORO_TRACE
    fmt::print("[tick {}] root {}, {} task(s)\n", tick++,
        root_alive ? "alive" : "done", tasks.size());
#endif
    if (root_alive) {
      if (auto request = root.resume()) {
        if (request->index() == 0) {
          admit(tasks, std::move(std::get<0>(*request).task), make_task,
              options);
        } else {
          co_yield std::get<1>(std::move(*request));
        }
      } else {
        root_alive = false;
      }
    }

    table polled;
    for (auto& [id, task] : tasks) {
      auto request = task.resume();
      if (!request) {
#ifdef EFF_CORO_TRACE
        fmt::print("[task {}] completed\n", describe(id));
#endif
        continue;
      }
      auto& kept = polled.emplace(id, std::move(task)).first->second;

      if (request->index() == 1) {
        if (root_alive) {
          inbox.put(std::move(std::get<1>(*request).value));
        }
#ifdef EFF_CORO_TRACE
        fmt::print("[task {}] output{}\n", describe(id),
            root_alive ? "" : " dropped, root is done");
#endif
        continue;
      }

#ifdef EFF_CORO_TRACE
      fmt::print("[task {}] forward {}\n", describe(id),
          describe(std::get<0>(*request)));
#endif
      if (options.answers == answer_routing::root) {
        co_yield std::get<0>(std::move(*request));
        if (!root_alive) {
          // nobody is left to read it
          inbox.take();
        }
        continue;
      }

      // The answer belongs to the task. Whatever the root had pending stays
      // pending.
      auto pending = inbox.take();
      auto restore = sg::make_scope_guard([&inbox, &pending]() noexcept {
        if (pending) {
          inbox.put(std::move(*pending));
        }
      });
      co_yield std::get<0>(std::move(*request));
      if (auto result = inbox.take()) {
        kept.put(std::move(*result));
      }
    }
    tasks = std::move(polled);

    if (!root_alive && tasks.empty()) {
      break;
    }
  }
}

}  // namespace detail

template <typename Task, typename Request, typename Inbox, typename Constructor>
  requires is_task<Task>
computation<Request, Inbox> spawn_tasks(
    computation<root_request<Task, Request>, Inbox> root,
    Constructor make_task,
    spawn_options options) {
  using task_computation = std::invoke_result_t<Constructor&, Task>;
  static_assert(
      std::is_same_v<task_computation,
          computation<task_request<Request, Inbox>, Inbox>>,
      "a task must yield task_request<Request, Inbox> and share the root's "
      "inbox type");

  auto inbox = root.inbox();
  return computation<Request, Inbox>(inbox,
      detail::schedule(std::move(root), std::move(make_task), options));
}
