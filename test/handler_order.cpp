// Test case "handler_order"
// Handlers attach one slice at a time, in any order, or as one subset
// handler; what is not handled yet surfaces to whoever drives the layer.

#include <cassert>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "eff-coro.hpp"
#include "fmt/core.h"

struct Get : public effect<unit_t, int> {};
struct Set : public effect<int, unit_t> {};
struct Log : public effect<std::string, unit_t> {};

using all = effect_set<Get, Set, Log>;
using inbox_t = all::result_t;

routine<all::request_t> doubler(mailbox<inbox_t> inbox, int rounds) {
  for (int i = 0; i < rounds; i++) {
    auto value = co_await raise<Get>(inbox, {});
    co_await raise<Log>(inbox, fmt::format("{} -> {}", value, value * 2));
    co_await raise<Set>(inbox, value * 2);
  }
}

auto make(int rounds) {
  return make_computation<inbox_t>(
      [rounds](auto inbox) { return doubler(inbox, rounds); });
}

void get_set_log() {
  int s = 1;
  std::vector<std::string> lines;
  make(3)
      .handle<Get>([&s](unit_t) -> int { return s; })
      .handle<Set>([&s](int in) -> unit_t {
        s = in;
        return {};
      })
      .handle<Log>([&lines](std::string line) -> unit_t {
        lines.push_back(std::move(line));
        return {};
      })
      .run();
  assert(s == 8);
  assert((lines ==
      std::vector<std::string>{"1 -> 2", "2 -> 4", "4 -> 8"}));
}

void log_set_get() {
  int s = 3;
  int logged = 0;
  auto c = make(2).handle<Log>([&logged](std::string) -> unit_t {
    ++logged;
    return {};
  });
  static_assert(
      std::is_same_v<decltype(c)::yield_t, requests<Get, Set>>);
  auto d = std::move(c).handle<Set>([&s](int in) -> unit_t {
    s = in;
    return {};
  });
  static_assert(std::is_same_v<decltype(d)::yield_t, requests<Get>>);
  std::move(d).handle<Get>([&s](unit_t) -> int { return s; }).run();
  assert(s == 12);
  assert(logged == 2);
}

void subset_handler() {
  int s = 5;
  std::vector<std::string> lines;
  using state = effect_set<Set, Get>;
  make(1)
      .handle<state>([&s](state::request_t request) -> state::result_t {
        if (std::holds_alternative<raised<Get>>(request)) {
          return state::result_t::make<Get>(s);
        }
        s = std::get<raised<Set>>(request).value;
        return state::result_t::make<Set>({});
      })
      .handle<Log>([&lines](std::string line) -> unit_t {
        lines.push_back(std::move(line));
        return {};
      })
      .run();
  assert(s == 10);
  assert((lines == std::vector<std::string>{"5 -> 10"}));
}

// The outer caller plays the missing handler by hand.
void surfaced_remainder() {
  int s = 7;
  auto c = make(1).handle<Get>([&s](unit_t) -> int { return s; });
  int surfaced = 0;
  while (auto request = c.resume()) {
    ++surfaced;
    if (auto* log = std::get_if<raised<Log>>(&*request)) {
      assert(log->value == "7 -> 14");
      c.put(inbox_t::make<Log>({}));
    } else {
      s = std::get<raised<Set>>(*request).value;
      c.put(inbox_t::make<Set>({}));
    }
  }
  assert(surfaced == 2);
  assert(s == 14);
}

int main() {
  get_set_log();
  log_set_get();
  subset_handler();
  surfaced_remainder();
  fmt::print("handler_order: ok\n");
  return 0;
}
