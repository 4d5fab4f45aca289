// Test case "contract"
// Misuse the types cannot rule out is fatal. Every case runs in a child
// process that must die with SIGABRT.

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cassert>
#include <coroutine>
#include <csignal>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "eff-coro.hpp"
#include "fmt/core.h"

struct Ping : public effect<int, int> {};
using ping = effect_set<Ping>;
using ping_computation = computation<ping::request_t, ping::result_t>;

struct Pong : public effect<unit_t, int> {};
using ping_pong = effect_set<Ping, Pong>;

// What the child wrote to stderr, if it died of SIGABRT.
template <typename Body>
std::optional<std::string> abort_message(Body body) {
  std::fflush(stdout);
  std::fflush(stderr);
  int fds[2];
  int piped = pipe(fds);
  assert(piped == 0);
  pid_t pid = fork();
  assert(pid >= 0);
  if (pid == 0) {
    close(fds[0]);
    dup2(fds[1], STDERR_FILENO);
    body();
    _exit(0);
  }
  close(fds[1]);
  std::string text;
  char buffer[512];
  ssize_t n;
  while ((n = read(fds[0], buffer, sizeof(buffer))) > 0) {
    text.append(buffer, static_cast<std::size_t>(n));
  }
  close(fds[0]);
  int status = 0;
  pid_t waited = waitpid(pid, &status, 0);
  assert(waited == pid);
  if (!WIFSIGNALED(status) || WTERMSIG(status) != SIGABRT) {
    return std::nullopt;
  }
  return text;
}

template <typename Body>
bool aborts(Body body) {
  return abort_message(std::move(body)).has_value();
}

bool mentions(const std::optional<std::string>& text, std::string_view what) {
  return text && text->find(what) != std::string::npos;
}

routine<ping::request_t> pinger(mailbox<ping::result_t> inbox, int* seen) {
  *seen = co_await raise<Ping>(inbox, 1);
}

routine<ping_pong::request_t> ping_twice(mailbox<ping_pong::result_t> inbox) {
  co_await raise<Ping>(inbox, 1);
  co_await raise<Ping>(inbox, 2);
}

routine<ping::request_t> reenter(
    mailbox<ping::result_t>, ping_computation** self) {
  (*self)->resume();
  co_return;
}

routine<ping::request_t> bare_suspend(mailbox<ping::result_t>) {
  co_await std::suspend_always{};
}

ping_computation make_pinger(int* seen) {
  return make_computation<ping::result_t>(
      [seen](auto inbox) { return pinger(inbox, seen); });
}

int main() {
  int seen = 0;

  assert(aborts([&seen] {
    auto c = make_pinger(&seen);
    c.resume();
    c.put(ping::result_t::make<Ping>(2));
    assert(!c.resume());
    c.resume();
  }));

  assert(aborts([&seen] {
    auto c = make_pinger(&seen);
    auto d = std::move(c);
    c.resume();
  }));

  assert(aborts([] {
    ping_computation* self = nullptr;
    auto c = make_computation<ping::result_t>(
        [&self](auto inbox) { return reenter(inbox, &self); });
    self = &c;
    c.resume();
  }));

  assert(aborts([] {
    auto c = make_computation<ping::result_t>(
        [](auto inbox) { return bare_suspend(inbox); });
    c.resume();
  }));

  assert(aborts([&seen] { make_pinger(&seen).assert_handled().run(); }));

  // resumed without anything in the mailbox
  assert(mentions(abort_message([&seen] {
    auto c = make_pinger(&seen);
    c.resume();
    c.resume();
  }),
      "fatal: no result delivered for Ping"));

  assert(mentions(abort_message([] {
    auto c = make_computation<ping_pong::result_t>(
        [](auto inbox) { return ping_twice(inbox); });
    c.resume();
    c.put(ping_pong::result_t::make<Pong>(5));
    c.resume();
  }),
      "fatal: expected a result for Ping, got Pong(5)"));

  assert(aborts([&seen] {
    auto c = make_pinger(&seen).handle<Ping>(
        [](int) -> int { throw std::runtime_error("down"); });
    try {
      c.resume();
    } catch (const std::runtime_error&) {
    }
    c.resume();
  }));

  make_pinger(&seen)
      .handle<Ping>([](int in) -> int { return in + 1; })
      .assert_handled()
      .run();
  assert(seen == 2);

  fmt::print("contract: ok\n");
  return 0;
}
