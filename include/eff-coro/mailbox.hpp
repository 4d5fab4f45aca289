#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "eff-coro/effect.hpp"

/** Single-slot cell from a handler or the scheduler back to a suspended
    computation.

    Copies are handles onto the same slot; the slot lives as long as the
    longest holder. A second `put` before a `take` discards the first value.
    There is no locking: one writer and one reader, never at the same time.
*/
template <typename T>
class mailbox {
  std::shared_ptr<std::optional<T>> slot;

 public:
  mailbox() : slot(std::make_shared<std::optional<T>>()) {}

  void put(T value) { slot->emplace(std::move(value)); }

  std::optional<T> take() { return std::exchange(*slot, std::nullopt); }

  bool has_value() const noexcept { return slot->has_value(); }

  long use_count() const noexcept { return slot.use_count(); }

  friend bool operator==(const mailbox& a, const mailbox& b) noexcept {
    return a.slot == b.slot;
  }
};

// Takes the pending result of kind `Effect`. A pending value of another kind
// is consumed all the same and reported as empty.
template <typename Effect, typename... Effects>
std::optional<typename Effect::resume_t> take_result(
    mailbox<effect_result<Effects...>>& inbox) {
  auto value = inbox.take();
  if (!value || !value->template holds<Effect>()) {
    return std::nullopt;
  }
  return std::move(*value).template get<Effect>();
}
