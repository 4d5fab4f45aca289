#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

// Traffic between the scheduler, its root and the tasks the root spawns.

template <typename Task>
struct spawn_t {
  Task task;
};

template <typename Value>
struct output_t {
  Value value;
};

// The root either asks for a task or forwards any other request.
template <typename Task, typename Request>
using root_request = std::variant<spawn_t<Task>, Request>;

// A task either forwards a request or hands a value to the root.
template <typename Request, typename Value>
using task_request = std::variant<Request, output_t<Value>>;

template <typename Task>
concept is_task = requires(const Task& task) {
  { task.task_id() } -> std::totally_ordered;
};

template <typename Task>
  requires is_task<Task>
using task_id_t = std::decay_t<decltype(std::declval<const Task&>().task_id())>;

enum class duplicate_policy {
  replace,  // the new task takes the slot, the old one is dropped
  ignore,   // the old task keeps running, the descriptor is dropped
  reject,   // the scheduler throws `duplicate_task`
};

// Where the outer answer to a request forwarded by a task goes.
enum class answer_routing {
  root,  // stays in the root's mailbox, like any other result
  task,  // moved into the forwarding task's own mailbox
};

struct spawn_options {
  duplicate_policy on_duplicate = duplicate_policy::replace;
  answer_routing answers = answer_routing::root;
};

class duplicate_task : public std::runtime_error {
 public:
  explicit duplicate_task(const std::string& what)
      : std::runtime_error(what) {}
};

namespace detail {

template <typename Yield>
struct forwarded;

template <typename Task, typename Request>
struct forwarded<std::variant<spawn_t<Task>, Request>> {
  using task_t = Task;
  using type = Request;
};

}  // namespace detail

// What the scheduler surfaces for a root yielding `Yield`.
template <typename Yield>
using forwarded_t = typename detail::forwarded<Yield>::type;
