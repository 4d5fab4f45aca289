#pragma once

// Effect runtime on stackless coroutines: computations suspend with effect
// requests, handler layers answer them one slice of the request sum at a
// time, and a cooperative scheduler multiplexes spawned tasks under a root.

#include "eff-coro/algebra.hpp"
#include "eff-coro/computation.hpp"
#include "eff-coro/diagnostics.hpp"
#include "eff-coro/effect.hpp"
#include "eff-coro/handler.hpp"
#include "eff-coro/mailbox.hpp"
#include "eff-coro/spawn.hpp"
#include "eff-coro/task.hpp"
