#include "eff-coro.hpp"
#include <cxxabi.h>
#include <libunwind.h>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "fmt/core.h"

std::string demangle(const char* name) {
  int status;
  char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
  if (status == 0) {
    std::string result(demangled);
    free(demangled);
    return result;
  } else {
    return name;
  }
}

auto fmt::formatter<unit_t>::format(unit_t c, format_context& ctx) const
    -> format_context::iterator {
  string_view name = "()";
  return formatter<string_view>::format(name, ctx);
}

void print_frames(const char* prefix) {
  unw_cursor_t cursor;
  unw_context_t uc;
  if (unw_getcontext(&uc) != 0 || unw_init_local(&cursor, &uc) != 0) {
    fmt::print(stderr, "{:16} <no unwind context>\n", prefix);
    return;
  }
  int i = 0;
  while (unw_step(&cursor) > 0) {
    unw_word_t sp, ip, off;
    unw_get_reg(&cursor, UNW_REG_SP, &sp);
    unw_get_reg(&cursor, UNW_REG_IP, &ip);
    char proc_name[1000];
    if (unw_get_proc_name(&cursor, proc_name, sizeof(proc_name), &off) != 0) {
      fmt::print(stderr, "{:16} [{}] sp={:#x} ip={:#x} ??\n", prefix, i++, sp,
          ip);
      continue;
    }
    fmt::print(stderr, "{:16} [{}] sp={:#x} ip={:#x} {} +{:#x}\n", prefix, i++,
        sp, ip, demangle(proc_name), off);
  }
}

void contract_violation(std::string_view what) {
  fmt::print(stderr, "fatal: {}\n", what);
  print_frames("contract");
  std::fflush(stderr);
  std::abort();
}
