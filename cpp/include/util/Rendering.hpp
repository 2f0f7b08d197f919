#pragma once

#include <cstdint>
#include <unistd.h>
#include <vector>

namespace util {

/*
 * Process-wide choice between plain-text and terminal output.
 *
 * The base mode is kTerminal if stdout is a tty and kText otherwise. Board printers consult mode()
 * to decide whether to emit ANSI colors. Tests force kText with set(), or scope an override with
 * Guard:
 *
 *   {
 *     util::Rendering::Guard guard(util::Rendering::kTerminal);
 *     IO::print_state(ss, state);  // colored
 *   }
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  // Pushes mode on construction, pops it on destruction.
  struct Guard {
    Guard(Mode mode);
    ~Guard();
  };

  static Mode mode();

  // Replaces the base mode. Overrides pushed on top of it are unaffected.
  static void set(Mode mode);

  static void push(Mode mode);

  // Throws util::Exception if only the base mode is left.
  static void pop();

 private:
  Rendering();
  static Rendering& instance();

  using mode_stack_t = std::vector<Mode>;
  mode_stack_t mode_stack_;
};

}  // namespace util

#include "inline/util/Rendering.inl"
