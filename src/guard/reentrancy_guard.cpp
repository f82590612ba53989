#include <spdlog/spdlog.h>
#include <strongbox/guard/reentrancy_guard.hpp>

namespace strongbox::guard {

bool reentrancy_guard::enter() {
  if (state_ == latch_state_t::entered) {
    spdlog::warn("Rejected reentrant call into guarded operation");
    return false;
  }
  state_ = latch_state_t::entered;
  return true;
}

void reentrancy_guard::exit() noexcept {
  state_ = latch_state_t::not_entered;
}

std::optional<reentrancy_guard::entry> reentrancy_guard::acquire() {
  if (!enter()) {
    return std::nullopt;
  }
  return std::optional<entry>{std::in_place, *this};
}

}  // namespace strongbox::guard
