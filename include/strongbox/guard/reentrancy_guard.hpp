#pragma once

#include <cstdint>
#include <optional>

namespace strongbox::guard {

enum class latch_state_t : uint8_t { not_entered = 0, entered = 1 };

/// Two-state latch protecting operations that hand control to external code.
///
/// A second enter() while entered is refused, never queued. The latch is not
/// synchronized; the owning ledger serializes access to it.
class reentrancy_guard final {
 public:
  /// Scoped hold on the latch. Destruction resets the latch on every path,
  /// including exception unwind.
  class entry final {
   public:
    explicit entry(reentrancy_guard& guard) : guard_{&guard} {}
    entry(const entry&) = delete;
    entry& operator=(const entry&) = delete;
    entry(entry&& other) noexcept : guard_{other.guard_} {
      other.guard_ = nullptr;
    }
    entry& operator=(entry&&) = delete;
    ~entry() {
      if (guard_ != nullptr) {
        guard_->exit();
      }
    }

   private:
    reentrancy_guard* guard_;
  };

  reentrancy_guard() = default;
  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

  /// Returns false, leaving the latch untouched, when already entered.
  [[nodiscard]] bool enter();

  /// Unconditionally resets to not_entered.
  void exit() noexcept;

  /// Enter and return the scoped hold, or std::nullopt on reentry.
  [[nodiscard]] std::optional<entry> acquire();

  latch_state_t state() const { return state_; }
  bool entered() const { return state_ == latch_state_t::entered; }

 private:
  latch_state_t state_{latch_state_t::not_entered};
};

}  // namespace strongbox::guard
