#pragma once

#include <cstdint>
#include <functional>

#include "arlink/tracking/DetectionTypes.h"

namespace arlink::tracking {

enum class TrackingStatus {
  SEARCHING,  // no box this cycle (initial state)
  LOCKED,     // valid box this cycle
  LOST        // detection attempt failed this cycle
};

const char* ToString(TrackingStatus status);

// Operator-facing status line.
const char* ToHudText(TrackingStatus status);

// Derives the tracking status from detection cycles. One transition per cycle,
// no debounce, no terminal state.
class TrackingStateMachine {
 public:
  using TransitionListener = std::function<void(TrackingStatus from, TrackingStatus to)>;

  TrackingStatus Update(const CycleResult& result);
  void Reset();

  void SetTransitionListener(TransitionListener listener);

  [[nodiscard]] TrackingStatus status() const noexcept { return status_; }
  [[nodiscard]] std::uint64_t cycle_count() const noexcept { return cycle_count_; }

 private:
  TrackingStatus status_{TrackingStatus::SEARCHING};
  std::uint64_t cycle_count_{0};
  TransitionListener listener_;
};

}  // namespace arlink::tracking
