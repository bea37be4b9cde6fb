#include "arlink/tracking/TrackingStateMachine.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace arlink::tracking {

const char* ToString(TrackingStatus status) {
  switch (status) {
    case TrackingStatus::SEARCHING:
      return "searching";
    case TrackingStatus::LOCKED:
      return "locked";
    case TrackingStatus::LOST:
      return "lost";
  }
  return "unknown";
}

const char* ToHudText(TrackingStatus status) {
  switch (status) {
    case TrackingStatus::SEARCHING:
      return "SEARCHING...";
    case TrackingStatus::LOCKED:
      return "TRACKING LOCKED";
    case TrackingStatus::LOST:
      return "TRACKING LOST";
  }
  return "INITIALIZING";
}

TrackingStatus TrackingStateMachine::Update(const CycleResult& result) {
  TrackingStatus next = TrackingStatus::SEARCHING;
  if (result.failed) {
    next = TrackingStatus::LOST;
  } else if (IsValid(result.box)) {
    next = TrackingStatus::LOCKED;
  }

  ++cycle_count_;
  const TrackingStatus previous = status_;
  status_ = next;
  if (previous != next) {
    spdlog::debug("Tracking status {} -> {}", ToString(previous), ToString(next));
    if (listener_) {
      listener_(previous, next);
    }
  }
  return status_;
}

void TrackingStateMachine::Reset() {
  status_ = TrackingStatus::SEARCHING;
  cycle_count_ = 0;
}

void TrackingStateMachine::SetTransitionListener(TransitionListener listener) {
  listener_ = std::move(listener);
}

}  // namespace arlink::tracking
