#include "capture/capture_types.hpp"

namespace camgate::capture {

const char* ToString(CaptureOutcome outcome) {
  switch (outcome) {
  case CaptureOutcome::kPending:
    return "pending";
  case CaptureOutcome::kSucceeded:
    return "succeeded";
  case CaptureOutcome::kTimedOut:
    return "timed_out";
  case CaptureOutcome::kDenied:
    return "denied";
  }
  return "pending";
}

} // namespace camgate::capture
