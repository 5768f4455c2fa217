#pragma once

namespace star {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request graceful shutdown.
  // Running servers poll IsStopRequested() between two accept attempts.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag so that several tests can raise signals in the same process.
  static void ResetStopRequest();
};

}  // namespace star
