#pragma once

#include "FlasherState.hpp"

#include <chrono>
#include <cstddef>

namespace flasher {

class FlasherError;

// Observer of an IspFlasher or a FlasherBase job. Called on the thread that
// runs the ISP sequence.
class FlasherCallback {
public:
  FlasherCallback() = default;
  virtual ~FlasherCallback() = default;

  // currentValue and maxValue are image bytes.
  virtual void OnProgress(std::chrono::milliseconds elapsed,
                          size_t currentValue, size_t maxValue) = 0;
  virtual void OnState(FlasherState state) = 0;
  // Called once per failed step, before the error is thrown to the caller.
  virtual void OnError(const FlasherError& error) {
    (void)error;
  }
};

} // namespace flasher
