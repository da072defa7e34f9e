#pragma once

#include "FlasherState.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace flasher {

class FlasherCallback;
class IspFlasher;

struct FlasherParameters {
    std::shared_ptr<IspFlasher> flasher;
    const std::vector<uint8_t> firmware;
};

// Runs a flashing job on a worker thread. Progress and state are polled
// through the getters or pushed to registered callbacks.
class FlasherBase {
public:
    explicit FlasherBase(FlasherParameters&& flasherParameters);
    virtual ~FlasherBase();

    FlasherState getCurrentState() const;
    size_t getCurrentProgress() const;
    size_t getMaximumProgress() const;
    std::string getLastError() const;

    void registerCallback(FlasherCallback &callback);
    void unregisterCallback(FlasherCallback &callback);

    void start();
    void join();

protected:
    virtual void startImpl() = 0;

    const FlasherParameters& getFlasherParameters() const;

    void setCurrentState(FlasherState state);
    void setCurrentProgress(size_t currentProgress);
    void setMaximumProgress(size_t maximumProgress);
    void setLastError(const std::string& message);

    void runOnThread(std::function<void()> callable);

private:
    std::vector<FlasherCallback *> getCallbacks() const;

private:
    FlasherParameters _flasherParameters;
    mutable std::mutex _mutex;
    size_t _currentProgress;
    size_t _maximumProgress;
    FlasherState _currentState;
    std::string _lastError;
    std::chrono::steady_clock::time_point _startTime;

    std::thread _flasherThread;

    std::vector<FlasherCallback *> _callbacks;
};

} // namespace flasher
