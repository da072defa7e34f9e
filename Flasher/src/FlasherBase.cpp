#include "flasher/FlasherBase.hpp"

#include "flasher/FlasherCallback.hpp"

#include <easylogging++.h>

#include <algorithm>
#include <stdexcept>

namespace flasher {

FlasherBase::FlasherBase(FlasherParameters&& flasherParameters)
    : _flasherParameters{ std::move(flasherParameters) }
    , _currentProgress{ 0 }
    , _maximumProgress{ 0 }
    , _currentState{ FlasherState::Initial }
    , _startTime{ std::chrono::steady_clock::now() }
    , _flasherThread{}
{
    if(!_flasherParameters.flasher) {
        throw std::invalid_argument("Flasher job requires an open device");
    }
}

FlasherBase::~FlasherBase()
{
    join();
}

FlasherState FlasherBase::getCurrentState() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _currentState;
}

size_t FlasherBase::getCurrentProgress() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _currentProgress;
}

size_t FlasherBase::getMaximumProgress() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _maximumProgress;
}

std::string FlasherBase::getLastError() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _lastError;
}

void FlasherBase::registerCallback(FlasherCallback &callback)
{
    std::unique_lock<std::mutex> lock{_mutex};
    _callbacks.push_back(&callback);
}

void FlasherBase::unregisterCallback(FlasherCallback &callback)
{
    std::unique_lock<std::mutex> lock{_mutex};
    _callbacks.erase(std::remove(_callbacks.begin(), _callbacks.end(), &callback),
                     _callbacks.end());
}

void FlasherBase::start()
{
    runOnThread([this]() {
        startImpl();
    });
}

void FlasherBase::join()
{
    if(_flasherThread.joinable()) {
        _flasherThread.join();
    }
}

const FlasherParameters& FlasherBase::getFlasherParameters() const
{
    return _flasherParameters;
}

void FlasherBase::setCurrentState(FlasherState state)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _currentState = state;
    }

    for(const auto& callback: getCallbacks()) {
        callback->OnState(state);
    }
}

void FlasherBase::setCurrentProgress(size_t currentProgress)
{
    size_t current;
    size_t maximum;
    std::chrono::milliseconds elapsed;
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _currentProgress = std::min(currentProgress, _maximumProgress);
        current = _currentProgress;
        maximum = _maximumProgress;
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - _startTime);
    }

    for(const auto& callback: getCallbacks()) {
        callback->OnProgress(elapsed, current, maximum);
    }
}

void FlasherBase::setMaximumProgress(size_t maximumProgress)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _maximumProgress = maximumProgress;
    _currentProgress = std::min(_currentProgress, _maximumProgress);
}

void FlasherBase::setLastError(const std::string& message)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _lastError = message;
}

void FlasherBase::runOnThread(std::function<void()> callable)
{
    if(getCurrentState() != FlasherState::Initial) {
        throw std::runtime_error("Flasher not in initial state");
    }

    {
        std::unique_lock<std::mutex> lock(_mutex);
        _startTime = std::chrono::steady_clock::now();
    }
    _flasherThread = std::thread([this, callable]() {
        try {
            callable();
        }
        catch(const std::exception& ex) {
            LOG(ERROR) << "Exception during flashing, what = " << ex.what();
            setLastError(ex.what());
            setCurrentState(FlasherState::Error);
        }
    });
}

std::vector<FlasherCallback *> FlasherBase::getCallbacks() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _callbacks;
}

} // namespace flasher
