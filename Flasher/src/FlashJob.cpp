#include "flasher/FlashJob.hpp"

#include "flasher/FlasherCallback.hpp"
#include "flasher/IspFlasher.hpp"

#include <common/protocols/IspError.hpp>

#include <easylogging++.h>

#define HFSM2_ENABLE_ALL
#include <hfsm2/machine.hpp>

namespace flasher {

    class FlashJobImpl: public FlasherCallback {
    public:
        FlashJobImpl(IspFlasher& flasher,
                     const std::vector<uint8_t>& firmware,
                     const std::function<void(FlasherState)>& stateUpdater,
                     const std::function<void(size_t)>& progressUpdater,
                     const std::function<void(const std::string&)>& errorUpdater)
            : _flasher{ flasher }
            , _firmware{ firmware }
            , _isFailed{ false }
            , _progressOffset{ 0 }
            , _stateUpdater{ stateUpdater }
            , _progressUpdater{ progressUpdater }
            , _errorUpdater{ errorUpdater }
        {
        }

        size_t getMaximumProgress() const
        {
            return _firmware.size() * 2;
        }

        void program()
        {
            _progressOffset = 0;
            runStep([this]() {
                _flasher.flash(_firmware);
            });
        }

        void verify()
        {
            _progressOffset = _firmware.size();
            runStep([this]() {
                _flasher.verify(_firmware);
            });
        }

        void reset()
        {
            if (!_isFailed) {
                runStep([this]() {
                    _flasher.reset();
                });
            }
        }

        void done()
        {
            _stateUpdater(FlasherState::Done);
        }

        void error()
        {
            _stateUpdater(FlasherState::Error);
        }

        bool isFailed() const
        {
            return _isFailed;
        }

        void OnProgress(std::chrono::milliseconds, size_t currentValue, size_t) override
        {
            _progressUpdater(_progressOffset + currentValue);
        }

        void OnState(FlasherState state) override
        {
            // Done and Error belong to the job, not to a single step.
            if (state != FlasherState::Error) {
                _stateUpdater(state);
            }
        }

    private:
        template<typename Callable>
        void runStep(Callable&& callable)
        {
            try {
                callable();
            }
            catch (const common::IspError& ex) {
                setFailed(ex.what());
            }
        }

        void setFailed(const std::string& message)
        {
            _isFailed = true;
            _errorUpdater(message);
        }

    private:
        IspFlasher& _flasher;
        const std::vector<uint8_t>& _firmware;
        bool _isFailed;
        size_t _progressOffset;
        const std::function<void(FlasherState)> _stateUpdater;
        const std::function<void(size_t)> _progressUpdater;
        const std::function<void(const std::string&)> _errorUpdater;
    };

    using M = hfsm2::MachineT<hfsm2::Config::ContextT<FlashJobImpl&>>;
    using FSM = M::PeerRoot<
        M::Composite<
            struct StartWork,
            struct Program,
            struct Verify>,
        M::Composite<
            struct Finish,
            struct Reset,
            struct Done,
            struct Error>
        >;

    struct BaseState : public FSM::State {
    public:
        void update(FullControl& control)
        {
            if (!control.context().isFailed()) {
                control.succeed();
            }
            else {
                control.fail();
            }
        }
    };

    struct BaseSuccesState : public FSM::State {
    public:
        void update(FullControl& control)
        {
            control.succeed();
        }
    };

    struct StartWork : public FSM::State {
        void enter(PlanControl& control)
        {
            auto plan = control.plan();
            plan.change<Program, Verify>();
        }

        void planSucceeded(FullControl& control)
        {
            control.changeTo<Finish>();
        }

        void planFailed(FullControl& control)
        {
            control.changeTo<Finish>();
        }
    };

    struct Program : public BaseState {
        void enter(PlanControl& control)
        {
            control.context().program();
        }
    };

    struct Verify : public BaseState {
        void enter(PlanControl& control)
        {
            control.context().verify();
        }
    };

    struct Finish : public FSM::State {
        void enter(PlanControl& control)
        {
            auto plan = control.plan();
            if (control.context().isFailed()) {
                plan.change<Reset, Error>();
            }
            else {
                plan.change<Reset, Done>();
            }
        }
    };

    // Skipped after a failure, the device stays in the bootloader.
    struct Reset : public BaseSuccesState {
        void enter(PlanControl& control)
        {
            control.context().reset();
        }
    };

    struct Done : public BaseSuccesState {
        void enter(PlanControl& control)
        {
            control.context().done();
        }
    };

    struct Error : public BaseSuccesState {
        void enter(PlanControl& control)
        {
            control.context().error();
        }
    };

    FlashJob::FlashJob(FlasherParameters&& flasherParameters)
        : FlasherBase{ std::move(flasherParameters) }
    {
    }

    FlashJob::~FlashJob()
    {
        join();
    }

    void FlashJob::startImpl()
    {
        auto& flasher{ *getFlasherParameters().flasher };
        FlashJobImpl impl(flasher, getFlasherParameters().firmware,
            [this](FlasherState state) {
                setCurrentState(state);
            },
            [this](size_t progress) {
                setCurrentProgress(progress);
            },
            [this](const std::string& message) {
                LOG(ERROR) << "Flash job failed: " << message;
                setLastError(message);
            });

        setMaximumProgress(impl.getMaximumProgress());

        flasher.registerCallback(impl);
        try {
            FSM::Instance fsm{ impl };

            while (getCurrentState() != FlasherState::Done && getCurrentState() != FlasherState::Error) {
                fsm.update();
            }
        }
        catch (...) {
            flasher.unregisterCallback(impl);
            throw;
        }
        flasher.unregisterCallback(impl);
    }

} // namespace flasher
