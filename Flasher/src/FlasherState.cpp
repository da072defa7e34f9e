#include "flasher/FlasherState.hpp"

namespace flasher {

std::string toString(FlasherState state)
{
    switch(state) {
    case FlasherState::Initial:
        return "Initial";
    case FlasherState::Identified:
        return "Identified";
    case FlasherState::ConfigRead:
        return "ConfigRead";
    case FlasherState::Unprotect:
        return "Unprotect";
    case FlasherState::Erased:
        return "Erased";
    case FlasherState::KeyReady:
        return "KeyReady";
    case FlasherState::Programmed:
        return "Programmed";
    case FlasherState::Verified:
        return "Verified";
    case FlasherState::Reset:
        return "Reset";
    case FlasherState::Done:
        return "Done";
    case FlasherState::Error:
        return "Error";
    }
    return {};
}

} // namespace flasher
