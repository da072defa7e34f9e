#pragma once

#include <string>

namespace flasher {

enum class FlasherState {
    Initial,
    Identified,
    ConfigRead,
    Unprotect,
    Erased,
    KeyReady,
    Programmed,
    Verified,
    Reset,
    Done,
    Error
};

std::string toString(FlasherState state);

} // namespace flasher
