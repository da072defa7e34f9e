#pragma once

#include "FlasherBase.hpp"

namespace flasher {

// Full flash (unprotect, erase, key, program), then verify and reset.
class FlashJob: public FlasherBase {
public:
    explicit FlashJob(FlasherParameters&& flasherParameters);
    ~FlashJob();

private:
    void startImpl() override;
};

} // namespace flasher
