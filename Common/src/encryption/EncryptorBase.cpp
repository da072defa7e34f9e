#include "common/encryption/EncryptorBase.hpp"

namespace common {

EncryptorBase::EncryptorBase() = default;

EncryptorBase::~EncryptorBase() = default;

} // namespace common
