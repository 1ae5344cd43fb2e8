#include "signing_lock.hpp"
#include "hex_utils.hpp"

namespace securewallet {

std::shared_ptr<std::mutex> SigningLockRegistry::mutex_for(const Address& address) {
    std::lock_guard<std::mutex> lock(mu_);
    auto& entry = locks_[HexUtils::encode(address.bytes())];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

std::unique_lock<std::mutex> SigningLockRegistry::acquire(const Address& address) {
    return std::unique_lock<std::mutex>(*mutex_for(address));
}

std::unique_lock<std::mutex> SigningLockRegistry::try_acquire(const Address& address) {
    return std::unique_lock<std::mutex>(*mutex_for(address), std::try_to_lock);
}

} // namespace securewallet
