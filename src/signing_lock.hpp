#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "address.hpp"

namespace securewallet {

// Hands out one mutex per address so that at most one signing attempt per
// address is in flight. Mutexes live as long as the registry.
class SigningLockRegistry {
public:
    std::shared_ptr<std::mutex> mutex_for(const Address& address);

    // Blocks until the address is free
    std::unique_lock<std::mutex> acquire(const Address& address);

    // Non-blocking variant; the returned lock does not own the mutex if busy
    std::unique_lock<std::mutex> try_acquire(const Address& address);

private:
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace securewallet
