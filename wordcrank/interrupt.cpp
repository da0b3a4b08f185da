#include "interrupt.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace wordcrank {
namespace {
static_assert(std::atomic<bool>::is_always_lock_free);
static_assert(std::atomic<std::atomic<bool>*>::is_always_lock_free);

// the flag of the live InterruptFlag.  A signal handler has no other way to
// find it.
std::atomic<std::atomic<bool>*> active{nullptr};

void on_signal(int) {
    if (auto* const flag = active.load()) {
        flag->store(true);
    }
}

void install(int const signal, struct sigaction* const previous) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    if (sigaction(signal, &action, previous) != 0) {
        throw std::runtime_error{std::string{"cannot install signal handler: "} +
                                 std::strerror(errno)};
    }
}
} // namespace

InterruptFlag::InterruptFlag() {
    std::atomic<bool>* expected = nullptr;
    if (!active.compare_exchange_strong(expected, &requested_)) {
        throw std::logic_error{"an InterruptFlag already exists"};
    }
    try {
        install(SIGINT, &previousInterrupt_);
    } catch (std::runtime_error const&) {
        active.store(nullptr);
        throw;
    }
    try {
        install(SIGTERM, &previousTerminate_);
    } catch (std::runtime_error const&) {
        sigaction(SIGINT, &previousInterrupt_, nullptr);
        active.store(nullptr);
        throw;
    }
}

InterruptFlag::~InterruptFlag() {
    sigaction(SIGINT, &previousInterrupt_, nullptr);
    sigaction(SIGTERM, &previousTerminate_, nullptr);
    active.store(nullptr);
}
} // namespace wordcrank
