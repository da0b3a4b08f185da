#ifndef wordcrank_interrupt_hpp
#define wordcrank_interrupt_hpp

#include <atomic>
#include <signal.h>

namespace wordcrank {
/// While an InterruptFlag exists, SIGINT and SIGTERM set it instead of
/// terminating the process.  The previous handlers are restored on
/// destruction.  Only one InterruptFlag may exist at a time.
class InterruptFlag {
  public:
    InterruptFlag();
    InterruptFlag(InterruptFlag const&)            = delete;
    InterruptFlag& operator=(InterruptFlag const&) = delete;
    ~InterruptFlag();

    bool requested() const {
        return requested_.load();
    }

    void request() {
        requested_.store(true);
    }

  private:
    std::atomic<bool> requested_{false};
    struct sigaction  previousInterrupt_;
    struct sigaction  previousTerminate_;
};
} // namespace wordcrank

#endif // include guard
