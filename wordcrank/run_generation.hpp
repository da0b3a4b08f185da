#ifndef wordcrank_run_generation_hpp
#define wordcrank_run_generation_hpp

#include "Console.hpp"
#include "SpaceSpecification.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace wordcrank {
struct RunConfig {
    SpaceSpecification space;

    // each line of the output is prefix + word + suffix
    std::string prefix;
    std::string suffix;

    std::filesystem::path output = "wordlist.txt";

    // stop after this many words (counting words written by earlier, resumed
    // runs)
    std::optional<BigInt> limit;

    // pick up from the output's session record
    bool resume = false;

    // persist progress every this many words
    size_t checkpointInterval = 10000;
};

enum class Outcome {
    // the space or the limit was exhausted; the session record is gone
    Completed,
    // cancelled; the session record holds count
    Paused,
    // an I/O error; error describes it
    Failed,
};

/// The process exit status for outcome: 1 for Failed, 0 otherwise.  A pause
/// is a clean exit.
int exit_code(Outcome outcome);

struct RunResult {
    Outcome                       outcome;
    BigInt                        count;
    std::chrono::duration<double> elapsed;
    std::string                   error;
};

// polled once per word; return true to pause the run
using CancellationCheck = std::function<bool()>;

/// Write the words of config.space to config.output, resuming from the
/// output's session record if config.resume is set.
///
/// Progress is persisted every config.checkpointInterval words and when
/// cancelled returns true.  The record is removed when the run completes,
/// including when it stops at config.limit.
///
/// Throws InvalidSpecification if config.space is invalid; nothing is written
/// in that case.  I/O errors are reported through the Failed outcome.
RunResult run_generation(RunConfig const&         config,
                         Console const&           console,
                         CancellationCheck const& cancelled = {});
} // namespace wordcrank

#endif // include guard
