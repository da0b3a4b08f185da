#include "run_generation.hpp"

#include "Enumerator.hpp"
#include "OutputSink.hpp"
#include "SessionStore.hpp"

#include <iomanip>
#include <iostream>
#include <optional>

namespace wordcrank {
namespace {
using Clock = std::chrono::steady_clock;

void report_progress(std::ostream& stream,
                     BigInt const& count,
                     BigInt const& limit) {
    stream << "[*] " << with_commas(count) << " / " << with_commas(limit)
           << " words";
    if (sgn(limit) > 0) {
        BigInt const percent = count * 100 / limit;
        stream << " (" << percent.get_str() << "%)";
    }
    stream << std::endl;
}

void report_paused(Console const&      console,
                   BigInt const&       count,
                   SessionStore const& session) {
    console.out << std::endl
                << "[!] Paused. Progress for " << with_commas(count)
                << " words saved to " << session.path().string() << "."
                << std::endl
                << "[!] To continue, run the same command with the --resume "
                   "flag."
                << std::endl;
}

void report_completed(Console const&                       console,
                      std::filesystem::path const&         output,
                      std::chrono::duration<double> const& elapsed) {
    console.out << std::endl
                << "[+] Generation complete. Total time: " << std::fixed
                << std::setprecision(2) << elapsed.count() << " seconds."
                << std::endl
                << "[+] Wordlist saved to '" << output.string() << "'"
                << std::endl;
}
} // namespace

int exit_code(Outcome const outcome) {
    return outcome == Outcome::Failed ? 1 : 0;
}

RunResult run_generation(RunConfig const&         config,
                         Console const&           console,
                         CancellationCheck const& cancelled) {
    auto const start   = Clock::now();
    auto const elapsed = [start] {
        return std::chrono::duration<double>{Clock::now() - start};
    };

    Enumerator enumerator{config.space};

    BigInt const& total = enumerator.size();
    BigInt        limit = total;
    if (config.limit && *config.limit < total) {
        limit = *config.limit;
    }
    console.out << "[*] Total Combinations: " << with_commas(total)
                << std::endl;
    if (config.limit) {
        console.out << "[*] User-defined Limit: " << with_commas(*config.limit)
                    << std::endl;
    }

    SessionStore const session{config.output};
    BigInt             startOffset = 0;
    if (config.resume) {
        startOffset = session.read_resume_offset(console.err);
        if (sgn(startOffset) > 0) {
            console.out << "[*] Resuming session. Starting after "
                        << with_commas(startOffset) << " words." << std::endl;
        }
    }

    std::optional<OutputSink> sink;
    try {
        sink.emplace(config.output,
                     sgn(startOffset) > 0 ? OpenMode::Append : OpenMode::Truncate,
                     startOffset,
                     config.checkpointInterval,
                     [&session, &console, &limit](BigInt const& n) {
                         session.persist(n);
                         report_progress(console.err, n, limit);
                     });
        enumerator.skip_ahead(startOffset);

        while (sink->lines() < limit && !enumerator.done()) {
            if (cancelled && cancelled()) {
                sink->flush();
                session.persist(sink->lines());
                report_paused(console, sink->lines(), session);
                return {Outcome::Paused, sink->lines(), elapsed(), {}};
            }
            sink->write_line(config.prefix + enumerator.next() + config.suffix);
        }
        sink->flush();
        session.clear();
    } catch (WriteIOError const& e) {
        console.err << std::endl
                    << "[!] Critical I/O Error: " << e.what() << std::endl;
        return {Outcome::Failed,
                sink ? sink->lines() : startOffset,
                elapsed(),
                e.what()};
    }

    auto const took = elapsed();
    report_completed(console, config.output, took);
    return {Outcome::Completed, sink->lines(), took, {}};
}
} // namespace wordcrank
