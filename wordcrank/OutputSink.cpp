#include "OutputSink.hpp"

namespace wordcrank {
namespace {
std::ios::openmode open_mode(OpenMode const mode) {
    auto const base = std::ios::out | std::ios::binary;
    return mode == OpenMode::Append ? base | std::ios::app
                                    : base | std::ios::trunc;
}
} // namespace

OutputSink::OutputSink(std::filesystem::path path,
                       OpenMode const        mode,
                       BigInt                linesWritten,
                       size_t const          checkpointInterval,
                       Checkpoint            checkpoint)
    : path_{std::move(path)}
    , buffer_(bufferSize)
    , lines_{std::move(linesWritten)}
    , checkpointInterval_{checkpointInterval}
    , checkpoint_{std::move(checkpoint)} {
    // setbuf only takes effect before the file is opened
    stream_.rdbuf()->pubsetbuf(buffer_.data(),
                               static_cast<std::streamsize>(buffer_.size()));
    stream_.open(path_, open_mode(mode));
    if (!stream_) {
        throw WriteIOError{"cannot open " + path_.string()};
    }
    if (checkpointInterval_ > 0) {
        // keep checkpoints on multiples of the interval across resumes
        sinceCheckpoint_ = mpz_fdiv_ui(lines_.get_mpz_t(), checkpointInterval_);
    }
}

OutputSink::~OutputSink() {
    // close flushes; there is nobody left to report a failure to
    stream_.close();
}

void OutputSink::write_line(std::string_view const text) {
    stream_.write(text.data(), static_cast<std::streamsize>(text.size()));
    stream_.put('\n');
    if (!stream_) {
        throw WriteIOError{"cannot write to " + path_.string()};
    }
    ++lines_;
    if (checkpointInterval_ > 0 && ++sinceCheckpoint_ == checkpointInterval_) {
        sinceCheckpoint_ = 0;
        flush();
        if (checkpoint_) {
            checkpoint_(lines_);
        }
    }
}

void OutputSink::flush() {
    if (!stream_.flush()) {
        throw WriteIOError{"cannot write to " + path_.string()};
    }
}
} // namespace wordcrank
