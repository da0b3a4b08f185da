#ifndef wordcrank_OutputSink_hpp
#define wordcrank_OutputSink_hpp

#include "SpaceSpecification.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace wordcrank {
enum class OpenMode {
    // start a new file, discarding anything already there
    Truncate,
    // add to the end of an existing file (resuming)
    Append,
};

/// A line-oriented output file.  The file is flushed and closed when the sink
/// is destroyed, however that happens.
///
/// The sink counts lines starting from linesWritten (the lines already in the
/// file when resuming).  Whenever that count reaches a multiple of
/// checkpointInterval the sink flushes and then calls checkpoint with the
/// count, so a checkpointed count always describes lines that have reached the
/// file.  A checkpointInterval of 0 disables checkpoints.
class OutputSink {
  public:
    using Checkpoint = std::function<void(BigInt const& linesWritten)>;

    static constexpr size_t bufferSize = 8192;

    OutputSink(std::filesystem::path path,
               OpenMode              mode,
               BigInt                linesWritten       = 0,
               size_t                checkpointInterval = 0,
               Checkpoint            checkpoint         = {});
    OutputSink(OutputSink const&)            = delete;
    OutputSink& operator=(OutputSink const&) = delete;
    ~OutputSink();

    /// Append text and a newline.  Throws WriteIOError on failure.
    void write_line(std::string_view text);

    /// Push buffered lines to the file.  Throws WriteIOError on failure.
    void flush();

    BigInt const& lines() const {
        return lines_;
    }

    std::filesystem::path const& path() const {
        return path_;
    }

  private:
    std::filesystem::path path_;
    // the stream buffer must outlive stream_
    std::vector<char> buffer_;
    std::ofstream     stream_;
    BigInt            lines_;
    size_t            checkpointInterval_;
    size_t            sinceCheckpoint_ = 0;
    Checkpoint        checkpoint_;
};

struct WriteIOError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
} // namespace wordcrank

#endif // include guard
