#ifndef wordcrank_SessionStore_hpp
#define wordcrank_SessionStore_hpp

#include "OutputSink.hpp"
#include "SpaceSpecification.hpp"

#include <filesystem>
#include <iosfwd>
#include <stdexcept>

namespace wordcrank {
/// The progress record of one output file: the number of lines of the output
/// that are known to be complete.  The record lives beside the output in
/// session_path(output).
///
/// Nothing checks that a resumed run uses the same space, prefix and suffix as
/// the run that wrote the record.  Two runs writing the same output at the
/// same time will corrupt both the output and the record.
class SessionStore {
  public:
    static constexpr char const* suffix = ".session";

    explicit SessionStore(std::filesystem::path const& outputTarget);

    std::filesystem::path const& path() const {
        return path_;
    }

    /// The persisted count, or 0 if there is no record.  An unreadable or
    /// malformed record is reported to warnings and also yields 0.
    BigInt read_resume_offset(std::ostream& warnings) const;

    /// Replace the record with count.  Throws SessionWriteError on failure.
    void persist(BigInt const& count) const;

    /// Remove the record if there is one.  Throws SessionWriteError on
    /// failure.
    void clear() const;

  private:
    std::filesystem::path path_;
};

std::filesystem::path session_path(std::filesystem::path const& outputTarget);

struct SessionReadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SessionWriteError : WriteIOError {
    using WriteIOError::WriteIOError;
};
} // namespace wordcrank

#endif // include guard
