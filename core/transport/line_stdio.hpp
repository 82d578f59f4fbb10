#pragma once

#include <cstddef>
#include <string>

namespace mlld {
namespace transport {

// Upper bound for a single protocol line (64 MiB)
constexpr size_t kMaxLineSize = 64u * 1024u * 1024u;

// LineWriter writes newline-terminated lines to the worker's stdin pipe.
// Not thread-safe: callers serialize writes (SessionManager holds its lock).
class LineWriter {
public:
    LineWriter() = default;
    ~LineWriter();

    // Delete copy (owns an OS handle)
    LineWriter(const LineWriter &) = delete;
    LineWriter &operator=(const LineWriter &) = delete;

    // Take ownership of the write end of a pipe
    void set_fd(int fd);

    // Write line plus '\n'. Handles partial writes and EINTR.
    // Returns false on error (sets error_)
    bool write_line(const std::string &line);

    // Close the pipe (signals EOF to the worker)
    void close();

    bool is_open() const { return fd_ >= 0; }
    const std::string &last_error() const { return error_; }

private:
    int fd_ = -1;
    std::string error_;

    bool write_exact(const char *buf, size_t n);
};

// LineReader reads newline-delimited text from a pipe with an internal buffer.
// Used by exactly one reader thread per pipe.
class LineReader {
public:
    LineReader() = default;
    explicit LineReader(int fd) : fd_(fd) {}
    ~LineReader();

    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;

    // Take ownership of the read end of a pipe
    void set_fd(int fd);

    // Read the next line without its terminator (a trailing '\r' is dropped too).
    // A final unterminated line is returned before EOF is reported.
    // Returns false on EOF (last_error() empty) or on error (last_error() set).
    bool read_line(std::string &out);

    void close();

    const std::string &last_error() const { return error_; }

private:
    int fd_ = -1;
    std::string buffer_;
    size_t scan_from_ = 0;
    bool eof_ = false;
    std::string error_;
};

}  // namespace transport
}  // namespace mlld
