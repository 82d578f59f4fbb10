#include "line_stdio.hpp"

#include <errno.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace mlld {
namespace transport {

namespace {
constexpr size_t kReadChunk = 4096;
}  // namespace

LineWriter::~LineWriter() { close(); }

void LineWriter::set_fd(int fd) {
    close();
    fd_ = fd;
    error_.clear();
}

bool LineWriter::write_line(const std::string &line) {
    if (fd_ < 0) {
        error_ = "stdin pipe is closed";
        return false;
    }
    if (line.size() + 1 > kMaxLineSize) {
        error_ = "Line too large: " + std::to_string(line.size()) + " bytes";
        return false;
    }

    // Single buffer so the line and its terminator go out in as few writes as possible
    std::string framed;
    framed.reserve(line.size() + 1);
    framed.append(line);
    framed.push_back('\n');
    return write_exact(framed.data(), framed.size());
}

bool LineWriter::write_exact(const char *buf, size_t n) {
    size_t total = 0;

    while (total < n) {
        ssize_t w = ::write(fd_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                error_ = "Broken pipe (worker terminated)";
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

void LineWriter::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

LineReader::~LineReader() { close(); }

void LineReader::set_fd(int fd) {
    close();
    fd_ = fd;
    buffer_.clear();
    scan_from_ = 0;
    eof_ = false;
    error_.clear();
}

bool LineReader::read_line(std::string &out) {
    while (true) {
        auto newline = buffer_.find('\n', scan_from_);
        if (newline != std::string::npos) {
            out.assign(buffer_, 0, newline);
            buffer_.erase(0, newline + 1);
            scan_from_ = 0;
            if (!out.empty() && out.back() == '\r') {
                out.pop_back();
            }
            return true;
        }
        scan_from_ = buffer_.size();

        if (eof_ || fd_ < 0) {
            if (!buffer_.empty()) {
                out.swap(buffer_);
                buffer_.clear();
                scan_from_ = 0;
                if (!out.empty() && out.back() == '\r') {
                    out.pop_back();
                }
                return true;
            }
            return false;
        }

        if (buffer_.size() > kMaxLineSize) {
            error_ = "Line too large: exceeded " + std::to_string(kMaxLineSize) + " bytes";
            return false;
        }

        char chunk[kReadChunk];
        ssize_t r = ::read(fd_, chunk, sizeof(chunk));
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(r));
    }
}

void LineReader::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace transport
}  // namespace mlld
