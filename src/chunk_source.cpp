#include "gigvault/chunk_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace gigvault {

// --- MemorySource ---

size_t MemorySource::read(uint8_t* buffer, size_t max_length) {
    size_t n = std::min(max_length, data_.size() - cursor_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + cursor_, n);
        cursor_ += n;
    }
    return n;
}

void MemorySource::seek(uint64_t offset) {
    if (offset > data_.size()) {
        throw IoError("seek beyond end of buffer");
    }
    cursor_ = static_cast<size_t>(offset);
}

// --- ChunkSource ---

ChunkSource::ChunkSource(const std::filesystem::path& path) : path_(path) {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        throw IoError("cannot stat " + path_.string() + ": " + strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw IoError("not a regular file: " + path_.string());
    }
    total_size_ = static_cast<uint64_t>(st.st_size);
}

ChunkSource::~ChunkSource() {
    close();
}

void ChunkSource::open() {
    if (fd_ >= 0) return;
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IoError("cannot open " + path_.string() + ": " + strerror(errno));
    }
    cursor_ = 0;
}

size_t ChunkSource::read(uint8_t* buffer, size_t max_length) {
    if (fd_ < 0) {
        throw IoError("read from closed source: " + path_.string());
    }

    // Never hand out more than the size reported up front; callers have
    // already committed to it (Upload-Length, Content-Length).
    uint64_t remaining = total_size_ - cursor_;
    size_t want = static_cast<size_t>(std::min<uint64_t>(max_length, remaining));
    if (want == 0) return 0;

    size_t got = 0;
    while (got < want) {
        ssize_t n = pread(fd_, buffer + got, want - got, static_cast<off_t>(cursor_ + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("read failed on " + path_.string() + ": " + strerror(errno));
        }
        if (n == 0) {
            throw IoError("file shrank while reading: " + path_.string() + " (expected " +
                          std::to_string(total_size_) + " bytes, got " +
                          std::to_string(cursor_ + got) + ")");
        }
        got += static_cast<size_t>(n);
    }

    cursor_ += got;
    return got;
}

std::vector<uint8_t> ChunkSource::read(size_t max_len) {
    uint64_t remaining = total_size_ - cursor_;
    std::vector<uint8_t> out(static_cast<size_t>(std::min<uint64_t>(max_len, remaining)));
    size_t n = read(out.data(), out.size());
    out.resize(n);
    return out;
}

void ChunkSource::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void ChunkSource::seek(uint64_t offset) {
    if (offset > total_size_) {
        throw IoError("seek to " + std::to_string(offset) + " beyond size " +
                      std::to_string(total_size_) + " of " + path_.string());
    }
    cursor_ = offset;
}

}  // namespace gigvault
