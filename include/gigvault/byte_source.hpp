#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gigvault {

/// Raised by byte sources when the underlying storage cannot be read.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Pull-based byte producer.
///
/// length() is known before open(). read() returns 0 only at the end of the
/// data and throws IoError on failure; after a failure the source is terminal
/// and callers must not read again.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual void open() = 0;
    virtual size_t read(uint8_t* buffer, size_t max_length) = 0;
    virtual void close() noexcept = 0;

    /// Total bytes a full drain from offset 0 yields.
    virtual uint64_t length() const = 0;

    /// Reposition the next read. Sources that cannot seek arbitrarily
    /// throw IoError for anything other than 0.
    virtual void seek(uint64_t offset) = 0;
};

/// Opens a source for the lifetime of the guard.
class SourceGuard {
public:
    explicit SourceGuard(ByteSource& source) : source_(source) { source_.open(); }
    ~SourceGuard() { source_.close(); }

    SourceGuard(const SourceGuard&) = delete;
    SourceGuard& operator=(const SourceGuard&) = delete;

private:
    ByteSource& source_;
};

/// Pass-through source over bytes held in memory.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit MemorySource(const std::string& data) : data_(data.begin(), data.end()) {}

    void open() override { cursor_ = 0; }
    size_t read(uint8_t* buffer, size_t max_length) override;
    void close() noexcept override {}
    uint64_t length() const override { return data_.size(); }
    void seek(uint64_t offset) override;

private:
    std::vector<uint8_t> data_;
    size_t cursor_ = 0;
};

}  // namespace gigvault
