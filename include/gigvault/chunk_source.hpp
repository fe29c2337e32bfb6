#pragma once

#include "gigvault/byte_source.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gigvault {

/// Sequential, seekable reader over a local file.
///
/// The size is taken from stat() at construction so it is available before
/// the file is opened. The descriptor is owned exclusively and released by
/// close() or the destructor.
class ChunkSource : public ByteSource {
public:
    /// @throws IoError if the path does not name a readable regular file.
    explicit ChunkSource(const std::filesystem::path& path);
    ~ChunkSource() override;

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    void open() override;
    size_t read(uint8_t* buffer, size_t max_length) override;
    void close() noexcept override;
    uint64_t length() const override { return total_size_; }
    void seek(uint64_t offset) override;

    /// Read up to max_len bytes; an empty vector means end of file.
    std::vector<uint8_t> read(size_t max_len);

    const std::filesystem::path& path() const { return path_; }
    uint64_t cursor() const { return cursor_; }
    bool is_open() const { return fd_ >= 0; }

private:
    std::filesystem::path path_;
    uint64_t total_size_ = 0;
    uint64_t cursor_ = 0;
    int fd_ = -1;
};

}  // namespace gigvault
