#pragma once

#include "gigvault/byte_source.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gigvault {

/// The file part of a multipart/form-data body.
struct MultipartFilePart {
    std::string field_name = "file";
    std::string file_name;
    std::string mime_type = "application/octet-stream";
    std::shared_ptr<ByteSource> source;
};

/// Synthesizes a multipart/form-data body on demand.
///
/// The header (all form fields plus the file part's headers) and the footer
/// are rendered at construction, so content_length() is exact before any
/// byte of the file is read. read() walks Header -> FileContent -> Footer ->
/// Complete and may cross several phases in one call.
class MultipartBodyStream : public ByteSource {
public:
    enum class Phase { Header, FileContent, Footer, Complete, Failed };

    using Field = std::pair<std::string, std::string>;

    MultipartBodyStream(std::string boundary,
                        std::vector<Field> fields,
                        MultipartFilePart file_part);
    ~MultipartBodyStream() override;

    MultipartBodyStream(const MultipartBodyStream&) = delete;
    MultipartBodyStream& operator=(const MultipartBodyStream&) = delete;

    void open() override;
    size_t read(uint8_t* buffer, size_t max_length) override;
    void close() noexcept override;
    uint64_t length() const override { return content_length_; }

    /// Only rewinding to 0 is supported (re-sending after a redirect).
    void seek(uint64_t offset) override;

    uint64_t content_length() const { return content_length_; }
    Phase phase() const { return phase_; }
    const std::string& boundary() const { return boundary_; }

    /// Value for the request's Content-Type header.
    std::string content_type() const;

    /// "Boundary-" followed by 32 random hex digits.
    static std::string make_boundary();

private:
    size_t read_fixed(const std::string& data, size_t& offset, Phase next,
                      uint8_t* buffer, size_t max_length);
    size_t read_file(uint8_t* buffer, size_t max_length);

    std::string boundary_;
    MultipartFilePart file_part_;
    std::string header_;
    std::string footer_;
    uint64_t content_length_ = 0;

    Phase phase_ = Phase::Header;
    size_t header_offset_ = 0;
    size_t footer_offset_ = 0;
    uint64_t file_bytes_read_ = 0;
    bool opened_ = false;
};

const char* multipart_phase_name(MultipartBodyStream::Phase phase);

}  // namespace gigvault
