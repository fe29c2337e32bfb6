#include "gigvault/multipart_stream.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>

namespace gigvault {

const char* multipart_phase_name(MultipartBodyStream::Phase phase) {
    switch (phase) {
        case MultipartBodyStream::Phase::Header: return "header";
        case MultipartBodyStream::Phase::FileContent: return "file";
        case MultipartBodyStream::Phase::Footer: return "footer";
        case MultipartBodyStream::Phase::Complete: return "complete";
        case MultipartBodyStream::Phase::Failed: return "failed";
    }
    return "unknown";
}

MultipartBodyStream::MultipartBodyStream(std::string boundary,
                                         std::vector<Field> fields,
                                         MultipartFilePart file_part)
    : boundary_(std::move(boundary))
    , file_part_(std::move(file_part)) {
    if (!file_part_.source) {
        throw std::invalid_argument("multipart file part requires a source");
    }

    std::ostringstream header;
    for (const auto& [name, value] : fields) {
        header << "--" << boundary_ << "\r\n"
               << "Content-Disposition: form-data; name=\"" << name << "\"\r\n\r\n"
               << value << "\r\n";
    }
    header << "--" << boundary_ << "\r\n"
           << "Content-Disposition: form-data; name=\"" << file_part_.field_name
           << "\"; filename=\"" << file_part_.file_name << "\"\r\n"
           << "Content-Type: " << file_part_.mime_type << "\r\n\r\n";
    header_ = header.str();

    footer_ = "\r\n--" + boundary_ + "--\r\n";

    content_length_ = header_.size() + file_part_.source->length() + footer_.size();
}

MultipartBodyStream::~MultipartBodyStream() {
    close();
}

std::string MultipartBodyStream::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartBodyStream::make_boundary() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << "Boundary-" << std::hex << std::setfill('0')
        << std::setw(16) << gen() << std::setw(16) << gen();
    return oss.str();
}

void MultipartBodyStream::open() {
    if (opened_) return;
    file_part_.source->open();
    opened_ = true;
}

void MultipartBodyStream::close() noexcept {
    if (!opened_) return;
    file_part_.source->close();
    opened_ = false;
}

void MultipartBodyStream::seek(uint64_t offset) {
    if (offset != 0) {
        throw IoError("multipart body can only be rewound to the start");
    }
    if (phase_ == Phase::Failed) {
        throw IoError("multipart body is in a failed state");
    }
    file_part_.source->seek(0);
    phase_ = Phase::Header;
    header_offset_ = 0;
    footer_offset_ = 0;
    file_bytes_read_ = 0;
}

size_t MultipartBodyStream::read(uint8_t* buffer, size_t max_length) {
    if (phase_ == Phase::Failed) {
        throw IoError("read from failed multipart body");
    }

    size_t written = 0;
    while (written < max_length && phase_ != Phase::Complete) {
        uint8_t* out = buffer + written;
        size_t room = max_length - written;
        switch (phase_) {
            case Phase::Header:
                written += read_fixed(header_, header_offset_, Phase::FileContent, out, room);
                break;
            case Phase::FileContent:
                written += read_file(out, room);
                break;
            case Phase::Footer:
                written += read_fixed(footer_, footer_offset_, Phase::Complete, out, room);
                break;
            case Phase::Complete:
            case Phase::Failed:
                return written;
        }
    }
    return written;
}

size_t MultipartBodyStream::read_fixed(const std::string& data, size_t& offset, Phase next,
                                       uint8_t* buffer, size_t max_length) {
    size_t n = std::min(max_length, data.size() - offset);
    std::memcpy(buffer, data.data() + offset, n);
    offset += n;
    if (offset >= data.size()) {
        phase_ = next;
    }
    return n;
}

size_t MultipartBodyStream::read_file(uint8_t* buffer, size_t max_length) {
    if (!opened_) {
        phase_ = Phase::Failed;
        throw IoError("multipart body read before open()");
    }

    uint64_t expected = file_part_.source->length();
    if (file_bytes_read_ >= expected) {
        phase_ = Phase::Footer;
        return 0;
    }

    size_t n = 0;
    try {
        n = file_part_.source->read(buffer, max_length);
    } catch (const IoError&) {
        phase_ = Phase::Failed;
        throw;
    }

    if (n == 0) {
        // Content-Length was computed from the stat size; a short file
        // would produce a body the server cannot frame.
        phase_ = Phase::Failed;
        throw IoError("file ended after " + std::to_string(file_bytes_read_) + " of " +
                      std::to_string(expected) + " bytes");
    }

    file_bytes_read_ += n;
    if (file_bytes_read_ >= expected) {
        phase_ = Phase::Footer;
    }
    return n;
}

}  // namespace gigvault
