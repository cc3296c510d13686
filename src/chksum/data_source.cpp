// =============================================================================
// pzkit - Checksum Data Sources Implementation
// =============================================================================

#include "pzk/chksum/data_source.h"

#include <fstream>
#include <span>
#include <spanstream>

#include <fmt/format.h>

#include "pzk/common/error.h"

namespace pzk::chksum {

namespace {

/// @brief Span stream that keeps its backing buffer alive.
class SharedBufferStream final : public std::ispanstream {
public:
    explicit SharedBufferStream(std::shared_ptr<const BytesDataSource::Buffer> bytes)
        : std::ispanstream(std::span<const char>(
              reinterpret_cast<const char*>(bytes->data()), bytes->size())),
          bytes_(std::move(bytes)) {}

private:
    std::shared_ptr<const BytesDataSource::Buffer> bytes_;
};

}  // namespace

// =============================================================================
// FileDataSource Implementation
// =============================================================================

std::unique_ptr<std::istream> FileDataSource::openReader() const {
    auto stream = std::make_unique<std::ifstream>(path_, std::ios::binary);
    if (!stream->is_open()) {
        throw IOError("Failed to open file for checksumming", ErrorContext(path_.string()));
    }
    return stream;
}

// =============================================================================
// BytesDataSource Implementation
// =============================================================================

BytesDataSource::BytesDataSource(Buffer bytes)
    : bytes_(std::make_shared<const Buffer>(std::move(bytes))) {}

BytesDataSource::BytesDataSource(std::shared_ptr<const Buffer> bytes)
    : bytes_(bytes ? std::move(bytes) : std::make_shared<const Buffer>()) {}

BytesDataSource::BytesDataSource(std::string_view text)
    : bytes_(std::make_shared<const Buffer>(text.begin(), text.end())) {}

std::unique_ptr<std::istream> BytesDataSource::openReader() const {
    return std::make_unique<SharedBufferStream>(bytes_);
}

std::string BytesDataSource::describe() const {
    return fmt::format("<{} bytes in memory>", bytes_->size());
}

}  // namespace pzk::chksum
