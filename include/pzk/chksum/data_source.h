// =============================================================================
// pzkit - Checksum Data Sources
// =============================================================================
// A DataSource hands out independent readers over the same bytes, so that
// concurrent digest workers never share a cursor.
// =============================================================================

#ifndef PZK_CHKSUM_DATA_SOURCE_H
#define PZK_CHKSUM_DATA_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pzk::chksum {

/// @brief Re-readable byte source.
class DataSource {
public:
    virtual ~DataSource() = default;

    /// @brief Open a new reader positioned at the first byte.
    /// @throws IOError if the source cannot be opened.
    [[nodiscard]] virtual std::unique_ptr<std::istream> openReader() const = 0;

    /// @brief Short description for logs and error messages.
    [[nodiscard]] virtual std::string describe() const = 0;
};

/// @brief A file on disk; each reader opens the file again.
class FileDataSource final : public DataSource {
public:
    explicit FileDataSource(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] std::unique_ptr<std::istream> openReader() const override;

    [[nodiscard]] std::string describe() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief An immutable in-memory buffer shared by all readers.
class BytesDataSource final : public DataSource {
public:
    using Buffer = std::vector<std::uint8_t>;

    explicit BytesDataSource(Buffer bytes);
    explicit BytesDataSource(std::shared_ptr<const Buffer> bytes);
    explicit BytesDataSource(std::string_view text);

    [[nodiscard]] std::unique_ptr<std::istream> openReader() const override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] std::size_t size() const noexcept { return bytes_->size(); }

private:
    std::shared_ptr<const Buffer> bytes_;
};

}  // namespace pzk::chksum

#endif  // PZK_CHKSUM_DATA_SOURCE_H
