#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace ircbooks::archive {

enum class Error
{
    IO_FAILURE,
    NOT_AN_ARCHIVE,
    TRUNCATED,
    UNSUPPORTED_ZIP64,
    UNSUPPORTED_METHOD,
    ENCRYPTED,
    CORRUPTED_DATA,
    CRC_MISMATCH,
};

struct ZipEntry
{
    constexpr static std::uint16_t METHOD_STORED = 0;
    constexpr static std::uint16_t METHOD_DEFLATED = 8;

    std::string name;
    std::uint16_t flags = 0;
    std::uint16_t method = METHOD_STORED;
    std::uint32_t crc32 = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t local_header_offset = 0;

    auto is_directory() const -> bool
    {
        return not name.empty() and (name.back() == '/' or name.back() == '\\');
    }

    auto is_encrypted() const -> bool { return (flags & 0x1) != 0; }

    /// Last path component, empty for "." and ".."
    auto basename() const -> std::string;
};

/**
 * @brief Central directory reader with streaming extraction (zlib inflate)
 */
class ZipReader
{
 public:
    using Sink = std::function<bool(std::span<const char>)>;

    static auto open(const std::filesystem::path& path)
      -> tl::expected<ZipReader, Error>;

    auto entries() const -> const std::vector<ZipEntry>& { return _entries; }
    auto path() const -> const std::filesystem::path& { return _path; }

    /**
     * @return uncompressed bytes written; target is removed on failure
     */
    auto extract(const ZipEntry& entry, const std::filesystem::path& target)
      const -> tl::expected<std::uint64_t, Error>;

    auto read_lines(const ZipEntry& entry) const
      -> tl::expected<std::vector<std::string>, Error>;

    /**
     * @brief Feed the uncompressed entry to sink chunk by chunk; CRC checked
     * at the end. A sink returning false aborts with IO_FAILURE.
     */
    auto stream(const ZipEntry& entry, const Sink& sink) const
      -> tl::expected<std::uint64_t, Error>;

 private:
    explicit ZipReader(std::filesystem::path path) : _path(std::move(path)) {}

    std::filesystem::path _path;
    std::vector<ZipEntry> _entries;
};

/// Local file header magic at offset 0
auto is_zip(const std::filesystem::path& path) -> bool;

/**
 * @brief Extract members whose name ends in "."+extension into dest_dir,
 * flattened. Encrypted members are skipped.
 */
auto extract_matching(
  const std::filesystem::path& archive,
  const std::filesystem::path& dest_dir,
  std::string_view extension
) -> tl::expected<std::vector<std::filesystem::path>, Error>;

}  // namespace ircbooks::archive
