#include "archive/zip.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>
#include <zlib.h>

#include "proto/utils.hpp"

namespace ircbooks::archive {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr std::uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr std::uint32_t END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;

constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t CENTRAL_HEADER_SIZE = 46;
constexpr std::size_t END_OF_CENTRAL_DIR_SIZE = 22;
constexpr std::size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

// ZIP stores integers little-endian
auto read_u16(std::span<const uint8_t> data, std::size_t offset) -> uint16_t
{
    return uint16_t(data[offset]) | uint16_t(data[offset + 1]) << 8;
}

auto read_u32(std::span<const uint8_t> data, std::size_t offset) -> uint32_t
{
    return uint32_t(data[offset]) | (uint32_t(data[offset + 1]) << 8) |
           (uint32_t(data[offset + 2]) << 16) |
           (uint32_t(data[offset + 3]) << 24);
}

auto read_at(std::ifstream& file, std::uint64_t offset, std::span<uint8_t> out)
  -> bool
{
    file.clear();
    file.seekg(std::streamoff(offset));
    file.read(reinterpret_cast<char*>(out.data()), std::streamsize(out.size()));
    return std::size_t(file.gcount()) == out.size();
}

/// Local header size plus its variable fields
auto data_offset(std::ifstream& file, const ZipEntry& entry)
  -> tl::expected<std::uint64_t, Error>
{
    std::array<uint8_t, LOCAL_HEADER_SIZE> header{};

    if (not read_at(file, entry.local_header_offset, header)) {
        return tl::make_unexpected(Error::TRUNCATED);
    }

    if (read_u32(header, 0) != LOCAL_HEADER_SIGNATURE) {
        return tl::make_unexpected(Error::CORRUPTED_DATA);
    }

    const auto name_len = read_u16(header, 26);
    const auto extra_len = read_u16(header, 28);

    return entry.local_header_offset + LOCAL_HEADER_SIZE + name_len + extra_len;
}

}  // namespace

auto ZipEntry::basename() const -> std::string
{
    const auto slash = name.find_last_of("/\\");
    auto base = slash == std::string::npos ? name : name.substr(slash + 1);

    if (base == "." or base == "..") {
        return {};
    }

    return base;
}

auto ZipReader::open(const fs::path& path) -> tl::expected<ZipReader, Error>
{
    std::error_code ec;
    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return tl::make_unexpected(Error::IO_FAILURE);
    }

    if (file_size < END_OF_CENTRAL_DIR_SIZE) {
        return tl::make_unexpected(Error::NOT_AN_ARCHIVE);
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (not file) {
        return tl::make_unexpected(Error::IO_FAILURE);
    }

    // End of central directory record sits within the last 64 KiB + 22
    const auto tail_size =
      std::min<std::uint64_t>(file_size, END_OF_CENTRAL_DIR_SIZE + MAX_COMMENT_SIZE);
    std::vector<uint8_t> tail(tail_size);

    if (not read_at(file, file_size - tail_size, tail)) {
        return tl::make_unexpected(Error::TRUNCATED);
    }

    std::optional<std::size_t> eocd;
    for (std::size_t pos = tail_size - END_OF_CENTRAL_DIR_SIZE + 1; pos-- > 0;) {
        if (read_u32(tail, pos) == END_OF_CENTRAL_DIR_SIGNATURE) {
            eocd = pos;
            break;
        }
    }

    if (not eocd) {
        return tl::make_unexpected(Error::NOT_AN_ARCHIVE);
    }

    const auto record = std::span<const uint8_t>(tail).subspan(*eocd);
    const auto entries_count = read_u16(record, 10);
    const auto dir_size = read_u32(record, 12);
    const auto dir_offset = read_u32(record, 16);

    if (entries_count == 0xFFFF or dir_size == 0xFFFFFFFF or
        dir_offset == 0xFFFFFFFF) {
        return tl::make_unexpected(Error::UNSUPPORTED_ZIP64);
    }

    if (std::uint64_t(dir_offset) + dir_size > file_size) {
        return tl::make_unexpected(Error::TRUNCATED);
    }

    std::vector<uint8_t> directory(dir_size);
    if (not read_at(file, dir_offset, directory)) {
        return tl::make_unexpected(Error::TRUNCATED);
    }

    ZipReader reader(path);
    reader._entries.reserve(entries_count);

    std::size_t pos = 0;
    for (std::size_t i = 0; i < entries_count; i++) {
        if (pos + CENTRAL_HEADER_SIZE > directory.size() or
            read_u32(directory, pos) != CENTRAL_HEADER_SIGNATURE) {
            return tl::make_unexpected(Error::CORRUPTED_DATA);
        }

        const auto header = std::span<const uint8_t>(directory).subspan(pos);
        const auto name_len = read_u16(header, 28);
        const auto extra_len = read_u16(header, 30);
        const auto comment_len = read_u16(header, 32);

        if (pos + CENTRAL_HEADER_SIZE + name_len > directory.size()) {
            return tl::make_unexpected(Error::TRUNCATED);
        }

        ZipEntry entry{
          .name = std::string(
            reinterpret_cast<const char*>(header.data() + CENTRAL_HEADER_SIZE),
            name_len
          ),
          .flags = read_u16(header, 8),
          .method = read_u16(header, 10),
          .crc32 = read_u32(header, 16),
          .compressed_size = read_u32(header, 20),
          .uncompressed_size = read_u32(header, 24),
          .local_header_offset = read_u32(header, 42),
        };

        if (entry.compressed_size == 0xFFFFFFFF or
            entry.uncompressed_size == 0xFFFFFFFF or
            entry.local_header_offset == 0xFFFFFFFF) {
            return tl::make_unexpected(Error::UNSUPPORTED_ZIP64);
        }

        reader._entries.push_back(std::move(entry));
        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
    }

    spdlog::debug(
      "Archive {}: {} entries", path.filename().string(), reader._entries.size()
    );

    return reader;
}

auto ZipReader::stream(const ZipEntry& entry, const Sink& sink) const
  -> tl::expected<std::uint64_t, Error>
{
    if (entry.is_encrypted()) {
        return tl::make_unexpected(Error::ENCRYPTED);
    }

    if (entry.method != ZipEntry::METHOD_STORED and
        entry.method != ZipEntry::METHOD_DEFLATED) {
        return tl::make_unexpected(Error::UNSUPPORTED_METHOD);
    }

    std::ifstream file(_path, std::ios::in | std::ios::binary);
    if (not file) {
        return tl::make_unexpected(Error::IO_FAILURE);
    }

    auto offset = data_offset(file, entry);
    if (not offset) {
        return tl::make_unexpected(offset.error());
    }

    file.clear();
    file.seekg(std::streamoff(*offset));

    std::vector<char> input(CHUNK_SIZE);
    std::vector<char> output(CHUNK_SIZE);

    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t remaining = entry.compressed_size;
    std::uint64_t written = 0;

    auto deliver = [&](const char* data, std::size_t size) -> bool {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), uInt(size));
        written += size;
        return sink(std::span<const char>(data, size));
    };

    if (entry.method == ZipEntry::METHOD_STORED) {
        while (remaining > 0) {
            const auto chunk = std::min<std::uint64_t>(remaining, input.size());
            file.read(input.data(), std::streamsize(chunk));

            if (std::uint64_t(file.gcount()) != chunk) {
                return tl::make_unexpected(Error::TRUNCATED);
            }

            if (not deliver(input.data(), chunk)) {
                return tl::make_unexpected(Error::IO_FAILURE);
            }

            remaining -= chunk;
        }
    }
    else {
        z_stream zs;
        std::memset(&zs, 0, sizeof(z_stream));

        // Raw deflate data, no zlib header
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
            return tl::make_unexpected(Error::CORRUPTED_DATA);
        }

        int status = Z_OK;

        while (status != Z_STREAM_END) {
            if (zs.avail_in == 0 and remaining > 0) {
                const auto chunk = std::min<std::uint64_t>(remaining, input.size());
                file.read(input.data(), std::streamsize(chunk));

                if (std::uint64_t(file.gcount()) != chunk) {
                    inflateEnd(&zs);
                    return tl::make_unexpected(Error::TRUNCATED);
                }

                remaining -= chunk;
                zs.next_in = reinterpret_cast<Bytef*>(input.data());
                zs.avail_in = uInt(chunk);
            }

            zs.next_out = reinterpret_cast<Bytef*>(output.data());
            zs.avail_out = uInt(output.size());

            status = inflate(&zs, Z_NO_FLUSH);

            if (status == Z_BUF_ERROR) {  // input exhausted
                break;
            }

            if (status != Z_OK and status != Z_STREAM_END) {
                inflateEnd(&zs);
                return tl::make_unexpected(Error::CORRUPTED_DATA);
            }

            const auto produced = output.size() - zs.avail_out;
            if (produced > 0 and not deliver(output.data(), produced)) {
                inflateEnd(&zs);
                return tl::make_unexpected(Error::IO_FAILURE);
            }
        }

        inflateEnd(&zs);

        if (status != Z_STREAM_END) {
            return tl::make_unexpected(Error::TRUNCATED);
        }
    }

    if (written != entry.uncompressed_size) {
        return tl::make_unexpected(Error::TRUNCATED);
    }

    if (crc != entry.crc32) {
        spdlog::warn(
          "CRC mismatch in {}: expected {:08x}, got {:08x}", entry.name,
          entry.crc32, crc
        );
        return tl::make_unexpected(Error::CRC_MISMATCH);
    }

    return written;
}

auto ZipReader::extract(const ZipEntry& entry, const fs::path& target) const
  -> tl::expected<std::uint64_t, Error>
{
    std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (not out) {
        return tl::make_unexpected(Error::IO_FAILURE);
    }

    auto written = stream(entry, [&out](std::span<const char> chunk) {
        out.write(chunk.data(), std::streamsize(chunk.size()));
        return bool(out);
    });

    out.close();

    if (not written or not out) {
        std::error_code ignored;
        fs::remove(target, ignored);
        return tl::make_unexpected(written ? Error::IO_FAILURE : written.error());
    }

    return written;
}

auto ZipReader::read_lines(const ZipEntry& entry) const
  -> tl::expected<std::vector<std::string>, Error>
{
    std::vector<std::string> lines;
    std::string pending;

    auto streamed = stream(entry, [&](std::span<const char> chunk) {
        for (const char c : chunk) {
            if (c == '\n') {
                if (not pending.empty() and pending.back() == '\r') {
                    pending.pop_back();
                }
                lines.push_back(std::move(pending));
                pending.clear();
            }
            else {
                pending.push_back(c);
            }
        }
        return true;
    });

    if (not streamed) {
        return tl::make_unexpected(streamed.error());
    }

    if (not pending.empty()) {
        lines.push_back(std::move(pending));
    }

    return lines;
}

auto is_zip(const fs::path& path) -> bool
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    std::array<uint8_t, 4> magic{};

    if (not read_at(file, 0, magic)) {
        return false;
    }

    const auto signature = read_u32(magic, 0);

    // Empty archives consist of the end record only
    return signature == LOCAL_HEADER_SIGNATURE or
           signature == END_OF_CENTRAL_DIR_SIGNATURE;
}

auto extract_matching(
  const fs::path& archive, const fs::path& dest_dir, std::string_view extension
) -> tl::expected<std::vector<fs::path>, Error>
{
    auto reader = ZipReader::open(archive);
    if (not reader) {
        return tl::make_unexpected(reader.error());
    }

    const auto suffix = proto::utils::to_lower(fmt::format(".{}", extension));
    std::vector<fs::path> extracted;

    for (const auto& entry : reader->entries()) {
        const auto name = entry.basename();

        if (entry.is_directory() or name.empty() or
            not proto::utils::to_lower(name).ends_with(suffix)) {
            spdlog::debug("Skip archive member {}", entry.name);
            continue;
        }

        if (entry.is_encrypted()) {
            spdlog::warn("Skip encrypted archive member {}", entry.name);
            continue;
        }

        const auto target = dest_dir / name;
        auto written = reader->extract(entry, target);

        if (not written) {
            spdlog::warn(
              "Can not extract {}: {}", entry.name,
              magic_enum::enum_name(written.error())
            );

            // All or nothing: drop members already written
            for (const auto& path : extracted) {
                std::error_code ec;
                if (fs::remove(path, ec); ec) {
                    spdlog::warn("Can not remove {}: {}", path.string(), ec.message());
                }
            }

            return tl::make_unexpected(written.error());
        }

        spdlog::info("Extracted {} ({} bytes)", target.string(), *written);
        extracted.push_back(target);
    }

    return extracted;
}

}  // namespace ircbooks::archive
