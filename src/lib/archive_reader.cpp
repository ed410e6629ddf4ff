#include <mwb2dbm/archive_reader.hpp>
#include <mwb2dbm/error.hpp>

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

namespace mwb2dbm {

  namespace {

    constexpr std::uint32_t local_header_sig = 0x04034b50;
    constexpr std::uint32_t central_header_sig = 0x02014b50;
    constexpr std::uint32_t end_of_central_dir_sig = 0x06054b50;

    constexpr std::size_t local_header_size = 30;
    constexpr std::size_t central_header_size = 46;
    constexpr std::size_t end_of_central_dir_size = 22;

    constexpr std::uint16_t method_stored = 0;
    constexpr std::uint16_t method_deflate = 8;

    struct central_entry {
      std::string name;
      std::uint16_t method;
      std::uint32_t crc;
      std::uint32_t compressed_size;
      std::uint32_t uncompressed_size;
      std::uint32_t local_header_offset;
    };

    std::uint16_t
    read_u16(const std::string& buf, std::size_t pos) {
      return static_cast<std::uint16_t>(
          static_cast<unsigned char>(buf[pos]) |
          (static_cast<unsigned char>(buf[pos + 1]) << 8));
    }

    std::uint32_t
    read_u32(const std::string& buf, std::size_t pos) {
      return static_cast<std::uint32_t>(read_u16(buf, pos)) |
             (static_cast<std::uint32_t>(read_u16(buf, pos + 2)) << 16);
    }

    std::string
    read_whole_file(const std::string& path) {
      std::ifstream in(path, std::ios::binary);
      if (!in) throw archive_error("archive: cannot open file: " + path);
      std::ostringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    // The end-of-central-directory record sits at the end of the file,
    // possibly followed by an archive comment of up to 64 KiB.
    std::size_t
    find_end_of_central_dir(const std::string& buf, const std::string& path) {
      if (buf.size() < end_of_central_dir_size) {
        throw archive_error("archive: not a ZIP container: " + path);
      }
      std::size_t lowest = buf.size() > end_of_central_dir_size + 0xFFFF
                               ? buf.size() - end_of_central_dir_size - 0xFFFF
                               : 0;
      for (std::size_t pos = buf.size() - end_of_central_dir_size;; --pos) {
        if (read_u32(buf, pos) == end_of_central_dir_sig) return pos;
        if (pos == lowest) break;
      }
      throw archive_error("archive: not a ZIP container: " + path);
    }

    std::vector<central_entry>
    read_central_directory(const std::string& buf, const std::string& path) {
      std::size_t eocd = find_end_of_central_dir(buf, path);
      std::uint16_t count = read_u16(buf, eocd + 10);
      std::uint32_t offset = read_u32(buf, eocd + 16);

      std::vector<central_entry> entries;
      std::size_t pos = offset;
      for (std::uint16_t i = 0; i < count; ++i) {
        if (pos + central_header_size > buf.size() ||
            read_u32(buf, pos) != central_header_sig) {
          throw archive_error("archive: corrupt central directory in " + path);
        }
        central_entry e;
        e.method = read_u16(buf, pos + 10);
        e.crc = read_u32(buf, pos + 16);
        e.compressed_size = read_u32(buf, pos + 20);
        e.uncompressed_size = read_u32(buf, pos + 24);
        std::uint16_t name_len = read_u16(buf, pos + 28);
        std::uint16_t extra_len = read_u16(buf, pos + 30);
        std::uint16_t comment_len = read_u16(buf, pos + 32);
        e.local_header_offset = read_u32(buf, pos + 42);
        if (pos + central_header_size + name_len > buf.size()) {
          throw archive_error("archive: corrupt central directory in " + path);
        }
        e.name = buf.substr(pos + central_header_size, name_len);
        entries.push_back(std::move(e));
        pos += central_header_size + name_len + extra_len + comment_len;
      }
      return entries;
    }

    std::string
    inflate_raw(const std::string& buf, std::size_t offset,
                const central_entry& entry) {
      if (entry.uncompressed_size == 0) return {};
      std::string out(entry.uncompressed_size, '\0');

      z_stream zs{};
      if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw archive_error("archive: inflateInit2 failed");
      }
      zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(buf.data()) +
                                            static_cast<std::ptrdiff_t>(offset));
      zs.avail_in = entry.compressed_size;
      zs.next_out = reinterpret_cast<Bytef*>(out.data());
      zs.avail_out = entry.uncompressed_size;

      int rc = inflate(&zs, Z_FINISH);
      inflateEnd(&zs);
      if (rc != Z_STREAM_END || zs.total_out != entry.uncompressed_size) {
        throw archive_error("archive: cannot inflate entry '" + entry.name +
                            "'");
      }
      return out;
    }

  } // namespace

  std::vector<std::string>
  list_archive_entries(const std::string& path) {
    std::string buf = read_whole_file(path);
    std::vector<std::string> names;
    for (auto& e : read_central_directory(buf, path))
      names.push_back(std::move(e.name));
    return names;
  }

  std::string
  extract_archive_entry(const std::string& path, std::string_view inner_name) {
    std::string buf = read_whole_file(path);
    auto entries = read_central_directory(buf, path);

    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const central_entry& e) {
                             return e.name == inner_name;
                           });
    if (it == entries.end()) {
      throw not_found_error("archive: " + std::string(inner_name) +
                            " not found in " + path);
    }
    const central_entry& entry = *it;

    std::size_t pos = entry.local_header_offset;
    if (pos + local_header_size > buf.size() ||
        read_u32(buf, pos) != local_header_sig) {
      throw archive_error("archive: corrupt local header for '" + entry.name +
                          "'");
    }
    std::size_t data = pos + local_header_size + read_u16(buf, pos + 26) +
                       read_u16(buf, pos + 28);
    if (data + entry.compressed_size > buf.size()) {
      throw archive_error("archive: truncated entry '" + entry.name + "'");
    }

    std::string contents;
    switch (entry.method) {
      case method_stored:
        contents = buf.substr(data, entry.compressed_size);
        break;
      case method_deflate:
        contents = inflate_raw(buf, data, entry);
        break;
      default:
        throw archive_error("archive: unsupported compression method " +
                            std::to_string(entry.method) + " for '" +
                            entry.name + "'");
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(contents.data()),
                static_cast<uInt>(contents.size()));
    if (static_cast<std::uint32_t>(crc) != entry.crc) {
      throw archive_error("archive: CRC mismatch for '" + entry.name + "'");
    }
    return contents;
  }

} // namespace mwb2dbm
