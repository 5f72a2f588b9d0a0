/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of vpkx.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <cstring>
#include <map>
#include <mutex>
#include <unordered_set>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/logger.h>
#include <vpkx/mmap.h>
#include <vpkx/string.h>

#include <vpkx/internal/worker_group.h>
#include <vpkx/reader/internal/chunk_stream.h>
#include <vpkx/reader/vpk_reader.h>

namespace vpkx::reader {

namespace {

constexpr uint32_t vpk_magic{0x55AA1234};
constexpr uint16_t vpk_major_version{2};
constexpr uint16_t vpk_minor_version{3};
constexpr size_t vpk_header_size{16};
constexpr uint16_t chunk_list_end{0xFFFF};

class tree_parser {
 public:
  tree_parser(std::span<uint8_t const> data, std::string const& file)
      : data_{data}
      , file_{file} {}

  template <typename T>
  T read() {
    T value;
    need(sizeof(value));
    std::memcpy(&value, data_.data() + pos_, sizeof(value));
    pos_ += sizeof(value);
    return boost::endian::little_to_native(value);
  }

  std::string read_string() {
    auto rest = data_.subspan(pos_);
    auto nul = std::find(rest.begin(), rest.end(), uint8_t{0});

    if (nul == rest.end()) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: unterminated string in directory tree at "
                             "offset {}",
                             file_, vpk_header_size + pos_));
    }

    std::string s(rest.begin(), nul);
    pos_ += s.size() + 1;

    return s;
  }

  size_t pos() const { return pos_; }
  bool done() const { return pos_ == data_.size(); }

 private:
  void need(size_t n) const {
    if (data_.size() - pos_ < n) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: truncated directory tree at offset {}",
                             file_, vpk_header_size + pos_));
    }
  }

  std::span<uint8_t const> data_;
  std::string const& file_;
  size_t pos_{0};
};

// A single space stands for an empty directory or extension.
std::string_view tree_name(std::string const& s) {
  return s == " " ? std::string_view{} : std::string_view{s};
}

bool is_valid_entry_path(std::string_view path) {
  if (path.empty() || path.starts_with('/')) {
    return false;
  }

  for (auto const& c : split_to<std::vector<std::string_view>>(path, '/')) {
    if (c.empty() || c == "." || c == "..") {
      return false;
    }
  }

  return true;
}

template <typename LoggerPolicy>
class vpk_reader_ final : public vpk_reader::impl {
 public:
  vpk_reader_(logger& lgr, vpk_location const& loc)
      : LOG_PROXY_INIT(lgr)
      , lgr_{lgr}
      , loc_{loc} {
    auto ti = LOG_TIMED_VERBOSE;

    parse_directory();

    ti << "read vpk directory " << loc_.dir_file() << " with "
       << entries_.size() << " entries";
  }

  std::span<archive_entry const> entries() const override { return entries_; }

  entry_stream
  open_entry(archive_entry const& entry, size_t parallelism) const override {
    reader::internal::chunk_source src;

    src.num_chunks = entry.chunks.size();
    src.size = entry.uncompressed_size();
    src.decode = [this, &entry](size_t chunk) {
      return decode_chunk(entry, chunk);
    };
    src.verify = [&entry](uint32_t crc) {
      if (crc != entry.crc32) {
        VPKX_THROW(archive_error,
                   fmt::format("{}: checksum mismatch (expected {:08x}, got "
                               "{:08x})",
                               entry.path, entry.crc32, crc));
      }
    };

    return entry_stream(reader::internal::make_chunk_stream(
        lgr_, parallelism > 0 ? &workers(parallelism) : nullptr, parallelism,
        std::move(src)));
  }

  vpk_location const& location() const override { return loc_; }

 private:
  void parse_directory() {
    auto const dir_file = loc_.dir_file();
    auto const file = dir_file.string();

    if (!std::filesystem::exists(dir_file)) {
      VPKX_THROW(archive_error, "vpk directory file not found: " + file);
    }

    mmap mm(dir_file);

    if (mm.size() < vpk_header_size) {
      VPKX_THROW(archive_error, file + ": file too short for vpk header");
    }

    tree_parser hdr(mm.span(0, vpk_header_size), file);

    auto const magic = hdr.read<uint32_t>();
    auto const major = hdr.read<uint16_t>();
    auto const minor = hdr.read<uint16_t>();
    auto const tree_size = hdr.read<uint32_t>();
    auto const signature_size = hdr.read<uint32_t>();

    if (magic != vpk_magic) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: bad magic {:#010x}", file, magic));
    }

    if (major != vpk_major_version || minor != vpk_minor_version) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: unsupported vpk version {}.{}", file, major,
                             minor));
    }

    if (mm.size() - vpk_header_size < tree_size) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: tree size {} exceeds file size {}", file,
                             tree_size, mm.size()));
    }

    LOG_DEBUG << file << ": tree size " << tree_size << ", signature size "
              << signature_size;

    tree_parser tp(mm.span(vpk_header_size, tree_size), file);
    std::unordered_set<std::string> seen;

    for (;;) {
      auto ext = tp.read_string();
      if (ext.empty()) {
        break;
      }

      for (;;) {
        auto dir = tp.read_string();
        if (dir.empty()) {
          break;
        }

        for (;;) {
          auto name = tp.read_string();
          if (name.empty()) {
            break;
          }

          archive_entry e;
          e.path = make_path(tree_name(dir), name, tree_name(ext));
          e.crc32 = tp.read<uint32_t>();
          e.preload_bytes = tp.read<uint16_t>();

          read_chunks(tp, e);
          check_entry(e, file);

          if (!seen.insert(e.path).second) {
            VPKX_THROW(archive_error,
                       fmt::format("{}: duplicate entry {}", file, e.path));
          }

          LOG_TRACE << e.path << ": " << e.chunks.size() << " chunk(s), "
                    << e.uncompressed_size() << " bytes";

          entries_.push_back(std::move(e));
        }
      }
    }

    if (!tp.done()) {
      LOG_WARN << file << ": " << (tree_size - tp.pos())
               << " trailing bytes in directory tree";
    }
  }

  static std::string
  make_path(std::string_view dir, std::string_view name, std::string_view ext) {
    std::string path;

    if (!dir.empty()) {
      path.append(dir);
      path += '/';
    }

    path.append(name);

    if (!ext.empty()) {
      path += '.';
      path.append(ext);
    }

    return path;
  }

  static void read_chunks(tree_parser& tp, archive_entry& e) {
    for (;;) {
      archive_chunk c;
      c.archive_index = tp.read<uint16_t>();
      c.load_flags = tp.read<uint32_t>();
      c.texture_flags = tp.read<uint16_t>();
      c.offset = tp.read<uint64_t>();
      c.compressed_size = tp.read<uint64_t>();
      c.uncompressed_size = tp.read<uint64_t>();
      e.chunks.push_back(c);

      auto const marker = tp.read<uint16_t>();

      if (marker == chunk_list_end) {
        break;
      }

      if (marker != 0) {
        VPKX_THROW(archive_error,
                   fmt::format("{}: invalid chunk separator {:#06x}", e.path,
                               marker));
      }
    }
  }

  static void check_entry(archive_entry const& e, std::string const& file) {
    if (!is_valid_entry_path(e.path)) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: invalid entry path '{}'", file, e.path));
    }

    if (e.preload_bytes != 0) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: {} preload bytes are not supported", e.path,
                             e.preload_bytes));
    }
  }

  block_range decode_chunk(archive_entry const& entry, size_t index) const {
    auto const& c = entry.chunks.at(index);

    if (c.is_compressed()) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: chunk {} is compressed ({} -> {} bytes), "
                             "which is not supported",
                             entry.path, index, c.compressed_size,
                             c.uncompressed_size));
    }

    auto const& mm = data_file(c.archive_index);

    if (c.offset > mm.size() || mm.size() - c.offset < c.compressed_size) {
      VPKX_THROW(archive_error,
                 fmt::format("{}: chunk {} at offset {} size {} is beyond "
                             "the end of {}",
                             entry.path, index, c.offset, c.compressed_size,
                             mm.path().string()));
    }

    return block_range(mm.span(c.offset, c.compressed_size));
  }

  mmif const& data_file(uint16_t index) const {
    std::lock_guard lock(mx_);

    auto it = data_files_.find(index);

    if (it == data_files_.end()) {
      auto path = loc_.archive_file(index);

      if (!std::filesystem::exists(path)) {
        VPKX_THROW(archive_error,
                   "vpk data file not found: " + path.string());
      }

      LOG_DEBUG << "mapping " << path;

      it = data_files_.emplace(index, std::make_unique<mmap>(path)).first;
    }

    return *it->second;
  }

  vpkx::internal::worker_group& workers(size_t num) const {
    std::lock_guard lock(wg_mx_);

    if (!wg_ || wg_.size() != num) {
      if (wg_) {
        wg_.stop();
      }
      wg_ = vpkx::internal::worker_group(lgr_, "vpkread", num);
    }

    return wg_;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  logger& lgr_;
  vpk_location const loc_;
  std::vector<archive_entry> entries_;
  std::mutex mutable mx_;
  std::map<uint16_t, std::unique_ptr<mmif>> mutable data_files_;
  std::mutex mutable wg_mx_;
  vpkx::internal::worker_group mutable wg_;
};

} // namespace

vpk_reader::vpk_reader(logger& lgr, vpk_location const& loc)
    : impl_{make_unique_logging_object<impl, vpk_reader_>(lgr, loc)} {}

vpk_reader::~vpk_reader() = default;

} // namespace vpkx::reader
