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
#include <ostream>
#include <vector>

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/logger.h>
#include <vpkx/path_filter.h>
#include <vpkx/util.h>

#include <vpkx/reader/archive_reader.h>
#include <vpkx/utility/archive_extractor.h>
#include <vpkx/utility/internal/file_writer.h>

namespace vpkx::utility {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view temp_file_prefix{".vpkx_"};

template <typename LoggerPolicy>
class archive_extractor_ final : public archive_extractor::impl {
 public:
  archive_extractor_(logger& lgr, std::ostream& progress)
      : LOG_PROXY_INIT(lgr)
      , progress_{progress} {}

  extraction_stats
  extract(reader::archive_reader const& reader, fs::path const& root,
          path_filter const& filter,
          archive_extractor_options const& opts) override {
    auto ti = LOG_TIMED_INFO;

    auto const entries = reader.entries();
    extraction_stats stats;

    stats.total = entries.size();

    std::vector<uint8_t> buffer(std::max<size_t>(opts.copy_buffer_size, 1));

    for (size_t i = 0; i < entries.size(); ++i) {
      auto const& e = entries[i];

      if (filter.is_excluded(e.path)) {
        ++stats.excluded;
        report(opts, i, stats.total, e.path, "excluded");
        continue;
      }

      auto const size = e.uncompressed_size();

      report(opts, i, stats.total, e.path,
             format_bytes_si(static_cast<int64_t>(size)));

      extract_entry(reader, root, e, opts.parallelism, buffer);

      ++stats.extracted;
      stats.bytes_extracted += size;
    }

    ti << "extracted " << stats.extracted << " of " << stats.total
       << " entries ("
       << format_bytes_si(static_cast<int64_t>(stats.bytes_extracted)) << ")";

    return stats;
  }

 private:
  void report(archive_extractor_options const& opts, size_t index,
              size_t total, std::string const& path, std::string_view info) {
    if (opts.enable_progress) {
      progress_ << fmt::format("[{:4}/{:4}] {} ({})\n", index + 1, total, path,
                               info);
    }
  }

  void extract_entry(reader::archive_reader const& reader,
                     fs::path const& root, reader::archive_entry const& e,
                     size_t parallelism, std::vector<uint8_t>& buffer) {
    auto const dest = root / fs::path(e.path);
    std::error_code ec;

    fs::create_directories(dest.parent_path(), ec);

    if (ec) {
      VPKX_THROW(system_error, "create " + dest.parent_path().string(), ec);
    }

    auto fw = internal::file_writer::create_temp(root, temp_file_prefix, ec);

    if (ec) {
      VPKX_THROW(system_error, "create temporary file in " + root.string(),
                 ec);
    }

    LOG_TRACE << "extracting " << e.path << " via " << fw.path();

    try {
      auto stream = reader.open_entry(e, parallelism);
      uint64_t offset = 0;

      while (auto n = stream.read(buffer)) {
        fw.write_data(offset, buffer.data(), n, ec);

        if (ec) {
          VPKX_THROW(system_error, "write " + fw.path().string(), ec);
        }

        offset += n;
      }

      fw.commit(ec);

      if (ec) {
        VPKX_THROW(system_error, "close " + fw.path().string(), ec);
      }

      fw.rename_to(dest, ec);

      if (ec) {
        VPKX_THROW(system_error,
                   fmt::format("rename {} to {}", fw.path().string(),
                               dest.string()),
                   ec);
      }
    } catch (...) {
      std::error_code cleanup_ec;

      fw.discard(cleanup_ec);

      if (cleanup_ec) {
        LOG_ERROR << "failed to remove temporary file " << fw.path() << ": "
                  << cleanup_ec.message();
      }

      throw;
    }
  }

  LOG_PROXY_DECL(LoggerPolicy);
  std::ostream& progress_;
};

} // namespace

archive_extractor::archive_extractor(logger& lgr, std::ostream& progress)
    : impl_{make_unique_logging_object<impl, archive_extractor_>(lgr,
                                                                 progress)} {}

} // namespace vpkx::utility
