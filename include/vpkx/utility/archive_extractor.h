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

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>

namespace vpkx {

class logger;
class path_filter;

namespace reader {

class archive_reader;

}

namespace utility {

struct archive_extractor_options {
  size_t parallelism{0};
  size_t copy_buffer_size{static_cast<size_t>(1) << 20};
  bool enable_progress{true};
};

struct extraction_stats {
  size_t total{0};
  size_t extracted{0};
  size_t excluded{0};
  uint64_t bytes_extracted{0};
};

/**
 * Extract the entries of an archive into a directory tree
 *
 * Entries are processed one at a time in listing order. Each retained
 * entry is written to a temporary file in the output root and renamed to
 * its final path once complete, so a failed run never leaves a partial
 * file behind. The first error aborts the run.
 *
 * Progress lines go to the stream passed to the constructor.
 */
class archive_extractor {
 public:
  archive_extractor(logger& lgr, std::ostream& progress);

  extraction_stats
  extract(reader::archive_reader const& reader,
          std::filesystem::path const& root, path_filter const& filter,
          archive_extractor_options const& opts = {}) {
    return impl_->extract(reader, root, filter, opts);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual extraction_stats
    extract(reader::archive_reader const& reader,
            std::filesystem::path const& root, path_filter const& filter,
            archive_extractor_options const& opts) = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace utility
} // namespace vpkx
