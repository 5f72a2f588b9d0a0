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

#include <cstdint>
#include <numeric>
#include <string>
#include <vector>

namespace vpkx::reader {

struct archive_chunk {
  uint16_t archive_index{0};
  uint32_t load_flags{0};
  uint16_t texture_flags{0};
  uint64_t offset{0};
  uint64_t compressed_size{0};
  uint64_t uncompressed_size{0};

  bool is_compressed() const { return compressed_size != uncompressed_size; }
};

/**
 * One named file inside an archive
 *
 * `path` is relative and `/`-separated, never absolute and never contains
 * `..` components.
 */
struct archive_entry {
  std::string path;
  uint32_t crc32{0};
  uint16_t preload_bytes{0};
  std::vector<archive_chunk> chunks;

  uint64_t uncompressed_size() const {
    return std::accumulate(chunks.begin(), chunks.end(), uint64_t{0},
                           [](uint64_t sum, archive_chunk const& c) {
                             return sum + c.uncompressed_size;
                           });
  }
};

} // namespace vpkx::reader
