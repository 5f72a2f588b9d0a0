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
#include <functional>
#include <memory>

#include <vpkx/reader/block_range.h>
#include <vpkx/reader/entry_stream.h>

namespace vpkx {

class logger;

namespace internal {

class worker_group;

} // namespace internal

namespace reader::internal {

struct chunk_source {
  size_t num_chunks{0};
  uint64_t size{0};

  // Must be safe to call concurrently for different chunks.
  std::function<block_range(size_t chunk)> decode;

  // Called once with the CRC32 of all delivered bytes at the end of the
  // entry.
  std::function<void(uint32_t crc)> verify;
};

/**
 * Create a stream delivering the decoded chunks of `src` in order
 *
 * With `readahead > 0`, up to `readahead` chunks are decoded on `wg` ahead
 * of the consumer. With `readahead == 0` (or no worker group), chunks are
 * decoded on the reading thread as they are consumed.
 */
std::unique_ptr<entry_stream::impl>
make_chunk_stream(logger& lgr, vpkx::internal::worker_group* wg,
                  size_t readahead, chunk_source src);

} // namespace reader::internal
} // namespace vpkx
