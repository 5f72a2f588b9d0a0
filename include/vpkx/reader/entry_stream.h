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
#include <memory>
#include <span>

namespace vpkx::reader {

/**
 * Sequential reader for the decoded contents of an archive entry
 *
 * Bytes are always delivered in chunk order, no matter how many chunks
 * are decoded ahead. The stream must not outlive the reader it was opened
 * from.
 */
class entry_stream {
 public:
  class impl;

  explicit entry_stream(std::unique_ptr<impl> i);
  ~entry_stream();

  entry_stream(entry_stream&&) noexcept;
  entry_stream& operator=(entry_stream&&) noexcept;

  /**
   * Read up to `buf.size()` bytes
   *
   * \returns The number of bytes read, 0 at the end of the entry. Throws
   *          `archive_error` if a chunk cannot be decoded or the entry's
   *          checksum does not match.
   */
  size_t read(std::span<uint8_t> buf) { return impl_->read(buf); }

  uint64_t size() const { return impl_->size(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual size_t read(std::span<uint8_t> buf) = 0;
    virtual uint64_t size() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace vpkx::reader
