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

#include <memory>

#include <vpkx/reader/archive_reader.h>
#include <vpkx/reader/vpk_location.h>

namespace vpkx {

class logger;

namespace reader {

/**
 * Reader for Respawn VPK (version 2.3) archives
 *
 * The directory file is parsed and validated on construction; data files
 * are memory-mapped on first use. Stored chunks are delivered straight
 * from the mapping, compressed chunks raise `archive_error`.
 */
class vpk_reader : public archive_reader {
 public:
  vpk_reader(logger& lgr, vpk_location const& loc);
  ~vpk_reader() override;

  std::span<archive_entry const> entries() const override {
    return impl_->entries();
  }

  entry_stream
  open_entry(archive_entry const& entry, size_t parallelism) const override {
    return impl_->open_entry(entry, parallelism);
  }

  vpk_location const& location() const { return impl_->location(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::span<archive_entry const> entries() const = 0;
    virtual entry_stream
    open_entry(archive_entry const& entry, size_t parallelism) const = 0;
    virtual vpk_location const& location() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace reader
} // namespace vpkx
