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
#include <memory>
#include <string_view>
#include <system_error>

namespace vpkx::utility::internal {

/**
 * Writer for a uniquely named temporary file that is either renamed into
 * place or removed
 *
 * A writer that is destroyed without a successful `rename_to()` removes
 * its file.
 */
class file_writer {
 public:
  static file_writer
  create_temp(std::filesystem::path const& dir, std::string_view prefix,
              std::error_code& ec);

  file_writer() = default;

  explicit operator bool() const { return static_cast<bool>(impl_); }

  void write_data(uint64_t offset, void const* buffer, size_t count,
                  std::error_code& ec) {
    impl_->write_data(offset, buffer, count, ec);
  }

  /**
   * Flush and close the file
   */
  void commit(std::error_code& ec) { impl_->commit(ec); }

  /**
   * Move the committed file to `dest`, failing if `dest` exists
   */
  void rename_to(std::filesystem::path const& dest, std::error_code& ec) {
    impl_->rename_to(dest, ec);
  }

  /**
   * Close (if still open) and remove the file
   */
  void discard(std::error_code& ec) { impl_->discard(ec); }

  std::filesystem::path const& path() const { return impl_->path(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void write_data(uint64_t offset, void const* buffer, size_t count,
                            std::error_code& ec) = 0;
    virtual void commit(std::error_code& ec) = 0;
    virtual void
    rename_to(std::filesystem::path const& dest, std::error_code& ec) = 0;
    virtual void discard(std::error_code& ec) = 0;
    virtual std::filesystem::path const& path() const = 0;
  };

  explicit file_writer(std::unique_ptr<impl>&& impl)
      : impl_{std::move(impl)} {}

 private:
  std::unique_ptr<impl> impl_;
};

/**
 * Rename `from` to `to` unless `to` already exists
 */
void rename_noreplace(std::filesystem::path const& from,
                      std::filesystem::path const& to, std::error_code& ec);

} // namespace vpkx::utility::internal
