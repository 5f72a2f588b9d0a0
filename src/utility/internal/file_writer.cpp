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

#include <cassert>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <vpkx/utility/internal/file_writer.h>

namespace vpkx::utility::internal {

namespace fs = std::filesystem;

namespace {

std::error_code last_error() {
  return std::error_code(errno, std::generic_category());
}

class file_writer_ final : public file_writer::impl {
 public:
  static file_writer
  create_temp(fs::path const& dir, std::string_view prefix,
              std::error_code& ec) {
    ec.clear();

    auto tmpfile = (dir / (std::string(prefix) + "XXXXXX")).string();
    auto fd = ::mkstemp(tmpfile.data());

    if (fd < 0) {
      ec = last_error();
      return {};
    }

    return file_writer{std::make_unique<file_writer_>(fd, tmpfile)};
  }

  file_writer_(int fd, fs::path path)
      : fd_{fd}
      , path_{std::move(path)} {}

  ~file_writer_() override {
    if (!done_) {
      std::error_code ec;

      discard(ec);

      if (ec) {
        std::cerr << "error removing temporary file " << path_ << ": "
                  << ec.message() << "\n";
      }
    }
  }

  void write_data(uint64_t offset, void const* buffer, size_t count,
                  std::error_code& ec) override {
    assert(fd_ >= 0);

    ec.clear();

    auto p = static_cast<uint8_t const*>(buffer);
    auto off = static_cast<off_t>(offset);

    while (count > 0) {
      auto n = ::pwrite(fd_, p, count, off);

      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }

        ec = last_error();

        return;
      }

      off += static_cast<off_t>(n);
      p += static_cast<size_t>(n);
      count -= static_cast<size_t>(n);
    }
  }

  void commit(std::error_code& ec) override {
    ec.clear();

    if (fd_ != -1) {
      auto fd = fd_;
      fd_ = -1;

      if (::close(fd) == -1) {
        ec = last_error();
      }
    }
  }

  void rename_to(fs::path const& dest, std::error_code& ec) override {
    assert(fd_ == -1);

    rename_noreplace(path_, dest, ec);

    if (!ec) {
      done_ = true;
    }
  }

  void discard(std::error_code& ec) override {
    std::error_code close_ec;

    commit(close_ec);

    done_ = true;

    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
      ec = last_error();
    } else {
      ec = close_ec;
    }
  }

  fs::path const& path() const override { return path_; }

 private:
  int fd_{-1};
  fs::path const path_;
  bool done_{false};
};

} // namespace

file_writer file_writer::create_temp(fs::path const& dir,
                                     std::string_view prefix,
                                     std::error_code& ec) {
  return file_writer_::create_temp(dir, prefix, ec);
}

void rename_noreplace(fs::path const& from, fs::path const& to,
                      std::error_code& ec) {
  ec.clear();

  if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(),
                  RENAME_NOREPLACE) == 0) {
    return;
  }

  if (errno != EINVAL && errno != ENOSYS) {
    ec = last_error();
    return;
  }

  // file system without RENAME_NOREPLACE support
  if (::link(from.c_str(), to.c_str()) != 0) {
    ec = last_error();
    return;
  }

  if (::unlink(from.c_str()) != 0) {
    ec = last_error();
  }
}

} // namespace vpkx::utility::internal
