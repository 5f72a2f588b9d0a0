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

#include <cerrno>

#include <sys/mman.h>
#include <unistd.h>

#include <vpkx/error.h>
#include <vpkx/mmap.h>

namespace vpkx {

namespace {

int posix_advice(advice adv) {
  switch (adv) {
  case advice::normal:
    return MADV_NORMAL;
  case advice::random:
    return MADV_RANDOM;
  case advice::sequential:
    return MADV_SEQUENTIAL;
  case advice::willneed:
    return MADV_WILLNEED;
  case advice::dontneed:
    return MADV_DONTNEED;
  }

  VPKX_PANIC("invalid advice");
}

uint64_t get_page_size() {
  auto sz = ::sysconf(_SC_PAGESIZE);
  return sz > 0 ? static_cast<uint64_t>(sz) : 4096;
}

boost::iostreams::mapped_file_source
open_mapped(std::filesystem::path const& path) {
  // boost refuses to map an empty file
  if (std::filesystem::file_size(path) == 0) {
    return {};
  }

  try {
    return boost::iostreams::mapped_file_source(path.string());
  } catch (std::exception const& e) {
    VPKX_THROW(system_error, "mmap " + path.string() + ": " + e.what());
  }
}

} // namespace

mmap::mmap(std::filesystem::path const& path)
    : mf_{open_mapped(path)}
    , page_size_{get_page_size()}
    , path_{path} {}

void const* mmap::addr() const {
  return mf_.is_open() ? static_cast<void const*>(mf_.data()) : nullptr;
}

size_t mmap::size() const { return mf_.is_open() ? mf_.size() : 0; }

std::error_code mmap::advise(advice adv) { return advise(adv, 0, size()); }

std::error_code mmap::advise(advice adv, size_t offset, size_t size) {
  std::error_code ec;

  if (!mf_.is_open() || size == 0) {
    return ec;
  }

  auto misalign = offset % page_size_;
  offset -= misalign;
  size += misalign;

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  auto addr = const_cast<char*>(mf_.data()) + offset;

  if (::madvise(addr, size, posix_advice(adv)) != 0) {
    ec.assign(errno, std::generic_category());
  }

  return ec;
}

std::filesystem::path const& mmap::path() const { return path_; }

} // namespace vpkx
