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
#include <deque>
#include <exception>
#include <future>

#include <boost/crc.hpp>

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/logger.h>
#include <vpkx/util.h>

#include <vpkx/internal/worker_group.h>
#include <vpkx/reader/internal/chunk_stream.h>

namespace vpkx::reader::internal {

namespace {

template <typename LoggerPolicy>
class chunk_stream_ final : public entry_stream::impl {
 public:
  chunk_stream_(logger& lgr, vpkx::internal::worker_group* wg,
                size_t readahead, chunk_source src)
      : LOG_PROXY_INIT(lgr)
      , wg_{readahead > 0 ? wg : nullptr}
      , readahead_{readahead}
      , src_{std::move(src)} {
    LOG_TRACE << "opening stream: " << src_.num_chunks << " chunk(s), "
              << src_.size << " bytes, readahead " << readahead_;
  }

  ~chunk_stream_() override {
    // Queued jobs refer to `src_`, so they must be done before we go away.
    for (auto& f : pending_) {
      if (f.valid()) {
        f.wait();
      }
    }
  }

  size_t read(std::span<uint8_t> buf) override {
    if (buf.empty()) {
      return 0;
    }

    size_t num_read = 0;

    while (num_read < buf.size()) {
      if (pos_ == current_.size() && !next_range()) {
        break;
      }

      auto avail = std::min(current_.size() - pos_, buf.size() - num_read);
      std::memcpy(buf.data() + num_read, current_.data() + pos_, avail);
      crc_.process_bytes(current_.data() + pos_, avail);
      pos_ += avail;
      num_read += avail;
    }

    if (num_read == 0 && !verified_) {
      verified_ = true;

      if (delivered_ != src_.size) {
        VPKX_THROW(archive_error,
                   fmt::format("entry size mismatch: expected {} bytes, got {}",
                               src_.size, delivered_));
      }

      if (src_.verify) {
        src_.verify(crc_.checksum());
      }
    }

    delivered_ += num_read;

    return num_read;
  }

  uint64_t size() const override { return src_.size; }

 private:
  void schedule() {
    while (pending_.size() < readahead_ && next_chunk_ < src_.num_chunks) {
      std::packaged_task<block_range()> task(
          [this, chunk = next_chunk_] { return src_.decode(chunk); });

      pending_.emplace_back(task.get_future());

      if (!wg_->add_job(std::move(task))) {
        pending_.pop_back();
        VPKX_THROW(runtime_error, "failed to queue chunk decode job");
      }

      ++next_chunk_;
    }
  }

  bool next_range() {
    do {
      if (wg_) {
        schedule();

        if (pending_.empty()) {
          return false;
        }

        auto f = std::move(pending_.front());
        pending_.pop_front();
        current_ = f.get();

        schedule();
      } else {
        if (next_chunk_ >= src_.num_chunks) {
          return false;
        }

        current_ = src_.decode(next_chunk_++);
      }

      pos_ = 0;
    } while (current_.size() == 0);

    return true;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  vpkx::internal::worker_group* const wg_;
  size_t const readahead_;
  chunk_source const src_;
  std::deque<std::future<block_range>> pending_;
  size_t next_chunk_{0};
  block_range current_;
  size_t pos_{0};
  uint64_t delivered_{0};
  bool verified_{false};
  boost::crc_32_type crc_;
};

} // namespace

std::unique_ptr<entry_stream::impl>
make_chunk_stream(logger& lgr, vpkx::internal::worker_group* wg,
                  size_t readahead, chunk_source src) {
  return make_unique_logging_object<entry_stream::impl, chunk_stream_>(
      lgr, wg, readahead, std::move(src));
}

} // namespace vpkx::reader::internal
