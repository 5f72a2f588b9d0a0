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

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <vpkx/glob_matcher.h>

namespace vpkx {

/**
 * Exclude/include filter chain
 *
 * A path is excluded if it matches at least one exclude pattern and no
 * include pattern. Include patterns only rescue excluded paths, so the
 * order of patterns within either list is irrelevant.
 *
 * All patterns are compiled up front; a malformed one throws
 * `pattern_error` from the constructor.
 */
class path_filter {
 public:
  path_filter() = default;
  path_filter(std::span<std::string const> exclude,
              std::span<std::string const> include);

  void add_exclude(std::string_view pattern);
  void add_include(std::string_view pattern);

  bool is_excluded(std::string_view path) const;

  bool empty() const { return exclude_.empty(); }
  size_t exclude_count() const { return exclude_.size(); }
  size_t include_count() const { return include_.size(); }

 private:
  std::vector<glob_matcher> exclude_;
  std::vector<glob_matcher> include_;
};

} // namespace vpkx
