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

#include <vpkx/path_filter.h>

namespace vpkx {

path_filter::path_filter(std::span<std::string const> exclude,
                         std::span<std::string const> include) {
  exclude_.reserve(exclude.size());
  include_.reserve(include.size());

  for (auto const& p : exclude) {
    add_exclude(p);
  }

  for (auto const& p : include) {
    add_include(p);
  }
}

void path_filter::add_exclude(std::string_view pattern) {
  exclude_.emplace_back(pattern);
}

void path_filter::add_include(std::string_view pattern) {
  include_.emplace_back(pattern);
}

bool path_filter::is_excluded(std::string_view path) const {
  bool excluded = false;

  for (auto const& m : exclude_) {
    if (m.match(path)) {
      excluded = true;
    }
  }

  if (excluded) {
    for (auto const& m : include_) {
      if (m.match(path)) {
        excluded = false;
      }
    }
  }

  return excluded;
}

} // namespace vpkx
