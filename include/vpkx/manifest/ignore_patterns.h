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

#include <vpkx/path_filter.h>
#include <vpkx/reader/archive_entry.h>

namespace vpkx::manifest {

/**
 * Paths to disregard when repacking a tree (the `.vpkignore` manifest)
 *
 * One glob per line, a leading `!` re-includes paths matched by other
 * lines, `#` starts a comment. A path is ignored if it matches a positive
 * line and no `!` line.
 */
class ignore_patterns {
 public:
  static constexpr std::string_view filename{".vpkignore"};

  static std::span<std::string_view const> default_patterns();

  static ignore_patterns parse(std::string_view text);

  /**
   * Append a line
   *
   * Throws `pattern_error` for a malformed glob.
   */
  void add(std::string_view line);

  /**
   * Append the well-known junk file patterns
   */
  void add_default();

  /**
   * Append a `!` rule for every entry the current rules would ignore
   */
  void add_auto_exclusions(std::span<reader::archive_entry const> entries);

  bool match(std::string_view path) const { return filter_.is_excluded(path); }

  std::span<std::string const> lines() const { return lines_; }

  std::string to_string() const;

 private:
  std::vector<std::string> lines_;
  path_filter filter_;
};

} // namespace vpkx::manifest
