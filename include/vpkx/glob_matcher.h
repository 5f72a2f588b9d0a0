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
#include <span>
#include <string>
#include <string_view>

namespace vpkx {

/**
 * Parent-aware glob matcher
 *
 * A pattern with a leading `/` is anchored at the root of the relative
 * path. A path matches if the pattern matches the path itself or any of
 * its ancestor directories; an unanchored pattern also matches the bare
 * name of the path or of any ancestor. Everything below a matching
 * directory therefore matches as well.
 *
 * The pattern is compiled on construction; a malformed pattern throws
 * `pattern_error`.
 */
class glob_matcher {
 public:
  explicit glob_matcher(std::string_view pattern);
  ~glob_matcher();

  glob_matcher(glob_matcher&&) noexcept;
  glob_matcher& operator=(glob_matcher&&) noexcept;

  bool match(std::string_view path) const { return impl_->match(path); }
  bool operator()(std::string_view path) const { return match(path); }

  bool anchored() const { return impl_->anchored(); }
  std::string const& pattern() const { return impl_->pattern(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual bool match(std::string_view path) const = 0;
    virtual bool anchored() const = 0;
    virtual std::string const& pattern() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

/**
 * Match a single glob against a single path, see `glob_matcher`
 */
bool match_glob_parents(std::string_view pattern, std::string_view path);

/**
 * Escape glob metacharacters so the result matches `name` literally
 */
std::string glob_escape(std::string_view name);

} // namespace vpkx
