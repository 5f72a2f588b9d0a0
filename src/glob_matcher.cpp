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

#include <string>

#include <vpkx/glob_matcher.h>

#include <vpkx/internal/glob_pattern.h>

namespace vpkx {

namespace {

constexpr std::string_view glob_meta_chars = R"(*?[]\)";

class glob_matcher_ final : public glob_matcher::impl {
 public:
  explicit glob_matcher_(std::string_view pattern)
      : pattern_{pattern}
      , anchored_{pattern.starts_with('/')}
      , glob_{anchored_ ? pattern.substr(1) : pattern} {}

  bool match(std::string_view path) const override {
    auto name = path;

    while (!name.empty()) {
      if (match_one(name)) {
        return true;
      }

      auto pos = name.rfind('/');
      auto parent = pos == std::string_view::npos ? std::string_view{}
                                                  : name.substr(0, pos);

      if (!anchored_) {
        auto base = pos == std::string_view::npos ? name : name.substr(pos + 1);
        if (match_one(base)) {
          return true;
        }
      }

      while (parent.ends_with('/')) {
        parent.remove_suffix(1);
      }

      name = parent;
    }

    return false;
  }

  bool anchored() const override { return anchored_; }

  std::string const& pattern() const override { return pattern_; }

 private:
  bool match_one(std::string_view sv) const { return glob_.match(sv); }

  std::string const pattern_;
  bool const anchored_;
  internal::glob_pattern const glob_;
};

} // namespace

glob_matcher::glob_matcher(std::string_view pattern)
    : impl_{std::make_unique<glob_matcher_>(pattern)} {}

glob_matcher::~glob_matcher() = default;
glob_matcher::glob_matcher(glob_matcher&&) noexcept = default;
glob_matcher& glob_matcher::operator=(glob_matcher&&) noexcept = default;

bool match_glob_parents(std::string_view pattern, std::string_view path) {
  return glob_matcher(pattern).match(path);
}

std::string glob_escape(std::string_view name) {
  std::string rv;
  rv.reserve(name.size());

  for (auto c : name) {
    if (glob_meta_chars.find(c) != std::string_view::npos) {
      rv += '\\';
    }
    rv += c;
  }

  return rv;
}

} // namespace vpkx
