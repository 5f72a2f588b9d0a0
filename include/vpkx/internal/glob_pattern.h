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

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace vpkx::internal {

/**
 * A compiled glob for a single path
 *
 * `*` matches any run of non-separator bytes, `?` a single non-separator
 * code point, and `[...]` a single code point from a class (negated with
 * a leading `^`, ranges written `a-z`, a reversed range matches nothing).
 * A backslash escapes the following character, both inside and outside of
 * classes. Invalid UTF-8 in the path counts as one code point per byte.
 *
 * Throws `pattern_error` if the glob is malformed.
 */
class glob_pattern {
 public:
  explicit glob_pattern(std::string_view pattern);

  bool match(std::string_view name) const;

 private:
  struct code_point_range {
    char32_t lo;
    char32_t hi;
  };

  struct element {
    enum class kind : uint8_t { literal, any, char_class };

    kind type{kind::literal};
    char byte{0};
    bool negated{false};
    std::vector<code_point_range> ranges{};
  };

  struct chunk {
    bool star{false};
    std::vector<element> elements;
  };

  static std::optional<std::string_view>
  match_chunk(std::vector<element> const& elements, std::string_view s);

  std::vector<chunk> chunks_;
};

} // namespace vpkx::internal
