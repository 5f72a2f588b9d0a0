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
#include <utility>

#include <fmt/format.h>

#include <utf8cpp/utf8.h>

#include <vpkx/error.h>

#include <vpkx/internal/glob_pattern.h>

namespace vpkx::internal {

namespace {

[[noreturn]] void bad_pattern(std::string_view what, std::string_view pat) {
  VPKX_THROW(pattern_error, fmt::format("{} in pattern: {}", what, pat));
}

std::pair<char32_t, size_t> next_code_point(std::string_view s) {
  auto it = s.begin();
  try {
    auto const cp = utf8::next(it, s.end());
    return {static_cast<char32_t>(cp), static_cast<size_t>(it - s.begin())};
  } catch (utf8::exception const&) {
    // an invalid sequence counts as a single byte
    return {U'\uFFFD', 1};
  }
}

// Reads one (possibly escaped) class member at `pos`, advancing `pos`.
char32_t class_code_point(std::string_view sv, size_t& pos) {
  if (pos >= sv.size()) {
    bad_pattern("unmatched '['", sv);
  }

  char const c = sv[pos];

  if (c == '-' || c == ']') {
    bad_pattern(fmt::format("unexpected '{}' in character class", c), sv);
  }

  if (c == '\\' && ++pos >= sv.size()) {
    bad_pattern("trailing backslash", sv);
  }

  auto it = sv.begin() + pos;
  char32_t cp{0};

  try {
    cp = static_cast<char32_t>(utf8::next(it, sv.end()));
  } catch (utf8::exception const& e) {
    bad_pattern(fmt::format("invalid UTF-8 in character class ({})", e.what()),
                sv);
  }

  pos = it - sv.begin();

  // a class member is always followed by `-`, `]` or another member
  if (pos >= sv.size()) {
    bad_pattern("unmatched '['", sv);
  }

  return cp;
}

} // namespace

glob_pattern::glob_pattern(std::string_view pattern) {
  size_t const len = pattern.size();
  size_t pos = 0;

  while (pos < len) {
    chunk ch;

    // consecutive stars are equivalent to a single one
    while (pos < len && pattern[pos] == '*') {
      ch.star = true;
      ++pos;
    }

    while (pos < len && pattern[pos] != '*') {
      element el;

      switch (pattern[pos]) {
      case '\\':
        if (++pos >= len) {
          bad_pattern("trailing backslash", pattern);
        }
        el.byte = pattern[pos++];
        break;

      case '?':
        el.type = element::kind::any;
        ++pos;
        break;

      case '[':
        el.type = element::kind::char_class;
        if (++pos < len && pattern[pos] == '^') {
          el.negated = true;
          ++pos;
        }
        while (pos >= len || pattern[pos] != ']' || el.ranges.empty()) {
          auto const lo = class_code_point(pattern, pos);
          auto hi = lo;
          if (pattern[pos] == '-') {
            hi = class_code_point(pattern, ++pos);
          }
          el.ranges.push_back({lo, hi});
        }
        ++pos;
        break;

      default:
        el.byte = pattern[pos++];
        break;
      }

      ch.elements.push_back(std::move(el));
    }

    chunks_.push_back(std::move(ch));
  }
}

std::optional<std::string_view>
glob_pattern::match_chunk(std::vector<element> const& elements,
                          std::string_view s) {
  for (auto const& el : elements) {
    if (s.empty()) {
      return std::nullopt;
    }

    switch (el.type) {
    case element::kind::literal:
      if (s.front() != el.byte) {
        return std::nullopt;
      }
      s.remove_prefix(1);
      break;

    case element::kind::any: {
      if (s.front() == '/') {
        return std::nullopt;
      }
      s.remove_prefix(next_code_point(s).second);
    } break;

    case element::kind::char_class: {
      auto const [cp, n] = next_code_point(s);
      bool found = false;
      for (auto const& r : el.ranges) {
        if (r.lo <= cp && cp <= r.hi) {
          found = true;
          break;
        }
      }
      if (found == el.negated) {
        return std::nullopt;
      }
      s.remove_prefix(n);
    } break;
    }
  }

  return s;
}

bool glob_pattern::match(std::string_view name) const {
  for (size_t i = 0; i < chunks_.size(); ++i) {
    auto const& ch = chunks_[i];
    bool const last = i + 1 == chunks_.size();

    if (ch.star && ch.elements.empty()) {
      // a trailing star matches the rest unless it contains a separator
      return name.find('/') == std::string_view::npos;
    }

    if (auto rest = match_chunk(ch.elements, name);
        rest && (rest->empty() || !last)) {
      name = *rest;
      continue;
    }

    if (!ch.star) {
      return false;
    }

    // leftmost match after the star, which cannot cross a separator
    bool found = false;

    for (size_t k = 0; k < name.size() && name[k] != '/'; ++k) {
      if (auto rest = match_chunk(ch.elements, name.substr(k + 1));
          rest && (rest->empty() || !last)) {
        name = *rest;
        found = true;
        break;
      }
    }

    if (!found) {
      return false;
    }
  }

  return name.empty();
}

} // namespace vpkx::internal
