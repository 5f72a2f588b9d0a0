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

#include <compare>
#include <iosfwd>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <vpkx/glob_matcher.h>
#include <vpkx/reader/archive_entry.h>

namespace vpkx::manifest {

struct entry_flags {
  uint32_t load_flags{0};
  uint16_t texture_flags{0};

  auto operator<=>(entry_flags const&) const = default;
};

std::ostream& operator<<(std::ostream& os, entry_flags const& f);

/**
 * The flags shared by all chunks of `entry`
 *
 * \returns An empty optional for an entry without chunks. Throws
 *          `runtime_error` if the chunks disagree.
 */
std::optional<entry_flags> get_entry_flags(reader::archive_entry const& entry);

/**
 * Per-path chunk flags (the `.vpkflags` manifest)
 *
 * Each rule is a line `<load_flags> <texture_flags> <pattern>` with both
 * flags in hex. A path takes the flags of the last rule whose pattern
 * matches it (see `glob_matcher`).
 */
class packing_hints {
 public:
  static constexpr std::string_view filename{".vpkflags"};

  struct rule {
    entry_flags flags;
    std::string pattern;
  };

  static packing_hints parse(std::string_view text);

  void add(entry_flags flags, std::string_view pattern);
  void clear();

  std::optional<entry_flags> resolve(std::string_view path) const;

  /**
   * Replace all rules with a minimal set describing `entries`
   *
   * The root rule carries the most common flags. Directories and files
   * only get a rule where they differ from what they inherit.
   */
  void generate(std::span<reader::archive_entry const> entries);

  /**
   * Replace all rules with one rule per entry
   */
  void generate_explicit(std::span<reader::archive_entry const> entries);

  /**
   * Check that the rendered rules resolve every entry to its own flags
   *
   * Throws `runtime_error` describing the first mismatch.
   */
  void test(std::span<reader::archive_entry const> entries) const;

  std::span<rule const> rules() const { return rules_; }
  bool empty() const { return rules_.empty(); }

  std::string to_string() const;

 private:
  std::vector<rule> rules_;
  std::vector<glob_matcher> matchers_;
};

} // namespace vpkx::manifest
