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

#include <array>

#include <vpkx/glob_matcher.h>
#include <vpkx/string.h>

#include <vpkx/manifest/ignore_patterns.h>

namespace vpkx::manifest {

namespace {

constexpr std::array<std::string_view, 9> const default_ignore{
    "/.vpkflags", "/.vpkignore", ".git",   ".DS_Store", "._*",
    "Thumbs.db",  "desktop.ini", "*.swp",  "*~",
};

} // namespace

std::span<std::string_view const> ignore_patterns::default_patterns() {
  return default_ignore;
}

ignore_patterns ignore_patterns::parse(std::string_view text) {
  ignore_patterns ip;

  if (text.ends_with('\n')) {
    text.remove_suffix(1);
  }

  for (auto line : split_to<std::vector<std::string_view>>(text, '\n')) {
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    ip.add(line);
  }

  return ip;
}

void ignore_patterns::add(std::string_view line) {
  if (!line.empty() && !line.starts_with('#')) {
    if (line.starts_with('!')) {
      filter_.add_include(line.substr(1));
    } else {
      filter_.add_exclude(line);
    }
  }

  lines_.emplace_back(line);
}

void ignore_patterns::add_default() {
  for (auto p : default_ignore) {
    add(p);
  }
}

void ignore_patterns::add_auto_exclusions(
    std::span<reader::archive_entry const> entries) {
  std::vector<std::string> rescue;

  for (auto const& e : entries) {
    if (match(e.path)) {
      rescue.push_back("!/" + glob_escape(e.path));
    }
  }

  if (!rescue.empty()) {
    add("# archive entries matched by the patterns above");
    for (auto const& r : rescue) {
      add(r);
    }
  }
}

std::string ignore_patterns::to_string() const {
  std::string out;

  for (auto const& l : lines_) {
    out += l;
    out += '\n';
  }

  return out;
}

} // namespace vpkx::manifest
