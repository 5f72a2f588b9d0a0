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
#include <charconv>
#include <map>
#include <memory>
#include <ostream>
#include <vector>

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/string.h>

#include <vpkx/manifest/packing_hints.h>

namespace vpkx::manifest {

namespace {

using flag_counts = std::map<entry_flags, size_t>;

struct dir_node {
  std::map<std::string, entry_flags> files;
  std::map<std::string, std::unique_ptr<dir_node>> dirs;
  flag_counts counts;
};

std::optional<entry_flags> most_common(flag_counts const& counts) {
  std::optional<entry_flags> best;
  size_t best_count = 0;

  // ascending order, so ties go to the smallest flags
  for (auto const& [flags, count] : counts) {
    if (count > best_count) {
      best = flags;
      best_count = count;
    }
  }

  return best;
}

std::string anchored_pattern(std::string_view path) {
  return "/" + glob_escape(path);
}

std::string join_path(std::string const& dir, std::string const& name) {
  return dir.empty() ? name : dir + '/' + name;
}

template <typename T>
T parse_hex(std::string_view sv, size_t lineno) {
  T value{};

  if (sv.starts_with("0x") || sv.starts_with("0X")) {
    sv.remove_prefix(2);
  }

  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value, 16);

  if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
    VPKX_THROW(runtime_error,
               fmt::format(".vpkflags line {}: invalid flags '{}'", lineno,
                           sv));
  }

  return value;
}

std::string_view next_field(std::string_view& sv) {
  auto start = sv.find_first_not_of(" \t");
  if (start == std::string_view::npos) {
    sv = {};
    return {};
  }
  sv.remove_prefix(start);
  auto end = sv.find_first_of(" \t");
  auto field = sv.substr(0, end);
  sv.remove_prefix(end == std::string_view::npos ? sv.size() : end);
  return field;
}

} // namespace

std::ostream& operator<<(std::ostream& os, entry_flags const& f) {
  return os << fmt::format("{:#010x} {:#06x}", f.load_flags, f.texture_flags);
}

std::optional<entry_flags>
get_entry_flags(reader::archive_entry const& entry) {
  std::optional<entry_flags> flags;

  for (auto const& c : entry.chunks) {
    entry_flags cf{c.load_flags, c.texture_flags};

    if (!flags) {
      flags = cf;
    } else if (*flags != cf) {
      VPKX_THROW(runtime_error,
                 fmt::format("{}: chunks have inconsistent flags", entry.path));
    }
  }

  return flags;
}

packing_hints packing_hints::parse(std::string_view text) {
  packing_hints ph;
  size_t lineno = 0;

  for (auto line : split_to<std::vector<std::string_view>>(text, '\n')) {
    ++lineno;

    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }

    auto rest = line;
    auto load = next_field(rest);

    if (load.empty() || load.starts_with('#')) {
      continue;
    }

    auto texture = next_field(rest);
    auto pattern = rest.substr(std::min(rest.find_first_not_of(" \t"),
                                        rest.size()));

    if (texture.empty() || pattern.empty()) {
      VPKX_THROW(runtime_error,
                 fmt::format(".vpkflags line {}: expected '<load_flags> "
                             "<texture_flags> <pattern>'",
                             lineno));
    }

    ph.add({parse_hex<uint32_t>(load, lineno),
            parse_hex<uint16_t>(texture, lineno)},
           pattern);
  }

  return ph;
}

void packing_hints::add(entry_flags flags, std::string_view pattern) {
  matchers_.emplace_back(pattern);
  rules_.push_back({flags, std::string(pattern)});
}

void packing_hints::clear() {
  rules_.clear();
  matchers_.clear();
}

std::optional<entry_flags>
packing_hints::resolve(std::string_view path) const {
  for (size_t i = rules_.size(); i > 0; --i) {
    if (matchers_[i - 1].match(path)) {
      return rules_[i - 1].flags;
    }
  }

  return std::nullopt;
}

void packing_hints::generate(std::span<reader::archive_entry const> entries) {
  dir_node root;

  for (auto const& e : entries) {
    auto flags = get_entry_flags(e);

    if (!flags) {
      continue;
    }

    auto parts = split_to<std::vector<std::string>>(e.path, '/');
    auto* node = &root;

    node->counts[*flags]++;

    for (size_t i = 0; i + 1 < parts.size(); ++i) {
      auto& child = node->dirs[parts[i]];
      if (!child) {
        child = std::make_unique<dir_node>();
      }
      node = child.get();
      node->counts[*flags]++;
    }

    node->files.emplace(parts.back(), *flags);
  }

  clear();

  auto root_flags = most_common(root.counts);

  if (!root_flags) {
    return;
  }

  add(*root_flags, "/*");

  auto walk = [this](auto& self, dir_node const& dir, std::string const& path,
                     entry_flags inherited) -> void {
    for (auto const& [name, flags] : dir.files) {
      if (flags != inherited) {
        add(flags, anchored_pattern(join_path(path, name)));
      }
    }

    for (auto const& [name, child] : dir.dirs) {
      auto child_path = join_path(path, name);
      auto effective = inherited;

      if (auto dom = most_common(child->counts); dom && *dom != inherited) {
        add(*dom, anchored_pattern(child_path));
        effective = *dom;
      }

      self(self, *child, child_path, effective);
    }
  };

  walk(walk, root, std::string{}, *root_flags);
}

void packing_hints::generate_explicit(
    std::span<reader::archive_entry const> entries) {
  clear();

  for (auto const& e : entries) {
    if (auto flags = get_entry_flags(e)) {
      add(*flags, anchored_pattern(e.path));
    }
  }
}

void packing_hints::test(std::span<reader::archive_entry const> entries) const {
  auto reparsed = parse(to_string());

  for (auto const& e : entries) {
    auto expected = get_entry_flags(e);

    if (!expected) {
      continue;
    }

    auto actual = reparsed.resolve(e.path);

    if (!actual) {
      VPKX_THROW(runtime_error,
                 fmt::format("{}: not matched by any rule", e.path));
    }

    if (*actual != *expected) {
      VPKX_THROW(runtime_error,
                 fmt::format("{}: resolved to {:#010x} {:#06x}, expected "
                             "{:#010x} {:#06x}",
                             e.path, actual->load_flags, actual->texture_flags,
                             expected->load_flags, expected->texture_flags));
    }
  }
}

std::string packing_hints::to_string() const {
  std::string out;

  for (auto const& r : rules_) {
    out += fmt::format("{:#010x} {:#06x} {}\n", r.flags.load_flags,
                       r.flags.texture_flags, r.pattern);
  }

  return out;
}

} // namespace vpkx::manifest
