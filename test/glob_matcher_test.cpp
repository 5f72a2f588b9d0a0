/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of vpkx.
 *
 * vpkx is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vpkx is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vpkx.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <vpkx/error.h>
#include <vpkx/glob_matcher.h>

using namespace vpkx;

namespace {

struct glob_case {
  std::string pattern;
  std::string path;
  bool expected;
};

std::ostream& operator<<(std::ostream& os, glob_case const& c) {
  return os << "'" << c.pattern << "' ~ '" << c.path << "'";
}

} // namespace

TEST(glob_matcher_test, unanchored) {
  std::vector<glob_case> const cases{
      {"*.tmp", "a.tmp", true},
      {"*.tmp", "x/y/z/a.tmp", true},
      {"*.tmp", "x/y/z/a.tmpx", false},
      {"*.tmp", "dir.tmp/file.txt", true},
      {"cache", "cache", true},
      {"cache", "models/cache/a.mdl", true},
      {"cache", "models/cached/a.mdl", false},
      {"?.txt", "a/b.txt", true},
      {"?.txt", "a/bb.txt", false},
      {"*", "anything/at/all", true},
      // a multi-component pattern is tested against ancestor prefixes
      {"a/b", "a/b/c.txt", true},
      {"b/c", "a/b/c", false},
      {"a/*", "a/b/c", true},
      {"*/b", "a/b/c", true},
      {"*/c", "a/b/c", false},
  };

  for (auto const& c : cases) {
    EXPECT_EQ(c.expected, match_glob_parents(c.pattern, c.path)) << c;
  }
}

TEST(glob_matcher_test, anchored) {
  std::vector<glob_case> const cases{
      {"/secrets", "secrets", true},
      {"/secrets", "secrets/public.txt", true},
      {"/secrets", "secrets/deep/key.pem", true},
      {"/secrets", "other/secrets/key.pem", false},
      {"/secrets", "secrets.txt", false},
      {"/*.txt", "a.txt", true},
      {"/*.txt", "dir/a.txt", false},
      {"/scripts/*.nut", "scripts/main.nut", true},
      {"/scripts/*.nut", "scripts/vscripts/main.nut", false},
      {"/scripts/*", "scripts/vscripts/main.nut", true},
      {"/", "a", false},
  };

  for (auto const& c : cases) {
    EXPECT_EQ(c.expected, match_glob_parents(c.pattern, c.path)) << c;
  }
}

TEST(glob_matcher_test, star_does_not_cross_separator) {
  EXPECT_FALSE(match_glob_parents("/a*c", "ab/c"));
  EXPECT_TRUE(match_glob_parents("/a*c", "abbbc"));
  EXPECT_TRUE(match_glob_parents("/a**c", "abc"));
  EXPECT_FALSE(match_glob_parents("/a?c", "a/c"));
}

TEST(glob_matcher_test, character_classes) {
  std::vector<glob_case> const cases{
      {"[abc].txt", "b.txt", true},
      {"[abc].txt", "d.txt", false},
      {"[a-c].txt", "c.txt", true},
      {"[a-c].txt", "C.txt", false},
      {"[^a-c].txt", "d.txt", true},
      {"[^a-c].txt", "a.txt", false},
      // only `^` negates, `!` is an ordinary member
      {"[!a]x", "!x", true},
      {"[!a]x", "ax", true},
      {"[!a]x", "bx", false},
      {"[0-9][0-9].vtf", "textures/42.vtf", true},
      {"[0-9][0-9].vtf", "textures/4x.vtf", false},
      {"[\\]]", "]", true},
      {"[\\-]", "-", true},
      {"[a\\-z]", "-", true},
      {"[a\\-z]", "m", false},
      {"[^/]", "/", false},
      {"/a[^b]c", "a/c", true},
      {"[*]", "*", true},
      {"[*]", "x", false},
  };

  for (auto const& c : cases) {
    EXPECT_EQ(c.expected, match_glob_parents(c.pattern, c.path)) << c;
  }
}

TEST(glob_matcher_test, reversed_range_matches_nothing) {
  glob_matcher m("[z-a].txt");
  EXPECT_FALSE(m("a.txt"));
  EXPECT_FALSE(m("m.txt"));
  EXPECT_FALSE(m("z.txt"));

  EXPECT_TRUE(match_glob_parents("[z-ab].txt", "b.txt"));
  EXPECT_TRUE(match_glob_parents("[^z-a].txt", "m.txt"));
}

TEST(glob_matcher_test, code_points) {
  std::vector<glob_case> const cases{
      {"?.txt", "\xc3\xa9.txt", true},
      {"??.txt", "\xc3\xa9.txt", false},
      {"/sounds/?", "sounds/\xe2\x82\xac", true},
      {"?", "\xf0\x9f\x98\x80", true},
      {"[\xc3\xa0-\xc3\xbf]x", "\xc3\xa9x", true},
      {"[\xc3\xa0-\xc3\xbf]x", "ex", false},
      {"[^\xc3\xa9]x", "\xc3\xa9x", false},
      {"[^\xc3\xa9]x", "\xc3\xa8x", true},
      {"*\xc3\xa9", "caf\xc3\xa9", true},
      // invalid sequences count as a single byte each
      {"??", "\xc3\x28", true},
      {"?", "\xff", true},
  };

  for (auto const& c : cases) {
    EXPECT_EQ(c.expected, match_glob_parents(c.pattern, c.path)) << c;
  }
}

TEST(glob_matcher_test, escapes) {
  EXPECT_TRUE(match_glob_parents("\\*", "*"));
  EXPECT_FALSE(match_glob_parents("\\*", "a"));
  EXPECT_TRUE(match_glob_parents("a\\?b", "dir/a?b"));
  EXPECT_FALSE(match_glob_parents("a\\?b", "dir/axb"));
  EXPECT_TRUE(match_glob_parents("\\[x\\]", "[x]"));
  EXPECT_TRUE(match_glob_parents("a\\\\b", "a\\b"));
}

TEST(glob_matcher_test, punctuation_is_literal) {
  EXPECT_TRUE(match_glob_parents("a.b", "a.b"));
  EXPECT_FALSE(match_glob_parents("a.b", "axb"));
  EXPECT_TRUE(match_glob_parents("(x)+{1}|$^", "(x)+{1}|$^"));
  EXPECT_FALSE(match_glob_parents("(x)+", "xx"));
}

TEST(glob_matcher_test, invalid_patterns) {
  for (auto const* pat : {"[", "[abc", "a\\", "[]", "[a-]", "[-a]",
                          "[a\\", "/scripts/[", "[^]"}) {
    EXPECT_THROW(glob_matcher{pat}, pattern_error) << pat;
    EXPECT_THROW(match_glob_parents(pat, "a/b"), pattern_error) << pat;
  }
}

TEST(glob_matcher_test, invalid_pattern_message) {
  try {
    glob_matcher m("foo[");
    FAIL() << "expected pattern_error";
  } catch (pattern_error const& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("foo["));
  }
}

TEST(glob_matcher_test, accessors) {
  glob_matcher a("/x/*.txt");
  glob_matcher u("*.txt");

  EXPECT_TRUE(a.anchored());
  EXPECT_FALSE(u.anchored());
  EXPECT_EQ("/x/*.txt", a.pattern());
  EXPECT_EQ("*.txt", u.pattern());

  EXPECT_TRUE(a("x/y.txt"));
  EXPECT_FALSE(a("y/x/y.txt"));
  EXPECT_TRUE(u("y/x/y.txt"));

  glob_matcher moved{std::move(a)};
  EXPECT_TRUE(moved.match("x/z.txt"));
}

TEST(glob_matcher_test, empty_path_never_matches) {
  EXPECT_FALSE(match_glob_parents("*", ""));
  EXPECT_FALSE(match_glob_parents("/*", ""));
}

TEST(glob_matcher_test, escape) {
  EXPECT_EQ("plain/name.txt", glob_escape("plain/name.txt"));
  EXPECT_EQ("a\\*b\\?c\\[d\\]e\\\\f", glob_escape("a*b?c[d]e\\f"));

  for (std::string name : {"weird[1].txt", "star*", "q?", "back\\slash"}) {
    auto pat = "/" + glob_escape(name);
    EXPECT_TRUE(match_glob_parents(pat, name)) << pat;
  }

  EXPECT_FALSE(match_glob_parents("/" + glob_escape("star*"), "starfish"));
}
