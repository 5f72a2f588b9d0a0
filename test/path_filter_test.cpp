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

#include <algorithm>
#include <string>
#include <vector>

#include <vpkx/error.h>
#include <vpkx/path_filter.h>

using namespace vpkx;

namespace {

std::vector<std::string> const paths{
    "secrets/public.txt",
    "secrets/private.key",
    "secrets/nested/deep.key",
    "scripts/vscripts/main.nut",
    "scripts/vscripts/main.nut.tmp",
    "models/props/crate.mdl",
    "resource/ui/menu.res",
    "readme.txt",
};

std::vector<std::string>
kept(path_filter const& f, std::vector<std::string> const& in = paths) {
  std::vector<std::string> rv;
  std::copy_if(in.begin(), in.end(), std::back_inserter(rv),
               [&](auto const& p) { return !f.is_excluded(p); });
  return rv;
}

} // namespace

TEST(path_filter_test, empty_filter_excludes_nothing) {
  path_filter f;
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(paths, kept(f));
}

TEST(path_filter_test, exclude_with_include_override) {
  std::vector<std::string> const exclude{"/secrets"};
  std::vector<std::string> const include{"/secrets/public.txt"};
  path_filter f(exclude, include);

  EXPECT_FALSE(f.empty());
  EXPECT_EQ(1, f.exclude_count());
  EXPECT_EQ(1, f.include_count());

  EXPECT_FALSE(f.is_excluded("secrets/public.txt"));
  EXPECT_TRUE(f.is_excluded("secrets/private.key"));
  EXPECT_TRUE(f.is_excluded("secrets/nested/deep.key"));
  EXPECT_FALSE(f.is_excluded("readme.txt"));
}

TEST(path_filter_test, any_exclude_matches) {
  std::vector<std::string> const exclude{"*.tmp", "/models", "*.key"};
  path_filter f(exclude, {});

  EXPECT_THAT(kept(f), ::testing::ElementsAre("secrets/public.txt",
                                              "scripts/vscripts/main.nut",
                                              "resource/ui/menu.res",
                                              "readme.txt"));
}

TEST(path_filter_test, include_only_never_excludes) {
  std::vector<std::string> const include{"*.txt", "/nothing"};
  path_filter f({}, include);

  EXPECT_TRUE(f.empty());
  EXPECT_EQ(paths, kept(f));
}

TEST(path_filter_test, include_overrides_any_exclude) {
  path_filter f;
  f.add_exclude("/scripts");
  f.add_exclude("*.tmp");
  f.add_include("main.nut.tmp");

  EXPECT_FALSE(f.is_excluded("scripts/vscripts/main.nut.tmp"));
  EXPECT_TRUE(f.is_excluded("scripts/vscripts/main.nut"));
  EXPECT_FALSE(f.is_excluded("readme.txt"));
}

TEST(path_filter_test, include_of_directory_rescues_subtree) {
  path_filter f;
  f.add_exclude("*");
  f.add_include("/resource");

  EXPECT_THAT(kept(f), ::testing::ElementsAre("resource/ui/menu.res"));
}

TEST(path_filter_test, order_independent) {
  std::vector<std::string> exclude{"/secrets", "*.tmp", "/models/props"};
  std::vector<std::string> include{"public.txt", "/scripts/vscripts/*.tmp",
                                   "/models"};

  std::sort(exclude.begin(), exclude.end());
  std::sort(include.begin(), include.end());

  auto const expected = kept(path_filter(exclude, include));

  do {
    do {
      path_filter f(exclude, include);
      EXPECT_EQ(expected, kept(f));
    } while (std::next_permutation(include.begin(), include.end()));
  } while (std::next_permutation(exclude.begin(), exclude.end()));
}

TEST(path_filter_test, invalid_pattern_throws_on_construction) {
  std::vector<std::string> const good{"*.tmp"};
  std::vector<std::string> const bad{"*.tmp", "[oops"};

  EXPECT_THROW(path_filter(bad, good), pattern_error);
  EXPECT_THROW(path_filter(good, bad), pattern_error);

  path_filter f;
  EXPECT_THROW(f.add_exclude("a\\"), pattern_error);
  EXPECT_THROW(f.add_include("[]"), pattern_error);
}
