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

#include <sstream>
#include <string>
#include <vector>

#include <vpkx/error.h>
#include <vpkx/manifest/packing_hints.h>

using namespace vpkx;
using manifest::entry_flags;
using manifest::packing_hints;

namespace {

reader::archive_entry make_entry(std::string path, uint32_t load_flags,
                                 uint16_t texture_flags = 0,
                                 size_t num_chunks = 1) {
  reader::archive_entry e;
  e.path = std::move(path);
  for (size_t i = 0; i < num_chunks; ++i) {
    reader::archive_chunk c;
    c.load_flags = load_flags;
    c.texture_flags = texture_flags;
    c.compressed_size = c.uncompressed_size = 10;
    e.chunks.push_back(c);
  }
  return e;
}

std::vector<reader::archive_entry> sample_entries() {
  return {
      make_entry("scripts/vscripts/a.nut", 0x101),
      make_entry("scripts/vscripts/b.nut", 0x101),
      make_entry("scripts/vscripts/c.nut", 0x101),
      make_entry("scripts/vscripts/special.nut", 0x3),
      make_entry("materials/a.vmt", 0x1),
      make_entry("materials/b.vmt", 0x1),
      make_entry("materials/tex/a.vtf", 0x1, 0x8),
      make_entry("materials/tex/b.vtf", 0x1, 0x8),
      make_entry("readme.txt", 0x1),
      make_entry("cfg/a.cfg", 0x1),
  };
}

} // namespace

TEST(packing_hints_test, entry_flags) {
  EXPECT_EQ((entry_flags{0x101, 0x8}),
            manifest::get_entry_flags(make_entry("a", 0x101, 0x8, 3)));

  reader::archive_entry empty;
  empty.path = "empty";
  EXPECT_FALSE(manifest::get_entry_flags(empty));

  auto mixed = make_entry("mixed.bin", 0x1, 0, 2);
  mixed.chunks[1].load_flags = 0x2;
  EXPECT_THROW(manifest::get_entry_flags(mixed), runtime_error);

  std::ostringstream oss;
  oss << entry_flags{0x101, 0x8};
  EXPECT_EQ("0x00000101 0x0008", oss.str());
}

TEST(packing_hints_test, generate_minimal_rules) {
  auto const entries = sample_entries();

  packing_hints ph;
  ph.generate(entries);

  EXPECT_EQ("0x00000001 0x0000 /*\n"
            "0x00000001 0x0008 /materials/tex\n"
            "0x00000101 0x0000 /scripts\n"
            "0x00000003 0x0000 /scripts/vscripts/special.nut\n",
            ph.to_string());

  EXPECT_EQ(4, ph.rules().size());
  EXPECT_NO_THROW(ph.test(entries));

  for (auto const& e : entries) {
    EXPECT_EQ(manifest::get_entry_flags(e), ph.resolve(e.path)) << e.path;
  }
}

TEST(packing_hints_test, generate_ties_prefer_smallest_flags) {
  std::vector<reader::archive_entry> const entries{
      make_entry("x.txt", 0x3),
      make_entry("y.txt", 0x1),
  };

  packing_hints ph;
  ph.generate(entries);

  EXPECT_EQ("0x00000001 0x0000 /*\n"
            "0x00000003 0x0000 /x.txt\n",
            ph.to_string());
  EXPECT_NO_THROW(ph.test(entries));
}

TEST(packing_hints_test, generate_escapes_names) {
  std::vector<reader::archive_entry> const entries{
      make_entry("a.txt", 0x1),
      make_entry("b.txt", 0x1),
      make_entry("weird[1]*.txt", 0x2),
  };

  packing_hints ph;
  ph.generate(entries);

  EXPECT_EQ("0x00000001 0x0000 /*\n"
            "0x00000002 0x0000 /weird\\[1\\]\\*.txt\n",
            ph.to_string());
  EXPECT_NO_THROW(ph.test(entries));
}

TEST(packing_hints_test, generate_skips_empty_entries) {
  reader::archive_entry empty;
  empty.path = "nothing";

  std::vector<reader::archive_entry> entries{empty};

  packing_hints ph;
  ph.add({0x1, 0}, "/*");
  ph.generate(entries);

  EXPECT_TRUE(ph.empty());
  EXPECT_EQ("", ph.to_string());
}

TEST(packing_hints_test, generate_explicit) {
  auto const entries = sample_entries();

  packing_hints ph;
  ph.generate_explicit(entries);

  ASSERT_EQ(entries.size(), ph.rules().size());
  EXPECT_EQ("/scripts/vscripts/a.nut", ph.rules()[0].pattern);
  EXPECT_EQ((entry_flags{0x1, 0x8}), ph.rules()[6].flags);
  EXPECT_NO_THROW(ph.test(entries));
}

TEST(packing_hints_test, test_detects_mismatch) {
  auto const entries = sample_entries();

  packing_hints ph;
  ph.add({0x1, 0}, "/*");

  try {
    ph.test(entries);
    FAIL() << "expected runtime_error";
  } catch (runtime_error const& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("scripts/vscripts/a.nut"));
  }

  packing_hints none;
  EXPECT_THROW(none.test(entries), runtime_error);
}

TEST(packing_hints_test, resolve_last_match_wins) {
  packing_hints ph;
  ph.add({0x1, 0}, "/*");
  ph.add({0x2, 0}, "*.vtf");
  ph.add({0x3, 0}, "/materials/special");

  EXPECT_EQ((entry_flags{0x1, 0}), ph.resolve("readme.txt"));
  EXPECT_EQ((entry_flags{0x2, 0}), ph.resolve("materials/a.vtf"));
  EXPECT_EQ((entry_flags{0x3, 0}), ph.resolve("materials/special/a.vtf"));

  packing_hints empty;
  EXPECT_FALSE(empty.resolve("readme.txt"));
}

TEST(packing_hints_test, parse) {
  auto ph = packing_hints::parse("# generated\n"
                                 "\n"
                                 "0x00000001 0x0000 /*\r\n"
                                 "   101\t8   /materials/with space.vmt\n"
                                 "0X3 0x0 *.nut");

  ASSERT_EQ(3, ph.rules().size());
  EXPECT_EQ("/*", ph.rules()[0].pattern);
  EXPECT_EQ((entry_flags{0x101, 0x8}), ph.rules()[1].flags);
  EXPECT_EQ("/materials/with space.vmt", ph.rules()[1].pattern);
  EXPECT_EQ((entry_flags{0x3, 0}), ph.rules()[2].flags);

  EXPECT_EQ(ph.to_string(), packing_hints::parse(ph.to_string()).to_string());
}

TEST(packing_hints_test, parse_errors) {
  auto expect_error = [](std::string_view text, std::string_view what) {
    try {
      packing_hints::parse(text);
      FAIL() << "expected runtime_error for: " << text;
    } catch (runtime_error const& e) {
      EXPECT_THAT(e.what(), ::testing::HasSubstr(std::string(what))) << text;
    }
  };

  expect_error("0x1 0x0 /*\n0x1\n", "line 2");
  expect_error("0x1 0x0\n", "line 1");
  expect_error("0xZZ 0x0 /*\n", "invalid flags");
  expect_error("0x1 0x10000 /*\n", "invalid flags");
  expect_error("0x1 0x0x /*\n", "invalid flags");
  expect_error("0x 0x0 /*\n", "invalid flags");

  EXPECT_THROW(packing_hints::parse("0x1 0x0 [oops\n"), pattern_error);
}
