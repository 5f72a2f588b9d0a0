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
#include <filesystem>
#include <string>
#include <vector>

#include <vpkx/error.h>
#include <vpkx/file_util.h>
#include <vpkx/reader/vpk_location.h>
#include <vpkx/reader/vpk_reader.h>

#include "test_logger.h"
#include "vpk_builder.h"

using namespace vpkx;
namespace fs = std::filesystem;

namespace {

std::string read_entry(reader::vpk_reader const& r,
                       reader::archive_entry const& e, size_t parallelism) {
  auto es = r.open_entry(e, parallelism);
  std::string rv;
  std::vector<uint8_t> buf(1000);

  while (auto n = es.read(buf)) {
    rv.append(reinterpret_cast<char const*>(buf.data()), n);
  }

  return rv;
}

std::vector<std::string> entry_paths(reader::vpk_reader const& r) {
  std::vector<std::string> rv;
  for (auto const& e : r.entries()) {
    rv.push_back(e.path);
  }
  return rv;
}

std::string large_data(size_t size) {
  std::string rv;
  rv.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    rv.push_back(static_cast<char>((i * 7 + i / 251) & 0xFF));
  }
  return rv;
}

class vpk_reader_test : public ::testing::Test {
 protected:
  test::test_logger lgr;
  temporary_directory td{"vpkx"};
};

} // namespace

TEST_F(vpk_reader_test, lists_entries) {
  test::vpk_builder b;
  b.add("scripts/vscripts/main.nut", "print(1)")
      .add("readme.txt", "hello")
      .add("Makefile", "all:")
      .add("resource/ui/menu.res", "menu", 0x101, 0x8)
      .add("resource/ui/hud.res", "hud");

  auto loc = b.write(td.path(), "client_mp_common.bsp");
  reader::vpk_reader r(lgr, loc);

  // grouped by extension, then by directory
  EXPECT_THAT(entry_paths(r),
              ::testing::ElementsAre("Makefile", "scripts/vscripts/main.nut",
                                     "resource/ui/menu.res",
                                     "resource/ui/hud.res", "readme.txt"));

  auto const& menu = r.entries()[2];
  EXPECT_EQ(test::crc32_of("menu"), menu.crc32);
  EXPECT_EQ(4, menu.uncompressed_size());
  ASSERT_EQ(1, menu.chunks.size());
  EXPECT_EQ(0x101, menu.chunks[0].load_flags);
  EXPECT_EQ(0x8, menu.chunks[0].texture_flags);
  EXPECT_FALSE(menu.chunks[0].is_compressed());

  EXPECT_EQ(loc.dir_file(), r.location().dir_file());
}

TEST_F(vpk_reader_test, reads_entries) {
  test::vpk_builder b;
  b.add("a/one.txt", "first file").add("b/two.bin", std::string(3, '\0'));
  b.add("empty.txt", "");

  reader::vpk_reader r(lgr, b.write(td.path(), "test"));

  for (size_t parallelism : {0, 1, 4}) {
    for (auto const& e : r.entries()) {
      auto data = read_entry(r, e, parallelism);
      if (e.path == "a/one.txt") {
        EXPECT_EQ("first file", data);
      } else if (e.path == "b/two.bin") {
        EXPECT_EQ(std::string(3, '\0'), data);
      } else {
        EXPECT_EQ("empty.txt", e.path);
        EXPECT_EQ("", data);
      }
    }
  }
}

TEST_F(vpk_reader_test, multi_chunk_entries) {
  auto const data = large_data(100'000);

  test::vpk_builder b;
  b.add({.path = "maps/big.bsp", .data = data, .chunk_size = 4096});
  b.add({.path = "maps/odd.bsp", .data = data.substr(0, 10'001),
         .chunk_size = 1000});

  reader::vpk_reader r(lgr, b.write(td.path(), "test"));

  ASSERT_EQ(2, r.entries().size());
  auto const& big = r.entries()[0];
  auto const& odd = r.entries()[1];
  EXPECT_EQ("maps/big.bsp", big.path);
  EXPECT_EQ(25, big.chunks.size());
  EXPECT_EQ(data.size(), big.uncompressed_size());
  EXPECT_EQ(11, odd.chunks.size());

  for (size_t parallelism : {0, 1, 2, 8, 3}) {
    EXPECT_EQ(data, read_entry(r, big, parallelism)) << parallelism;
    EXPECT_EQ(data.substr(0, 10'001), read_entry(r, odd, parallelism))
        << parallelism;
  }
}

TEST_F(vpk_reader_test, checksum_mismatch) {
  test::vpk_builder b;
  b.add({.path = "bad.txt", .data = "payload", .crc = 0xDEADBEEF});

  reader::vpk_reader r(lgr, b.write(td.path(), "test"));

  for (size_t parallelism : {0, 2}) {
    EXPECT_THROW(read_entry(r, r.entries()[0], parallelism), archive_error);
  }
}

TEST_F(vpk_reader_test, compressed_chunks_are_rejected) {
  test::vpk_builder b;
  b.add({.path = "packed.txt", .data = "not really compressed",
         .compressed = true});

  reader::vpk_reader r(lgr, b.write(td.path(), "test"));

  ASSERT_EQ(1, r.entries().size());
  EXPECT_TRUE(r.entries()[0].chunks[0].is_compressed());

  try {
    read_entry(r, r.entries()[0], 0);
    FAIL() << "expected archive_error";
  } catch (archive_error const& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("compressed"));
  }
}

TEST_F(vpk_reader_test, missing_directory_file) {
  reader::vpk_location loc;
  loc.dir = td.path();
  loc.name = "nothing";

  EXPECT_THROW(reader::vpk_reader(lgr, loc), archive_error);
}

TEST_F(vpk_reader_test, missing_data_file) {
  test::vpk_builder b;
  b.add("file.txt", "data");

  auto loc = b.write(td.path(), "test");
  fs::remove(loc.archive_file(0));

  reader::vpk_reader r(lgr, loc);
  ASSERT_EQ(1, r.entries().size());

  EXPECT_THROW(read_entry(r, r.entries()[0], 0), archive_error);
}

TEST_F(vpk_reader_test, truncated_data_file) {
  test::vpk_builder b;
  b.add("file.txt", "some data");

  auto loc = b.write(td.path(), "test");
  write_file(loc.archive_file(0), "some");

  reader::vpk_reader r(lgr, loc);

  EXPECT_THROW(read_entry(r, r.entries()[0], 0), archive_error);
}

TEST_F(vpk_reader_test, bad_header) {
  test::vpk_builder b;
  b.add("file.txt", "data");
  auto const good = b.build_directory();

  reader::vpk_location loc;
  loc.dir = td.path();
  loc.name = "test";

  auto expect_error = [&](std::string const& contents, char const* what) {
    write_file(loc.dir_file(), contents);
    try {
      reader::vpk_reader r(lgr, loc);
      FAIL() << "expected archive_error: " << what;
    } catch (archive_error const& e) {
      EXPECT_THAT(e.what(), ::testing::HasSubstr(what));
    }
  };

  auto bad_magic = good;
  bad_magic[0] = 'X';
  expect_error(bad_magic, "bad magic");

  auto bad_version = good;
  bad_version[6] = 2;
  expect_error(bad_version, "unsupported vpk version 2.2");

  expect_error(good.substr(0, 10), "too short");
  expect_error(good.substr(0, good.size() - 5), "exceeds file size");

  // patch the tree size so the truncation happens inside the tree
  auto truncated = good.substr(0, good.size() - 5);
  auto const tree_size = static_cast<uint32_t>(truncated.size() - 16);
  for (int i = 0; i < 4; ++i) {
    truncated[8 + i] = static_cast<char>((tree_size >> (8 * i)) & 0xFF);
  }
  expect_error(truncated, "directory tree");
}

TEST_F(vpk_reader_test, invalid_entry_paths) {
  for (auto const* path :
       {"../evil.txt", "a/../b.txt", "a//b.txt", "./x.txt", "a/./b.txt"}) {
    test::vpk_builder b;
    b.add(path, "x");
    EXPECT_THROW(reader::vpk_reader(lgr, b.write(td.path(), "test")),
                 archive_error)
        << path;
  }
}

TEST_F(vpk_reader_test, duplicate_entries) {
  test::vpk_builder b;
  b.add("dup.txt", "one").add("dup.txt", "two");

  EXPECT_THROW(reader::vpk_reader(lgr, b.write(td.path(), "test")),
               archive_error);
}

TEST_F(vpk_reader_test, custom_prefix) {
  test::vpk_builder b;
  b.add("file.txt", "data");

  auto loc = b.write(td.path(), "test", "french");
  EXPECT_EQ(td.path() / "frenchtest.pak000_dir.vpk", loc.dir_file());

  reader::vpk_reader r(lgr, loc);
  EXPECT_EQ("data", read_entry(r, r.entries()[0], 0));
}

TEST(vpk_location_test, file_names) {
  reader::vpk_location loc;
  loc.dir = "/games/r2/vpk";
  loc.name = "client_mp_common.bsp";

  EXPECT_EQ(fs::path("/games/r2/vpk/englishclient_mp_common.bsp.pak000_dir.vpk"),
            loc.dir_file());
  EXPECT_EQ(fs::path("/games/r2/vpk/client_mp_common.bsp.pak000_000.vpk"),
            loc.archive_file(0));
  EXPECT_EQ(fs::path("/games/r2/vpk/client_mp_common.bsp.pak000_042.vpk"),
            loc.archive_file(42));
}

TEST(vpk_location_test, from_path) {
  auto loc = reader::vpk_location::from_path(
      "/vpk/englishclient_mp_common.bsp.pak000_dir.vpk", "english");
  EXPECT_EQ(fs::path("/vpk"), loc.dir);
  EXPECT_EQ("english", loc.prefix);
  EXPECT_EQ("client_mp_common.bsp", loc.name);

  loc = reader::vpk_location::from_path(
      "/vpk/client_mp_common.bsp.pak000_003.vpk", "english");
  EXPECT_EQ("client_mp_common.bsp", loc.name);
  EXPECT_EQ(fs::path("/vpk/englishclient_mp_common.bsp.pak000_dir.vpk"),
            loc.dir_file());

  loc = reader::vpk_location::from_path("frenchmp_box.bsp.pak000_dir.vpk",
                                        "french");
  EXPECT_EQ("mp_box.bsp", loc.name);
  EXPECT_EQ("french", loc.prefix);
}

TEST(vpk_location_test, from_path_errors) {
  EXPECT_THROW(reader::vpk_location::from_path("/vpk/archive.zip", "english"),
               runtime_error);
  EXPECT_THROW(
      reader::vpk_location::from_path("/vpk/x.pak000_12.vpk", "english"),
      runtime_error);
  EXPECT_THROW(reader::vpk_location::from_path(
                   "/vpk/frenchmp_box.bsp.pak000_dir.vpk", "english"),
               runtime_error);
  EXPECT_THROW(reader::vpk_location::from_path(
                   "/vpk/english.pak000_dir.vpk", "english"),
               runtime_error);
}
