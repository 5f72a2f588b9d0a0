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

#include <cerrno>
#include <filesystem>
#include <map>
#include <memory>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <vpkx/error.h>
#include <vpkx/file_util.h>
#include <vpkx/manifest/ignore_patterns.h>
#include <vpkx/path_filter.h>
#include <vpkx/reader/archive_reader.h>
#include <vpkx/reader/vpk_reader.h>
#include <vpkx/utility/archive_extractor.h>
#include <vpkx/utility/internal/file_writer.h>
#include <vpkx/utility/output_directory.h>

#include "test_helpers.h"
#include "test_logger.h"
#include "vpk_builder.h"

using namespace vpkx;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> temp_files(fs::path const& root) {
  std::vector<std::string> rv;
  for (auto const& e : fs::recursive_directory_iterator(root)) {
    auto name = e.path().filename().string();
    if (name.starts_with(".vpkx_")) {
      rv.push_back(name);
    }
  }
  return rv;
}

// Turns the in-flight temporary file into a directory so it can no longer
// be unlinked, then fails the read.
class unremovable_temp_reader : public reader::archive_reader {
 public:
  explicit unremovable_temp_reader(fs::path root)
      : root_{std::move(root)} {
    reader::archive_entry e;
    e.path = "maps/mp_box.bsp";
    e.chunks.push_back({.compressed_size = 16, .uncompressed_size = 16});
    entries_.push_back(std::move(e));
  }

  std::span<reader::archive_entry const> entries() const override {
    return entries_;
  }

  reader::entry_stream
  open_entry(reader::archive_entry const&, size_t) const override {
    return reader::entry_stream(std::make_unique<stream>(root_));
  }

 private:
  class stream : public reader::entry_stream::impl {
   public:
    explicit stream(fs::path root)
        : root_{std::move(root)} {}

    size_t read(std::span<uint8_t>) override {
      for (auto const& name : temp_files(root_)) {
        fs::remove(root_ / name);
        fs::create_directory(root_ / name);
      }
      VPKX_THROW(archive_error, "maps/mp_box.bsp: chunk 0 is corrupt");
    }

    uint64_t size() const override { return 16; }

   private:
    fs::path const root_;
  };

  fs::path const root_;
  std::vector<reader::archive_entry> entries_;
};

class archive_extractor_test : public ::testing::Test {
 protected:
  void SetUp() override {
    archive_dir = td.path() / "vpk";
    out_dir = td.path() / "out";
    fs::create_directories(archive_dir);
    fs::create_directories(out_dir);
  }

  utility::extraction_stats
  extract(test::vpk_builder const& b, path_filter const& filter,
          utility::archive_extractor_options const& opts = {}) {
    reader::vpk_reader r(lgr, b.write(archive_dir, "test"));
    utility::archive_extractor ae(lgr, progress);
    return ae.extract(r, out_dir, filter, opts);
  }

  test::test_logger lgr;
  temporary_directory td{"vpkx"};
  fs::path archive_dir;
  fs::path out_dir;
  std::ostringstream progress;
};

} // namespace

TEST_F(archive_extractor_test, extracts_all_entries) {
  test::vpk_builder b;
  b.add("readme.txt", "hello")
      .add("scripts/vscripts/main.nut", "print(1)")
      .add("maps/graphs/mp_box.ain", std::string(5000, 'x'))
      .add("empty.txt", "");

  auto stats = extract(b, {});

  EXPECT_EQ(4, stats.total);
  EXPECT_EQ(4, stats.extracted);
  EXPECT_EQ(0, stats.excluded);
  EXPECT_EQ(5 + 8 + 5000, stats.bytes_extracted);

  std::map<std::string, std::string> const expected{
      {"readme.txt", "hello"},
      {"scripts/vscripts/main.nut", "print(1)"},
      {"maps/graphs/mp_box.ain", std::string(5000, 'x')},
      {"empty.txt", ""},
  };

  EXPECT_EQ(expected, test::read_tree(out_dir));
  EXPECT_TRUE(temp_files(out_dir).empty());

  EXPECT_THAT(lgr.messages(logger::INFO),
              ElementsAre(HasSubstr("extracted 4 of 4 entries (5.0 kB)")))
      << lgr;
  EXPECT_TRUE(lgr.messages(logger::ERROR).empty()) << lgr;
}

TEST_F(archive_extractor_test, filters_entries) {
  test::vpk_builder b;
  b.add("secrets/public.txt", "public")
      .add("secrets/private.key", "private")
      .add("secrets/nested/deep.key", "deep")
      .add("readme.txt", "hello");

  std::vector<std::string> const exclude{"/secrets"};
  std::vector<std::string> const include{"/secrets/public.txt"};

  auto stats = extract(b, path_filter(exclude, include));

  EXPECT_EQ(4, stats.total);
  EXPECT_EQ(2, stats.extracted);
  EXPECT_EQ(2, stats.excluded);
  EXPECT_EQ(6 + 5, stats.bytes_extracted);

  std::map<std::string, std::string> const expected{
      {"secrets/public.txt", "public"},
      {"readme.txt", "hello"},
  };

  EXPECT_EQ(expected, test::read_tree(out_dir));
  EXPECT_FALSE(fs::exists(out_dir / "secrets" / "nested"));
}

TEST_F(archive_extractor_test, progress_lines) {
  test::vpk_builder b;
  b.add("b/big.bin", std::string(1500, 'b'))
      .add("a/small.txt", "abc")
      .add("a/skip.tmp", "zzz");

  path_filter filter;
  filter.add_exclude("*.tmp");

  extract(b, filter);

  // entries are grouped by extension
  EXPECT_EQ("[   1/   3] b/big.bin (1.5 kB)\n"
            "[   2/   3] a/skip.tmp (excluded)\n"
            "[   3/   3] a/small.txt (3 B)\n",
            progress.str());
}

TEST_F(archive_extractor_test, progress_disabled) {
  test::vpk_builder b;
  b.add("a.txt", "abc");

  utility::archive_extractor_options opts;
  opts.enable_progress = false;

  auto stats = extract(b, {}, opts);

  EXPECT_EQ(1, stats.extracted);
  EXPECT_EQ("", progress.str());
}

TEST_F(archive_extractor_test, parallel_and_small_buffers) {
  std::string data;
  for (int i = 0; i < 50'000; ++i) {
    data.push_back(static_cast<char>(i % 251));
  }

  test::vpk_builder b;
  b.add({.path = "maps/big.bsp", .data = data, .chunk_size = 777});
  b.add({.path = "maps/other.bsp", .data = data.substr(123),
         .chunk_size = 4096});

  for (size_t parallelism : {0, 1, 4}) {
    fs::remove_all(out_dir);
    fs::create_directories(out_dir);

    utility::archive_extractor_options opts;
    opts.parallelism = parallelism;
    opts.copy_buffer_size = 1000;

    auto stats = extract(b, {}, opts);
    EXPECT_EQ(2, stats.extracted);

    auto tree = test::read_tree(out_dir);
    EXPECT_EQ(data, tree["maps/big.bsp"]) << parallelism;
    EXPECT_EQ(data.substr(123), tree["maps/other.bsp"]) << parallelism;
  }
}

TEST_F(archive_extractor_test, checksum_failure_is_atomic) {
  test::vpk_builder b;
  b.add("a/good.txt", "fine");
  b.add({.path = "b/bad.txt",
         .data = std::string(10'000, 'q'),
         .chunk_size = 1000,
         .crc = 0x12345678});
  b.add("c/never.txt", "unreached");

  for (size_t parallelism : {0, 3}) {
    fs::remove_all(out_dir);
    fs::create_directories(out_dir);

    utility::archive_extractor_options opts;
    opts.parallelism = parallelism;
    opts.copy_buffer_size = 100;

    EXPECT_THROW(extract(b, {}, opts), archive_error);

    EXPECT_TRUE(fs::exists(out_dir / "a" / "good.txt"));
    EXPECT_FALSE(fs::exists(out_dir / "b" / "bad.txt"));
    EXPECT_FALSE(fs::exists(out_dir / "c" / "never.txt"));
    EXPECT_TRUE(temp_files(out_dir).empty());
  }
}

TEST_F(archive_extractor_test, decode_failure_is_atomic) {
  test::vpk_builder b;
  b.add({.path = "packed.bin", .data = "compressed?", .compressed = true});

  EXPECT_THROW(extract(b, {}), archive_error);

  EXPECT_FALSE(fs::exists(out_dir / "packed.bin"));
  EXPECT_TRUE(temp_files(out_dir).empty());
}

TEST_F(archive_extractor_test, existing_file_is_not_replaced) {
  test::vpk_builder b;
  b.add("dir/file.txt", "new contents");

  fs::create_directories(out_dir / "dir");
  write_file(out_dir / "dir" / "file.txt", "old contents");

  try {
    extract(b, {});
    FAIL() << "expected system_error";
  } catch (vpkx::system_error const& e) {
    EXPECT_EQ(EEXIST, e.get_errno());
  }

  EXPECT_EQ("old contents", read_file(out_dir / "dir" / "file.txt"));
  EXPECT_TRUE(temp_files(out_dir).empty());
}

TEST_F(archive_extractor_test, failed_cleanup_is_logged) {
  unremovable_temp_reader r(out_dir);
  utility::archive_extractor ae(lgr, progress);

  try {
    ae.extract(r, out_dir, {}, {});
    FAIL() << "expected archive_error";
  } catch (archive_error const& e) {
    EXPECT_THAT(e.what(), HasSubstr("chunk 0 is corrupt"));
  }

  EXPECT_FALSE(fs::exists(out_dir / "maps" / "mp_box.bsp"));

  auto const errors = lgr.messages(logger::ERROR);
  ASSERT_EQ(1, errors.size()) << lgr;
  EXPECT_THAT(errors[0], HasSubstr("failed to remove temporary file"));
  EXPECT_THAT(errors[0], HasSubstr(".vpkx_"));

  auto const log = lgr.get_log();
  ASSERT_FALSE(log.empty());
  EXPECT_EQ(logger::ERROR, log.front().level);
}

TEST_F(archive_extractor_test, runs_are_independent) {
  test::vpk_builder b;
  b.add("a.txt", "a").add("b.txt", "b");

  auto first = extract(b, {});
  fs::remove_all(out_dir);
  fs::create_directories(out_dir);
  auto second = extract(b, {});

  EXPECT_EQ(first.extracted, second.extracted);
  EXPECT_EQ(2, second.extracted);
  EXPECT_EQ(2, second.total);
}

TEST(file_writer_test, rename_and_discard) {
  temporary_directory td("vpkx");
  std::error_code ec;

  auto fw = utility::internal::file_writer::create_temp(td.path(), ".tmp_", ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_TRUE(fs::exists(fw.path()));
  EXPECT_EQ(td.path(), fw.path().parent_path());

  std::string const data{"0123456789"};
  fw.write_data(5, data.data() + 5, 5, ec);
  ASSERT_FALSE(ec);
  fw.write_data(0, data.data(), 5, ec);
  ASSERT_FALSE(ec);
  fw.commit(ec);
  ASSERT_FALSE(ec);

  auto tmp = fw.path();
  fw.rename_to(td.path() / "final", ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_FALSE(fs::exists(tmp));
  EXPECT_EQ(data, read_file(td.path() / "final"));

  {
    auto fw2 =
        utility::internal::file_writer::create_temp(td.path(), ".tmp_", ec);
    ASSERT_FALSE(ec);
    tmp = fw2.path();
    fw2.commit(ec);
    fw2.rename_to(td.path() / "final", ec);
    EXPECT_EQ(std::errc::file_exists, ec);
  }

  // destroyed without a successful rename
  EXPECT_FALSE(fs::exists(tmp));
  EXPECT_EQ(data, read_file(td.path() / "final"));
}

TEST(file_writer_test, create_in_missing_directory) {
  temporary_directory td("vpkx");
  std::error_code ec;

  auto fw = utility::internal::file_writer::create_temp(
      td.path() / "missing", ".tmp_", ec);

  EXPECT_EQ(std::errc::no_such_file_or_directory, ec);
  EXPECT_FALSE(fw);
}

TEST(output_directory_test, creates_missing_directory) {
  temporary_directory td("vpkx");
  manifest::ignore_patterns ip;

  utility::prepare_output_directory(td.path() / "new", ip);

  EXPECT_TRUE(fs::is_directory(td.path() / "new"));
}

TEST(output_directory_test, ignored_files_are_allowed) {
  temporary_directory td("vpkx");
  manifest::ignore_patterns ip;
  ip.add_default();

  write_file(td.path() / ".vpkflags", "old");
  write_file(td.path() / ".DS_Store", "");
  fs::create_directories(td.path() / ".git" / "objects");

  EXPECT_NO_THROW(utility::prepare_output_directory(td.path(), ip));
}

TEST(output_directory_test, rejects_non_empty_directory) {
  temporary_directory td("vpkx");
  manifest::ignore_patterns ip;
  ip.add_default();

  write_file(td.path() / ".vpkignore", "");
  write_file(td.path() / "leftover.txt", "x");

  try {
    utility::prepare_output_directory(td.path(), ip);
    FAIL() << "expected precondition_error";
  } catch (precondition_error const& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("found \"leftover.txt\""));
  }
}

TEST(output_directory_test, rejects_file_as_root) {
  temporary_directory td("vpkx");
  manifest::ignore_patterns ip;

  write_file(td.path() / "file", "x");

  EXPECT_THROW(utility::prepare_output_directory(td.path() / "file", ip),
               vpkx::system_error);
}

TEST(output_directory_test, write_manifest) {
  temporary_directory td("vpkx");

  utility::write_manifest(td.path(), ".vpkignore", "*.tmp\n");

  EXPECT_EQ("*.tmp\n", read_file(td.path() / ".vpkignore"));
}
