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
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/logger.h>
#include <vpkx/path_filter.h>
#include <vpkx/string.h>
#include <vpkx/tool/iolayer.h>
#include <vpkx/tool/tool.h>
#include <vpkx/util.h>

#include <vpkx/manifest/ignore_patterns.h>
#include <vpkx/manifest/packing_hints.h>
#include <vpkx/reader/vpk_reader.h>
#include <vpkx/utility/archive_extractor.h>
#include <vpkx/utility/output_directory.h>

#include <vpkx_tool_main.h>

namespace po = boost::program_options;

namespace vpkx::tool {

namespace {

constexpr int exit_usage{2};

std::vector<std::string> split_list(std::vector<std::string> const& args) {
  std::vector<std::string> rv;
  for (auto const& a : args) {
    split_to(a, ',', rv);
  }
  return rv;
}

} // namespace

int vpkunpack_main(int argc, sys_char** argv, iolayer const& iol) {
  std::string prefix;
  std::vector<std::string> args, exclude_args, include_args;
  int threads;
  bool vpkflags_explicit{false}, vpkignore_no_default{false};
  logger_options logopts;

  // clang-format off
  po::options_description opts("Command line options");
  opts.add_options()
    ("vpk-prefix,p",
        po::value<std::string>(&prefix)
            ->default_value(std::string(reader::vpk_location::default_prefix)),
        "VPK prefix")
    ("vpkflags-explicit",
        po::bool_switch(&vpkflags_explicit),
        "do not optimize .vpkflags for inheritance; generate one line for "
        "each file")
    ("vpkignore-no-default",
        po::bool_switch(&vpkignore_no_default),
        "do not add default .vpkignore entries")
    ("threads,j",
        po::value<int>(&threads)->default_value(
            static_cast<int>(hardware_concurrency())),
        "number of decompression threads (0 to only decompress chunks as "
        "they are read; a negative value, given as --threads=N, means 0)")
    ("exclude",
        po::value<std::vector<std::string>>(&exclude_args)->composing(),
        "exclude files or directories matching this glob (anchor to the "
        "start with /)")
    ("include",
        po::value<std::vector<std::string>>(&include_args)->composing(),
        "negate --exclude for files or directories matching this glob")
    ;
  // clang-format on

  tool::add_common_options(opts, logopts);

  po::options_description hidden;
  hidden.add_options()("args", po::value<std::vector<std::string>>(&args));

  po::options_description all;
  all.add(opts).add(hidden);

  po::positional_options_description pos;
  pos.add("args", -1);

  po::variables_map vm;

  try {
    po::store(po::basic_command_line_parser<sys_char>(argc, argv)
                  .options(all)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return exit_usage;
  }

  auto const usage =
      fmt::format("usage: {} [options] empty_output_path "
                  "[(vpk_dir vpk_name)|vpk_path]\n",
                  argc > 0 ? basename(argv[0]) : "vpkunpack");

  if (vm.contains("help")) {
    iol.out << tool::tool_header("vpkunpack") << usage << "\n" << opts << "\n";
    return 0;
  }

  if (args.empty() || args.size() > 3) {
    iol.err << usage << "\n" << opts << "\n";
    return exit_usage;
  }

  threads = std::max(threads, 0);

  try {
    stream_logger lgr(iol.term, iol.err, logopts);
    LOG_PROXY(debug_logger_policy, lgr);

    if (static_cast<unsigned>(threads) > hardware_concurrency()) {
      LOG_WARN << "using " << threads << " decompression threads on "
               << hardware_concurrency() << " processing units";
    }

    path_filter const filter(split_list(exclude_args),
                             split_list(include_args));

    std::filesystem::path const vpk_out(args[0]);
    std::optional<reader::vpk_location> loc;

    if (args.size() == 3) {
      iol.out << fmt::format("unpacking vpk \"{}\" (in \"{}\") to \"{}\"\n",
                             args[2], args[1], args[0]);
      loc.emplace();
      loc->dir = args[1];
      loc->prefix = prefix;
      loc->name = args[2];
    } else if (args.size() == 2) {
      iol.out << fmt::format("unpacking vpk \"{}\" to \"{}\"\n", args[1],
                             args[0]);
      loc = reader::vpk_location::from_path(args[1], prefix);
    } else {
      iol.out << fmt::format("initializing new vpk in \"{}\"\n", args[0]);
    }

    std::unique_ptr<reader::vpk_reader> vpk;

    if (loc) {
      vpk = std::make_unique<reader::vpk_reader>(lgr, *loc);
    }

    iol.out << "... generating .vpkflags"
            << (vpkflags_explicit && vpk ? " (without inheritance)" : "")
            << "\n";

    manifest::packing_hints flags;

    if (vpk) {
      if (vpkflags_explicit) {
        flags.generate_explicit(vpk->entries());
      } else {
        flags.generate(vpk->entries());
      }

      try {
        flags.test(vpk->entries());
      } catch (std::exception const& e) {
        iol.out << flags.to_string() << "\n";
        VPKX_PANIC("test generated .vpkflags: " + exception_str(e));
      }
    }

    iol.out << "... generating .vpkignore"
            << (vpkignore_no_default ? " (without default entries)" : "")
            << "\n";

    manifest::ignore_patterns ignore;

    if (!vpkignore_no_default) {
      ignore.add_default();
    }

    if (vpk) {
      ignore.add_auto_exclusions(vpk->entries());
    }

    iol.out << "... creating output directory\n";
    utility::prepare_output_directory(vpk_out, ignore);

    iol.out << "... saving .vpkflags\n";
    utility::write_manifest(vpk_out, manifest::packing_hints::filename,
                            flags.to_string());

    iol.out << "... saving .vpkignore\n";
    utility::write_manifest(vpk_out, manifest::ignore_patterns::filename,
                            ignore.to_string());

    iol.out << "\n";

    utility::extraction_stats stats;

    if (vpk) {
      utility::archive_extractor_options ax_opts;
      ax_opts.parallelism = static_cast<size_t>(threads);

      utility::archive_extractor ax(lgr, iol.out);
      stats = ax.extract(*vpk, vpk_out, filter, ax_opts);
    }

    iol.out << "\n";

    if (stats.excluded > 0) {
      iol.out << fmt::format(
          "success ({} files excluded by command-line filter)\n",
          stats.excluded);
    } else {
      iol.out << "success\n";
    }
  } catch (std::exception const& e) {
    iol.err << "error: " << exception_str(e) << "\n";
    return 1;
  }

  return 0;
}

} // namespace vpkx::tool
