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

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace vpkx::reader {

/**
 * Where the files of a Respawn VPK live
 *
 * The directory file is `<dir>/<prefix><name>.pak000_dir.vpk`, the data
 * files are `<dir>/<name>.pak000_<NNN>.vpk`.
 */
struct vpk_location {
  static constexpr std::string_view default_prefix{"english"};

  std::filesystem::path dir;
  std::string prefix{default_prefix};
  std::string name;

  std::filesystem::path dir_file() const;
  std::filesystem::path archive_file(uint16_t index) const;

  /**
   * Resolve the path of a directory or data file
   *
   * Throws `runtime_error` if `path` does not name a VPK file, or if a
   * directory file name does not start with `prefix`.
   */
  static vpk_location
  from_path(std::filesystem::path const& path, std::string_view prefix);
};

} // namespace vpkx::reader
