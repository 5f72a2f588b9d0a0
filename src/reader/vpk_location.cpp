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

#include <regex>

#include <fmt/format.h>

#include <vpkx/error.h>

#include <vpkx/reader/vpk_location.h>

namespace vpkx::reader {

std::filesystem::path vpk_location::dir_file() const {
  return dir / fmt::format("{}{}.pak000_dir.vpk", prefix, name);
}

std::filesystem::path vpk_location::archive_file(uint16_t index) const {
  return dir / fmt::format("{}.pak000_{:03}.vpk", name, index);
}

vpk_location vpk_location::from_path(std::filesystem::path const& path,
                                     std::string_view prefix) {
  static std::regex const vpk_re{R"(^(.+)\.pak000_(dir|[0-9]{3})\.vpk$)"};

  auto const filename = path.filename().string();
  std::smatch m;

  if (!std::regex_match(filename, m, vpk_re)) {
    VPKX_THROW(runtime_error,
               fmt::format("not a vpk file name: {}", path.string()));
  }

  vpk_location loc;
  loc.dir = path.parent_path();
  loc.prefix = prefix;
  loc.name = m[1].str();

  if (m[2] == "dir") {
    if (!std::string_view(loc.name).starts_with(prefix) ||
        loc.name.size() == prefix.size()) {
      VPKX_THROW(runtime_error,
                 fmt::format("vpk directory file {} does not start with "
                             "prefix '{}'",
                             filename, prefix));
    }
    loc.name.erase(0, prefix.size());
  }

  return loc;
}

} // namespace vpkx::reader
