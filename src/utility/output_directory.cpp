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

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/file_util.h>

#include <vpkx/manifest/ignore_patterns.h>
#include <vpkx/utility/output_directory.h>

namespace vpkx::utility {

namespace fs = std::filesystem;

void prepare_output_directory(fs::path const& root,
                              manifest::ignore_patterns const& ignore) {
  std::error_code ec;

  fs::create_directory(root, ec);

  if (ec) {
    VPKX_THROW(system_error, "create output directory " + root.string(), ec);
  }

  fs::directory_iterator it(root, ec);

  if (ec) {
    VPKX_THROW(system_error, "list output directory " + root.string(), ec);
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    auto name = it->path().filename().string();

    if (!ignore.match(name)) {
      VPKX_THROW(precondition_error,
                 fmt::format("output directory must not exist or be empty "
                             "(other than ignored files), found \"{}\"",
                             name));
    }
  }

  if (ec) {
    VPKX_THROW(system_error, "list output directory " + root.string(), ec);
  }
}

void write_manifest(fs::path const& root, std::string_view filename,
                    std::string_view content) {
  write_file(root / filename, content);
}

} // namespace vpkx::utility
