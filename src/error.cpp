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

#include <cerrno>
#include <cstdlib>
#include <iostream>

#include <fmt/format.h>

#include <vpkx/error.h>
#include <vpkx/util.h>

namespace vpkx {

namespace {

[[noreturn]] void do_terminate() {
#ifdef VPKX_COVERAGE_ENABLED
  std::exit(99);
#else
  std::abort();
#endif
}

std::string with_location(std::string_view s, source_location loc) {
  return fmt::format("[{}:{}] {}", basename(loc.file_name()), loc.line(), s);
}

} // namespace

error::error(source_location loc) noexcept
    : loc_{loc} {}

runtime_error::runtime_error(std::string_view s, source_location loc)
    : error{loc}
    , what_{with_location(s, loc)} {}

system_error::system_error(std::string_view s, source_location loc)
    : system_error(s, errno, loc) {}

system_error::system_error(std::string_view s, int err, source_location loc)
    : system_error(s, std::error_code{err, std::generic_category()}, loc) {}

system_error::system_error(std::string_view s, std::error_code ec,
                           source_location loc)
    : error{loc}
    , syserr_{ec, with_location(s, loc)} {}

void assertion_failed(std::string_view expr, std::string_view msg,
                      source_location loc) {
  std::cerr << "Assertion `" << expr << "` failed in " << loc.file_name() << "("
            << loc.line() << "): " << msg << "\n";
  do_terminate();
}

void handle_panic(std::string_view msg, source_location loc) {
  std::cerr << "Panic: " << msg << " in " << loc.file_name() << "("
            << loc.line() << ")\n";
  do_terminate();
}

} // namespace vpkx
