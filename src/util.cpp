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

#include <array>
#include <cerrno>
#include <clocale>
#include <cstdlib>
#include <iostream>
#include <locale>
#include <optional>

#include <fmt/format.h>

#include <folly/ExceptionString.h>
#include <folly/String.h>
#include <folly/system/HardwareConcurrency.h>

#include <vpkx/conv.h>
#include <vpkx/error.h>
#include <vpkx/util.h>

namespace vpkx {

namespace {

inline std::string trimmed(std::string in) {
  while (!in.empty() && in.back() == ' ') {
    in.pop_back();
  }
  return in;
}

constexpr std::array<char, 6> si_prefixes{'k', 'M', 'G', 'T', 'P', 'E'};

} // namespace

std::string time_with_unit(double sec) {
  return trimmed(folly::prettyPrint(sec, folly::PRETTY_TIME_HMS, false));
}

std::string time_with_unit(std::chrono::nanoseconds ns) {
  return time_with_unit(1e-9 * ns.count());
}

std::string format_bytes_si(int64_t bytes) {
  static constexpr uint64_t unit{1000};

  bool const negative = bytes < 0;
  // two's complement negation, also valid for INT64_MIN
  uint64_t const abs = negative ? ~static_cast<uint64_t>(bytes) + 1
                                : static_cast<uint64_t>(bytes);
  std::string_view const sign = negative ? "-" : "";

  if (abs < unit) {
    return fmt::format("{}{} B", sign, abs);
  }

  uint64_t div = unit;
  size_t exp = 0;

  for (uint64_t n = abs / unit; n >= unit; n /= unit) {
    div *= unit;
    ++exp;
  }

  return fmt::format("{}{:.1f} {}B", sign,
                     static_cast<double>(abs) / static_cast<double>(div),
                     si_prefixes.at(exp));
}

bool getenv_is_enabled(char const* var) {
  if (auto val = std::getenv(var)) {
    if (auto maybe_bool = try_to<bool>(val); maybe_bool && *maybe_bool) {
      return true;
    }
  }
  return false;
}

void setup_default_locale() {
  try {
    std::locale::global(std::locale(""));
    if (!std::setlocale(LC_ALL, "")) {
      std::cerr << "warning: setlocale(LC_ALL, \"\") failed\n";
    }
  } catch (std::exception const& e) {
    std::cerr << "warning: failed to set user default locale: " << e.what()
              << "\n";
    try {
      std::locale::global(std::locale::classic());
      if (!std::setlocale(LC_ALL, "C")) {
        std::cerr << "warning: setlocale(LC_ALL, \"C\") failed\n";
      }
    } catch (std::exception const& e) {
      std::cerr << "warning: also failed to set classic locale: " << e.what()
                << "\n";
    }
  }
}

std::string_view basename(std::string_view path) {
  auto pos = path.find_last_of('/');
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

std::string exception_str(std::exception const& e) {
  return folly::exceptionStr(e).toStdString();
}

std::string exception_str(std::exception_ptr const& e) {
  return folly::exceptionStr(e).toStdString();
}

unsigned int hardware_concurrency() noexcept {
  static auto const env = [] {
    std::optional<int> concurrency;
    if (auto env = std::getenv("VPKX_OVERRIDE_HARDWARE_CONCURRENCY")) {
      concurrency = try_to<int>(env);
    }
    return concurrency;
  }();
  return env.value_or(folly::hardware_concurrency());
}

std::tm safe_localtime(std::time_t t) {
  std::tm buf{};
  if (!::localtime_r(&t, &buf)) {
    VPKX_THROW(runtime_error,
               fmt::format("localtime_r: error code {}", errno));
  }
  return buf;
}

} // namespace vpkx
