/*
 * =====================================================================================
 *
 *       Filename:  Extractor_Utils.h
 *
 *    Description:  Routines shared by the 13F extraction strategies.
 *
 *        Version:  2.0
 *        Created:  01/27/2020 09:56:52 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:  David P. Riedel (), driedel@cox.net
 *   Organization:
 *
 * =====================================================================================
 */

/* This file is part of Extractor_13F. */

/* Extractor_13F is free software: you can redistribute it and/or modify */
/* it under the terms of the GNU General Public License as published by */
/* the Free Software Foundation, either version 3 of the License, or */
/* (at your option) any later version. */

/* Extractor_13F is distributed in the hope that it will be useful, */
/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
/* GNU General Public License for more details. */

/* You should have received a copy of the GNU General Public License */
/* along with Extractor_13F.  If not, see <http://www.gnu.org/licenses/>. */

#ifndef _EXTRACTOR_UTILS_INC_
#define _EXTRACTOR_UTILS_INC_

#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/assert.hpp>

#include <date/tz.h>

#include <fmt/format.h>

#include "Extractor.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(const std::filesystem::path &p, FormatContext &ctx) const {
    std::string f_name = p.string();
    return formatter<std::string>::format(f_name, ctx);
  }
};

// custom fmtlib formatter for date year_month_day

template <>
struct fmt::formatter<date::year_month_day> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(date::year_month_day d, FormatContext &ctx) const {
    std::string s_date = date::format("%Y-%m-%d", d);
    return formatter<std::string>::format(s_date, ctx);
  }
};

template <typename... Ts> inline std::string catenate(Ts &&...ts) {

  constexpr auto N = sizeof...(Ts);

  // first, construct our format string

  std::string f_string;
  for (size_t i = 0; i < N; ++i) {
    f_string.append("{}");
  }

  return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts> auto SumT(const std::tuple<Ts...> &t) {
  auto z_([](auto... ys) { return (... + ys); });
  return std::apply(z_, t);
}

// utility to convert a date::year_month_day to a string
// using Howard Hinnant's date library

inline std::string
LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  auto t = date::make_zoned(date::current_zone(), a_date_time);
  std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p %Z", t);
  return ts;
}

// seems we do this a lot too.

date::year_month_day StringToDateYMD(const std::string &input_format,
                                     const std::string &the_date);

std::string LoadDataFileForUse(const X13::FileName &file_name);

// so we can recognize our errors if we want to do something special.
// the extraction strategies each have their own way to fail and the
// chain needs to tell them apart from real trouble.

class ExtractorException : public std::runtime_error {
public:
  explicit ExtractorException(const char *what);

  explicit ExtractorException(const std::string &what);
};

class AssertionException : public std::invalid_argument {
public:
  explicit AssertionException(const char *what);

  explicit AssertionException(const std::string &what);
};

// bad user supplied settings. fatal at setup time.

class ConfigException : public std::invalid_argument {
public:
  explicit ConfigException(const char *what);

  explicit ConfigException(const std::string &what);
};

class ParseException : public ExtractorException {
public:
  explicit ParseException(const char *what);

  explicit ParseException(const std::string &what);
};

class HeaderNotFoundException : public ExtractorException {
public:
  explicit HeaderNotFoundException(const char *what);

  explicit HeaderNotFoundException(const std::string &what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(X13::sv string_data, char delim)
  requires std::is_same_v<T, std::string> || std::is_same_v<T, X13::sv>
{
  std::vector<T> results;
  for (size_t it = 0; it != T::npos; ++it) {
    auto pos = string_data.find(delim, it);
    if (pos != T::npos) {
      results.emplace_back(string_data.substr(it, pos - it));
    } else {
      results.emplace_back(string_data.substr(it));
      break;
    }
    it = pos;
  }
  return results;
}

// utility function

template <typename... Ts> auto NotAllEmpty(const Ts &...ts) {
  return ((!ts.empty()) || ...);
}

// split a block of text into lines, dropping any trailing '\r'.

std::vector<X13::sv> SplitLines(X13::sv text);

X13::DocumentSectionList LocateDocumentSections(X13::FileContent file_content);

X13::FileType FindFileType(const X13::DocumentSection &document);

// the holdings part of a legacy text filing runs from the
// 'form 13f information table' heading through the 'grand total' line.
// case does not matter. without a heading we use all of the text.

X13::InfoTableBlock ExtractInfoTableBlock(X13::FileContent file_content);

std::string CleanLabel(const std::string &label);

#endif /* ----- #ifndef _EXTRACTOR_UTILS_INC_  ----- */
