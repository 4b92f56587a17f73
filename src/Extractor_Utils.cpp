/*
 * =====================================================================================
 *
 *       Filename:  Extractor_Utils.cpp
 *
 *    Description:  Routines shared by the 13F extraction strategies.
 *
 *        Version:  1.0
 *        Created:  11/14/2018 11:14:03 AM
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

#include "Extractor_Utils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>

#include <boost/regex.hpp>

#include <range/v3/algorithm/for_each.hpp>

namespace rng = ranges;

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;

date::year_month_day StringToDateYMD(const std::string &input_format,
                                     const std::string &the_date) {
  std::istringstream in{the_date};
  date::sys_days tp;
  date::from_stream(in, input_format.data(), tp);
  BOOST_ASSERT_MSG(!in.fail() && !in.bad(),
                   catenate("Unable to parse given date: ", the_date).c_str());
  date::year_month_day result = tp;
  BOOST_ASSERT_MSG(result.ok(), catenate("Invalid date: ", the_date).c_str());
  return result;
} // -----  end of method StringToDateYMD  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ExtractorException
 *      Method:  ExtractorException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ExtractorException::ExtractorException(const char *text)
    : std::runtime_error(text) {
} /* -----  end of method ExtractorException::ExtractorException  (constructor)
     ----- */

ExtractorException::ExtractorException(const std::string &text)
    : std::runtime_error(text) {
} /* -----  end of method ExtractorException::ExtractorException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char *text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

AssertionException::AssertionException(const std::string &text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ConfigException
 *      Method:  ConfigException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ConfigException::ConfigException(const char *text)
    : std::invalid_argument(text) {
} /* -----  end of method ConfigException::ConfigException  (constructor)
     ----- */

ConfigException::ConfigException(const std::string &text)
    : std::invalid_argument(text) {
} /* -----  end of method ConfigException::ConfigException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ParseException
 *      Method:  ParseException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ParseException::ParseException(const char *text)
    : ExtractorException(text) {
} /* -----  end of method ParseException::ParseException  (constructor)  ----- */

ParseException::ParseException(const std::string &text)
    : ExtractorException(text) {
} /* -----  end of method ParseException::ParseException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  HeaderNotFoundException
 *      Method:  HeaderNotFoundException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
HeaderNotFoundException::HeaderNotFoundException(const char *text)
    : ExtractorException(text) {
} /* -----  end of method HeaderNotFoundException::HeaderNotFoundException
     (constructor)  ----- */

HeaderNotFoundException::HeaderNotFoundException(const std::string &text)
    : ExtractorException(text) {
} /* -----  end of method HeaderNotFoundException::HeaderNotFoundException
     (constructor)  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * LoadDataFileForUse Description:
 * =====================================================================================
 */
std::string LoadDataFileForUse(const X13::FileName &file_name) {
  std::ifstream input_file{file_name.get(),
                           std::ios_base::in | std::ios_base::binary};
  if (!input_file) {
    throw ExtractorException(
        catenate("Unable to open file: ", file_name.get()));
  }
  std::string file_content(fs::file_size(file_name.get()), '\0');
  input_file.read(&file_content[0], file_content.size());
  input_file.close();

  return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * SplitLines Description:
 * =====================================================================================
 */
std::vector<X13::sv> SplitLines(X13::sv text) {
  auto lines = split_string<X13::sv>(text, '\n');
  for (auto &line : lines) {
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
  }
  return lines;
} /* -----  end of function SplitLines  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * LocateDocumentSections Description:
 * =====================================================================================
 */
X13::DocumentSectionList LocateDocumentSections(X13::FileContent file_content) {
  const std::string doc_begin{"<DOCUMENT>"};
  const std::string doc_end{"</DOCUMENT>"};
  const auto doc_begin_len = doc_begin.size();
  const auto doc_end_len = doc_end.size();

  X13::DocumentSectionList result;

  auto found_begin = file_content.get().begin();
  auto content_end = file_content.get().end();

  auto doc_searcher = std::boyer_moore_searcher(doc_end.begin(), doc_end.end());

  while (found_begin != content_end) {
    // look for our begin tag

    found_begin = std::search(found_begin, content_end, doc_begin.begin(),
                              doc_begin.end());

    if (found_begin == content_end) {
      break;
    }

    // now, look for our end tag.
    // since this can be rather far away, try boyer-moore

    auto found_end =
        std::search(found_begin + doc_begin_len, content_end, doc_searcher);

    if (found_end == content_end) {
      throw ParseException("Can't find end of 'DOCUMENT'");
    }

    result.emplace_back(X13::DocumentSection{
        X13::sv(found_begin, found_end + doc_end_len)});
    found_begin = found_end + doc_end_len;
  }
  return result;
} /* -----  end of function LocateDocumentSections  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * FindFileType Description:
 * =====================================================================================
 */
X13::FileType FindFileType(const X13::DocumentSection &document) {
  const boost::regex regex_ftype{R"***(^<TYPE>(.*?)$)***"};
  boost::cmatch matches;

  if (bool found_it = boost::regex_search(
          document.get().data(), document.get().data() + document.get().size(),
          matches, regex_ftype);
      found_it) {
    X13::FileType file_type{X13::sv(matches[1].first, matches[1].length())};
    return file_type;
  }
  throw ParseException("Can't find file type in document.\n");
} /* -----  end of function FindFileType  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * ExtractInfoTableBlock Description:
 * =====================================================================================
 */
X13::InfoTableBlock ExtractInfoTableBlock(X13::FileContent file_content) {
  static const std::string start_key{"form 13f information table"};
  static const std::string end_key{"grand total"};

  auto text = file_content.get();
  auto same_letter = [](char lhs, char rhs) {
    return std::tolower(static_cast<unsigned char>(lhs)) ==
           std::tolower(static_cast<unsigned char>(rhs));
  };

  auto found_start = std::search(text.begin(), text.end(), start_key.begin(),
                                 start_key.end(), same_letter);
  if (found_start == text.end()) {
    return X13::InfoTableBlock{text};
  }

  auto found_end = std::search(found_start, text.end(), end_key.begin(),
                               end_key.end(), same_letter);
  if (found_end == text.end()) {
    return X13::InfoTableBlock{X13::sv(found_start, text.end())};
  }
  return X13::InfoTableBlock{
      X13::sv(found_start, found_end + end_key.size())};
} /* -----  end of function ExtractInfoTableBlock  ----- */

// ===  FUNCTION
// ======================================================================
//         Name:  CleanLabel
//  Description:
// =====================================================================================

std::string CleanLabel(const std::string &label) {
  static const std::string delete_this{""};
  static const std::string single_space{" "};
  static const boost::regex regex_punctuation{R"***([[:punct:]])***"};
  static const boost::regex regex_leading_space{R"***(^[[:space:]]+)***"};
  static const boost::regex regex_trailing_space{R"***([[:space:]]{1,}$)***"};
  static const boost::regex regex_double_space{R"***([[:space:]]{2,})***"};

  std::string cleaned_label =
      boost::regex_replace(label, regex_punctuation, single_space);
  cleaned_label =
      boost::regex_replace(cleaned_label, regex_leading_space, delete_this);
  cleaned_label =
      boost::regex_replace(cleaned_label, regex_trailing_space, delete_this);
  cleaned_label =
      boost::regex_replace(cleaned_label, regex_double_space, single_space);

  // lastly, lowercase

  rng::for_each(cleaned_label, [](char &c) { c = std::tolower(c); });

  return cleaned_label;
} // -----  end of function CleanLabel  -----

namespace boost {
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed_mgs Description: defined in boost header but left to us to
 * implement.
 * =====================================================================================
 */

void assertion_failed_msg(char const *expr, char const *msg,
                          char const *function, char const *file, long line) {
  throw AssertionException(catenate(
      "\n*** Assertion failed *** test: ", expr, " in function: ", function,
      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
} /* -----  end of function assertion_failed_mgs  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed Description:
 * =====================================================================================
 */
void assertion_failed(char const *expr, char const *function, char const *file,
                      long line) {
  throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr,
                                    " in function: ", function,
                                    " from file: ", file, " at line: ", line));
} /* -----  end of function assertion_failed  ----- */
} /* end namespace boost */
