/*
 * =====================================================================================
 *
 *       Filename:  HeaderLocator.cpp
 *
 *    Description:  Find the column header of a fixed-width holdings table
 *                  and work out where each column starts.
 *
 *        Version:  1.0
 *        Created:  03/04/2024 09:18:30 AM
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

#include "HeaderLocator.h"

#include <cctype>
#include <optional>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/regex.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>

namespace rng = ranges;

#include "Extractor_Utils.h"

namespace
{
    std::optional<std::size_t> FindKeyword(const std::string& upper_line, X13::sv keyword)
    {
        if (auto pos = upper_line.find(keyword); pos != std::string::npos)
        {
            return pos;
        }
        return std::nullopt;
    }

    bool HasKeyword(const std::string& upper_line, X13::sv keyword)
    {
        return upper_line.find(keyword) != std::string::npos;
    }
} // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  DropSeparatorLines
 *  Description:
 * =====================================================================================
 */
std::vector<X13::sv> DropSeparatorLines(const std::vector<X13::sv>& lines)
{
    static const X13::sv decoration{"-=<>_"};

    std::vector<X13::sv> result;
    result.reserve(lines.size());

    for (auto line : lines)
    {
        bool only_decoration = rng::all_of(line, [](char c)
            { return decoration.find(c) != X13::sv::npos || std::isspace(static_cast<unsigned char>(c)) != 0; });

        if (! only_decoration)
        {
            result.push_back(line);
        }
    }
    return result;
} /* -----  end of function DropSeparatorLines  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LooksLikeSubHeader
 *  Description:  a data row can say 'SOLE' in its discretion column so we need
 *                more than that to believe we have the second header line.
 *                and an issuer name can have any of our keywords in it but
 *                a header line never has a CUSIP.
 * =====================================================================================
 */
bool LooksLikeSubHeader(X13::sv line)
{
    static const boost::regex regex_cusip{R"***(\b[0-9A-Z]{8}[0-9]\b)***"};

    auto upper_line = boost::algorithm::to_upper_copy(std::string{line});

    if (boost::regex_search(upper_line, regex_cusip))
    {
        return false;
    }

    if (HasKeyword(upper_line, "SOLE") && (HasKeyword(upper_line, "SHARED") || HasKeyword(upper_line, "NONE")))
    {
        return true;
    }

    static const std::vector<X13::sv> sub_header_keywords{"(X$1000)", "PRN AMT", "DISCRETION", "MANAGERS", "AUTHORITY"};

    return rng::any_of(sub_header_keywords, [&upper_line](X13::sv keyword) { return HasKeyword(upper_line, keyword); });
} /* -----  end of function LooksLikeSubHeader  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LocateHeader
 *  Description:
 * =====================================================================================
 */
HeaderLayout LocateHeader(const std::vector<X13::sv>& lines, std::size_t voting_margin)
{
    HeaderLayout layout;

    std::optional<std::size_t> header_line;
    std::string header;

    for (std::size_t indx = 0; indx < lines.size(); ++indx)
    {
        auto upper_line = boost::algorithm::to_upper_copy(std::string{lines[indx]});
        if (HasKeyword(upper_line, "NAME OF ISSUER") && HasKeyword(upper_line, "CUSIP") && HasKeyword(upper_line, "VALUE"))
        {
            header_line = indx;
            header = std::move(upper_line);
            break;
        }
    }
    if (! header_line)
    {
        throw HeaderNotFoundException("Could not locate header line.");
    }

    layout.header_line_ = header_line.value();

    std::string sub_header;
    if (layout.header_line_ + 1 < lines.size() && LooksLikeSubHeader(lines[layout.header_line_ + 1]))
    {
        sub_header = boost::algorithm::to_upper_copy(std::string{lines[layout.header_line_ + 1]});
        layout.has_sub_header_ = true;
    }
    layout.data_start_ = layout.header_line_ + (layout.has_sub_header_ ? 2 : 1);

    auto add_column = [&layout](const char* column_name, std::optional<std::size_t> offset)
    {
        if (offset)
        {
            layout.offsets_.push_back(ColumnOffset{column_name, offset.value()});
        }
    };

    add_column("name", FindKeyword(header, "NAME OF ISSUER"));
    add_column("title", FindKeyword(header, "TITLE OF"));
    add_column("cusip", FindKeyword(header, "CUSIP"));
    add_column("value", FindKeyword(header, "VALUE"));

    auto shares = FindKeyword(header, "SHRS OR PRN AMT");
    add_column("shares", shares ? shares : FindKeyword(header, "SHRS OR"));

    add_column("sh_prn", FindKeyword(header, "SH/"));
    add_column("putcall", FindKeyword(header, "PUT/CALL"));
    add_column("discr", FindKeyword(header, "INVESTMENT DISCRETION"));
    add_column("mgrs", FindKeyword(header, "OTHER MANAGERS"));

    // the voting columns are usually split across 2 lines:
    // 'VOTING AUTHORITY' above and 'SOLE SHARED NONE' below.

    auto voting_block = FindKeyword(header, "VOTING AUTHORITY");
    if (! voting_block)
    {
        voting_block = FindKeyword(sub_header, "VOTING AUTHORITY");
    }
    if (! voting_block)
    {
        return layout;
    }

    auto v_sole = FindKeyword(sub_header, "SOLE");
    if (! v_sole)
    {
        v_sole = FindKeyword(header, "SOLE");
    }
    if (! v_sole)
    {
        v_sole = voting_block;
    }

    auto v_shared = FindKeyword(sub_header, "SHARED");
    if (! v_shared)
    {
        v_shared = v_sole.value() + voting_margin;
    }

    auto v_none = FindKeyword(sub_header, "NONE");
    if (! v_none)
    {
        v_none = v_shared.value() + voting_margin;
    }

    add_column("v_sole", v_sole);
    add_column("v_shared", v_shared);
    add_column("v_none", v_none);

    return layout;
} /* -----  end of function LocateHeader  ----- */
