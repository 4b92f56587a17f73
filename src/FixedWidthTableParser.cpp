/*
 * =====================================================================================
 *
 *       Filename:  FixedWidthTableParser.cpp
 *
 *    Description:  Slice the data lines of a fixed-width holdings table
 *                  into fields.
 *
 *        Version:  1.0
 *        Created:  03/04/2024 01:40:56 PM
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

#include "FixedWidthTableParser.h"

#include <algorithm>
#include <iterator>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <range/v3/algorithm/find_if.hpp>

namespace rng = ranges;

#include "Extractor_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  MakeColumnSpans
 *  Description:
 * =====================================================================================
 */
std::vector<ColumnSpan> MakeColumnSpans(const std::vector<ColumnOffset>& offsets)
{
    auto ordered = offsets;
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs)
        { return lhs.offset_ < rhs.offset_; });

    std::vector<ColumnSpan> spans;
    for (std::size_t indx = 0; indx < ordered.size(); ++indx)
    {
        ColumnSpan span{ordered[indx].column_name_, ordered[indx].offset_, std::nullopt};
        if (indx + 1 < ordered.size())
        {
            span.end_ = ordered[indx + 1].offset_;
        }
        spans.push_back(std::move(span));
    }
    return spans;
} /* -----  end of function MakeColumnSpans  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  SliceField
 *  Description:
 * =====================================================================================
 */
std::string SliceField(X13::sv line, const ColumnSpan& span)
{
    if (span.start_ >= line.size())
    {
        return {};
    }
    auto field = line.substr(span.start_);
    if (span.end_ && span.end_.value() > span.start_)
    {
        field = field.substr(0, span.end_.value() - span.start_);
    }
    else if (span.end_)
    {
        return {};
    }
    return boost::algorithm::trim_copy(std::string{field});
} /* -----  end of function SliceField  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseFixedWidthTable
 *  Description:
 * =====================================================================================
 */
X13::RawTable ParseFixedWidthTable(const std::vector<X13::sv>& lines, const HeaderLayout& layout)
{
    const auto spans = MakeColumnSpans(layout.offsets_);

    X13::RawTable table;
    for (const auto& span : spans)
    {
        table.columns_.push_back(span.column_name_);
    }

    auto column_index = [&table](X13::sv column_name) -> std::optional<std::size_t>
    {
        auto found = rng::find_if(table.columns_, [column_name](const auto& c) { return c == column_name; });
        if (found == table.columns_.end())
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(table.columns_.begin(), found));
    };
    const auto cusip_column = column_index("cusip");
    const auto value_column = column_index("value");

    for (std::size_t indx = layout.data_start_; indx < lines.size(); ++indx)
    {
        auto line = lines[indx];
        if (boost::algorithm::trim_copy(std::string{line}).empty())
        {
            continue;
        }
        if (boost::algorithm::to_upper_copy(std::string{line}).find("GRAND TOTAL") != std::string::npos)
        {
            break;
        }

        std::vector<std::string> row;
        row.reserve(spans.size());
        for (const auto& span : spans)
        {
            row.push_back(SliceField(line, span));
        }

        // page headers, footnotes and such have nothing where the cusip and value go.

        bool no_cusip = ! cusip_column || row[cusip_column.value()].empty();
        bool no_value = ! value_column || row[value_column.value()].empty();
        if (no_cusip && no_value)
        {
            continue;
        }
        table.rows_.push_back(std::move(row));
    }
    return table;
} /* -----  end of function ParseFixedWidthTable  ----- */

X13::RawTable ParseFixedWidthTable(X13::InfoTableBlock block, std::size_t voting_margin)
{
    const auto lines = DropSeparatorLines(SplitLines(block.get()));
    const auto layout = LocateHeader(lines, voting_margin);
    return ParseFixedWidthTable(lines, layout);
} /* -----  end of function ParseFixedWidthTable  ----- */
