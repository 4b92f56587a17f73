/*
 * =====================================================================================
 *
 *       Filename:  FixedWidthTableParser.h
 *
 *    Description:  Slice the data lines of a fixed-width holdings table
 *                  into fields.
 *
 *        Version:  1.0
 *        Created:  03/04/2024 01:22:10 PM
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

#ifndef _FIXEDWIDTHTABLEPARSER_INC_
#define _FIXEDWIDTHTABLEPARSER_INC_

#include <optional>
#include <string>
#include <vector>

#include "Extractor.h"
#include "HeaderLocator.h"

struct ColumnSpan
{
    std::string column_name_;
    std::size_t start_;
    std::optional<std::size_t> end_;        // none means 'to end of line'
};

// spans are ordered by where they start. each runs up to the next one.

std::vector<ColumnSpan> MakeColumnSpans(const std::vector<ColumnOffset>& offsets);

// the trimmed text of the line under the span. empty if the line is too short.

std::string SliceField(X13::sv line, const ColumnSpan& span);

// columns are named 'name', 'title', 'cusip', 'value', 'shares', 'sh_prn',
// 'putcall', 'discr', 'mgrs', 'v_sole', 'v_shared', 'v_none'.
// the lines must have had their separator lines dropped already.

X13::RawTable ParseFixedWidthTable(const std::vector<X13::sv>& lines, const HeaderLayout& layout);

// does all the steps: split into lines, drop separators, locate header, slice.

X13::RawTable ParseFixedWidthTable(X13::InfoTableBlock block, std::size_t voting_margin = VOTING_COLUMN_MARGIN);

#endif /* ----- #ifndef _FIXEDWIDTHTABLEPARSER_INC_  ----- */
