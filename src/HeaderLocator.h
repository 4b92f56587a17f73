/*
 * =====================================================================================
 *
 *       Filename:  HeaderLocator.h
 *
 *    Description:  Find the column header of a fixed-width holdings table
 *                  and work out where each column starts.
 *
 *        Version:  1.0
 *        Created:  03/04/2024 09:05:52 AM
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

#ifndef _HEADERLOCATOR_INC_
#define _HEADERLOCATOR_INC_

#include <string>
#include <vector>

#include "Extractor.h"

// when the voting sub-header doesn't name a column, assume it starts
// this many characters after the one before it.

constexpr std::size_t VOTING_COLUMN_MARGIN = 10;

struct ColumnOffset
{
    std::string column_name_;
    std::size_t offset_;

    bool operator==(const ColumnOffset& rhs) const = default;
};

struct HeaderLayout
{
    std::size_t header_line_ = 0;
    std::size_t data_start_ = 0;
    bool has_sub_header_ = false;

    // only the columns we found, in the order we look for them.

    std::vector<ColumnOffset> offsets_;
};

// lines made up only of '-', '=', '<', '>', '_' and blanks are just decoration.
// empty lines go too.

std::vector<X13::sv> DropSeparatorLines(const std::vector<X13::sv>& lines);

bool LooksLikeSubHeader(X13::sv line);

// throws HeaderNotFoundException if no line names the issuer, cusip and value columns.

HeaderLayout LocateHeader(const std::vector<X13::sv>& lines, std::size_t voting_margin = VOTING_COLUMN_MARGIN);

#endif /* ----- #ifndef _HEADERLOCATOR_INC_  ----- */
