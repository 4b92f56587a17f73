/*
 * =====================================================================================
 *
 *       Filename:  AmendmentResolver.h
 *
 *    Description:  Choose the one filing which speaks for a reporting period.
 *
 *        Version:  1.0
 *        Created:  03/02/2024 02:47:19 PM
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

#ifndef _AMENDMENTRESOLVER_INC_
#define _AMENDMENTRESOLVER_INC_

#include <map>
#include <string>
#include <vector>

#include "Extractor.h"

class PeriodFilter;

using FilingsByPeriod = std::map<std::string, std::vector<X13::Filing>>;

// latest amendment wins, then latest original filing, then latest anything.
// 'latest' means ordered by date filed then accession number.

X13::Filing PickAuthoritativeFiling(std::vector<X13::Filing> filings);

// groups the wanted filings by their period of report.
// filings without a period of report can't be placed and are skipped.

FilingsByPeriod BucketFilingsByPeriod(const std::vector<X13::Filing>& filings, const PeriodFilter& period_filter);

#endif /* ----- #ifndef _AMENDMENTRESOLVER_INC_  ----- */
