/*
 * =====================================================================================
 *
 *       Filename:  AmendmentResolver.cpp
 *
 *    Description:  Choose the one filing which speaks for a reporting period.
 *
 *        Version:  1.0
 *        Created:  03/02/2024 02:58:44 PM
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

#include "AmendmentResolver.h"

#include <algorithm>
#include <tuple>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/reverse.hpp>

namespace rng = ranges;

#include "Extractor_Utils.h"
#include "PeriodFilter.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  PickAuthoritativeFiling
 *  Description:
 * =====================================================================================
 */
X13::Filing PickAuthoritativeFiling(std::vector<X13::Filing> filings)
{
    BOOST_ASSERT_MSG(! filings.empty(), "Can't pick a filing from an empty list.");

    std::stable_sort(filings.begin(), filings.end(), [](const auto& lhs, const auto& rhs)
        { return std::tie(lhs.date_filed, lhs.accession_number) < std::tie(rhs.date_filed, rhs.accession_number); });

    auto latest = filings | rng::views::reverse;

    if (auto amendment = rng::find_if(latest, [](const auto& f) { return f.form_type == X13::FormType::e_13F_HR_A; });
        amendment != latest.end())
    {
        return *amendment;
    }
    if (auto original = rng::find_if(latest, [](const auto& f) { return f.form_type == X13::FormType::e_13F_HR; });
        original != latest.end())
    {
        return *original;
    }
    return filings.back();
} /* -----  end of function PickAuthoritativeFiling  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  BucketFilingsByPeriod
 *  Description:
 * =====================================================================================
 */
FilingsByPeriod BucketFilingsByPeriod(const std::vector<X13::Filing>& filings, const PeriodFilter& period_filter)
{
    FilingsByPeriod result;

    for (const auto& filing : filings)
    {
        if (filing.period_of_report.empty() || ! period_filter(filing.period_of_report))
        {
            continue;
        }
        result[filing.period_of_report].push_back(filing);
    }
    return result;
} /* -----  end of function BucketFilingsByPeriod  ----- */
