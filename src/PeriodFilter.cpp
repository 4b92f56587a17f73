/*
 * =====================================================================================
 *
 *       Filename:  PeriodFilter.cpp
 *
 *    Description:  Select reporting periods by year, quarter and date range.
 *
 *        Version:  1.0
 *        Created:  03/02/2024 10:31:07 AM
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

#include "PeriodFilter.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>

namespace rng = ranges;

#include "Extractor_Utils.h"

namespace
{
    // returns nothing if the text is not a valid ISO date.

    std::optional<date::year_month_day> ParseISODate(X13::sv text)
    {
        std::istringstream in{std::string{text}};
        date::sys_days tp;
        date::from_stream(in, "%F", tp);
        if (in.fail() || in.bad())
        {
            return std::nullopt;
        }
        date::year_month_day result = tp;
        if (! result.ok())
        {
            return std::nullopt;
        }
        return result;
    }

    std::optional<date::year_month_day> ParseDateBound(const std::string& bound, const char* which)
    {
        if (bound.empty())
        {
            return std::nullopt;
        }
        auto result = ParseISODate(bound);
        if (! result)
        {
            throw ConfigException(catenate("Unable to parse ", which, " date: '", bound, "'. Must be YYYY-MM-DD."));
        }
        return result;
    }
} // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  QuarterToPeriodEnd
 *  Description:
 * =====================================================================================
 */
std::string QuarterToPeriodEnd(X13::sv quarter_token)
{
    auto token = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(std::string{quarter_token}));

    bool is_good = token.size() == 6
        && rng::all_of(token.substr(0, 4), [](unsigned char c) { return std::isdigit(c) != 0; })
        && token[4] == 'Q'
        && token[5] >= '1' && token[5] <= '4';

    if (! is_good)
    {
        throw ConfigException(catenate("Invalid quarter: '", quarter_token, "'. Must look like 2013Q1."));
    }

    static const std::array<const char*, 4> quarter_ends{"-03-31", "-06-30", "-09-30", "-12-31"};

    return token.substr(0, 4) + quarter_ends[token[5] - '1'];
} /* -----  end of function QuarterToPeriodEnd  ----- */

PeriodIsInYears::PeriodIsInYears(const std::vector<std::string>& years)
{
    for (const auto& year : years)
    {
        auto trimmed = boost::algorithm::trim_copy(year);
        if (trimmed.size() != 4 || ! rng::all_of(trimmed, [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            throw ConfigException(catenate("Invalid year: '", year, "'. Must be 4 digits."));
        }
        years_.push_back(trimmed);
    }
} /* -----  end of method PeriodIsInYears::PeriodIsInYears  (constructor)  ----- */

bool PeriodIsInYears::operator()(X13::sv period) const
{
    if (period.size() < 4)
    {
        return false;
    }
    return rng::find(years_, period.substr(0, 4)) != years_.end();
} /* -----  end of method PeriodIsInYears::operator()  ----- */

PeriodIsInQuarters::PeriodIsInQuarters(const std::vector<std::string>& quarter_tokens)
{
    for (const auto& token : quarter_tokens)
    {
        period_ends_.push_back(QuarterToPeriodEnd(token));
    }
} /* -----  end of method PeriodIsInQuarters::PeriodIsInQuarters  (constructor)  ----- */

bool PeriodIsInQuarters::operator()(X13::sv period) const
{
    return rng::find(period_ends_, period) != period_ends_.end();
} /* -----  end of method PeriodIsInQuarters::operator()  ----- */

bool PeriodIsWithinDateRange::operator()(X13::sv period) const
{
    auto report_date = ParseISODate(period);
    if (! report_date)
    {
        return false;
    }
    if (begin_date_ && report_date.value() < begin_date_.value())
    {
        return false;
    }
    if (end_date_ && end_date_.value() < report_date.value())
    {
        return false;
    }
    return true;
} /* -----  end of method PeriodIsWithinDateRange::operator()  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  PeriodFilter
 *      Method:  PeriodFilter
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
PeriodFilter::PeriodFilter(const std::vector<std::string>& years, const std::vector<std::string>& quarter_tokens,
                           const std::string& begin_date, const std::string& end_date)
{
    if (! NotAllEmpty(years, quarter_tokens, begin_date, end_date))
    {
        throw ConfigException("Usage error: must specify at least one of years, quarters or a date range.");
    }

    if (! years.empty())
    {
        filters_.emplace_back(PeriodIsInYears{years});
    }

    if (! quarter_tokens.empty())
    {
        filters_.emplace_back(PeriodIsInQuarters{quarter_tokens});
    }

    if (NotAllEmpty(begin_date, end_date))
    {
        auto begin = ParseDateBound(begin_date, "begin");
        auto end = ParseDateBound(end_date, "end");
        if (begin && end && end.value() < begin.value())
        {
            throw ConfigException(catenate("Begin date: ", begin_date, " is after end date: ", end_date, "."));
        }
        filters_.emplace_back(PeriodIsWithinDateRange{begin, end});
    }
} /* -----  end of method PeriodFilter::PeriodFilter  (constructor)  ----- */

bool PeriodFilter::operator()(X13::sv period) const
{
    if (period.empty())
    {
        return false;
    }
    return rng::all_of(filters_, [period](const auto& filter)
        { return std::visit([period](const auto& f) { return f(period); }, filter); });
} /* -----  end of method PeriodFilter::operator()  ----- */
