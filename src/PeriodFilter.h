/*
 * =====================================================================================
 *
 *       Filename:  PeriodFilter.h
 *
 *    Description:  Select reporting periods by year, quarter and date range.
 *
 *        Version:  1.0
 *        Created:  03/02/2024 10:12:41 AM
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

#ifndef _PERIODFILTER_INC_
#define _PERIODFILTER_INC_

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <date/date.h>

#include "Extractor.h"

// a quarter token looks like '2013Q1'. the result is the quarter end date
// in ISO format, '2013-03-31'. throws ConfigException for anything else.

std::string QuarterToPeriodEnd(X13::sv quarter_token);

// the filters. each takes a period end date formatted as YYYY-MM-DD.

struct PeriodIsInYears
{
    explicit PeriodIsInYears(const std::vector<std::string>& years);

    bool operator()(X13::sv period) const;

    const std::string filter_name_{"PeriodIsInYears"};

    std::vector<std::string> years_;
};

struct PeriodIsInQuarters
{
    explicit PeriodIsInQuarters(const std::vector<std::string>& quarter_tokens);

    bool operator()(X13::sv period) const;

    const std::string filter_name_{"PeriodIsInQuarters"};

    std::vector<std::string> period_ends_;
};

// either end may be open.

struct PeriodIsWithinDateRange
{
    PeriodIsWithinDateRange(const std::optional<date::year_month_day>& begin_date,
                            const std::optional<date::year_month_day>& end_date)
        : begin_date_{begin_date}, end_date_{end_date}
    {
    }

    bool operator()(X13::sv period) const;

    const std::string filter_name_{"PeriodIsWithinDateRange"};

    const std::optional<date::year_month_day> begin_date_;
    const std::optional<date::year_month_day> end_date_;
};

// =====================================================================================
//        Class:  PeriodFilter
//  Description:  a period is selected only when every supplied filter agrees.
// =====================================================================================

class PeriodFilter
{
public:
    using FilterTypes = std::variant<PeriodIsInYears, PeriodIsInQuarters, PeriodIsWithinDateRange>;
    using FilterList = std::vector<FilterTypes>;

    // ====================  LIFECYCLE     =======================================

    PeriodFilter() = delete;

    // empty arguments mean 'not supplied'. supplying nothing at all is a usage error.

    PeriodFilter(const std::vector<std::string>& years, const std::vector<std::string>& quarter_tokens,
                 const std::string& begin_date, const std::string& end_date);

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const FilterList& GetFilters() const { return filters_; }

    // ====================  OPERATORS     =======================================

    bool operator()(X13::sv period) const;

private:
    // ====================  DATA MEMBERS  =======================================

    FilterList filters_;

}; // -----  end of class PeriodFilter  -----

#endif /* ----- #ifndef _PERIODFILTER_INC_  ----- */
