// =====================================================================================
//
//       Filename:  StructuredInfoTable.cpp
//
//    Description:  Load the SEC Form 13F data set information table file
//                  (INFOTABLE.tsv) into one table per filing.
//
//        Version:  1.0
//        Created:  03/12/2024 10:58:02 AM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

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

#include "StructuredInfoTable.h"

#include <iterator>

#include <boost/algorithm/string/trim.hpp>

#include <range/v3/algorithm/find.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "Extractor_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseStructuredInfoTables
 *  Description:
 * =====================================================================================
 */
StructuredTables ParseStructuredInfoTables(X13::FileContent tsv_content)
{
    auto lines = SplitLines(tsv_content.get());
    while (! lines.empty() && lines.back().empty())
    {
        lines.pop_back();
    }
    if (lines.empty())
    {
        throw ParseException("Information table data set is empty.");
    }

    const auto file_columns = split_string<std::string>(lines.front(), '\t');

    auto accession_column = rng::find(file_columns, "ACCESSION_NUMBER");
    if (accession_column == file_columns.end())
    {
        throw ParseException("Information table data set has no 'ACCESSION_NUMBER' column.");
    }
    const auto accession_index = static_cast<std::size_t>(std::distance(file_columns.begin(), accession_column));

    std::vector<std::string> table_columns;
    for (std::size_t indx = 0; indx < file_columns.size(); ++indx)
    {
        if (indx == accession_index)
        {
            continue;
        }
        auto column_name = boost::algorithm::trim_copy(file_columns[indx]);
        auto xbrl_name = DATA_SET_COLUMN_NAMES.find(column_name);
        table_columns.push_back(xbrl_name != DATA_SET_COLUMN_NAMES.end() ? xbrl_name->second : column_name);
    }

    StructuredTables tables;

    for (auto line = std::next(lines.begin()); line != lines.end(); ++line)
    {
        if (line->empty())
        {
            continue;
        }

        // a line with too many or too few fields keeps them all. the structured
        // strategy won't use a table whose rows don't fit its columns.

        auto fields = split_string<std::string>(*line, '\t');
        if (fields.size() <= accession_index)
        {
            throw ParseException(catenate("Information table data set line: ", std::distance(lines.begin(), line) + 1,
                        " has no accession number: ", *line));
        }

        const auto accession_number = boost::algorithm::trim_copy(fields[accession_index]);
        if (accession_number.empty())
        {
            continue;
        }

        std::vector<std::string> row;
        row.reserve(fields.size());
        for (std::size_t indx = 0; indx < fields.size(); ++indx)
        {
            if (indx != accession_index)
            {
                row.push_back(boost::algorithm::trim_copy(fields[indx]));
            }
        }

        auto& table = tables[accession_number];
        if (table.columns_.empty())
        {
            table.columns_ = table_columns;
        }
        table.rows_.push_back(std::move(row));
    }

    spdlog::debug(catenate("Information table data set has entries for: ", tables.size(), " filings."));

    return tables;
} /* -----  end of function ParseStructuredInfoTables  ----- */

StructuredTables LoadStructuredInfoTables(const X13::FileName& tsv_file_name)
{
    const std::string tsv_content = LoadDataFileForUse(tsv_file_name);
    return ParseStructuredInfoTables(X13::FileContent{tsv_content});
} /* -----  end of function LoadStructuredInfoTables  ----- */

std::optional<X13::RawTable> FindStructuredTable(const StructuredTables& tables, const std::string& accession_number)
{
    if (auto found = tables.find(accession_number); found != tables.end())
    {
        return found->second;
    }
    return std::nullopt;
} /* -----  end of function FindStructuredTable  ----- */
