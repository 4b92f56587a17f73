/*
 * =====================================================================================
 *
 *       Filename:  TablesFromFile.cpp
 *
 *    Description:  Extract HTML tables from a block of text.
 *
 *        Version:  2.0
 *        Created:  12/21/2018 09:23:04 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:  David P. Riedel (), driedel@cox.net
 *        License:  GNU General Public License v3
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


#include "TablesFromFile.h"
#include "Extractor_Utils.h"

#include <algorithm>
#include <charconv>
#include <optional>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count_if.hpp>

namespace rng = ranges;

using namespace std::string_literals;

// gumbo-query

#include "gq/Document.h"
#include "gq/Node.h"
#include "gq/Selection.h"

#include "spdlog/spdlog.h"

constexpr int MAX_COLSPAN = 50;

namespace
{
    // issuer names can have 'TITLE' or 'VALUE' in them so a heading row
    // needs at least 2 different heading words.

    bool IsHeaderRow(const std::vector<std::string>& cells)
    {
        static const std::vector<std::string> heading_words{"name of issuer", "title", "cusip", "value"};

        auto heading_count = rng::count_if(heading_words, [&cells](const auto& word)
            {
                return rng::any_of(cells, [&word](const auto& cell) { return boost::algorithm::icontains(cell, word); });
            });
        return heading_count >= 2;
    }

    // the second header line which splits up voting authority.

    bool IsSubHeaderRow(const std::vector<std::string>& cells)
    {
        static const std::vector<std::string> sub_header_labels{"sole", "shared", "none", "voting authority"};

        bool has_content = false;
        bool all_labels = rng::all_of(cells, [&has_content](const auto& cell)
            {
                if (cell.empty())
                {
                    return true;
                }
                has_content = true;
                auto label = CleanLabel(cell);
                return std::find(sub_header_labels.begin(), sub_header_labels.end(), label) != sub_header_labels.end();
            });
        return has_content && all_labels;
    }

    // filers put dashes in empty data cells too. only a row of nothing
    // but dashes is a rule.

    bool IsRuleRow(const std::vector<std::string>& cells)
    {
        static const boost::regex regex_rule{R"***(^[-=_]+$)***"};

        bool has_content = false;
        bool all_rules = rng::all_of(cells, [&has_content](const auto& cell)
            {
                if (cell.empty())
                {
                    return true;
                }
                has_content = true;
                return boost::regex_match(cell, regex_rule);
            });
        return has_content && all_rules;
    }

    bool IsGrandTotalRow(const std::vector<std::string>& cells)
    {
        return rng::any_of(cells, [](const auto& cell) { return boost::algorithm::icontains(cell, "grand total"); });
    }

    bool IsBlankRow(const std::vector<std::string>& cells)
    {
        return rng::all_of(cells, [](const auto& cell) { return cell.empty(); });
    }

    int ColumnSpan(CNode& a_cell)
    {
        auto colspan = a_cell.attribute("colspan");
        int span{1};
        auto [ptr, ec] = std::from_chars(colspan.data(), colspan.data() + colspan.size(), span);
        if (ec != std::errc() || span < 1)
        {
            return 1;
        }
        return std::min(span, MAX_COLSPAN);
    }
} // namespace

/*
 *--------------------------------------------------------------------------------------
 *       Class:  TablesFromHTML
 *      Method:  TablesFromHTML
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
TablesFromHTML::iterator TablesFromHTML::begin ()
{
    iterator it{this};
    return it;
}		/* -----  end of method TablesFromHTML::begin  ----- */

TablesFromHTML::const_iterator TablesFromHTML::begin () const
{
    const_iterator it{this};
    return it;
}		/* -----  end of method TablesFromHTML::begin  ----- */

TablesFromHTML::iterator TablesFromHTML::end ()
{
    return {};
}		/* -----  end of method TablesFromHTML::end  ----- */

TablesFromHTML::const_iterator TablesFromHTML::end () const
{
    return {};
}		/* -----  end of method TablesFromHTML::end  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  TablesFromHTML::table_itor
 *      Method:  TablesFromHTML::table_itor
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
TablesFromHTML::table_itor::table_itor(TablesFromHTML const * tables)
    : tables_{tables}
{
    if (tables_ == nullptr)
    {
        return;
    }
    html_ = tables_->GetHTML();

    doc_ = boost::cregex_token_iterator(html_.cbegin(), html_.cend(), tables_->regex_table_);
    if (doc_ == end_)
    {
        tables_ = nullptr;
        return;
    }
    if (! UseTable())
    {
        operator++();
    }
}  /* -----  end of method TablesFromHTML::table_itor::table_itor  (constructor)  ----- */

TablesFromHTML::table_itor& TablesFromHTML::table_itor::operator++ ()
{
    if (tables_ == nullptr)
    {
        return *this;
    }

    while (++doc_ != end_)
    {
        if (UseTable())
        {
            return *this;
        }
    }

    table_data_.current_table_html_ = {};
    table_data_.current_table_cells_.clear();
    tables_ = nullptr;
    return *this;
}		/* -----  end of method TablesFromHTML::table_itor::operator++  ----- */

bool TablesFromHTML::table_itor::UseTable ()
{
    try
    {
        table_data_.current_table_html_ = X13::sv(doc_->first, doc_->length());
        if (TableHasMarkup(table_data_.current_table_html_))
        {
            table_data_.current_table_cells_ = CollectTableContent(table_data_.current_table_html_);
            return true;
        }
        spdlog::debug("Little or no HTML found in table...Skipping.");
    }
    catch (AssertionException& e)
    {
        // let's ignore it and continue.

        spdlog::debug(catenate("Problem processing HTML table: ", e.what()));
    }
    catch (ParseException& e)
    {
        // let's ignore it and continue.

        spdlog::debug(catenate("Problem processing HTML table: ", e.what()));
    }
    return false;
}		/* -----  end of method TablesFromHTML::table_itor::UseTable  ----- */

bool TablesFromHTML::table_itor::TableHasMarkup (X13::sv table)
{
    auto have_td = table.find("</TD>") != X13::sv::npos || table.find("</td>") != X13::sv::npos;
    auto have_tr = table.find("</TR>") != X13::sv::npos || table.find("</tr>") != X13::sv::npos;

    return have_td && have_tr;
}		// -----  end of method TablesFromHTML::table_itor::TableHasMarkup  -----

std::vector<std::vector<std::string>> TablesFromHTML::table_itor::CollectTableContent(X13::sv a_table)
{
    std::string tmp;
    tmp.reserve(a_table.size());
    boost::regex_replace(std::back_inserter(tmp), a_table.begin(), a_table.end(),
            tables_->regex_bogus_em_dash, tables_->pseudo_em_dash);
    tmp = boost::regex_replace(tmp, tables_->regex_real_em_dash, tables_->pseudo_em_dash);

    CDocument the_filing;
    the_filing.parse(tmp);
    CSelection all_tables = the_filing.find("table");

    if (all_tables.nodeNum() == 0)
    {
        throw ParseException("Markup parser found no table.");
    }

    // we matched 1 table with our regex so the first is the one we want.
    // nested tables will show up in its rows anyway.

    CNode a_table = all_tables.nodeAt(0);
    auto cells = ExtractCellsFromTable(a_table);
    if (cells.empty())
    {
        throw ParseException("Table has no rows.");
    }
    return cells;
}		/* -----  end of function TablesFromHTML::table_itor::CollectTableContent  ----- */

std::vector<std::vector<std::string>> TablesFromHTML::table_itor::ExtractCellsFromTable (CNode& a_table)
{
    std::vector<std::vector<std::string>> table_cells;

    // now, the each table, find all rows in the table.

    CSelection a_table_rows = a_table.find("tr");

    for (size_t indx = 0 ; indx < a_table_rows.nodeNum(); ++indx)
    {
        CNode a_table_row = a_table_rows.nodeAt(indx);

        // for each row in the table, find all the fields.

        CSelection a_table_row_cells = a_table_row.find("th,td");

        std::vector<std::pair<std::string, int>> row_cells;
        for (size_t cell_indx = 0 ; cell_indx < a_table_row_cells.nodeNum(); ++cell_indx)
        {
            CNode a_table_row_cell = a_table_row_cells.nodeAt(cell_indx);
            row_cells.emplace_back(FilterFoundHTML(a_table_row_cell.text()), ColumnSpan(a_table_row_cell));
        }

        std::vector<std::string> texts;
        for (const auto& [text, span] : row_cells)
        {
            texts.push_back(text);
        }

        // header labels cover every column they span. data goes in the first.

        bool spread_text = IsHeaderRow(texts) || IsSubHeaderRow(texts);

        std::vector<std::string> new_row_data;
        for (const auto& [text, span] : row_cells)
        {
            new_row_data.push_back(text);
            for (int i = 1; i < span; ++i)
            {
                new_row_data.push_back(spread_text ? text : ""s);
            }
        }
        table_cells.push_back(std::move(new_row_data));
    }
    return table_cells;
}		/* -----  end of function TablesFromHTML::table_itor::ExtractCellsFromTable  ----- */

std::string TablesFromHTML::table_itor::FilterFoundHTML (const std::string& cell_text)
{
    // at this point, I do not want any line breaks, returns or funny characters from source data.

    std::string clean_cell_data = boost::regex_replace(cell_text, tables_->regex_hi_ascii, tables_->one_space);
    clean_cell_data = boost::regex_replace(clean_cell_data, tables_->regex_white_space, tables_->one_space);
    boost::algorithm::trim(clean_cell_data);

    return clean_cell_data;
}		/* -----  end of function TablesFromHTML::table_itor::FilterFoundHTML  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  IsHoldingsTable
 *  Description:
 * =====================================================================================
 */
bool IsHoldingsTable(const TableData& table)
{
    std::string table_text;
    for (const auto& row : table.current_table_cells_)
    {
        for (const auto& cell : row)
        {
            table_text += cell;
            table_text += ' ';
        }
    }
    boost::algorithm::to_lower(table_text);

    return table_text.find("information table") != std::string::npos
        || table_text.find("name of issuer") != std::string::npos;
}		/* -----  end of function IsHoldingsTable  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  MakeHoldingsTable
 *  Description:
 * =====================================================================================
 */
X13::RawTable MakeHoldingsTable(const TableData& table)
{
    const auto& rows = table.current_table_cells_;

    std::size_t width{0};
    for (const auto& row : rows)
    {
        width = std::max(width, row.size());
    }

    auto first_header = std::find_if(rows.begin(), rows.end(), [](const auto& row) { return IsHeaderRow(row); });
    if (first_header == rows.end())
    {
        throw ParseException("Can't find column headings in markup table.");
    }

    // column labels come from the header row plus any sub-header rows right after it.
    // a short sub-header row belongs over the right-most columns.

    std::vector<std::string> labels(width);
    auto row = first_header;
    for (; row != rows.end() && (IsHeaderRow(*row) || IsSubHeaderRow(*row)); ++row)
    {
        std::size_t offset = IsSubHeaderRow(*row) ? width - row->size() : 0;
        for (std::size_t indx = 0; indx < row->size(); ++indx)
        {
            const auto& cell = (*row)[indx];
            if (cell.empty())
            {
                continue;
            }
            auto& label = labels[indx + offset];
            if (label.find(cell) != std::string::npos)
            {
                continue;
            }
            label = label.empty() ? cell : catenate(label, ' ', cell);
        }
    }

    std::vector<std::vector<std::string>> data_rows;
    for (; row != rows.end() && ! IsGrandTotalRow(*row); ++row)
    {
        if (IsBlankRow(*row) || IsRuleRow(*row) || IsHeaderRow(*row) || IsSubHeaderRow(*row))
        {
            continue;
        }
        auto data_row = *row;
        data_row.resize(width);
        data_rows.push_back(std::move(data_row));
    }
    if (data_rows.empty())
    {
        throw ParseException("Markup table has headings but no holdings.");
    }

    // spacer columns are common in markup tables. drop them.

    std::vector<std::size_t> keep;
    for (std::size_t indx = 0; indx < width; ++indx)
    {
        bool has_data = rng::any_of(data_rows, [indx](const auto& r) { return ! r[indx].empty(); });
        if (! labels[indx].empty() || has_data)
        {
            keep.push_back(indx);
        }
    }

    X13::RawTable result;
    for (auto indx : keep)
    {
        result.columns_.push_back(labels[indx].empty() ? catenate("column_", indx) : labels[indx]);
    }
    for (const auto& data_row : data_rows)
    {
        std::vector<std::string> new_row;
        new_row.reserve(keep.size());
        for (auto indx : keep)
        {
            new_row.push_back(data_row[indx]);
        }
        result.rows_.push_back(std::move(new_row));
    }
    return result;
}		/* -----  end of function MakeHoldingsTable  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractMarkupHoldingsTable
 *  Description:
 * =====================================================================================
 */
X13::RawTable ExtractMarkupHoldingsTable(X13::InfoTableBlock block, X13::FileContent file_content)
{
    auto find_table = [](X13::sv text) -> std::optional<X13::RawTable>
    {
        TablesFromHTML tables{text};
        for (const auto& table : tables)
        {
            if (! IsHoldingsTable(table))
            {
                continue;
            }
            try
            {
                auto holdings = MakeHoldingsTable(table);
                if (! holdings.empty())
                {
                    return holdings;
                }
            }
            catch (const ParseException& e)
            {
                spdlog::debug(catenate("Skipping markup table: ", e.what()));
            }
        }
        return std::nullopt;
    };

    if (auto holdings = find_table(block.get()); holdings)
    {
        return holdings.value();
    }
    if (block.get().size() != file_content.get().size())
    {
        if (auto holdings = find_table(file_content.get()); holdings)
        {
            return holdings.value();
        }
    }
    throw ParseException("No usable markup holdings table found.");
}		/* -----  end of function ExtractMarkupHoldingsTable  ----- */
