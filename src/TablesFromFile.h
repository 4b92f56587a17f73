/*
 * =====================================================================================
 *
 *       Filename:  TablesFromFile.h
 *
 *    Description:  Extract HTML tables from a block of text.
 *
 *        Version:  2.0
 *        Created:  12/21/2018 09:22:12 AM
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


#ifndef  _TABLESFROMFILE_INC_
#define  _TABLESFROMFILE_INC_

#include <iterator>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "Extractor.h"

class CNode;

// let's keep our found table content here,

struct TableData
{
    X13::sv current_table_html_;

    // each row's cells, with colspans spread out.

    std::vector<std::vector<std::string>> current_table_cells_;

    bool operator==(TableData const& rhs) const
    {
        return current_table_html_ == rhs.current_table_html_;
    }
};

/*
 * =====================================================================================
 *        Class:  TablesFromHTML
 *  Description:  Range compatible class to iterate over tables (if any) in block of text.
 * =====================================================================================
 */
class TablesFromHTML
{
public:

    class table_itor;

    using iterator = table_itor;
    using const_iterator = table_itor;

public:
    /* ====================  LIFECYCLE     ======================================= */

    TablesFromHTML() = default;
    explicit TablesFromHTML (X13::sv html) : html_{html} { }         /* constructor */

    /* ====================  ACCESSORS     ======================================= */

    [[nodiscard]] iterator begin();
    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] iterator end();
    [[nodiscard]] const_iterator end() const;

    /* ====================  MUTATORS      ======================================= */

    /* ====================  OPERATORS     ======================================= */

protected:
    /* ====================  METHODS       ======================================= */

    /* ====================  DATA MEMBERS  ======================================= */

private:

    friend class table_itor;

    /* ====================  METHODS       ======================================= */

    [[nodiscard]] X13::sv GetHTML(void) const { return html_; }

    /* ====================  DATA MEMBERS  ======================================= */

    X13::sv html_;

    // these regexes are used to help parse the HTML.

    const boost::regex regex_table_{R"***(<table.*?>.*?</table>)***",
        boost::regex_constants::normal | boost::regex_constants::icase};

    // used to clean up the parsed data

    const boost::regex regex_bogus_em_dash{R"***(&#151;)***"};
    const boost::regex regex_real_em_dash{R"***(&#8212;)***"};
    const boost::regex regex_hi_ascii{R"***([^\x00-\x7f])***"};
    const boost::regex regex_white_space{R"***([[:space:]]+)***"};

    const std::string pseudo_em_dash = "---";
    const std::string one_space = " ";

}; /* -----  end of class TablesFromHTML  ----- */


// =====================================================================================
//        Class:  TablesFromHTML::table_itor
//  Description:  Range compatible iterator from contents of TablesFromHTML container.
// =====================================================================================
//
class TablesFromHTML::table_itor
{
public:

    using iterator_category = std::forward_iterator_tag;
    using value_type = TableData;
    using difference_type = ptrdiff_t;
    using pointer = TableData *;
    using reference = TableData &;

    // ====================  LIFECYCLE     =======================================

    table_itor() : tables_{nullptr} { }
    explicit table_itor(TablesFromHTML const* tables);

    // ====================  ACCESSORS     =======================================

    X13::sv to_sview() const { return table_data_.current_table_html_; }
    bool TableHasMarkup (X13::sv table);

    // ====================  MUTATORS      =======================================

    table_itor& operator++();
    table_itor operator++(int) { table_itor retval = *this; ++(*this); return retval; }

    // ====================  OPERATORS     =======================================

    bool operator==(const table_itor& other) const { return tables_ == other.tables_ && table_data_ == other.table_data_; }
    bool operator!=(const table_itor& other) const { return !(*this == other); }

    reference operator*() const { return table_data_; };
    pointer operator->() const { return &table_data_; }

protected:
    // ====================  METHODS       =======================================

    // ====================  DATA MEMBERS  =======================================

private:
    // ====================  METHODS       =======================================

    bool UseTable();

    std::vector<std::vector<std::string>> CollectTableContent(X13::sv html);

    // a_table is non-const because the qumbo-query library doesn't do 'const'

    std::vector<std::vector<std::string>> ExtractCellsFromTable (CNode& a_table);
    std::string FilterFoundHTML (const std::string& cell_text);

    // ====================  DATA MEMBERS  =======================================

    boost::cregex_token_iterator doc_;
    boost::cregex_token_iterator end_;

    TablesFromHTML const * tables_;
    X13::sv html_;

    mutable TableData table_data_;
}; // -----  end of class TablesFromHTML::table_itor  -----

// does this table look like a 13F information table ?

bool IsHoldingsTable(const TableData& table);

// header rows name the columns. everything else after the first header row
// which has some content and is not a rule line is a holding.
// throws ParseException if the table has no header or no holdings.

X13::RawTable MakeHoldingsTable(const TableData& table);

// looks in the block first. the block can start inside the table we
// want so we look at the whole text if the block gives us nothing.

X13::RawTable ExtractMarkupHoldingsTable(X13::InfoTableBlock block, X13::FileContent file_content);

#endif   /* ----- #ifndef TABLESFROMFILE_INC  ----- */
