/*
 * =====================================================================================
 *
 *       Filename:  ColumnNormalizer.cpp
 *
 *    Description:  Map each extraction method's column names onto our
 *                  holdings record and convert the numbers.
 *
 *        Version:  1.0
 *        Created:  03/07/2024 09:02:53 AM
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

#include "ColumnNormalizer.h"

#include <charconv>
#include <set>
#include <system_error>

#include <boost/algorithm/string/trim.hpp>

#include <range/v3/action/remove_if.hpp>
#include <range/v3/algorithm/any_of.hpp>

namespace rng = ranges;

#include "Extractor_Utils.h"

namespace
{
    // order matters. 'shrs or prn amt' must be shares, not share type.

    struct MarkupLabelRule
    {
        std::vector<X13::sv> keywords_;
        std::string column_name_;
    };

    const std::vector<MarkupLabelRule> MARKUP_LABEL_RULES{
        {{"name", "issuer"}, "name"},
        {{"title", "class"}, "title"},
        {{"cusip"}, "cusip"},
        {{"value"}, "value_x1000"},
        {{"put"}, "put_call"},
        {{"prn amt", "shrs", "shares", "amount"}, "shares"},
        {{"sh prn", "prn"}, "share_unit"},
        {{"discretion"}, "discretion"},
        {{"manager"}, "other_managers"},
        {{"sole"}, "voting_sole"},
        {{"shared"}, "voting_shared"},
        {{"none"}, "voting_none"}};

    void AssignField(X13::HoldingRecord& record, const std::string& column_name, const std::string& value)
    {
        if (column_name == "name") { record.name = value; }
        else if (column_name == "title") { record.title = value; }
        else if (column_name == "cusip") { record.cusip = value; }
        else if (column_name == "value_x1000") { record.value_x1000 = CoerceToCount(value); }
        else if (column_name == "shares") { record.shares = CoerceToCount(value); }
        else if (column_name == "share_unit") { record.share_unit = value; }
        else if (column_name == "put_call") { record.put_call = value; }
        else if (column_name == "discretion") { record.discretion = value; }
        else if (column_name == "other_managers") { record.other_managers = value; }
        else if (column_name == "voting_sole") { record.voting_sole = CoerceToCount(value); }
        else if (column_name == "voting_shared") { record.voting_shared = CoerceToCount(value); }
        else if (column_name == "voting_none") { record.voting_none = CoerceToCount(value); }
    }

    std::string CountAsText(const std::optional<int64_t>& count)
    {
        return count ? std::to_string(count.value()) : std::string{};
    }
} // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CoerceToCount
 *  Description:
 * =====================================================================================
 */
std::optional<int64_t> CoerceToCount(X13::sv text)
{
    std::string digits{text};
    digits |= rng::actions::remove_if([](char c) { return c == ','; });
    boost::algorithm::trim(digits);

    if (digits.empty())
    {
        return std::nullopt;
    }

    int64_t result{0};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || result < 0)
    {
        return std::nullopt;
    }
    return result;
} /* -----  end of function CoerceToCount  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CanonicalNameForMarkupLabel
 *  Description:
 * =====================================================================================
 */
std::optional<std::string> CanonicalNameForMarkupLabel(const std::string& label)
{
    const auto cleaned_label = CleanLabel(label);
    if (cleaned_label.empty())
    {
        return std::nullopt;
    }

    for (const auto& rule : MARKUP_LABEL_RULES)
    {
        if (rng::any_of(rule.keywords_, [&cleaned_label](X13::sv keyword)
            { return cleaned_label.find(keyword) != std::string::npos; }))
        {
            return rule.column_name_;
        }
    }
    return std::nullopt;
} /* -----  end of function CanonicalNameForMarkupLabel  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  MapColumnNames
 *  Description:  a canonical name is given to the first column which claims it.
 * =====================================================================================
 */
std::vector<std::optional<std::string>> MapColumnNames(const std::vector<std::string>& columns, ColumnSchema schema)
{
    std::vector<std::optional<std::string>> result;
    std::set<std::string> used;

    for (const auto& column : columns)
    {
        std::optional<std::string> canonical_name;
        switch (schema)
        {
            case ColumnSchema::e_XBRL:
                if (auto found = XBRL_COLUMN_NAMES.find(column); found != XBRL_COLUMN_NAMES.end())
                {
                    canonical_name = found->second;
                }
                break;

            case ColumnSchema::e_FixedWidth:
                if (auto found = FIXED_WIDTH_COLUMN_NAMES.find(column); found != FIXED_WIDTH_COLUMN_NAMES.end())
                {
                    canonical_name = found->second;
                }
                break;

            case ColumnSchema::e_Markup:
                canonical_name = CanonicalNameForMarkupLabel(column);
                break;
        }
        if (canonical_name && used.contains(canonical_name.value()))
        {
            canonical_name.reset();
        }
        if (canonical_name)
        {
            used.insert(canonical_name.value());
        }
        result.push_back(std::move(canonical_name));
    }
    return result;
} /* -----  end of function MapColumnNames  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  NormalizeTable
 *  Description:
 * =====================================================================================
 */
X13::HoldingRecords NormalizeTable(const X13::RawTable& table, ColumnSchema schema,
                                   const std::shared_ptr<spdlog::logger>& logger)
{
    const auto column_names = MapColumnNames(table.columns_, schema);

    X13::HoldingRecords records;
    records.reserve(table.rows_.size());

    int low_confidence_count{0};

    for (const auto& row : table.rows_)
    {
        X13::HoldingRecord record;
        for (std::size_t indx = 0; indx < table.columns_.size(); ++indx)
        {
            const std::string value = indx < row.size() ? row[indx] : std::string{};
            if (column_names[indx])
            {
                AssignField(record, column_names[indx].value(), value);
            }
            else
            {
                record.other_fields.emplace_back(table.columns_[indx], value);
            }
        }
        if (! record.voting_sole && ! record.voting_shared && ! record.voting_none)
        {
            record.low_confidence = true;
            ++low_confidence_count;
        }
        records.push_back(std::move(record));
    }

    if (low_confidence_count > 0 && logger)
    {
        logger->warn(catenate(low_confidence_count, " of ", records.size(),
                              " holdings have no voting authority values. Marked low confidence."));
    }
    return records;
} /* -----  end of function NormalizeTable  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  HoldingRecordFields
 *  Description:
 * =====================================================================================
 */
std::vector<std::string> HoldingRecordFields(const X13::HoldingRecord& record)
{
    return {record.name,
            record.title,
            record.cusip,
            CountAsText(record.value_x1000),
            CountAsText(record.shares),
            record.share_unit,
            record.put_call,
            record.discretion,
            record.other_managers,
            CountAsText(record.voting_sole),
            CountAsText(record.voting_shared),
            CountAsText(record.voting_none)};
} /* -----  end of function HoldingRecordFields  ----- */
