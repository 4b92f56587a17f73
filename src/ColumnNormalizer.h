/*
 * =====================================================================================
 *
 *       Filename:  ColumnNormalizer.h
 *
 *    Description:  Map each extraction method's column names onto our
 *                  holdings record and convert the numbers.
 *
 *        Version:  1.0
 *        Created:  03/07/2024 08:44:16 AM
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

#ifndef _COLUMNNORMALIZER_INC_
#define _COLUMNNORMALIZER_INC_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Extractor.h"

// which naming scheme the raw table uses.

enum class ColumnSchema
{
    e_XBRL,
    e_FixedWidth,
    e_Markup
};

// every extraction produces these, in this order.

inline const std::vector<std::string> CANONICAL_COLUMNS{
    "name", "title", "cusip", "value_x1000", "shares", "share_unit", "put_call",
    "discretion", "other_managers", "voting_sole", "voting_shared", "voting_none"};

inline const std::map<std::string, std::string> XBRL_COLUMN_NAMES{
    {"nameOfIssuer", "name"},
    {"titleOfClass", "title"},
    {"cusip", "cusip"},
    {"value", "value_x1000"},
    {"sshPrnamt", "shares"},
    {"sshPrnamtType", "share_unit"},
    {"putCall", "put_call"},
    {"investmentDiscretion", "discretion"},
    {"otherManager", "other_managers"},
    {"votingAuthoritySole", "voting_sole"},
    {"votingAuthorityShared", "voting_shared"},
    {"votingAuthorityNone", "voting_none"}};

inline const std::map<std::string, std::string> FIXED_WIDTH_COLUMN_NAMES{
    {"name", "name"},
    {"title", "title"},
    {"cusip", "cusip"},
    {"value", "value_x1000"},
    {"shares", "shares"},
    {"sh_prn", "share_unit"},
    {"putcall", "put_call"},
    {"discr", "discretion"},
    {"mgrs", "other_managers"},
    {"v_sole", "voting_sole"},
    {"v_shared", "voting_shared"},
    {"v_none", "voting_none"}};

// strips thousands separators. anything which is not a whole
// non-negative number gives the missing marker.

std::optional<int64_t> CoerceToCount(X13::sv text);

// column labels in markup tables are free text so we match on keywords.

std::optional<std::string> CanonicalNameForMarkupLabel(const std::string& label);

// canonical name for each column of the table, or nothing if we don't know it.

std::vector<std::optional<std::string>> MapColumnNames(const std::vector<std::string>& columns, ColumnSchema schema);

X13::HoldingRecords NormalizeTable(const X13::RawTable& table, ColumnSchema schema,
                                   const std::shared_ptr<spdlog::logger>& logger);

// the record as text, in canonical column order. missing numbers are empty.

std::vector<std::string> HoldingRecordFields(const X13::HoldingRecord& record);

#endif /* ----- #ifndef _COLUMNNORMALIZER_INC_  ----- */
