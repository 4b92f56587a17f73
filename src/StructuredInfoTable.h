// =====================================================================================
//
//       Filename:  StructuredInfoTable.h
//
//    Description:  Load the SEC Form 13F data set information table file
//                  (INFOTABLE.tsv) into one table per filing.
//
//        Version:  1.0
//        Created:  03/12/2024 10:41:19 AM
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

#ifndef  _STRUCTUREDINFOTABLE_INC_
#define  _STRUCTUREDINFOTABLE_INC_

#include <map>
#include <optional>
#include <string>

#include "Extractor.h"

// keyed by accession number. column names are the XBRL element names.

using StructuredTables = std::map<std::string, X13::RawTable>;

// data set column name to XBRL element name. anything not here keeps its own name.

inline const std::map<std::string, std::string> DATA_SET_COLUMN_NAMES{
    {"NAMEOFISSUER", "nameOfIssuer"},
    {"TITLEOFCLASS", "titleOfClass"},
    {"CUSIP", "cusip"},
    {"VALUE", "value"},
    {"SSHPRNAMT", "sshPrnamt"},
    {"SSHPRNAMTTYPE", "sshPrnamtType"},
    {"PUTCALL", "putCall"},
    {"INVESTMENTDISCRETION", "investmentDiscretion"},
    {"OTHERMANAGER", "otherManager"},
    {"VOTING_AUTH_SOLE", "votingAuthoritySole"},
    {"VOTING_AUTH_SHARED", "votingAuthorityShared"},
    {"VOTING_AUTH_NONE", "votingAuthorityNone"}};

// throws ParseException if there is no ACCESSION_NUMBER column.

StructuredTables ParseStructuredInfoTables(X13::FileContent tsv_content);

StructuredTables LoadStructuredInfoTables(const X13::FileName& tsv_file_name);

std::optional<X13::RawTable> FindStructuredTable(const StructuredTables& tables, const std::string& accession_number);

#endif   // ----- #ifndef _STRUCTUREDINFOTABLE_INC_  -----
