// =====================================================================================
//
//       Filename:  ColumnNormalizer_Test.cpp
//
//    Description:  Tests for turning raw tables into holding records.
//
//        Version:  1.0
//        Created:  03/15/2024 02:02:19 PM
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


#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "ColumnNormalizer.h"
#include "Extractor_Utils.h"

using namespace testing;

TEST(Counts, ThousandsSeparatorsAreIgnored)
{
    EXPECT_EQ(CoerceToCount("1,234"), 1234);
    EXPECT_EQ(CoerceToCount("1,032,852"), 1032852);
    EXPECT_EQ(CoerceToCount(" 42 "), 42);
    EXPECT_EQ(CoerceToCount("0"), 0);
}

TEST(Counts, AnythingElseIsMissing)
{
    EXPECT_FALSE(CoerceToCount("").has_value());
    EXPECT_FALSE(CoerceToCount("-5").has_value());
    EXPECT_FALSE(CoerceToCount("abc").has_value());
    EXPECT_FALSE(CoerceToCount("12.5").has_value());
    EXPECT_FALSE(CoerceToCount("$100").has_value());
}

TEST(MarkupLabels, KeywordsPickTheColumn)
{
    EXPECT_EQ(CanonicalNameForMarkupLabel("Name of Issuer"), "name");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Title of Class"), "title");
    EXPECT_EQ(CanonicalNameForMarkupLabel("CUSIP"), "cusip");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Market Value (x$1000)"), "value_x1000");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Shrs or Prn Amt"), "shares");
    EXPECT_EQ(CanonicalNameForMarkupLabel("SH/PRN"), "share_unit");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Put/Call"), "put_call");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Investment Discretion"), "discretion");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Other Managers"), "other_managers");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Voting Authority Sole"), "voting_sole");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Voting Authority Shared"), "voting_shared");
    EXPECT_EQ(CanonicalNameForMarkupLabel("Voting Authority None"), "voting_none");
}

TEST(MarkupLabels, UnknownLabels)
{
    EXPECT_FALSE(CanonicalNameForMarkupLabel("Footnote").has_value());
    EXPECT_FALSE(CanonicalNameForMarkupLabel("  --  ").has_value());
}

TEST(ColumnNames, FirstColumnClaimingANameGetsIt)
{
    auto names = MapColumnNames({"CUSIP", "Cusip Number", "Value"}, ColumnSchema::e_Markup);

    EXPECT_THAT(names, ElementsAre(Optional(std::string{"cusip"}), Eq(std::nullopt), Optional(std::string{"value_x1000"})));
}

TEST(ColumnNames, EachSchemaHasItsOwnNames)
{
    EXPECT_THAT(MapColumnNames({"sshPrnamtType"}, ColumnSchema::e_XBRL), ElementsAre(Optional(std::string{"share_unit"})));
    EXPECT_THAT(MapColumnNames({"sh_prn"}, ColumnSchema::e_FixedWidth), ElementsAre(Optional(std::string{"share_unit"})));
    EXPECT_THAT(MapColumnNames({"sh_prn"}, ColumnSchema::e_XBRL), ElementsAre(Eq(std::nullopt)));
}

TEST(Normalize, UnknownColumnsAreKeptAside)
{
    X13::RawTable table;
    table.columns_ = {"nameOfIssuer", "cusip", "value", "votingAuthoritySole", "FIGI"};
    table.rows_.push_back({"APPLE INC", "037833100", "117,446", "887135", "BBG000B9XRY4"});

    auto records = NormalizeTable(table, ColumnSchema::e_XBRL, nullptr);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].name, "APPLE INC");
    EXPECT_EQ(records[0].value_x1000, 117446);
    EXPECT_THAT(records[0].other_fields, ElementsAre(Pair("FIGI", "BBG000B9XRY4")));
    EXPECT_FALSE(records[0].low_confidence);
}

TEST(Normalize, NoVotingNumbersMeansLowConfidence)
{
    X13::RawTable table;
    table.columns_ = {"name", "cusip", "value", "v_sole", "v_shared", "v_none"};
    table.rows_.push_back({"APPLE INC", "037833100", "117446", "", "", ""});
    table.rows_.push_back({"BANK AMER CORP", "060505104", "31244", "n/a", "", "0"});
    table.rows_.push_back({"COCA COLA CO", "191216100", "21936", "abc", "", ""});

    auto records = NormalizeTable(table, ColumnSchema::e_FixedWidth, nullptr);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_TRUE(records[0].low_confidence);
    EXPECT_FALSE(records[1].low_confidence);
    EXPECT_TRUE(records[2].low_confidence);

    // text the same as what we started with.

    EXPECT_EQ(records[0].name, "APPLE INC");
    EXPECT_EQ(records[0].cusip, "037833100");
}

TEST(Normalize, ShortRowsHaveMissingValues)
{
    X13::RawTable table;
    table.columns_ = {"name", "cusip", "value", "v_sole"};
    table.rows_.push_back({"APPLE INC", "037833100"});

    auto records = NormalizeTable(table, ColumnSchema::e_FixedWidth, nullptr);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].value_x1000.has_value());
    EXPECT_TRUE(records[0].low_confidence);
}

TEST(Normalize, RecordFieldsAreInCanonicalOrder)
{
    X13::HoldingRecord record;
    record.name = "APPLE INC";
    record.cusip = "037833100";
    record.value_x1000 = 117446;
    record.voting_none = 0;

    auto fields = HoldingRecordFields(record);

    ASSERT_EQ(fields.size(), CANONICAL_COLUMNS.size());
    EXPECT_THAT(fields, ElementsAre("APPLE INC", "", "037833100", "117446", "", "", "", "", "", "", "", "0"));
}
