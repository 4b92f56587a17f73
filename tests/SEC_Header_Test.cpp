// =====================================================================================
//
//       Filename:  SEC_Header_Test.cpp
//
//    Description:  Tests for reading the SEC header of a submission.
//
//        Version:  1.0
//        Created:  03/15/2024 02:44:31 PM
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

#include "Extractor_Utils.h"
#include "SEC_Header.h"
#include "TestSubmissions.h"

using namespace testing;

TEST(SECHeader, FieldsOfAnOriginalFiling)
{
    auto submission = FixedWidthSubmission(SubmissionInfo{});

    SEC_Header SEC_data;
    SEC_data.UseData(X13::FileContent{submission});
    SEC_data.ExtractHeaderFields();

    auto filing = SEC_data.GetFiling();
    EXPECT_EQ(filing.cik, "0001067983");
    EXPECT_EQ(filing.form_name, "13F-HR");
    EXPECT_EQ(filing.form_type, X13::FormType::e_13F_HR);
    EXPECT_EQ(filing.date_filed, "2021-02-15");
    EXPECT_EQ(filing.period_of_report, "2020-12-31");
    EXPECT_EQ(filing.accession_number, "0000950123-21-002345");
    EXPECT_EQ(filing.company_name, "BERKSHIRE HATHAWAY INC");
}

TEST(SECHeader, AmendmentFiling)
{
    SubmissionInfo info;
    info.form_type_ = "13F-HR/A";
    info.accession_number_ = "0000950123-21-004567";
    auto submission = XMLSubmission(info);

    SEC_Header SEC_data;
    SEC_data.UseData(X13::FileContent{submission});
    SEC_data.ExtractHeaderFields();

    auto filing = SEC_data.GetFiling();
    EXPECT_EQ(filing.form_name, "13F-HR/A");
    EXPECT_EQ(filing.form_type, X13::FormType::e_13F_HR_A);
    EXPECT_EQ(filing.accession_number, "0000950123-21-004567");
}

TEST(SECHeader, MissingPeriodOfReportIsEmpty)
{
    SubmissionInfo info;
    info.form_type_ = "13F-NT";
    info.period_ = "";
    auto submission = UselessSubmission(info);

    SEC_Header SEC_data;
    SEC_data.UseData(X13::FileContent{submission});
    SEC_data.ExtractHeaderFields();

    auto filing = SEC_data.GetFiling();
    EXPECT_EQ(filing.period_of_report, "");
    EXPECT_EQ(filing.form_type, X13::FormType::e_13F_NT);
}

TEST(SECHeader, WindowsLineEndings)
{
    auto submission = MakeSECHeader(SubmissionInfo{});
    std::string with_returns;
    for (char c : submission)
    {
        if (c == '\n')
        {
            with_returns += '\r';
        }
        with_returns += c;
    }

    SEC_Header SEC_data;
    SEC_data.UseData(X13::FileContent{with_returns});
    SEC_data.ExtractHeaderFields();

    auto filing = SEC_data.GetFiling();
    EXPECT_EQ(filing.cik, "0001067983");
    EXPECT_EQ(filing.form_name, "13F-HR");
    EXPECT_EQ(filing.company_name, "BERKSHIRE HATHAWAY INC");
}

TEST(SECHeader, NoHeaderIsAnError)
{
    const std::string text{"<DOCUMENT>\n<TYPE>13F-HR\n</DOCUMENT>\n"};

    SEC_Header SEC_data;
    EXPECT_THROW(SEC_data.UseData(X13::FileContent{text}), AssertionException);
}

TEST(SECHeader, FieldsMustBeExtractedFirst)
{
    SEC_Header SEC_data;
    EXPECT_THROW(SEC_data.GetFiling(), AssertionException);
}
