// =====================================================================================
//
//       Filename:  ExtractorApp_Test.cpp
//
//    Description:  Tests for the whole program, from form directory to output files.
//
//        Version:  1.0
//        Created:  03/15/2024 05:22:31 PM
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

#include <algorithm>
#include <string>
#include <vector>

#include "ExtractorApp.h"
#include "Extractor_Utils.h"
#include "TestSubmissions.h"

using namespace testing;

namespace
{
    const SubmissionInfo Q1{"0000950123-20-000100", "13F-HR", "20200331", "20200515"};
    const SubmissionInfo Q2{"0000950123-20-000150", "13F-HR", "20200630", "20200814"};
    const SubmissionInfo Q4{"0000950123-21-000200", "13F-HR", "20201231", "20210212"};

    const SubmissionInfo SOMEONE_ELSE{"0000102909-20-000300", "13F-HR", "20200930", "20201110", "0000102909",
        "VANGUARD GROUP INC"};
    const SubmissionInfo NOT_A_13F{"0001193125-20-000400", "10-K", "20201231", "20210225"};

    std::string ReadTestFile(const fs::path& file_name)
    {
        return LoadDataFileForUse(X13::FileName{file_name});
    }
} // namespace

class ExtractorAppTest : public Test
{
protected:
    ExtractorAppTest()
        : form_dir_{"ExtractorAppTest_forms"}, output_dir_{"ExtractorAppTest_output"}
    {
        const auto berkshire = form_dir_.get() / "downloads" / "berkshire";
        WriteTestFile(berkshire / "q1.txt", XMLSubmission(Q1));
        WriteTestFile(berkshire / "q2.txt", UselessSubmission(Q2));
        WriteTestFile(berkshire / "q4.txt", FixedWidthSubmission(Q4));
        WriteTestFile(berkshire / "annual_report.txt", UselessSubmission(NOT_A_13F));
        WriteTestFile(berkshire / "README.md", "not a submission\n");
        WriteTestFile(form_dir_.get() / "downloads" / "vanguard" / "q3.txt", MarkupSubmission(SOMEONE_ELSE));
        WriteTestFile(form_dir_.get() / "downloads" / "garbage.txt", "this is not an SEC submission\n");
    }

    [[nodiscard]] std::vector<std::string> Options(const std::vector<std::string>& extra) const
    {
        std::vector<std::string> tokens{"--form-dir", form_dir_.get().string(), "--output-dir", output_dir_.get().string(),
            "--company", "BRK", "-l", "error"};
        tokens.insert(tokens.end(), extra.begin(), extra.end());
        return tokens;
    }

    TempDirectory form_dir_;
    TempDirectory output_dir_;
};

TEST_F(ExtractorAppTest, ExtractEveryPeriodOfAYear)
{
    ExtractorApp myApp(Options({"--CIK", "1067983", "--years", "2020"}));

    ASSERT_TRUE(myApp.Startup());
    auto [successes, skipped, failures] = myApp.Run();
    myApp.Shutdown();

    // the other company, the 10-K and the garbage.

    EXPECT_EQ(successes, 2);
    EXPECT_EQ(skipped, 3);
    EXPECT_EQ(failures, 1);

    const auto q1_file = output_dir_.get() / "BRK_2020-03-31.csv";
    const auto q4_file = output_dir_.get() / "BRK_2020-12-31.csv";
    ASSERT_TRUE(fs::exists(q1_file));
    ASSERT_TRUE(fs::exists(q4_file));
    EXPECT_FALSE(fs::exists(output_dir_.get() / "BRK_2020-06-30.csv"));
    EXPECT_FALSE(fs::exists(output_dir_.get() / "BRK_2020-09-30.csv"));

    auto q1_lines = split_string<std::string>(ReadTestFile(q1_file), '\n');
    ASSERT_EQ(q1_lines.size(), 4u);
    EXPECT_THAT(q1_lines[0], StartsWith("period_of_report,name,title,cusip"));
    EXPECT_THAT(q1_lines[1], StartsWith("2020-03-31,APPLE INC,"));

    auto q4_lines = split_string<std::string>(ReadTestFile(q4_file), '\n');
    EXPECT_EQ(q4_lines.size(), 5u);

    // not combined unless asked.

    EXPECT_FALSE(fs::exists(output_dir_.get() / "BRK_2020.csv"));
    EXPECT_FALSE(fs::exists(output_dir_.get() / "BRK_MASTER.csv"));
}

TEST_F(ExtractorAppTest, FailedPeriodsKeepTheirSubmission)
{
    ExtractorApp myApp(Options({"--CIK", "0001067983", "--quarters", "2020Q2"}));

    ASSERT_TRUE(myApp.Startup());
    auto [successes, skipped, failures] = myApp.Run();

    EXPECT_EQ(successes, 0);
    EXPECT_EQ(failures, 1);

    const auto failed_file = output_dir_.get() / "failed" / "BRK_2020-06-30.txt";
    ASSERT_TRUE(fs::exists(failed_file));
    EXPECT_EQ(ReadTestFile(failed_file), UselessSubmission(Q2));

    auto report = ReadTestFile(output_dir_.get() / "BRK_REPORT.txt");
    EXPECT_THAT(report, HasSubstr("Company: BRK\n"));
    EXPECT_THAT(report, HasSubstr("Failed: 1 quarterly filings\n"));
    EXPECT_THAT(report, HasSubstr("  [FAIL] 2020-06-30  0000950123-20-000150: "));
}

TEST_F(ExtractorAppTest, SubmissionsAreCopiedToTheCache)
{
    ExtractorApp myApp(Options({"--CIK", "1067983", "--years", "2020"}));

    ASSERT_TRUE(myApp.Startup());
    myApp.Run();

    const auto cache_dir = form_dir_.get() / "0001067983";
    EXPECT_TRUE(fs::exists(cache_dir / "0000950123-20-000100.txt"));
    EXPECT_TRUE(fs::exists(cache_dir / "0000950123-20-000150.txt"));
    EXPECT_TRUE(fs::exists(cache_dir / "0000950123-21-000200.txt"));

    // a second run sees each submission twice but uses it once.

    ExtractorApp myApp2(Options({"--CIK", "1067983", "--years", "2020"}));

    ASSERT_TRUE(myApp2.Startup());
    auto [successes, skipped, failures] = myApp2.Run();

    EXPECT_EQ(successes, 2);
    EXPECT_EQ(skipped, 3);
    EXPECT_EQ(failures, 1);
}

TEST_F(ExtractorAppTest, AllCompaniesWhenNoCIKGiven)
{
    ExtractorApp myApp(Options({"--begin-date", "2020-07-01", "--end-date", "2020-09-30"}));

    ASSERT_TRUE(myApp.Startup());
    auto [successes, skipped, failures] = myApp.Run();

    // just the 10-K and the garbage.

    EXPECT_EQ(successes, 1);
    EXPECT_EQ(skipped, 2);
    EXPECT_EQ(failures, 0);

    auto report = ReadTestFile(output_dir_.get() / "BRK_REPORT.txt");
    EXPECT_THAT(report, HasSubstr("  [OK] 2020-09-30  0000102909-20-000300  13F-HR  2 holdings via embedded-markup\n"));
}

TEST_F(ExtractorAppTest, CombinedFiles)
{
    ExtractorApp myApp(Options({"--CIK", "1067983", "--years", "2019,2020", "--per-year-combined", "--master-combined"}));

    ASSERT_TRUE(myApp.Startup());
    myApp.Run();

    const auto year_file = output_dir_.get() / "BRK_2020.csv";
    const auto master_file = output_dir_.get() / "BRK_MASTER.csv";
    ASSERT_TRUE(fs::exists(year_file));
    ASSERT_TRUE(fs::exists(master_file));
    EXPECT_FALSE(fs::exists(output_dir_.get() / "BRK_2019.csv"));

    // 1 set of column names, 2 XML holdings, 3 fixed-width holdings.

    auto year_lines = split_string<std::string>(ReadTestFile(year_file), '\n');
    ASSERT_EQ(year_lines.size(), 7u);
    EXPECT_THAT(year_lines[0], StartsWith("period_of_report,"));
    EXPECT_THAT(year_lines[1], StartsWith("2020-03-31,"));
    EXPECT_THAT(year_lines[5], StartsWith("2020-12-31,"));
    EXPECT_EQ(std::count(year_lines.begin(), year_lines.end(), year_lines[0]), 1);

    EXPECT_EQ(ReadTestFile(master_file), ReadTestFile(year_file));
}

TEST_F(ExtractorAppTest, StructuredDataSetFillsTheGap)
{
    const auto tsv_file = form_dir_.get() / "INFOTABLE.tsv";
    WriteTestFile(tsv_file,
        "ACCESSION_NUMBER\tNAMEOFISSUER\tTITLEOFCLASS\tCUSIP\tVALUE\tSSHPRNAMT\tSSHPRNAMTTYPE\n"
        "0000950123-20-000150\tAPPLE INC\tCOM\t037833100\t117446\t887135\tSH\n");

    ExtractorApp myApp(Options({"--CIK", "1067983", "--years", "2020", "--infotable-file", tsv_file.string()}));

    ASSERT_TRUE(myApp.Startup());
    auto [successes, skipped, failures] = myApp.Run();

    EXPECT_EQ(successes, 3);
    EXPECT_EQ(failures, 0);
    EXPECT_FALSE(fs::exists(output_dir_.get() / "failed"));

    auto report = ReadTestFile(output_dir_.get() / "BRK_REPORT.txt");
    EXPECT_THAT(report, HasSubstr("  [OK] 2020-06-30  0000950123-20-000150  13F-HR  1 holdings via structured-object\n"));
}

TEST_F(ExtractorAppTest, OnlyTheChosenStrategies)
{
    ExtractorApp myApp(Options({"--CIK", "1067983", "--years", "2020", "--strategies", "fixed-width"}));

    ASSERT_TRUE(myApp.Startup());
    auto [successes, skipped, failures] = myApp.Run();

    // fixed-width can't read the XML submission.

    EXPECT_EQ(successes, 1);
    EXPECT_EQ(failures, 2);

    auto report = ReadTestFile(output_dir_.get() / "BRK_REPORT.txt");
    EXPECT_THAT(report, HasSubstr("  [OK] 2020-12-31  0000950123-21-000200  13F-HR  3 holdings via fixed-width\n"));
    EXPECT_THAT(report, HasSubstr("  [FAIL] 2020-03-31  0000950123-20-000100: "));
}

TEST_F(ExtractorAppTest, NeedSomethingToSelectPeriodsOn)
{
    ExtractorApp myApp(Options({"--CIK", "1067983"}));

    EXPECT_FALSE(myApp.Startup());
}

TEST_F(ExtractorAppTest, UnknownStrategyIsRejected)
{
    ExtractorApp myApp(Options({"--years", "2020", "--strategies", "SGML/XML,guesswork"}));

    EXPECT_FALSE(myApp.Startup());
}

TEST_F(ExtractorAppTest, BadCIKIsRejected)
{
    ExtractorApp myApp(Options({"--years", "2020", "--CIK", "BRK"}));

    EXPECT_FALSE(myApp.Startup());
}

TEST_F(ExtractorAppTest, BadLogLevelIsRejected)
{
    ExtractorApp myApp(std::vector<std::string>{"--form-dir", form_dir_.get().string(), "--output-dir",
        output_dir_.get().string(), "--years", "2020", "-l", "chatty"});

    EXPECT_FALSE(myApp.Startup());
}

TEST(ExtractorAppStartup, FormDirectoryMustExist)
{
    TempDirectory output_dir{"ExtractorAppStartup_output"};

    ExtractorApp myApp(std::vector<std::string>{"--form-dir", "/not/a/real/directory", "--output-dir", output_dir.get().string(),
        "--years", "2020", "-l", "error"});

    EXPECT_FALSE(myApp.Startup());
}

TEST(ExtractorAppStartup, FormDirectoryIsRequired)
{
    ExtractorApp myApp(std::vector<std::string>{"--output-dir", "/tmp", "--years", "2020"});

    EXPECT_FALSE(myApp.Startup());
}
