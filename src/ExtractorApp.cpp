// =====================================================================================
//
//       Filename:  ExtractorApp.cpp
//
//    Description:  main application
//
//        Version:  2.0
//        Created:  04/23/2018 09:50:10 AM
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

//--------------------------------------------------------------------------------------
//       Class:  ExtractorApp
//      Method:  ExtractorApp
// Description:  constructor
//--------------------------------------------------------------------------------------

#include "ExtractorApp.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <range/v3/action/transform.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>

#include "date/tz.h"

#include "spdlog/sinks/basic_file_sink.h"

#include "SEC_Header.h"
#include "StructuredInfoTable.h"
#include "SubmissionCache.h"

using namespace std::string_literals;

namespace
{
    // CIKs show up with and without leading zeros.

    std::string TrimLeadingZeros(const std::string& CIK)
    {
        auto first_non_zero = CIK.find_first_not_of('0');
        return first_non_zero == std::string::npos ? "0"s : CIK.substr(first_non_zero);
    }

    void WriteTextFile(const fs::path& file_name, X13::sv content)
    {
        std::ofstream output{file_name, std::ios::out | std::ios::binary | std::ios::trunc};
        if (! output)
        {
            throw ExtractorException(catenate("Unable to open output file: ", file_name));
        }
        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        output.close();
        if (! output)
        {
            throw ExtractorException(catenate("Problem writing output file: ", file_name));
        }
    }
} // namespace

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ExtractorApp
 *      Method:  ExtractorApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ExtractorApp::ExtractorApp (int argc, char* argv[])
    : mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method ExtractorApp::ExtractorApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ExtractorApp
 *      Method:  ExtractorApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ExtractorApp::ExtractorApp (const std::vector<std::string>& tokens)
    : tokens_{tokens}
{
}  /* -----  end of method ExtractorApp::ExtractorApp  (constructor)  ----- */

void ExtractorApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().c_str());
            spdlog::set_default_logger(logger_);
        }
    }
    if (! logger_)
    {
        logger_ = spdlog::default_logger();
    }

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }
}		/* -----  end of method ExtractorApp::ConfigureLogging  ----- */

bool ExtractorApp::Startup()
{
    spdlog::info(catenate("\n\n*** Begin run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
    bool result{true};
	try
	{
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ConfigureLogging();
		result = CheckArgs ();
	}
	catch(std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method ExtractorApp::Startup  ----- */

void ExtractorApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("form-dir", po::value<X13::FileName>(&local_form_file_directory_)->required(),
         "directory of 13F submission files. Searched recursively for '.txt' files. Also our cache.")
		("output-dir", po::value<X13::FileName>(&output_directory_)->required(),
         "directory to write holdings, failed submissions and report to.")
		("CIK",	po::value<std::string>(&CIK_),
         "CIK[s] we are processing. May be comma-delimited list. Default is all.")
		("years", po::value<std::string>(&years_),
         "years of period of report to extract. May be comma-delimited list.")
		("quarters", po::value<std::string>(&quarters_),
         "quarters to extract, like '2013Q1'. May be comma-delimited list.")
		("begin-date", po::value<std::string>(&this->start_date_), "extract periods ending on or after this date.")
		("end-date", po::value<std::string>(&this->stop_date_), "extract periods ending on or before this date.")
		("strategies", po::value<std::string>(&strategy_names_),
         "extraction methods to use. Comma-delimited list of 'structured-object', 'SGML/XML', 'embedded-markup', 'fixed-width'. Default is all.")
		("infotable-file", po::value<X13::FileName>(&infotable_file_name_),
         "path to SEC Form 13F data set INFOTABLE.tsv file.")
		("voting-margin", po::value<int>(&voting_margin_)->default_value(static_cast<int>(VOTING_COLUMN_MARGIN)),
         "width to assume for voting authority columns we can't find in fixed-width tables.")
		("company", po::value<std::string>(&company_)->default_value("13F"), "prefix for output file names.")
		("per-year-combined", po::value<bool>(&per_year_combined_)->default_value(false)->implicit_value(true),
            "also write all holdings for each year to 1 file. Default is 'false'")
		("master-combined", po::value<bool>(&master_combined_)->default_value(false)->implicit_value(true),
            "also write all holdings to 1 file. Default is 'false'")
		("log-level,l", po::value<std::string>(&logging_level_),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<X13::FileName>(&log_file_path_name_),	"path name for log file.")
		;
}		/* -----  end of method ExtractorApp::SetupProgramOptions  ----- */

void ExtractorApp::ParseProgramOptions ()
{
	auto options = po::parse_command_line(mArgc, mArgv, *mNewOptions);
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);

}		/* -----  end of method ExtractorApp::ParseProgramOptions  ----- */

void ExtractorApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);
}		/* -----  end of method ExtractorApp::ParseProgramOptions  ----- */

bool ExtractorApp::CheckArgs ()
{
    BOOST_ASSERT_MSG(logging_level_ == "none" || logging_level_ == "error" || logging_level_ == "information"
            || logging_level_ == "debug", "log-level must be: 'none|error|information|debug'.");

    BOOST_ASSERT_MSG(fs::exists(local_form_file_directory_.get()), catenate("Can't find SEC file directory: ",
                local_form_file_directory_.get()).c_str());
    BOOST_ASSERT_MSG(fs::is_directory(local_form_file_directory_.get()),
            catenate("Path: ", local_form_file_directory_.get(), " is not a directory.").c_str());

    BOOST_ASSERT_MSG(! output_directory_.get().empty(), "Must specify output directory.");
    BOOST_ASSERT_MSG(! company_.empty(), "Company name can't be empty.");
    BOOST_ASSERT_MSG(voting_margin_ > 0, "Voting margin must be positive.");

    // we use the company name as part of our file names so we can't have the '/' character in it.

    company_ |= ranges::actions::transform([](char c) { return (c == '/' ? '-' : c); });

    //  the user may specify multiple CIKs, years and quarters in comma delimited lists.

    if (! CIK_.empty())
    {
        CIK_list_ = split_string<std::string>(CIK_, ',');
        BOOST_ASSERT_MSG(ranges::all_of(CIK_list_, [](const auto& e)
                    { return ! e.empty() && e.size() <= 10 && ranges::all_of(e, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }); }),
                "All CIKs must be numeric and no more than 10 digits in length.");
        CIK_list_ |= ranges::actions::transform(TrimLeadingZeros);
    }

    if (! years_.empty())
    {
        year_list_ = split_string<std::string>(years_, ',');
    }

    if (! quarters_.empty())
    {
        quarter_list_ = split_string<std::string>(quarters_, ',');
    }

    // this will throw if there is nothing to select on.

    period_filter_.emplace(year_list_, quarter_list_, start_date_, stop_date_);

    std::vector<std::string> strategy_list;
    if (! strategy_names_.empty())
    {
        strategy_list = split_string<std::string>(strategy_names_, ',');
    }
    strategies_ = SelectStrategies(strategy_list, static_cast<std::size_t>(voting_margin_));

    if (! infotable_file_name_.get().empty())
    {
        BOOST_ASSERT_MSG(fs::exists(infotable_file_name_.get()),
                catenate("Can't find file: ", infotable_file_name_.get()).c_str());
        BOOST_ASSERT_MSG(fs::is_regular_file(infotable_file_name_.get()),
                catenate("Path: ", infotable_file_name_.get(), " is not a regular file.").c_str());
    }

    return true;
}       // -----  end of method ExtractorApp::CheckArgs  -----

bool ExtractorApp::FilingIsWanted (const X13::Filing& filing) const
{
    // we only want the 13F family.

    if (! filing.form_name.starts_with("13F"))
    {
        return false;
    }
    if (CIK_list_.empty())
    {
        return true;
    }
    return ranges::find(CIK_list_, TrimLeadingZeros(filing.cik)) != CIK_list_.end();
}		/* -----  end of method ExtractorApp::FilingIsWanted  ----- */

int ExtractorApp::BuildListOfFilings ()
{
    filings_.clear();
    submission_files_.clear();

    int skipped_counter{0};

    for (const auto& dir_ent : fs::recursive_directory_iterator(local_form_file_directory_.get()))
    {
        if (! dir_ent.is_regular_file() || dir_ent.path().extension() != ".txt")
        {
            continue;
        }
        try
        {
            const std::string file_content_text = LoadDataFileForUse(X13::FileName{dir_ent.path()});

            SEC_Header SEC_data;
            SEC_data.UseData(X13::FileContent{file_content_text});
            SEC_data.ExtractHeaderFields();
            auto filing = SEC_data.GetFiling();

            if (! FilingIsWanted(filing))
            {
                ++skipped_counter;
                continue;
            }

            // our cache lives in the same directory so we may see a submission twice.

            if (submission_files_.contains(filing.accession_number))
            {
                continue;
            }
            submission_files_[filing.accession_number] = dir_ent.path();
            filings_.push_back(std::move(filing));
        }
        catch (const std::exception& e)
        {
            spdlog::error(catenate("Problem reading submission: ", dir_ent.path(), ". ", e.what()));
            ++skipped_counter;
        }
    }

    spdlog::info(catenate("Found: ", filings_.size(), " 13F filings to consider. Skipped: ", skipped_counter, " files."));
    return skipped_counter;
}		/* -----  end of method ExtractorApp::BuildListOfFilings  ----- */

std::tuple<int, int, int> ExtractorApp::Run()
{
    auto skipped_counter = BuildListOfFilings();

    if (! infotable_file_name_.get().empty())
    {
        structured_tables_ = LoadStructuredInfoTables(infotable_file_name_);
    }

    // anything not already at its cached location is copied there from where we found it.

    SubmissionCache cache{local_form_file_directory_, [this](const X13::Filing& filing)
        {
            auto found = submission_files_.find(filing.accession_number);
            if (found == submission_files_.end())
            {
                throw ExtractorException(catenate("No submission file for: ", filing.accession_number));
            }
            return LoadDataFileForUse(X13::FileName{found->second});
        }};

    ExtractionChain chain{strategies_, logger_};

    auto summary = ExtractHoldings(filings_, period_filter_.value(), chain, cache, structured_tables_, logger_);

    WriteResults(summary, cache);

    std::tuple<int, int, int> counters{static_cast<int>(summary.successes_.size()), skipped_counter,
        static_cast<int>(summary.failures_.size())};

    auto [success_counter, skips, error_counter] = counters;

    spdlog::info(catenate("Processed: ", SumT(counters), " items. Successful periods: ",
            success_counter, ". Skipped files: ", skips , ". Failed periods: ", error_counter, "."));

    return counters;
}		/* -----  end of method ExtractorApp::Run  ----- */

fs::path ExtractorApp::OutputPathFor (const std::string& suffix) const
{
    return output_directory_.get() / catenate(company_, '_', suffix);
}		/* -----  end of method ExtractorApp::OutputPathFor  ----- */

void ExtractorApp::WriteResults (const RunSummary& summary, SubmissionCache& cache)
{
    fs::create_directories(output_directory_.get());

    for (const auto& success : summary.successes_)
    {
        auto output_file_name = OutputPathFor(catenate(success.period_, ".csv"));
        WriteTextFile(output_file_name, HoldingsAsCSV(success.period_, success.result_.records_));
        spdlog::info(catenate("Saved: ", output_file_name, " (", success.result_.records_.size(), " holdings)"));
    }

    for (const auto& failure : summary.failures_)
    {
        WriteFailedSubmission(failure, cache);
    }

    WriteCombinedFiles(summary);

    auto report_file_name = OutputPathFor("REPORT.txt");
    WriteTextFile(report_file_name, FormatRunSummary(summary, company_));
    spdlog::info(catenate("Report saved to: ", report_file_name));
}		/* -----  end of method ExtractorApp::WriteResults  ----- */

void ExtractorApp::WriteFailedSubmission (const FailedPeriod& failure, SubmissionCache& cache)
{
    if (! failure.filing_)
    {
        return;
    }

    // keep the raw submission for someone to look at.

    try
    {
        auto raw_text = cache.Retrieve(failure.filing_.value());
        fs::path failed_dir = output_directory_.get() / "failed";
        fs::create_directories(failed_dir);
        auto failed_file_name = failed_dir / catenate(company_, '_', failure.period_, ".txt");
        WriteTextFile(failed_file_name, raw_text);
        spdlog::debug(catenate("Saved failed filing to: ", failed_file_name));
    }
    catch (const std::exception& e)
    {
        spdlog::error(catenate("Could not save failed filing for period: ", failure.period_, ". ", e.what()));
    }
}		/* -----  end of method ExtractorApp::WriteFailedSubmission  ----- */

void ExtractorApp::WriteCombinedFiles (const RunSummary& summary)
{
    if (! (per_year_combined_ || master_combined_) || summary.successes_.empty())
    {
        return;
    }

    // periods are in order so each year's periods are together.

    std::map<std::string, std::string> by_year;
    std::string master;

    for (const auto& success : summary.successes_)
    {
        auto csv = HoldingsAsCSV(success.period_, success.result_.records_);
        auto year = success.period_.substr(0, 4);

        auto append_csv = [&csv](std::string& combined)
        {
            if (combined.empty())
            {
                combined = csv;
            }
            else
            {
                // drop the column names from all but the first.

                combined += csv.substr(csv.find('\n') + 1);
            }
        };
        append_csv(by_year[year]);
        append_csv(master);
    }

    if (per_year_combined_)
    {
        for (const auto& [year, combined] : by_year)
        {
            auto output_file_name = OutputPathFor(catenate(year, ".csv"));
            WriteTextFile(output_file_name, combined);
            spdlog::info(catenate("Year combined saved: ", output_file_name));
        }
    }
    if (master_combined_)
    {
        auto output_file_name = OutputPathFor("MASTER.csv");
        WriteTextFile(output_file_name, master);
        spdlog::info(catenate("Master combined saved: ", output_file_name));
    }
}		/* -----  end of method ExtractorApp::WriteCombinedFiles  ----- */

void ExtractorApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method ExtractorApp::Shutdown  -----
