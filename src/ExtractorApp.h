// =====================================================================================
//
//       Filename:  ExtractorApp.h
//
//    Description:  main application
//
//        Version:  2.0
//        Created:  04/23/2018 09:40:53 AM
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

// =====================================================================================
//        Class:  ExtractorApp
//  Description:  finds the 13F submissions in a directory, picks one per
//                period and writes out the holdings for each.
// =====================================================================================

#ifndef EXTRACTORAPP_H_
#define EXTRACTORAPP_H_

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "Extractor.h"
#include "Extractor_Utils.h"
#include "Extractors.h"
#include "HoldingsExtractor.h"
#include "PeriodFilter.h"

class ExtractorApp
{
public:
    ExtractorApp(int argc, char *argv[]);

    // use ctor below for testing with predefined options

    explicit ExtractorApp(const std::vector<std::string> &tokens);

    ExtractorApp() = delete;
    ExtractorApp(const ExtractorApp &rhs) = delete;
    ExtractorApp(ExtractorApp &&rhs) = delete;

    ~ExtractorApp() = default;

    ExtractorApp &operator=(const ExtractorApp &rhs) = delete;
    ExtractorApp &operator=(ExtractorApp &&rhs) = delete;

    bool Startup();

    // counters are: successful periods, skipped files, failed periods.

    std::tuple<int, int, int> Run();
    void Shutdown();

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);

    void ConfigureLogging();

    bool CheckArgs();

    int BuildListOfFilings();
    bool FilingIsWanted(const X13::Filing &filing) const;

    void WriteResults(const RunSummary &summary, SubmissionCache &cache);
    void WriteFailedSubmission(const FailedPeriod &failure, SubmissionCache &cache);
    void WriteCombinedFiles(const RunSummary &summary);

    [[nodiscard]] fs::path OutputPathFor(const std::string &suffix) const;

    // ====================  DATA MEMBERS  =======================================

private:
    // ====================  DATA MEMBERS  =======================================

    po::positional_options_description mPositional;       //	old style options
    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    std::string start_date_;
    std::string stop_date_;
    std::string years_;
    std::string quarters_;
    std::string CIK_;
    std::string strategy_names_;
    std::string company_{"13F"};
    std::string logging_level_{"information"};

    std::vector<std::string> CIK_list_;
    std::vector<std::string> year_list_;
    std::vector<std::string> quarter_list_;

    std::optional<PeriodFilter> period_filter_;
    StrategyList strategies_;
    StructuredTables structured_tables_;

    // what we found in the form directory.

    std::vector<X13::Filing> filings_;
    std::map<std::string, fs::path> submission_files_;

    X13::FileName log_file_path_name_;
    X13::FileName local_form_file_directory_;
    X13::FileName output_directory_;
    X13::FileName infotable_file_name_;

    std::shared_ptr<spdlog::logger> logger_;

    int voting_margin_{static_cast<int>(VOTING_COLUMN_MARGIN)};

    bool per_year_combined_{false};
    bool master_combined_{false};

}; // -----  end of class ExtractorApp  -----

#endif /* EXTRACTORAPP_H_ */
