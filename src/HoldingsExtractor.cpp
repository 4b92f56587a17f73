// =====================================================================================
//
//       Filename:  HoldingsExtractor.cpp
//
//    Description:  Run the extraction chain over a set of filings, one
//                  reporting period at a time.
//
//        Version:  1.0
//        Created:  03/13/2024 09:30:17 AM
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

#include "HoldingsExtractor.h"

#include <exception>

#include <range/v3/algorithm/any_of.hpp>

namespace rng = ranges;

#include "AmendmentResolver.h"
#include "ColumnNormalizer.h"
#include "Extractor_Utils.h"

using namespace std::string_literals;

constexpr auto REPORT_RULE_WIDTH = 80;

namespace
{
    std::string QuoteCSVField(const std::string& field)
    {
        if (! rng::any_of(field, [](char c) { return c == ',' || c == '"' || c == '\n' || c == '\r'; }))
        {
            return field;
        }
        std::string quoted{'"'};
        for (char c : field)
        {
            if (c == '"')
            {
                quoted += '"';
            }
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    void AppendCSVLine(std::string& csv, const std::vector<std::string>& fields)
    {
        for (std::size_t indx = 0; indx < fields.size(); ++indx)
        {
            if (indx > 0)
            {
                csv += ',';
            }
            csv += QuoteCSVField(fields[indx]);
        }
        csv += '\n';
    }
} // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractHoldings
 *  Description:
 * =====================================================================================
 */
RunSummary ExtractHoldings(const std::vector<X13::Filing>& filings, const PeriodFilter& period_filter,
                           const ExtractionChain& chain, SubmissionCache& cache,
                           const StructuredTables& structured_tables, const std::shared_ptr<spdlog::logger>& logger)
{
    auto the_logger = logger ? logger : spdlog::default_logger();

    RunSummary summary;

    auto filings_by_period = BucketFilingsByPeriod(filings, period_filter);

    the_logger->info(catenate("Found: ", filings_by_period.size(), " periods to extract from: ", filings.size(), " filings."));

    for (const auto& [period, period_filings] : filings_by_period)
    {
        std::optional<X13::Filing> chosen_filing;
        try
        {
            chosen_filing = PickAuthoritativeFiling(period_filings);

            the_logger->info(catenate("Period: ", period, " using filing: ", chosen_filing->accession_number,
                        " form: ", chosen_filing->form_name, " filed: ", chosen_filing->date_filed,
                        " from: ", period_filings.size(), " candidates."));

            auto result = chain.Extract(chosen_filing.value(),
                    FindStructuredTable(structured_tables, chosen_filing->accession_number), cache);

            summary.successes_.push_back({period, chosen_filing.value(), std::move(result)});
        }
        catch (const ExtractionExhaustedException& e)
        {
            the_logger->error(catenate("Skipping period: ", period, ". ", e.what()));
            summary.failures_.push_back({period, chosen_filing, e.what()});
        }
        catch (const std::exception& e)
        {
            the_logger->error(catenate("Problem with period: ", period, ". ", e.what()));
            summary.failures_.push_back({period, chosen_filing, e.what()});
        }
    }
    return summary;
} /* -----  end of function ExtractHoldings  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FormatRunSummary
 *  Description:
 * =====================================================================================
 */
std::string FormatRunSummary(const RunSummary& summary, const std::string& company)
{
    const std::string heavy_rule(REPORT_RULE_WIDTH, '=');
    const std::string light_rule(REPORT_RULE_WIDTH, '-');

    std::string report;
    report += catenate(heavy_rule, '\n');
    report += "13F FILINGS PROCESSING REPORT\n";
    report += catenate(heavy_rule, "\n\n");
    report += catenate("Company: ", company, '\n');
    report += catenate("Total periods processed: ", summary.successes_.size() + summary.failures_.size(), '\n');
    report += catenate("Successful: ", summary.successes_.size(), " quarterly filings\n");
    report += catenate("Failed: ", summary.failures_.size(), " quarterly filings\n\n");

    if (! summary.successes_.empty())
    {
        report += "SUCCESSFUL PERIODS:\n";
        report += catenate(light_rule, '\n');
        for (const auto& success : summary.successes_)
        {
            report += catenate("  [OK] ", success.period_, "  ", success.filing_.accession_number, "  ",
                    success.filing_.form_name, "  ", success.result_.records_.size(), " holdings via ",
                    success.result_.strategy_name_, '\n');
        }
        report += '\n';
    }

    if (! summary.failures_.empty())
    {
        report += "FAILED PERIODS:\n";
        report += catenate(light_rule, '\n');
        for (const auto& failure : summary.failures_)
        {
            report += catenate("  [FAIL] ", failure.period_);
            if (failure.filing_)
            {
                report += catenate("  ", failure.filing_->accession_number);
            }
            report += catenate(": ", failure.reason_, '\n');
        }
        report += '\n';
    }

    report += catenate(heavy_rule, '\n');
    return report;
} /* -----  end of function FormatRunSummary  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  HoldingsAsCSV
 *  Description:
 * =====================================================================================
 */
std::string HoldingsAsCSV(const std::string& period, const X13::HoldingRecords& records)
{
    std::string csv;

    std::vector<std::string> header{"period_of_report"};
    header.insert(header.end(), CANONICAL_COLUMNS.begin(), CANONICAL_COLUMNS.end());
    header.emplace_back("low_confidence");
    AppendCSVLine(csv, header);

    for (const auto& record : records)
    {
        std::vector<std::string> fields{period};
        auto record_fields = HoldingRecordFields(record);
        fields.insert(fields.end(), record_fields.begin(), record_fields.end());
        fields.emplace_back(record.low_confidence ? "true" : "false");
        AppendCSVLine(csv, fields);
    }
    return csv;
} /* -----  end of function HoldingsAsCSV  ----- */
