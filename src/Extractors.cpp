// =====================================================================================
//
//       Filename:  Extractors.cpp
//
//    Description:  The set of ways we know to pull a holdings table out of a
//                  13F submission and the chain which tries them in turn.
//
//      Inputs:
//
//        Version:  2.0
//        Created:  03/20/2018
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================
//

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

#include "Extractors.h"

#include <algorithm>
#include <exception>

#include <boost/algorithm/string/predicate.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>

namespace rng = ranges;

#include "FixedWidthTableParser.h"
#include "InfoTable_XML.h"
#include "TablesFromFile.h"

using namespace std::string_literals;

X13::sv OutcomeKindName(OutcomeKind kind)
{
    switch (kind)
    {
        case OutcomeKind::e_NotApplicable:
            return "not applicable";
        case OutcomeKind::e_Failed:
            return "failed";
        case OutcomeKind::e_Succeeded:
            return "succeeded";
    }
    return "unknown";
} /* -----  end of function OutcomeKindName  ----- */

X13::FileContent FilingSource::GetRawText ()
{
    if (raw_text_)
    {
        return X13::FileContent{raw_text_.value()};
    }

    // one try only. later strategies see the same failure.

    if (retrieval_error_)
    {
        throw ExtractorException(retrieval_error_.value());
    }
    try
    {
        raw_text_ = cache_.Retrieve(filing_);
    }
    catch (const std::exception& e)
    {
        retrieval_error_ = catenate("Unable to retrieve submission text: ", e.what());
        throw ExtractorException(retrieval_error_.value());
    }
    return X13::FileContent{raw_text_.value()};
}		/* -----  end of method FilingSource::GetRawText  ----- */

StrategyOutcome StructuredObjectStrategy::operator() (FilingSource& source) const
{
    const auto& structured_table = source.GetStructuredTable();
    if (! structured_table)
    {
        return {OutcomeKind::e_NotApplicable, {}, "no structured information table for this filing"};
    }
    if (structured_table->empty())
    {
        return {OutcomeKind::e_Failed, {}, "structured information table is empty"};
    }
    const auto width = structured_table->columns_.size();
    if (rng::any_of(structured_table->rows_, [width](const auto& row) { return row.size() != width; }))
    {
        throw ParseException(catenate("Structured information table for: ", source.GetFiling().accession_number,
                    " has rows which don't match its: ", width, " columns."));
    }
    return {OutcomeKind::e_Succeeded, structured_table.value(), ""};
}		/* -----  end of method StructuredObjectStrategy::operator()  ----- */

StrategyOutcome SGML_XML_Strategy::operator() (FilingSource& source) const
{
    auto raw_text = source.GetRawText();
    if (! boost::algorithm::icontains(raw_text.get(), "<xml>"))
    {
        return {OutcomeKind::e_NotApplicable, {}, "submission has no XML documents"};
    }

    auto document_sections = LocateDocumentSections(raw_text);
    auto info_table_content = LocateInfoTableDocument(document_sections);
    if (info_table_content.get().empty())
    {
        return {OutcomeKind::e_NotApplicable, {}, "no XML information table document"};
    }

    auto info_table_xml = ParseXMLContent(info_table_content);
    auto table = ExtractInfoTableRows(info_table_xml);
    if (table.empty())
    {
        return {OutcomeKind::e_Failed, {}, "XML information table has no infoTable entries"};
    }
    return {OutcomeKind::e_Succeeded, std::move(table), ""};
}		/* -----  end of method SGML_XML_Strategy::operator()  ----- */

StrategyOutcome EmbeddedMarkupStrategy::operator() (FilingSource& source) const
{
    auto raw_text = source.GetRawText();
    if (! boost::algorithm::icontains(raw_text.get(), "<table"))
    {
        return {OutcomeKind::e_NotApplicable, {}, "submission has no markup tables"};
    }

    auto block = ExtractInfoTableBlock(raw_text);
    auto table = ExtractMarkupHoldingsTable(block, raw_text);
    return {OutcomeKind::e_Succeeded, std::move(table), ""};
}		/* -----  end of method EmbeddedMarkupStrategy::operator()  ----- */

StrategyOutcome FixedWidthStrategy::operator() (FilingSource& source) const
{
    auto raw_text = source.GetRawText();
    auto block = ExtractInfoTableBlock(raw_text);
    auto table = ParseFixedWidthTable(block, voting_margin_);
    return {OutcomeKind::e_Succeeded, std::move(table), ""};
}		/* -----  end of method FixedWidthStrategy::operator()  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  SelectStrategies
 *  Description:
 * =====================================================================================
 */
StrategyList SelectStrategies(const std::vector<std::string>& strategy_names, std::size_t voting_margin)
{
    for (const auto& name : strategy_names)
    {
        if (rng::find(STRATEGY_NAMES, name) == STRATEGY_NAMES.end())
        {
            throw ConfigException(catenate("Unknown extraction strategy: '", name,
                        "'. Must be one of: structured-object, SGML/XML, embedded-markup, fixed-width."));
        }
    }

    auto wanted = [&strategy_names](const std::string& name)
    {
        return strategy_names.empty() || rng::find(strategy_names, name) != strategy_names.end();
    };

    // regardless of how the user listed them, they go in our order.

    StrategyList strategies;

    if (wanted("structured-object"))
    {
        strategies.emplace_back(StructuredObjectStrategy{});
    }
    if (wanted("SGML/XML"))
    {
        strategies.emplace_back(SGML_XML_Strategy{});
    }
    if (wanted("embedded-markup"))
    {
        strategies.emplace_back(EmbeddedMarkupStrategy{});
    }
    if (wanted("fixed-width"))
    {
        strategies.emplace_back(FixedWidthStrategy{voting_margin});
    }
    return strategies;
} /* -----  end of function SelectStrategies  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ExtractionExhaustedException
 *      Method:  ExtractionExhaustedException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ExtractionExhaustedException::ExtractionExhaustedException (const X13::Filing& filing, std::vector<StrategyAttempt> attempts)
    : ExtractorException(
        [&filing, &attempts]()
        {
            std::string message = catenate("All extraction strategies failed for filing: ", filing.accession_number,
                    " CIK: ", filing.cik, " period: ", filing.period_of_report, '.');
            for (const auto& attempt : attempts)
            {
                message += catenate("\n\t", attempt.strategy_name_, ": ", OutcomeKindName(attempt.kind_), ": ", attempt.reason_);
            }
            return message;
        }()),
    attempts_{std::move(attempts)}, accession_number_{filing.accession_number}, period_{filing.period_of_report}
{
}  /* -----  end of method ExtractionExhaustedException::ExtractionExhaustedException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ExtractionChain
 *      Method:  ExtractionChain
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ExtractionChain::ExtractionChain (StrategyList strategies, std::shared_ptr<spdlog::logger> logger)
    : strategies_{std::move(strategies)}, logger_{std::move(logger)}
{
    if (! logger_)
    {
        logger_ = spdlog::default_logger();
    }
    BOOST_ASSERT_MSG(! strategies_.empty(), "Must have at least 1 extraction strategy.");
}  /* -----  end of method ExtractionChain::ExtractionChain  (constructor)  ----- */

ExtractionResult ExtractionChain::Extract (const X13::Filing& filing, const std::optional<X13::RawTable>& structured_table,
        SubmissionCache& cache) const
{
    FilingSource source{filing, structured_table, cache};

    std::vector<StrategyAttempt> attempts;

    for (const auto& strategy : strategies_)
    {
        const auto [strategy_name, schema] = std::visit([](const auto& x) { return std::pair{x.strategy_name_, x.schema_}; }, strategy);

        logger_->debug(catenate("Trying strategy: ", strategy_name, " for filing: ", filing.accession_number));

        StrategyOutcome outcome;
        try
        {
            outcome = std::visit([&source](const auto& x) { return x(source); }, strategy);
        }
        catch (const std::exception& e)
        {
            outcome = StrategyOutcome{OutcomeKind::e_Failed, {}, e.what()};
        }

        if (outcome.kind_ == OutcomeKind::e_Succeeded && outcome.table_.empty())
        {
            outcome.kind_ = OutcomeKind::e_Failed;
            outcome.reason_ = "no holdings found";
        }

        if (outcome.kind_ == OutcomeKind::e_Succeeded)
        {
            attempts.push_back({strategy_name, outcome.kind_, ""});

            auto records = NormalizeTable(outcome.table_, schema, logger_);

            logger_->info(catenate("Strategy: ", strategy_name, " found: ", records.size(), " holdings for filing: ",
                        filing.accession_number, " period: ", filing.period_of_report));

            return ExtractionResult{std::move(records), CANONICAL_COLUMNS, strategy_name, std::move(attempts)};
        }

        logger_->info(catenate("Strategy: ", strategy_name, ' ', OutcomeKindName(outcome.kind_), " for filing: ",
                    filing.accession_number, ". ", outcome.reason_));

        attempts.push_back({strategy_name, outcome.kind_, outcome.reason_});
    }

    throw ExtractionExhaustedException(filing, std::move(attempts));
}		/* -----  end of method ExtractionChain::Extract  ----- */
