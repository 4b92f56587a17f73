// =====================================================================================
//
//       Filename:  Extractors.h
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

#ifndef EXTRACTORS_
#define EXTRACTORS_

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "ColumnNormalizer.h"
#include "Extractor.h"
#include "Extractor_Utils.h"
#include "HeaderLocator.h"
#include "SubmissionCache.h"

enum class OutcomeKind
{
    e_NotApplicable,
    e_Failed,
    e_Succeeded
};

X13::sv OutcomeKindName(OutcomeKind kind);

struct StrategyOutcome
{
    OutcomeKind kind_ = OutcomeKind::e_NotApplicable;
    X13::RawTable table_;
    std::string reason_;
};

// =====================================================================================
//        Class:  FilingSource
//  Description:  what the strategies get to look at for one filing.
//                the raw text is retrieved the first time someone asks for it
//                and never more than once.
// =====================================================================================

class FilingSource
{
public:
    FilingSource(const X13::Filing& filing, const std::optional<X13::RawTable>& structured_table, SubmissionCache& cache)
        : filing_{filing}, structured_table_{structured_table}, cache_{cache}
    {
    }

    [[nodiscard]] const X13::Filing& GetFiling() const { return filing_; }
    [[nodiscard]] const std::optional<X13::RawTable>& GetStructuredTable() const { return structured_table_; }

    X13::FileContent GetRawText();

private:
    const X13::Filing& filing_;
    const std::optional<X13::RawTable>& structured_table_;
    SubmissionCache& cache_;

    std::optional<std::string> raw_text_;
    std::optional<std::string> retrieval_error_;
};

// the strategies. each one knows which naming scheme its table uses.

struct StructuredObjectStrategy
{
    StrategyOutcome operator()(FilingSource& source) const;

    const std::string strategy_name_{"structured-object"};
    const ColumnSchema schema_{ColumnSchema::e_XBRL};
};

struct SGML_XML_Strategy
{
    StrategyOutcome operator()(FilingSource& source) const;

    const std::string strategy_name_{"SGML/XML"};
    const ColumnSchema schema_{ColumnSchema::e_XBRL};
};

struct EmbeddedMarkupStrategy
{
    StrategyOutcome operator()(FilingSource& source) const;

    const std::string strategy_name_{"embedded-markup"};
    const ColumnSchema schema_{ColumnSchema::e_Markup};
};

struct FixedWidthStrategy
{
    explicit FixedWidthStrategy(std::size_t voting_margin = VOTING_COLUMN_MARGIN)
        : voting_margin_{voting_margin}
    {
    }

    StrategyOutcome operator()(FilingSource& source) const;

    const std::string strategy_name_{"fixed-width"};
    const ColumnSchema schema_{ColumnSchema::e_FixedWidth};

    const std::size_t voting_margin_;
};

using StrategyTypes = std::variant<StructuredObjectStrategy, SGML_XML_Strategy, EmbeddedMarkupStrategy, FixedWidthStrategy>;
using StrategyList = std::vector<StrategyTypes>;

// the order here is the order they are always tried in.

inline const std::vector<std::string> STRATEGY_NAMES{"structured-object", "SGML/XML", "embedded-markup", "fixed-width"};

// an empty list means use them all. unknown names throw ConfigException.

StrategyList SelectStrategies(const std::vector<std::string>& strategy_names,
                              std::size_t voting_margin = VOTING_COLUMN_MARGIN);

struct StrategyAttempt
{
    std::string strategy_name_;
    OutcomeKind kind_;
    std::string reason_;
};

struct ExtractionResult
{
    X13::HoldingRecords records_;
    std::vector<std::string> columns_;
    std::string strategy_name_;
    std::vector<StrategyAttempt> attempts_;
};

// nothing worked. the attempts are listed in the order they were made.

class ExtractionExhaustedException : public ExtractorException
{
public:
    ExtractionExhaustedException(const X13::Filing& filing, std::vector<StrategyAttempt> attempts);

    [[nodiscard]] const std::vector<StrategyAttempt>& GetAttempts() const { return attempts_; }
    [[nodiscard]] const std::string& GetAccessionNumber() const { return accession_number_; }
    [[nodiscard]] const std::string& GetPeriod() const { return period_; }

private:
    std::vector<StrategyAttempt> attempts_;
    std::string accession_number_;
    std::string period_;
};

// =====================================================================================
//        Class:  ExtractionChain
//  Description:  try each enabled strategy in order until one gives us a table.
// =====================================================================================

class ExtractionChain
{
public:
    // ====================  LIFECYCLE     =======================================

    ExtractionChain() = delete;
    ExtractionChain(StrategyList strategies, std::shared_ptr<spdlog::logger> logger);

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const StrategyList& GetStrategies() const { return strategies_; }

    // ====================  OPERATORS     =======================================

    ExtractionResult Extract(const X13::Filing& filing, const std::optional<X13::RawTable>& structured_table,
                             SubmissionCache& cache) const;

private:
    // ====================  DATA MEMBERS  =======================================

    StrategyList strategies_;
    std::shared_ptr<spdlog::logger> logger_;

}; // -----  end of class ExtractionChain  -----

#endif /* end of include guard:  EXTRACTORS_*/
