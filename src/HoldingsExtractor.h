// =====================================================================================
//
//       Filename:  HoldingsExtractor.h
//
//    Description:  Run the extraction chain over a set of filings, one
//                  reporting period at a time.
//
//        Version:  1.0
//        Created:  03/13/2024 09:12:44 AM
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

#ifndef  _HOLDINGSEXTRACTOR_INC_
#define  _HOLDINGSEXTRACTOR_INC_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Extractor.h"
#include "Extractors.h"
#include "PeriodFilter.h"
#include "StructuredInfoTable.h"
#include "SubmissionCache.h"

struct SuccessfulPeriod
{
    std::string period_;
    X13::Filing filing_;
    ExtractionResult result_;
};

struct FailedPeriod
{
    std::string period_;
    std::optional<X13::Filing> filing_;     // none if we never got as far as picking one
    std::string reason_;
};

struct RunSummary
{
    std::vector<SuccessfulPeriod> successes_;
    std::vector<FailedPeriod> failures_;
};

// periods are done in order, one at a time. a failure is recorded
// and we go on to the next period.

RunSummary ExtractHoldings(const std::vector<X13::Filing>& filings, const PeriodFilter& period_filter,
                           const ExtractionChain& chain, SubmissionCache& cache,
                           const StructuredTables& structured_tables, const std::shared_ptr<spdlog::logger>& logger);

std::string FormatRunSummary(const RunSummary& summary, const std::string& company);

// first column is the period, then the canonical columns, then the low confidence flag.

std::string HoldingsAsCSV(const std::string& period, const X13::HoldingRecords& records);

#endif   // ----- #ifndef _HOLDINGSEXTRACTOR_INC_  -----
