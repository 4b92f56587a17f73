// =====================================================================================
//
//       Filename:  SubmissionCache.h
//
//    Description:  Keep a local copy of each full submission text so we
//                  only ever have to retrieve it once.
//
//        Version:  1.0
//        Created:  03/11/2024 02:14:37 PM
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

#ifndef  _SUBMISSIONCACHE_INC_
#define  _SUBMISSIONCACHE_INC_

#include <functional>
#include <string>

#include "Extractor.h"

// whoever knows how to get a submission we don't have yet.

using SubmissionFetcher = std::function<std::string(const X13::Filing&)>;

// =====================================================================================
//        Class:  SubmissionCache
//  Description:  submissions live at <cache dir>/<cik>/<accession number>.txt
// =====================================================================================

class SubmissionCache
{
public:
    // ====================  LIFECYCLE     =======================================

    SubmissionCache() = delete;
    explicit SubmissionCache(const X13::FileName& cache_directory, SubmissionFetcher fetcher = {});

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] X13::FileName PathFor(const X13::Filing& filing) const;
    [[nodiscard]] bool Contains(const X13::Filing& filing) const;
    [[nodiscard]] int GetFetchCount() const { return fetch_count_; }

    // ====================  MUTATORS      =======================================

    // load from disk if we have it, else fetch it and save it.
    // without a fetcher, a miss throws ExtractorException.

    std::string Retrieve(const X13::Filing& filing);

private:
    // ====================  DATA MEMBERS  =======================================

    X13::FileName cache_directory_;
    SubmissionFetcher fetcher_;

    int fetch_count_ = 0;

}; // -----  end of class SubmissionCache  -----

#endif   // ----- #ifndef _SUBMISSIONCACHE_INC_  -----
