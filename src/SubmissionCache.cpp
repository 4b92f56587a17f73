// =====================================================================================
//
//       Filename:  SubmissionCache.cpp
//
//    Description:  Keep a local copy of each full submission text so we
//                  only ever have to retrieve it once.
//
//        Version:  1.0
//        Created:  03/11/2024 02:31:05 PM
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

#include "SubmissionCache.h"

#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "Extractor_Utils.h"

namespace fs = std::filesystem;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  SubmissionCache
 *      Method:  SubmissionCache
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
SubmissionCache::SubmissionCache (const X13::FileName& cache_directory, SubmissionFetcher fetcher)
    : cache_directory_{cache_directory}, fetcher_{std::move(fetcher)}
{
    BOOST_ASSERT_MSG(! cache_directory_.get().empty(), "Must specify a directory for cached submissions.");
}  /* -----  end of method SubmissionCache::SubmissionCache  (constructor)  ----- */

X13::FileName SubmissionCache::PathFor (const X13::Filing& filing) const
{
    BOOST_ASSERT_MSG(! filing.cik.empty() && ! filing.accession_number.empty(),
            "Filing must have CIK and accession number to be cached.");

    return X13::FileName{cache_directory_.get() / filing.cik / catenate(filing.accession_number, ".txt")};
}		/* -----  end of method SubmissionCache::PathFor  ----- */

bool SubmissionCache::Contains (const X13::Filing& filing) const
{
    return fs::exists(PathFor(filing).get());
}		/* -----  end of method SubmissionCache::Contains  ----- */

std::string SubmissionCache::Retrieve (const X13::Filing& filing)
{
    const auto cached_path = PathFor(filing);
    if (fs::exists(cached_path.get()))
    {
        return LoadDataFileForUse(cached_path);
    }

    if (! fetcher_)
    {
        throw ExtractorException(catenate("Submission: ", filing.accession_number, " is not in cache: ",
                    cache_directory_.get(), " and there is no way to fetch it."));
    }

    spdlog::debug(catenate("Fetching submission: ", filing.accession_number, " for CIK: ", filing.cik));

    auto content = fetcher_(filing);
    ++fetch_count_;

    fs::create_directories(cached_path.get().parent_path());

    std::ofstream cached_file{cached_path.get(), std::ios::out | std::ios::binary | std::ios::trunc};
    if (! cached_file)
    {
        throw ExtractorException(catenate("Unable to open cache file: ", cached_path.get(), " for writing."));
    }
    cached_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    cached_file.close();
    if (! cached_file)
    {
        throw ExtractorException(catenate("Problem writing cache file: ", cached_path.get()));
    }

    return content;
}		/* -----  end of method SubmissionCache::Retrieve  ----- */
