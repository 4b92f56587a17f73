// =====================================================================================
//
//       Filename:  extract_13F_main.cpp
//
//    Description:  Driver program for 13F holdings extraction.
//
//        Version:  1.0
//        Created:  03/14/2024 08:20:41 AM
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

#include <iostream>
#include <tuple>

#include "spdlog/spdlog.h"

#include "ExtractorApp.h"

int main(int argc, char* argv[])
{
    // start logging here.  will possibly change once we have parsed
    // command line.

    spdlog::set_level(spdlog::level::info);

    int result{0};

    try
    {
        ExtractorApp myApp(argc, argv);
        auto ok = myApp.Startup();
        if (ok)
        {
            auto counters = myApp.Run();
            myApp.Shutdown();

            // some periods failed. their raw text is in the output directory.

            if (std::get<2>(counters) > 0)
            {
                result = 2;
            }
        }
        else
        {
            std::cerr << "Problems starting program.  No processing done.\n";
            result = 1;
        }
    }
    catch (std::exception& theProblem)
    {
        spdlog::error(catenate("Something fundamental went wrong: ", theProblem.what()));
        result = 1;
    }
    return result;
}		/* -----  end of function main  ----- */
