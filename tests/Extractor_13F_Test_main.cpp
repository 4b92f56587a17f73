// =====================================================================================
//
//       Filename:  Extractor_13F_Test_main.cpp
//
//    Description:  Driver program for Extractor_13F unit tests
//
//        Version:  1.0
//        Created:  03/15/2024 09:02:17 AM
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

#include <spdlog/spdlog.h>

void InitLogging ()
{
    // the extraction chain logs every attempt. keep the test output readable.

    spdlog::set_level(spdlog::level::err);
}		/* -----  end of function InitLogging  ----- */

int main(int argc, char** argv)
{
    InitLogging();

    testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}		/* -----  end of function main  ----- */
