// =====================================================================================
//
//       Filename:  SEC_Header.h
//
//    Description:  class which extracts needed data from header portion of SEC files
//
//        Version:  1.0
//        Created:  06/16/2014 11:37:16 AM
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
//        Class:  SEC_Header
//  Description:  class which extracts needed data from header portion of SEC files
// =====================================================================================

#ifndef  _SEC_HEADER_INC_
#define  _SEC_HEADER_INC_

#include "Extractor.h"

class SEC_Header
{
	public:

		// ====================  LIFECYCLE     =======================================

		SEC_Header () = default;                             // constructor

		// ====================  ACCESSORS     =======================================

        [[nodiscard]] X13::Filing GetFiling() const;

		// ====================  MUTATORS      =======================================

		void UseData(X13::FileContent file_content);
		void ExtractHeaderFields();

		// ====================  OPERATORS     =======================================

	protected:

		void ExtractCIK();
		void ExtractFormType();
		void ExtractDateFiled();
		void ExtractPeriodOfReport();
		void ExtractAccessionNumber();
		void ExtractCompanyName();

		// ====================  DATA MEMBERS  =======================================

	private:
		// ====================  DATA MEMBERS  =======================================

		X13::sv header_data_;

		X13::SEC_Header_fields parsed_header_data_;

}; // -----  end of class SEC_Header  -----

// 13F-HR/A and friends. the '/' is kept.

X13::FormType FormTypeFromName(X13::sv form_name);

#endif   // ----- #ifndef _SEC_HEADER_INC_  -----
