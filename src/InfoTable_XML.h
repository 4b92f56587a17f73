// =====================================================================================
//
//       Filename:  InfoTable_XML.h
//
//    Description:  Extract the 13F information table from the XML document
//                  wrapped inside an SGML submission.
//
//        Version:  1.0
//        Created:  03/06/2024 10:02:37 AM
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

#ifndef  _INFOTABLE_XML_INC_
#define  _INFOTABLE_XML_INC_

#include <string>
#include <vector>

#include <pugixml.hpp>

#include "Extractor.h"

// information table documents are tried first, then any other document
// with an <XML> payload. returns empty content if there is none.

X13::XMLContent LocateInfoTableDocument(const X13::DocumentSectionList& document_sections);

X13::XMLContent TrimExcessXML(X13::DocumentSection document);

pugi::xml_document ParseXMLContent(X13::XMLContent document);

// filers don't agree on how to nest things so we try these in order
// and keep the first which finds anything.

inline const std::vector<std::string> INFO_TABLE_QUERIES{
    "//*[local-name()='informationTable']/*[local-name()='infoTable']",
    "//*[local-name()='infoTable']",
    "//*[local-name()='informationTable']/*[local-name()='informationTable']/*"
};

// each row node becomes 1 row. leaf elements become columns named
// as in the XML, without namespace prefix. the voting authority
// leaves ('Sole', 'Shared', 'None') are named for their parent too.

X13::RawTable ExtractInfoTableRows(const pugi::xml_document& info_table_xml);

#endif   // ----- #ifndef _INFOTABLE_XML_INC_  -----
