// =====================================================================================
//
//       Filename:  InfoTable_XML.cpp
//
//    Description:  Extract the 13F information table from the XML document
//                  wrapped inside an SGML submission.
//
//        Version:  1.0
//        Created:  03/06/2024 10:15:58 AM
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

#include "InfoTable_XML.h"

#include <cctype>
#include <iterator>
#include <map>
#include <optional>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/find.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "Extractor_Utils.h"

using namespace std::string_literals;

namespace
{
    using FlatRow = std::vector<std::pair<std::string, std::string>>;

    std::string LocalName(const char* node_name)
    {
        X13::sv name{node_name};
        if (auto colon = name.find(':'); colon != X13::sv::npos)
        {
            name.remove_prefix(colon + 1);
        }
        return std::string{name};
    }

    void FlattenNode(const pugi::xml_node& node, const std::string& parent_name, FlatRow& row)
    {
        bool has_element_children = false;
        for (auto child = node.first_child(); child; child = child.next_sibling())
        {
            if (child.type() == pugi::node_element)
            {
                has_element_children = true;
                FlattenNode(child, LocalName(node.name()), row);
            }
        }
        if (has_element_children)
        {
            return;
        }

        auto name = LocalName(node.name());
        if (! name.empty() && std::isupper(static_cast<unsigned char>(name[0])) && ! parent_name.empty())
        {
            name = parent_name + name;
        }
        row.emplace_back(name, boost::algorithm::trim_copy(std::string{node.text().get()}));
    }
} // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LocateInfoTableDocument
 *  Description:
 * =====================================================================================
 */
X13::XMLContent LocateInfoTableDocument(const X13::DocumentSectionList& document_sections)
{
    std::optional<X13::DocumentSection> fallback;

    for (const auto& document : document_sections)
    {
        if (! boost::algorithm::icontains(document.get(), "<xml>"))
        {
            continue;
        }
        auto file_type = boost::algorithm::to_upper_copy(std::string{FindFileType(document).get()});
        if (file_type.find("INFORMATION TABLE") != std::string::npos)
        {
            return TrimExcessXML(document);
        }
        if (! fallback && document.get().find("infoTable") != X13::sv::npos)
        {
            fallback = document;
        }
    }
    if (fallback)
    {
        return TrimExcessXML(fallback.value());
    }
    return X13::XMLContent{};
} /* -----  end of function LocateInfoTableDocument  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  TrimExcessXML
 *  Description:
 * =====================================================================================
 */
X13::XMLContent TrimExcessXML(X13::DocumentSection document)
{
    // the SGML tags are upper case in EDGAR but we don't count on it.

    auto doc_val = document.get();
    auto xml_loc = boost::algorithm::ifind_first(doc_val, "<XML>");
    if (xml_loc.empty())
    {
        throw ParseException("Can't find start of XML in document.\n");
    }
    doc_val.remove_prefix(std::distance(doc_val.begin(), xml_loc.end()));

    auto xml_end_loc = boost::algorithm::ifind_last(doc_val, "</XML>");
    if (! xml_end_loc.empty())
    {
        doc_val.remove_suffix(std::distance(xml_end_loc.begin(), doc_val.end()));

        // pugixml won't accept anything in front of the xml declaration.

        while (! doc_val.empty() && std::isspace(static_cast<unsigned char>(doc_val.front())))
        {
            doc_val.remove_prefix(1);
        }
        return X13::XMLContent{doc_val};
    }
    throw ParseException("Can't find end of XML in document.\n");
} /* -----  end of function TrimExcessXML  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseXMLContent
 *  Description:
 * =====================================================================================
 */
pugi::xml_document ParseXMLContent(X13::XMLContent document)
{
    pugi::xml_document doc;
    auto result = doc.load_buffer(document.get().data(), document.get().size(), pugi::parse_default | pugi::parse_wnorm_attribute);
    if (! result)
    {
        throw ParseException{catenate("Error description: ", result.description(), "\nError offset: ", result.offset, '\n')};
    }

    return doc;
} /* -----  end of function ParseXMLContent  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractInfoTableRows
 *  Description:
 * =====================================================================================
 */
X13::RawTable ExtractInfoTableRows(const pugi::xml_document& info_table_xml)
{
    X13::RawTable table;

    for (const auto& query : INFO_TABLE_QUERIES)
    {
        auto row_nodes = info_table_xml.select_nodes(query.c_str());
        if (row_nodes.empty())
        {
            continue;
        }

        std::vector<FlatRow> flat_rows;
        for (const auto& row_node : row_nodes)
        {
            FlatRow row;
            FlattenNode(row_node.node(), "", row);
            if (! row.empty())
            {
                flat_rows.push_back(std::move(row));
            }
        }
        if (flat_rows.empty())
        {
            continue;
        }

        // columns in the order we first see them.

        std::map<std::string, std::size_t> column_index;
        for (const auto& row : flat_rows)
        {
            for (const auto& [name, value] : row)
            {
                if (! column_index.contains(name))
                {
                    column_index[name] = table.columns_.size();
                    table.columns_.push_back(name);
                }
            }
        }
        for (const auto& row : flat_rows)
        {
            std::vector<std::string> cells(table.columns_.size());
            for (const auto& [name, value] : row)
            {
                // some filers repeat 'otherManager'. keep them all.

                auto& cell = cells[column_index[name]];
                cell = cell.empty() ? value : catenate(cell, ',', value);
            }
            table.rows_.push_back(std::move(cells));
        }
        break;
    }
    return table;
} /* -----  end of function ExtractInfoTableRows  ----- */
