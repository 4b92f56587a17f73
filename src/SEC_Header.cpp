// =====================================================================================
//
//       Filename:  SEC_Header.cpp
//
//    Description:  implements class which extracts needed content from header
//    portion of SEC files.
//
//        Version:  1.0
//        Created:  06/16/2014 11:47:08 AM
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

#include "SEC_Header.h"

#include <boost/regex.hpp>
#include <iostream>
#include <range/v3/action/transform.hpp>

namespace rng = ranges;

#include <date/date.h>

#include "Extractor_Utils.h"

//--------------------------------------------------------------------------------------
//       Class:  SEC_Header
//      Method:  SEC_Header
// Description:  constructor
//--------------------------------------------------------------------------------------

void SEC_Header::UseData(X13::FileContent file_content)
{
    // very old filings use an IMS header instead.

    const boost::regex regex_SEC_header{R"***(^<(SEC|IMS)-HEADER>.+?</(SEC|IMS)-HEADER>\r?$)***"};
    boost::cmatch results;

    bool found_it =
        boost::regex_search(file_content.get().cbegin(), file_content.get().cend(), results, regex_SEC_header);
    BOOST_ASSERT_MSG(found_it, "Can't find SEC Header");

    header_data_ = X13::sv(results[0].first, results[0].length());
} // -----  end of method SEC_Header::UseData  -----

void SEC_Header::ExtractHeaderFields()
{
    ExtractCIK();
    ExtractFormType();
    ExtractDateFiled();
    ExtractPeriodOfReport();
    ExtractAccessionNumber();
    ExtractCompanyName();
} // -----  end of method SEC_Header::ExtractHeaderFields  -----

X13::Filing SEC_Header::GetFiling() const
{
    BOOST_ASSERT_MSG(parsed_header_data_.contains("cik"), "Header fields have not been extracted.");

    X13::Filing filing;
    filing.cik = parsed_header_data_.at("cik");
    filing.accession_number = parsed_header_data_.at("accession_number");
    filing.date_filed = parsed_header_data_.at("date_filed");
    filing.form_name = parsed_header_data_.at("form_type");
    filing.form_type = FormTypeFromName(filing.form_name);
    filing.period_of_report = parsed_header_data_.at("period_of_report");
    filing.company_name = parsed_header_data_.at("company_name");
    return filing;
} // -----  end of method SEC_Header::GetFiling  -----

void SEC_Header::ExtractCIK()
{
    const boost::regex ex{R"***(^\s+CENTRAL INDEX KEY:\s+([0-9]+)\r?$)***"};

    boost::cmatch results;
    bool found_it = boost::regex_search(header_data_.cbegin(), header_data_.cend(), results, ex);

    BOOST_ASSERT_MSG(found_it, "Can't find CIK in SEC Header");

    parsed_header_data_["cik"] = results.str(1);
} // -----  end of method SEC_Header::ExtractCIK  -----

void SEC_Header::ExtractFormType()
{
    const boost::regex ex{R"***(^CONFORMED SUBMISSION TYPE:\s+(.+?)\r?$)***",
                          boost::regex_constants::match_not_dot_newline};

    boost::cmatch results;
    bool found_it = boost::regex_search(header_data_.cbegin(), header_data_.cend(), results, ex);

    BOOST_ASSERT_MSG(found_it, "Can't find 'form type' in SEC Header");

    // unlike file names, we need to keep the '/' to tell amendments apart.

    parsed_header_data_["form_type"] =
        results.str(1) | rng::actions::transform([](unsigned char c) { return std::toupper(c); });
} // -----  end of method SEC_Header::ExtractFormType  -----

void SEC_Header::ExtractDateFiled()
{
    const boost::regex ex{R"***(^FILED AS OF DATE:\s+([0-9]+?)\r?$)***"};

    boost::cmatch results;
    bool found_it = boost::regex_search(header_data_.cbegin(), header_data_.cend(), results, ex);

    BOOST_ASSERT_MSG(found_it, "Can't find 'date filed' in SEC Header");

    auto the_date = StringToDateYMD("%Y%m%d", results.str(1));
    parsed_header_data_["date_filed"] = catenate(the_date);
} // -----  end of method SEC_Header::ExtractDateFiled  -----

void SEC_Header::ExtractPeriodOfReport()
{
    // 13F-NT filings and some very old ones can be missing this.
    // such filings can't be bucketed by period, so leave it empty.

    const boost::regex ex{R"***(^CONFORMED PERIOD OF REPORT:\s+([0-9]+?)\r?$)***"};

    boost::cmatch results;
    bool found_it = boost::regex_search(header_data_.cbegin(), header_data_.cend(), results, ex);

    if (found_it)
    {
        auto the_date = StringToDateYMD("%Y%m%d", results.str(1));
        parsed_header_data_["period_of_report"] = catenate(the_date);
    }
    else
    {
        parsed_header_data_["period_of_report"] = "";
    }
} // -----  end of method SEC_Header::ExtractPeriodOfReport  -----

void SEC_Header::ExtractAccessionNumber()
{
    const boost::regex ex{R"***(^ACCESSION NUMBER:\s+([0-9-]+?)\r?$)***"};

    boost::cmatch results;
    bool found_it = boost::regex_search(header_data_.cbegin(), header_data_.cend(), results, ex);

    BOOST_ASSERT_MSG(found_it, "Can't find 'accession number' in SEC Header");

    parsed_header_data_["accession_number"] = results.str(1);
} // -----  end of method SEC_Header::ExtractAccessionNumber  -----

void SEC_Header::ExtractCompanyName()
{
    const boost::regex ex{R"***(^\s+COMPANY CONFORMED NAME:\s+(.+?)\r?$)***",
                          boost::regex_constants::match_not_dot_newline};

    boost::cmatch results;
    bool found_it = boost::regex_search(header_data_.cbegin(), header_data_.cend(), results, ex);

    BOOST_ASSERT_MSG(found_it, "Can't find 'company name' in SEC Header");

    parsed_header_data_["company_name"] = results.str(1);
} // -----  end of method SEC_Header::ExtractCompanyName  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FormTypeFromName
 *  Description:
 * =====================================================================================
 */
X13::FormType FormTypeFromName(X13::sv form_name)
{
    static const std::map<X13::sv, X13::FormType> form_types{
        {"13F-HR", X13::FormType::e_13F_HR},
        {"13F-HR/A", X13::FormType::e_13F_HR_A},
        {"13F-NT", X13::FormType::e_13F_NT},
        {"13F-NT/A", X13::FormType::e_13F_NT_A}};

    if (auto found = form_types.find(form_name); found != form_types.end())
    {
        return found->second;
    }
    return X13::FormType::e_Other;
} /* -----  end of function FormTypeFromName  ----- */
