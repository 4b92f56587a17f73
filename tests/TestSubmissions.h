// =====================================================================================
//
//       Filename:  TestSubmissions.h
//
//    Description:  Small made up 13F submissions for the tests to chew on.
//
//        Version:  1.0
//        Created:  03/15/2024 09:11:45 AM
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

#ifndef  _TESTSUBMISSIONS_INC_
#define  _TESTSUBMISSIONS_INC_

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "Extractor.h"
#include "Extractor_Utils.h"
#include "SEC_Header.h"

namespace fs = std::filesystem;

// the parts of the SEC header we look at. dates are YYYYMMDD like EDGAR has them.
// an empty period leaves the period of report line out.

struct SubmissionInfo
{
    std::string accession_number_{"0000950123-21-002345"};
    std::string form_type_{"13F-HR"};
    std::string period_{"20201231"};
    std::string date_filed_{"20210215"};
    std::string cik_{"0001067983"};
    std::string company_{"BERKSHIRE HATHAWAY INC"};
};

inline std::string MakeSECHeader(const SubmissionInfo& info)
{
    std::string header = catenate(
        "<SEC-DOCUMENT>", info.accession_number_, ".txt : ", info.date_filed_, '\n',
        "<SEC-HEADER>", info.accession_number_, ".hdr.sgml : ", info.date_filed_, '\n',
        "ACCESSION NUMBER:\t\t", info.accession_number_, '\n',
        "CONFORMED SUBMISSION TYPE:\t", info.form_type_, '\n',
        "PUBLIC DOCUMENT COUNT:\t\t2\n");
    if (! info.period_.empty())
    {
        header += catenate("CONFORMED PERIOD OF REPORT:\t", info.period_, '\n');
    }
    header += catenate(
        "FILED AS OF DATE:\t\t", info.date_filed_, '\n',
        "DATE AS OF CHANGE:\t\t", info.date_filed_, '\n',
        '\n',
        "FILER:\n",
        '\n',
        "\tCOMPANY DATA:\t\n",
        "\t\tCOMPANY CONFORMED NAME:\t\t\t", info.company_, '\n',
        "\t\tCENTRAL INDEX KEY:\t\t\t", info.cik_, '\n',
        "\t\tIRS NUMBER:\t\t\t\t470813844\n",
        "\t\tSTATE OF INCORPORATION:\t\t\tDE\n",
        "\t\tFISCAL YEAR END:\t\t\t1231\n",
        "</SEC-HEADER>\n");
    return header;
}

inline std::string CoverPageDocument(const SubmissionInfo& info)
{
    return catenate(
        "<DOCUMENT>\n",
        "<TYPE>", info.form_type_, '\n',
        "<SEQUENCE>1\n",
        "<FILENAME>primary_doc.txt\n",
        "<TEXT>\n",
        "                UNITED STATES SECURITIES AND EXCHANGE COMMISSION\n",
        "                              Washington, D.C. 20549\n",
        '\n',
        "                                   FORM 13F\n",
        "Report for the Calendar Year or Quarter Ended: ", info.period_, '\n',
        "</TEXT>\n",
        "</DOCUMENT>\n");
}

// lay out fixed width text. each field is left justified in its width.

inline std::string FixedWidthLine(const std::vector<std::pair<std::string, std::size_t>>& fields)
{
    std::string line;
    for (const auto& [text, width] : fields)
    {
        std::string field{text};
        field.resize(std::max(width, text.size() + 1), ' ');
        line += field;
    }
    while (! line.empty() && line.back() == ' ')
    {
        line.pop_back();
    }
    return line;
}

// name, title, cusip, value, shares, sh/prn, put/call, discretion, managers, sole, shared, none.

inline const std::vector<std::size_t> FIXED_WIDTHS{22, 16, 11, 10, 17, 8, 9, 23, 16, 10, 10, 10};

inline std::string FixedWidthRow(const std::vector<std::string>& cells)
{
    std::vector<std::pair<std::string, std::size_t>> fields;
    for (std::size_t indx = 0; indx < cells.size(); ++indx)
    {
        fields.emplace_back(cells[indx], FIXED_WIDTHS[indx]);
    }
    return FixedWidthLine(fields);
}

inline std::string FixedWidthInfoTable()
{
    return catenate(
        "                          FORM 13F INFORMATION TABLE\n",
        '\n',
        FixedWidthLine({{"NAME OF ISSUER", 22}, {"TITLE OF CLASS", 16}, {"CUSIP", 11}, {"VALUE", 10},
            {"SHRS OR PRN AMT", 17}, {"SH/PRN", 8}, {"PUT/CALL", 9}, {"INVESTMENT DISCRETION", 23},
            {"OTHER MANAGERS", 16}, {"VOTING AUTHORITY", 30}}), '\n',
        FixedWidthRow({"", "", "", "(X$1000)", "", "", "", "", "", "SOLE", "SHARED", "NONE"}), '\n',
        "-------------------------------------------------------------------------------------------------\n",
        FixedWidthRow({"APPLE INC", "COM", "037833100", "117,446", "887,135", "SH", "", "SOLE", "",
            "887,135", "0", "0"}), '\n',
        FixedWidthRow({"BANK AMER CORP", "COM", "060505104", "31,244", "1,032,852", "SH", "", "DFND", "4,8",
            "1,000,000", "32,852", "0"}), '\n',
        "Page 2\n",
        FixedWidthRow({"COCA COLA CO", "COM", "191216100", "21,936", "400,000", "SH", "", "DFND", "4",
            "400,000", "", ""}), '\n',
        "                                            ======\n",
        "GRAND TOTAL                                 170,626\n");
}

inline std::string FixedWidthSubmission(const SubmissionInfo& info)
{
    return catenate(
        MakeSECHeader(info),
        CoverPageDocument(info),
        "<DOCUMENT>\n",
        "<TYPE>", info.form_type_, '\n',
        "<SEQUENCE>2\n",
        "<TEXT>\n",
        FixedWidthInfoTable(),
        "</TEXT>\n",
        "</DOCUMENT>\n",
        "</SEC-DOCUMENT>\n");
}

inline std::string InfoTableXML()
{
    return
R"***(<?xml version="1.0" encoding="UTF-8"?>
<ns1:informationTable xmlns:ns1="http://www.sec.gov/edgar/document/thirteenf/informationtable">
  <ns1:infoTable>
    <ns1:nameOfIssuer>APPLE INC</ns1:nameOfIssuer>
    <ns1:titleOfClass>COM</ns1:titleOfClass>
    <ns1:cusip>037833100</ns1:cusip>
    <ns1:value>117446</ns1:value>
    <ns1:shrsOrPrnAmt>
      <ns1:sshPrnamt>887135</ns1:sshPrnamt>
      <ns1:sshPrnamtType>SH</ns1:sshPrnamtType>
    </ns1:shrsOrPrnAmt>
    <ns1:investmentDiscretion>DFND</ns1:investmentDiscretion>
    <ns1:otherManager>4</ns1:otherManager>
    <ns1:otherManager>8</ns1:otherManager>
    <ns1:votingAuthority>
      <ns1:Sole>887135</ns1:Sole>
      <ns1:Shared>0</ns1:Shared>
      <ns1:None>0</ns1:None>
    </ns1:votingAuthority>
  </ns1:infoTable>
  <ns1:infoTable>
    <ns1:nameOfIssuer>AMERICAN EXPRESS CO</ns1:nameOfIssuer>
    <ns1:titleOfClass>COM</ns1:titleOfClass>
    <ns1:cusip>025816109</ns1:cusip>
    <ns1:value>18331</ns1:value>
    <ns1:shrsOrPrnAmt>
      <ns1:sshPrnamt>151610</ns1:sshPrnamt>
      <ns1:sshPrnamtType>SH</ns1:sshPrnamtType>
    </ns1:shrsOrPrnAmt>
    <ns1:putCall>Call</ns1:putCall>
    <ns1:investmentDiscretion>SOLE</ns1:investmentDiscretion>
    <ns1:votingAuthority>
      <ns1:Sole>151610</ns1:Sole>
      <ns1:Shared>0</ns1:Shared>
      <ns1:None>0</ns1:None>
    </ns1:votingAuthority>
  </ns1:infoTable>
</ns1:informationTable>
)***";
}

inline std::string XMLSubmission(const SubmissionInfo& info)
{
    return catenate(
        MakeSECHeader(info),
        "<DOCUMENT>\n",
        "<TYPE>", info.form_type_, '\n',
        "<SEQUENCE>1\n",
        "<FILENAME>primary_doc.xml\n",
        "<TEXT>\n",
        "<XML>\n",
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n",
        "<edgarSubmission xmlns=\"http://www.sec.gov/edgar/thirteenffiler\">\n",
        "  <headerData><submissionType>", info.form_type_, "</submissionType></headerData>\n",
        "</edgarSubmission>\n",
        "</XML>\n",
        "</TEXT>\n",
        "</DOCUMENT>\n",
        "<DOCUMENT>\n",
        "<TYPE>INFORMATION TABLE\n",
        "<SEQUENCE>2\n",
        "<FILENAME>infotable.xml\n",
        "<TEXT>\n",
        "<XML>\n",
        InfoTableXML(),
        "</XML>\n",
        "</TEXT>\n",
        "</DOCUMENT>\n",
        "</SEC-DOCUMENT>\n");
}

inline std::string MarkupInfoTable()
{
    return
R"***(<HTML>
<BODY>
<P ALIGN="CENTER">FORM 13F INFORMATION TABLE</P>
<TABLE BORDER="0" WIDTH="100%">
<TR>
<TD>NAME OF ISSUER</TD><TD>TITLE OF CLASS</TD><TD>CUSIP</TD><TD>VALUE (X$1000)</TD>
<TD>SHRS OR PRN AMT</TD><TD>SH/PRN</TD><TD>PUT/CALL</TD><TD>INVESTMENT DISCRETION</TD>
<TD>OTHER MANAGERS</TD><TD COLSPAN="3">VOTING AUTHORITY</TD>
</TR>
<TR><TD>SOLE</TD><TD>SHARED</TD><TD>NONE</TD></TR>
<TR><TD>-----</TD><TD>-----</TD><TD>-----</TD><TD>-----</TD><TD>-----</TD><TD>-----</TD>
<TD>-----</TD><TD>-----</TD><TD>-----</TD><TD>-----</TD><TD>-----</TD><TD>-----</TD></TR>
<TR>
<TD>APPLE INC</TD><TD>COM</TD><TD>037833100</TD><TD>117,446</TD>
<TD>887,135</TD><TD>SH</TD><TD></TD><TD>SOLE</TD>
<TD></TD><TD>887,135</TD><TD>0</TD><TD>0</TD>
</TR>
<TR><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD><TD></TD></TR>
<TR>
<TD>WELLS FARGO &amp; CO NEW</TD><TD>COM</TD><TD>949746101</TD><TD>9,510</TD>
<TD>315,113</TD><TD>SH</TD><TD></TD><TD>DFND</TD>
<TD>4,8</TD><TD>315,113</TD><TD>0</TD><TD>0</TD>
</TR>
<TR><TD>GRAND TOTAL</TD><TD></TD><TD></TD><TD>126,956</TD></TR>
</TABLE>
</BODY>
</HTML>
)***";
}

inline std::string MarkupSubmission(const SubmissionInfo& info)
{
    return catenate(
        MakeSECHeader(info),
        CoverPageDocument(info),
        "<DOCUMENT>\n",
        "<TYPE>", info.form_type_, '\n',
        "<SEQUENCE>2\n",
        "<TEXT>\n",
        MarkupInfoTable(),
        "</TEXT>\n",
        "</DOCUMENT>\n",
        "</SEC-DOCUMENT>\n");
}

// a submission none of our strategies can do anything with.

inline std::string UselessSubmission(const SubmissionInfo& info)
{
    return catenate(
        MakeSECHeader(info),
        CoverPageDocument(info),
        "</SEC-DOCUMENT>\n");
}

// a scratch directory which is empty when we start and gone when we're done.

class TempDirectory
{
public:
    explicit TempDirectory(const std::string& name)
        : path_{fs::temp_directory_path() / "Extractor_13F_Test" / name}
    {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDirectory()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory& rhs) = delete;
    TempDirectory& operator=(const TempDirectory& rhs) = delete;

    [[nodiscard]] const fs::path& get() const { return path_; }

private:
    fs::path path_;
};

inline void WriteTestFile(const fs::path& file_name, const std::string& content)
{
    fs::create_directories(file_name.parent_path());
    std::ofstream output{file_name, std::ios::out | std::ios::binary | std::ios::trunc};
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline X13::Filing MakeFiling(const SubmissionInfo& info)
{
    X13::Filing filing;
    filing.cik = info.cik_;
    filing.accession_number = info.accession_number_;
    filing.form_name = info.form_type_;
    filing.form_type = FormTypeFromName(filing.form_name);
    filing.company_name = info.company_;
    filing.date_filed = catenate(info.date_filed_.substr(0, 4), '-', info.date_filed_.substr(4, 2), '-',
                                 info.date_filed_.substr(6, 2));
    if (! info.period_.empty())
    {
        filing.period_of_report = catenate(info.period_.substr(0, 4), '-', info.period_.substr(4, 2), '-',
                                           info.period_.substr(6, 2));
    }
    return filing;
}

#endif   // ----- #ifndef _TESTSUBMISSIONS_INC_  -----
