// =====================================================================================
//
//       Filename:  Extractor.h
//
//    Description:  holds some common type defs shared by several classes.
//
//        Version:  1.0
//        Created:  07/08/2014 01:00:04 PM
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

#ifndef EXTRACTOR_H_
#define EXTRACTOR_H_


#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace Extractor13F
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     =======================================

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_constructible_v<T>
            : value_{rhs.value_} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        UniqType(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_constructible_v<T>
            : value_(std::move(rhs.value_)) {}

        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        // ====================  ACCESSORS     =======================================

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     =======================================

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = rhs.value_;
            }
            return *this;
        }
        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = rhs;
            }
            return *this;
        }
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = std::move(rhs.value_);
            }
            return *this;
        }
        UniqType& operator=(T&& rhs) requires std::is_move_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = std::move(rhs);
            }
            return *this;
        }

    private:
        // ====================  DATA MEMBERS  =======================================

        T value_;

    }; // -----  end of class UniqType  -----

    using sv = std::string_view;
	using SEC_Header_fields = std::map<std::string, std::string>;
    using std::filesystem::path;

    // the forms we care about. anything else is carried along as 'e_Other'
    // so the amendment logic can still fall back to it.

    enum class FormType
    {
        e_13F_HR,
        e_13F_HR_A,
        e_13F_NT,
        e_13F_NT_A,
        e_Other
    };

	struct Filing
	{
		std::string cik;
		std::string accession_number;
		std::string date_filed;
		std::string form_name;
		FormType form_type = FormType::e_Other;
		std::string period_of_report;
		std::string company_name;
	};

    // a strategy's native output. just text at this point.

    struct RawTable
    {
        std::vector<std::string> columns_;
        std::vector<std::vector<std::string>> rows_;

        [[nodiscard]] bool empty() const { return columns_.empty() || rows_.empty(); }
    };

	using Extractor_Values = std::vector<std::pair<std::string, std::string>>;

    struct HoldingRecord
    {
        std::string name;
        std::string title;
        std::string cusip;
        std::optional<int64_t> value_x1000;
        std::optional<int64_t> shares;
        std::string share_unit;
        std::string put_call;
        std::string discretion;
        std::string other_managers;
        std::optional<int64_t> voting_sole;
        std::optional<int64_t> voting_shared;
        std::optional<int64_t> voting_none;

        bool low_confidence = false;

        // whatever the source had that we don't recognize.

        Extractor_Values other_fields;

        bool operator==(const HoldingRecord& rhs) const = default;
    };

    using HoldingRecords = std::vector<HoldingRecord>;

    // we don't want to have naked string_views all over the place so
    // lets' add a little type safety based on ideas from fluentcpp

    using FileContent = UniqType<sv, struct FileContentTag>;
    using DocumentSection = UniqType<sv, struct DocumentSectionTag>;
    using XMLContent = UniqType<sv, struct XMLContentTag>;
    using FileName = UniqType<path, struct FileNameTag>;
    using FileType = UniqType<sv, struct FileTypeTag>;
    using InfoTableBlock = UniqType<sv, struct InfoTableBlockTag>;

    using DocumentSectionList = std::vector<DocumentSection>;

}		// namespace Extractor13F

namespace X13 = Extractor13F;

//  seems to be needed by boost program options

template <typename T, typename Uniqueifier>
std::ostream& operator<<(std::ostream& os, const X13::UniqType<T, Uniqueifier>& a_type)
{
    os << a_type.get();
    return os;
}

template <typename T, typename Uniqueifier>
std::istream& operator>>(std::istream& is, X13::UniqType<T, Uniqueifier>& a_type)
{
    T temp = a_type.get();
    is >> temp;
    a_type = temp;
    return is;
}

#endif /* end of include guard: EXTRACTOR_H_ */
