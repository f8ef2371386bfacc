// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CVRT_TEXT_H_018727339083427097434
#define CVRT_TEXT_H_018727339083427097434

#include <zen/string_tools.h>


namespace zen
{
/**
\file
\brief Handle conversion of string-convertible types to and from std::string.

Used implicitly by zen::XmlElement::getValue(), zen::XmlElement::setValue(), zen::XmlElement::getAttribute() and zen::XmlElement::setAttribute().
\n\n
Conversions supported by default: std::string, bool and all built-in integer types.
Specialize zen::readText() and zen::writeText() to add support for additional types, e.g. enums.
*/

///Convert text to user data - used by XML elements and attributes
/**
  \return "true" if value was read successfully. Numbers must be well-formed: no trailing garbage!
*/
template <class T> bool readText(const std::string& input, T& value);

///Convert user data into text - used by XML elements and attributes
template <class T> void writeText(const T& value, std::string& output);








//------------------------------ implementation -------------------------------------
template <class T> inline
void writeText(const T& value, std::string& output)
{
    if constexpr (std::is_same_v<T, std::string>)
        output = value;
    else if constexpr (std::is_same_v<T, bool>)
        output = value ? "true" : "false";
    else if constexpr (std::is_integral_v<T>)
        output = numberTo<std::string>(value);
    else
        static_assert(sizeof(T) == -1, "Type is unknown to zen::Xml: specialize zen::readText() and zen::writeText()");
}


template <class T> inline
bool readText(const std::string& input, T& value)
{
    if constexpr (std::is_same_v<T, std::string>)
    {
        value = input;
        return true;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        const std::string tmp = trimCpy(input);
        if (tmp == "true")
            value = true;
        else if (tmp == "false")
            value = false;
        else
            return false;
        return true;
    }
    else if constexpr (std::is_integral_v<T>)
    {
        std::string_view tmp = trimCpy(std::string_view(input));
        if (startsWith(tmp, '+'))
            tmp.remove_prefix(1);

        T number = 0;
        const auto [ptr, ec] = std::from_chars(tmp.data(), tmp.data() + tmp.size(), number);
        if (tmp.empty() || ec != std::errc() || ptr != tmp.data() + tmp.size())
            return false;

        value = number;
        return true;
    }
    else
        static_assert(sizeof(T) == -1, "Type is unknown to zen::Xml: specialize zen::readText() and zen::writeText()");
}
}

#endif //CVRT_TEXT_H_018727339083427097434
