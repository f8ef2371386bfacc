// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PARSER_H_81248670213764583021432
#define PARSER_H_81248670213764583021432

#include <cstddef> //ptrdiff_t; req. on Linux
#include <zen/string_tools.h>
#include "dom.h"


namespace zen
{
/**
\file
\brief Convert an XML document object model (class XmlDoc) to and from a byte stream representation.
*/

///Save XML document as a byte stream
/**
\param doc Input XML document
\param lineBreak Line break, default: new line
\param indent Indentation, default: four space characters
\return Output byte stream
*/
std::string serializeXml(const XmlDoc& doc,
                         const std::string& lineBreak = "\n",
                         const std::string& indent    = "    "); //noexcept


///Exception thrown due to an XML parsing error
struct XmlParsingError
{
    XmlParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    ///Input row where the parsing error occured (zero-based)
    const size_t row;
    ///Input column where the parsing error occured (zero-based)
    const size_t col;
};

///Load XML document from a byte stream
/**
Supports the subset of XML produced by configuration files and object store REST responses:
declaration, comments, elements, attributes, predefined and numeric character references, CDATA sections.
No support for mixed-mode content or DTDs.
\throw XmlParsingError
*/
XmlDoc parseXml(const std::string& stream); //throw XmlParsingError




















//---------------------------- implementation ----------------------------
//see: https://www.w3.org/TR/xml/

namespace xml_impl
{
constexpr std::string_view BYTE_ORDER_MARK_UTF8 = "\xEF\xBB\xBF";


template <class Predicate> inline
std::string normalize(const std::string_view str, Predicate pred) //pred: unary function taking a char, return true if value shall be encoded as hex
{
    std::string output;
    for (const char c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case '&': output += "&amp;"; break; //
            case '<': output +=  "&lt;"; break; //normalization mandatory: https://www.w3.org/TR/xml/#syntax
            case '>': output +=  "&gt;"; break; //
            default:
                if (pred(c))
                {
                    if      (c == '\'') output += "&apos;";
                    else if (c ==  '"') output += "&quot;";
                    else
                    {
                        output += "&#x";
                        const auto [high, low] = hexify(static_cast<unsigned char>(c));
                        output += high;
                        output += low;
                        output += ';';
                    }
                }
                else
                    output += c;
                break;
            //*INDENT-ON*
        }
    return output;
}

inline
std::string normalizeName(const std::string& str)
{
    const std::string nameFmt = normalize(str, [](char c) { return isWhiteSpace(c) || c == '=' || c == '/' || c == '\'' || c == '"'; });
    assert(!nameFmt.empty());
    return nameFmt;
}

inline
std::string normalizeElementValue(const std::string& str)
{
    return normalize(str, [](char c) { return static_cast<unsigned char>(c) < 32 && c != '\n' && c != '\t'; });
}

inline
std::string normalizeAttribValue(const std::string& str)
{
    return normalize(str, [](char c) { return static_cast<unsigned char>(c) < 32 || c == '\'' || c == '"'; });
}


inline
void appendCodePointUtf8(std::string& output, uint32_t cp)
{
    //*INDENT-OFF*
    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>(0xC0 | (cp >> 6));
        output += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>(0xE0 | (cp >> 12));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        output += static_cast<char>(0xF0 | (cp >> 18));
        output += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (cp & 0x3F));
    }
    //*INDENT-ON*
}


//"&#x2F;" or "&#47;": return number of chars consumed, 0 if not a character reference
inline
size_t parseCharReference(const std::string_view str, std::string& output)
{
    if (!startsWith(str, "&#"))
        return 0;

    const bool hex = str.size() > 2 && str[2] == 'x';
    const size_t digitsBegin = hex ? 3 : 2;

    const size_t posEnd = str.find(';', digitsBegin);
    if (posEnd == std::string_view::npos || posEnd == digitsBegin || posEnd - digitsBegin > 8)
        return 0;

    uint32_t cp = 0;
    for (const char c : str.substr(digitsBegin, posEnd - digitsBegin))
        if (hex && isHexDigit(c))
            cp = cp * 16 + static_cast<unsigned char>(unhexify('0', c));
        else if (!hex && isDigit(c))
            cp = cp * 10 + (c - '0');
        else
            return 0;

    if (cp > 0x10FFFF)
        return 0;

    appendCodePointUtf8(output, cp);
    return posEnd + 1;
}


inline
std::string denormalize(const std::string_view str)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        const std::string_view tail = str.substr(i);

        if (c == '&')
        {
            //*INDENT-OFF*
            if      (startsWith(tail, "&amp;" )) { output += '&';  i += 4; }
            else if (startsWith(tail, "&lt;"  )) { output += '<';  i += 3; }
            else if (startsWith(tail, "&gt;"  )) { output += '>';  i += 3; }
            else if (startsWith(tail, "&apos;")) { output += '\''; i += 5; }
            else if (startsWith(tail, "&quot;")) { output += '"';  i += 5; }
            else if (const size_t charsUsed = parseCharReference(tail, output); charsUsed > 0)
                i += charsUsed - 1;
            else
                output += c; //unexpected char!
            //*INDENT-ON*
        }
        else if (c == '\r') //map all end-of-line characters to \n https://www.w3.org/TR/xml/#sec-line-ends
        {
            if (i + 1 < str.size() && str[i + 1] == '\n')
                ++i;
            output += '\n';
        }
        else
            output += c;
    }
    return output;
}


inline
void serialize(const XmlElement& element, std::string& stream,
               const std::string& lineBreak,
               const std::string& indent,
               size_t indentLevel)
{
    const std::string nameFmt = normalizeName(element.getName());

    for (size_t i = 0; i < indentLevel; ++i)
        stream += indent;

    stream += '<' + nameFmt;

    const auto [itAttr, itAttrEnd] = element.getAttributes();
    for (auto it = itAttr; it != itAttrEnd; ++it)
        stream += ' ' + normalizeName(it->name) + "=\"" + normalizeAttribValue(it->value) + '"';

    const auto [it, itEnd] = element.getChildren();
    if (it != itEnd) //structured element
    {
        //no support for mixed-mode content
        stream += '>' + lineBreak;

        std::for_each(it, itEnd, [&](const XmlElement& el)
        { serialize(el, stream, lineBreak, indent, indentLevel + 1); });

        for (size_t i = 0; i < indentLevel; ++i)
            stream += indent;
        stream += "</" + nameFmt + '>' + lineBreak;
    }
    else
    {
        std::string value;
        element.getValue(value);

        if (!value.empty()) //value element
            stream += '>' + normalizeElementValue(value) + "</" + nameFmt + '>' + lineBreak;
        else //empty element
            stream += "/>" + lineBreak;
    }
}
}

inline
std::string serializeXml(const XmlDoc& doc,
                         const std::string& lineBreak,
                         const std::string& indent)
{
    std::string output = "<?xml";

    if (const std::string& version = doc.getVersion();
        !version.empty())
        output += " version=\"" + xml_impl::normalizeAttribValue(version) + '"';

    if (const std::string& encoding = doc.getEncoding();
        !encoding.empty())
        output += " encoding=\"" + xml_impl::normalizeAttribValue(encoding) + '"';

    output += "?>" + lineBreak;

    xml_impl::serialize(doc.root(), output, lineBreak, indent, 0 /*indentLevel*/);
    return output;
}

/*
Grammar for XML parser
-------------------------------
document-expression:
    <?xml version="1.0" encoding="utf-8"?>
    element-expression:

element-expression:
    <string attributes-expression/>
    <string attributes-expression> pm-expression </string>

element-list-expression:
    <empty>
    element-expression element-list-expression

attributes-expression:
    <empty>
    string="string" attributes-expression

pm-expression:
    string
    element-list-expression
*/

namespace xml_impl
{
struct Token
{
    enum Type
    {
        TK_LESS,
        TK_GREATER,
        TK_LESS_SLASH,
        TK_SLASH_GREATER,
        TK_EQUAL,
        TK_QUOTE,
        TK_DECL_BEGIN,
        TK_DECL_END,
        TK_NAME,
        TK_END
    };

    Token(Type t) : type(t) {}
    Token(std::string&& txt) : type(TK_NAME), name(std::move(txt)) {}

    Type type;
    std::string name; //filled if type == TK_NAME
};


class Scanner
{
public:
    explicit Scanner(const std::string& stream) : stream_(stream), pos_(stream_.begin())
    {
        if (zen::startsWith(stream_, BYTE_ORDER_MARK_UTF8))
            pos_ += BYTE_ORDER_MARK_UTF8.size();
    }

    Token getNextToken() //throw XmlParsingError
    {
        for (;;)
        {
            pos_ = std::find_if_not(pos_, stream_.end(), isWhiteSpace);

            if (pos_ == stream_.end())
                return Token::TK_END;

            if (!skipComment())
                break;
        }

        for (const auto& [tokenStr, tokenType] : tokens_)
            if (startsWith(tokenStr))
            {
                pos_ += tokenStr.size();
                return tokenType;
            }

        const auto itNameEnd = std::find_if(pos_, stream_.end(), [](char c)
        {
            return c == '<'  ||
                   c == '>'  ||
                   c == '='  ||
                   c == '/'  ||
                   c == '\'' ||
                   c == '"'  ||
                   isWhiteSpace(c);
        });

        if (itNameEnd != pos_)
        {
            const std::string_view name = makeStringView(pos_, itNameEnd);
            pos_ = itNameEnd;
            return denormalize(name);
        }

        //unknown token
        throw XmlParsingError(posRow(), posCol());
    }

    std::string extractElementValue() //throw XmlParsingError
    {
        std::string output;
        for (;;)
        {
            if (startsWith(cdataBegin_))
            {
                const auto itCdata = pos_ + cdataBegin_.size();
                const auto itCdataEnd = std::search(itCdata, stream_.end(), cdataEnd_.begin(), cdataEnd_.end());
                if (itCdataEnd == stream_.end())
                    throw XmlParsingError(posRow(), posCol());

                output.append(itCdata, itCdataEnd); //verbatim: no entity decoding
                pos_ = itCdataEnd + cdataEnd_.size();
                continue;
            }

            auto it = std::find_if(pos_, stream_.end(), [](char c) { return c == '<' || c == '>'; });
            output += denormalize(makeStringView(pos_, it));
            pos_ = it;

            if (!startsWith(cdataBegin_))
                return output;
        }
    }

    std::string extractAttributeValue()
    {
        auto it = std::find_if(pos_, stream_.end(), [](char c)
        {
            return c == '<'  ||
                   c == '>'  ||
                   c == '\'' ||
                   c == '"';
        });
        const std::string_view output = makeStringView(pos_, it);
        pos_ = it;
        return denormalize(output);
    }

    size_t posRow() const //current row beginning with 0
    {
        const size_t crSum = std::count(stream_.begin(), pos_, '\r'); //carriage returns
        const size_t nlSum = std::count(stream_.begin(), pos_, '\n'); //new lines
        return std::max(crSum, nlSum); //be compatible with Linux/Mac/Win
    }

    size_t posCol() const //current col beginning with 0
    {
        //seek beginning of line
        for (auto it = pos_; it != stream_.begin(); )
        {
            --it;
            if (isLineBreak(*it))
                return pos_ - it - 1;
        }
        return pos_ - stream_.begin();
    }

private:
    Scanner           (const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    bool startsWith(const std::string_view prefix) const
    {
        return zen::startsWith(makeStringView(pos_, stream_.end()), prefix);
    }

    bool skipComment() //throw XmlParsingError
    {
        if (!startsWith(commentBegin_))
            return false;

        auto it = std::search(pos_ + commentBegin_.size(), stream_.end(), commentEnd_.begin(), commentEnd_.end());
        if (it == stream_.end())
            throw XmlParsingError(posRow(), posCol());

        pos_ = it + commentEnd_.size();
        return true;
    }

    using TokenList = std::vector<std::pair<std::string, Token::Type>>;
    const TokenList tokens_
    {
        {"<?xml", Token::TK_DECL_BEGIN   },
        {"?>",    Token::TK_DECL_END     },
        {"</",    Token::TK_LESS_SLASH   },
        {"/>",    Token::TK_SLASH_GREATER},
        {"<",     Token::TK_LESS         }, //evaluate after TK_DECL_BEGIN!
        {">",     Token::TK_GREATER      },
        {"=",     Token::TK_EQUAL        },
        {"\"",    Token::TK_QUOTE        },
        {"\'",    Token::TK_QUOTE        },
    };

    const std::string commentBegin_ = "<!--";
    const std::string commentEnd_   = "-->";
    const std::string cdataBegin_   = "<![CDATA[";
    const std::string cdataEnd_     = "]]>";

    const std::string stream_;
    std::string::const_iterator pos_;
};


class XmlParser
{
public:
    explicit XmlParser(const std::string& stream) :
        scn_(stream),
        tk_(scn_.getNextToken()) {} //throw XmlParsingError

    XmlDoc parse() //throw XmlParsingError
    {
        XmlDoc doc;

        //declaration (optional)
        if (token().type == Token::TK_DECL_BEGIN)
        {
            nextToken(); //throw XmlParsingError

            while (token().type == Token::TK_NAME)
            {
                const std::string attribName = token().name;
                nextToken(); //throw XmlParsingError

                const std::string attribValue = parseAttributeValue(); //throw XmlParsingError

                if (attribName == "version")
                    doc.setVersion(attribValue);
                else if (attribName == "encoding")
                    doc.setEncoding(attribValue);
            }
            consumeToken(Token::TK_DECL_END); //throw XmlParsingError
        }

        XmlElement dummy;
        parseChildElements(dummy);

        auto [it, itEnd] = dummy.getChildren();
        if (it == itEnd) //root element is mandatory
            throw XmlParsingError(scn_.posRow(), scn_.posCol());
        doc.root().swapSubtree(*it);

        expectToken(Token::TK_END); //throw XmlParsingError
        return doc;
    }

private:
    XmlParser           (const XmlParser&) = delete;
    XmlParser& operator=(const XmlParser&) = delete;

    void parseChildElements(XmlElement& parent) //throw XmlParsingError
    {
        while (token().type == Token::TK_LESS)
        {
            nextToken(); //throw XmlParsingError

            expectToken(Token::TK_NAME); //throw XmlParsingError
            const std::string elementName = token().name;
            nextToken(); //throw XmlParsingError

            XmlElement& newElement = parent.addChild(elementName);

            while (token().type == Token::TK_NAME) //attributes
            {
                const std::string attribName = token().name;
                nextToken(); //throw XmlParsingError

                newElement.setAttribute(attribName, parseAttributeValue()); //throw XmlParsingError
            }

            if (token().type == Token::TK_SLASH_GREATER) //empty element
            {
                nextToken(); //throw XmlParsingError
                continue;
            }

            expectToken(Token::TK_GREATER); //throw XmlParsingError
            std::string elementValue = scn_.extractElementValue(); //throw XmlParsingError
            nextToken(); //throw XmlParsingError

            //no support for mixed-mode content
            if (token().type == Token::TK_LESS) //structure-element
                parseChildElements(newElement);
            else                                //value-element
                newElement.setValue(std::move(elementValue));

            consumeToken(Token::TK_LESS_SLASH); //throw XmlParsingError

            expectToken(Token::TK_NAME); //throw XmlParsingError
            if (token().name != elementName)
                throw XmlParsingError(scn_.posRow(), scn_.posCol());
            nextToken(); //throw XmlParsingError

            consumeToken(Token::TK_GREATER); //throw XmlParsingError
        }
    }

    std::string parseAttributeValue() //throw XmlParsingError
    {
        consumeToken(Token::TK_EQUAL); //throw XmlParsingError
        expectToken (Token::TK_QUOTE); //
        std::string attribValue = scn_.extractAttributeValue();
        nextToken(); //throw XmlParsingError

        consumeToken(Token::TK_QUOTE); //throw XmlParsingError
        return attribValue;
    }

    const Token& token() const { return tk_; }

    void nextToken() { tk_ = scn_.getNextToken(); } //throw XmlParsingError

    void expectToken(Token::Type t) //throw XmlParsingError
    {
        if (token().type != t)
            throw XmlParsingError(scn_.posRow(), scn_.posCol());
    }

    void consumeToken(Token::Type t) //throw XmlParsingError
    {
        expectToken(t); //throw XmlParsingError
        nextToken();    //
    }

    Scanner scn_;
    Token tk_;
};
}

inline
XmlDoc parseXml(const std::string& stream) //throw XmlParsingError
{
    return xml_impl::XmlParser(stream).parse(); //throw XmlParsingError
}
}

#endif //PARSER_H_81248670213764583021432
