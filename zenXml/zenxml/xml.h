// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef XML_H_349578228034572457454554
#define XML_H_349578228034572457454554

#include <memory>
#include <unordered_set>
#include <zen/file_io.h>
#include "parser.h"


/// The zen::Xml namespace
namespace zen
{
/**
\file
\brief Load XML documents from files and map them to user data
*/

///Load XML document from a file
/**
\param filePath Input file path
\returns The loaded XML document
\throw FileError
*/
inline
XmlDoc loadXml(const Zstring& filePath) //throw FileError
{
    const std::string stream = getFileContent(filePath); //throw FileError

    std::string_view header = stream;
    if (startsWith(header, xml_impl::BYTE_ORDER_MARK_UTF8))
        header.remove_prefix(xml_impl::BYTE_ORDER_MARK_UTF8.size());

    if (!startsWith(trimCpy(header, true /*fromLeft*/, false /*fromRight*/), '<'))
        throw FileError(replaceCpy("File %x does not contain a valid configuration.", "%x", fmtPath(filePath)));

    try
    {
        return parseXml(stream); //throw XmlParsingError
    }
    catch (const XmlParsingError& e)
    {
        throw FileError(
            replaceCpy(replaceCpy(replaceCpy("Error parsing file %x, row %y, column %z.",
                                             "%x", fmtPath(filePath)),
                                  "%y", numberTo<std::string>(e.row + 1)),
                       "%z", numberTo<std::string>(e.col + 1)));
    }
}


///Save XML document to a file
inline
void saveXml(const XmlDoc& doc, const Zstring& filePath) //throw FileError
{
    setFileContent(filePath, serializeXml(doc)); //throw FileError
}


///Proxy class to conveniently convert user data into XML structure
class XmlOut
{
public:
    ///Construct an output proxy for an XML document
    /**
    \code
        zen::XmlDoc doc("CompleteMultipartUpload");

        zen::XmlOut out(doc);
        zen::XmlOut part = out.addChild("Part");
        part["PartNumber"](1);
        part["ETag"](std::string("\"a54357aff0632cce46d942af68356b38\""));
    \endcode
    */
    explicit XmlOut(XmlDoc& doc) : ref_(doc.root()) {}

    ///Retrieve a handle to an XML child element for writing
    /**
    The child element will be created if it is not yet existing.
    */
    XmlOut operator[](std::string name) const
    {
        XmlElement* child = ref_.getChild(name);
        return XmlOut(child ? *child : ref_.addChild(std::move(name)));
    }

    ///Add a child element, allowing for multiple elements with the same name.
    XmlOut addChild(std::string name) const
    {
        return XmlOut(ref_.addChild(std::move(name)));
    }

    ///Write user data to the underlying XML element
    template <class T>
    void operator()(const T& value) { ref_.setValue(value); }

    ///Write user data to an XML attribute
    template <class T>
    void attribute(std::string name, const T& value) { ref_.setAttribute(std::move(name), value); }

private:
    explicit XmlOut(XmlElement& element) : ref_(element) {}

    XmlElement& ref_;
};


///Proxy class to conveniently convert XML structure to user data
class XmlIn
{
    struct ErrorLog;

public:
    ///Construct an input proxy for an XML document
    /**
    \code
        zen::XmlIn in(doc);
        in["Parallel"](cfg.parallel); //
        in["DryRun"  ](cfg.dryRun);   //read data from XML elements
    \endcode
    */
    explicit XmlIn(const XmlDoc& doc) : XmlIn(&doc.root(), '<' + doc.root().getName() + '>', std::make_shared<ErrorLog>()) {}

    ///Retrieve a handle to an XML child element for reading
    /**
    It is \b not an error if the child element does not exist, but only later if a conversion to user data is attempted.
    */
    XmlIn operator[](const std::string& name) const
    {
        return XmlIn(elem_ ? elem_->getChild(name) : nullptr, elementNameFmt_ + " <" + name + '>', log_);
    }

    ///Iterate over XML child elements, optionally restricted to a given element name
    template <class Function>
    void visitChildren(Function fun, const std::string& childName = {})
    {
        if (!elem_)
            logMissingElement();
        else
        {
            auto [it, itEnd] = elem_->getChildren();
            size_t childIdx = 0;
            std::for_each(it, itEnd, [&](const XmlElement& child)
            {
                if (childName.empty() || child.getName() == childName)
                    fun(XmlIn(&child, elementNameFmt_ + " <" + child.getName() + ">[" + numberTo<std::string>(++childIdx) + ']', log_));
            });
        }
    }

    ///Test whether the underlying XML element exists
    explicit operator bool() const { return elem_; }

    ///Read user data from the underlying XML element
    /**
    \return "true" if data was read successfully
    */
    template <class T>
    bool operator()(T& value) const
    {
        if (elem_)
        {
            if (elem_->getValue(value))
                return true;

            logConversionError();
        }
        else
            logMissingElement();

        return false;
    }

    ///Read user data from an XML attribute
    template <class T>
    bool attribute(const std::string& name, T& value) const
    {
        if (elem_)
        {
            if (elem_->getAttribute(name, value))
                return true;

            logMissingAttribute(name);
        }
        else
            logMissingElement();

        return false;
    }

    ///Get a list of XML element and attribute names which failed to convert to user data.
    /**
    Error logging is shared by each hierarchy of XmlIn proxy instances that are created from each other.
      \returns A list of XML element and attribute names, empty if no errors occured.
    */
    const std::string& getErrors() const { return log_->failedElements; }

private:
    XmlIn(const XmlElement* elem,
          const std::string& elementNameFmt,
          const std::shared_ptr<ErrorLog>& sharedlog) : log_(sharedlog), elem_(elem), elementNameFmt_(elementNameFmt) {}

    struct ErrorLog
    {
        std::string failedElements; //unique list of failed elements
        std::unordered_set<std::string> usedElements;
    };

    void logElementError(const std::string& elementName) const
    {
        if (const auto [it, inserted] = log_->usedElements.insert(elementName);
            inserted)
        {
            if (!log_->failedElements.empty())
                log_->failedElements += '\n';
            log_->failedElements += elementName;
        }
    }

    void logConversionError() const                               { logElementError(elementNameFmt_); }
    void logMissingElement() const                                { logElementError(elementNameFmt_); }
    void logMissingAttribute(const std::string& attribName) const { logElementError(elementNameFmt_ + " @" + attribName); }

    std::shared_ptr<ErrorLog> log_;
    const XmlElement* elem_;
    std::string elementNameFmt_; //e.g. "<S3Mirror> <Sync> <Filter>[1]"
};
}

#endif //XML_H_349578228034572457454554
