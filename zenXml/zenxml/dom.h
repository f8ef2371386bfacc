// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DOM_H_82085720723894567204564256
#define DOM_H_82085720723894567204564256

#include <string>
#include <list>
#include <unordered_map>
#include "cvrt_text.h" //"readText/writeText"


namespace zen
{
/// An XML element
class XmlElement
{
public:
    XmlElement() {}

    //Construct an empty XML element
    explicit XmlElement(std::string name, XmlElement* parent = nullptr) : name_(std::move(name)), parent_(parent) {}

    ///Retrieve the name of this XML element.
    const std::string& getName() const { return name_; }

    ///Get the value of this element as a user type.
    /**
      \tparam T String-convertible user data type: std::string, bool, built-in integers or types with a readText() specialization
      \returns "true" if Xml element was successfully converted to value, cannot fail for std::string
    */
    template <class T>
    bool getValue(T& value) const { return readText(value_, value); }

    ///Set the value of this element.
    template <class T>
    void setValue(const T& value) { writeText(value, value_); }

    void setValue(std::string&& value) { value_ = std::move(value); } //perf

    ///Retrieve an attribute by name.
    /**
      \return "true" if value was retrieved successfully.
    */
    template <class T>
    bool getAttribute(const std::string& name, T& value) const
    {
        auto it = attributesByName_.find(name);
        return it == attributesByName_.end() ? false : readText(it->second->value, value);
    }

    bool hasAttribute(const std::string& name) const { return attributesByName_.contains(name); }

    ///Create or update an XML attribute.
    template <class T>
    void setAttribute(std::string name, const T& value)
    {
        std::string attrValue;
        writeText(value, attrValue);

        auto it = attributesByName_.find(name);
        if (it != attributesByName_.end())
            it->second->value = std::move(attrValue);
        else
        {
            attributes_.push_back({name, std::move(attrValue)});
            attributesByName_.emplace(std::move(name), --attributes_.end());
        }
        static_assert(std::is_same_v<decltype(attributes_), std::list<Attribute>>); //must NOT invalidate references used in "attributesByName_"!
    }

    ///Create a new child element and return a reference to it.
    XmlElement& addChild(std::string name)
    {
        childElements_.emplace_back(name, this);
        XmlElement& newElement = childElements_.back();
        childElementByName_.emplace(std::move(name), --childElements_.end()); //first child of a given name wins

        static_assert(std::is_same_v<decltype(childElements_), std::list<XmlElement>>); //must NOT invalidate references used in "childElementByName_"!
        return newElement;
    }

    ///Retrieve the first child element with the given name.
    /**
      \return A pointer to the child element or nullptr if none was found.
    */
    const XmlElement* getChild(const std::string& name) const
    {
        auto it = childElementByName_.find(name);
        return it == childElementByName_.end() ? nullptr : &*(it->second);
    }

    ///\sa getChild
    XmlElement* getChild(const std::string& name)
    {
        return const_cast<XmlElement*>(static_cast<const XmlElement*>(this)->getChild(name));
    }

    using ChildIter      = std::list<XmlElement>::iterator;
    using ChildIterConst = std::list<XmlElement>::const_iterator;

    ///Access all child elements sequentially via STL iterators.
    std::pair<ChildIterConst, ChildIterConst> getChildren() const { return {childElements_.begin(), childElements_.end()}; }

    ///\sa getChildren
    std::pair<ChildIter, ChildIter> getChildren() { return {childElements_.begin(), childElements_.end()}; }

    ///Get parent XML element, may be nullptr for root element
    const XmlElement* parent() const { return parent_; }

    struct Attribute
    {
        std::string name;
        std::string value;
    };
    using AttrIter = std::list<Attribute>::const_iterator;

    std::pair<AttrIter, AttrIter> getAttributes() const { return {attributes_.begin(), attributes_.end()}; }

    //swap two elements while keeping references to parent
    void swapSubtree(XmlElement& other) noexcept
    {
        name_              .swap(other.name_);
        value_             .swap(other.value_);
        attributes_        .swap(other.attributes_);
        attributesByName_  .swap(other.attributesByName_);
        childElements_     .swap(other.childElements_);
        childElementByName_.swap(other.childElementByName_);

        for (XmlElement& child : childElements_)
            child.parent_ = this;
        for (XmlElement& child : other.childElements_)
            child.parent_ = &other;
    }

private:
    XmlElement           (const XmlElement&) = delete;
    XmlElement& operator=(const XmlElement&) = delete;

    std::string name_;
    std::string value_;

    std::list<Attribute>                                            attributes_;       //attributes in order of creation
    std::unordered_map<std::string, std::list<Attribute>::iterator> attributesByName_; //alternate view for lookup

    std::list<XmlElement>                                            childElements_;      //child elements in order of creation
    std::unordered_map<std::string, std::list<XmlElement>::iterator> childElementByName_; //alternate view for lookup of (*first*) child by name

    XmlElement* parent_ = nullptr;
};


///The complete XML document
class XmlDoc
{
public:
    ///Default constructor setting up an empty XML document with a standard declaration: <?xml version="1.0" encoding="utf-8" ?>
    XmlDoc() {}

    XmlDoc(XmlDoc&& tmp) noexcept { swap(tmp); }
    XmlDoc& operator=(XmlDoc&& tmp) noexcept { swap(tmp); return *this; }

    ///Setup an empty XML document
    explicit XmlDoc(std::string rootName) : root_(std::move(rootName)) {}

    const XmlElement& root() const { return root_; }
    XmlElement& root() { return root_; }

    const std::string& getVersion() const { return version_; }
    void setVersion(const std::string& version) { version_ = version; }

    const std::string& getEncoding() const { return encoding_; }
    void setEncoding(const std::string& encoding) { encoding_ = encoding; }

    //Transactionally swap two elements.
    void swap(XmlDoc& other) noexcept
    {
        version_ .swap(other.version_);
        encoding_.swap(other.encoding_);
        root_.swapSubtree(other.root_);
    }

private:
    XmlDoc           (const XmlDoc&) = delete; //not implemented, thanks to XmlElement::parent_
    XmlDoc& operator=(const XmlDoc&) = delete;

    std::string version_ {"1.0"}; //non-optional for valid XML
    std::string encoding_{"utf-8"};

    XmlElement root_{"Root"};
};
}

#endif //DOM_H_82085720723894567204564256
