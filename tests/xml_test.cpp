// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zenxml/xml.h>

using namespace zen;


TEST(Xml, ParseElementsAttributesAndEntities)
{
    const XmlDoc doc = parseXml(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<!-- comment -->\n"
        "<Root version=\"3\">\n"
        "    <Name>R&amp;D &lt;team&gt; &quot;x&quot; &apos;y&apos;</Name>\n"
        "    <Item>1</Item>\n"
        "    <Item>2</Item>\n"
        "    <Other/>\n"
        "    <Item>3</Item>\n"
        "    <Cdata><![CDATA[<raw & text>]]></Cdata>\n"
        "</Root>");

    EXPECT_EQ(doc.root().getName(), "Root");

    XmlIn in(doc);
    int version = 0;
    EXPECT_TRUE(in.attribute("version", version));
    EXPECT_EQ(version, 3);

    std::string name;
    EXPECT_TRUE(in["Name"](name));
    EXPECT_EQ(name, "R&D <team> \"x\" 'y'");

    std::string cdata;
    EXPECT_TRUE(in["Cdata"](cdata));
    EXPECT_EQ(cdata, "<raw & text>");

    std::vector<int> items;
    in.visitChildren([&](XmlIn inItem)
    {
        int item = 0;
        if (inItem(item))
            items.push_back(item);
    }, "Item");
    EXPECT_EQ(items, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(in.getErrors().empty());
}


TEST(Xml, MappingErrorsAreCollected)
{
    const XmlDoc doc = parseXml("<Root><Number>abc</Number><Flag>yes</Flag><Ok>42</Ok></Root>");

    XmlIn in(doc);
    int number = 7;
    bool flag = false;
    int ok = 0;
    std::string missing;

    EXPECT_FALSE(in["Number"](number));
    EXPECT_FALSE(in["Flag"](flag));
    EXPECT_TRUE (in["Ok"](ok));
    EXPECT_FALSE(in["Missing"](missing));
    EXPECT_FALSE(in["Missing"]);

    EXPECT_EQ(number, 7); //unchanged on error
    EXPECT_EQ(ok, 42);

    const std::string errors = in.getErrors();
    EXPECT_TRUE(contains(errors, "<Number>"));
    EXPECT_TRUE(contains(errors, "<Flag>"));
    EXPECT_TRUE(contains(errors, "<Missing>"));
    EXPECT_FALSE(contains(errors, "<Ok>"));
}


TEST(Xml, SerializeAndParseBack)
{
    XmlDoc doc("Config");
    doc.root().setAttribute("note", std::string("a \"quoted\" value"));

    XmlOut out(doc);
    out["Sync"]["Parallel"](16);
    out["Sync"]["DryRun"](true);
    out["Sync"]["Pattern"](std::string("\\.txt$ & <more>"));

    const std::string stream = serializeXml(doc);
    EXPECT_TRUE(startsWith(stream, "<?xml version=\"1.0\" encoding=\"utf-8\"?>"));
    EXPECT_TRUE(contains(stream, "<DryRun>true</DryRun>"));
    EXPECT_TRUE(contains(stream, "&amp; &lt;more&gt;"));

    const XmlDoc doc2 = parseXml(stream);
    XmlIn in(doc2);

    size_t parallel = 0;
    bool dryRun = false;
    std::string pattern;
    std::string note;
    EXPECT_TRUE(in["Sync"]["Parallel"](parallel));
    EXPECT_TRUE(in["Sync"]["DryRun"](dryRun));
    EXPECT_TRUE(in["Sync"]["Pattern"](pattern));
    EXPECT_TRUE(in.attribute("note", note));

    EXPECT_EQ(parallel, 16u);
    EXPECT_TRUE(dryRun);
    EXPECT_EQ(pattern, "\\.txt$ & <more>");
    EXPECT_EQ(note, "a \"quoted\" value");
}


TEST(Xml, ParsingErrorPosition)
{
    try
    {
        parseXml("<Root>\n  <A>1</A>\n  <B>2</C>\n</Root>");
        FAIL() << "XmlParsingError expected";
    }
    catch (const XmlParsingError& e)
    {
        EXPECT_EQ(e.row, 2u);
    }

    EXPECT_THROW(parseXml(""), XmlParsingError);
    EXPECT_THROW(parseXml("<Root>"), XmlParsingError);
}
