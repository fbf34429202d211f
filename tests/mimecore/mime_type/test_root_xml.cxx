#include <gtest/gtest.h>

#include <mimecore.hxx>

using namespace mimecore;

TEST(RootXmlTest, BothEmptyThrows) {
    EXPECT_THROW(root_xml_t("application/xml", "", ""), exceptions::invalid_argument_exception_t);
}

TEST(RootXmlTest, LocalNameOnly) {
    root_xml_t root_xml("application/xml", "", "root");

    EXPECT_TRUE(root_xml.matches("", "root"));

    EXPECT_FALSE(root_xml.matches("anything", "root"));
    EXPECT_FALSE(root_xml.matches("", "other"));
    EXPECT_FALSE(root_xml.matches("", ""));
}

TEST(RootXmlTest, NamespaceOnly) {
    root_xml_t root_xml("application/atom+xml", "http://www.w3.org/2005/Atom", "");

    EXPECT_TRUE(root_xml.matches("http://www.w3.org/2005/Atom", ""));

    EXPECT_FALSE(root_xml.matches("http://www.w3.org/2005/Atom", "feed"));
    EXPECT_FALSE(root_xml.matches("", ""));
}

TEST(RootXmlTest, NamespaceAndLocalName) {
    root_xml_t root_xml("application/rss+xml", "http://purl.org/rss/1.0/", "RDF");

    EXPECT_TRUE(root_xml.matches("http://purl.org/rss/1.0/", "RDF"));

    EXPECT_FALSE(root_xml.matches("http://purl.org/rss/1.0/", "rdf"));
    EXPECT_FALSE(root_xml.matches("", "RDF"));
    EXPECT_FALSE(root_xml.matches("http://purl.org/rss/1.0", "RDF"));
}

TEST(RootXmlTest, Accessors) {
    root_xml_t root_xml("image/svg+xml", "http://www.w3.org/2000/svg", "svg");

    EXPECT_EQ(root_xml.type_name(), "image/svg+xml");
    EXPECT_EQ(root_xml.namespace_uri(), "http://www.w3.org/2000/svg");
    EXPECT_EQ(root_xml.local_name(), "svg");

    EXPECT_EQ(root_xml.to_string(), "image/svg+xml, http://www.w3.org/2000/svg, svg");
    EXPECT_EQ(fmt::format("{}", root_xml), root_xml.to_string());
}
