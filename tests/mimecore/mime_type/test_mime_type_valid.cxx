#include <gtest/gtest.h>

#include <mimecore.hxx>

using namespace mimecore;

TEST(MimeTypeValidTest, NullNameThrows) {
    const char* name = nullptr;

    EXPECT_THROW((void)c_mime_type::is_valid(name), exceptions::invalid_argument_exception_t);
}

TEST(MimeTypeValidTest, AcceptsTokenPairs) {
    EXPECT_TRUE(c_mime_type::is_valid("a/b"));
    EXPECT_TRUE(c_mime_type::is_valid("application/rdf+xml"));
    EXPECT_TRUE(c_mime_type::is_valid("application/vnd.ms-excel"));
    EXPECT_TRUE(c_mime_type::is_valid(std::string("text/x-c++src")));
}

TEST(MimeTypeValidTest, RejectsMisplacedSlashes) {
    EXPECT_FALSE(c_mime_type::is_valid(""));
    EXPECT_FALSE(c_mime_type::is_valid("text"));
    EXPECT_FALSE(c_mime_type::is_valid("a//b"));
    EXPECT_FALSE(c_mime_type::is_valid("a/b/c"));
    EXPECT_FALSE(c_mime_type::is_valid("a/"));
    EXPECT_FALSE(c_mime_type::is_valid("/b"));
    EXPECT_FALSE(c_mime_type::is_valid("/"));
}

TEST(MimeTypeValidTest, RejectsControlsAndTspecials) {
    EXPECT_FALSE(c_mime_type::is_valid("text/ plain"));
    EXPECT_FALSE(c_mime_type::is_valid("text/plain\t"));
    EXPECT_FALSE(c_mime_type::is_valid(std::string_view("text/pl\0ain", 11u)));
    EXPECT_FALSE(c_mime_type::is_valid("text/pl\x7f" "ain"));
    EXPECT_FALSE(c_mime_type::is_valid("text/pl\xc3\xa4in"));

    for (const char ch : std::string_view("()<>@,;:\\\"[]?=")) {
        const auto name = fmt::format("text/pl{}ain", ch);

        EXPECT_FALSE(c_mime_type::is_valid(name)) << name;
    }
}
