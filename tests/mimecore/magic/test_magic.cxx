#include <gtest/gtest.h>

#include <mimecore.hxx>

using namespace mimecore;
using namespace mimecore::magic;

namespace {
    std::vector<std::uint8_t> to_bytes(const std::string_view& str) {
        return std::vector<std::uint8_t>(str.begin(), str.end());
    }
}

TEST(MagicTest, BytesMagicMatchesAtOffset) {
    bytes_magic_t pdf(0u, "%PDF-");
    bytes_magic_t tar(257u, "ustar");

    const auto doc = to_bytes("%PDF-1.7\n...");

    EXPECT_TRUE(pdf.eval(doc));
    EXPECT_FALSE(tar.eval(doc));

    EXPECT_EQ(pdf.min_length(), 5u);
    EXPECT_EQ(tar.min_length(), 262u);
    EXPECT_EQ(tar.offset(), 257u);

    std::vector<std::uint8_t> archive(300u, 0u);

    std::copy_n("ustar", 5, archive.begin() + 257);

    EXPECT_TRUE(tar.eval(archive));
}

TEST(MagicTest, BytesMagicShortBufferIsNoMatch) {
    bytes_magic_t png(0u, std::vector<std::uint8_t>{0x89, 'P', 'N', 'G'});

    EXPECT_FALSE(png.eval(to_bytes("")));
    EXPECT_FALSE(png.eval(std::vector<std::uint8_t>{0x89, 'P', 'N'}));
    EXPECT_TRUE(png.eval(std::vector<std::uint8_t>{0x89, 'P', 'N', 'G', 0x0d}));
}

TEST(MagicTest, EmptyPatternThrows) {
    EXPECT_THROW(bytes_magic_t(0u, ""), exceptions::invalid_argument_exception_t);
}

TEST(MagicTest, FnMagicWrapsCallable) {
    auto calls = std::make_shared<int>(0);

    auto magic = make_magic([calls](bytes_t data) {
        ++*calls;

        return !data.empty() && data[0] == '{';
    }, 1u);

    EXPECT_TRUE(magic->eval(to_bytes("{\"a\":1}")));
    EXPECT_FALSE(magic->eval(to_bytes("[]")));
    EXPECT_FALSE(magic->eval(bytes_t{}));

    EXPECT_EQ(magic->min_length(), 1u);
    EXPECT_EQ(*calls, 3);
}

TEST(MagicTest, BytesMagicOffsetPastBufferIsNoMatch) {
    bytes_magic_t magic(std::numeric_limits<std::size_t>::max() - 2u, "ab");

    EXPECT_EQ(magic.min_length(), std::numeric_limits<std::size_t>::max());

    EXPECT_FALSE(magic.eval(to_bytes("abc")));
    EXPECT_FALSE(magic.eval(bytes_t{}));

    EXPECT_FALSE(bytes_magic_t(4u, "ab").eval(to_bytes("abc")));
}

TEST(MagicTest, BytesMagicOverflowingOffsetThrows) {
    EXPECT_THROW(bytes_magic_t(std::numeric_limits<std::size_t>::max() - 1u, "ab"), exceptions::invalid_argument_exception_t);
    EXPECT_THROW(bytes_magic_t(std::numeric_limits<std::size_t>::max(), "a"), exceptions::invalid_argument_exception_t);
}
