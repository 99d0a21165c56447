#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include <zkguest/core/buf.h>

#include "utils/test_macros.h"

namespace {

using namespace zkguest;

TEST(Buf, DefaultConstructor) {
  buf_t buf;
  EXPECT_EQ(buf.size(), 0);
  EXPECT_TRUE(buf.empty());
}

TEST(Buf, SizedIsZeroed) {
  buf_t small(8), large(100);
  for (int i = 0; i < small.size(); i++) EXPECT_EQ(small[i], 0);
  for (int i = 0; i < large.size(); i++) EXPECT_EQ(large[i], 0);
}

TEST(Buf, ConstructFromMem) {
  std::string test_str = "Hello";
  buf_t buf(test_str);

  EXPECT_EQ(buf.size(), (int)test_str.size());
  EXPECT_EQ(buf.to_string(), test_str);
}

TEST(Buf, MoveLeavesSourceEmpty) {
  {  // inline storage
    buf_t original(5);
    for (int i = 0; i < 5; ++i) original[i] = static_cast<uint8_t>(i + 10);

    buf_t moved(std::move(original));
    EXPECT_EQ(moved.size(), 5);
    EXPECT_EQ(moved[4], 14);
    EXPECT_TRUE(original.empty());
  }

  {  // heap storage
    buf_t original(100);
    original[99] = 0x42;

    buf_t moved;
    moved = std::move(original);
    EXPECT_EQ(moved.size(), 100);
    EXPECT_EQ(moved[99], 0x42);
    EXPECT_TRUE(original.empty());
  }
}

TEST(Buf, ResizeAcrossInlineLimit) {
  buf_t buf(mem_t("0123456789"));

  buf.resize(64);
  EXPECT_EQ(buf.size(), 64);
  EXPECT_EQ(buf.take(10).to_string(), "0123456789");
  EXPECT_EQ(buf[63], 0);

  buf.resize(4);
  EXPECT_EQ(buf.size(), 4);
  EXPECT_EQ(buf.to_string(), "0123");
}

TEST(Buf, ShrinkThenGrowReadsZeros) {
  buf_t buf(mem_t("abcdef"));
  buf.resize(2);
  buf.resize(6);
  EXPECT_EQ(buf.take(2).to_string(), "ab");
  for (int i = 2; i < 6; i++) EXPECT_EQ(buf[i], 0);
}

TEST(Buf, Append) {
  buf_t buf;
  buf += mem_t("abc");
  buf += mem_t("");
  buf += mem_t("defghijklmnopqrstuvwxyz0123456789ABCDEFG");
  EXPECT_EQ(buf.size(), 43);
  EXPECT_EQ(buf.take(6).to_string(), "abcdef");

  buf_t joined = mem_t("ab") + mem_t("cd");
  EXPECT_EQ(joined.to_string(), "abcd");
}

TEST(Buf, Equality) {
  buf_t a(mem_t("same"));
  buf_t b(mem_t("same"));
  buf_t c(mem_t("diff"));

  EXPECT_TRUE(a == b);
  EXPECT_TRUE(a != c);
  EXPECT_TRUE(mem_t(a) == b);
  EXPECT_FALSE(mem_t(a) == mem_t("sam"));
  EXPECT_TRUE(mem_t() == buf_t());
}

TEST(Buf, Hex) {
  const byte_t bytes[] = {0x00, 0xff, 0x30, 0x39};
  EXPECT_EQ(to_hex(mem_t(bytes, 4)), "00ff3039");
  EXPECT_EQ(to_hex(mem_t()), "");

  std::ostringstream os;
  os << mem_t(bytes, 2);
  EXPECT_EQ(os.str(), "00ff");
}

TEST(Buf, BigEndianWords) {
  byte_t bin[8];
  be_set_8(bin, 0x1122334455667788ull);
  EXPECT_EQ(bin[0], 0x11);
  EXPECT_EQ(bin[7], 0x88);
  EXPECT_EQ(be_get_8(bin), 0x1122334455667788ull);
}

}  // namespace
