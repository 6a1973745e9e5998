#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "this is some text";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"this", "is", "some", "text"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "compile-executor-0\n\ncompile-executor-1\n";
  auto pieces = util::split(str, '\n');
  EXPECT_THAT(pieces,
              ElementsAreArray({"compile-executor-0", "compile-executor-1"}));
}

/*
 * Trim
 */

// NOLINTNEXTLINE
TEST(Misc, Trim) {
  EXPECT_EQ(util::trim("  true\n"), "true");
  EXPECT_EQ(util::trim("\t\n "), "");
  EXPECT_EQ(util::trim("a b"), "a b");
}

/*
 * Shell quoting
 */

// NOLINTNEXTLINE
TEST(Misc, ShellQuote) {
  EXPECT_EQ(util::shellQuote("Main.java"), "'Main.java'");
  EXPECT_EQ(util::shellQuote(""), "''");
  EXPECT_EQ(util::shellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(util::shellQuote("$(rm -rf /)"), "'$(rm -rf /)'");
}

// NOLINTNEXTLINE
TEST(Misc, ShellJoin) {
  EXPECT_EQ(util::shellJoin({"javac", "-encoding", "UTF-8", "Hi.java"}),
            "'javac' '-encoding' 'UTF-8' 'Hi.java'");
  EXPECT_EQ(util::shellJoin({}), "");
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  util::setBool(&x)();
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  util::setString(&x)("wow");
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int32_t x = 0;
  util::setInt(&x)("42");
  EXPECT_EQ(x, 42);
}

// NOLINTNEXTLINE
TEST(Misc, SetUInt) {
  uint32_t x = 0;
  util::setUint(&x)("42");
  EXPECT_EQ(x, 42);
}

}  // namespace
