/***
 * Name: test_py_repr
 * Purpose: Literal rendering matches the script language's repr().
 */
#include <gtest/gtest.h>
#include "pyspect/support/py_repr.h"

using namespace pyspect;

TEST(PyRepr, StringQuoteChoice) {
  EXPECT_EQ(support::ReprString("abc"), "'abc'");
  EXPECT_EQ(support::ReprString("it's"), "\"it's\"");
  EXPECT_EQ(support::ReprString("say \"hi\""), "'say \"hi\"'");
  EXPECT_EQ(support::ReprString("both ' and \""), "'both \\' and \"'");
}

TEST(PyRepr, StringEscapes) {
  EXPECT_EQ(support::ReprString("a\nb\tc\\"), "'a\\nb\\tc\\\\'");
  EXPECT_EQ(support::ReprString(std::string("\x01", 1)), "'\\x01'");
  EXPECT_EQ(support::ReprString("caf\xC3\xA9"), "'caf\xC3\xA9'");
}

TEST(PyRepr, Bytes) {
  EXPECT_EQ(support::ReprBytes("ab"), "b'ab'");
  EXPECT_EQ(support::ReprBytes(std::string("\xff\x00", 2)), "b'\\xff\\x00'");
}

TEST(PyRepr, IntegersNormalizeToDecimal) {
  EXPECT_EQ(support::ReprIntLiteral("0xff"), "255");
  EXPECT_EQ(support::ReprIntLiteral("0o17"), "15");
  EXPECT_EQ(support::ReprIntLiteral("0b101"), "5");
  EXPECT_EQ(support::ReprIntLiteral("1_000_000"), "1000000");
  EXPECT_EQ(support::ReprIntLiteral("0xFFFFFFFFFFFFFFFFFF"), "4722366482869645213695");
}

TEST(PyRepr, FloatsShortestRoundTrip) {
  EXPECT_EQ(support::ReprFloat(1.0), "1.0");
  EXPECT_EQ(support::ReprFloat(0.1), "0.1");
  EXPECT_EQ(support::ReprFloat(1e16), "1e+16");
  EXPECT_EQ(support::ReprFloat(1e15), "1000000000000000.0");
  EXPECT_EQ(support::ReprFloat(0.0001), "0.0001");
  EXPECT_EQ(support::ReprFloat(0.00001), "1e-05");
  EXPECT_EQ(support::ReprFloatLiteral("1_0.5"), "10.5");
}

TEST(PyRepr, Imaginary) {
  EXPECT_EQ(support::ReprImagLiteral("1j"), "1j");
  EXPECT_EQ(support::ReprImagLiteral("2.50J"), "2.5j");
}
