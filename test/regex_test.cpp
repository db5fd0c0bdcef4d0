#include "exp.h"
#include "regex_yaml.h"

#include "gtest/gtest.h"

namespace YTree {
namespace {

TEST(RegExTest, SingleCharactersAndRanges) {
  EXPECT_TRUE(Exp::Digit().Matches('7'));
  EXPECT_FALSE(Exp::Digit().Matches('x'));
  EXPECT_TRUE(Exp::Hex().Matches('c'));
  EXPECT_TRUE(Exp::Hex().Matches('F'));
  EXPECT_FALSE(Exp::Hex().Matches('g'));
}

TEST(RegExTest, SequencesReportMatchedLength) {
  EXPECT_EQ(4, Exp::DocStart().Match("--- x"));
  EXPECT_EQ(-1, Exp::DocStart().Match("---x"));
  EXPECT_EQ(-1, Exp::DocStart().Match("-- x"));
}

TEST(RegExTest, MappingIndicatorNeedsFollowingBlank) {
  EXPECT_TRUE(Exp::EndScalar().Matches(": x"));
  EXPECT_FALSE(Exp::EndScalar().Matches(":x"));
  EXPECT_FALSE(Exp::EndScalarInFlow().Matches(":x"));
  EXPECT_TRUE(Exp::EndScalarInFlow().Matches(", x"));
}

TEST(RegExTest, NegationAndCombinators) {
  RegEx notSpace = !Exp::Space();
  EXPECT_TRUE(notSpace.Matches('a'));
  EXPECT_FALSE(notSpace.Matches(' '));

  RegEx hexAndLetter = Exp::Hex() && Exp::Alpha();
  EXPECT_TRUE(hexAndLetter.Matches('b'));
  EXPECT_FALSE(hexAndLetter.Matches('5'));
}

}  // namespace
}  // namespace YTree
