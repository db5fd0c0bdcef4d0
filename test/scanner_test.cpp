#include "ytree/exceptions.h"
#include "ytree/tokenizer.h"

#include <sstream>

#include "gtest/gtest.h"

namespace YTree {
namespace {

std::vector<Token::TYPE> StructureOf(const std::vector<Token>& tokens) {
  std::vector<Token::TYPE> types;
  for (std::size_t i = 0; i < tokens.size(); i++) {
    if (tokens[i].type != Token::COMMENT)
      types.push_back(tokens[i].type);
  }
  return types;
}

std::vector<Token> OfType(const std::vector<Token>& tokens, Token::TYPE type) {
  std::vector<Token> found;
  for (std::size_t i = 0; i < tokens.size(); i++) {
    if (tokens[i].type == type)
      found.push_back(tokens[i]);
  }
  return found;
}

LexError::Kind LexErrorKindOf(const std::string& input) {
  try {
    ScanTokens(input);
  } catch (const LexError& e) {
    return e.kind;
  }
  ADD_FAILURE() << "no LexError for: " << input;
  return LexError::InvalidCharacter;
}

TEST(ScannerTest, EmptyInputIsJustTheStream) {
  std::vector<Token> tokens = ScanTokens("");
  ASSERT_EQ(2u, tokens.size());
  EXPECT_EQ(Token::STREAM_START, tokens[0].type);
  EXPECT_EQ(Token::STREAM_END, tokens[1].type);
}

TEST(ScannerTest, SimpleMap) {
  std::vector<Token> tokens = ScanTokens("a: b");
  const Token::TYPE expected[] = {Token::STREAM_START, Token::BLOCK_MAP_START,
                                  Token::KEY,          Token::SCALAR,
                                  Token::VALUE,        Token::SCALAR,
                                  Token::BLOCK_MAP_END, Token::STREAM_END};
  EXPECT_EQ(std::vector<Token::TYPE>(expected, expected + 8),
            StructureOf(tokens));
  EXPECT_EQ("a", tokens[3].value);
  EXPECT_EQ(ScalarStyle::Plain, tokens[3].style);
  EXPECT_EQ("b", tokens[5].value);
}

TEST(ScannerTest, BlockSequence) {
  const Token::TYPE expected[] = {Token::STREAM_START, Token::BLOCK_SEQ_START,
                                  Token::BLOCK_ENTRY,  Token::SCALAR,
                                  Token::BLOCK_ENTRY,  Token::SCALAR,
                                  Token::BLOCK_SEQ_END, Token::STREAM_END};
  EXPECT_EQ(std::vector<Token::TYPE>(expected, expected + 8),
            StructureOf(ScanTokens("- a\n- b\n")));
}

TEST(ScannerTest, FlowSequence) {
  const Token::TYPE expected[] = {Token::STREAM_START, Token::FLOW_SEQ_START,
                                  Token::SCALAR,       Token::FLOW_ENTRY,
                                  Token::SCALAR,       Token::FLOW_SEQ_END,
                                  Token::STREAM_END};
  EXPECT_EQ(std::vector<Token::TYPE>(expected, expected + 7),
            StructureOf(ScanTokens("[a, b]")));
}

TEST(ScannerTest, DedentClosesEveryOpenBlock) {
  std::vector<Token> tokens = ScanTokens("a:\n  b:\n    c: 1\nd: 2\n");
  EXPECT_EQ(3u, OfType(tokens, Token::BLOCK_MAP_START).size());
  EXPECT_EQ(3u, OfType(tokens, Token::BLOCK_MAP_END).size());

  std::vector<Token> scalars = OfType(tokens, Token::SCALAR);
  ASSERT_EQ(6u, scalars.size());
  EXPECT_EQ("d", scalars[4].value);
  EXPECT_EQ(3, scalars[4].mark.line);
  EXPECT_EQ(0, scalars[4].mark.column);
}

TEST(ScannerTest, MultiLinePlainScalarFolds) {
  std::vector<Token> scalars = OfType(ScanTokens("a: one\n  two\n"), Token::SCALAR);
  ASSERT_EQ(2u, scalars.size());
  EXPECT_EQ("one two", scalars[1].value);
}

TEST(ScannerTest, QuotedScalars) {
  std::vector<Token> scalars =
      OfType(ScanTokens("- 'it''s'\n- \"tab\\there\"\n"), Token::SCALAR);
  ASSERT_EQ(2u, scalars.size());
  EXPECT_EQ("it's", scalars[0].value);
  EXPECT_EQ(ScalarStyle::SingleQuoted, scalars[0].style);
  EXPECT_EQ("tab\there", scalars[1].value);
  EXPECT_EQ(ScalarStyle::DoubleQuoted, scalars[1].style);
}

TEST(ScannerTest, BlockScalarsHonourChomping) {
  std::vector<Token> scalars = OfType(
      ScanTokens("a: |\n  one\n  two\n\nb: >-\n  folded\n  text\nc: |+\n  kept\n\n"),
      Token::SCALAR);
  ASSERT_EQ(6u, scalars.size());
  EXPECT_EQ("one\ntwo\n", scalars[1].value);
  EXPECT_EQ(ScalarStyle::Literal, scalars[1].style);
  EXPECT_EQ("folded text", scalars[3].value);
  EXPECT_EQ(ScalarStyle::Folded, scalars[3].style);
  EXPECT_EQ("kept\n\n", scalars[5].value);
}

TEST(ScannerTest, CommentsAreTokens) {
  std::vector<Token> comments =
      OfType(ScanTokens("# top\na: 1 # trailing\n"), Token::COMMENT);
  ASSERT_EQ(2u, comments.size());
  EXPECT_EQ("top", comments[0].value);
  EXPECT_EQ(0, comments[0].data);
  EXPECT_EQ("trailing", comments[1].value);
  EXPECT_EQ(1, comments[1].data);
}

TEST(ScannerTest, Directive) {
  std::vector<Token> tokens = ScanTokens("%YAML 1.2\n---\na\n");
  std::vector<Token> directives = OfType(tokens, Token::DIRECTIVE);
  ASSERT_EQ(1u, directives.size());
  EXPECT_EQ("YAML", directives[0].value);
  ASSERT_EQ(1u, directives[0].params.size());
  EXPECT_EQ("1.2", directives[0].params[0]);
  EXPECT_EQ(1u, OfType(tokens, Token::DOC_START).size());
}

TEST(ScannerTest, TagHandles) {
  std::vector<Token> tags =
      OfType(ScanTokens("- !!str a\n- !local b\n- !<tag:x.org,2000:c> c\n"),
             Token::TAG);
  ASSERT_EQ(3u, tags.size());
  EXPECT_EQ("!!", tags[0].value);
  EXPECT_EQ("str", tags[0].params[0]);
  EXPECT_EQ("!", tags[1].value);
  EXPECT_EQ("local", tags[1].params[0]);
  EXPECT_EQ("", tags[2].value);
  EXPECT_EQ("tag:x.org,2000:c", tags[2].params[0]);
}

TEST(ScannerTest, AnchorAndAlias) {
  std::vector<Token> tokens = ScanTokens("- &x a\n- *x\n");
  std::vector<Token> anchors = OfType(tokens, Token::ANCHOR);
  std::vector<Token> aliases = OfType(tokens, Token::ALIAS);
  ASSERT_EQ(1u, anchors.size());
  ASSERT_EQ(1u, aliases.size());
  EXPECT_EQ("x", anchors[0].value);
  EXPECT_EQ("x", aliases[0].value);
}

TEST(ScannerTest, TokenizerPullsOneAtATime) {
  std::stringstream stream("[1, 2]");
  Tokenizer tokenizer(stream);
  Token token(Token::STREAM_START, Mark());
  std::size_t count = 0;
  while (tokenizer.Next(token))
    count++;
  EXPECT_EQ(7u, count);
  EXPECT_EQ(Token::STREAM_END, token.type);
  EXPECT_FALSE(tokenizer.Next(token));
}

TEST(ScannerTest, UnterminatedQuoteReportsTheOpeningQuote) {
  try {
    ScanTokens("a: 1\nkey: \"never closed\n  still going\n");
    FAIL() << "expected a LexError";
  } catch (const LexError& e) {
    EXPECT_EQ(LexError::UnterminatedScalar, e.kind);
    EXPECT_EQ(1, e.mark.line);
    EXPECT_EQ(5, e.mark.column);
  }
}

TEST(ScannerTest, Errors) {
  EXPECT_EQ(LexError::TabInIndentation, LexErrorKindOf("a:\n\tb: 1\n"));
  EXPECT_EQ(LexError::InconsistentIndentation,
            LexErrorKindOf("a:\n    b: 1\n  c: 2\n"));
  EXPECT_EQ(LexError::InvalidEscape, LexErrorKindOf("\"bad \\q escape\""));
  EXPECT_EQ(LexError::InvalidEncoding, LexErrorKindOf("a: \xC3\x28\n"));
  EXPECT_EQ(LexError::UnterminatedScalar, LexErrorKindOf("'open"));
  EXPECT_EQ(LexError::UnterminatedScalar, LexErrorKindOf("\"abc\n"));
  EXPECT_EQ(LexError::UnterminatedScalar, LexErrorKindOf("[\"abc\n\n]\n"));
}

TEST(ScannerTest, ErrorMessageCarriesThePosition) {
  try {
    ScanTokens("x: 'open");
    FAIL() << "expected a LexError";
  } catch (const Exception& e) {
    EXPECT_STREQ("ytree: error at line 1, column 4: illegal EOF in scalar",
                 e.what());
  }
}
}  // namespace
}  // namespace YTree
