#include "ytree/eventhandler.h"
#include "ytree/yaml.h"  // IWYU pragma: keep

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::StrictMock;

#define EXPECT_THROW_PARSE_ERROR(statement, error_kind) \
  try {                                                  \
    statement;                                           \
    ADD_FAILURE() << "expected a ParseError";            \
  }                                                      \
  catch (const ParseError& e) {                          \
    EXPECT_EQ(error_kind, e.kind) << e.what();           \
  }

namespace YTree {
namespace {

class MockEventHandler : public EventHandler {
 public:
  MOCK_METHOD3(OnDocumentStart, void(const Mark&, const Directives&, bool));
  MOCK_METHOD2(OnDocumentEnd, void(const Mark&, bool));

  MOCK_METHOD2(OnAlias, void(const Mark&, const std::string&));
  MOCK_METHOD5(OnScalar, void(const Mark&, const std::string&,
                              const std::string&, const std::string&,
                              ScalarStyle::value));

  MOCK_METHOD4(OnSequenceStart, void(const Mark&, const std::string&,
                                     const std::string&,
                                     CollectionStyle::value));
  MOCK_METHOD1(OnSequenceEnd, void(const Mark&));

  MOCK_METHOD4(OnMapStart, void(const Mark&, const std::string&,
                                const std::string&, CollectionStyle::value));
  MOCK_METHOD1(OnMapEnd, void(const Mark&));
};

class HandlerTest : public ::testing::Test {
 protected:
  void Parse(const std::string& example,
             const ParserOptions& options = ParserOptions()) {
    std::stringstream stream(example);
    Parser parser(stream, options);
    while (parser.HandleNextDocument(handler)) {
    }
  }

  void IgnoreParse(const std::string& example,
                   const ParserOptions& options = ParserOptions()) {
    std::stringstream stream(example);
    Parser parser(stream, options);
    while (parser.HandleNextDocument(nice_handler)) {
    }
  }

  InSequence sequence;
  StrictMock<MockEventHandler> handler;
  NiceMock<MockEventHandler> nice_handler;
};

TEST_F(HandlerTest, EmptyStreamHasNoDocuments) {
  Parse("");
  Parse("# only a comment\n");
}

TEST_F(HandlerTest, PlainScalarStartingWithQuestionMark) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnMapStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "foo", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "?bar", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnMapEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("foo: ?bar");
}

TEST_F(HandlerTest, QuotedScalarsAreNonSpecific) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnSequenceStart(_, "?", "", CollectionStyle::Flow));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "!", "", "b", ScalarStyle::SingleQuoted));
  EXPECT_CALL(handler, OnScalar(_, "!", "", "c", ScalarStyle::DoubleQuoted));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("[a, 'b', \"c\"]");
}

TEST_F(HandlerTest, EmptyValueIsEmptyPlainScalar) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnMapStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "b", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "1", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnMapEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("a:\nb: 1\n");
}

TEST_F(HandlerTest, AnchorAndAlias) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnSequenceStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler, OnScalar(_, "?", "x", "value", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnAlias(_, "x"));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("- &x value\n- *x\n");
}

TEST_F(HandlerTest, PropertiesOnCollections) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnMapStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "list", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnSequenceStart(_, "tag:yaml.org,2002:seq", "l",
                                       CollectionStyle::Flow));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnMapEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("list: &l !!seq []\n");
}

TEST_F(HandlerTest, TagShorthands) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnSequenceStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler,
              OnScalar(_, "tag:yaml.org,2002:str", "", "5", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "!local", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler,
              OnScalar(_, "tag:x.org,2000:v", "", "b", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "!", "", "c", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("- !!str 5\n- !local a\n- !<tag:x.org,2000:v> b\n- ! c\n");
}

TEST_F(HandlerTest, NamedTagHandle) {
  EXPECT_CALL(handler,
              OnDocumentStart(_, Field(&Directives::tags, testing::SizeIs(1)),
                              true));
  EXPECT_CALL(handler, OnScalar(_, "tag:example.com,2000:app/foo", "", "bar",
                                ScalarStyle::Plain));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("%TAG !e! tag:example.com,2000:app/\n--- !e!foo bar\n");
}

TEST_F(HandlerTest, BlockScalars) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnMapStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "lit", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "!", "", "a\nb\n", ScalarStyle::Literal));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "fold", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "!", "", "a b", ScalarStyle::Folded));
  EXPECT_CALL(handler, OnMapEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("lit: |\n  a\n  b\nfold: >-\n  a\n  b\n");
}

TEST_F(HandlerTest, MultipleDocuments) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  EXPECT_CALL(handler, OnDocumentStart(_, _, true));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "b", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnDocumentEnd(_, true));
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "c", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("a\n---\nb\n...\nc\n");
}

TEST_F(HandlerTest, ExplicitEmptyDocument) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, true));
  EXPECT_CALL(handler, OnDocumentEnd(_, true));
  Parse("---\n...\n");
}

TEST_F(HandlerTest, EventMarks) {
  std::vector<Event> events = ParseEvents("a:\n  - b\n");
  ASSERT_EQ(10u, events.size());
  EXPECT_EQ(Event::STREAM_START, events[0].type);
  EXPECT_EQ(Event::SEQ_START, events[4].type);
  EXPECT_EQ(1, events[4].mark.line);
  EXPECT_EQ(2, events[4].mark.column);
  EXPECT_EQ(Event::SCALAR, events[5].type);
  EXPECT_EQ(1, events[5].mark.line);
  EXPECT_EQ(4, events[5].mark.column);
  EXPECT_EQ(Event::STREAM_END, events[9].type);
}

TEST_F(HandlerTest, DirectivesApplyToOneDocument) {
  std::vector<Event> events =
      ParseEvents("%YAML 1.2\n%TAG !e! tag:e.com:\n--- a\n--- b\n");
  ASSERT_EQ(8u, events.size());
  EXPECT_FALSE(events[1].directives.version.isDefault);
  EXPECT_EQ(1, events[1].directives.version.major);
  EXPECT_EQ(2, events[1].directives.version.minor);
  EXPECT_EQ("tag:e.com:", events[1].directives.tags["!e!"]);
  EXPECT_EQ(Event::DOC_START, events[4].type);
  EXPECT_TRUE(events[4].directives.empty());
}

TEST_F(HandlerTest, UnclosedFlowCollection) {
  try {
    IgnoreParse("key: [a, b\n");
    FAIL() << "expected a ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(ParseError::UnclosedFlowCollection, e.kind);
    EXPECT_EQ(0, e.mark.line);
    EXPECT_EQ(5, e.mark.column);
  }
}

TEST_F(HandlerTest, MismatchedFlowEnd) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("{a: [b}"),
                           ParseError::UnclosedFlowCollection);
}

TEST_F(HandlerTest, AliasWithProperty) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("- &a x\n- &b *a\n"),
                           ParseError::AliasWithProperty);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("- &a x\n- *a b\n"),
                           ParseError::AliasWithProperty);
}

TEST_F(HandlerTest, DuplicateProperty) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("!!str &a !!int x\n"),
                           ParseError::DuplicateProperty);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("&a &b x\n"),
                           ParseError::DuplicateProperty);
}

TEST_F(HandlerTest, DanglingProperty) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("&a\n---\nb\n"),
                           ParseError::DanglingProperty);
}

TEST_F(HandlerTest, PropertiesOnEmptyNode) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnMapStart(_, "?", "", CollectionStyle::Block));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler,
              OnScalar(_, "tag:yaml.org,2002:str", "", "", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "b", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "c", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnMapEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("a: !!str\nb: c\n");
}

TEST_F(HandlerTest, DirectiveErrors) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("%YAML 1.2\n%YAML 1.2\n---\na\n"),
                           ParseError::DirectiveConflict);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("%TAG !e! a:\n%TAG !e! b:\n---\na\n"),
                           ParseError::DirectiveConflict);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("%YAML 2.0\n---\na\n"),
                           ParseError::InvalidDirective);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("%YAML one\n---\na\n"),
                           ParseError::InvalidDirective);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("%TAG !e!\n---\na\n"),
                           ParseError::InvalidDirective);
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("%YAML 1.2\na\n"),
                           ParseError::UnexpectedToken);
}

TEST_F(HandlerTest, UnknownDirectiveIsIgnored) {
  EXPECT_CALL(handler, OnDocumentStart(_, _, true));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  logs::silence();
  Parse("%FOO bar\n---\na\n");
  logs::reset();
}

TEST_F(HandlerTest, UndefinedTagHandle) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("!e!foo bar\n"),
                           ParseError::UndefinedTagHandle);
}

TEST_F(HandlerTest, SequenceEntryInMap) {
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("a: 1\n- b\n"),
                           ParseError::UnexpectedToken);
}

TEST_F(HandlerTest, NestingCeiling) {
  ParserOptions options;
  options.maxDepth = 3;
  EXPECT_THROW_PARSE_ERROR(IgnoreParse("[[[[a]]]]", options),
                           ParseError::NestingTooDeep);

  EXPECT_CALL(handler, OnDocumentStart(_, _, false));
  EXPECT_CALL(handler, OnSequenceStart(_, "?", "", CollectionStyle::Flow));
  EXPECT_CALL(handler, OnSequenceStart(_, "?", "", CollectionStyle::Flow));
  EXPECT_CALL(handler, OnSequenceStart(_, "?", "", CollectionStyle::Flow));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "a", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnSequenceEnd(_));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  Parse("[[[a]]]", options);
}

TEST_F(HandlerTest, StrictParserStopsAfterAnError) {
  std::stringstream stream("a: [b\n---\nc\n");
  Parser parser(stream);
  EXPECT_THROW(while (parser.HandleNextDocument(nice_handler)) {}, ParseError);
  EXPECT_FALSE(parser);
  EXPECT_FALSE(parser.HandleNextDocument(nice_handler));
}

TEST_F(HandlerTest, NonStrictParserResumesAtNextDocument) {
  ParserOptions options;
  options.strict = false;
  std::stringstream stream("a: [b\n---\nc\n");
  Parser parser(stream, options);

  EXPECT_THROW(parser.HandleNextDocument(nice_handler), ParseError);

  EXPECT_CALL(handler, OnDocumentStart(_, _, true));
  EXPECT_CALL(handler, OnScalar(_, "?", "", "c", ScalarStyle::Plain));
  EXPECT_CALL(handler, OnDocumentEnd(_, false));
  logs::silence();
  EXPECT_TRUE(parser.HandleNextDocument(handler));
  logs::reset();
  EXPECT_FALSE(parser.HandleNextDocument(handler));
}
}  // namespace
}  // namespace YTree
