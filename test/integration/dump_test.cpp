#include "ytree/dump.h"
#include "ytree/exceptions.h"
#include "ytree/loader.h"
#include "ytree/parser.h"
#include "ytree/schema.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace YTree {
namespace {
#define EXPECT_THROW_EMIT_ERROR(statement, expected_kind, message) \
  try {                                                            \
    statement;                                                     \
    FAIL() << "EmitError was not thrown";                          \
  } catch (const EmitError& e) {                                   \
    EXPECT_EQ(expected_kind, e.kind);                              \
    EXPECT_EQ(message, e.msg);                                     \
  }

void ExpectRoundTrip(const std::string& input) {
  const Document doc = Load(input);
  const std::string output = Dump(doc);

  EXPECT_TRUE(StructurallyEqual(doc, Load(output))) << "input:\n" << input << "output:\n" << output;
  EXPECT_EQ(output, Dump(Load(output)));
}

TEST(DumpTest, SimpleMap) {
  EXPECT_EQ("a: 1\nb: [x, y]\n", Dump(Load("a: 1\nb: [x, y]\n")));
}

TEST(DumpTest, EmptyDocument) {
  const std::string output = Dump(Document());

  EXPECT_EQ("---\n", output);
  EXPECT_FALSE(Load(output).Root());
}

TEST(DumpTest, RoundTrips) {
  ExpectRoundTrip("name: ytree\nversion: 1.2\ntags: [yaml, \"1.0\", 'x y']\n");
  ExpectRoundTrip("- &a {k: v}\n- *a\n- ~\n- |\n  literal\n  text\n");
  ExpectRoundTrip("empty: []\nnone: {}\nquoted: \"line\\nbreak\"\n");
  ExpectRoundTrip("? [complex, key]\n: value\n? {k: v}\n: other\n");
  ExpectRoundTrip("a: \"true\"\nb: true\nc: '12'\nd: !!str 12\ne: !custom x\n");
  ExpectRoundTrip("- >\n  folded\n  text\n- \"  padded  \"\n- \"\"\n- ''\n");
  ExpectRoundTrip("--- !!set\n? a\n? b\n");
}

TEST(DumpTest, QuotedScalarsKeepTheirType) {
  Document doc;
  Node& seq = doc.CreateSequence();
  seq.Append(doc.CreateScalar("true", "?", ScalarStyle::DoubleQuoted));
  seq.Append(doc.CreateScalar("12", "!", ScalarStyle::Plain));
  doc.SetRoot(&seq);

  const Document reloaded = Load(Dump(doc));
  ASSERT_TRUE(reloaded.Root());
  EXPECT_EQ(Tags::Str, reloaded.Root()->Entries()[0]->ResolvedTag());
  EXPECT_EQ(Tags::Str, reloaded.Root()->Entries()[1]->ResolvedTag());
  EXPECT_TRUE(StructurallyEqual(doc, reloaded));
}

TEST(DumpTest, EmptyValueStaysNull) {
  Document doc;
  Node& map = doc.CreateMapping();
  map.Insert(doc.CreateScalar("a"), doc.CreateScalar(""));
  doc.SetRoot(&map);

  const Document reloaded = Load(Dump(doc));
  ASSERT_TRUE(reloaded.Root());
  EXPECT_EQ(Tags::Null, reloaded.Root()->FindValue("a")->ResolvedTag());
}

TEST(DumpTest, EmptyNodesWithPropertiesHaveNoTrailingBlank) {
  const std::string output = Dump(Load("- &n\n- !!null\n- *n\n"));

  EXPECT_EQ(std::string::npos, output.find(" \n")) << output;
  ExpectRoundTrip("- &n\n- !!null\n- *n\n");
  ExpectRoundTrip("a: &m\nb:\nc: *m\n");
}

TEST(DumpTest, MultipleDocuments) {
  const std::vector<Document> docs = LoadAll("a\n---\nb\n");

  EXPECT_EQ("a\n---\nb\n", Dump(docs));
}

TEST(DumpTest, ExplicitDocumentEnd) {
  EXPECT_EQ("a\n...\n", Dump(Load("a\n...\n")));
}

TEST(DumpTest, DirectivesAndTagShorthands) {
  const std::string input = "%TAG !e! tag:e.com:\n--- !e!x v\n";
  const Document doc = Load(input);
  ASSERT_TRUE(doc.Root());
  EXPECT_EQ("tag:e.com:x", doc.Root()->Tag());

  EXPECT_EQ("%TAG !e! tag:e.com:\n---\n!e!x v\n", Dump(doc));
}

TEST(DumpTest, SharedNodesGetAnchors) {
  Document doc;
  Node& seq = doc.CreateSequence();
  Node& shared = doc.CreateScalar("a");
  seq.Append(shared);
  seq.Append(shared);
  doc.SetRoot(&seq);

  EXPECT_EQ("- &alias1 a\n- *alias1\n", Dump(doc));
}

TEST(DumpTest, GeneratedAnchorsAvoidDeclaredNames) {
  Document doc;
  Node& seq = doc.CreateSequence();
  Node& declared = doc.CreateScalar("m");
  doc.SetAnchor(declared, "alias1");
  Node& shared = doc.CreateScalar("a");
  seq.Append(declared);
  seq.Append(shared);
  seq.Append(doc.CreateAlias(shared));
  doc.SetRoot(&seq);

  EXPECT_EQ("- &alias1 m\n- &alias2 a\n- *alias2\n", Dump(doc));
}

TEST(DumpTest, KeepsDeclaredAnchorNames) {
  const std::string input = "- &x a\n- &x b\n- *x\n";

  EXPECT_EQ(input, Dump(Load(input)));
}

TEST(DumpTest, AnchorCollision) {
  Document doc;
  Node& seq = doc.CreateSequence();
  Node& first = doc.CreateScalar("a");
  Node& second = doc.CreateScalar("b");
  doc.SetAnchor(first, "x");
  doc.SetAnchor(second, "x");
  seq.Append(first);
  seq.Append(second);
  seq.Append(doc.CreateAlias(first));
  doc.SetRoot(&seq);

  EXPECT_THROW_EMIT_ERROR(Dump(doc), EmitError::AnchorCollision, std::string(ErrorMsg::ANCHOR_COLLISION) + "x");
}

TEST(DumpTest, AliasToEnclosingNode) {
  Document doc;
  Node& seq = doc.CreateSequence();
  doc.SetAnchor(seq, "s");
  seq.Append(doc.CreateAlias(seq));
  doc.SetRoot(&seq);

  EXPECT_THROW_EMIT_ERROR(Dump(doc), EmitError::InvalidAlias, std::string(ErrorMsg::ALIAS_NOT_WRITTEN) + "s");
}

TEST(DumpTest, AliasBeforeItsTarget) {
  Document doc;
  Node& seq = doc.CreateSequence();
  Node& target = doc.CreateScalar("t");
  seq.Append(doc.CreateAlias(target));
  seq.Append(target);
  doc.SetRoot(&seq);

  try {
    Dump(doc);
    FAIL() << "EmitError was not thrown";
  } catch (const EmitError& e) {
    EXPECT_EQ(EmitError::InvalidAlias, e.kind);
  }
}

TEST(DumpTest, InvalidUtf8) {
  Document doc;
  doc.SetRoot(&doc.CreateScalar("\xC3\x28"));

  EXPECT_THROW_EMIT_ERROR(Dump(doc), EmitError::UnrepresentableScalar, ErrorMsg::INVALID_UTF8);
}

TEST(DumpTest, ZeroIndentIsRejected) {
  EmitterOptions options;
  options.indentWidth = 0;

  EXPECT_THROW_EMIT_ERROR(Dump(Load("a: 1"), options), EmitError::InvalidState, ErrorMsg::INVALID_INDENT);
}

TEST(DumpTest, IndentWidth) {
  EmitterOptions options;
  options.indentWidth = 4;

  EXPECT_EQ("a:\n    b: c\n", Dump(Load("a:\n  b: c\n"), options));
}

TEST(DumpTest, DefaultFlowStyle) {
  Document doc;
  Node& map = doc.CreateMapping();
  Node& seq = doc.CreateSequence();
  seq.Append(doc.CreateScalar("1"));
  seq.Append(doc.CreateScalar("2"));
  map.Insert(doc.CreateScalar("a"), seq);
  doc.SetRoot(&map);

  EmitterOptions options;
  options.defaultStyle = CollectionStyle::Flow;

  EXPECT_EQ("{a: [1, 2]}\n", Dump(doc, options));
  EXPECT_EQ("a:\n  - 1\n  - 2\n", Dump(doc));
}

TEST(DumpTest, QuoteStyle) {
  Document doc;
  Node& seq = doc.CreateSequence();
  seq.Append(doc.CreateScalar("12"));
  seq.Append(doc.CreateScalar("text"));
  doc.SetRoot(&seq);

  EmitterOptions options;
  options.quoteStyle = QuoteStyle::PreferSingle;
  EXPECT_EQ("- 12\n- 'text'\n", Dump(doc, options));

  options.quoteStyle = QuoteStyle::PreferDouble;
  EXPECT_EQ("- 12\n- \"text\"\n", Dump(doc, options));
}

TEST(EmitEventsTest, ParsedEvents) {
  EXPECT_EQ("- a\n- b\n", EmitEvents(ParseEvents("- a\n- b\n")));
  EXPECT_EQ("key: [1, 2]\n", EmitEvents(ParseEvents("key: [1, 2]")));
}

TEST(EmitEventsTest, EmptyCollectionsAreFlow) {
  std::vector<Event> events;
  events.push_back(Event(Event::DOC_START, Mark()));
  events.push_back(Event::SequenceStart(Mark(), "?", "", CollectionStyle::Block));
  events.push_back(Event(Event::SEQ_END, Mark()));
  events.push_back(Event(Event::DOC_END, Mark()));

  EXPECT_EQ("[]\n", EmitEvents(events));
}

TEST(EmitEventsTest, EmptyDocumentGetsMarker) {
  std::vector<Event> events;
  events.push_back(Event(Event::DOC_START, Mark()));
  events.push_back(Event(Event::DOC_END, Mark()));

  EXPECT_EQ("---\n", EmitEvents(events));
}

TEST(EmitEventsTest, IncompleteOutput) {
  std::vector<Event> events;
  events.push_back(Event(Event::DOC_START, Mark()));
  events.push_back(Event::MapStart(Mark(), "?", "", CollectionStyle::Any));
  events.push_back(Event::Scalar(Mark(), "?", "", "a", ScalarStyle::Plain));

  EXPECT_THROW_EMIT_ERROR(EmitEvents(events), EmitError::InvalidState, ErrorMsg::INCOMPLETE_OUTPUT);
}
}  // namespace
}  // namespace YTree
