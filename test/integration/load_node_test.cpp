#include "ytree/yaml.h"  // IWYU pragma: keep
#include "ytree/schema.h"

#include <sstream>

#include "gtest/gtest.h"

namespace YTree {
namespace {

#define EXPECT_THROW_COMPOSE_ERROR(statement, error_kind) \
  try {                                                    \
    statement;                                             \
    ADD_FAILURE() << "expected a ComposeError";            \
  }                                                        \
  catch (const ComposeError& e) {                          \
    EXPECT_EQ(error_kind, e.kind) << e.what();             \
  }

std::string Encode(const std::string& ascii, int unitSize, bool bigEndian,
                   bool withBom) {
  std::string out;
  std::string text = ascii;
  if (withBom)
    text.insert(0, 1, '\0');  // placeholder for U+FEFF

  for (std::size_t i = 0; i < text.size(); i++) {
    unsigned long codePoint =
        (withBom && i == 0) ? 0xFEFF : static_cast<unsigned char>(text[i]);
    std::string unit(unitSize, '\0');
    for (int b = 0; b < unitSize; b++) {
      const int shift = 8 * (bigEndian ? unitSize - 1 - b : b);
      unit[b] = static_cast<char>((codePoint >> shift) & 0xFF);
    }
    out += unit;
  }
  return out;
}

TEST(LoadNodeTest, SimpleMap) {
  Document doc = Load("a: 1\nb: [x, y]\nc: text\n");
  ASSERT_TRUE(doc.Root());
  const Node& root = *doc.Root();
  EXPECT_EQ(NodeType::Map, root.Type());
  EXPECT_EQ(3u, root.size());
  EXPECT_EQ(CollectionStyle::Block, root.GetCollectionStyle());

  const Node* a = root.FindValue("a");
  ASSERT_TRUE(a);
  EXPECT_EQ("1", a->Scalar());
  EXPECT_EQ(Tags::Int, a->ResolvedTag());

  const Node* b = root.FindValue("b");
  ASSERT_TRUE(b);
  EXPECT_EQ(NodeType::Sequence, b->Type());
  EXPECT_EQ(CollectionStyle::Flow, b->GetCollectionStyle());
  ASSERT_EQ(2u, b->size());
  EXPECT_EQ("y", b->Entries()[1]->Scalar());

  EXPECT_EQ(Tags::Str, root.FindValue("c")->ResolvedTag());
  EXPECT_FALSE(root.FindValue("missing"));
}

TEST(LoadNodeTest, CoreSchemaResolution) {
  Document doc = Load("[~, null, true, False, 12, -0x1F, 0o17, 1.5, .inf, .NaN, '12', word, '']");
  const Node& root = *doc.Root();
  const char* expected[] = {Tags::Null,  Tags::Null,  Tags::Bool, Tags::Bool,
                            Tags::Int,   Tags::Str,   Tags::Int,  Tags::Float,
                            Tags::Float, Tags::Float, Tags::Str,  Tags::Str,
                            Tags::Str};
  ASSERT_EQ(13u, root.size());
  for (std::size_t i = 0; i < root.size(); i++)
    EXPECT_EQ(expected[i], root.Entries()[i]->ResolvedTag()) << i;
}

TEST(LoadNodeTest, NodeMarks) {
  Document doc = Load("a:\n  b: c\n");
  const Node* b = doc.Root()->FindValue("a");
  ASSERT_TRUE(b);
  EXPECT_EQ(1, b->GetMark().line);
  EXPECT_EQ(2, b->GetMark().column);
}

TEST(LoadNodeTest, EmptyInput) {
  EXPECT_TRUE(LoadAll("").empty());
  EXPECT_TRUE(LoadAll("# nothing here\n").empty());
  EXPECT_FALSE(Load("").Root());
}

TEST(LoadNodeTest, ExplicitEmptyDocumentHasNoRoot) {
  std::vector<Document> docs = LoadAll("---\n...\n--- a\n");
  ASSERT_EQ(2u, docs.size());
  EXPECT_FALSE(docs[0].Root());
  EXPECT_TRUE(docs[0].HasExplicitStart());
  EXPECT_TRUE(docs[0].HasExplicitEnd());
  ASSERT_TRUE(docs[1].Root());
  EXPECT_EQ("a", docs[1].Root()->Scalar());
}

TEST(LoadNodeTest, LoaderIsLazy) {
  std::stringstream stream("a\n---\nb\n---\nc\n");
  Loader loader(stream);
  Document doc;
  std::vector<std::string> values;
  while (loader.GetNextDocument(doc))
    values.push_back(doc.Root()->Scalar());
  ASSERT_EQ(3u, values.size());
  EXPECT_EQ("c", values[2]);
}

TEST(LoadNodeTest, AliasResolvesToTheAnchoredNode) {
  Document doc = Load("- &a [1, 2]\n- *a\n- *a\n");
  const Node& root = *doc.Root();
  ASSERT_EQ(3u, root.size());
  const Node* anchored = root.Entries()[0];
  EXPECT_FALSE(anchored->IsAlias());
  EXPECT_TRUE(root.Entries()[1]->IsAlias());
  EXPECT_EQ(anchored, root.Entries()[1]->Target());
  EXPECT_EQ(anchored, root.Entries()[2]->Target());
  EXPECT_EQ(anchored, &root.Entries()[2]->Deref());
  EXPECT_EQ("a", doc.Anchors().NameOf(*anchored));
}

TEST(LoadNodeTest, LastAnchorDefinitionWins) {
  Document doc = Load("- &a first\n- *a\n- &a second\n- *a\n");
  const Node& root = *doc.Root();
  ASSERT_EQ(4u, root.size());
  EXPECT_EQ("first", root.Entries()[1]->Deref().Scalar());
  EXPECT_EQ(root.Entries()[0], root.Entries()[1]->Target());
  EXPECT_EQ("second", root.Entries()[3]->Deref().Scalar());
  EXPECT_EQ(root.Entries()[2], root.Entries()[3]->Target());
  EXPECT_EQ(root.Entries()[2], doc.Anchors().Find("a"));
}

TEST(LoadNodeTest, AnchorsDoNotCrossDocuments) {
  EXPECT_THROW_COMPOSE_ERROR(LoadAll("&a x\n---\n*a\n"),
                             ComposeError::UndefinedAlias);
}

TEST(LoadNodeTest, UndefinedAlias) {
  EXPECT_THROW_COMPOSE_ERROR(Load("- *nope\n"), ComposeError::UndefinedAlias);
}

TEST(LoadNodeTest, AliasToOpenNodeIsACycle) {
  EXPECT_THROW_COMPOSE_ERROR(Load("&a [1, *a]\n"), ComposeError::AliasCycle);
  EXPECT_THROW_COMPOSE_ERROR(Load("&m\nkey: *m\n"), ComposeError::AliasCycle);
}

TEST(LoadNodeTest, AliasExpansionIsBounded) {
  const std::string laughs =
      "a: &a [x, x, x, x, x, x, x, x, x, x]\n"
      "b: &b [*a, *a, *a, *a, *a, *a, *a, *a, *a, *a]\n"
      "c: &c [*b, *b, *b, *b, *b, *b, *b, *b, *b, *b]\n"
      "d: &d [*c, *c, *c, *c, *c, *c, *c, *c, *c, *c]\n";

  LoadOptions options;
  options.composer.maxExpandedNodes = 1000;
  EXPECT_THROW_COMPOSE_ERROR(Load(laughs, options),
                             ComposeError::ExpansionLimitExceeded);

  // the aliases themselves stay cheap
  Document doc = Load(laughs);
  EXPECT_LT(doc.NodeCount(), 60u);
}

TEST(LoadNodeTest, NodeCountIsBounded) {
  LoadOptions options;
  options.composer.maxNodes = 4;
  EXPECT_THROW_COMPOSE_ERROR(Load("[1, 2, 3, 4]", options),
                             ComposeError::ExpansionLimitExceeded);
  EXPECT_NO_THROW(Load("[1, 2, 3]", options));
}

TEST(LoadNodeTest, DuplicateKeysFailByDefault) {
  EXPECT_THROW_COMPOSE_ERROR(Load("a: 1\na: 2\n"), ComposeError::DuplicateKey);
  EXPECT_THROW_COMPOSE_ERROR(Load("{[1, 2]: a, [1, 2]: b}"),
                             ComposeError::DuplicateKey);
}

TEST(LoadNodeTest, DuplicateKeysFirstWins) {
  LoadOptions options;
  options.composer.duplicateKeys = DuplicateKeyPolicy::FirstWins;
  logs::silence();
  Document doc = Load("a: 1\nb: 2\na: 3\n", options);
  logs::reset();
  ASSERT_EQ(2u, doc.Root()->size());
  EXPECT_EQ("1", doc.Root()->FindValue("a")->Scalar());
  EXPECT_EQ("a", doc.Root()->Pairs()[0].first->Scalar());
}

TEST(LoadNodeTest, DuplicateKeysLastWins) {
  LoadOptions options;
  options.composer.duplicateKeys = DuplicateKeyPolicy::LastWins;
  logs::silence();
  Document doc = Load("a: 1\nb: 2\na: 3\n", options);
  logs::reset();
  ASSERT_EQ(2u, doc.Root()->size());
  EXPECT_EQ("3", doc.Root()->FindValue("a")->Scalar());
  EXPECT_EQ("b", doc.Root()->Pairs()[0].first->Scalar());
}

TEST(LoadNodeTest, KeysOfDifferentTypesAreDistinct) {
  Document doc = Load("1: int\n'1': str\n");
  EXPECT_EQ(2u, doc.Root()->size());
}

TEST(LoadNodeTest, DroppedDuplicateTakesItsAnchors) {
  LoadOptions firstWins;
  firstWins.composer.duplicateKeys = DuplicateKeyPolicy::FirstWins;
  LoadOptions lastWins;
  lastWins.composer.duplicateKeys = DuplicateKeyPolicy::LastWins;
  logs::silence();

  EXPECT_THROW_COMPOSE_ERROR(Load("a: 1\na: &x 2\nb: *x\n", firstWins),
                             ComposeError::UndefinedAlias);
  EXPECT_THROW_COMPOSE_ERROR(Load("a: &x 1\na: 2\nb: *x\n", lastWins),
                             ComposeError::UndefinedAlias);
  EXPECT_THROW_COMPOSE_ERROR(Load("a: {k: &x 1}\na: 2\nb: *x\n", lastWins),
                             ComposeError::UndefinedAlias);

  // the name falls back to the declaration that stayed in the tree
  Document doc = Load("a: &x 1\na: &x 2\nb: *x\n", firstWins);
  logs::reset();
  ASSERT_TRUE(doc.Root());
  EXPECT_EQ(doc.Root()->FindValue("a"), doc.Root()->FindValue("b")->Target());
  EXPECT_EQ("a: &x 1\nb: *x\n", Dump(doc));
}

TEST(LoadNodeTest, LastWinsKeepsValuesAliasesReferTo) {
  LoadOptions options;
  options.composer.duplicateKeys = DuplicateKeyPolicy::LastWins;
  logs::silence();
  EXPECT_THROW_COMPOSE_ERROR(Load("a: &x 1\nb: *x\na: 2\n", options),
                             ComposeError::DuplicateKey);
  logs::reset();
}

TEST(LoadNodeTest, IndentationDecidesNesting) {
  Document sibling = Load("a:\n  b: 1\nc: 2\n");
  ASSERT_EQ(2u, sibling.Root()->size());
  EXPECT_EQ(1u, sibling.Root()->FindValue("a")->size());

  Document nested = Load("a:\n  b: 1\n  c: 2\n");
  ASSERT_EQ(1u, nested.Root()->size());
  EXPECT_EQ(2u, nested.Root()->FindValue("a")->size());

  EXPECT_FALSE(StructurallyEqual(sibling, nested));
}

TEST(LoadNodeTest, FlowAndBlockAreEquivalent) {
  Document block = Load("a:\n  - 1\n  - two\nb:\n  c: d\n");
  Document flow = Load("{a: [1, two], b: {c: d}}");
  EXPECT_TRUE(StructurallyEqual(block, flow));
  EXPECT_FALSE(StructurallyEqual(block, flow, true));
}

TEST(LoadNodeTest, QuotingChangesTheType) {
  EXPECT_FALSE(StructurallyEqual(Load("[1]"), Load("['1']")));
  EXPECT_TRUE(StructurallyEqual(Load("['1']"), Load("[\"1\"]")));
  EXPECT_TRUE(StructurallyEqual(Load("[!!str 1]"), Load("['1']")));
}

TEST(LoadNodeTest, DocumentKeepsDirectives) {
  Document doc =
      Load("%YAML 1.2\n%TAG !e! tag:e.com,2000:\n--- !e!thing value\n");
  EXPECT_FALSE(doc.GetDirectives().version.isDefault);
  EXPECT_EQ(2, doc.GetDirectives().version.minor);
  ASSERT_EQ(1u, doc.GetDirectives().tags.size());
  EXPECT_EQ("tag:e.com,2000:", doc.GetDirectives().tags.find("!e!")->second);
  EXPECT_EQ("tag:e.com,2000:thing", doc.Root()->Tag());
  EXPECT_TRUE(doc.HasExplicitStart());
  EXPECT_FALSE(doc.HasExplicitEnd());
}

TEST(LoadNodeTest, ErrorPositionOfUnterminatedQuote) {
  try {
    Load("first: 1\nsecond: \"no end\n");
    FAIL() << "expected a LexError";
  } catch (const LexError& e) {
    EXPECT_EQ(LexError::UnterminatedScalar, e.kind);
    EXPECT_EQ(1, e.mark.line);
    EXPECT_EQ(8, e.mark.column);
  }
}

TEST(LoadNodeTest, UnterminatedQuoteDoesNotSwallowTheDocument) {
  try {
    Load("x: 1\ny: 'abc\n\nz: 2\n");
    FAIL() << "expected a LexError";
  } catch (const LexError& e) {
    EXPECT_EQ(LexError::UnterminatedScalar, e.kind);
    EXPECT_EQ(1, e.mark.line);
    EXPECT_EQ(3, e.mark.column);
  }
}

TEST(LoadNodeTest, NonStrictLoaderSkipsBadDocuments) {
  LoadOptions options;
  options.parser.strict = false;
  std::stringstream stream("a: 1\n---\nb: [2\n---\nc: 3\n");
  Loader loader(stream, options);

  logs::silence();
  Document doc;
  ASSERT_TRUE(loader.GetNextDocument(doc));
  EXPECT_EQ("1", doc.Root()->FindValue("a")->Scalar());
  EXPECT_THROW(loader.GetNextDocument(doc), ParseError);
  ASSERT_TRUE(loader.GetNextDocument(doc));
  EXPECT_EQ("3", doc.Root()->FindValue("c")->Scalar());
  EXPECT_FALSE(loader.GetNextDocument(doc));
  logs::reset();
}

TEST(LoadNodeTest, NonStrictLoaderSkipsComposeErrors) {
  LoadOptions options;
  options.parser.strict = false;
  std::stringstream stream("- *missing\n- x\n---\nok\n");
  Loader loader(stream, options);

  Document doc;
  EXPECT_THROW(loader.GetNextDocument(doc), ComposeError);
  ASSERT_TRUE(loader.GetNextDocument(doc));
  EXPECT_EQ("ok", doc.Root()->Scalar());
}

TEST(LoadNodeTest, StrictLoaderStopsAtTheFirstError) {
  std::stringstream stream("- *missing\n---\nok\n");
  Loader loader(stream);
  Document doc;
  EXPECT_THROW(loader.GetNextDocument(doc), ComposeError);
  EXPECT_FALSE(loader);
  EXPECT_FALSE(loader.GetNextDocument(doc));
}

TEST(LoadNodeTest, Utf8ByteOrderMark) {
  Document doc = Load("\xEF\xBB\xBF" "a: b\n");
  ASSERT_TRUE(doc.Root());
  EXPECT_EQ("b", doc.Root()->FindValue("a")->Scalar());
}

TEST(LoadNodeTest, DetectsEveryEncoding) {
  const std::string text = "a: [b, c]\n";
  Document expected = Load(text);

  for (int unitSize = 2; unitSize <= 4; unitSize += 2) {
    for (int bigEndian = 0; bigEndian < 2; bigEndian++) {
      for (int withBom = 0; withBom < 2; withBom++) {
        Document doc = Load(Encode(text, unitSize, bigEndian != 0, withBom != 0));
        EXPECT_TRUE(StructurallyEqual(expected, doc))
            << "unit " << unitSize << " big endian " << bigEndian << " bom "
            << withBom;
      }
    }
  }
}

TEST(LoadNodeTest, Utf16SurrogatePairs) {
  // "x: " followed by U+1F600 in UTF-16LE
  const char bytes[] = {'\xFF', '\xFE', 'x', 0, ':', 0, ' ', 0,
                        '\x3D', '\xD8', '\x00', '\xDE'};
  Document doc = Load(std::string(bytes, sizeof(bytes)));
  EXPECT_EQ("\xF0\x9F\x98\x80", doc.Root()->FindValue("x")->Scalar());
}
}  // namespace
}  // namespace YTree
