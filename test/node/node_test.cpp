#include "ytree/document.h"
#include "ytree/node.h"
#include "ytree/schema.h"

#include <utility>

#include "gtest/gtest.h"

namespace YTree {
namespace {
TEST(NodeTest, SimpleScalar) {
  Document doc;
  doc.SetRoot(&doc.CreateScalar("Hello, World!"));
  ASSERT_TRUE(doc.Root());
  EXPECT_EQ(NodeType::Scalar, doc.Root()->Type());
  EXPECT_EQ("Hello, World!", doc.Root()->Scalar());
  EXPECT_EQ("?", doc.Root()->Tag());
  EXPECT_EQ(Tags::Str, doc.Root()->ResolvedTag());
}

TEST(NodeTest, ScalarTagResolution) {
  Document doc;
  EXPECT_EQ(Tags::Int, doc.CreateScalar("15").ResolvedTag());
  EXPECT_EQ(Tags::Str, doc.CreateScalar("15", "!").ResolvedTag());
  EXPECT_EQ(Tags::Str, doc.CreateScalar("15", "?", ScalarStyle::DoubleQuoted).ResolvedTag());
  EXPECT_EQ(Tags::Null, doc.CreateScalar("").ResolvedTag());
  EXPECT_EQ("!custom", doc.CreateScalar("x", "!custom").ResolvedTag());
  EXPECT_EQ(Tags::Seq, doc.CreateSequence().ResolvedTag());
  EXPECT_EQ(Tags::Map, doc.CreateMapping("!").ResolvedTag());
}

TEST(NodeTest, AppendSequence) {
  Document doc;
  Node& seq = doc.CreateSequence();
  seq.Append(doc.CreateScalar("10"));
  seq.Append(doc.CreateScalar("foo"));
  seq.Append(doc.CreateScalar("monkey"));
  doc.SetRoot(&seq);

  EXPECT_EQ(NodeType::Sequence, doc.Root()->Type());
  ASSERT_EQ(3u, seq.size());
  EXPECT_EQ("10", seq.Entries()[0]->Scalar());
  EXPECT_EQ("monkey", seq.Entries()[2]->Scalar());
  EXPECT_EQ(4u, doc.NodeCount());
}

TEST(NodeTest, InsertAndRemoveMapPairs) {
  Document doc;
  Node& map = doc.CreateMapping();
  Node& key = doc.CreateScalar("key");
  map.Insert(key, doc.CreateScalar("value"));
  map.Insert(doc.CreateScalar("other"), doc.CreateScalar("thing"));

  ASSERT_EQ(2u, map.size());
  EXPECT_EQ("value", map.FindValue("key")->Scalar());
  EXPECT_EQ("thing", map.FindValue("other")->Scalar());
  EXPECT_FALSE(map.FindValue("nothing"));

  map.Remove(key);
  ASSERT_EQ(1u, map.size());
  EXPECT_FALSE(map.FindValue("key"));
  EXPECT_EQ("other", map.Pairs()[0].first->Scalar());
}

TEST(NodeTest, AliasRefersToTarget) {
  Document doc;
  Node& target = doc.CreateScalar("42");
  doc.SetAnchor(target, "answer");

  Node& alias = doc.CreateAlias(target);
  EXPECT_TRUE(alias.IsAlias());
  EXPECT_EQ(NodeType::Alias, alias.Type());
  EXPECT_EQ(&target, alias.Target());
  EXPECT_EQ(&target, &alias.Deref());
  EXPECT_EQ("answer", alias.Scalar());
  EXPECT_EQ(Tags::Int, alias.ResolvedTag());

  // an alias of an alias refers to the node itself
  Node& again = doc.CreateAlias(alias);
  EXPECT_EQ(&target, again.Target());
}

TEST(NodeTest, AnchorTable) {
  Document doc;
  Node& first = doc.CreateScalar("a");
  Node& second = doc.CreateScalar("b");
  doc.SetAnchor(first, "x");
  doc.SetAnchor(second, "x");

  EXPECT_EQ(&second, doc.Anchors().Find("x"));
  EXPECT_EQ("x", doc.Anchors().NameOf(first));
  EXPECT_TRUE(doc.Anchors().IsAnchored(first));
  EXPECT_FALSE(doc.Anchors().IsAnchored(doc.CreateScalar("c")));
  EXPECT_FALSE(doc.Anchors().Find("y"));
  EXPECT_EQ(2u, doc.Anchors().size());
}

TEST(NodeTest, ClearAnchorRestoresEarlierDeclaration) {
  Document doc;
  Node& first = doc.CreateScalar("a");
  Node& second = doc.CreateScalar("b");
  doc.SetAnchor(first, "x");
  doc.SetAnchor(second, "x");

  doc.ClearAnchor(second);
  EXPECT_EQ(&first, doc.Anchors().Find("x"));
  EXPECT_FALSE(doc.Anchors().IsAnchored(second));

  doc.ClearAnchor(first);
  EXPECT_FALSE(doc.Anchors().Find("x"));
  EXPECT_TRUE(doc.Anchors().empty());
}

TEST(NodeTest, MovedDocumentKeepsNodes) {
  Document doc;
  Node& root = doc.CreateSequence();
  Node& entry = doc.CreateScalar("x");
  root.Append(entry);
  doc.SetRoot(&root);
  doc.SetAnchor(entry, "e");

  Document moved(std::move(doc));
  EXPECT_EQ(&root, moved.Root());
  EXPECT_EQ(&entry, moved.Root()->Entries()[0]);
  EXPECT_EQ(&entry, moved.Anchors().Find("e"));
  EXPECT_FALSE(doc.Root());

  Document assigned;
  assigned = std::move(moved);
  EXPECT_EQ(&root, assigned.Root());
}

TEST(NodeTest, StructuralEquality) {
  Document lhs;
  Node& l = lhs.CreateMapping();
  l.Insert(lhs.CreateScalar("a"), lhs.CreateScalar("1"));
  lhs.SetRoot(&l);

  Document rhs;
  Node& r = rhs.CreateMapping("?", CollectionStyle::Flow);
  r.Insert(rhs.CreateScalar("a"), rhs.CreateScalar("1", "tag:yaml.org,2002:int"));
  rhs.SetRoot(&r);

  EXPECT_TRUE(StructurallyEqual(lhs, rhs));
  EXPECT_FALSE(StructurallyEqual(lhs, rhs, true));

  r.Insert(rhs.CreateScalar("b"), rhs.CreateScalar("2"));
  EXPECT_FALSE(StructurallyEqual(lhs, rhs));
  EXPECT_TRUE(StructurallyEqual(Document(), Document()));
  EXPECT_FALSE(StructurallyEqual(lhs, Document()));
}

TEST(NodeTest, StructuralEqualityFollowsAliasTopology) {
  // [&x a, *x] against [&y a, *y] and against [a, a]
  Document lhs;
  Node& lseq = lhs.CreateSequence();
  Node& la = lhs.CreateScalar("a");
  lhs.SetAnchor(la, "x");
  lseq.Append(la);
  lseq.Append(lhs.CreateAlias(la));
  lhs.SetRoot(&lseq);

  Document rhs;
  Node& rseq = rhs.CreateSequence();
  Node& ra = rhs.CreateScalar("a");
  rhs.SetAnchor(ra, "y");
  rseq.Append(ra);
  rseq.Append(rhs.CreateAlias(ra));
  rhs.SetRoot(&rseq);

  Document plain;
  Node& pseq = plain.CreateSequence();
  pseq.Append(plain.CreateScalar("a"));
  pseq.Append(plain.CreateScalar("a"));
  plain.SetRoot(&pseq);

  EXPECT_TRUE(StructurallyEqual(lhs, rhs));
  EXPECT_FALSE(StructurallyEqual(lhs, plain));
}

TEST(NodeTest, DocumentDirectives) {
  Document doc;
  EXPECT_TRUE(doc.GetDirectives().empty());

  doc.SetVersion(1, 1);
  doc.AddTagDirective("!e!", "tag:example.com,2000:");
  const Directives& directives = doc.GetDirectives();
  EXPECT_FALSE(directives.empty());
  EXPECT_EQ(1, directives.version.minor);
  EXPECT_EQ("tag:example.com,2000:", directives.TranslateTagHandle("!e!"));
  EXPECT_EQ("tag:yaml.org,2002:", directives.TranslateTagHandle("!!"));
  EXPECT_EQ("!", directives.TranslateTagHandle("!"));
  EXPECT_EQ("", directives.TranslateTagHandle("!other!"));
  EXPECT_TRUE(directives.IsHandleDefined("!e!"));
  EXPECT_FALSE(directives.IsHandleDefined("!other!"));
}

TEST(SchemaTest, CoreSchema) {
  EXPECT_TRUE(IsNullScalar(""));
  EXPECT_TRUE(IsNullScalar("~"));
  EXPECT_TRUE(IsNullScalar("NULL"));
  EXPECT_FALSE(IsNullScalar("nil"));

  bool b = false;
  EXPECT_TRUE(ConvertBool("True", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ConvertBool("FALSE", b));
  EXPECT_FALSE(b);
  EXPECT_FALSE(ConvertBool("yes", b));
  EXPECT_FALSE(ConvertBool("tRUE", b));

  EXPECT_TRUE(IsIntScalar("-17"));
  EXPECT_TRUE(IsIntScalar("0o17"));
  EXPECT_TRUE(IsIntScalar("0xBEEF"));
  EXPECT_FALSE(IsIntScalar("0o18"));
  EXPECT_FALSE(IsIntScalar("1_000"));

  EXPECT_TRUE(IsFloatScalar("1.5"));
  EXPECT_TRUE(IsFloatScalar("-.5e-3"));
  EXPECT_TRUE(IsFloatScalar("1e5"));
  EXPECT_TRUE(IsFloatScalar("-.INF"));
  EXPECT_FALSE(IsFloatScalar("-.nan"));
  EXPECT_FALSE(IsFloatScalar("."));
  EXPECT_FALSE(IsFloatScalar("1.5.2"));

  EXPECT_EQ(Tags::Float, ResolvePlainScalar("3.0"));
  EXPECT_EQ(Tags::Str, ResolvePlainScalar("3.0.1"));
}
}  // namespace
}  // namespace YTree
