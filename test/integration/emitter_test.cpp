#include "ytree/emitter.h"
#include "ytree/exceptions.h"

#include <sstream>
#include <string>

#include "gtest/gtest.h"

namespace YTree {
namespace {
class EmitterTest : public ::testing::Test {
 protected:
  void ExpectEmit(const std::string& expected) {
    EXPECT_TRUE(out.good()) << "Emitter raised: " << out.GetLastError();
    EXPECT_EQ(expected, out.c_str());
  }

  void ExpectFailure(EmitError::Kind kind, const std::string& message) {
    EXPECT_FALSE(out.good());
    EXPECT_EQ(kind, out.GetLastErrorKind());
    EXPECT_EQ(message, out.GetLastError());
  }

  Emitter out;
};

TEST_F(EmitterTest, SimpleScalar) {
  out << "Hello, World!";

  ExpectEmit("Hello, World!");
}

TEST_F(EmitterTest, SimpleSeq) {
  out << BeginSeq;
  out << "eggs";
  out << "bread";
  out << "milk";
  out << EndSeq;

  ExpectEmit("- eggs\n- bread\n- milk");
}

TEST_F(EmitterTest, SimpleMap) {
  out << BeginMap;
  out << "name";
  out << "Ryan Braun";
  out << "position";
  out << 3;
  out << EndMap;

  ExpectEmit("name: Ryan Braun\nposition: 3");
}

TEST_F(EmitterTest, FlowCollections) {
  out << BeginMap;
  out << "seq" << Flow << BeginSeq << "a" << "b" << EndSeq;
  out << "map" << Flow << BeginMap << "a" << "b" << EndMap;
  out << EndMap;

  ExpectEmit("seq: [a, b]\nmap: {a: b}");
}

TEST_F(EmitterTest, NestedBlockSeq) {
  out << BeginSeq;
  out << "item 1";
  out << BeginSeq << "subitem 1" << "subitem 2" << EndSeq;
  out << EndSeq;

  ExpectEmit("- item 1\n- - subitem 1\n  - subitem 2");
}

TEST_F(EmitterTest, LiteralScalar) {
  out << Literal << "line1\nline2\n";

  ExpectEmit("|\n  line1\n  line2");
}

TEST_F(EmitterTest, BoolIsPlain) {
  out << Flow << BeginSeq << true << false << EndSeq;

  ExpectEmit("[true, false]");
}

TEST_F(EmitterTest, AutoQuotesWhatWouldChangeType) {
  out << Flow << BeginSeq << "true" << "12" << "~" << "text" << EndSeq;

  ExpectEmit("[\"true\", \"12\", \"~\", text]");
}

TEST_F(EmitterTest, EmptyStringIsQuotedAtTopLevel) {
  out << "";

  ExpectEmit("\"\"");
}

TEST_F(EmitterTest, Comment) {
  out << Comment("hi");

  ExpectEmit("# hi");
}

TEST_F(EmitterTest, ExplicitDocument) {
  out << BeginDoc << "a" << EndDoc;

  ExpectEmit("---\na\n...\n");
}

TEST_F(EmitterTest, SecondTopNodeStartsDocument) {
  out << "a" << "b";

  ExpectEmit("a\n---\nb");
}

TEST_F(EmitterTest, AnchorAndAlias) {
  out << BeginSeq;
  out << Anchor("x") << 1;
  out << Alias("x");
  out << EndSeq;

  ExpectEmit("- &x 1\n- *x");
}

TEST_F(EmitterTest, EmptyPlainHasNoTrailingBlank) {
  out << BeginSeq;
  out << Anchor("n") << Plain << "";
  out << Plain << "";
  out << LocalTag("t") << Plain << "";
  out << "x";
  out << EndSeq;

  ExpectEmit("- &n\n-\n- !t\n- x");
}

TEST_F(EmitterTest, EmptyPlainMapValue) {
  out << BeginMap;
  out << "a" << Plain << "";
  out << "b" << Anchor("m") << Plain << "";
  out << EndMap;

  ExpectEmit("a:\nb: &m");
}

TEST_F(EmitterTest, LocalTag) {
  out << LocalTag("foo") << "bar";

  ExpectEmit("!foo bar");
}

TEST_F(EmitterTest, DirectivesShortenTags) {
  Directives directives;
  directives.version.isDefault = false;
  directives.version.major = 1;
  directives.version.minor = 2;
  directives.tags["!e!"] = "tag:e.com:";

  out << directives;
  out << Tag("tag:e.com:x") << "v";

  ExpectEmit("%YAML 1.2\n%TAG !e! tag:e.com:\n---\n!e!x v");
}

TEST_F(EmitterTest, LongKey) {
  const std::string key(1100, 'k');
  out << BeginMap << key << "v" << EndMap;

  ExpectEmit("? " + key + "\n: v");
}

TEST_F(EmitterTest, WritesToStream) {
  std::stringstream stream;
  Emitter emitter(stream);
  emitter << BeginSeq << "a" << EndSeq;

  EXPECT_TRUE(emitter.good());
  EXPECT_EQ("- a", stream.str());
}

TEST_F(EmitterTest, ErrorUnmatchedEndSeq) {
  out << EndSeq;

  ExpectFailure(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_SEQ);
}

TEST_F(EmitterTest, ErrorOddMapChildren) {
  out << BeginMap << "key" << EndMap;

  ExpectFailure(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_MAP);
}

TEST_F(EmitterTest, ErrorAliasNotWritten) {
  out << BeginSeq << Alias("missing") << EndSeq;

  ExpectFailure(EmitError::InvalidAlias, std::string(ErrorMsg::ALIAS_NOT_WRITTEN) + "missing");
}

TEST_F(EmitterTest, ErrorPlainCantHoldText) {
  out << Plain << "a: b";

  ExpectFailure(EmitError::UnrepresentableScalar, ErrorMsg::UNREPRESENTABLE_STYLE);
}

TEST_F(EmitterTest, ErrorInvalidUtf8) {
  out << "\xC3\x28";

  ExpectFailure(EmitError::UnrepresentableScalar, ErrorMsg::INVALID_UTF8);
}

TEST_F(EmitterTest, ErrorsAreSticky) {
  out << EndSeq;
  out << "more";

  ExpectFailure(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_SEQ);
  EXPECT_EQ(std::string(), out.c_str());
}
}  // namespace
}  // namespace YTree
