#include "ytree/ostream_wrapper.h"

#include <sstream>

#include "gtest/gtest.h"

namespace YTree {
namespace {
TEST(OstreamWrapperTest, ConstructNoWrite) {
  ostream_wrapper wrapper;
  EXPECT_STREQ("", wrapper.str());
  EXPECT_EQ(0u, wrapper.pos());
}

TEST(OstreamWrapperTest, BufferTracksPosition) {
  ostream_wrapper wrapper;
  wrapper << "key: " << 'v' << std::string("alue\n  next");
  EXPECT_STREQ("key: value\n  next", wrapper.str());
  EXPECT_EQ(1u, wrapper.row());
  EXPECT_EQ(6u, wrapper.col());
  EXPECT_EQ(17u, wrapper.pos());
}

TEST(OstreamWrapperTest, NewlineClearsComment) {
  ostream_wrapper wrapper;
  wrapper << "# note";
  wrapper.set_comment();
  EXPECT_TRUE(wrapper.comment());
  wrapper << "\n";
  EXPECT_FALSE(wrapper.comment());
}

TEST(OstreamWrapperTest, WritesThroughToStream) {
  std::stringstream stream;
  ostream_wrapper wrapper(stream);
  wrapper << "- a\n- b";
  EXPECT_EQ("- a\n- b", stream.str());
  EXPECT_EQ(nullptr, wrapper.str());
  EXPECT_EQ(1u, wrapper.row());
  EXPECT_EQ(3u, wrapper.col());
}
}  // namespace
}  // namespace YTree
