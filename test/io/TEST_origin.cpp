#include "runcase/Origin.hpp"

#include <gtest/gtest.h>

namespace runcase::io::test {

TEST(OriginFileName, LiteralTextHasNoOrigin) {
  EXPECT_EQ(origin_file_name("3\n4\n"), "");
  EXPECT_EQ(origin_file_name(""), "");
  EXPECT_EQ(origin_file_name("file:in.txt"), "");
}

TEST(OriginFileName, MarkerSelectsFile) {
  EXPECT_EQ(origin_file_name("@file:big.in"), "big.in");
  EXPECT_EQ(origin_file_name("  @file: big.in \n"), "big.in");
}

TEST(OriginFileName, MarkerMustBeTheOnlyLine) {
  EXPECT_EQ(origin_file_name("@file:big.in\n1 2 3\n"), "");
  EXPECT_EQ(origin_file_name("1 2\n@file:big.in"), "");
}

TEST(OriginFileName, SeparatorsAreKeptForTheCallerToReject) {
  EXPECT_EQ(origin_file_name("@file:../secret"), "../secret");
}

TEST(OriginFileName, DefaultResolverDelegates) {
  auto resolver = default_origin_resolver();
  EXPECT_EQ(resolver("@file:a.txt"), "a.txt");
  EXPECT_EQ(resolver("plain"), "");
}

} // namespace runcase::io::test
