#include "Chain.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using tally::Chain;

TEST(ChainTest, StartsEmpty) {
  Chain<int> chain;
  EXPECT_TRUE(chain.empty());
  EXPECT_EQ(chain.size(), 0u);
  EXPECT_EQ(chain.head(), nullptr);
  EXPECT_TRUE(chain.begin() == chain.end());
}

TEST(ChainTest, IteratesNewestFirst) {
  Chain<std::string> chain;
  chain.append("A");
  chain.append("B");
  chain.append("C");

  ASSERT_NE(chain.head(), nullptr);
  EXPECT_EQ(*chain.head(), "C");
  EXPECT_EQ(chain.size(), 3u);

  std::vector<std::string> seen;
  for (const auto &item : chain) {
    seen.push_back(item);
  }
  EXPECT_EQ(seen, (std::vector<std::string>{ "C", "B", "A" }));
}

TEST(ChainTest, MutableIterationEditsInPlace) {
  Chain<int> chain;
  chain.append(1);
  chain.append(2);
  chain.append(3);

  for (auto &item : chain) {
    item *= 10;
  }

  std::vector<int> seen(chain.cbegin(), chain.cend());
  EXPECT_EQ(seen, (std::vector<int>{ 30, 20, 10 }));
  EXPECT_EQ(chain.size(), 3u);
}

TEST(ChainTest, HeadIsMutable) {
  Chain<int> chain;
  chain.append(7);
  *chain.head() = 8;
  EXPECT_EQ(*chain.begin(), 8);
}

TEST(ChainTest, MoveTransfersOwnership) {
  Chain<int> source;
  source.append(1);
  source.append(2);

  Chain<int> target(std::move(source));
  EXPECT_EQ(target.size(), 2u);
  EXPECT_EQ(*target.head(), 2);
  EXPECT_TRUE(source.empty());

  Chain<int> assigned;
  assigned.append(99);
  assigned = std::move(target);
  EXPECT_EQ(assigned.size(), 2u);
  EXPECT_EQ(*assigned.head(), 2);
}

TEST(ChainTest, LongChainTearsDownWithoutRecursion) {
  Chain<int> chain;
  for (int i = 0; i < 1000000; ++i) {
    chain.append(i);
  }
  EXPECT_EQ(chain.size(), 1000000u);
  EXPECT_EQ(*chain.head(), 999999);
}
