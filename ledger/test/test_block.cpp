#include "LedgerTestUtil.h"

#include <gtest/gtest.h>

using namespace tally;
using tally::test::createAccountTx;
using tally::test::generateRandomAccount;
using tally::test::mintTx;

TEST(BlockTest, NewBlockHasNoHash) {
  Block block;
  EXPECT_FALSE(block.getHash().has_value());
  EXPECT_FALSE(block.getPreviousHash().has_value());
  EXPECT_EQ(block.getTransactionCount(), 0u);
  EXPECT_FALSE(block.verify());
}

TEST(BlockTest, MutatorsKeepHashCurrent) {
  Block block;
  block.setNonce(42);
  EXPECT_TRUE(block.verify());
  EXPECT_EQ(block.getNonce(), static_cast<Nonce>(42));

  block.addTransaction(createAccountTx("alice"));
  EXPECT_TRUE(block.verify());
  EXPECT_EQ(*block.getHash(), block.calculateHash());

  block.setPreviousHash(std::string("abc"));
  EXPECT_TRUE(block.verify());
  ASSERT_TRUE(block.getPreviousHash().has_value());
  EXPECT_EQ(*block.getPreviousHash(), "abc");
}

TEST(BlockTest, HashIsDeterministic) {
  auto tx = createAccountTx("alice");

  Block a;
  a.setNonce(1);
  a.addTransaction(tx);

  Block b;
  b.setNonce(1);
  b.addTransaction(tx);

  EXPECT_EQ(*a.getHash(), *b.getHash());
  EXPECT_EQ(a.getHash()->size(), 64u);
}

TEST(BlockTest, HashDependsOnNonceAndPreviousHash) {
  Block base;
  base.setNonce(1);

  Block otherNonce;
  otherNonce.setNonce(2);
  EXPECT_NE(*base.getHash(), *otherNonce.getHash());

  Block linked(std::string("prev"));
  linked.setNonce(1);
  EXPECT_NE(*base.getHash(), *linked.getHash());
}

TEST(BlockTest, HashDependsOnTransactionOrder) {
  auto first = createAccountTx("alice");
  auto second = createAccountTx("bob");

  Block ab;
  ab.addTransaction(first);
  ab.addTransaction(second);

  Block ba;
  ba.addTransaction(second);
  ba.addTransaction(first);

  EXPECT_NE(*ab.getHash(), *ba.getHash());
}

TEST(BlockTest, RawNonceEditBreaksVerification) {
  Block block;
  block.setNonce(1);
  ASSERT_TRUE(block.verify());

  BlockTestPeer::setNonceRaw(block, 2);
  EXPECT_FALSE(block.verify());

  // Any mutator brings the cached hash back in line
  block.setNonce(3);
  EXPECT_TRUE(block.verify());
}

TEST(BlockTest, RawTransactionReplacementBreaksVerification) {
  Block block;
  block.addTransaction(mintTx("alice", 100));
  ASSERT_TRUE(block.verify());

  BlockTestPeer::transactions(block)[0] = mintTx("alice", 1000);
  EXPECT_FALSE(block.verify());
}

TEST(BlockTest, RawPreviousHashEditBreaksVerification) {
  Block block(std::string("prev"));
  block.setNonce(0);
  ASSERT_TRUE(block.verify());

  BlockTestPeer::setPreviousHashRaw(block, std::nullopt);
  EXPECT_FALSE(block.verify());
}

TEST(BlockTest, SignatureDoesNotAffectBlockHash) {
  Transaction unsigned_(Transfer{ generateRandomAccount(), 5 }, "alice");
  Transaction signed_ = unsigned_;
  signed_.addSignature(std::string(64, 'x'));

  Block a;
  a.addTransaction(unsigned_);
  Block b;
  b.addTransaction(signed_);

  EXPECT_EQ(*a.getHash(), *b.getHash());
}
