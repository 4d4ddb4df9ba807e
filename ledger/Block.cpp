#include "Block.h"
#include "../lib/BinaryPack.hpp"
#include "../lib/Utilities.h"

#include <utility>

namespace tally {

namespace {

struct BlockHeader {
  const std::optional<Hash> &previousHash;
  Nonce nonce;

  template <typename Archive> void serialize(Archive &ar) const {
    ar & previousHash & nonce;
  }
};

} // namespace

Block::Block(std::optional<Hash> previousHash)
    : previousHash_(std::move(previousHash)) {}

void Block::setNonce(Nonce nonce) {
  nonce_ = nonce;
  updateHash();
}

void Block::addTransaction(Transaction tx) {
  transactions_.push_back(std::move(tx));
  updateHash();
}

void Block::setPreviousHash(std::optional<Hash> previousHash) {
  previousHash_ = std::move(previousHash);
  updateHash();
}

Hash Block::calculateHash() const {
  std::string preimage = utl::binaryPack(BlockHeader{ previousHash_, nonce_ });
  for (const auto &tx : transactions_) {
    preimage += tx.calculateHash();
  }
  return utl::blake2b256(preimage);
}

bool Block::verify() const { return hash_ && *hash_ == calculateHash(); }

void Block::updateHash() { hash_ = calculateHash(); }

} // namespace tally
