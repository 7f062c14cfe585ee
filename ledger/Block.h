#pragma once

#include "Payload.h"
#include "ProofOfWork.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pc {

/**
 * A single link of the chain.
 *
 * The hash is a cache of digest(index, previousHash, timestamp, payload,
 * nonce). Only mine() changes the nonce, and it recomputes the hash with
 * every change. The field setters below leave the hash stale so that chain
 * validation can detect edits made after mining.
 */
class Block {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Mining errors (1-9)
  constexpr static int32_t E_MINING_CANCELLED = 1; // Cancel flag was raised
  constexpr static int32_t E_MINING_ABORTED = 2;   // maxAttempts reached
  constexpr static int32_t E_NONCE_EXHAUSTED = 3;  // Nonce counter would overflow

  // Serialization errors (10-19)
  constexpr static int32_t E_BLOCK_FORMAT = 10;    // Malformed block JSON

  Block(uint64_t index, const std::string &previousHash, int64_t timestamp,
        const Payload &payload, uint64_t nonce = 0);

  uint64_t getIndex() const { return index_; }
  const std::string &getPreviousHash() const { return previousHash_; }
  int64_t getTimestamp() const { return timestamp_; }
  const Payload &getPayload() const { return payload_; }
  uint64_t getNonce() const { return nonce_; }
  const std::string &getHash() const { return hash_; }

  /**
   * Concatenation hashed by calculateHash():
   * decimal index + previousHash + decimal timestamp + payload.canonical()
   * + decimal nonce
   */
  std::string getDigestInput() const;

  // SHA-256 of getDigestInput(), lowercase hex. Does not touch the block.
  std::string calculateHash() const;

  bool hasValidHash() const { return hash_ == calculateHash(); }

  /**
   * Proof of work: starting from the current nonce, increment until the hash
   * has `difficulty` leading '0' hex characters.
   * @throws std::invalid_argument if difficulty > MAX_DIFFICULTY
   */
  Roe<MiningStats> mine(uint32_t difficulty, const MiningControl &control = {});

  // These do not refresh the hash
  void setPreviousHash(const std::string &previousHash);
  void setPayload(const Payload &payload);

  nlohmann::ordered_json toJson() const;
  static Roe<Block> fromJson(const nlohmann::ordered_json &j);

private:
  uint64_t index_;
  std::string previousHash_;
  int64_t timestamp_;
  Payload payload_;
  uint64_t nonce_;
  std::string hash_;
};

} // namespace pc
