#include "Block.h"
#include "../lib/Utilities.h"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace pc {

Block::Block(uint64_t index, const std::string &previousHash,
             int64_t timestamp, const Payload &payload, uint64_t nonce)
    : index_(index), previousHash_(previousHash), timestamp_(timestamp),
      payload_(payload), nonce_(nonce) {
  hash_ = calculateHash();
}

std::string Block::getDigestInput() const {
  std::string input;
  input += std::to_string(index_);
  input += previousHash_;
  input += std::to_string(timestamp_);
  input += payload_.canonical();
  input += std::to_string(nonce_);
  return input;
}

std::string Block::calculateHash() const { return utl::sha256(getDigestInput()); }

Block::Roe<MiningStats> Block::mine(uint32_t difficulty,
                                    const MiningControl &control) {
  if (difficulty > MAX_DIFFICULTY) {
    throw std::invalid_argument("Difficulty " + std::to_string(difficulty) +
                                " exceeds " + std::to_string(MAX_DIFFICULTY));
  }

  auto start = std::chrono::steady_clock::now();
  auto elapsedMs = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  MiningStats stats;
  stats.difficulty = difficulty;

  hash_ = calculateHash();
  stats.attempts = 1;

  while (!meetsDifficulty(hash_, difficulty)) {
    if (control.maxAttempts > 0 && stats.attempts >= control.maxAttempts) {
      return Error(E_MINING_ABORTED, "Gave up on block " +
                                         std::to_string(index_) + " after " +
                                         std::to_string(stats.attempts) +
                                         " attempts");
    }
    if (control.checkInterval > 0 && stats.attempts % control.checkInterval == 0) {
      if (control.onProgress) {
        control.onProgress(stats.attempts, nonce_, hash_);
      }
      if (control.cancelFlag &&
          control.cancelFlag->load(std::memory_order_relaxed)) {
        return Error(E_MINING_CANCELLED,
                     "Mining of block " + std::to_string(index_) +
                         " cancelled at nonce " + std::to_string(nonce_));
      }
    }
    if (nonce_ == std::numeric_limits<uint64_t>::max()) {
      return Error(E_NONCE_EXHAUSTED, "Nonce space exhausted for block " +
                                          std::to_string(index_));
    }
    ++nonce_;
    hash_ = calculateHash();
    ++stats.attempts;
  }

  stats.nonce = nonce_;
  stats.elapsedMs = elapsedMs();
  return stats;
}

void Block::setPreviousHash(const std::string &previousHash) {
  previousHash_ = previousHash;
}

void Block::setPayload(const Payload &payload) { payload_ = payload; }

nlohmann::ordered_json Block::toJson() const {
  nlohmann::ordered_json j;
  j["index"] = index_;
  j["previousHash"] = previousHash_;
  j["timestamp"] = timestamp_;
  j["payload"] = payload_.toJson();
  j["nonce"] = nonce_;
  j["hash"] = hash_;
  return j;
}

Block::Roe<Block> Block::fromJson(const nlohmann::ordered_json &j) {
  if (!j.is_object()) {
    return Error(E_BLOCK_FORMAT, "Block entry must be a JSON object");
  }
  for (const char *key :
       {"index", "previousHash", "timestamp", "payload", "nonce", "hash"}) {
    if (!j.contains(key)) {
      return Error(E_BLOCK_FORMAT, std::string("Block is missing '") + key + "'");
    }
  }
  if (!j["index"].is_number_unsigned() || !j["nonce"].is_number_unsigned()) {
    return Error(E_BLOCK_FORMAT, "Block index and nonce must be unsigned integers");
  }
  if (!j["timestamp"].is_number_integer()) {
    return Error(E_BLOCK_FORMAT, "Block timestamp must be an integer");
  }
  if (!j["previousHash"].is_string() || !j["hash"].is_string()) {
    return Error(E_BLOCK_FORMAT, "Block hashes must be strings");
  }

  try {
    Block block(j["index"].get<uint64_t>(), j["previousHash"].get<std::string>(),
                j["timestamp"].get<int64_t>(), Payload::fromJson(j["payload"]),
                j["nonce"].get<uint64_t>());
    // Stored hash is kept as-is so validation can compare it
    block.hash_ = j["hash"].get<std::string>();
    return block;
  } catch (const std::invalid_argument &e) {
    return Error(E_BLOCK_FORMAT, e.what());
  }
}

} // namespace pc
