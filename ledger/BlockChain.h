#pragma once

#include "Block.h"
#include "ChainConfig.h"
#include "ProofOfWork.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pc {

/**
 * In-memory proof-of-work chain.
 *
 * - Starts with an unmined genesis block (index 0, previous hash "0",
 *   payload "Genesis Block")
 * - append() relinks a block to the current tip, mines it at the chain's
 *   difficulty and stores it
 * - Blocks are never removed or reordered; difficulty never changes
 *
 * Single writer. The cancel flag in MiningControl is the only thing another
 * thread may touch during append().
 */
class BlockChain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Append errors (10-29)
  constexpr static int32_t E_BLOCK_NULL = 10;     // No block given
  constexpr static int32_t E_BLOCK_SEQUENCE = 11; // Index does not continue the chain
  constexpr static int32_t E_MINING = 20;         // Nonce search did not finish

  // Persistence errors (30-39)
  constexpr static int32_t E_CHAIN_INVALID = 30;  // Loaded chain fails validation
  constexpr static int32_t E_CHAIN_FORMAT = 31;   // Malformed chain JSON
  constexpr static int32_t E_CHAIN_IO = 32;       // File read/write failed

  constexpr static const char *GENESIS_PREVIOUS_HASH = "0";
  constexpr static const char *GENESIS_MARKER = "Genesis Block";

  enum class Fault { NONE, HASH_MISMATCH, LINKAGE_BROKEN, INSUFFICIENT_WORK };

  struct ValidationResult {
    bool ok{true};
    uint64_t failedIndex{0};
    Fault fault{Fault::NONE};

    std::string toString() const;
  };

  /**
   * @param difficulty Leading zero hex digits required of mined blocks
   * @param genesisTime Genesis timestamp in Unix seconds, 0 = now
   * @throws std::invalid_argument if difficulty > MAX_DIFFICULTY
   */
  explicit BlockChain(uint32_t difficulty, int64_t genesisTime = 0);
  explicit BlockChain(const ChainConfig &config);
  ~BlockChain() override = default;

  /**
   * Link, mine and store a block. The block's previous hash is replaced by
   * the tip's hash; its nonce and hash are updated in place.
   * Fails with E_BLOCK_SEQUENCE if block->getIndex() != getSize().
   */
  Roe<MiningStats> append(std::shared_ptr<Block> block);
  Roe<MiningStats> append(std::shared_ptr<Block> block,
                          const MiningControl &control);

  // Unmined block for the next index, linked to the tip, stamped now
  std::shared_ptr<Block> makeBlock(const Payload &payload) const;

  /**
   * Hash recomputation and linkage check for every block after genesis.
   * Stops at the first failure.
   */
  bool isValid() const;

  /**
   * Same checks as isValid(), reporting the first failing block.
   * @param requireWork Also check each hash against the difficulty
   */
  ValidationResult validate(bool requireWork = false) const;

  std::shared_ptr<Block> getLatestBlock() const;
  std::shared_ptr<Block> getBlock(uint64_t index) const;
  std::vector<std::shared_ptr<Block>> getBlocks(uint64_t fromIndex,
                                                uint64_t toIndex) const;
  size_t getSize() const;
  uint32_t getDifficulty() const;
  std::string getLastBlockHash() const;

  const MiningControl &getMiningControl() const { return miningControl_; }
  void setMiningControl(const MiningControl &control) { miningControl_ = control; }

  // {"difficulty": n, "blocks": [...]}
  nlohmann::ordered_json toJson() const;
  static Roe<std::unique_ptr<BlockChain>> fromJson(const nlohmann::ordered_json &j);

  Roe<void> saveToFile(const std::string &path) const;
  static Roe<std::unique_ptr<BlockChain>> loadFromFile(const std::string &path);

private:
  BlockChain(uint32_t difficulty, std::vector<std::shared_ptr<Block>> blocks);

  void createGenesisBlock(int64_t genesisTime);
  void initMiningControl(uint64_t checkInterval);

  std::vector<std::shared_ptr<Block>> chain_;
  uint32_t difficulty_;
  MiningControl miningControl_;
};

} // namespace pc
