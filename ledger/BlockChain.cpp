#include "BlockChain.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <stdexcept>

namespace pc {

namespace {

void checkDifficulty(uint32_t difficulty) {
  if (difficulty > MAX_DIFFICULTY) {
    throw std::invalid_argument("Difficulty must be at most " +
                                std::to_string(MAX_DIFFICULTY) + ", got " +
                                std::to_string(difficulty));
  }
}

const char *faultToString(BlockChain::Fault fault) {
  switch (fault) {
  case BlockChain::Fault::NONE:
    return "none";
  case BlockChain::Fault::HASH_MISMATCH:
    return "hash mismatch";
  case BlockChain::Fault::LINKAGE_BROKEN:
    return "linkage broken";
  case BlockChain::Fault::INSUFFICIENT_WORK:
    return "insufficient work";
  }
  return "unknown";
}

} // namespace

std::string BlockChain::ValidationResult::toString() const {
  if (ok) {
    return "valid";
  }
  return "block " + std::to_string(failedIndex) + ": " + faultToString(fault);
}

BlockChain::BlockChain(uint32_t difficulty, int64_t genesisTime)
    : Module("blockchain"), difficulty_(difficulty) {
  checkDifficulty(difficulty);
  initMiningControl(MiningControl().checkInterval);
  createGenesisBlock(genesisTime);
}

BlockChain::BlockChain(const ChainConfig &config)
    : Module("blockchain"), difficulty_(config.difficulty) {
  checkDifficulty(config.difficulty);
  initMiningControl(config.checkInterval);
  createGenesisBlock(config.genesisTime);
}

BlockChain::BlockChain(uint32_t difficulty,
                       std::vector<std::shared_ptr<Block>> blocks)
    : Module("blockchain"), chain_(std::move(blocks)), difficulty_(difficulty) {
  initMiningControl(MiningControl().checkInterval);
}

void BlockChain::initMiningControl(uint64_t checkInterval) {
  miningControl_.checkInterval = checkInterval;
}

void BlockChain::createGenesisBlock(int64_t genesisTime) {
  int64_t timestamp = genesisTime != 0 ? genesisTime : utl::getCurrentTime();
  // Genesis is never mined
  auto genesis = std::make_shared<Block>(0, GENESIS_PREVIOUS_HASH, timestamp,
                                         Payload::marker(GENESIS_MARKER));
  chain_.push_back(genesis);
  log().debug << "Genesis block " << genesis->getHash() << " (difficulty "
              << difficulty_ << ")";
}

BlockChain::Roe<MiningStats> BlockChain::append(std::shared_ptr<Block> block) {
  return append(std::move(block), miningControl_);
}

BlockChain::Roe<MiningStats> BlockChain::append(std::shared_ptr<Block> block,
                                                const MiningControl &control) {
  if (!block) {
    return Error(E_BLOCK_NULL, "Cannot append a null block");
  }

  if (block->getIndex() != chain_.size()) {
    log().warning << "Rejected block " << block->getIndex()
                  << ": expected index " << chain_.size();
    return Error(E_BLOCK_SEQUENCE,
                 "Block index " + std::to_string(block->getIndex()) +
                     " does not continue chain of size " +
                     std::to_string(chain_.size()));
  }

  // The chain owns linkage; whatever the caller put here is discarded
  block->setPreviousHash(chain_.back()->getHash());

  // Progress is logged through this chain for the duration of the call only
  MiningControl localControl = control;
  localControl.onProgress = [this, &control](uint64_t attempts, uint64_t nonce,
                                             const std::string &hash) {
    log().debug << "Mining block: " << attempts << " attempts, nonce " << nonce
                << ", hash " << hash;
    if (control.onProgress) {
      control.onProgress(attempts, nonce, hash);
    }
  };

  auto mined = block->mine(difficulty_, localControl);
  if (!mined) {
    log().warning << "Block " << block->getIndex()
                  << " not appended: " << mined.error().message;
    return Error(E_MINING, mined.error().message);
  }

  chain_.push_back(block);

  const MiningStats &stats = mined.value();
  log().info << "Mined block " << block->getIndex() << " nonce=" << stats.nonce
             << " attempts=" << stats.attempts << " in " << stats.elapsedMs
             << " ms: " << block->getHash();
  return stats;
}

std::shared_ptr<Block> BlockChain::makeBlock(const Payload &payload) const {
  return std::make_shared<Block>(chain_.size(), getLastBlockHash(),
                                 utl::getCurrentTime(), payload);
}

bool BlockChain::isValid() const { return validate(false).ok; }

BlockChain::ValidationResult BlockChain::validate(bool requireWork) const {
  ValidationResult result;

  // Genesis has no predecessor and is never mined
  for (size_t i = 1; i < chain_.size(); i++) {
    const auto &currentBlock = chain_[i];
    const auto &previousBlock = chain_[i - 1];

    if (!currentBlock->hasValidHash()) {
      result.fault = Fault::HASH_MISMATCH;
    } else if (currentBlock->getPreviousHash() != previousBlock->getHash()) {
      result.fault = Fault::LINKAGE_BROKEN;
    } else if (requireWork &&
               !meetsDifficulty(currentBlock->getHash(), difficulty_)) {
      result.fault = Fault::INSUFFICIENT_WORK;
    }

    if (result.fault != Fault::NONE) {
      result.ok = false;
      result.failedIndex = i;
      return result;
    }
  }

  return result;
}

std::shared_ptr<Block> BlockChain::getLatestBlock() const {
  return chain_.back();
}

std::shared_ptr<Block> BlockChain::getBlock(uint64_t index) const {
  if (index >= chain_.size()) {
    return nullptr;
  }
  return chain_[index];
}

std::vector<std::shared_ptr<Block>>
BlockChain::getBlocks(uint64_t fromIndex, uint64_t toIndex) const {
  std::vector<std::shared_ptr<Block>> result;

  if (fromIndex > toIndex || fromIndex >= chain_.size()) {
    return result;
  }

  uint64_t endIndex =
      std::min(toIndex + 1, static_cast<uint64_t>(chain_.size()));
  for (uint64_t i = fromIndex; i < endIndex; i++) {
    result.push_back(chain_[i]);
  }
  return result;
}

size_t BlockChain::getSize() const { return chain_.size(); }

uint32_t BlockChain::getDifficulty() const { return difficulty_; }

std::string BlockChain::getLastBlockHash() const {
  return chain_.back()->getHash();
}

nlohmann::ordered_json BlockChain::toJson() const {
  nlohmann::ordered_json j;
  j["difficulty"] = difficulty_;
  j["blocks"] = nlohmann::ordered_json::array();
  for (const auto &block : chain_) {
    j["blocks"].push_back(block->toJson());
  }
  return j;
}

BlockChain::Roe<std::unique_ptr<BlockChain>>
BlockChain::fromJson(const nlohmann::ordered_json &j) {
  if (!j.is_object() || !j.contains("difficulty") || !j.contains("blocks")) {
    return Error(E_CHAIN_FORMAT, "Chain JSON needs 'difficulty' and 'blocks'");
  }
  const auto &difficultyJson = j["difficulty"];
  if (!difficultyJson.is_number_unsigned() ||
      difficultyJson.get<uint64_t>() > MAX_DIFFICULTY) {
    return Error(E_CHAIN_FORMAT, "Invalid chain difficulty");
  }
  const auto &blocksJson = j["blocks"];
  if (!blocksJson.is_array() || blocksJson.empty()) {
    return Error(E_CHAIN_FORMAT, "Chain 'blocks' must be a non-empty array");
  }

  std::vector<std::shared_ptr<Block>> blocks;
  blocks.reserve(blocksJson.size());
  for (const auto &blockJson : blocksJson) {
    auto parsed = Block::fromJson(blockJson);
    if (!parsed) {
      return Error(E_CHAIN_FORMAT, "Block " + std::to_string(blocks.size()) +
                                       ": " + parsed.error().message);
    }
    if (parsed.value().getIndex() != blocks.size()) {
      return Error(E_CHAIN_INVALID,
                   "Block at position " + std::to_string(blocks.size()) +
                       " has index " + std::to_string(parsed.value().getIndex()));
    }
    blocks.push_back(std::make_shared<Block>(std::move(parsed.value())));
  }

  const auto &genesis = blocks.front();
  if (genesis->getPreviousHash() != GENESIS_PREVIOUS_HASH ||
      !genesis->hasValidHash()) {
    return Error(E_CHAIN_INVALID, "Genesis block is not a valid genesis");
  }

  std::unique_ptr<BlockChain> chain(
      new BlockChain(difficultyJson.get<uint32_t>(), std::move(blocks)));
  auto validation = chain->validate(true);
  if (!validation.ok) {
    chain->log().warning << "Loaded chain is invalid at "
                         << validation.toString();
    return Error(E_CHAIN_INVALID, "Chain invalid at " + validation.toString());
  }
  return std::move(chain);
}

BlockChain::Roe<void> BlockChain::saveToFile(const std::string &path) const {
  auto result = utl::writeToFile(path, toJson().dump(2));
  if (!result) {
    return Error(E_CHAIN_IO, result.error().message);
  }
  log().info << "Saved " << chain_.size() << " blocks to " << path;
  return {};
}

BlockChain::Roe<std::unique_ptr<BlockChain>>
BlockChain::loadFromFile(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CHAIN_IO, jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

} // namespace pc
