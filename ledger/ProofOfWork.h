#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace pc {

// Hex length of a SHA-256 digest, the largest difficulty that can be met
constexpr uint32_t MAX_DIFFICULTY = 64;

/**
 * True when hash starts with `difficulty` '0' characters.
 * Difficulty 0 accepts any hash.
 */
bool meetsDifficulty(const std::string &hash, uint32_t difficulty);

/**
 * Optional controls for a nonce search. A default-constructed control
 * searches until a nonce is found.
 */
struct MiningControl {
  using ProgressCallback =
      std::function<void(uint64_t attempts, uint64_t nonce, const std::string &hash)>;

  const std::atomic<bool> *cancelFlag{nullptr}; // checked every checkInterval attempts
  uint64_t checkInterval{10000};
  uint64_t maxAttempts{0};                      // 0 = unlimited
  ProgressCallback onProgress;
};

struct MiningStats {
  uint32_t difficulty{0};
  uint64_t nonce{0};
  uint64_t attempts{0}; // hashes computed, including the winning one
  int64_t elapsedMs{0};
};

} // namespace pc
