#include "ProofOfWork.h"

namespace pc {

bool meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  if (difficulty == 0) {
    return true;
  }
  if (hash.size() < difficulty) {
    return false;
  }
  return hash.find_first_not_of('0') >= difficulty;
}

} // namespace pc
