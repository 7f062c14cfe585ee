#ifndef POWCHAIN_UTILITIES_H
#define POWCHAIN_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 * @return Current time in seconds
 */
int64_t getCurrentTime();

/**
 * Compute SHA-256 using the OpenSSL EVP API
 * @param input Input bytes
 * @return Lowercase hexadecimal digest (64 characters)
 * @throws std::runtime_error if the digest backend fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as lowercase hex
 */
std::string hexEncode(const std::string &data);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON with object key order preserved, or error
 *         (1 not found, 2 open failure, 3 parse failure)
 */
Roe<nlohmann::ordered_json> loadJsonFile(const std::string &path);

/**
 * Write a string to a file, replacing any previous content.
 * Creates parent directories if needed.
 * @return Roe<void> (4 on write failure)
 */
Roe<void> writeToFile(const std::string &filePath, const std::string &content);

} // namespace utl
} // namespace pc

#endif // POWCHAIN_UTILITIES_H
