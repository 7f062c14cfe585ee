#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace pc {

/**
 * Block payload: either a plain marker string (the genesis block carries
 * "Genesis Block") or an ordered record of named fields.
 *
 * canonical() is what feeds the block digest:
 * - marker: the raw string
 * - record: compact JSON, fields in insertion order
 *
 * Text that is not valid UTF-8 cannot be serialized, so every entry point
 * rejects it with std::invalid_argument.
 */
class Payload {
public:
  // Empty record
  Payload();

  static Payload marker(const std::string &text);
  static Payload record(const nlohmann::ordered_json &fields);

  bool isMarker() const { return isMarker_; }

  // Set or replace a record field; replacing keeps the field's position.
  // Throws std::logic_error on a marker payload.
  Payload &set(const std::string &key, const nlohmann::ordered_json &value);

  bool has(const std::string &key) const;
  const nlohmann::ordered_json &get(const std::string &key) const;
  size_t size() const;

  std::string canonical() const;

  // JSON string for a marker, JSON object for a record
  nlohmann::ordered_json toJson() const;
  static Payload fromJson(const nlohmann::ordered_json &j);

  bool operator==(const Payload &other) const;
  bool operator!=(const Payload &other) const { return !(*this == other); }

private:
  bool isMarker_{false};
  std::string marker_;
  nlohmann::ordered_json fields_;
};

} // namespace pc
