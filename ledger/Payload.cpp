#include "Payload.h"

#include <stdexcept>

namespace pc {

namespace {

void checkSerializable(const nlohmann::ordered_json &value,
                       const std::string &what) {
  try {
    (void)value.dump();
  } catch (const nlohmann::json::type_error &e) {
    throw std::invalid_argument(what + " is not valid UTF-8: " + e.what());
  }
}

} // namespace

Payload::Payload() : fields_(nlohmann::ordered_json::object()) {}

Payload Payload::marker(const std::string &text) {
  checkSerializable(text, "Payload marker");
  Payload payload;
  payload.isMarker_ = true;
  payload.marker_ = text;
  payload.fields_ = nlohmann::ordered_json::object();
  return payload;
}

Payload Payload::record(const nlohmann::ordered_json &fields) {
  if (!fields.is_object()) {
    throw std::invalid_argument("Payload record must be a JSON object");
  }
  checkSerializable(fields, "Payload record");
  Payload payload;
  payload.fields_ = fields;
  return payload;
}

Payload &Payload::set(const std::string &key,
                      const nlohmann::ordered_json &value) {
  if (isMarker_) {
    throw std::logic_error("Cannot set field '" + key + "' on marker payload");
  }
  nlohmann::ordered_json entry = nlohmann::ordered_json::object();
  entry[key] = value;
  checkSerializable(entry, "Payload field");
  fields_[key] = value;
  return *this;
}

bool Payload::has(const std::string &key) const {
  return !isMarker_ && fields_.contains(key);
}

const nlohmann::ordered_json &Payload::get(const std::string &key) const {
  if (!has(key)) {
    throw std::out_of_range("Payload has no field '" + key + "'");
  }
  return fields_.at(key);
}

size_t Payload::size() const { return isMarker_ ? 0 : fields_.size(); }

std::string Payload::canonical() const {
  if (isMarker_) {
    return marker_;
  }
  return fields_.dump();
}

nlohmann::ordered_json Payload::toJson() const {
  if (isMarker_) {
    return marker_;
  }
  return fields_;
}

Payload Payload::fromJson(const nlohmann::ordered_json &j) {
  if (j.is_string()) {
    return marker(j.get<std::string>());
  }
  if (j.is_object()) {
    return record(j);
  }
  throw std::invalid_argument("Payload must be a JSON string or object");
}

bool Payload::operator==(const Payload &other) const {
  return isMarker_ == other.isMarker_ && canonical() == other.canonical();
}

} // namespace pc
