#include "Utilities.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace pc {
namespace utl {

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string sha256(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                             &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  return hexEncode(
      std::string(reinterpret_cast<const char *>(hash), hashLen));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

Roe<nlohmann::ordered_json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream in(path);
  if (!in.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());

  try {
    return nlohmann::ordered_json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }
}

Roe<void> writeToFile(const std::string &filePath, const std::string &content) {
  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(4, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return Error(4, "Failed to open file for writing: " + filePath);
  }
  out << content;
  out.close();
  if (out.fail()) {
    return Error(4, "Failed to write file: " + filePath);
  }
  return {};
}

} // namespace utl
} // namespace pc
