#include "cardlink/core/ref_id.hpp"

#include <algorithm>
#include <cstdint>
#include <random>

namespace cardlink::core {

namespace {

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t kBase36Size = 36;

std::string encodeTimestamp(uint64_t milliseconds) {
  if (milliseconds == 0) {
    return "0";
  }

  std::string result;
  while (milliseconds > 0) {
    result += kBase36[milliseconds % kBase36Size];
    milliseconds /= kBase36Size;
  }
  std::reverse(result.begin(), result.end());
  return result;
}

std::string generateRandomness() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(rd());
  static thread_local std::uniform_int_distribution<> dis(0, kBase36Size - 1);

  std::string result;
  result.reserve(RefId::kRandomLength);

  for (size_t i = 0; i < RefId::kRandomLength; ++i) {
    result += kBase36[dis(gen)];
  }

  return result;
}

}  // namespace

std::string RefId::generate() {
  return generate(std::chrono::system_clock::now());
}

std::string RefId::generate(std::chrono::system_clock::time_point timestamp) {
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      timestamp.time_since_epoch()).count();
  if (milliseconds < 0) {
    milliseconds = 0;
  }

  return encodeTimestamp(static_cast<uint64_t>(milliseconds)) + generateRandomness();
}

bool RefId::isIdChar(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool RefId::isValid(std::string_view id) noexcept {
  return !id.empty() && std::all_of(id.begin(), id.end(), isIdChar);
}

}  // namespace cardlink::core
