// Copyright 2026 The boardkit Authors

#include "scene/object_id.h"

#include <chrono>
#include <random>

namespace boardkit {
namespace internal {

namespace {

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr int kSuffixLength = 9;

}  // namespace

std::string GenerateObjectId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int> digit(0, 35);

  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();

  std::string id = "obj_" + std::to_string(now_ms) + "_";
  for (int i = 0; i < kSuffixLength; ++i) {
    id.push_back(kBase36[digit(rng)]);
  }
  return id;
}

}  // namespace internal
}  // namespace boardkit
