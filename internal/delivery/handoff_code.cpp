#include "internal/delivery/handoff_code.hpp"

#include <random>

#include "internal/util/errors.hpp"

namespace dispatch::delivery {

namespace {

constexpr std::string_view kAlphabet     = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
constexpr std::size_t      kSegments     = 3;
constexpr std::size_t      kSegmentWidth = 3;
constexpr std::size_t      kCodeLength   = kSegments * kSegmentWidth + (kSegments - 1);

} // namespace

std::string NewHandoffCode() {
  static thread_local std::mt19937_64          rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);

  std::string code;
  code.reserve(kCodeLength);
  for (std::size_t i = 0; i < kSegments * kSegmentWidth; ++i) {
    if (i != 0 && i % kSegmentWidth == 0) {
      code.push_back('-');
    }
    code.push_back(kAlphabet[pick(rng)]);
  }
  return code;
}

bool IsWellFormedHandoffCode(std::string_view code) {
  if (code.size() != kCodeLength) {
    return false;
  }
  for (std::size_t i = 0; i < code.size(); ++i) {
    const bool separator = (i + 1) % (kSegmentWidth + 1) == 0;
    if (separator ? code[i] != '-' : kAlphabet.find(code[i]) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

void VerifyHandoffCode(std::string_view expected, std::string_view provided, std::string_view which) {
  if (!IsWellFormedHandoffCode(provided)) {
    throw util::InvalidArgument(std::string(which) + " code must look like XXX-XXX-XXX");
  }
  if (provided != expected) {
    throw util::HandoffCodeMismatch(std::string(which) + " code does not match");
  }
}

} // namespace dispatch::delivery
