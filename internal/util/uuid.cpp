#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace planner::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(Rng()());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string NewWorkflowId() {
  return ToString(GenerateUUID());
}

std::string RandomAlphanumeric(std::size_t length) {
  static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

  std::random_device                         rd;
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i)
    out.push_back(kAlphabet[pick(rd)]);
  return out;
}

} // namespace planner::util
