// scopelink/basic/id_generator.cpp - Identity generation
//
#include "scopelink/basic/id_generator.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace scopelink
{

std::string to_string(NodeId id) { return fmt::format("{:016x}", id.value); }

std::string_view to_string(IdStrategy strategy) noexcept
{
  switch (strategy) {
    case IdStrategy::Counter:
      return "counter";
    case IdStrategy::Random:
      return "random";
  }
  return "counter";
}

std::optional<IdStrategy> parse_id_strategy(std::string_view text) noexcept
{
  if (text == "counter") return IdStrategy::Counter;
  if (text == "random") return IdStrategy::Random;
  return std::nullopt;
}

IdGenerator::IdGenerator(IdStrategy strategy, uint64_t first)
: strategy_(strategy), counter_(std::max<uint64_t>(first, 1)), engine_(std::random_device{}())
{
}

NodeId IdGenerator::next()
{
  uint64_t value = 0;
  if (strategy_ == IdStrategy::Counter) {
    value = counter_++;
  } else {
    // 0 is the reserved invalid id
    do {
      value = engine_();
    } while (value == 0);
  }
  high_water_mark_ = std::max(high_water_mark_, value);
  return NodeId{value};
}

}  // namespace scopelink
