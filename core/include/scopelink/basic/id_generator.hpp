// scopelink/basic/id_generator.hpp - Node identities and their generation
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace scopelink
{

// ============================================================================
// NodeId
// ============================================================================

/**
 * Identity of a model node within one Environment.
 *
 * The value 0 is reserved for "not stamped yet".
 */
struct NodeId
{
  uint64_t value = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }

  [[nodiscard]] static constexpr NodeId invalid() noexcept { return NodeId{}; }

  friend constexpr bool operator==(NodeId a, NodeId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(NodeId a, NodeId b) noexcept { return a.value != b.value; }
  friend constexpr bool operator<(NodeId a, NodeId b) noexcept { return a.value < b.value; }
};

/// Hex rendering used by dumps and the CLI (e.g. "00000000000000a3").
[[nodiscard]] std::string to_string(NodeId id);

struct NodeIdHash
{
  size_t operator()(NodeId id) const noexcept { return std::hash<uint64_t>{}(id.value); }
};

// ============================================================================
// IdGenerator
// ============================================================================

/**
 * How fresh identities are produced. Only uniqueness is part of the contract.
 */
enum class IdStrategy : uint8_t {
  Counter,  ///< Monotonic, deterministic (default)
  Random,   ///< 64-bit random values
};

[[nodiscard]] std::string_view to_string(IdStrategy strategy) noexcept;
[[nodiscard]] std::optional<IdStrategy> parse_id_strategy(std::string_view text) noexcept;

/**
 * Produces unique NodeIds for one ModelContext.
 *
 * The counter strategy starts at `first`, which lets a relink continue after the
 * identities of the environment it is built from.
 */
class IdGenerator
{
public:
  explicit IdGenerator(IdStrategy strategy = IdStrategy::Counter, uint64_t first = 1);

  /// Produce the next identity (never invalid).
  [[nodiscard]] NodeId next();

  [[nodiscard]] IdStrategy strategy() const noexcept { return strategy_; }

  /// Highest value handed out so far (0 if none).
  [[nodiscard]] uint64_t high_water_mark() const noexcept { return high_water_mark_; }

private:
  IdStrategy strategy_;
  uint64_t counter_;
  uint64_t high_water_mark_ = 0;
  std::mt19937_64 engine_;
};

}  // namespace scopelink
