/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file snowflake.hpp
 * @brief 64-bit time-ordered Snowflake identifiers.
 *
 * @details
 * Bit layout of a generated value (UNIX epoch, milliseconds):
 *
 * @code
 *  63                      22 21     17 16   12 11         0
 * +-------------------------+---------+-------+------------+
 * |      timestamp_ms       | machine |  node |  sequence  |
 * +-------------------------+---------+-------+------------+
 * @endcode
 *
 * A generator instance owns one (machine, node) slot and a 4096-value sequence
 * per millisecond. Three strategies trade clock reads for throughput:
 *
 * - `RealTime`: reads the clock on every call; the sequence restarts each new millisecond.
 * - `Generate`: reads the clock only when the sequence wraps.
 * - `Lazy`: never re-reads the clock; the embedded timestamp is bumped on wrap.
 *
 * Instances are internally synchronized. The static `generate()` used by the
 * entity contract draws from one process-wide instance that must be installed
 * first with `single_node()`, `distributed()` or `from_config()`.
 */

#pragma once

#include "tagid/infra/clock.hpp"
#include "tagid/infra/config.hpp"

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace tagid::gen {

enum class SnowflakeStrategy { RealTime, Generate, Lazy };

/// @brief `real_time`, `generate` or `lazy`.
const char* strategy_name(SnowflakeStrategy strategy) noexcept;

/// @throws tagid::ConfigError On an unknown name.
SnowflakeStrategy parse_strategy(std::string_view name);

/**
 * @struct MachineNode
 * @brief Identifies one generator slot; each component is in [0, 31].
 */
struct MachineNode {
    int machine_id = 1;
    int node_id = 1;

    /// @throws tagid::ConfigError If either component is outside [0, 31].
    static MachineNode create(int machine_id, int node_id);

    /// @brief `(machine::node)`, e.g. `(1::1)`.
    std::string to_string() const;

    bool operator==(const MachineNode& o) const noexcept
    {
        return machine_id == o.machine_id && node_id == o.node_id;
    }
    bool operator!=(const MachineNode& o) const noexcept { return !(*this == o); }
    bool operator<(const MachineNode& o) const noexcept
    {
        return machine_id != o.machine_id ? machine_id < o.machine_id : node_id < o.node_id;
    }
};

inline std::ostream& operator<<(std::ostream& os, const MachineNode& node)
{
    return os << node.to_string();
}

/// @brief The fields packed into a Snowflake value.
struct SnowflakeParts {
    int64_t timestamp_ms;
    int machine_id;
    int node_id;
    int sequence;
};

class SnowflakeGenerator {
  public:
    using value_type = int64_t;

    static constexpr int kSequenceBits = 12;
    static constexpr int kNodeBits = 5;
    static constexpr int kMachineBits = 5;
    static constexpr int kSequenceModulo = 1 << kSequenceBits;

    /**
     * @brief Creates a standalone generator. The clock is read once here.
     *
     * @throws tagid::ConfigError If @p node is out of range.
     */
    SnowflakeGenerator(MachineNode node, SnowflakeStrategy strategy,
                       infra::ClockPolicy policy = infra::ClockPolicy(),
                       infra::ClockFn clock = infra::system_clock());

    SnowflakeGenerator(const SnowflakeGenerator&) = delete;
    SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;

    /**
     * @brief Produces the next value of this instance.
     *
     * @throws tagid::ClockRegression When the clock moved backward and the policy gives up.
     * @throws tagid::GenerationFailure When the sequence is exhausted and the clock stalls.
     */
    int64_t next_value();

    MachineNode machine_node() const noexcept { return node_; }
    SnowflakeStrategy strategy() const noexcept { return strategy_; }
    const infra::ClockPolicy& clock_policy() const noexcept { return policy_; }

    /// @brief Generator contract entry point; draws from the process-wide instance.
    static int64_t generate();

    /**
     * @brief Installs the process-wide instance for machine/node (1, 1).
     *
     * Only the first installation takes effect; later calls return the existing
     * instance (a warning is logged if their arguments differ).
     */
    static SnowflakeGenerator& single_node(SnowflakeStrategy strategy = SnowflakeStrategy::RealTime);

    static SnowflakeGenerator& distributed(MachineNode node,
                                           SnowflakeStrategy strategy = SnowflakeStrategy::RealTime);

    /// @brief Installs from `TAGID_*` settings (node, strategy and clock policy).
    static SnowflakeGenerator& from_config(const infra::Config& config);

    /// @throws tagid::GenerationFailure If no process-wide instance was installed.
    static SnowflakeGenerator& summon();

    static bool is_initialized() noexcept;

    static int64_t compose(int64_t timestamp_ms, MachineNode node, int sequence) noexcept;

    static SnowflakeParts decompose(int64_t id) noexcept;

  private:
    static SnowflakeGenerator& install(MachineNode node, SnowflakeStrategy strategy,
                                       const infra::ClockPolicy& policy);

    int64_t real_time_next();
    int64_t generate_next();
    int64_t lazy_next();

    const MachineNode node_;
    const SnowflakeStrategy strategy_;
    const infra::ClockPolicy policy_;
    const infra::ClockFn clock_;

    std::mutex mutex_;
    int64_t last_time_ms_;
    int sequence_ = 0;
};

} // namespace tagid::gen
