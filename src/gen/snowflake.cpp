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
 * @file snowflake.cpp
 * @brief Snowflake generation strategies and the process-wide instance.
 */

#include "tagid/gen/snowflake.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/logger.hpp"
#include "tagid/infra/string.hpp"

#include <atomic>
#include <memory>

namespace tagid::gen {

namespace {

const std::string kName = "Snowflake";

std::once_flag g_install_once;
std::unique_ptr<SnowflakeGenerator> g_owner;
std::atomic<SnowflakeGenerator*> g_instance{nullptr};

} // namespace

const char* strategy_name(SnowflakeStrategy strategy) noexcept
{
    switch (strategy) {
    case SnowflakeStrategy::RealTime:
        return "real_time";
    case SnowflakeStrategy::Generate:
        return "generate";
    case SnowflakeStrategy::Lazy:
        return "lazy";
    }
    return "unknown";
}

SnowflakeStrategy parse_strategy(std::string_view name)
{
    std::string key = infra::String::to_lower(infra::String::trim(std::string(name)));
    if (key == "real_time" || key == "realtime")
        return SnowflakeStrategy::RealTime;
    if (key == "generate")
        return SnowflakeStrategy::Generate;
    if (key == "lazy")
        return SnowflakeStrategy::Lazy;
    throw ConfigError("Snowflake: unknown generation strategy '" + std::string(name) + "'");
}

MachineNode MachineNode::create(int machine_id, int node_id)
{
    if (machine_id < 0 || machine_id > 31) {
        throw ConfigError("Snowflake: machine_id must be in [0, 31], got " + std::to_string(machine_id));
    }
    if (node_id < 0 || node_id > 31) {
        throw ConfigError("Snowflake: node_id must be in [0, 31], got " + std::to_string(node_id));
    }
    return MachineNode{machine_id, node_id};
}

std::string MachineNode::to_string() const
{
    return "(" + std::to_string(machine_id) + "::" + std::to_string(node_id) + ")";
}

SnowflakeGenerator::SnowflakeGenerator(MachineNode node, SnowflakeStrategy strategy,
                                       infra::ClockPolicy policy, infra::ClockFn clock)
    : node_(MachineNode::create(node.machine_id, node.node_id)), strategy_(strategy),
      policy_(policy), clock_(std::move(clock)), last_time_ms_(clock_())
{
}

int64_t SnowflakeGenerator::next_value()
{
    std::lock_guard<std::mutex> lock(mutex_);
    switch (strategy_) {
    case SnowflakeStrategy::RealTime:
        return real_time_next();
    case SnowflakeStrategy::Generate:
        return generate_next();
    case SnowflakeStrategy::Lazy:
        return lazy_next();
    }
    throw GenerationFailure(kName + ": unknown strategy");
}

/**
 * Reads the clock every call. A new millisecond restarts the sequence at 0; in
 * the same millisecond a wrapped sequence waits for the next one.
 */
int64_t SnowflakeGenerator::real_time_next()
{
    const int next_sequence = (sequence_ + 1) % kSequenceModulo;
    int64_t now = infra::settle_clock(clock_, clock_(), last_time_ms_, policy_, kName);

    if (now == last_time_ms_) {
        if (next_sequence == 0) {
            now = infra::wait_next_millis(clock_, last_time_ms_, policy_, kName);
            last_time_ms_ = now;
        }
        sequence_ = next_sequence;
    } else {
        last_time_ms_ = now;
        sequence_ = 0;
    }

    return compose(last_time_ms_, node_, sequence_);
}

/**
 * Consults the clock only when the sequence wraps, so bursts within one
 * millisecond cost no clock reads.
 */
int64_t SnowflakeGenerator::generate_next()
{
    const int next_sequence = (sequence_ + 1) % kSequenceModulo;
    if (next_sequence == 0) {
        int64_t now = infra::settle_clock(clock_, clock_(), last_time_ms_, policy_, kName);
        if (now == last_time_ms_) {
            now = infra::wait_next_millis(clock_, last_time_ms_, policy_, kName);
        }
        last_time_ms_ = now;
    }
    sequence_ = next_sequence;

    return compose(last_time_ms_, node_, sequence_);
}

int64_t SnowflakeGenerator::lazy_next()
{
    sequence_ = (sequence_ + 1) % kSequenceModulo;
    if (sequence_ == 0) {
        last_time_ms_ += 1;
    }
    return compose(last_time_ms_, node_, sequence_);
}

int64_t SnowflakeGenerator::compose(int64_t timestamp_ms, MachineNode node, int sequence) noexcept
{
    return (timestamp_ms << (kSequenceBits + kNodeBits + kMachineBits)) |
           (static_cast<int64_t>(node.machine_id) << (kSequenceBits + kNodeBits)) |
           (static_cast<int64_t>(node.node_id) << kSequenceBits) | static_cast<int64_t>(sequence);
}

SnowflakeParts SnowflakeGenerator::decompose(int64_t id) noexcept
{
    SnowflakeParts parts{};
    parts.timestamp_ms = id >> (kSequenceBits + kNodeBits + kMachineBits);
    parts.machine_id = static_cast<int>((id >> (kSequenceBits + kNodeBits)) & 0x1F);
    parts.node_id = static_cast<int>((id >> kSequenceBits) & 0x1F);
    parts.sequence = static_cast<int>(id & (kSequenceModulo - 1));
    return parts;
}

SnowflakeGenerator& SnowflakeGenerator::install(MachineNode node, SnowflakeStrategy strategy,
                                                const infra::ClockPolicy& policy)
{
    std::call_once(g_install_once, [&] {
        g_owner = std::make_unique<SnowflakeGenerator>(node, strategy, policy);
        g_instance.store(g_owner.get(), std::memory_order_release);
        infra::Logger::log(infra::LogLevel::INFO, kName + ": initialized " + node.to_string() +
                                                      " with " + strategy_name(strategy) +
                                                      " strategy");
    });

    SnowflakeGenerator& instance = *g_instance.load(std::memory_order_acquire);
    if (instance.machine_node() != node || instance.strategy() != strategy) {
        infra::Logger::log(infra::LogLevel::WARN,
                           kName + ": already initialized as " + instance.machine_node().to_string() +
                               " " + strategy_name(instance.strategy()) + ", ignoring " +
                               node.to_string() + " " + strategy_name(strategy));
    }
    return instance;
}

SnowflakeGenerator& SnowflakeGenerator::single_node(SnowflakeStrategy strategy)
{
    return install(MachineNode(), strategy, infra::ClockPolicy());
}

SnowflakeGenerator& SnowflakeGenerator::distributed(MachineNode node, SnowflakeStrategy strategy)
{
    return install(MachineNode::create(node.machine_id, node.node_id), strategy,
                   infra::ClockPolicy());
}

SnowflakeGenerator& SnowflakeGenerator::from_config(const infra::Config& config)
{
    MachineNode node = MachineNode::create(config.machine_id, config.node_id);
    return install(node, parse_strategy(config.snowflake_strategy), config.clock_policy);
}

SnowflakeGenerator& SnowflakeGenerator::summon()
{
    SnowflakeGenerator* instance = g_instance.load(std::memory_order_acquire);
    if (instance == nullptr) {
        throw GenerationFailure(
            kName + ": generator is not initialized; call single_node(), distributed() or from_config()");
    }
    return *instance;
}

bool SnowflakeGenerator::is_initialized() noexcept
{
    return g_instance.load(std::memory_order_acquire) != nullptr;
}

int64_t SnowflakeGenerator::generate()
{
    return summon().next_value();
}

} // namespace tagid::gen
