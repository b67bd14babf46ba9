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
 * @file main.cpp
 * @brief `tagid-mint`: prints freshly generated identifiers.
 *
 * @details
 * Startup sequence:
 * 1. Argument Parsing.
 * 2. Configuration from `TAGID_*` environment variables (log level, Snowflake node).
 * 3. Generation, optionally spread over a worker pool.
 * 4. Output, one identifier per line or a single JSON array.
 *
 * Diagnostics of every level go to stderr so stdout carries only identifiers.
 */

#include "tagid/core/codec.hpp"
#include "tagid/core/error.hpp"
#include "tagid/core/id.hpp"
#include "tagid/gen/cuid.hpp"
#include "tagid/gen/pretty.hpp"
#include "tagid/gen/snowflake.hpp"
#include "tagid/gen/ulid.hpp"
#include "tagid/gen/uuid.hpp"
#include "tagid/infra/config.hpp"
#include "tagid/infra/logger.hpp"
#include "tagid/infra/scheduler.hpp"
#include "tagid/infra/string.hpp"

#include <cJSON.h>

#include <algorithm>
#include <future>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using tagid::infra::Logger;
using tagid::infra::LogLevel;

namespace {

struct CuidToken {
    static constexpr const char* id_label = "Cuid";
    using id_generator = tagid::gen::CuidGenerator;
};

struct UuidToken {
    static constexpr const char* id_label = "Uuid";
    using id_generator = tagid::gen::UuidGenerator;
};

struct SnowflakeToken {
    static constexpr const char* id_label = "Snowflake";
    using id_generator = tagid::gen::SnowflakeGenerator;
};

struct PrettyToken {
    static constexpr const char* id_label = "Pretty";
    using id_generator = tagid::gen::PrettySnowflakeGenerator;
};

struct UlidToken {
    static constexpr const char* id_label = "Ulid";
    using id_generator = tagid::gen::UlidGenerator;
};

/// @brief Parsed command line.
struct Options {
    std::string generator = "cuid";
    size_t count = 1;
    bool json = false;
    bool raw = false;
    size_t threads = 1;
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [GENERATOR] [COUNT] [--json] [--raw] [--threads N]\n"
              << "Options:\n"
              << "  GENERATOR    cuid | uuid | snowflake | pretty | ulid (Default: cuid)\n"
              << "  COUNT        Number of identifiers to print (Default: 1)\n"
              << "  --json       Print a JSON array of raw values\n"
              << "  --raw        Omit the label prefix\n"
              << "  --threads N  Generate on N worker threads (Default: 1)\n"
              << "  --help       Show this help message\n"
              << "Environment:\n"
              << "  TAGID_LOG_LEVEL, TAGID_MACHINE_ID, TAGID_NODE_ID,\n"
              << "  TAGID_SNOWFLAKE_STRATEGY, TAGID_CLOCK_POLICY, TAGID_CLOCK_MAX_WAIT_MS\n";
}

size_t parse_count(const std::string& text, const char* what)
{
    auto value = tagid::infra::String::parse_uint64(text);
    if (!value) {
        throw std::invalid_argument(std::string(what) + " must be a non-negative integer, got '" +
                                    text + "'");
    }
    return static_cast<size_t>(*value);
}

Options parse_args(const std::vector<std::string>& args)
{
    Options options;
    size_t positional = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--json") {
            options.json = true;
        } else if (arg == "--raw") {
            options.raw = true;
        } else if (arg == "--threads") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("--threads requires a value");
            }
            options.threads = std::max<size_t>(1, parse_count(args[++i], "--threads"));
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option '" + arg + "'");
        } else if (positional == 0) {
            options.generator = tagid::infra::String::to_lower(arg);
            ++positional;
        } else if (positional == 1) {
            options.count = parse_count(arg, "COUNT");
            ++positional;
        } else {
            throw std::invalid_argument("unexpected argument '" + arg + "'");
        }
    }
    return options;
}

/**
 * @brief Generates `options.count` ids for entity @p E, split into one batch per worker.
 */
template <typename E>
std::vector<tagid::IdOf<E>> mint(const Options& options)
{
    using IdType = tagid::IdOf<E>;

    std::vector<IdType> ids;
    ids.reserve(options.count);

    if (options.threads <= 1 || options.count < 2) {
        for (size_t i = 0; i < options.count; ++i) {
            ids.push_back(tagid::next_id<E>());
        }
        return ids;
    }

    tagid::infra::Scheduler pool(options.threads);
    const size_t batch = (options.count + pool.size() - 1) / pool.size();

    std::vector<std::future<std::vector<IdType>>> pending;
    for (size_t start = 0; start < options.count; start += batch) {
        const size_t n = std::min(batch, options.count - start);
        pending.push_back(pool.submit([n] {
            std::vector<IdType> out;
            out.reserve(n);
            for (size_t i = 0; i < n; ++i) {
                out.push_back(tagid::next_id<E>());
            }
            return out;
        }));
    }

    for (auto& f : pending) {
        auto part = f.get();
        std::move(part.begin(), part.end(), std::back_inserter(ids));
    }
    return ids;
}

template <typename E>
void emit(const Options& options)
{
    auto ids = mint<E>(options);
    Logger::log(LogLevel::INFO, "Mint: generated " + std::to_string(ids.size()) + " " +
                                    options.generator + " identifiers");

    if (options.json) {
        tagid::JsonPtr array(cJSON_CreateArray());
        for (const auto& id : ids) {
            cJSON_AddItemToArray(array.get(), tagid::to_json(id));
        }
        std::cout << tagid::print_json(array.get()) << "\n";
        return;
    }

    for (const auto& id : ids) {
        std::cout << (options.raw ? id.raw_string() : id.to_string()) << "\n";
    }
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    Logger::set_route(tagid::infra::LogRoute::StderrOnly);

    std::vector<std::string> args(argv + 1, argv + argc);
    if (std::find(args.begin(), args.end(), "--help") != args.end()) {
        print_help(argv[0]);
        return 0;
    }

    try {
        Options options = parse_args(args);

        tagid::infra::Config config = tagid::infra::Config::from_env();
        config.apply();

        if (options.generator == "cuid") {
            emit<CuidToken>(options);
        } else if (options.generator == "uuid") {
            emit<UuidToken>(options);
        } else if (options.generator == "snowflake") {
            tagid::gen::SnowflakeGenerator::from_config(config);
            emit<SnowflakeToken>(options);
        } else if (options.generator == "pretty") {
            tagid::gen::SnowflakeGenerator::from_config(config);
            emit<PrettyToken>(options);
        } else if (options.generator == "ulid") {
            emit<UlidToken>(options);
        } else {
            throw std::invalid_argument("unknown generator '" + options.generator +
                                        "' (expected cuid, uuid, snowflake, pretty or ulid)");
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "Mint: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
