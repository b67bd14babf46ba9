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
 * @file envelope_test.cpp
 * @brief Unit tests for correlation metadata and content envelopes.
 */

#include "framework.hpp"
#include "tagid/core/error.hpp"
#include "tagid/envelope/envelope.hpp"
#include "tagid/envelope/metadata.hpp"
#include "tagid/gen/cuid.hpp"
#include "tagid/gen/snowflake.hpp"
#include "tagid/infra/timestamp.hpp"

#include <cJSON.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

using tagid::envelope::CustomMap;
using tagid::envelope::Envelope;
using tagid::envelope::MetaData;
using tagid::infra::Timestamp;

namespace {

struct Order {
    using id_generator = tagid::gen::CuidGenerator;
    int amount = 0;
};

std::ostream& operator<<(std::ostream& os, const Order& order)
{
    return os << "Order(" << order.amount << ")";
}

Order operator+(const Order& a, const Order& b)
{
    return Order{a.amount + b.amount};
}

struct Invoice {
    std::string number;
};

using OrderMeta = MetaData<Order, std::string>;
using OrderEnvelope = Envelope<Order, std::string>;

const Timestamp kReceived = Timestamp::from_millis(1669779798068);

OrderMeta fixed_meta(const std::string& raw, Timestamp ts = kReceived, CustomMap custom = {})
{
    return OrderMeta(tagid::Id<Order>(raw), ts, std::move(custom));
}

cJSON* encode_order(const Order& order)
{
    return cJSON_CreateNumber(order.amount);
}

Order decode_order(const cJSON* node)
{
    if (!cJSON_IsNumber(node)) {
        throw tagid::FormatError("Order: expected a number");
    }
    return Order{node->valueint};
}

} // namespace

void test_metadata_create()
{
    Timestamp before = Timestamp::now();
    OrderMeta meta = OrderMeta::create();
    Timestamp after = Timestamp::now();

    ASSERT_TRUE(tagid::gen::is_cuid(meta.correlation_id().value()));
    ASSERT_TRUE(before <= meta.recv_timestamp());
    ASSERT_TRUE(meta.recv_timestamp() <= after);
    ASSERT_TRUE(meta.custom().empty());
    ASSERT_NE(meta, OrderMeta::create());
}

/**
 * @brief Equality follows the correlation id; ordering follows the timestamp.
 */
void test_metadata_equality_and_ordering()
{
    OrderMeta early = fixed_meta("c1", Timestamp::from_millis(1000));
    OrderMeta late = fixed_meta("c2", Timestamp::from_millis(2000));
    OrderMeta same_id = fixed_meta("c1", Timestamp::from_millis(5000), {{"k", "v"}});

    ASSERT_EQ(early, same_id);
    ASSERT_NE(early, late);
    ASSERT_TRUE(early < late);
    ASSERT_TRUE(late > early);
    ASSERT_TRUE(early <= late);

    ASSERT_EQ((early + late).correlation_id().value(), std::string("c2"));
    ASSERT_EQ((late + early).correlation_id().value(), std::string("c2"));

    OrderMeta tie = fixed_meta("c3", Timestamp::from_millis(1000));
    ASSERT_EQ((early + tie).correlation_id().value(), std::string("c1"));
    ASSERT_EQ((tie + early).correlation_id().value(), std::string("c3"));

    std::hash<OrderMeta> hasher;
    ASSERT_EQ(hasher(early), hasher(same_id));
}

void test_metadata_copies()
{
    OrderMeta meta = fixed_meta("c1");
    OrderMeta stamped = meta.with_recv_timestamp(Timestamp::from_millis(7));
    OrderMeta tagged = meta.with_custom("source", "api");

    ASSERT_EQ(stamped.recv_timestamp(), Timestamp::from_millis(7));
    ASSERT_EQ(meta.recv_timestamp(), kReceived);
    ASSERT_EQ(tagged.custom().at("source"), std::string("api"));
    ASSERT_TRUE(meta.custom().empty());

    MetaData<Invoice, std::string> relabeled = tagged.relabel<Invoice>();
    ASSERT_EQ(relabeled.correlation_id().to_string(), std::string("Invoice::c1"));
    ASSERT_EQ(relabeled.recv_timestamp(), kReceived);
    ASSERT_TRUE(relabeled.custom() == tagged.custom());
}

void test_metadata_display()
{
    ASSERT_EQ(fixed_meta("abc").to_string(), std::string("Order::abc @ 2022-11-30T03:43:18.068Z"));

    OrderMeta meta = fixed_meta("abc", kReceived, {{"b", "2"}, {"a", "1"}});
    std::ostringstream os;
    os << meta;
    ASSERT_EQ(os.str(), std::string("Order::abc @ 2022-11-30T03:43:18.068Z {a=1, b=2}"));
}

void test_metadata_map_form()
{
    OrderMeta meta = fixed_meta("c1", kReceived, {{"tenant", "acme"}});
    CustomMap map = meta.to_map();
    ASSERT_EQ(map.size(), static_cast<size_t>(3));
    ASSERT_EQ(map.at(tagid::envelope::kCorrelationIdKey), std::string("c1"));
    ASSERT_EQ(map.at(tagid::envelope::kRecvTimestampKey), std::string("2022-11-30T03:43:18.068Z"));

    OrderMeta back = tagid::envelope::from_map<tagid::gen::CuidGenerator, Order>(map);
    ASSERT_EQ(back, meta);
    ASSERT_EQ(back.recv_timestamp(), kReceived);
    ASSERT_TRUE(back.custom() == meta.custom());
}

/**
 * @brief Missing keys are filled in; present but malformed ones are rejected.
 */
void test_metadata_from_map_defaults()
{
    Timestamp before = Timestamp::now();
    auto meta = tagid::envelope::from_map<tagid::gen::CuidGenerator>({{"trace", "on"}});
    ASSERT_TRUE(tagid::gen::is_cuid(meta.correlation_id().value()));
    ASSERT_TRUE(before <= meta.recv_timestamp());
    ASSERT_EQ(meta.custom().at("trace"), std::string("on"));
    ASSERT_EQ(meta.correlation_id().to_string(), meta.correlation_id().value());

    ASSERT_THROWS(tagid::envelope::from_map<tagid::gen::CuidGenerator>(
                      {{tagid::envelope::kRecvTimestampKey, "yesterday"}}),
                  tagid::FormatError);
    ASSERT_THROWS(tagid::envelope::from_map<tagid::gen::SnowflakeGenerator>(
                      {{tagid::envelope::kCorrelationIdKey, "not-a-number"}}),
                  tagid::FormatError);
}

void test_metadata_json()
{
    OrderMeta meta = fixed_meta("abc", kReceived, {{"k", "v"}});
    std::string text = meta.to_json_string();
    ASSERT_EQ(text, std::string("{\"correlation_id\":\"abc\",\"recv_timestamp\":"
                                "\"2022-11-30T03:43:18.068Z\",\"custom\":{\"k\":\"v\"}}"));

    OrderMeta back = OrderMeta::from_json_string(text);
    ASSERT_EQ(back, meta);
    ASSERT_EQ(back.recv_timestamp(), kReceived);
    ASSERT_TRUE(back.custom() == meta.custom());

    OrderMeta bare = OrderMeta::from_json_string(
        R"({"correlation_id":"x","recv_timestamp":"2022-11-30T03:43:18.068Z"})");
    ASSERT_TRUE(bare.custom().empty());

    ASSERT_THROWS(OrderMeta::from_json_string("[]"), tagid::FormatError);
    ASSERT_THROWS(OrderMeta::from_json_string(R"({"recv_timestamp":"2022-11-30T03:43:18.068Z"})"),
                  tagid::FormatError);
    ASSERT_THROWS(OrderMeta::from_json_string(R"({"correlation_id":"x","recv_timestamp":5})"),
                  tagid::FormatError);
    ASSERT_THROWS(OrderMeta::from_json_string(
                      R"({"correlation_id":"x","recv_timestamp":"2022-11-30T03:43:18.068Z","custom":{"n":1}})"),
                  tagid::FormatError);
}

void test_metadata_json_far_timestamps()
{
    for (int64_t millis : {int64_t(253402300800000), int64_t(-62167219200001)}) {
        OrderMeta meta = fixed_meta("far", tagid::infra::Timestamp::from_millis(millis));
        OrderMeta back = OrderMeta::from_json_string(meta.to_json_string());
        ASSERT_EQ(back.recv_timestamp().millis(), millis);
        ASSERT_EQ(back, meta);
    }
}

void test_metadata_json_refuses_nul_bytes()
{
    const std::string with_nul("x\0y", 3);

    ASSERT_THROWS(fixed_meta("c1", kReceived, {{"k", with_nul}}).to_json_string(), tagid::FormatError);
    ASSERT_THROWS(fixed_meta("c1", kReceived, {{with_nul, "v"}}).to_json_string(), tagid::FormatError);
    ASSERT_THROWS(fixed_meta(with_nul).to_json_string(), tagid::FormatError);

    // The map form keeps every byte.
    ASSERT_EQ(fixed_meta("c1", kReceived, {{"k", with_nul}}).to_map().at("k"), with_nul);
}

void test_envelope_access()
{
    OrderEnvelope env = OrderEnvelope::from_entity(Order{10});
    ASSERT_TRUE(tagid::gen::is_cuid(env.metadata().correlation_id().value()));
    ASSERT_EQ(env.content().amount, 10);
    ASSERT_EQ(env->amount, 10);

    env->amount = 12;
    ASSERT_EQ(env.content().amount, 12);

    OrderMeta meta = env.metadata();
    auto [parts_meta, parts_content] = std::move(env).into_parts();
    ASSERT_EQ(parts_meta, meta);
    ASSERT_EQ(parts_content.amount, 12);

    ASSERT_EQ(OrderEnvelope::from_parts(fixed_meta("c1"), Order{3}).into_inner().amount, 3);
}

/**
 * @brief Content transformations keep the correlation id under the new content's label.
 */
void test_envelope_map_and_flat_map()
{
    OrderEnvelope env = OrderEnvelope::from_parts(fixed_meta("c1", kReceived, {{"k", "v"}}), Order{5});

    Envelope<Invoice, std::string> invoice =
        std::move(env).map([](Order o) { return Invoice{"INV-" + std::to_string(o.amount)}; });
    ASSERT_EQ(invoice.content().number, std::string("INV-5"));
    ASSERT_EQ(invoice.metadata().correlation_id().to_string(), std::string("Invoice::c1"));
    ASSERT_EQ(invoice.metadata().recv_timestamp(), kReceived);
    ASSERT_EQ(invoice.metadata().custom().at("k"), std::string("v"));

    Envelope<std::string, std::string> summary =
        std::move(invoice).flat_map([](Envelope<Invoice, std::string> e) {
            return e.metadata().correlation_id().value() + ":" + e.content().number;
        });
    ASSERT_EQ(summary.content(), std::string("c1:INV-5"));
    ASSERT_EQ(summary.metadata().correlation_id().to_string(), std::string("string::c1"));
}

void test_envelope_adopt_metadata()
{
    OrderEnvelope env = OrderEnvelope::from_parts(fixed_meta("old"), Order{1});
    MetaData<Invoice, std::string> foreign(tagid::Id<Invoice>("new"), Timestamp::from_millis(9));

    OrderMeta previous = env.adopt_metadata(foreign);
    ASSERT_EQ(previous.correlation_id().value(), std::string("old"));
    ASSERT_EQ(env.metadata().correlation_id().to_string(), std::string("Order::new"));
    ASSERT_EQ(env.metadata().recv_timestamp(), Timestamp::from_millis(9));
}

void test_envelope_combine()
{
    OrderEnvelope a = OrderEnvelope::from_parts(fixed_meta("a", Timestamp::from_millis(1)), Order{2});
    OrderEnvelope b = OrderEnvelope::from_parts(fixed_meta("b", Timestamp::from_millis(2)), Order{3});

    OrderEnvelope sum = a + b;
    ASSERT_EQ(sum.content().amount, 5);
    ASSERT_EQ(sum.metadata().correlation_id().value(), std::string("b"));
}

void test_envelope_transpose()
{
    using MaybeOrder = std::optional<Order>;
    MetaData<MaybeOrder, std::string> meta(tagid::Id<MaybeOrder>("c1"), kReceived);

    auto present = tagid::envelope::transpose(
        Envelope<MaybeOrder, std::string>(meta, MaybeOrder(Order{4})));
    ASSERT_TRUE(present.has_value());
    ASSERT_EQ(present->content().amount, 4);
    ASSERT_EQ(present->metadata().correlation_id().to_string(), std::string("Order::c1"));

    auto absent =
        tagid::envelope::transpose(Envelope<MaybeOrder, std::string>(meta, std::nullopt));
    ASSERT_FALSE(absent.has_value());
}

void test_envelope_display_and_label()
{
    OrderEnvelope env = OrderEnvelope::from_parts(fixed_meta("c1"), Order{8});
    std::ostringstream os;
    os << env;
    ASSERT_EQ(os.str(), std::string("[Order::c1 @ 2022-11-30T03:43:18.068Z](Order(8))"));

    ASSERT_EQ(tagid::Label<OrderEnvelope>::label(), std::string("Order"));
}

void test_envelope_create_with_generator()
{
    auto env = Envelope<std::string, std::string>::create<tagid::gen::CuidGenerator>("payload");
    ASSERT_EQ(env.content(), std::string("payload"));
    ASSERT_TRUE(tagid::gen::is_cuid(env.metadata().correlation_id().value()));
}

void test_envelope_json()
{
    OrderEnvelope env = OrderEnvelope::from_parts(fixed_meta("c1"), Order{42});
    std::string text = env.to_json_string(encode_order);
    ASSERT_EQ(text, std::string("{\"metadata\":{\"correlation_id\":\"c1\",\"recv_timestamp\":"
                                "\"2022-11-30T03:43:18.068Z\",\"custom\":{}},\"content\":42}"));

    OrderEnvelope back = OrderEnvelope::from_json_string(text, decode_order);
    ASSERT_EQ(back.metadata(), env.metadata());
    ASSERT_EQ(back.content().amount, 42);

    ASSERT_THROWS(OrderEnvelope::from_json_string(R"({"content":1})", decode_order),
                  tagid::FormatError);
    ASSERT_THROWS(OrderEnvelope::from_json_string(
                      R"({"metadata":{"correlation_id":"c1","recv_timestamp":"2022-11-30T03:43:18.068Z"},"content":"x"})",
                      decode_order),
                  tagid::FormatError);
}
