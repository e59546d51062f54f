#include <doctest/doctest.h>
#include "relaypost/codec.hpp"
#include "relaypost/keeper.hpp"
#include "relaypost/transport/memory_channel.hpp"

using namespace relaypost;

namespace {

struct Sender {
    transport::MemoryCapabilityKeeper caps;
    transport::MemoryChannelKeeper    channels{caps};
    Stores                            stores;
    EventLog                          events;
    Keeper                            keeper{channels, caps, stores, events};

    size_t count(const char* type) {
        size_t n = 0;
        Event ev;
        while (events.next(ev)) if (ev.is(type)) ++n;
        return n;
    }
};

Packet outbound(const char* dst_port, const char* dst_channel, uint64_t seq = 1) {
    Packet p;
    p.sequence            = seq;
    p.source_port         = "blog";
    p.source_channel      = "channel-0";
    p.destination_port    = dst_port;
    p.destination_channel = dst_channel;
    p.timeout_timestamp   = 500;
    return p;
}

Acknowledgement ack_with_id(const char* id) {
    Bytes raw;
    AckResult r;
    r.post_id = id;
    REQUIRE(codec::encode_ack_result(r, raw).ok());
    return Acknowledgement::success(raw);
}

} // namespace

TEST_CASE("Success ack appends one SentPostRecord") {
    Sender s;
    const PostPayload post{"bob", "Hi", "body"};

    REQUIRE(s.keeper.on_acknowledgement_post(outbound("post", "channel-1"), post, ack_with_id("7")).ok());

    REQUIRE(s.stores.sent_posts.size() == 1);
    const SentPostRecord& rec = s.stores.sent_posts.all().front();
    CHECK(rec.creator == "bob");
    CHECK(rec.post_id == "7");
    CHECK(rec.title == "Hi");
    CHECK(rec.chain == "post-channel-1");
    CHECK(s.stores.timed_out_posts.size() == 0);
    CHECK(s.count("post_sent") == 1);
}

TEST_CASE("Success ack with undecodable result is AckDecodeError and appends nothing") {
    Sender s;
    const PostPayload post{"bob", "Hi", ""};
    const Acknowledgement bad = Acknowledgement::success(codec::to_bytes("not json"));

    CHECK(s.keeper.on_acknowledgement_post(outbound("post", "channel-1"), post, bad).code ==
          ErrorCode::AckDecodeError);
    CHECK(s.stores.sent_posts.size() == 0);
    CHECK(s.stores.resolved.size() == 0);
}

TEST_CASE("Failure ack changes no store and surfaces the remote error") {
    Sender s;
    const PostPayload post{"bob", "Hi", ""};

    REQUIRE(s.keeper.on_acknowledgement_post(outbound("post", "channel-1"), post,
                                             Acknowledgement::failure("title cannot be empty")).ok());
    CHECK(s.stores.sent_posts.size() == 0);
    CHECK(s.stores.timed_out_posts.size() == 0);

    Event ev;
    REQUIRE(s.events.next(ev));
    CHECK(ev.is("post_ack_error"));
    REQUIRE(ev.attrs.get("error") != nullptr);
    CHECK(*ev.attrs.get("error") == AttrValStr("title cannot be empty"));
    CHECK(*ev.attrs.get("chain") == AttrValStr("post-channel-1"));
}

TEST_CASE("Unknown ack kind is UnsupportedAckFormat") {
    Sender s;
    const PostPayload post{"bob", "Hi", ""};
    CHECK(s.keeper.on_acknowledgement_post(outbound("post", "channel-1"), post, Acknowledgement{}).code ==
          ErrorCode::UnsupportedAckFormat);
    CHECK(s.stores.sent_posts.size() == 0);
}

TEST_CASE("Timeout appends one TimedOutPostRecord") {
    Sender s;
    const PostPayload post{"carol", "X", "ignored"};

    REQUIRE(s.keeper.on_timeout_post(outbound("post", "channel-2"), post).ok());

    REQUIRE(s.stores.timed_out_posts.size() == 1);
    const TimedOutPostRecord& rec = s.stores.timed_out_posts.all().front();
    CHECK(rec.creator == "carol");
    CHECK(rec.title == "X");
    CHECK(rec.chain == "post-channel-2");
    CHECK(s.count("post_timed_out") == 1);
}

TEST_CASE("Timeout with empty fields still succeeds") {
    Sender s;
    const PostPayload post{"", "", ""};
    CHECK(s.keeper.on_timeout_post(outbound("post", "channel-2"), post).ok());
    CHECK(s.stores.timed_out_posts.size() == 1);
}

TEST_CASE("A packet reaches at most one terminal record") {
    const PostPayload post{"bob", "Hi", ""};
    const Packet p = outbound("post", "channel-1", 3);

    SUBCASE("ack then timeout") {
        Sender s;
        REQUIRE(s.keeper.on_acknowledgement_post(p, post, ack_with_id("1")).ok());
        REQUIRE(s.keeper.on_timeout_post(p, post).ok());
        CHECK(s.stores.sent_posts.size() == 1);
        CHECK(s.stores.timed_out_posts.size() == 0);
        CHECK(s.count("packet_already_resolved") == 1);
    }

    SUBCASE("timeout then ack") {
        Sender s;
        REQUIRE(s.keeper.on_timeout_post(p, post).ok());
        REQUIRE(s.keeper.on_acknowledgement_post(p, post, ack_with_id("1")).ok());
        CHECK(s.stores.sent_posts.size() == 0);
        CHECK(s.stores.timed_out_posts.size() == 1);
    }

    SUBCASE("duplicate ack") {
        Sender s;
        REQUIRE(s.keeper.on_acknowledgement_post(p, post, ack_with_id("1")).ok());
        REQUIRE(s.keeper.on_acknowledgement_post(p, post, ack_with_id("2")).ok());
        REQUIRE(s.stores.sent_posts.size() == 1);
        CHECK(s.stores.sent_posts.all().front().post_id == "1");
    }

    SUBCASE("duplicate timeout") {
        Sender s;
        REQUIRE(s.keeper.on_timeout_post(p, post).ok());
        REQUIRE(s.keeper.on_timeout_post(p, post).ok());
        CHECK(s.stores.timed_out_posts.size() == 1);
    }

    SUBCASE("failure ack then timeout") {
        Sender s;
        REQUIRE(s.keeper.on_acknowledgement_post(p, post, Acknowledgement::failure("nope")).ok());
        REQUIRE(s.keeper.on_timeout_post(p, post).ok());
        CHECK(s.stores.timed_out_posts.size() == 0);
    }

    SUBCASE("a rejected ack does not block a later outcome") {
        Sender s;
        const Acknowledgement bad = Acknowledgement::success(codec::to_bytes("{}x"));
        CHECK(s.keeper.on_acknowledgement_post(p, post, bad).code == ErrorCode::AckDecodeError);
        REQUIRE(s.keeper.on_timeout_post(p, post).ok());
        CHECK(s.stores.timed_out_posts.size() == 1);
    }
}

TEST_CASE("Distinct sequences reconcile independently") {
    Sender s;
    const PostPayload post{"bob", "Hi", ""};
    REQUIRE(s.keeper.on_acknowledgement_post(outbound("post", "channel-1", 1), post, ack_with_id("0")).ok());
    REQUIRE(s.keeper.on_timeout_post(outbound("post", "channel-1", 2), post).ok());
    CHECK(s.stores.sent_posts.size() == 1);
    CHECK(s.stores.timed_out_posts.size() == 1);
    CHECK(s.stores.resolved.size() == 2);
}
