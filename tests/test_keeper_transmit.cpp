#include <doctest/doctest.h>
#include <optional>
#include <vector>
#include "relaypost/codec.hpp"
#include "relaypost/keeper.hpp"
#include "relaypost/transport/memory_channel.hpp"

using namespace relaypost;
using namespace relaypost::transport;

namespace {

// Scriptable channel keeper: every lookup and the send result are set by the test.
struct FakeChannels : IChannelKeeper {
    std::optional<Counterparty> counterparty;
    std::optional<uint64_t>     sequence;
    Status                      send_result;
    std::vector<Packet>         sent;

    std::optional<Counterparty> get_channel(const PortIdStr&, const ChannelIdStr&) const override {
        return counterparty;
    }
    std::optional<uint64_t> get_next_sequence_send(const PortIdStr&, const ChannelIdStr&) const override {
        return sequence;
    }
    Status send_packet(const Capability&, const Packet& packet) override {
        if (send_result.ok()) sent.push_back(packet);
        return send_result;
    }
};

struct Fixture {
    FakeChannels           channels;
    MemoryCapabilityKeeper caps;
    Stores                 stores;
    EventLog               events;
    Keeper                 keeper{channels, caps, stores, events};

    Fixture() {
        channels.counterparty = Counterparty{PortIdStr("post"), ChannelIdStr("channel-7")};
        channels.sequence     = 5;
        caps.claim(channel_capability_path(PortIdStr("blog"), ChannelIdStr("channel-0")));
    }

    Status send(const PostPayload& p, Height h = Height{}, uint64_t ts = 1000) {
        return keeper.transmit_post(p, PortIdStr("blog"), ChannelIdStr("channel-0"), h, ts);
    }

    bool stores_untouched() const {
        return stores.posts.size() == 0 && stores.sent_posts.size() == 0 &&
               stores.timed_out_posts.size() == 0 && stores.resolved.size() == 0;
    }
};

} // namespace

TEST_CASE("transmit_post builds the packet from caller inputs and the channel end") {
    Fixture f;
    Height h; h.revision_number = 1; h.revision_height = 20;

    const PostPayload post{"alice", "T", "C"};
    REQUIRE(f.send(post, h, 123456).ok());
    REQUIRE(f.channels.sent.size() == 1);

    const Packet& p = f.channels.sent[0];
    CHECK(p.sequence == 5);
    CHECK(p.source_port == PortIdStr("blog"));
    CHECK(p.source_channel == ChannelIdStr("channel-0"));
    CHECK(p.destination_port == PortIdStr("post"));
    CHECK(p.destination_channel == ChannelIdStr("channel-7"));
    CHECK(p.timeout_height == h);
    CHECK(p.timeout_timestamp == 123456);

    codec::PacketKind kind = codec::PacketKind::NoData;
    PostPayload decoded;
    REQUIRE(codec::decode_packet_data(p.data, kind, decoded).ok());
    CHECK(kind == codec::PacketKind::Post);
    CHECK(decoded == post);

    CHECK(f.stores_untouched());
}

TEST_CASE("transmit_post: unknown channel is ChannelNotFound") {
    Fixture f;
    f.channels.counterparty.reset();
    const PostPayload post{"alice", "T", ""};
    Status st = f.send(post);
    CHECK(st.code == ErrorCode::ChannelNotFound);
    CHECK(st.detail == "port ID (blog) channel ID (channel-0)");
    CHECK(f.channels.sent.empty());
}

TEST_CASE("transmit_post: missing send sequence is SequenceNotFound") {
    Fixture f;
    f.channels.sequence.reset();
    const PostPayload post{"alice", "T", ""};
    CHECK(f.send(post).code == ErrorCode::SequenceNotFound);
    CHECK(f.channels.sent.empty());
}

TEST_CASE("transmit_post: channel checked before sequence") {
    Fixture f;
    f.channels.counterparty.reset();
    f.channels.sequence.reset();
    const PostPayload post{"alice", "T", ""};
    CHECK(f.send(post).code == ErrorCode::ChannelNotFound);
}

TEST_CASE("transmit_post: capability not held is CapabilityMissing") {
    Fixture f;
    CHECK(f.caps.release(channel_capability_path(PortIdStr("blog"), ChannelIdStr("channel-0"))));
    const PostPayload post{"alice", "T", ""};
    CHECK(f.send(post).code == ErrorCode::CapabilityMissing);
    CHECK(f.channels.sent.empty());
}

TEST_CASE("transmit_post: unencodable payload is EncodingError") {
    Fixture f;
    const PostPayload post{"alice", std::string("\xfe"), ""};
    CHECK(f.send(post).code == ErrorCode::EncodingError);
    CHECK(f.channels.sent.empty());
}

TEST_CASE("transmit_post: transport refusal is passed through unchanged") {
    Fixture f;
    f.channels.send_result = Status::failure(ErrorCode::TransportError, "send queue full");
    const PostPayload post{"alice", "T", ""};
    Status st = f.send(post);
    CHECK(st.code == ErrorCode::TransportError);
    CHECK(st.detail == "send queue full");
    CHECK(f.stores_untouched());
}

TEST_CASE("MemoryChannelKeeper advances the send sequence and commits") {
    MemoryCapabilityKeeper caps;
    MemoryChannelKeeper    channels(caps);
    Stores                 stores;
    EventLog               events;
    Keeper                 keeper(channels, caps, stores, events);

    const PortIdStr    port("blog");
    const ChannelIdStr chan("channel-0");
    channels.open_channel(port, chan, Counterparty{PortIdStr("blog"), ChannelIdStr("channel-1")});
    caps.claim(channel_capability_path(port, chan));

    CHECK(channels.get_next_sequence_send(port, chan) == std::optional<uint64_t>(1));
    const PostPayload one{"a", "one", ""};
    const PostPayload two{"a", "two", ""};
    REQUIRE(keeper.transmit_post(one, port, chan, Height{}, 50).ok());
    REQUIRE(keeper.transmit_post(two, port, chan, Height{}, 50).ok());
    CHECK(channels.get_next_sequence_send(port, chan) == std::optional<uint64_t>(3));
    CHECK(channels.pending() == 2);

    const PacketKey first{port, chan, 1};
    const PacketKey second{port, chan, 2};
    CHECK(channels.has_commitment(first));
    CHECK(channels.has_commitment(second));

    Packet out;
    REQUIRE(channels.next_outbound(out));
    CHECK(out.sequence == 1);

    // no timeout at all is refused by the transport, sequence untouched
    const PostPayload three{"a", "three", ""};
    Status st = keeper.transmit_post(three, port, chan, Height{}, 0);
    CHECK(st.code == ErrorCode::TransportError);
    CHECK(channels.get_next_sequence_send(port, chan) == std::optional<uint64_t>(3));
}

TEST_CASE("MemoryChannelKeeper rejects a foreign capability and stale sequences") {
    MemoryCapabilityKeeper caps;
    MemoryChannelKeeper    channels(caps);
    const PortIdStr    port("blog");
    const ChannelIdStr chan("channel-0");
    channels.open_channel(port, chan, Counterparty{port, ChannelIdStr("channel-1")});
    Capability mine  = caps.claim(channel_capability_path(port, chan));
    Capability other = caps.claim("capabilities/ports/blog/channels/channel-5");

    Packet p;
    p.sequence          = 1;
    p.source_port       = port;
    p.source_channel    = chan;
    p.timeout_timestamp = 10;

    CHECK(channels.send_packet(other, p).code == ErrorCode::CapabilityMissing);

    p.sequence = 2;
    CHECK(channels.send_packet(mine, p).code == ErrorCode::TransportError);

    p.sequence = 1;
    CHECK(channels.send_packet(mine, p).ok());
}

TEST_CASE("MemoryChannelKeeper applies backpressure when the outbound queue is full") {
    MemoryCapabilityKeeper caps;
    MemoryChannelKeeper    channels(caps);
    const PortIdStr    port("blog");
    const ChannelIdStr chan("channel-0");
    channels.open_channel(port, chan, Counterparty{port, ChannelIdStr("channel-1")});
    Capability cap = caps.claim(channel_capability_path(port, chan));

    Packet p;
    p.source_port       = port;
    p.source_channel    = chan;
    p.timeout_timestamp = 10;
    for (uint64_t s = 1; s <= MemoryChannelKeeper::OUTBOUND_CAP; ++s) {
        p.sequence = s;
        REQUIRE(channels.send_packet(cap, p).ok());
    }
    p.sequence = MemoryChannelKeeper::OUTBOUND_CAP + 1;
    Status st = channels.send_packet(cap, p);
    CHECK(st.code == ErrorCode::TransportError);
    CHECK(st.detail == "send queue full");
    CHECK_FALSE(channels.has_commitment(key_of(p)));
}
