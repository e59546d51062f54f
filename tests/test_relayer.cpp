#include <doctest/doctest.h>
#include "relaypost/relayer.hpp"

using namespace relaypost;

namespace {

// Two chains joined by blog/channel-0 <-> blog/channel-1, both clocks at 1 s.
struct Pair {
    Chain a{"source"};
    Chain b{"target"};
    LoopbackRelayer relayer{a, b};

    Pair() {
        a.open_channel(ChannelIdStr("channel-0"), transport::Counterparty{PortIdStr("blog"), ChannelIdStr("channel-1")});
        b.open_channel(ChannelIdStr("channel-1"), transport::Counterparty{PortIdStr("blog"), ChannelIdStr("channel-0")});
        a.advance(0, 1000000000ull);
        b.advance(0, 1000000000ull);
    }

    Status send(const char* creator, const char* title, uint64_t timeout = 0) {
        MsgSendPost m;
        m.creator           = creator;
        m.port              = "blog";
        m.channel_id        = "channel-0";
        m.title             = title;
        m.content           = "body";
        m.timeout_timestamp = timeout;
        return a.send_post(m);
    }
};

} // namespace

TEST_CASE("Delivered post lands on the target and is acknowledged on the source") {
    Pair p;
    REQUIRE(p.send("alice", "Hello").ok());

    RelayReport r = p.relayer.relay_once();
    CHECK(r.delivered == 1);
    CHECK(r.acknowledged == 1);
    CHECK(r.timed_out == 0);
    CHECK(r.failed == 0);

    REQUIRE(p.b.stores().posts.size() == 1);
    CHECK(p.b.stores().posts.all().front().creator == "blog-channel-0-alice");

    REQUIRE(p.a.stores().sent_posts.size() == 1);
    const SentPostRecord& sent = p.a.stores().sent_posts.all().front();
    CHECK(sent.post_id == "0");
    CHECK(sent.chain == "blog-channel-1");
    CHECK(sent.title == "Hello");

    const PacketKey key{PortIdStr("blog"), ChannelIdStr("channel-0"), 1};
    CHECK_FALSE(p.a.channels().has_commitment(key));
}

TEST_CASE("Expired packet times out instead of being delivered") {
    Pair p;
    REQUIRE(p.send("carol", "Late", 2000000000ull).ok());
    p.b.advance(5, 1000000000ull);    // target now at exactly the timeout

    RelayReport r = p.relayer.relay_once();
    CHECK(r.delivered == 0);
    CHECK(r.timed_out == 1);

    CHECK(p.b.stores().posts.size() == 0);
    CHECK(p.a.stores().sent_posts.size() == 0);
    REQUIRE(p.a.stores().timed_out_posts.size() == 1);
    CHECK(p.a.stores().timed_out_posts.all().front().chain == "blog-channel-1");
}

TEST_CASE("Rejected post comes back as an error acknowledgement") {
    Pair p;
    REQUIRE(p.send("alice", "").ok());

    RelayReport r = p.relayer.relay_once();
    CHECK(r.delivered == 1);
    CHECK(r.acknowledged == 1);
    CHECK(p.b.stores().posts.size() == 0);
    CHECK(p.a.stores().sent_posts.size() == 0);
    CHECK(p.a.stores().timed_out_posts.size() == 0);

    bool saw_error = false;
    Event ev;
    while (p.a.events().next(ev)) saw_error = saw_error || ev.is("post_ack_error");
    CHECK(saw_error);
}

TEST_CASE("Relaying again does not reconcile twice") {
    Pair p;
    REQUIRE(p.send("alice", "one").ok());
    REQUIRE(p.send("bob", "two").ok());

    RelayReport r = p.relayer.relay_once();
    CHECK(r.acknowledged == 2);

    r = p.relayer.relay_once();
    CHECK(r.delivered == 0);
    CHECK(r.acknowledged == 0);
    CHECK(p.a.stores().sent_posts.size() == 2);
    CHECK(p.b.stores().posts.size() == 2);
    CHECK(p.a.stores().sent_posts.find(1)->post_id == "1");
}

TEST_CASE("Traffic flows in both directions") {
    Pair p;
    REQUIRE(p.send("alice", "from a").ok());

    MsgSendPost m;
    m.creator    = "zed";
    m.port       = "blog";
    m.channel_id = "channel-1";
    m.title      = "from b";
    REQUIRE(p.b.send_post(m).ok());

    RelayReport r = p.relayer.relay_once();
    CHECK(r.acknowledged == 2);
    CHECK(p.a.stores().posts.all().front().creator == "blog-channel-1-zed");
    CHECK(p.b.stores().sent_posts.all().front().chain == "blog-channel-0");
}

TEST_CASE("Packet toward a channel the target never opened stays pending until it times out") {
    Chain a("source");
    Chain b("target");
    a.open_channel(ChannelIdStr("channel-0"), transport::Counterparty{PortIdStr("blog"), ChannelIdStr("channel-7")});
    LoopbackRelayer relayer(a, b);

    MsgSendPost m;
    m.creator    = "alice";
    m.port       = "blog";
    m.channel_id = "channel-0";
    m.title      = "lost";
    REQUIRE(a.send_post(m).ok());

    RelayReport r = relayer.relay_once();
    CHECK(r.failed == 1);
    CHECK(r.last_error.code == ErrorCode::ChannelNotFound);
    const PacketKey key{PortIdStr("blog"), ChannelIdStr("channel-0"), 1};
    CHECK(a.channels().has_commitment(key));
    CHECK(a.stores().sent_posts.size() == 0);
    CHECK(r.requeued == 1);
    CHECK(a.channels().pending() == 1);

    // still unroutable before the deadline: stays queued, nothing settles
    r = relayer.relay_once();
    CHECK(r.failed == 1);
    CHECK(a.stores().timed_out_posts.size() == 0);

    // once the target clock passes the default timeout it settles as a timeout
    b.advance(1, a.config().default_timeout_ns + 1);
    r = relayer.relay_once();
    CHECK(r.timed_out == 1);
    CHECK(r.failed == 0);
    CHECK(r.requeued == 0);
    REQUIRE(a.stores().timed_out_posts.size() == 1);
    CHECK(a.stores().timed_out_posts.all().front().chain == "blog-channel-7");
    CHECK_FALSE(a.channels().has_commitment(key));
    CHECK(a.channels().pending() == 0);
}
