#include <doctest/doctest.h>
#include <stdint.h>
#include <string>
#include "relaypost/genesis.hpp"

using namespace relaypost;

namespace {

GenesisState sample() {
    GenesisState g = default_genesis();

    PostRecord p;
    p.id = 0; p.creator = "blog-channel-0-alice"; p.title = "T"; p.content = "C";
    g.posts.push_back(p);
    g.post_count = 1;

    SentPostRecord s;
    s.id = 2; s.creator = "bob"; s.post_id = "7"; s.title = "Hi"; s.chain = "blog-channel-1";
    g.sent_posts.push_back(s);
    g.sent_post_count = 3;

    TimedOutPostRecord t;
    t.id = 0; t.creator = "carol"; t.title = "X"; t.chain = "blog-channel-1";
    g.timed_out_posts.push_back(t);
    g.timed_out_post_count = 1;
    return g;
}

} // namespace

TEST_CASE("Default genesis is empty, bound to blog, and valid") {
    GenesisState g = default_genesis();
    CHECK(g.port_id == "blog");
    CHECK(g.posts.empty());
    CHECK(g.post_count == 0);
    CHECK(validate(g).ok());
}

TEST_CASE("Genesis validation") {
    CHECK(validate(sample()).ok());

    GenesisState g = sample();
    g.port_id = "";
    CHECK(validate(g).code == ErrorCode::GenesisInvalid);

    g = sample();
    g.posts.push_back(g.posts.front());
    g.post_count = 5;
    Status st = validate(g);
    CHECK(st.code == ErrorCode::GenesisInvalid);
    CHECK(st.detail == "duplicated id for post: 0");

    g = sample();
    g.sent_post_count = 2;      // id 2 is not below the count
    CHECK(validate(g).code == ErrorCode::GenesisInvalid);

    g = sample();
    g.timed_out_post_count = 0;
    CHECK(validate(g).code == ErrorCode::GenesisInvalid);

    // a counter at the top of the range has no id left to hand out
    g = sample();
    g.post_count = UINT64_MAX;
    st = validate(g);
    CHECK(st.code == ErrorCode::GenesisInvalid);
    CHECK(st.detail == "post count is exhausted");
}

TEST_CASE("JSON form uses the fixed field names") {
    const std::string text = genesis_to_json(sample());
    CHECK(text.find(R"("portId":"blog")") != std::string::npos);
    CHECK(text.find(R"("postCount":1)") != std::string::npos);
    CHECK(text.find(R"("postID":"7")") != std::string::npos);
    CHECK(text.find(R"("sentPostCount":3)") != std::string::npos);
    CHECK(text.find(R"("timedoutPostList":[)") != std::string::npos);
    CHECK(text.find(R"("timedoutPostCount":1)") != std::string::npos);

    GenesisState back;
    REQUIRE(genesis_from_json(text, back).ok());
    CHECK(back.port_id == "blog");
    REQUIRE(back.sent_posts.size() == 1);
    CHECK(back.sent_posts.front() == sample().sent_posts.front());
    CHECK(back.sent_post_count == 3);
}

TEST_CASE("Malformed genesis JSON is GenesisInvalid") {
    GenesisState out;
    CHECK(genesis_from_json("", out).code == ErrorCode::GenesisInvalid);
    CHECK(genesis_from_json("[]", out).code == ErrorCode::GenesisInvalid);
    CHECK(genesis_from_json(R"({"portId":"blog"})", out).code == ErrorCode::GenesisInvalid);

    std::string text = genesis_to_json(default_genesis());
    const std::string from = R"("postCount":0)";
    text.replace(text.find(from), from.size(), R"("postCount":"zero")");
    CHECK(genesis_from_json(text, out).code == ErrorCode::GenesisInvalid);
}

TEST_CASE("Negative counts and ids are rejected instead of wrapping") {
    GenesisState out;
    const std::string base = genesis_to_json(sample());

    std::string text = base;
    const std::string count = R"("postCount":1)";
    text.replace(text.find(count), count.size(), R"("postCount":-1)");
    Status st = genesis_from_json(text, out);
    CHECK(st.code == ErrorCode::GenesisInvalid);
    CHECK(st.detail == "field \"postCount\" is not an unsigned integer");

    text = base;
    const std::string id = R"("id":2)";
    text.replace(text.find(id), id.size(), R"("id":-2)");
    CHECK(genesis_from_json(text, out).code == ErrorCode::GenesisInvalid);

    text = base;
    const std::string timed = R"("timedoutPostCount":1)";
    text.replace(text.find(timed), timed.size(), R"("timedoutPostCount":1.5)");
    CHECK(genesis_from_json(text, out).code == ErrorCode::GenesisInvalid);
}

TEST_CASE("init_genesis restores stores and export reproduces them") {
    Stores stores;
    REQUIRE(init_genesis(stores, sample()).ok());

    CHECK(stores.posts.size() == 1);
    CHECK(stores.sent_posts.count() == 3);
    CHECK(stores.timed_out_posts.find(0)->creator == "carol");

    // next appends continue after the restored counters
    PostRecord r;
    r.creator = "x"; r.title = "y";
    CHECK(stores.posts.append(r) == 1);

    ModuleConfig cfg;
    GenesisState out = export_genesis(stores, cfg);
    CHECK(out.port_id == "blog");
    CHECK(out.post_count == 2);
    CHECK(out.posts.size() == 2);
    CHECK(out.sent_posts == sample().sent_posts);
    CHECK(validate(out).ok());
}

TEST_CASE("init_genesis leaves stores untouched on invalid input") {
    Stores stores;
    PostRecord r;
    r.creator = "keep"; r.title = "me";
    stores.posts.append(r);

    GenesisState bad = sample();
    bad.post_count = 0;
    CHECK(init_genesis(stores, bad).code == ErrorCode::GenesisInvalid);
    CHECK(stores.posts.size() == 1);
    CHECK(stores.posts.find(0)->creator == "keep");
}

TEST_CASE("State file failures carry their own reason") {
    Status st = Status::failure(ErrorCode::StateIoError, "cannot open chains.json");
    CHECK(st.message() == "cannot open chains.json: state file I/O failed");
    CHECK(std::string(to_string(ErrorCode::StateIoError)) != to_string(ErrorCode::TransportError));
}
