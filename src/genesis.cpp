// -----------------------------------------------------------------------------
// genesis.cpp - export / validate / import of the post module state.
// API: see include/relaypost/genesis.hpp
// -----------------------------------------------------------------------------
#include "relaypost/genesis.hpp"

#include <stdint.h>
#include <set>
#include <utility>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace relaypost {

namespace {

// Ids must be unique and below the store counter that will hand out the next one.
template <typename Record>
bool check_ids(const std::vector<Record>& records, uint64_t count, const char* what, std::string& err) {
  if (count == UINT64_MAX) {
    err = std::string(what) + " count is exhausted";
    return false;
  }
  std::set<uint64_t> seen;
  for (const auto& r : records) {
    if (!seen.insert(r.id).second) {
      err = std::string("duplicated id for ") + what + ": " + std::to_string(r.id);
      return false;
    }
    if (r.id >= count) {
      err = std::string(what) + " id " + std::to_string(r.id) + " should be lower than count " +
            std::to_string(count);
      return false;
    }
  }
  return true;
}

const json& require(const json& j, const char* key) {
  return j.at(key);   // throws json::out_of_range, caught by genesis_from_json()
}

// Counts and ids must be JSON unsigned integers; get<uint64_t>() would wrap a negative one.
bool read_u64(const json& j, const char* key, uint64_t& out, std::string& err) {
  const json& v = require(j, key);
  if (!v.is_number_unsigned()) {
    err = std::string("field \"") + key + "\" is not an unsigned integer";
    return false;
  }
  out = v.get<uint64_t>();
  return true;
}

} // namespace

GenesisState default_genesis() {
  GenesisState state;
  state.port_id = ModuleConfig{}.port_id;
  return state;
}

Status validate(const GenesisState& state) {
  if (!is_valid_port_id(state.port_id)) {
    return Status::failure(ErrorCode::GenesisInvalid, "invalid port ID (" + state.port_id + ")");
  }

  std::string err;
  if (!check_ids(state.posts, state.post_count, "post", err) ||
      !check_ids(state.sent_posts, state.sent_post_count, "sentPost", err) ||
      !check_ids(state.timed_out_posts, state.timed_out_post_count, "timedoutPost", err)) {
    return Status::failure(ErrorCode::GenesisInvalid, err);
  }
  return Status::success();
}

GenesisState export_genesis(const Stores& stores, const ModuleConfig& config) {
  GenesisState state;
  state.port_id              = config.port_id;
  state.posts                = stores.posts.all();
  state.post_count           = stores.posts.count();
  state.sent_posts           = stores.sent_posts.all();
  state.sent_post_count      = stores.sent_posts.count();
  state.timed_out_posts      = stores.timed_out_posts.all();
  state.timed_out_post_count = stores.timed_out_posts.count();
  return state;
}

Status init_genesis(Stores& stores, const GenesisState& state) {
  Status valid = validate(state);
  if (!valid.ok()) return valid;

  stores.posts.restore(state.posts, state.post_count);
  stores.sent_posts.restore(state.sent_posts, state.sent_post_count);
  stores.timed_out_posts.restore(state.timed_out_posts, state.timed_out_post_count);
  return Status::success();
}

std::string genesis_to_json(const GenesisState& state, int indent) {
  json posts = json::array();
  for (const auto& p : state.posts) {
    posts.push_back({{"id", p.id}, {"creator", p.creator}, {"title", p.title}, {"content", p.content}});
  }

  json sent = json::array();
  for (const auto& s : state.sent_posts) {
    sent.push_back({{"id", s.id}, {"creator", s.creator}, {"postID", s.post_id},
                    {"title", s.title}, {"chain", s.chain}});
  }

  json timed_out = json::array();
  for (const auto& t : state.timed_out_posts) {
    timed_out.push_back({{"id", t.id}, {"creator", t.creator}, {"title", t.title}, {"chain", t.chain}});
  }

  json j = json::object();
  j["portId"]            = state.port_id;
  j["postList"]          = std::move(posts);
  j["postCount"]         = state.post_count;
  j["sentPostList"]      = std::move(sent);
  j["sentPostCount"]     = state.sent_post_count;
  j["timedoutPostList"]  = std::move(timed_out);
  j["timedoutPostCount"] = state.timed_out_post_count;

  // Record text came through the codec as valid UTF-8; replace rather than throw if not.
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

Status genesis_from_json(const std::string& text, GenesisState& out) {
  try {
    const json j = json::parse(text);

    GenesisState state;
    state.port_id              = require(j, "portId").get<std::string>();
    std::string err;
    if (!read_u64(j, "postCount", state.post_count, err) ||
        !read_u64(j, "sentPostCount", state.sent_post_count, err) ||
        !read_u64(j, "timedoutPostCount", state.timed_out_post_count, err)) {
      return Status::failure(ErrorCode::GenesisInvalid, err);
    }

    for (const auto& p : require(j, "postList")) {
      PostRecord r;
      if (!read_u64(p, "id", r.id, err)) return Status::failure(ErrorCode::GenesisInvalid, err);
      r.creator = require(p, "creator").get<std::string>();
      r.title   = require(p, "title").get<std::string>();
      r.content = require(p, "content").get<std::string>();
      state.posts.push_back(std::move(r));
    }
    for (const auto& s : require(j, "sentPostList")) {
      SentPostRecord r;
      if (!read_u64(s, "id", r.id, err)) return Status::failure(ErrorCode::GenesisInvalid, err);
      r.creator = require(s, "creator").get<std::string>();
      r.post_id = require(s, "postID").get<std::string>();
      r.title   = require(s, "title").get<std::string>();
      r.chain   = require(s, "chain").get<std::string>();
      state.sent_posts.push_back(std::move(r));
    }
    for (const auto& t : require(j, "timedoutPostList")) {
      TimedOutPostRecord r;
      if (!read_u64(t, "id", r.id, err)) return Status::failure(ErrorCode::GenesisInvalid, err);
      r.creator = require(t, "creator").get<std::string>();
      r.title   = require(t, "title").get<std::string>();
      r.chain   = require(t, "chain").get<std::string>();
      state.timed_out_posts.push_back(std::move(r));
    }

    out = std::move(state);
    return Status::success();
  } catch (const json::exception& e) {
    return Status::failure(ErrorCode::GenesisInvalid, e.what());
  }
}

} // namespace relaypost
