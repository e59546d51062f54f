/**
 * @file main.cpp
 * @brief relaypost CLI - one-shot runner around two in-process chains.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11).
 *  - Stand up chain A ("source") and chain B ("target") joined by
 *    channel-0 <-> channel-1 on the module port.
 *  - Restore both chains from <state-dir>/chains.json (XDG config by default).
 *  - Send one post A → B, relay once, print drained events and records.
 *  - Persist state atomically (tmp + rename).
 *
 * Exit codes: 0 ok, 2 usage, 3 send failed, 4 state I/O.
 *
 * State file: {"source":{"genesis":{...},"nextSequenceSend":N},"target":{...}}
 */

#include <cstdint>
#include <cstdlib>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "relaypost/chain.hpp"
#include "relaypost/genesis.hpp"
#include "relaypost/relayer.hpp"
#include "relaypost/status.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace relaypost;

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_SEND  = 3;
constexpr int EXIT_STATE = 4;

const char* const SOURCE_CHANNEL = "channel-0";
const char* const TARGET_CHANNEL = "channel-1";

// ---------- small utilities ----------

fs::path default_state_dir() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                : (home && *home) ? fs::path(home) / ".config"
                : fs::current_path();
  return base / "relaypost";
}

uint64_t now_ns_system() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

int fail(int code, const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

Status read_text_file(const fs::path& p, std::string& out) {
  std::ifstream in(p);
  if (!in) return Status::failure(ErrorCode::StateIoError, "cannot open " + p.string());
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return Status::success();
}

Status atomic_write_json(const fs::path& p, const json& j) {
  try {
    fs::create_directories(p.parent_path());
    auto tmp = p; tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out) return Status::failure(ErrorCode::StateIoError, "cannot write " + tmp.string());
      out << j.dump(2);
      out.flush();
      if (!out) return Status::failure(ErrorCode::StateIoError, "short write " + tmp.string());
    }
    fs::rename(tmp, p);
    return Status::success();
  } catch (const fs::filesystem_error& e) {
    return Status::failure(ErrorCode::StateIoError, e.what());
  } catch (const json::exception& e) {
    return Status::failure(ErrorCode::EncodingError, e.what());
  }
}

// ---------- chain state ----------

json chain_to_json(Chain& chain, const ChannelIdStr& channel) {
  json j;
  j["genesis"] = json::parse(genesis_to_json(export_genesis(chain.stores(), chain.config())));
  const auto seq = chain.channels().get_next_sequence_send(chain.port(), channel);
  j["nextSequenceSend"] = seq ? *seq : 1;
  return j;
}

Status chain_from_json(const json& j, Chain& chain, const ChannelIdStr& channel) {
  if (!j.is_object() || !j.contains("genesis")) {
    return Status::failure(ErrorCode::GenesisInvalid, chain.id() + ": missing genesis");
  }

  GenesisState state;
  Status st = genesis_from_json(j["genesis"].dump(), state);
  if (!st.ok()) return st;
  if (state.port_id != chain.config().port_id) {
    return Status::failure(ErrorCode::GenesisInvalid,
                           chain.id() + ": port " + state.port_id + " != " + chain.config().port_id);
  }
  st = init_genesis(chain.stores(), state);
  if (!st.ok()) return st;

  if (j.contains("nextSequenceSend")) {
    const json& seq = j["nextSequenceSend"];
    if (!seq.is_number_unsigned() || seq.get<uint64_t>() == 0) {
      return Status::failure(ErrorCode::GenesisInvalid, chain.id() + ": bad nextSequenceSend");
    }
    chain.channels().set_next_sequence_send(chain.port(), channel, seq.get<uint64_t>());
  }
  return Status::success();
}

Status load_state(const fs::path& file, Chain& a, Chain& b) {
  if (!fs::exists(file)) return Status::success();

  std::string text;
  Status st = read_text_file(file, text);
  if (!st.ok()) return st;

  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return Status::failure(ErrorCode::GenesisInvalid, "malformed " + file.string());
  }
  if (j.contains(a.id())) {
    st = chain_from_json(j[a.id()], a, ChannelIdStr(SOURCE_CHANNEL));
    if (!st.ok()) return st;
  }
  if (j.contains(b.id())) {
    st = chain_from_json(j[b.id()], b, ChannelIdStr(TARGET_CHANNEL));
    if (!st.ok()) return st;
  }
  return Status::success();
}

// ---------- output ----------

json event_to_json(const std::string& chain, const Event& ev) {
  json j;
  j["chain"] = chain;
  j["type"]  = ev.type.c_str();
  json attrs = json::object();
  for (size_t i = 0; i < ev.attrs.size(); ++i) {
    attrs[ev.attrs[i].k.c_str()] = ev.attrs[i].v.c_str();
  }
  j["attrs"] = attrs;
  return j;
}

void print_event_pretty(const std::string& chain, const Event& ev) {
  std::cout << "event=" << ev.type.c_str() << " chain=" << chain;
  for (size_t i = 0; i < ev.attrs.size(); ++i) {
    std::cout << " " << ev.attrs[i].k.c_str() << "=" << ev.attrs[i].v.c_str();
  }
  std::cout << "\n";
}

void print_records_pretty(const Chain& chain) {
  const Stores& s = chain.stores();
  for (const auto& r : s.posts.all()) {
    std::cout << "record=post chain=" << chain.id() << " id=" << r.id << " creator=" << r.creator
              << " title=" << r.title << " content=" << r.content << "\n";
  }
  for (const auto& r : s.sent_posts.all()) {
    std::cout << "record=sent chain=" << chain.id() << " id=" << r.id << " creator=" << r.creator
              << " postID=" << r.post_id << " title=" << r.title << " dest=" << r.chain << "\n";
  }
  for (const auto& r : s.timed_out_posts.all()) {
    std::cout << "record=timedout chain=" << chain.id() << " id=" << r.id << " creator=" << r.creator
              << " title=" << r.title << " dest=" << r.chain << "\n";
  }
}

json records_to_json(const Chain& chain) {
  return json::parse(genesis_to_json(export_genesis(chain.stores(), chain.config())));
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_creator;
  std::string opt_title;
  std::string opt_content;
  uint64_t    opt_timeout_ns = 0;
  bool        opt_expire  = false;
  bool        opt_reject  = false;
  bool        opt_list    = false;
  bool        opt_no_save = false;
  std::string opt_format  = "pretty";   // pretty|json
  std::string opt_state_dir;
  std::string opt_port    = ModuleConfig{}.port_id;

  CLI::App app{"relaypost CLI - send a post across a loopback channel"};
  app.add_option("--creator", opt_creator, "Post creator on the source chain");
  app.add_option("--title", opt_title, "Post title");
  app.add_option("--content", opt_content, "Post body");
  app.add_option("--timeout-ns", opt_timeout_ns, "Absolute timeout timestamp in ns (0 = default relative)");
  app.add_option("--port", opt_port, "Module port bound on both chains")->capture_default_str();
  app.add_flag("--expire", opt_expire, "Advance the target clock past the timeout before relaying");
  app.add_flag("--reject", opt_reject, "Send an empty title so the target rejects the post");
  app.add_flag("--list", opt_list, "Print stored records and exit");
  app.add_flag("--no-save", opt_no_save, "Do not persist state");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_option("--state-dir", opt_state_dir, "Override state directory");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (!is_valid_port_id(opt_port)) return fail(EXIT_USAGE, "invalid port " + opt_port);
  if (!opt_list) {
    if (opt_creator.empty()) return fail(EXIT_USAGE, "--creator is required");
    if (opt_reject) opt_title.clear();
    else if (opt_title.empty()) return fail(EXIT_USAGE, "--title is required");
  }

  ModuleConfig cfg;
  cfg.port_id = opt_port;

  Chain a("source", cfg);
  Chain b("target", cfg);
  a.open_channel(ChannelIdStr(SOURCE_CHANNEL), {a.port(), ChannelIdStr(TARGET_CHANNEL)});
  b.open_channel(ChannelIdStr(TARGET_CHANNEL), {b.port(), ChannelIdStr(SOURCE_CHANNEL)});

  const uint64_t now = now_ns_system();
  a.advance(0, now);
  b.advance(0, now);

  fs::path state_dir  = opt_state_dir.empty() ? default_state_dir() : fs::path(opt_state_dir);
  fs::path state_file = state_dir / "chains.json";
  {
    Status st = load_state(state_file, a, b);
    if (!st.ok()) return fail(EXIT_STATE, st.message());
  }

  if (opt_list) {
    if (opt_format == "json") {
      json j;
      j[a.id()] = records_to_json(a);
      j[b.id()] = records_to_json(b);
      std::cout << j.dump(2) << "\n";
    } else {
      print_records_pretty(a);
      print_records_pretty(b);
    }
    return 0;
  }

  MsgSendPost msg;
  msg.creator           = opt_creator;
  msg.port              = cfg.port_id;
  msg.channel_id        = SOURCE_CHANNEL;
  msg.timeout_timestamp = opt_timeout_ns;
  msg.title             = opt_title;
  msg.content           = opt_content;

  Status sent = a.send_post(msg);
  if (!sent.ok()) return fail(EXIT_SEND, sent.message());

  if (opt_expire) {
    const uint64_t deadline = opt_timeout_ns != 0 ? opt_timeout_ns : a.time_ns() + cfg.default_timeout_ns;
    if (b.time_ns() < deadline) b.advance(1, deadline - b.time_ns());
  }

  LoopbackRelayer relayer(a, b);
  const RelayReport report = relayer.relay_once();

  if (opt_format == "json") {
    json out;
    out["relay"] = {{"delivered", report.delivered}, {"acknowledged", report.acknowledged},
                    {"timedOut", report.timed_out}, {"failed", report.failed},
                    {"requeued", report.requeued}};
    if (!report.last_error.ok()) out["relay"]["error"] = report.last_error.message();
    json events = json::array();
    Event ev;
    while (a.events().next(ev)) events.push_back(event_to_json(a.id(), ev));
    while (b.events().next(ev)) events.push_back(event_to_json(b.id(), ev));
    out["events"] = events;
    out["records"] = {{a.id(), records_to_json(a)}, {b.id(), records_to_json(b)}};
    std::cout << out.dump(2) << "\n";
  } else {
    std::cout << "relay delivered=" << report.delivered << " acknowledged=" << report.acknowledged
              << " timed_out=" << report.timed_out << " failed=" << report.failed
              << " requeued=" << report.requeued << "\n";
    if (!report.last_error.ok()) std::cerr << "status=warn reason=" << report.last_error.message() << "\n";
    Event ev;
    while (a.events().next(ev)) print_event_pretty(a.id(), ev);
    while (b.events().next(ev)) print_event_pretty(b.id(), ev);
    print_records_pretty(a);
    print_records_pretty(b);
  }

  if (!opt_no_save) {
    json st;
    st[a.id()] = chain_to_json(a, ChannelIdStr(SOURCE_CHANNEL));
    st[b.id()] = chain_to_json(b, ChannelIdStr(TARGET_CHANNEL));
    Status saved = atomic_write_json(state_file, st);
    if (!saved.ok()) return fail(EXIT_STATE, saved.message());
  }

  return 0;
}
