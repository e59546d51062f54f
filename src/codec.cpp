/**
 * @file codec.cpp
 * @brief nlohmann::json implementation of the relaypost wire codec.
 *
 * @details
 *   Every parse goes through `parse_object()`, which only accepts a top-level
 *   JSON object. Field readers are strict about types (a number where a string
 *   is expected is an error) and reject keys they do not know, matching how the
 *   counterparty's protobuf-JSON decoder treats unknown fields.
 *
 *   nlohmann::json throws on malformed input and on invalid UTF-8 while
 *   dumping; both are caught here and converted into a Status so nothing
 *   escapes the codec boundary.
 */

#include "relaypost/codec.hpp"

#include <nlohmann/json.hpp>
#include <utility>

using nlohmann::json;

namespace relaypost {
namespace codec {

namespace {

constexpr const char* kPostEnvelopeKey = "ibcPostPacket";
constexpr const char* kNoDataKey       = "noData";
constexpr const char* kPostIdKey       = "postID";

const char kB64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Parse bytes into a JSON object; anything else is reported through `err`.
bool parse_object(const Bytes& bytes, json& out, std::string& err) {
  try {
    out = json::parse(bytes.begin(), bytes.end());
  } catch (const json::exception& e) {
    err = e.what();
    return false;
  }
  if (!out.is_object()) {
    err = "expected a JSON object";
    return false;
  }
  return true;
}

bool dump_to(const json& j, Bytes& out, std::string& err) {
  try {
    out = to_bytes(j.dump());
  } catch (const json::exception& e) {
    err = e.what();
    return false;
  }
  return true;
}

json post_to_json(const PostPayload& p) {
  json j = json::object();
  j["creator"] = p.creator;
  j["title"]   = p.title;
  j["content"] = p.content;
  return j;
}

// Strict field reader for a PostPayload object.
bool post_from_json(const json& j, PostPayload& out, std::string& err) {
  if (!j.is_object()) { err = "post payload is not an object"; return false; }
  PostPayload p;
  for (auto it = j.begin(); it != j.end(); ++it) {
    std::string* field = nullptr;
    if      (it.key() == "creator") field = &p.creator;
    else if (it.key() == "title")   field = &p.title;
    else if (it.key() == "content") field = &p.content;
    else { err = "unknown field \"" + it.key() + "\""; return false; }

    if (!it.value().is_string()) { err = "field \"" + it.key() + "\" is not a string"; return false; }
    *field = it.value().get<std::string>();
  }
  out = std::move(p);
  return true;
}

int b64_index(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

} // namespace

// ---------- bytes <-> text ----------

Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

std::string to_text(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

// ---------- PostPayload ----------

Status encode_post(const PostPayload& payload, Bytes& out) {
  std::string err;
  if (!dump_to(post_to_json(payload), out, err)) {
    return Status::failure(ErrorCode::EncodingError, "cannot marshal post: " + err);
  }
  return Status::success();
}

Status decode_post(const Bytes& bytes, PostPayload& out) {
  json j;
  std::string err;
  if (!parse_object(bytes, j, err) || !post_from_json(j, out, err)) {
    return Status::failure(ErrorCode::PacketDecodeError, err);
  }
  return Status::success();
}

// ---------- packet envelope ----------

Status encode_packet_data(const PostPayload& payload, Bytes& out) {
  json j = json::object();
  j[kPostEnvelopeKey] = post_to_json(payload);

  std::string err;
  if (!dump_to(j, out, err)) {
    return Status::failure(ErrorCode::EncodingError, "cannot marshal the packet: " + err);
  }
  return Status::success();
}

Status decode_packet_data(const Bytes& bytes, PacketKind& kind, PostPayload& out) {
  kind = PacketKind::NoData;

  json j;
  std::string err;
  if (!parse_object(bytes, j, err)) {
    return Status::failure(ErrorCode::PacketDecodeError, err);
  }

  // The envelope is a oneof: at most one known key, nothing else.
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.key() != kPostEnvelopeKey && it.key() != kNoDataKey) {
      return Status::failure(ErrorCode::PacketDecodeError, "unknown field \"" + it.key() + "\"");
    }
  }
  if (j.size() > 1) {
    return Status::failure(ErrorCode::PacketDecodeError, "packet envelope carries more than one variant");
  }

  auto post = j.find(kPostEnvelopeKey);
  if (post == j.end()) return Status::success();   // noData or empty envelope

  if (!post_from_json(*post, out, err)) {
    return Status::failure(ErrorCode::PacketDecodeError, err);
  }
  kind = PacketKind::Post;
  return Status::success();
}

// ---------- AckResult ----------

Status encode_ack_result(const AckResult& ack, Bytes& out) {
  json j = json::object();
  j[kPostIdKey] = ack.post_id;

  std::string err;
  if (!dump_to(j, out, err)) {
    return Status::failure(ErrorCode::EncodingError, "cannot marshal acknowledgment: " + err);
  }
  return Status::success();
}

Status decode_ack_result(const Bytes& bytes, AckResult& out) {
  json j;
  std::string err;
  if (!parse_object(bytes, j, err)) {
    return Status::failure(ErrorCode::AckDecodeError, err);
  }

  AckResult ack;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.key() != kPostIdKey) {
      return Status::failure(ErrorCode::AckDecodeError, "unknown field \"" + it.key() + "\"");
    }
    if (!it.value().is_string()) {
      return Status::failure(ErrorCode::AckDecodeError, "field \"postID\" is not a string");
    }
    ack.post_id = it.value().get<std::string>();
  }
  out = std::move(ack);
  return Status::success();
}

// ---------- Acknowledgement envelope ----------

Bytes encode_acknowledgement(const Acknowledgement& ack) {
  json j = json::object();
  switch (ack.kind) {
    case AckKind::Success: j["result"] = base64_encode(ack.result); break;
    case AckKind::Failure: j["error"]  = ack.error;                 break;
    case AckKind::Unknown:                                           break;
  }

  Bytes out;
  std::string err;
  if (!dump_to(j, out, err)) {
    // Only the error text can carry invalid UTF-8; fall back to a fixed message.
    json fallback = json::object();
    fallback["error"] = "acknowledgement error message is not valid UTF-8";
    out = to_bytes(fallback.dump());
  }
  return out;
}

Acknowledgement decode_acknowledgement(const Bytes& bytes) {
  Acknowledgement unknown;    // kind defaults to Unknown

  json j;
  std::string err;
  if (!parse_object(bytes, j, err) || j.size() != 1) return unknown;

  auto result = j.find("result");
  if (result != j.end()) {
    Bytes raw;
    if (!result->is_string() || !base64_decode(result->get<std::string>(), raw)) return unknown;
    return Acknowledgement::success(std::move(raw));
  }

  auto error = j.find("error");
  if (error != j.end() && error->is_string()) {
    return Acknowledgement::failure(error->get<std::string>());
  }
  return unknown;
}

// ---------- base64 ----------

std::string base64_encode(const Bytes& bytes) {
  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);

  size_t i = 0;
  while (i + 3 <= bytes.size()) {
    uint32_t v = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
    out.push_back(kB64Alphabet[(v >> 18) & 0x3F]);
    out.push_back(kB64Alphabet[(v >> 12) & 0x3F]);
    out.push_back(kB64Alphabet[(v >> 6) & 0x3F]);
    out.push_back(kB64Alphabet[v & 0x3F]);
    i += 3;
  }

  const size_t rest = bytes.size() - i;
  if (rest == 1) {
    uint32_t v = uint32_t(bytes[i]) << 16;
    out.push_back(kB64Alphabet[(v >> 18) & 0x3F]);
    out.push_back(kB64Alphabet[(v >> 12) & 0x3F]);
    out.append("==");
  } else if (rest == 2) {
    uint32_t v = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
    out.push_back(kB64Alphabet[(v >> 18) & 0x3F]);
    out.push_back(kB64Alphabet[(v >> 12) & 0x3F]);
    out.push_back(kB64Alphabet[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

bool base64_decode(const std::string& text, Bytes& out) {
  if (text.size() % 4 != 0) return false;

  Bytes decoded;
  decoded.reserve(text.size() / 4 * 3);

  for (size_t i = 0; i < text.size(); i += 4) {
    const bool last = (i + 4 == text.size());
    int v[4];
    int pad = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = text[i + k];
      if (c == '=') {
        // Padding only in the last quad, only in the final two slots.
        if (!last || k < 2) return false;
        v[k] = 0;
        ++pad;
        continue;
      }
      if (pad > 0) return false;     // data after padding
      v[k] = b64_index(c);
      if (v[k] < 0) return false;
    }

    const uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) |
                       (uint32_t(v[2]) << 6) | uint32_t(v[3]);
    decoded.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
    if (pad < 2) decoded.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
    if (pad < 1) decoded.push_back(static_cast<uint8_t>(n & 0xFF));
  }

  out = std::move(decoded);
  return true;
}

} // namespace codec
} // namespace relaypost
