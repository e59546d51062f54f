/**
 * @file codec.hpp
 * @brief JSON wire codec for relaypost packet data and acknowledgements.
 *
 * @details
 *   The codec centralizes every conversion between bytes on the wire and the
 *   value types in types.hpp. Both chains must produce and accept the same
 *   bytes, so the encoding is JSON with fixed field names:
 *
 *   | value              | wire form                                                       |
 *   |--------------------|-----------------------------------------------------------------|
 *   | PostPayload        | `{"content":..,"creator":..,"title":..}`                        |
 *   | packet envelope    | `{"ibcPostPacket":{<PostPayload>}}` or `{"noData":{}}`          |
 *   | AckResult          | `{"postID":"<decimal>"}`                                        |
 *   | Acknowledgement    | `{"result":"<base64 bytes>"}` or `{"error":"<message>"}`         |
 *
 *   Keys are emitted in sorted order (nlohmann::json object ordering), which
 *   keeps the byte output deterministic across builds.
 *
 *   ## Error Handling
 *   No function here throws. JSON exceptions are caught and reported as a
 *   `Status` (EncodingError / PacketDecodeError / AckDecodeError) with the
 *   library's message as detail. `decode_acknowledgement()` never fails: input
 *   that is neither a result nor an error envelope is tagged `AckKind::Unknown`
 *   and the keeper turns that into `UnsupportedAckFormat`.
 */

#pragma once

#include <string>
#include "relaypost/status.hpp"
#include "relaypost/types.hpp"

namespace relaypost {
namespace codec {

/// Which variant a module packet-data envelope carries.
enum class PacketKind : uint8_t { NoData = 0, Post };

/// Serialize a bare PostPayload.
Status encode_post(const PostPayload& payload, Bytes& out);

/// Parse a bare PostPayload. Missing fields decode as empty strings; unknown fields fail.
Status decode_post(const Bytes& bytes, PostPayload& out);

/// Wrap a PostPayload in the module envelope used as packet data.
Status encode_packet_data(const PostPayload& payload, Bytes& out);

/**
 * @brief Unwrap module packet data.
 * @param kind Set to `PacketKind::Post` when `out` was filled, `NoData` otherwise.
 */
Status decode_packet_data(const Bytes& bytes, PacketKind& kind, PostPayload& out);

Status encode_ack_result(const AckResult& ack, Bytes& out);
Status decode_ack_result(const Bytes& bytes, AckResult& out);

/// Serialize an acknowledgement envelope. An `Unknown` tag is written as `{}`.
Bytes encode_acknowledgement(const Acknowledgement& ack);

/// Classify acknowledgement bytes; anything unrecognized comes back as `AckKind::Unknown`.
Acknowledgement decode_acknowledgement(const Bytes& bytes);

/// Standard base64 (RFC 4648, padded) used for the `result` field.
std::string base64_encode(const Bytes& bytes);
bool        base64_decode(const std::string& text, Bytes& out);

Bytes       to_bytes(const std::string& text);
std::string to_text(const Bytes& bytes);

} // namespace codec
} // namespace relaypost
