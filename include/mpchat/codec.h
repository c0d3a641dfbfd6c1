#pragma once

#include <mpchat/crypto.h>
#include <mpchat/messages.h>

#include <optional>
#include <string>
#include <tuple>

namespace mpchat::codec {

const uint8_t protocol_version = 0x01;

// Record types used in encoded messages
struct TLVType
{
  static constexpr uint16_t padding = 0x0000;
  static constexpr uint16_t protocol_version = 0x0001;
  static constexpr uint16_t message_type = 0x0002;
  static constexpr uint16_t message_signature = 0x0003;
  static constexpr uint16_t message_payload = 0x0010;
  static constexpr uint16_t message_iv = 0x0011;
  static constexpr uint16_t sidkey_hint = 0x0012;
  static constexpr uint16_t source = 0x0100;
  static constexpr uint16_t dest = 0x0101;
  static constexpr uint16_t member = 0x0102;
  static constexpr uint16_t int_key = 0x0103;
  static constexpr uint16_t nonce = 0x0104;
  static constexpr uint16_t pub_key = 0x0105;
  static constexpr uint16_t session_signature = 0x0106;
  static constexpr uint16_t signing_key = 0x0107;
  static constexpr uint16_t greet_type = 0x01ff;
};

///
/// Greet messages
///

// The signed part of a greet message
bytes
encode_greet_content(const ProtocolMessage& message);

bytes
encode_greet_message(const ProtocolMessage& message,
                     const SignaturePrivateKey& signing_key);

// Decode a greet message and check its signature against `pub_key`, or
// against the key the message lists for its source if none is given.  A bad
// or unverifiable signature is reported in `signature_ok`; malformed content
// throws ProtocolError.
ProtocolMessage
decode_greet_message(
  const bytes& message,
  const std::optional<SignaturePublicKey>& pub_key = std::nullopt);

// Summarize a greet or data message without checking its signature
ProtocolMessageInfo
inspect_message_content(const bytes& message);

///
/// Wire framing
///

std::string
encode_wire_message(const bytes& content);

std::string
query_message(const std::string& text);

std::string
error_message(const std::string& text);

std::tuple<MessageCategory, bytes>
categorise_message(const std::string& wire);

} // namespace mpchat::codec
