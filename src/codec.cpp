#include <mpchat/codec.h>
#include <mpchat/log.h>

#include <tlv/tlv_syntax.h>

#include <algorithm>
#include <cctype>

namespace mpchat::codec {

using log::Log;

static const auto log_mod = "codec"s;

static const auto wire_prefix = "?mpENC"s;
static const auto error_infix = " Error:"s;
static const auto signature_label = from_ascii("greetmsgsig");

///
/// Greet messages
///

static void
write_all(tlv::ostream& w, uint16_t type, const std::vector<bytes>& values)
{
  for (const auto& value : values) {
    w.write(type, value);
  }
}

bytes
encode_greet_content(const ProtocolMessage& message)
{
  if (!message.greet_type) {
    throw InvalidParameterError("Greet message without a greet type");
  }

  if (message.int_keys.size() > message.members.size() ||
      message.nonces.size() > message.members.size() ||
      message.pub_keys.size() > message.members.size()) {
    throw InvalidParameterError("More keys than members");
  }

  auto w = tlv::ostream();
  w.write_uint(TLVType::protocol_version, protocol_version, 1);
  w.write_uint(TLVType::message_type,
               static_cast<uint8_t>(MessageCategory::greet),
               1);
  w.write_uint(
    TLVType::greet_type, static_cast<uint16_t>(message.greet_type.value()), 2);
  w.write(TLVType::source, from_ascii(message.source));
  w.write(TLVType::dest, from_ascii(message.dest));

  for (const auto& member : message.members) {
    w.write(TLVType::member, from_ascii(member));
  }

  write_all(w, TLVType::int_key, message.int_keys);
  write_all(w, TLVType::nonce, message.nonces);
  write_all(w, TLVType::pub_key, message.pub_keys);

  if (message.session_signature) {
    w.write(TLVType::session_signature, message.session_signature.value());
  }

  if (message.signing_key) {
    w.write(TLVType::signing_key, message.signing_key.value());
  }

  return w.bytes();
}

bytes
encode_greet_message(const ProtocolMessage& message,
                     const SignaturePrivateKey& signing_key)
{
  const auto content = encode_greet_content(message);
  const auto signature = signing_key.sign(signature_label + content);

  auto w = tlv::ostream();
  w.write(TLVType::message_signature, signature);
  w.write_raw(content);

  Log::debug(log_mod,
             "Encoded ",
             message.greet_type.value(),
             " from ",
             message.source,
             " (",
             w.size(),
             " bytes)");
  return w.bytes();
}

// Integer fields have a fixed width on the wire
static uint64_t
fixed_uint(const tlv::Record& record, size_t length)
{
  if (record.value.size() != length) {
    throw ProtocolError("Record of type " + std::to_string(record.type) +
                        " must be " + std::to_string(length) + " bytes, got " +
                        std::to_string(record.value.size()));
  }

  return record.uint_value();
}

static void
read_greet_record(ProtocolMessage& message, const tlv::Record& record)
{
  switch (record.type) {
    case TLVType::padding:
      break;

    case TLVType::protocol_version: {
      const auto version = fixed_uint(record, 1);
      if (version != protocol_version) {
        throw ProtocolError("Received wrong protocol version: " +
                            std::to_string(version));
      }
      message.protocol_version = static_cast<uint8_t>(version);
      break;
    }

    case TLVType::message_type:
      if (fixed_uint(record, 1) !=
          static_cast<uint8_t>(MessageCategory::greet)) {
        throw ProtocolError("Not a greet message");
      }
      break;

    case TLVType::greet_type: {
      const auto type = static_cast<GreetType>(fixed_uint(record, 2));
      message.greet_type = type;
      message.agreement = agreement(type);
      message.flow = flow(type);
      break;
    }

    case TLVType::source:
      message.source = to_ascii(record.value);
      break;

    case TLVType::dest:
      message.dest = to_ascii(record.value);
      break;

    case TLVType::member:
      message.members.push_back(to_ascii(record.value));
      break;

    case TLVType::int_key:
      message.int_keys.push_back(record.value);
      message.debug_keys.push_back(to_base64(record.value));
      break;

    case TLVType::nonce:
      message.nonces.push_back(record.value);
      break;

    case TLVType::pub_key:
      message.pub_keys.push_back(record.value);
      break;

    case TLVType::session_signature:
      message.session_signature = record.value;
      break;

    case TLVType::signing_key:
      message.signing_key = record.value;
      break;

    default:
      throw ProtocolError("Unexpected record type in greet message: " +
                          std::to_string(record.type));
  }
}

static std::optional<SignaturePublicKey>
source_key(const ProtocolMessage& message)
{
  const auto it =
    std::find(message.members.begin(), message.members.end(), message.source);
  if (it == message.members.end()) {
    return std::nullopt;
  }

  const auto index = static_cast<size_t>(it - message.members.begin());
  if (index >= message.pub_keys.size()) {
    return std::nullopt;
  }

  return SignaturePublicKey{ message.pub_keys.at(index) };
}

ProtocolMessage
decode_greet_message(const bytes& message,
                     const std::optional<SignaturePublicKey>& pub_key)
{
  auto r = tlv::istream(message);
  if (r.peek_type() != TLVType::message_signature) {
    throw ProtocolError("Greet message does not start with a signature");
  }

  auto out = ProtocolMessage();
  out.signature = r.next().value;
  out.raw_message = r.remaining();

  auto has_source = false;
  auto has_dest = false;
  while (!r.empty()) {
    const auto record = r.next();
    has_source = has_source || record.type == TLVType::source;
    has_dest = has_dest || record.type == TLVType::dest;
    read_greet_record(out, record);
  }

  if (!out.protocol_version) {
    throw ProtocolError("Greet message without a protocol version");
  }

  if (!out.greet_type) {
    throw ProtocolError("Greet message without a greet type");
  }

  if (!has_source || !has_dest) {
    throw ProtocolError("Greet message without a source and destination");
  }

  if (out.int_keys.size() > out.members.size() ||
      out.nonces.size() > out.members.size() ||
      out.pub_keys.size() > out.members.size()) {
    throw ProtocolError("Greet message lists more keys than members");
  }

  for (size_t i = 0; i < out.int_keys.size(); i++) {
    Log::crypto(log_mod, "int_key[", i, "] = ", out.debug_keys.at(i));
  }
  for (size_t i = 0; i < out.nonces.size(); i++) {
    Log::crypto(log_mod, "nonce[", i, "] = ", to_base64(out.nonces.at(i)));
  }

  const auto key = pub_key ? pub_key : source_key(out);
  if (!key || key->data.size() != SignaturePublicKey::size) {
    Log::warn(log_mod, "No usable key to verify greet from ", out.source);
    return out;
  }

  const auto signed_content = signature_label + out.raw_message;
  out.signature_ok = key->verify(signed_content, out.signature);
  if (!out.signature_ok) {
    Log::warn(log_mod, "Bad signature on greet from ", out.source);
  }

  Log::debug(log_mod,
             "Decoded ",
             out.greet_type.value(),
             " from ",
             out.source,
             " to ",
             out.is_broadcast() ? "everyone" : out.dest);
  return out;
}

ProtocolMessageInfo
inspect_message_content(const bytes& message)
{
  auto info = ProtocolMessageInfo{};
  auto category = std::optional<MessageCategory>{};
  auto greet_type = std::optional<GreetType>{};
  auto members = std::vector<MemberId>{};
  auto num_nonces = size_t(0);
  auto num_pub_keys = size_t(0);
  auto num_int_keys = size_t(0);

  info.protocol_version = 0;
  for (const auto& record : tlv::read_all(message)) {
    switch (record.type) {
      case TLVType::protocol_version:
        info.protocol_version = static_cast<uint8_t>(fixed_uint(record, 1));
        break;

      case TLVType::message_type:
        category = static_cast<MessageCategory>(fixed_uint(record, 1));
        break;

      case TLVType::greet_type:
        greet_type = static_cast<GreetType>(fixed_uint(record, 2));
        break;

      case TLVType::source:
        info.from = to_ascii(record.value);
        break;

      case TLVType::dest:
        info.to = to_ascii(record.value);
        break;

      case TLVType::member:
        members.push_back(to_ascii(record.value));
        break;

      case TLVType::int_key:
        num_int_keys += 1;
        break;

      case TLVType::nonce:
        num_nonces += 1;
        break;

      case TLVType::pub_key:
        num_pub_keys += 1;
        break;

      case TLVType::sidkey_hint:
        info.sidkey_hint = record.value;
        break;

      default:
        // Inspection only looks at routing information
        break;
    }
  }

  if (category != MessageCategory::greet && category != MessageCategory::data) {
    throw ProtocolError("Message does not carry a known message type");
  }

  info.type = category.value();
  info.origin = classify_origin(info.from, members);

  if (info.type == MessageCategory::greet) {
    if (!greet_type) {
      throw ProtocolError("Greet message without a greet type");
    }

    const auto type = greet_type.value();
    info.greet = GreetInfo{ type,
                            agreement(type),
                            flow(type),
                            is_initiator(type),
                            negotiation_name(type),
                            members,
                            num_nonces,
                            num_pub_keys,
                            num_int_keys };
  }

  return info;
}

///
/// Wire framing
///

std::string
encode_wire_message(const bytes& content)
{
  return wire_prefix + ":" + to_base64(content) + ".";
}

std::string
query_message(const std::string& text)
{
  return wire_prefix + "v" + std::to_string(protocol_version) + "?" + text;
}

std::string
error_message(const std::string& text)
{
  return wire_prefix + error_infix + text + ".";
}

static bool
starts_with(const std::string& str, const std::string& prefix)
{
  return str.compare(0, prefix.size(), prefix) == 0;
}

static bool
is_digit(char c)
{
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// The digits of the first "v<digits>?" in a query, if there is one
static std::optional<std::string>
query_version(const std::string& text)
{
  for (auto pos = text.find('v'); pos != std::string::npos;
       pos = text.find('v', pos + 1)) {
    auto end = pos + 1;
    while (end < text.size() && is_digit(text.at(end))) {
      end += 1;
    }

    if (end > pos + 1 && end < text.size() && text.at(end) == '?') {
      return text.substr(pos + 1, end - pos - 1);
    }
  }

  return std::nullopt;
}

static MessageCategory
content_category(const bytes& content)
{
  auto r = tlv::istream(content);
  while (!r.empty()) {
    const auto record = r.next();
    if (record.type == TLVType::message_type) {
      const auto type = static_cast<MessageCategory>(fixed_uint(record, 1));
      if (type == MessageCategory::data) {
        return MessageCategory::data;
      }
      return MessageCategory::greet;
    }
  }

  return MessageCategory::greet;
}

std::tuple<MessageCategory, bytes>
categorise_message(const std::string& wire)
{
  if (!starts_with(wire, wire_prefix)) {
    return { MessageCategory::plain, from_ascii(wire) };
  }

  const auto rest = wire.substr(wire_prefix.size());
  if (starts_with(rest, error_infix)) {
    auto text = rest.substr(error_infix.size());
    if (!text.empty() && text.back() == '.') {
      text.pop_back();
    }
    return { MessageCategory::error, from_ascii(text) };
  }

  if (rest.size() >= 2 && rest.front() == ':' && rest.back() == '.') {
    const auto content = from_base64(rest.substr(1, rest.size() - 2));
    return { content_category(content), content };
  }

  const auto version = query_version(rest);
  if (version == std::to_string(protocol_version)) {
    return { MessageCategory::query, bytes{ protocol_version } };
  }

  throw ProtocolError("Unknown mpENC message");
}

} // namespace mpchat::codec
