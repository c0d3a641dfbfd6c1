#include <catch2/catch.hpp>
#include <mpchat/codec.h>

using namespace mpchat;
using namespace mpchat::codec;

// Greet messages signed with the RFC 8032 test key
class CodecTest
{
public:
  CodecTest()
    : priv(SignaturePrivateKey::parse(seed))
  {
  }

protected:
  const bytes seed = from_hex(
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
  const bytes pub = from_hex(
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
  const bytes key = from_hex(
    "8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a");
  const SignaturePrivateKey priv;

  // INIT_INITIATOR_UP from 1 to 2, members 1..6
  const bytes upflow = from_hex(
    "0003004014e66025ae06b50c0db2abed47bcbca95ad251c8cc9f9d192bc13dda"
    "8645614ff56382cd4c6d7dd4351fa54ba08baa44d26d6215a9b609737320a4ad"
    "ce235c070001000101000200010201ff0002009c010000013101010001320102"
    "0001310102000132010200013301020001340102000135010200013601030000"
    "010300208520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98e"
    "aa9b4e6a010400208520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4"
    "eba4a98eaa9b4e6a01050020d75a980182b10ab7d54bfed3c964073a0ee172f3"
    "daa62325af021a68f707511a");
  const std::string upflow_wire =
    "?mpENC:"
    "AAMAQBTmYCWuBrUMDbKr7Ue8vKla0lHIzJ+dGSvBPdqGRWFP9WOCzUxtfdQ1H6VLoIuqRNJtYh"
    "WptglzcyCkrc4jXAcAAQABAQACAAECAf8AAgCcAQAAATEBAQABMgECAAExAQIAATIBAgABMwEC"
    "AAE0AQIAATUBAgABNgEDAAABAwAghSDwCYkwp1R0i33ctD73Wg2/Og0mOBr066SpjqqbTmoBBA"
    "AghSDwCYkwp1R0i33ctD73Wg2/Og0mOBr066SpjqqbTmoBBQAg11qYAYKxCrfVS/7TyWQHOg7h"
    "cvPapiMlrwIaaPcHURo=.";

  // QUIT_DOWN broadcast from 1, disclosing its signing key
  const bytes quit = from_hex(
    "00030040423b68bed53e2f9acbbf6ae302267b337849cd6a566a35bd44f7299cf4ddbb63"
    "ba28871e837b1fe9ef59db63a2a5aa9f866e73a1a6eec3dc7ea6dd2c5b0e3f0d00010001"
    "01000200010201ff000200d3010000013101010000010700209d61b19deffd5a60ba844a"
    "f492ec2cc44449c5697b326919703bac031cae7f60");

  // Encrypted data message with session key hint 'T'
  const bytes data = from_hex(
    "001200015400030040b2a71f745069d4ff9e8bd2d35881a95e7d78e1fce2dd4a2bb021bb"
    "9a8190ceca0914225e2c961c8f7e7cb88490a913de8fe9eeb1cb3b3cf70c1f9f066e7d62"
    "03000100010100020001030011000c7afb3688694d13c92ca4cbd9001000098c10ec431a"
    "7ae8af5e");

  const std::vector<MemberId> six_members{ "1", "2", "3", "4", "5", "6" };

  ProtocolMessage upflow_message() const
  {
    auto message = ProtocolMessage("1");
    message.dest = "2";
    message.greet_type = GreetType::init_initiator_up;
    message.members = six_members;
    message.int_keys = { {}, key };
    message.nonces = { key };
    message.pub_keys = { pub };
    return message;
  }
};

TEST_CASE_METHOD(CodecTest, "Decode an upflow greet message")
{
  const auto message =
    decode_greet_message(upflow, SignaturePublicKey{ pub });

  REQUIRE(message.signature_ok);
  REQUIRE(message.signature.size() == 64);
  REQUIRE(message.raw_message.size() == 168);
  REQUIRE(message.protocol_version == protocol_version);
  REQUIRE(message.source == "1");
  REQUIRE(message.dest == "2");
  REQUIRE(!message.is_broadcast());
  REQUIRE(message.greet_type == GreetType::init_initiator_up);
  REQUIRE(message.agreement == Agreement::initial);
  REQUIRE(message.flow == Flow::upflow);
  REQUIRE(message.members == six_members);
  REQUIRE(message.int_keys == std::vector<bytes>{ {}, key });
  REQUIRE(message.debug_keys ==
          std::vector<std::string>{ "", to_base64(key) });
  REQUIRE(message.nonces == std::vector<bytes>{ key });
  REQUIRE(message.pub_keys == std::vector<bytes>{ pub });
  REQUIRE(!message.session_signature.has_value());
  REQUIRE(!message.signing_key.has_value());

  // Without an explicit key, the key listed for the source is used
  REQUIRE(decode_greet_message(upflow).signature_ok);
}

TEST_CASE_METHOD(CodecTest, "Decode a quit greet message")
{
  const auto message = decode_greet_message(quit, SignaturePublicKey{ pub });

  REQUIRE(message.signature_ok);
  REQUIRE(message.raw_message.size() == 61);
  REQUIRE(message.source == "1");
  REQUIRE(message.is_broadcast());
  REQUIRE(message.greet_type == GreetType::quit_down);
  REQUIRE(message.agreement == Agreement::auxiliary);
  REQUIRE(message.flow == Flow::downflow);
  REQUIRE(message.members.empty());
  REQUIRE(message.signing_key == seed);

  // Nobody is listed, so there is no key to check against
  REQUIRE(!decode_greet_message(quit).signature_ok);
}

TEST_CASE_METHOD(CodecTest, "Bad signatures are reported, not thrown")
{
  const auto other = SignaturePrivateKey::generate();
  REQUIRE(!decode_greet_message(upflow, other.public_key).signature_ok);

  // Tamper with the destination
  auto tampered = upflow;
  const auto dest_offset = size_t(68 + 5 + 5 + 6 + 5 + 4);
  REQUIRE(tampered.at(dest_offset) == '2');
  tampered.at(dest_offset) = '3';

  const auto message = decode_greet_message(tampered, SignaturePublicKey{ pub });
  REQUIRE(message.dest == "3");
  REQUIRE(!message.signature_ok);
}

TEST_CASE_METHOD(CodecTest, "Encode greet messages")
{
  // Ed25519 signatures are deterministic
  REQUIRE(encode_greet_message(upflow_message(), priv) == upflow);

  auto message = ProtocolMessage("1");
  message.greet_type = GreetType::quit_down;
  message.signing_key = seed;
  REQUIRE(encode_greet_message(message, priv) == quit);

  const auto decoded = decode_greet_message(upflow);
  REQUIRE(encode_greet_content(decoded) == decoded.raw_message);
  REQUIRE(encode_greet_message(decoded, priv) == upflow);
}

TEST_CASE_METHOD(CodecTest, "Encode with a session signature")
{
  const auto alice = SignaturePrivateKey::generate();
  auto message = ProtocolMessage("alice");
  message.greet_type = GreetType::init_participant_confirm_down;
  message.members = { "alice", "bob" };
  message.pub_keys = { alice.public_key.data, pub };
  message.session_signature = from_hex("00112233");

  const auto decoded =
    decode_greet_message(encode_greet_message(message, alice));
  REQUIRE(decoded.signature_ok);
  REQUIRE(decoded.session_signature == from_hex("00112233"));
  REQUIRE(decoded.agreement == Agreement::initial);
  REQUIRE(decoded.flow == Flow::downflow);
}

TEST_CASE_METHOD(CodecTest, "Malformed greet messages")
{
  auto bad_version = upflow;
  bad_version.at(72) = 77;
  REQUIRE_THROWS_WITH(decode_greet_message(bad_version),
                      "Received wrong protocol version: 77");

  REQUIRE_THROWS_AS(decode_greet_message(upflow + from_hex("09990000")),
                    ProtocolError);

  // An intermediate key with nobody to hold it
  REQUIRE_THROWS_AS(decode_greet_message(quit + from_hex("010300020102")),
                    ProtocolError);

  const auto unsigned_content = bytes(upflow.begin() + 68, upflow.end());
  REQUIRE_THROWS_AS(decode_greet_message(unsigned_content), ProtocolError);

  // Records are laid out as signature (0..67), version (68..72), message
  // type (73..77), greet type (78..83), source (84..88), dest (89..93)
  const auto begin = upflow.begin();
  const auto splice = [&](size_t from, size_t to, const bytes& middle) {
    const auto head = bytes(begin, begin + static_cast<std::ptrdiff_t>(from));
    const auto tail =
      bytes(begin + static_cast<std::ptrdiff_t>(to), upflow.end());
    return head + middle + tail;
  };

  SECTION("Integer fields must have their fixed width")
  {
    const auto long_type = splice(78, 84, from_hex("01ff00040001009c"));
    const auto long_category = splice(73, 78, from_hex("000200020002"));
    const auto long_version = splice(68, 73, from_hex("000100020001"));
    REQUIRE_THROWS_AS(decode_greet_message(long_type), ProtocolError);
    REQUIRE_THROWS_AS(decode_greet_message(long_category), ProtocolError);
    REQUIRE_THROWS_AS(decode_greet_message(long_version), ProtocolError);
  }

  SECTION("Source and destination are required")
  {
    REQUIRE_THROWS_AS(decode_greet_message(splice(84, 89, {})), ProtocolError);
    REQUIRE_THROWS_AS(decode_greet_message(splice(89, 94, {})), ProtocolError);
    REQUIRE(decode_greet_message(splice(84, 84, {})).signature_ok);
  }

  auto no_type = upflow_message();
  no_type.greet_type = std::nullopt;
  REQUIRE_THROWS_AS(encode_greet_content(no_type), InvalidParameterError);

  auto extra_keys = upflow_message();
  extra_keys.members = { "1" };
  REQUIRE_THROWS_AS(encode_greet_content(extra_keys), InvalidParameterError);
}

TEST_CASE_METHOD(CodecTest, "Inspect message content")
{
  SECTION("Upflow message")
  {
    const auto info = inspect_message_content(upflow);
    REQUIRE(info.type == MessageCategory::greet);
    REQUIRE(info.protocol_version == 1);
    REQUIRE(info.from == "1");
    REQUIRE(info.to == "2");
    REQUIRE(info.origin == Origin::participant);
    REQUIRE(!info.sidkey_hint.has_value());
    REQUIRE(info.is_greet());

    const auto& greet = info.greet.value();
    REQUIRE(greet.greet_type == GreetType::init_initiator_up);
    REQUIRE(greet.agreement == Agreement::initial);
    REQUIRE(greet.flow == Flow::upflow);
    REQUIRE(greet.from_initiator);
    REQUIRE(greet.negotiation == "START");
    REQUIRE(greet.members == six_members);
    REQUIRE(greet.num_nonces == 1);
    REQUIRE(greet.num_pub_keys == 1);
    REQUIRE(greet.num_int_keys == 2);
  }

  SECTION("Downflow message for quit")
  {
    const auto info = inspect_message_content(quit);
    REQUIRE(info.type == MessageCategory::greet);
    REQUIRE(info.from == "1");
    REQUIRE(info.to.empty());
    REQUIRE(info.origin == Origin::unknown);

    const auto& greet = info.greet.value();
    REQUIRE(greet.greet_type == GreetType::quit_down);
    REQUIRE(greet.agreement == Agreement::auxiliary);
    REQUIRE(greet.flow == Flow::downflow);
    REQUIRE(greet.negotiation == "QUIT");
    REQUIRE(greet.members.empty());
    REQUIRE(greet.num_nonces == 0);
    REQUIRE(greet.num_pub_keys == 0);
    REQUIRE(greet.num_int_keys == 0);
  }

  SECTION("Data message")
  {
    const auto info = inspect_message_content(data);
    REQUIRE(info.type == MessageCategory::data);
    REQUIRE(info.protocol_version == 1);
    REQUIRE(info.from.empty());
    REQUIRE(info.origin == Origin::unknown);
    REQUIRE(!info.is_greet());
    REQUIRE(info.sidkey_hint == from_ascii("T"));
  }

  SECTION("Message from an outsider")
  {
    auto message = ProtocolMessage("7");
    message.greet_type = with_recover(GreetType::exclude_aux_initiator_down);
    message.members = { "1", "2", "3" };

    const auto info =
      inspect_message_content(encode_greet_message(message, priv));
    REQUIRE(info.origin == Origin::outsider);
    REQUIRE(info.greet.value().negotiation == "EXCLUDE (recovery)");
    REQUIRE(info.greet.value().from_initiator);
  }

  SECTION("Content without a message type")
  {
    REQUIRE_THROWS_AS(inspect_message_content(from_hex("0001000101")),
                      ProtocolError);
  }

  SECTION("Oversized integer fields")
  {
    const auto version = from_hex("0001000101");
    const auto greet = from_hex("0002000102");
    const auto type = from_hex("01ff0002009c");
    REQUIRE(inspect_message_content(version + greet + type).is_greet());

    REQUIRE_THROWS_AS(
      inspect_message_content(from_hex("000100020101") + greet + type),
      ProtocolError);
    REQUIRE_THROWS_AS(
      inspect_message_content(version + from_hex("000200020102") + type),
      ProtocolError);
    REQUIRE_THROWS_AS(
      inspect_message_content(version + greet + from_hex("01ff00040001009c")),
      ProtocolError);
  }
}

TEST_CASE_METHOD(CodecTest, "Wire framing")
{
  REQUIRE(encode_wire_message(upflow) == upflow_wire);

  const auto [greet_category, greet_content] = categorise_message(upflow_wire);
  REQUIRE(greet_category == MessageCategory::greet);
  REQUIRE(greet_content == upflow);

  const auto [data_category, data_content] =
    categorise_message(encode_wire_message(data));
  REQUIRE(data_category == MessageCategory::data);
  REQUIRE(data_content == data);

  const auto [plain_category, plain_content] = categorise_message("hello");
  REQUIRE(plain_category == MessageCategory::plain);
  REQUIRE(plain_content == from_ascii("hello"));

  REQUIRE(query_message("Let's talk") == "?mpENCv1?Let's talk");
  const auto [query_category, query_content] =
    categorise_message(query_message("Let's talk"));
  REQUIRE(query_category == MessageCategory::query);
  REQUIRE(query_content == bytes{ protocol_version });

  REQUIRE(error_message("Signature failed") ==
          "?mpENC Error:Signature failed.");
  const auto [error_category, error_content] =
    categorise_message(error_message("Signature failed"));
  REQUIRE(error_category == MessageCategory::error);
  REQUIRE(error_content == from_ascii("Signature failed"));

  REQUIRE_THROWS_AS(categorise_message("?mpENC what is this"), ProtocolError);

  // Only the first version marker of a query counts
  REQUIRE(std::get<0>(categorise_message("?mpENCvery v1?")) ==
          MessageCategory::query);
  REQUIRE_THROWS_AS(categorise_message("?mpENCv2?v1?"), ProtocolError);
  REQUIRE_THROWS_AS(categorise_message("?mpENCv12?"), ProtocolError);
}
