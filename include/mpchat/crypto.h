#pragma once

#include <mpchat/common.h>

namespace mpchat {

// Ed25519 signature keys, held as raw 32-byte encodings
struct SignaturePublicKey
{
  static constexpr size_t size = 32;

  bytes data;

  bool verify(const bytes& message, const bytes& signature) const;
};

bool
operator==(const SignaturePublicKey& lhs, const SignaturePublicKey& rhs);

struct SignaturePrivateKey
{
  static constexpr size_t size = 32;

  static SignaturePrivateKey generate();
  static SignaturePrivateKey parse(const bytes& data);

  bytes data;
  SignaturePublicKey public_key;

  bytes sign(const bytes& message) const;

private:
  SignaturePrivateKey(bytes priv_data, bytes pub_data);
};

} // namespace mpchat
