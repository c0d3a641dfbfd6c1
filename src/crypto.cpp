#include <mpchat/crypto.h>

#include "openssl_common.h"

#include <openssl/evp.h>

namespace mpchat {

static typed_unique_ptr<EVP_PKEY>
public_pkey(const bytes& data)
{
  auto* pkey = EVP_PKEY_new_raw_public_key(
    EVP_PKEY_ED25519, nullptr, data.data(), data.size());
  if (pkey == nullptr) {
    throw openssl_error();
  }

  return make_typed_unique(pkey);
}

static typed_unique_ptr<EVP_PKEY>
private_pkey(const bytes& data)
{
  auto* pkey = EVP_PKEY_new_raw_private_key(
    EVP_PKEY_ED25519, nullptr, data.data(), data.size());
  if (pkey == nullptr) {
    throw openssl_error();
  }

  return make_typed_unique(pkey);
}

static bytes
raw_public_key(EVP_PKEY* pkey)
{
  auto raw = bytes(SignaturePublicKey::size);
  auto len = raw.size();
  if (1 != EVP_PKEY_get_raw_public_key(pkey, raw.data(), &len)) {
    throw openssl_error();
  }

  raw.resize(len);
  return raw;
}

static bytes
raw_private_key(EVP_PKEY* pkey)
{
  auto raw = bytes(SignaturePrivateKey::size);
  auto len = raw.size();
  if (1 != EVP_PKEY_get_raw_private_key(pkey, raw.data(), &len)) {
    throw openssl_error();
  }

  raw.resize(len);
  return raw;
}

///
/// SignaturePublicKey
///

bool
SignaturePublicKey::verify(const bytes& message, const bytes& signature) const
{
  auto pkey = public_pkey(data);

  auto ctx = make_typed_unique(EVP_MD_CTX_new());
  if (ctx == nullptr) {
    throw openssl_error();
  }

  if (1 != EVP_DigestVerifyInit(
             ctx.get(), nullptr, nullptr, nullptr, pkey.get())) {
    throw openssl_error();
  }

  auto rv = EVP_DigestVerify(
    ctx.get(), signature.data(), signature.size(), message.data(), message.size());

  return rv == 1;
}

bool
operator==(const SignaturePublicKey& lhs, const SignaturePublicKey& rhs)
{
  return lhs.data == rhs.data;
}

///
/// SignaturePrivateKey
///

SignaturePrivateKey
SignaturePrivateKey::generate()
{
  auto ctx = make_typed_unique(
    EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (ctx == nullptr) {
    throw openssl_error();
  }

  if (1 != EVP_PKEY_keygen_init(ctx.get())) {
    throw openssl_error();
  }

  EVP_PKEY* raw = nullptr;
  if (1 != EVP_PKEY_keygen(ctx.get(), &raw)) {
    throw openssl_error();
  }

  auto pkey = make_typed_unique(raw);
  return { raw_private_key(pkey.get()), raw_public_key(pkey.get()) };
}

SignaturePrivateKey
SignaturePrivateKey::parse(const bytes& data)
{
  if (data.size() != size) {
    throw InvalidParameterError("Ed25519 private key must be 32 bytes");
  }

  auto pkey = private_pkey(data);
  return { data, raw_public_key(pkey.get()) };
}

bytes
SignaturePrivateKey::sign(const bytes& message) const
{
  auto pkey = private_pkey(data);

  auto ctx = make_typed_unique(EVP_MD_CTX_new());
  if (ctx == nullptr) {
    throw openssl_error();
  }

  if (1 != EVP_DigestSignInit(
             ctx.get(), nullptr, nullptr, nullptr, pkey.get())) {
    throw openssl_error();
  }

  size_t siglen = EVP_PKEY_size(pkey.get());
  bytes sig(siglen);
  if (1 != EVP_DigestSign(
             ctx.get(), sig.data(), &siglen, message.data(), message.size())) {
    throw openssl_error();
  }

  sig.resize(siglen);
  return sig;
}

SignaturePrivateKey::SignaturePrivateKey(bytes priv_data, bytes pub_data)
  : data(std::move(priv_data))
  , public_key{ std::move(pub_data) }
{
}

} // namespace mpchat
