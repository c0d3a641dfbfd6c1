#pragma once

#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace mpchat {

template<typename T>
void
typed_delete(T* ptr);

template<>
void
typed_delete(EVP_MD_CTX* ptr);

template<>
void
typed_delete(EVP_PKEY_CTX* ptr);

template<>
void
typed_delete(EVP_PKEY* ptr);

template<typename T>
using typed_unique_ptr = std::unique_ptr<T, decltype(&typed_delete<T>)>;

template<typename T>
typed_unique_ptr<T>
make_typed_unique(T* ptr)
{
  return typed_unique_ptr<T>(ptr, typed_delete<T>);
}

// The most recent error on the OpenSSL error queue
std::runtime_error
openssl_error();

} // namespace mpchat
