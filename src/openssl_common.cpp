#include "openssl_common.h"

#include <openssl/err.h>
#include <openssl/evp.h>

namespace mpchat {

template<>
void
typed_delete(EVP_MD_CTX* ptr)
{
  EVP_MD_CTX_free(ptr);
}

template<>
void
typed_delete(EVP_PKEY_CTX* ptr)
{
  EVP_PKEY_CTX_free(ptr);
}

template<>
void
typed_delete(EVP_PKEY* ptr)
{
  EVP_PKEY_free(ptr);
}

std::runtime_error
openssl_error()
{
  auto code = ERR_get_error();
  return std::runtime_error(ERR_error_string(code, nullptr));
}

} // namespace mpchat
