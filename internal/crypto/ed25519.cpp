#include "ed25519.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

namespace coolrouter::crypto {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using Pkey  = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

Pkey PrivateKeyFromSeed(const Ed25519Seed& seed) {
  Pkey key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
  if (!key) {
    throw std::runtime_error("ed25519: invalid private key seed");
  }
  return key;
}

} // namespace

Ed25519KeyPair Ed25519KeyPair::Generate() {
  Ed25519Seed seed{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    throw std::runtime_error("ed25519: RAND_bytes failed");
  }
  return FromSeed(seed);
}

Ed25519KeyPair Ed25519KeyPair::FromSeed(const Ed25519Seed& seed) {
  auto key = PrivateKeyFromSeed(seed);

  model::Identity public_key{};
  std::size_t     len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &len) != 1 || len != public_key.size()) {
    throw std::runtime_error("ed25519: public key derivation failed");
  }
  return Ed25519KeyPair(seed, public_key);
}

std::string Ed25519KeyPair::Sign(std::string_view message) const {
  auto  key = PrivateKeyFromSeed(seed_);
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw std::runtime_error("ed25519: sign init failed");
  }

  std::string signature(kEd25519SignatureBytes, '\0');
  std::size_t len = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &len,
                     reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
    throw std::runtime_error("ed25519: sign failed");
  }
  signature.resize(len);
  return signature;
}

bool VerifyEd25519(const model::Identity& public_key, std::string_view message, std::string_view signature) {
  if (signature.size() != kEd25519SignatureBytes) {
    return false;
  }

  Pkey key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    return false;
  }

  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    return false;
  }

  return EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                          reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1;
}

} // namespace coolrouter::crypto
