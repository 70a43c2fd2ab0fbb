#include "sha256.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

namespace coolrouter::crypto {

namespace {

constexpr std::string_view kAddressDomain = "coolrouter:derived_address";

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

class Sha256Stream {
 public:
  Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("sha256: digest init failed");
    }
  }

  void Update(const void* data, std::size_t size) {
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      throw std::runtime_error("sha256: digest update failed");
    }
  }

  model::Hash32 Final() {
    model::Hash32 out{};
    unsigned int  len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
      throw std::runtime_error("sha256: digest final failed");
    }
    return out;
  }

 private:
  MdCtx ctx_;
};

} // namespace

model::Hash32 Sha256(std::string_view data) {
  Sha256Stream stream;
  stream.Update(data.data(), data.size());
  return stream.Final();
}

std::array<std::uint8_t, 8> Discriminator(std::string_view name) {
  const auto digest = Sha256("global:" + std::string(name));

  std::array<std::uint8_t, 8> tag{};
  std::copy_n(digest.begin(), tag.size(), tag.begin());
  return tag;
}

model::Identity DeriveAddress(const std::vector<std::string_view>& seeds, const model::Identity& program_id) {
  Sha256Stream stream;
  for (const auto seed : seeds) {
    stream.Update(seed.data(), seed.size());
  }
  stream.Update(program_id.data(), program_id.size());
  stream.Update(kAddressDomain.data(), kAddressDomain.size());
  return stream.Final();
}

} // namespace coolrouter::crypto
