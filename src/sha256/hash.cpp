#include <hap/common/critical.hpp>
#include <hap/sha256/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace hap::sha256 {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

hap::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    hap::common::critical("failed to allocate SHA-256 context");
  }
  auto output = hap::schema::hash32_t{};
  auto output_size = static_cast<unsigned int>(output.size());
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &output_size) != 1) {
    hap::common::critical("SHA-256 digest failed");
  }
  return output;
}

}  // namespace

hap::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

hap::schema::hash32_t hash(const hap::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

hap::schema::content_hash_t content_hash(const std::string_view& canonical) {
  auto digest_bytes = hash(canonical);
  return std::string{kContentHashPrefix} +
         hap::schema::to_hex(hap::schema::bytes_view_t{digest_bytes.data(),
                                                       digest_bytes.size()});
}

bool is_content_hash(const std::string_view value) {
  if (value.size() != kContentHashPrefix.size() + 64 ||
      !value.starts_with(kContentHashPrefix)) {
    return false;
  }
  for (const auto ch : value.substr(kContentHashPrefix.size())) {
    if (!((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'))) {
      return false;
    }
  }
  return true;
}

}  // namespace hap::sha256
