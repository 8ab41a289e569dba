#include <blake3.h>
#include <trustee/blake3/hash.hpp>

namespace trustee::blake3 {

namespace {

trustee::schema::hash32_t finalize(blake3_hasher& hasher) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<trustee::schema::hash32_t>);
  auto output = trustee::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

trustee::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

trustee::schema::hash32_t hash(const trustee::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

}  // namespace trustee::blake3
