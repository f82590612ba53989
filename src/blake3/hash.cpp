#include <blake3.h>
#include <strongbox/blake3/hash.hpp>

namespace strongbox::blake3 {

strongbox::schema::hash32_t fold(
    const strongbox::schema::hash32_t& root,
    const strongbox::schema::bytes_view_t& material) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, root.data(), root.size());
  blake3_hasher_update(&hasher, material.data(), material.size());
  auto output = strongbox::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<strongbox::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace strongbox::blake3
