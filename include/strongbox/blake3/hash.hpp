#pragma once
#include <strongbox/schema/primitives.hpp>

namespace strongbox::blake3 {

/// BLAKE3(root || material). Used to chain committed journal records into
/// the ledger state root.
strongbox::schema::hash32_t fold(
    const strongbox::schema::hash32_t& root,
    const strongbox::schema::bytes_view_t& material);

}  // namespace strongbox::blake3
