/**
 * FileVault - Hashing helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace filevault::crypto
{

    void ensure_sodium_init();

    // Lower-case hex BLAKE2b digest (crypto_generichash_BYTES long).
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

} // namespace filevault::crypto
