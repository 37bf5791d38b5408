// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "hash.hpp"
#include <openssl/evp.h>

namespace evmpre::crypto
{
namespace
{
bool digest(const EVP_MD* md, uint8_t* hash, const uint8_t* data, std::size_t size) noexcept
{
    if (md == nullptr)
        return false;
    return EVP_Digest(data, size, hash, nullptr, md, nullptr) == 1;
}
}  // namespace

bool sha256(uint8_t hash[SHA256_HASH_SIZE], const uint8_t* data, std::size_t size) noexcept
{
    return digest(EVP_sha256(), hash, data, size);
}

bool ripemd160(uint8_t hash[RIPEMD160_HASH_SIZE], const uint8_t* data, std::size_t size) noexcept
{
    return digest(EVP_ripemd160(), hash, data, size);
}
}  // namespace evmpre::crypto
