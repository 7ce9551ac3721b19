/*
 * Blob KZG
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once
#include "blake3.h"
#include "blst.h"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string_view>

// Domain separation tags for every Fiat-Shamir derivation
const std::string_view CHALLENGE_TAG = "BLOBKZG_CHALLENGE_V1";
const std::string_view BATCH_TAG     = "BLOBKZG_BATCH_V1";
const std::string_view SRS_TAG       = "BLOBKZG_SRS_V1";

struct Hash {
    byte h[32];
};

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    void update_tag(std::string_view tag) {
        blake3_hasher_update(&h_, tag.data(), tag.size());
    }
    // little-endian, fixed width
    void update_u64(uint64_t v) {
        byte buff[8];
        for (int i = 0; i < 8; i++) buff[i] = static_cast<byte>(v >> (8 * i));
        blake3_hasher_update(&h_, buff, 8);
    }
    void finalize(byte* out) {
        blake3_hasher_finalize(&h_, static_cast<uint8_t*>(out), 32);
    }
};

Hash new_hash(const byte* h = nullptr);

// reduces the digest mod r
void hash_to_scalar(blst_scalar* dst, const Hash &hash);
