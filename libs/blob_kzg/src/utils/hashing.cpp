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

#include "hashing.h"

Hash new_hash(const byte* h) {
    Hash hash;
    if (h != nullptr) {
        std::memcpy(hash.h, h, 32);
    } else {
        std::memset(hash.h, 0, 32);
    }
    return hash;
}

void hash_to_scalar(blst_scalar* dst, const Hash &hash) {
    blst_scalar_from_le_bytes(dst, hash.h, 32);
}
