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
#include "blst.h"
#include "domain.h"
#include "errors.h"
#include "result.h"
#include "utils.h"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

const size_t BYTES_PER_SCALAR = 32;
const size_t BYTES_PER_G1 = 48;
const size_t BYTES_PER_G2 = 96;

// ---------------- scalars ----------------

// 32 bytes big-endian, rejects values >= r
Result<blst_scalar, KZGError> scalar_from_bytes(std::span<const byte> in);
bytes32 scalar_to_bytes(const blst_scalar &s);

// ---------------- points -----------------

// compressed, on curve and in the prime order subgroup
Result<blst_p1_affine, KZGError> g1_from_bytes(std::span<const byte> in);
bytes48 g1_to_bytes(const blst_p1_affine &p);

Result<blst_p2_affine, KZGError> g2_from_bytes(std::span<const byte> in);
bytes96 g2_to_bytes(const blst_p2_affine &p);

// ---------------- blobs ------------------

// n canonical scalars back to back, read as evaluations
Result<Polynomial, KZGError> blob_to_polynomial(std::span<const byte> blob, size_t n);

// ---------------- hex --------------------

// optional 0x prefix, either case
std::optional<std::vector<byte>> hex_to_bytes(std::string_view hex);
std::string bytes_to_hex(std::span<const byte> in);
