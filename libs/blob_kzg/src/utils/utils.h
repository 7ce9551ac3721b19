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
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

using bytes32 = std::array<byte, 32>;
using bytes48 = std::array<byte, 48>;
using bytes96 = std::array<byte, 96>;
using scalar_vec = std::vector<blst_scalar>;

const size_t SCALAR_BITS = 256;

// 32 bytes from /dev/urandom, throws std::runtime_error if unavailable
bytes32 gen_rand_32();


// =======================================
// =============== POINTS ================
// =======================================

// -------------------- P1 ---------------------------

// point at infinity
blst_p1 new_p1();
blst_p1_affine new_p1_affine();

blst_p1_affine p1_to_affine(const blst_p1 &p1);
blst_p1 p1_from_affine(const blst_p1_affine &aff);
void p1_mult(blst_p1& dst, const blst_p1 &a, const blst_scalar &b);
void p1_sub_inplace(blst_p1 &dst, const blst_p1 &src);
bool p1_affine_equal(const blst_p1_affine &a, const blst_p1_affine &b);

bytes48 compress_p1_affine(const blst_p1_affine &pk);

// -------------------- P2 ---------------------------

blst_p2 new_p2();
blst_p2_affine p2_to_affine(const blst_p2 &p2);
blst_p2 p2_from_affine(const blst_p2_affine &aff);
void p2_mult(blst_p2& dst, const blst_p2 &a, const blst_scalar &b);
bool p2_affine_equal(const blst_p2_affine &a, const blst_p2_affine &b);

bytes96 compress_p2_affine(const blst_p2_affine &pk);
void print_p2_affine(const blst_p2_affine &pk);

// -------------------- PAIRING ----------------------

// e(a1, a2) == e(b1, b2)
bool pairings_verify(
    const blst_p1_affine &a1,
    const blst_p2_affine &a2,
    const blst_p1_affine &b1,
    const blst_p2_affine &b2
);


// =======================================
// =============== SCALARS ===============
// =======================================

blst_scalar new_scalar(const uint64_t v = 0);
bool scalar_is_zero(const blst_scalar &s);
bool scalar_is_one(const blst_scalar &s);
bool equal_scalars(const blst_scalar &a, const blst_scalar &b);

blst_scalar scalar_mul(const blst_scalar &a, const blst_scalar &b);
blst_scalar scalar_add(const blst_scalar &a, const blst_scalar &b);
blst_scalar scalar_sub(const blst_scalar &a, const blst_scalar &b);
void scalar_add_inplace(blst_scalar &dst, const blst_scalar &src);
void scalar_sub_inplace(blst_scalar &dst, const blst_scalar &src);
void scalar_mul_inplace(blst_scalar &dst, const blst_scalar &mult);
void scalar_pow(blst_scalar &out, const blst_scalar &base, uint64_t exp);

blst_scalar neg_scalar(const blst_scalar &sk);
blst_scalar inv_scalar(const blst_scalar &a);

// [1, x, x^2, ..., x^(n-1)]
scalar_vec compute_powers(const blst_scalar &x, size_t n);

// out[i] = 1 / in[i] with a single field inversion.
// Every input must be non-zero.
void batch_inv(scalar_vec &out, const scalar_vec &in);
