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

#include <iostream>
#include <iomanip>
#include "utils.h"


// =======================================
// =============== POINTS ================
// =======================================


// -------------------- P1 ---------------------------

blst_p1 new_p1() {
    blst_p1 p;
    memset(&p, 0, sizeof(p));
    return p;
}

blst_p1_affine new_p1_affine() {
    blst_p1_affine p;
    memset(&p, 0, sizeof(p));
    return p;
}

bytes48 compress_p1_affine(const blst_p1_affine &pk) {
    bytes48 pk_comp;
    blst_p1_affine_compress(pk_comp.data(), &pk);
    return pk_comp;
}

blst_p1_affine p1_to_affine(const blst_p1 &p1) {
    blst_p1_affine aff;
    blst_p1_to_affine(&aff, &p1);
    return aff;
}

blst_p1 p1_from_affine(const blst_p1_affine &aff) {
    blst_p1 p1;
    blst_p1_from_affine(&p1, &aff);
    return p1;
}

void p1_mult(blst_p1& dst, const blst_p1 &a, const blst_scalar &b) {
    blst_p1_mult(&dst, &a, b.b, SCALAR_BITS);
}

// dst = dst - src
void p1_sub_inplace(blst_p1 &dst, const blst_p1 &src) {
    blst_p1 neg = src;
    blst_p1_cneg(&neg, true);
    blst_p1_add_or_double(&dst, &dst, &neg);
}

bool p1_affine_equal(const blst_p1_affine &a, const blst_p1_affine &b) {
    return blst_p1_affine_is_equal(&a, &b);
}



// -------------------- P2 ---------------------------

blst_p2 new_p2() {
    blst_p2 p;
    memset(&p, 0, sizeof(p));
    return p;
}
bytes96 compress_p2_affine(const blst_p2_affine &pk) {
    bytes96 pk_comp;
    blst_p2_affine_compress(pk_comp.data(), &pk);
    return pk_comp;
}
blst_p2_affine p2_to_affine(const blst_p2 &p2) {
    blst_p2_affine aff;
    blst_p2_to_affine(&aff, &p2);
    return aff;
}
blst_p2 p2_from_affine(const blst_p2_affine &aff) {
    blst_p2 p2;
    blst_p2_from_affine(&p2, &aff);
    return p2;
}
void p2_mult(blst_p2& dst, const blst_p2 &a, const blst_scalar &b) {
    blst_p2_mult(&dst, &a, b.b, SCALAR_BITS);
}
bool p2_affine_equal(const blst_p2_affine &a, const blst_p2_affine &b) {
    return blst_p2_affine_is_equal(&a, &b);
}

void print_p2_affine(const blst_p2_affine& pk) {
    auto pk_comp = compress_p2_affine(pk);
    for (auto b : pk_comp)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    std::cout << std::dec << std::endl;
}


// -------------------- PAIRING ----------------------

bool pairings_verify(
    const blst_p1_affine &a1,
    const blst_p2_affine &a2,
    const blst_p1_affine &b1,
    const blst_p2_affine &b2
) {
    // negate a1 so both loops land in one product
    blst_p1 a1_neg = p1_from_affine(a1);
    blst_p1_cneg(&a1_neg, true);
    blst_p1_affine a1_neg_aff = p1_to_affine(a1_neg);

    blst_fp12 acc = *blst_fp12_one();
    blst_fp12 loop;

    // a pairing with infinity on either side is 1
    if (!blst_p1_affine_is_inf(&a1_neg_aff) && !blst_p2_affine_is_inf(&a2)) {
        blst_miller_loop(&loop, &a2, &a1_neg_aff);
        blst_fp12_mul(&acc, &acc, &loop);
    }
    if (!blst_p1_affine_is_inf(&b1) && !blst_p2_affine_is_inf(&b2)) {
        blst_miller_loop(&loop, &b2, &b1);
        blst_fp12_mul(&acc, &acc, &loop);
    }

    blst_final_exp(&acc, &acc);
    return blst_fp12_is_one(&acc);
}
