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

#include <fstream>
#include <stdexcept>
#include "utils.h"


bytes32 gen_rand_32() {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) throw std::runtime_error("Failed to open /dev/urandom");

    bytes32 buffer;
    urandom.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    if (urandom.gcount() != static_cast<std::streamsize>(buffer.size()))
        throw std::runtime_error("Short read from /dev/urandom");
    return buffer;
}


// =======================================
// =============== SCALAR ================
// =======================================

blst_scalar new_scalar(const uint64_t v) {
    blst_scalar s;
    uint64_t a[4] = {v, 0, 0, 0};
    blst_scalar_from_uint64(&s, a);
    return s;
}

blst_scalar scalar_mul(const blst_scalar &a, const blst_scalar &b) {
    blst_scalar res;
    blst_sk_mul_n_check(&res, &a, &b);
    return res;
}

blst_scalar scalar_add(const blst_scalar &a, const blst_scalar &b) {
    blst_scalar res;
    blst_sk_add_n_check(&res, &a, &b);
    return res;
}
blst_scalar scalar_sub(const blst_scalar &a, const blst_scalar &b) {
    blst_scalar res;
    blst_sk_sub_n_check(&res, &a, &b);
    return res;
}

blst_scalar inv_scalar(const blst_scalar &a) {
    blst_scalar res;
    blst_sk_inverse(&res, &a);
    return res;
}

void scalar_add_inplace(blst_scalar &dst, const blst_scalar &src) {
    blst_sk_add_n_check(&dst, &dst, &src);
}
void scalar_sub_inplace(blst_scalar &dst, const blst_scalar &src) {
    blst_sk_sub_n_check(&dst, &dst, &src);
}
void scalar_mul_inplace(blst_scalar &dst, const blst_scalar &mult) {
    blst_sk_mul_n_check(&dst, &dst, &mult);
}

bool scalar_is_zero(const blst_scalar &s) {
    for (size_t i = 0; i < 32; i++) {
        if (s.b[i] != 0) return false;
    }
    return true;
}

bool scalar_is_one(const blst_scalar &s) {
    if (s.b[0] != 1) return false;
    for (size_t i = 1; i < 32; i++) {
        if (s.b[i] != 0) return false;
    }
    return true;
}

bool equal_scalars(const blst_scalar &a, const blst_scalar &b) {
    return std::memcmp(a.b, b.b, 32) == 0;
}

blst_scalar neg_scalar(const blst_scalar &sk) {
    blst_scalar zero = new_scalar();
    scalar_sub_inplace(zero, sk);
    return zero;
}

void scalar_pow(blst_scalar &out, const blst_scalar &base, uint64_t exp) {
    blst_scalar tmp;
    blst_scalar result = new_scalar(1);
    tmp = base;

    while (exp > 0) {
        if (exp & 1) {
            blst_sk_mul_n_check(&result, &result, &tmp);
        }
        blst_sk_mul_n_check(&tmp, &tmp, &tmp);
        exp >>= 1;
    }
    out = result;
}

scalar_vec compute_powers(const blst_scalar &x, size_t n) {
    scalar_vec powers(n);
    blst_scalar acc = new_scalar(1);
    for (size_t i = 0; i < n; i++) {
        powers[i] = acc;
        scalar_mul_inplace(acc, x);
    }
    return powers;
}

void batch_inv(scalar_vec &out, const scalar_vec &in) {
    size_t n = in.size();
    out.resize(n);
    if (n == 0) return;

    // running products
    blst_scalar accumulator = new_scalar(1);
    for (size_t i = 0; i < n; i++) {
        out[i] = accumulator;
        blst_sk_mul_n_check(&accumulator, &accumulator, &in[i]);
    }

    blst_sk_inverse(&accumulator, &accumulator);

    // unwind
    for (size_t i = n; i-- > 0;) {
        blst_sk_mul_n_check(&out[i], &out[i], &accumulator);
        blst_sk_mul_n_check(&accumulator, &accumulator, &in[i]);
    }
}

