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

#include "fixtures.h"
#include "hashing.h"
#include "serialize.h"
#include <algorithm>
#include <random>

TrustedSetup insecure_setup(size_t n_g1, size_t n_g2, const blst_scalar &s) {
    TrustedSetup setup;
    setup.g1_monomial.resize(n_g1);
    setup.g2_monomial.resize(n_g2);

    blst_p1 g = *blst_p1_generator();
    blst_p2 h = *blst_p2_generator();
    blst_p1 p1;
    blst_p2 p2;

    // s^0 = 1
    blst_scalar pow_s = new_scalar(1);
    for (size_t i{}; i < std::max(n_g1, n_g2); i++) {
        if (i < n_g1) {
            p1_mult(p1, g, pow_s);
            setup.g1_monomial[i] = p1_to_affine(p1);
        }
        if (i < n_g2) {
            p2_mult(p2, h, pow_s);
            setup.g2_monomial[i] = p2_to_affine(p2);
        }
        scalar_mul_inplace(pow_s, s);
    }
    return setup;
}

void seeded_hash(Hash* out, int i) {
    std::mt19937_64 gen(i);            // 64-bit PRNG
    std::uniform_int_distribution<uint64_t> dist;

    for (i = 0; i < 4; ++i) {        // 4 * 8 bytes = 32 bytes
        uint64_t num = dist(gen);
        for (int j{} ; j < 8; ++j) {
            out->h[i*8 + j] = static_cast<byte>((num >> (8 * j)) & 0xFF);
        }
    }
}

blst_scalar test_secret() {
    Hash hash = new_hash();
    seeded_hash(&hash, 1337);
    blst_scalar s;
    hash_to_scalar(&s, hash);
    return s;
}

Domain make_domain(size_t n) {
    auto d = new_domain(n);
    return d.unwrap();
}

Polynomial seeded_poly(size_t n, int seed) {
    Polynomial p(n);
    Hash hash = new_hash();
    for (size_t i = 0; i < n; i++) {
        seeded_hash(&hash, seed * 100000 + (int)i);
        hash_to_scalar(&p[i], hash);
    }
    return p;
}

blst_scalar sample_point_outside_domain(const Domain &domain, int seed) {
    Hash hash = new_hash();
    blst_scalar z;
    for (int i = seed;; i++) {
        seeded_hash(&hash, -1 - i);
        hash_to_scalar(&z, hash);
        if (!domain.is_in_domain(z)) return z;
    }
}

// f(z) = y, Horner
blst_scalar eval_poly(const scalar_vec &coeffs, const blst_scalar &z) {
    blst_scalar Y = new_scalar();
    for (size_t i = coeffs.size(); i-- > 0;) {
        scalar_mul_inplace(Y, z);
        scalar_add_inplace(Y, coeffs[i]);
    }
    return Y;
}

// Q(x) = (f(x) - f(z)) / (x - z), synthetic division
scalar_vec derive_q(const scalar_vec &coeffs, const blst_scalar &z) {
    size_t n = coeffs.size();
    if (n < 2) return scalar_vec{};

    scalar_vec q(n - 1);
    blst_scalar curr = coeffs[n - 1];
    q[n - 2] = curr;

    for (size_t i = n - 2; i >= 1; i--) {
        // next = (curr * z) + coeffs[i]
        curr = scalar_add(scalar_mul(curr, z), coeffs[i]);
        q[i - 1] = curr;
    }
    return q;
}

std::vector<byte> poly_to_blob(const Polynomial &poly) {
    std::vector<byte> blob;
    blob.reserve(poly.size() * BYTES_PER_SCALAR);
    for (auto &s : poly) {
        bytes32 b = scalar_to_bytes(s);
        blob.insert(blob.end(), b.begin(), b.end());
    }
    return blob;
}
