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

#include <cassert>
#include <cstdio>
#include "blst.h"
#include "domain.h"
#include "fft.h"
#include "fixtures.h"
#include "tests.h"

static size_t reverse_bits(size_t i, size_t log_n) {
    size_t r = 0;
    for (size_t b = 0; b < log_n; b++)
        if (i & (size_t(1) << b)) r |= size_t(1) << (log_n - 1 - b);
    return r;
}

void test_domain_sizes() {
    printf("TESTING domain sizes round up to powers of two\n");

    assert(new_domain(0).unwrap().cardinality == 1);
    assert(new_domain(1).unwrap().cardinality == 1);
    assert(new_domain(3).unwrap().cardinality == 4);
    assert(new_domain(16).unwrap().cardinality == 16);
    assert(new_domain(17).unwrap().cardinality == 32);

    auto too_big = new_domain((uint64_t(1) << 32) + 1);
    assert(too_big.is_err());
    assert(too_big.unwrap_err() == KZGError::DomainTooLarge);
}

void test_roots() {
    printf("TESTING roots of unity\n");
    const size_t N = 16;
    Domain d = make_domain(N);

    // w^n == 1 and w^(n/2) == -1
    blst_scalar tmp;
    scalar_pow(tmp, d.generator, N);
    assert(scalar_is_one(tmp));
    scalar_pow(tmp, d.generator, N / 2);
    assert(equal_scalars(tmp, neg_scalar(new_scalar(1))));

    for (size_t i = 0; i < N; i++) {
        assert(scalar_is_one(scalar_mul(d.roots[i], d.roots_inv[i])));
        for (size_t j = i + 1; j < N; j++)
            assert(!equal_scalars(d.roots[i], d.roots[j]));
    }

    assert(scalar_is_one(scalar_mul(d.cardinality_inv, new_scalar(N))));

    // order 2 subgroup is {1, -1}
    Domain two = make_domain(2);
    assert(equal_scalars(two.generator, neg_scalar(new_scalar(1))));
}

void test_evaluate_on_domain() {
    printf("TESTING evaluation at a root returns the stored value\n");
    const size_t N = 16;
    Domain d = make_domain(N);
    Polynomial f = seeded_poly(N, 1);

    for (size_t i = 0; i < N; i++) {
        std::optional<size_t> index;
        auto y = d.evaluate(f, d.roots[i], index);
        assert(y.is_ok());
        assert(index.has_value() && *index == i);
        assert(equal_scalars(y.unwrap(), f[i]));
    }

    Polynomial short_f(N - 1, new_scalar(1));
    auto bad = d.evaluate(short_f, new_scalar(5));
    assert(bad.is_err());
    assert(bad.unwrap_err() == KZGError::DomainSizeMismatch);
}

void test_evaluate_off_domain() {
    printf("TESTING barycentric evaluation\n");

    // f(x) = x^2 + x, f(5) = 30, on a domain asked for 3 points
    Domain d4 = new_domain(3).unwrap();
    assert(d4.cardinality == 4);
    Polynomial f(4);
    for (size_t i = 0; i < 4; i++)
        f[i] = scalar_add(scalar_mul(d4.roots[i], d4.roots[i]), d4.roots[i]);

    std::optional<size_t> index;
    auto y = d4.evaluate(f, new_scalar(5), index);
    assert(y.is_ok());
    assert(!index.has_value());
    assert(equal_scalars(y.unwrap(), new_scalar(30)));

    // against coefficient form
    const size_t N = 64;
    Domain d = make_domain(N);
    Polynomial evals = seeded_poly(N, 2);
    scalar_vec coeffs = evals;
    inverse_fft_in_place(coeffs, d.roots_inv);

    for (int k = 0; k < 4; k++) {
        blst_scalar z = sample_point_outside_domain(d, k);
        auto fz = d.evaluate(evals, z);
        assert(fz.is_ok());
        assert(equal_scalars(fz.unwrap(), eval_poly(coeffs, z)));
    }
}

void test_fft_round_trip() {
    printf("TESTING f -> IFFT -> FFT == f\n");
    const size_t N = 256;
    Domain d = make_domain(N);
    Polynomial evals = seeded_poly(N, 3);

    scalar_vec fx = evals;
    inverse_fft_in_place(fx, d.roots_inv);

    // coefficients evaluate back to the same values
    for (size_t i = 0; i < N; i += 37)
        assert(equal_scalars(eval_poly(fx, d.roots[i]), evals[i]));

    fft_in_place(fx, d.roots);
    for (size_t i = 0; i < N; i++)
        assert(equal_scalars(fx[i], evals[i]));
}

void test_bit_reversal() {
    printf("TESTING bit-reversed domain\n");
    const size_t N = 32;
    const size_t LOG_N = 5;
    Domain natural = make_domain(N);
    Domain rev = make_domain(N);
    rev.reverse_order();
    assert(rev.bit_reversed);

    for (size_t i = 0; i < N; i++) {
        size_t j = reverse_bits(i, LOG_N);
        assert(equal_scalars(rev.roots[i], natural.roots[j]));
        assert(equal_scalars(rev.roots_inv[i], natural.roots_inv[j]));
    }

    // same function, permuted storage, same value
    Polynomial f = seeded_poly(N, 4);
    Polynomial f_rev = f;
    bit_reverse_permutation(f_rev);

    blst_scalar z = sample_point_outside_domain(natural, 9);
    auto a = natural.evaluate(f, z);
    auto b = rev.evaluate(f_rev, z);
    assert(a.is_ok() && b.is_ok());
    assert(equal_scalars(a.unwrap(), b.unwrap()));

    // reversing twice restores natural order
    rev.reverse_order();
    assert(!rev.bit_reversed);
    for (size_t i = 0; i < N; i++)
        assert(equal_scalars(rev.roots[i], natural.roots[i]));
}

void test_lagrange_coefficients() {
    printf("TESTING lagrange coefficients\n");
    const size_t N = 16;
    Domain d = make_domain(N);
    Polynomial f = seeded_poly(N, 5);

    // SUM L_i(tau) f_i == f(tau)
    blst_scalar tau = sample_point_outside_domain(d, 3);
    scalar_vec L = d.all_lagrange_coefficients(tau);
    blst_scalar acc = new_scalar();
    blst_scalar sum_L = new_scalar();
    for (size_t i = 0; i < N; i++) {
        scalar_add_inplace(acc, scalar_mul(L[i], f[i]));
        scalar_add_inplace(sum_L, L[i]);
    }
    assert(equal_scalars(acc, d.evaluate(f, tau).unwrap()));
    assert(scalar_is_one(sum_L));

    // tau on the domain gives the indicator vector
    scalar_vec I = d.all_lagrange_coefficients(d.roots[3]);
    for (size_t i = 0; i < N; i++) {
        if (i == 3) assert(scalar_is_one(I[i]));
        else assert(scalar_is_zero(I[i]));
    }

    // follows the storage order
    d.reverse_order();
    scalar_vec L_rev = d.all_lagrange_coefficients(tau);
    for (size_t i = 0; i < N; i++)
        assert(equal_scalars(L_rev[i], L[reverse_bits(i, 4)]));
}

void main_domain() {
    test_domain_sizes();
    test_roots();
    test_evaluate_on_domain();
    test_evaluate_off_domain();
    test_fft_round_trip();
    test_bit_reversal();
    test_lagrange_coefficients();
    printf("=====================================\n");
}
