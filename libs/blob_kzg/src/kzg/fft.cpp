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

#include "fft.h"


void fft_in_place(
    scalar_vec &a,
    const scalar_vec &roots
) {
    size_t n = a.size();

    bit_reverse_permutation(a);

    // Cooley–Tukey butterflies
    for (size_t len{2}; len <= n; len <<= 1) {
        size_t half = len >> 1;
        size_t step = n / len;

        for (size_t i{}; i < n; i += len) {
            size_t root_index{};

            for (size_t k{}; k < half; k++) {
                blst_scalar t = a[i + k + half];
                blst_sk_mul_n_check(&t, &t, &roots[root_index]);

                blst_scalar u = a[i + k];
                blst_sk_add_n_check(&a[i + k], &u, &t);           // a[i+k] = u + t
                blst_sk_sub_n_check(&a[i + k + half], &u, &t);    // a[i+k+half] = u - t

                root_index += step;
            }
        }
    }
}


void inverse_fft_in_place(
    scalar_vec &a,
    const scalar_vec &inv_roots
) {
    fft_in_place(a, inv_roots);

    blst_scalar inv_n = inv_scalar(new_scalar(a.size()));
    for (auto &x : a)
        blst_sk_mul_n_check(&x, &x, &inv_n);
}


void inverse_fft_g1(
    std::vector<blst_p1> &a,
    const scalar_vec &inv_roots
) {
    size_t n = a.size();

    bit_reverse_permutation(a);

    blst_p1 t;
    for (size_t len{2}; len <= n; len <<= 1) {
        size_t half = len >> 1;
        size_t step = n / len;

        for (size_t i{}; i < n; i += len) {
            size_t root_index{};

            for (size_t k{}; k < half; k++) {
                // w^0 == 1
                if (root_index == 0) t = a[i + k + half];
                else p1_mult(t, a[i + k + half], inv_roots[root_index]);

                blst_p1 u = a[i + k];
                blst_p1_add_or_double(&a[i + k], &u, &t);    // a[i+k] = u + t
                p1_sub_inplace(u, t);
                a[i + k + half] = u;                          // a[i+k+half] = u - t

                root_index += step;
            }
        }
    }

    blst_scalar inv_n = inv_scalar(new_scalar(n));
    for (auto &p : a)
        p1_mult(p, p, inv_n);
}
