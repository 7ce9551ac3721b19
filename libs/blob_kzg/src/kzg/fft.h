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
#include "utils.h"
#include <utility>
#include <vector>

// In-place bit-reversal permutation, a.size() must be a power of two
template <typename T>
void bit_reverse_permutation(std::vector<T> &a) {
    size_t n = a.size();
    size_t j{};
    for (size_t i{1}; i < n; i++) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1)
            j ^= bit;
        j ^= bit;
        if (i < j)
            std::swap(a[i], a[j]);
    }
}

// natural order: roots[i] = w^i, roots.size() == a.size()
void fft_in_place(
    scalar_vec &a,
    const scalar_vec &roots
);

void inverse_fft_in_place(
    scalar_vec &a,
    const scalar_vec &inv_roots
);

// Same butterflies over G1, used to move the monomial
// setup [tau^j]_1 into the lagrange basis [L_i(tau)]_1
void inverse_fft_g1(
    std::vector<blst_p1> &a,
    const scalar_vec &inv_roots
);
