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
#include "errors.h"
#include "result.h"
#include "utils.h"
#include <optional>

// evaluations at roots[i], not coefficients
using Polynomial = scalar_vec;

// 2-adicity of the BLS12-381 scalar field
const uint64_t MAX_ORDER_ROOT = 32;

// Multiplicative subgroup of order `cardinality` with every
// root and its inverse precomputed.
class Domain {
public:
    uint64_t cardinality;
    blst_scalar cardinality_inv;

    // generator of the subgroup, not of the whole field
    blst_scalar generator;
    blst_scalar generator_inv;

    // roots[i] = generator^i until reverse_order() is applied
    scalar_vec roots;
    scalar_vec roots_inv;

    bool bit_reversed = false;

    // first i with roots[i] == point
    std::optional<size_t> find_index(const blst_scalar &point) const;
    bool is_in_domain(const blst_scalar &point) const;

    // f(point) for f in evaluation form
    Result<blst_scalar, KZGError> evaluate(
        const Polynomial &poly,
        const blst_scalar &point
    ) const;

    // same, also reports the domain index of `point` if it has one
    Result<blst_scalar, KZGError> evaluate(
        const Polynomial &poly,
        const blst_scalar &point,
        std::optional<size_t> &index
    ) const;

    // [L_0(tau), ..., L_{n-1}(tau)] where L_i is the lagrange
    // basis polynomial of roots[i]
    scalar_vec all_lagrange_coefficients(const blst_scalar &tau) const;

    void reverse_order();
};

// smallest power of two >= m, 1 when m == 0
Result<Domain, KZGError> new_domain(uint64_t m);
