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
#include <cstddef>
#include <vector>

using std::vector;

// =======================================
// ============== PIPPENGER ==============
// =======================================

// Multi-scalar multiplication over G1. Owns its scratch space,
// so create one per call and never share it between threads.
class PippMan {
public:
    PippMan() = default;
    ~PippMan();

    PippMan(const PippMan&) = delete;
    PippMan& operator=(const PippMan&) = delete;

    // agg = SUM( scalars[i] * points[i] )
    void mult_p1s(
        blst_p1 &agg,
        const scalar_vec& scalars,
        const vector<blst_p1_affine>& points);

private:
    limb_t *scratch_space = nullptr;
    size_t scratch_size = 0;
    vector<const byte*> scalar_ptrs;
    vector<const blst_p1_affine*> point_ptrs;

    void fill(const scalar_vec& scalars, const vector<blst_p1_affine>& points);
    void new_scratch_space(size_t n);
    void free_scratch_space();
};
