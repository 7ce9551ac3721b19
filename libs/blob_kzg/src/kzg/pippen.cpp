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

#include "pippen.h"
#include <cstdlib>
#include <new>

// below this many points the plain double-and-add loop wins
const size_t PIPPENGER_THRESHOLD = 8;

// =====================================================
// ============= CONSTRUCT / DESTRUCT ==================
// =====================================================

PippMan::~PippMan() {
    free_scratch_space();
}

// ==============================================
// ============= SCRATCH_SPACE ==================
// ==============================================

void PippMan::new_scratch_space(size_t n) {
    size_t needed = blst_p1s_mult_pippenger_scratch_sizeof(n);
    if (scratch_size < needed) {
        free_scratch_space();
        scratch_space = (limb_t*)malloc(needed);
        if (scratch_space == nullptr) throw std::bad_alloc();
        scratch_size = needed;
    }
}

void PippMan::free_scratch_space() {
    scratch_size = 0;
    free(scratch_space);
    scratch_space = nullptr;
}


// =================================================
// ============= POINTS N SCALARS ==================
// =================================================

// blst's pippenger does not accept points at infinity,
// they contribute nothing so they are skipped here
void PippMan::fill(const scalar_vec& scalars, const vector<blst_p1_affine>& points) {
    scalar_ptrs.clear();
    point_ptrs.clear();
    scalar_ptrs.reserve(points.size());
    point_ptrs.reserve(points.size());

    for (size_t i = 0; i < points.size(); i++) {
        if (blst_p1_affine_is_inf(&points[i])) continue;
        point_ptrs.push_back(&points[i]);
        scalar_ptrs.push_back(scalars[i].b);
    }
}


// ==============================================
// ============= FUNCTIONALITY ==================
// ==============================================

void PippMan::mult_p1s(
    blst_p1 &agg,
    const scalar_vec& scalars,
    const vector<blst_p1_affine>& points
) {
    agg = new_p1();
    fill(scalars, points);
    size_t n = point_ptrs.size();
    if (n == 0) return;

    if (n < PIPPENGER_THRESHOLD) {
        blst_p1 tmp;
        for (size_t i = 0; i < n; i++) {
            blst_p1 p = p1_from_affine(*point_ptrs[i]);
            blst_p1_mult(&tmp, &p, scalar_ptrs[i], SCALAR_BITS);
            blst_p1_add_or_double(&agg, &agg, &tmp);
        }
        return;
    }

    new_scratch_space(n);
    blst_p1s_mult_pippenger(
        &agg,
        point_ptrs.data(),
        n,
        scalar_ptrs.data(),
        SCALAR_BITS,
        scratch_space);
}
