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

#include "polynomial.h"
#include "pippen.h"
#include "utils.h"

// ================== COMMIT POLYNOMIAL ==================

Result<Commitment, KZGError> commit(
    const Polynomial &poly,
    const CommitKey &commit_key
) {
    if (poly.size() != commit_key.size())
        return KZGError::PolynomialLengthMismatch;

    blst_p1 C;
    PippMan pip;
    pip.mult_p1s(C, poly, commit_key);
    return p1_to_affine(C);
}


// ================== QUOTIENT ===========================

Polynomial derive_quotient(
    const Polynomial &poly,
    const blst_scalar &z,
    const blst_scalar &y,
    const Domain &domain,
    std::optional<size_t> m
) {
    size_t len = poly.size();

    Polynomial q(len, new_scalar());
    scalar_vec inverses;
    scalar_vec inverses_in(len);

    for (size_t i = 0; i < len; i++) {
        if (m == i) {
            inverses_in[i] = new_scalar(1);
            continue;
        }

        // (p_i - y) / (w_i - z)
        q[i] = scalar_sub(poly[i], y);
        inverses_in[i] = scalar_sub(domain.roots[i], z);
    }

    batch_inv(inverses, inverses_in);

    for (size_t i = 0; i < len; i++)
        scalar_mul_inplace(q[i], inverses[i]);

    if (!m.has_value()) return q;

    size_t k = *m;
    q[k] = new_scalar();
    blst_scalar tmp;

    for (size_t i = 0; i < len; i++) {
        if (i == k) {
            inverses_in[i] = new_scalar(1);
            continue;
        }
        // z * (z - w_i)
        tmp = scalar_sub(z, domain.roots[i]);
        inverses_in[i] = scalar_mul(tmp, z);
    }

    batch_inv(inverses, inverses_in);

    for (size_t i = 0; i < len; i++) {
        if (i == k) continue;

        // (p_i - y) * w_i / (z * (z - w_i))
        tmp = scalar_sub(poly[i], y);
        scalar_mul_inplace(tmp, domain.roots[i]);
        scalar_mul_inplace(tmp, inverses[i]);
        scalar_add_inplace(q[k], tmp);
    }

    return q;
}
