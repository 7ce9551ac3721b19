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

#include "domain.h"
#include "fft.h"

// 2^32-th root of unity
// 10238227357739495823651030575849232062558860180284477541189508159991286009131
static blst_scalar max_order_root() {
    const uint64_t limbs[4] = {
        0x3829971f439f0d2b,
        0xb63683508c2280b9,
        0xd09b681922c813b4,
        0x16a2a19edfe81f20
    };
    blst_scalar s;
    blst_scalar_from_uint64(&s, limbs);
    return s;
}

Result<Domain, KZGError> new_domain(uint64_t m) {
    uint64_t x = 1;
    uint64_t logx = 0;
    while (x < m) {
        if (logx == MAX_ORDER_ROOT) return KZGError::DomainTooLarge;
        x <<= 1;
        logx++;
    }

    Domain d;
    d.cardinality = x;

    // w = root^(2^(32 - log(x))) has order x
    blst_scalar w = max_order_root();
    for (uint64_t i = logx; i < MAX_ORDER_ROOT; i++)
        scalar_mul_inplace(w, w);

    d.generator = w;
    d.generator_inv = inv_scalar(w);
    d.cardinality_inv = inv_scalar(new_scalar(x));

    d.roots = compute_powers(d.generator, x);
    d.roots_inv = compute_powers(d.generator_inv, x);

    return d;
}


std::optional<size_t> Domain::find_index(const blst_scalar &point) const {
    for (size_t i = 0; i < roots.size(); i++) {
        if (equal_scalars(point, roots[i])) return i;
    }
    return std::nullopt;
}

bool Domain::is_in_domain(const blst_scalar &point) const {
    return find_index(point).has_value();
}


Result<blst_scalar, KZGError> Domain::evaluate(
    const Polynomial &poly,
    const blst_scalar &point
) const {
    std::optional<size_t> index;
    return evaluate(poly, point, index);
}

Result<blst_scalar, KZGError> Domain::evaluate(
    const Polynomial &poly,
    const blst_scalar &point,
    std::optional<size_t> &index
) const {
    if (poly.size() != cardinality) return KZGError::DomainSizeMismatch;

    // on the domain the evaluation is just the entry
    index = find_index(point);
    if (index.has_value()) return poly[*index];

    // 1 / (z - w_i), none are zero off the domain
    scalar_vec denom(cardinality);
    for (size_t i = 0; i < cardinality; i++)
        blst_sk_sub_n_check(&denom[i], &point, &roots[i]);

    scalar_vec inv_denom;
    batch_inv(inv_denom, denom);

    // SUM( f_i * w_i / (z - w_i) )
    blst_scalar result = new_scalar();
    blst_scalar tmp;
    for (size_t i = 0; i < cardinality; i++) {
        blst_sk_mul_n_check(&tmp, &poly[i], &roots[i]);
        blst_sk_mul_n_check(&tmp, &tmp, &inv_denom[i]);
        scalar_add_inplace(result, tmp);
    }

    // result * (z^n - 1) * 1/n
    scalar_pow(tmp, point, cardinality);
    scalar_sub_inplace(tmp, new_scalar(1));
    scalar_mul_inplace(tmp, cardinality_inv);
    scalar_mul_inplace(result, tmp);

    return result;
}


scalar_vec Domain::all_lagrange_coefficients(const blst_scalar &tau) const {
    scalar_vec u(cardinality, new_scalar());

    blst_scalar t_size;
    scalar_pow(t_size, tau, cardinality);

    // tau is a root, L_i(tau) is 1 at its index and 0 elsewhere
    if (scalar_is_one(t_size)) {
        for (size_t i = 0; i < cardinality; i++) {
            if (equal_scalars(roots[i], tau)) {
                u[i] = new_scalar(1);
                break;
            }
        }
        return u;
    }

    // L_i(tau) = (tau^n - 1)/n * w_i / (tau - w_i)
    blst_scalar l = scalar_sub(t_size, new_scalar(1));
    scalar_mul_inplace(l, cardinality_inv);

    scalar_vec denom(cardinality);
    for (size_t i = 0; i < cardinality; i++)
        blst_sk_sub_n_check(&denom[i], &tau, &roots[i]);

    batch_inv(u, denom);

    for (size_t i = 0; i < cardinality; i++) {
        scalar_mul_inplace(u[i], roots[i]);
        scalar_mul_inplace(u[i], l);
    }
    return u;
}


void Domain::reverse_order() {
    bit_reverse_permutation(roots);
    bit_reverse_permutation(roots_inv);
    bit_reversed = !bit_reversed;
}
