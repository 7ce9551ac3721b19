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

#include "settings.h"
#include "fft.h"
#include "utils.h"

Result<SetupKeys, KZGError> derive_setup_keys(
    const TrustedSetup &setup,
    Domain &domain,
    bool bit_reversed
) {
    size_t n = domain.cardinality;
    if (setup.g1_monomial.size() < n) return KZGError::SRSLengthMismatch;
    if (setup.g2_monomial.size() < 2) return KZGError::SRSLengthMismatch;

    // natural order twiddles regardless of how the domain is stored
    scalar_vec inv_roots = compute_powers(domain.generator_inv, n);

    std::vector<blst_p1> points(n);
    for (size_t i = 0; i < n; i++)
        points[i] = p1_from_affine(setup.g1_monomial[i]);

    // [s^j]_1 -> [L_i(s)]_1
    inverse_fft_g1(points, inv_roots);

    SetupKeys keys;
    keys.commit_key.resize(n);
    for (size_t i = 0; i < n; i++)
        keys.commit_key[i] = p1_to_affine(points[i]);

    if (domain.bit_reversed != bit_reversed) domain.reverse_order();
    if (bit_reversed) bit_reverse_permutation(keys.commit_key);

    OpeningKey &ok = keys.opening_key;
    ok.gen_g1 = setup.g1_monomial[0];
    ok.gen_g2 = setup.g2_monomial[0];
    ok.alpha_g2 = setup.g2_monomial[1];
    blst_precompute_lines(ok.lines_gen_g2.data(), &ok.gen_g2);
    blst_precompute_lines(ok.lines_alpha_g2.data(), &ok.alpha_g2);

    return keys;
}


bool pairing_lines_product_is_one(
    const blst_p1_affine &a,
    const PairingLines &a_lines,
    const blst_p1_affine &b,
    const PairingLines &b_lines
) {
    blst_fp12 acc = *blst_fp12_one();
    blst_fp12 loop;

    // e(inf, Q) == 1
    if (!blst_p1_affine_is_inf(&a)) {
        blst_miller_loop_lines(&loop, a_lines.data(), &a);
        blst_fp12_mul(&acc, &acc, &loop);
    }
    if (!blst_p1_affine_is_inf(&b)) {
        blst_miller_loop_lines(&loop, b_lines.data(), &b);
        blst_fp12_mul(&acc, &acc, &loop);
    }

    blst_final_exp(&acc, &acc);
    return blst_fp12_is_one(&acc);
}
