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

#include "srs.h"
#include "hashing.h"
#include "pippen.h"
#include "utils.h"
#include <algorithm>

// r = H(tag, entropy, |g1|, |g2|, g1s, g2s)
static blst_scalar srs_challenge(const TrustedSetup &setup) {
    BlakeHasher hasher;
    hasher.update_tag(SRS_TAG);

    bytes32 entropy = gen_rand_32();
    hasher.update(entropy.data(), entropy.size());

    hasher.update_u64(setup.g1_monomial.size());
    hasher.update_u64(setup.g2_monomial.size());

    for (auto &g1 : setup.g1_monomial) {
        bytes48 buff = compress_p1_affine(g1);
        hasher.update(buff.data(), buff.size());
    }
    for (auto &g2 : setup.g2_monomial) {
        bytes96 buff = compress_p2_affine(g2);
        hasher.update(buff.data(), buff.size());
    }

    Hash h = new_hash();
    hasher.finalize(h.h);

    blst_scalar r;
    hash_to_scalar(&r, h);
    return r;
}

// SUM( r^i * g2s[offset + i] ), i in [0, count)
static blst_p2 fold_g2(
    const std::vector<blst_p2_affine> &g2s,
    const scalar_vec &powers,
    size_t offset,
    size_t count
) {
    blst_p2 agg = new_p2();
    blst_p2 tmp;
    for (size_t i = 0; i < count; i++) {
        p2_mult(tmp, p2_from_affine(g2s[offset + i]), powers[i]);
        blst_p2_add_or_double(&agg, &agg, &tmp);
    }
    return agg;
}


KZGError check_trusted_setup(const TrustedSetup &setup, size_t num_g1) {
    const auto &g1s = setup.g1_monomial;
    const auto &g2s = setup.g2_monomial;

    if (g1s.empty() || g2s.empty()) return KZGError::EmptySRS;
    if (g1s.size() != num_g1) return KZGError::SRSLengthMismatch;

    // [1]_2 and [s]_2 are both needed to pin down s
    if (g2s.size() < 2) return KZGError::SRSLengthMismatch;

    if (!p1_affine_equal(g1s[0], *blst_p1_affine_generator()))
        return KZGError::MalformedTrustedSetup;
    if (!p2_affine_equal(g2s[0], *blst_p2_affine_generator()))
        return KZGError::MalformedTrustedSetup;

    // s == 0 puts the identity in every later slot and lets
    // e(., [s]_2) vanish from the pairing checks
    for (size_t i = 1; i < g1s.size(); i++)
        if (blst_p1_affine_is_inf(&g1s[i])) return KZGError::MalformedTrustedSetup;
    for (size_t i = 1; i < g2s.size(); i++)
        if (blst_p2_affine_is_inf(&g2s[i])) return KZGError::MalformedTrustedSetup;

    if (g1s.size() == 1) return KZGError::Ok;

    blst_scalar r = srs_challenge(setup);
    size_t pairs = std::max(g1s.size(), g2s.size()) - 1;
    scalar_vec powers = compute_powers(r, pairs);

    // L = SUM( r^i * g1[i+1] ), R = SUM( r^i * g1[i] )
    // g1[i+1] == s * g1[i] for all i  =>  L == s * R
    size_t g1_pairs = g1s.size() - 1;
    std::vector<blst_p1_affine> upper(g1s.begin() + 1, g1s.end());
    std::vector<blst_p1_affine> lower(g1s.begin(), g1s.end() - 1);
    scalar_vec g1_powers(powers.begin(), powers.begin() + g1_pairs);

    blst_p1 L, R;
    {
        PippMan pip;
        pip.mult_p1s(L, g1_powers, upper);
        pip.mult_p1s(R, g1_powers, lower);
    }

    // e(L, [1]_2) == e(R, [s]_2)
    if (!pairings_verify(p1_to_affine(L), g2s[0], p1_to_affine(R), g2s[1]))
        return KZGError::MalformedTrustedSetup;

    // remaining G2 powers against the now trusted [s]_1
    // e([1]_1, SUM r^i g2[i+1]) == e([s]_1, SUM r^i g2[i])
    if (g2s.size() > 2) {
        size_t g2_pairs = g2s.size() - 1;
        blst_p2 L2 = fold_g2(g2s, powers, 1, g2_pairs);
        blst_p2 R2 = fold_g2(g2s, powers, 0, g2_pairs);

        if (!pairings_verify(g1s[0], p2_to_affine(L2), g1s[1], p2_to_affine(R2)))
            return KZGError::MalformedTrustedSetup;
    }

    return KZGError::Ok;
}
