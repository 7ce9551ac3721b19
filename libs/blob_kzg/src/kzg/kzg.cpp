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

#include "kzg.h"
#include "hashing.h"
#include "pippen.h"
#include "utils.h"

// ======================================================
// ====================== OPEN ==========================
// ======================================================

Result<OpeningProof, KZGError> open_kzg(
    const Domain &domain,
    const Polynomial &poly,
    const blst_scalar &z,
    const CommitKey &commit_key
) {
    if (poly.size() != commit_key.size())
        return KZGError::PolynomialLengthMismatch;

    std::optional<size_t> index;
    auto y = domain.evaluate(poly, z, index);
    if (y.is_err()) return y.unwrap_err();

    OpeningProof proof;
    proof.input_point = z;
    proof.claimed_value = y.unwrap();

    Polynomial q = derive_quotient(poly, z, proof.claimed_value, domain, index);

    blst_p1 Q;
    PippMan pip;
    pip.mult_p1s(Q, q, commit_key);
    proof.quotient_commitment = p1_to_affine(Q);

    return proof;
}


// ======================================================
// ================= VERIFY SINGLE ======================
// ======================================================

KZGError verify_kzg(
    const Commitment &C,
    const OpeningProof &proof,
    const OpeningKey &key
) {
    // T = [y]_1 + [-z]Q - C = -[s]Q for an honest proof
    blst_p1 T;
    {
        scalar_vec scalars = {proof.claimed_value, neg_scalar(proof.input_point)};
        std::vector<blst_p1_affine> points = {key.gen_g1, proof.quotient_commitment};
        PippMan pip;
        pip.mult_p1s(T, scalars, points);
    }
    p1_sub_inplace(T, p1_from_affine(C));

    // e(T, [1]_2) * e(Q, [s]_2) == 1
    bool ok = pairing_lines_product_is_one(
        p1_to_affine(T), key.lines_gen_g2,
        proof.quotient_commitment, key.lines_alpha_g2
    );
    return ok ? KZGError::Ok : KZGError::VerificationFailed;
}


// ======================================================
// ================= VERIFY BATCH =======================
// ======================================================

// r = H(tag, entropy, n, (C, Q, z, y)...)
static blst_scalar batch_challenge(
    const std::vector<Commitment> &Cs,
    const std::vector<OpeningProof> &proofs
) {
    BlakeHasher hasher;
    hasher.update_tag(BATCH_TAG);

    bytes32 entropy = gen_rand_32();
    hasher.update(entropy.data(), entropy.size());
    hasher.update_u64(Cs.size());

    bytes48 buff;
    for (size_t i = 0; i < Cs.size(); i++) {
        buff = compress_p1_affine(Cs[i]);
        hasher.update(buff.data(), buff.size());
        buff = compress_p1_affine(proofs[i].quotient_commitment);
        hasher.update(buff.data(), buff.size());

        bytes32 sc;
        blst_bendian_from_scalar(sc.data(), &proofs[i].input_point);
        hasher.update(sc.data(), sc.size());
        blst_bendian_from_scalar(sc.data(), &proofs[i].claimed_value);
        hasher.update(sc.data(), sc.size());
    }

    Hash h = new_hash();
    hasher.finalize(h.h);

    blst_scalar r;
    hash_to_scalar(&r, h);
    return r;
}

KZGError batch_verify_kzg(
    const std::vector<Commitment> &Cs,
    const std::vector<OpeningProof> &proofs,
    const OpeningKey &key
) {
    if (Cs.size() != proofs.size()) return KZGError::LengthMismatch;
    size_t n = Cs.size();
    if (n == 0) return KZGError::Ok;
    if (n == 1) return verify_kzg(Cs[0], proofs[0], key);

    blst_scalar r = batch_challenge(Cs, proofs);
    if (scalar_is_zero(r)) return KZGError::VerificationFailed;
    scalar_vec weights = compute_powers(r, n);

    std::vector<blst_p1_affine> Qs(n);
    scalar_vec zw(n);
    blst_scalar folded_y = new_scalar();

    for (size_t i = 0; i < n; i++) {
        Qs[i] = proofs[i].quotient_commitment;
        zw[i] = scalar_mul(weights[i], proofs[i].input_point);
        scalar_add_inplace(folded_y, scalar_mul(weights[i], proofs[i].claimed_value));
    }

    blst_p1 folded_Q, folded_C, folded_ZQ, tmp;
    {
        PippMan pip;
        pip.mult_p1s(folded_Q, weights, Qs);
        pip.mult_p1s(folded_C, weights, Cs);
        pip.mult_p1s(folded_ZQ, zw, Qs);
    }

    // T = folded_C - [folded_y]_1 + folded_ZQ
    blst_p1 T = folded_C;
    p1_mult(tmp, p1_from_affine(key.gen_g1), folded_y);
    p1_sub_inplace(T, tmp);
    blst_p1_add_or_double(&T, &T, &folded_ZQ);

    blst_p1_cneg(&folded_Q, true);

    // e(T, [1]_2) * e(-folded_Q, [s]_2) == 1
    bool ok = pairing_lines_product_is_one(
        p1_to_affine(T), key.lines_gen_g2,
        p1_to_affine(folded_Q), key.lines_alpha_g2
    );
    return ok ? KZGError::Ok : KZGError::VerificationFailed;
}
