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
#include "domain.h"
#include "errors.h"
#include "polynomial.h"
#include "settings.h"
#include <vector>

// Claim that the committed polynomial takes claimed_value at input_point,
// witnessed by a commitment to (f(x) - y) / (x - z)
struct OpeningProof {
    blst_p1_affine quotient_commitment;
    blst_scalar input_point;
    blst_scalar claimed_value;
};

// PolynomialLengthMismatch when poly and key differ in size,
// DomainSizeMismatch when the domain differs from both
Result<OpeningProof, KZGError> open_kzg(
    const Domain &domain,
    const Polynomial &poly,
    const blst_scalar &z,
    const CommitKey &commit_key
);

// Ok or VerificationFailed
KZGError verify_kzg(
    const Commitment &C,
    const OpeningProof &proof,
    const OpeningKey &key
);

// All proofs folded into a single pairing check with random weights.
// Empty input verifies, mismatched lengths give LengthMismatch.
KZGError batch_verify_kzg(
    const std::vector<Commitment> &Cs,
    const std::vector<OpeningProof> &proofs,
    const OpeningKey &key
);
