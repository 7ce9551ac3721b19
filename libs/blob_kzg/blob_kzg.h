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
#include "kzg.h"
#include "result.h"
#include "settings.h"
#include "srs.h"
#include "utils.h"
#include <span>
#include <string>
#include <vector>

// Fiat-Shamir oracle: (blob bytes, compressed commitment) -> evaluation point
using ChallengeFn = blst_scalar (*)(std::span<const byte> blob, const bytes48 &commitment);

// BLAKE3 over tag, blob length in scalars, blob, commitment
blst_scalar compute_challenge(std::span<const byte> blob, const bytes48 &commitment);

struct ContextConfig {
    size_t domain_size = 4096;
    bool bit_reversed = true;
    ChallengeFn challenge = compute_challenge;
};

struct ProofAndValue {
    bytes48 proof;
    bytes32 y;
};

// Validated setup, domain and derived keys. Immutable once created,
// so a single context can serve any number of threads.
class KZGContext {
public:
    static Result<KZGContext, KZGError> create(
        const TrustedSetup &setup,
        ContextConfig config = {}
    );
    static Result<KZGContext, KZGError> from_file(
        const std::string &path,
        ContextConfig config = {}
    );

    const Domain& domain() const { return domain_; }
    const SetupKeys& keys() const { return keys_; }
    const ContextConfig& config() const { return config_; }

    // bytes per blob, 32 per evaluation
    size_t blob_size() const;

    Result<bytes48, KZGError> blob_to_commitment(std::span<const byte> blob) const;

    Result<ProofAndValue, KZGError> compute_kzg_proof(
        std::span<const byte> blob,
        const bytes32 &z
    ) const;

    // opens at the challenge derived from blob and commitment
    Result<bytes48, KZGError> compute_blob_kzg_proof(
        std::span<const byte> blob,
        const bytes48 &commitment
    ) const;

    KZGError verify_kzg_proof(
        const bytes48 &commitment,
        const bytes32 &z,
        const bytes32 &y,
        const bytes48 &proof
    ) const;

    KZGError verify_blob_kzg_proof(
        std::span<const byte> blob,
        const bytes48 &commitment,
        const bytes48 &proof
    ) const;

    KZGError verify_blob_kzg_proof_batch(
        const std::vector<std::span<const byte>> &blobs,
        const std::vector<bytes48> &commitments,
        const std::vector<bytes48> &proofs
    ) const;

private:
    KZGContext(Domain domain, SetupKeys keys, ContextConfig config);

    Domain domain_;
    SetupKeys keys_;
    ContextConfig config_;
};
