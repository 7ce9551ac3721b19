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

#include "blob_kzg.h"
#include "hashing.h"
#include "serialize.h"
#include "setup_file.h"

blst_scalar compute_challenge(std::span<const byte> blob, const bytes48 &commitment) {
    BlakeHasher hasher;
    hasher.update_tag(CHALLENGE_TAG);
    hasher.update_u64(blob.size() / BYTES_PER_SCALAR);
    hasher.update(blob.data(), blob.size());
    hasher.update(commitment.data(), commitment.size());

    Hash h = new_hash();
    hasher.finalize(h.h);

    blst_scalar z;
    hash_to_scalar(&z, h);
    return z;
}


// ==============================================
// =============== CONSTRUCTION =================
// ==============================================

KZGContext::KZGContext(Domain domain, SetupKeys keys, ContextConfig config)
    : domain_(std::move(domain)),
      keys_(std::move(keys)),
      config_(config) {
    if (config_.challenge == nullptr) config_.challenge = compute_challenge;
}

Result<KZGContext, KZGError> KZGContext::create(
    const TrustedSetup &setup,
    ContextConfig config
) {
    auto d = new_domain(config.domain_size);
    if (d.is_err()) return d.unwrap_err();
    Domain domain = std::move(d.unwrap());

    KZGError err = check_trusted_setup(setup, domain.cardinality);
    if (err != KZGError::Ok) return err;

    auto keys = derive_setup_keys(setup, domain, config.bit_reversed);
    if (keys.is_err()) return keys.unwrap_err();

    return KZGContext(std::move(domain), std::move(keys.unwrap()), config);
}

Result<KZGContext, KZGError> KZGContext::from_file(
    const std::string &path,
    ContextConfig config
) {
    auto setup = load_trusted_setup(path);
    if (setup.is_err()) return setup.unwrap_err();
    return create(setup.unwrap(), config);
}

size_t KZGContext::blob_size() const {
    return domain_.cardinality * BYTES_PER_SCALAR;
}


// ==============================================
// ================= PROVER =====================
// ==============================================

Result<bytes48, KZGError> KZGContext::blob_to_commitment(std::span<const byte> blob) const {
    auto poly = blob_to_polynomial(blob, domain_.cardinality);
    if (poly.is_err()) return poly.unwrap_err();

    auto C = commit(poly.unwrap(), keys_.commit_key);
    if (C.is_err()) return C.unwrap_err();
    return g1_to_bytes(C.unwrap());
}

Result<ProofAndValue, KZGError> KZGContext::compute_kzg_proof(
    std::span<const byte> blob,
    const bytes32 &z
) const {
    auto poly = blob_to_polynomial(blob, domain_.cardinality);
    if (poly.is_err()) return poly.unwrap_err();

    auto point = scalar_from_bytes(z);
    if (point.is_err()) return point.unwrap_err();

    auto proof = open_kzg(domain_, poly.unwrap(), point.unwrap(), keys_.commit_key);
    if (proof.is_err()) return proof.unwrap_err();

    ProofAndValue out;
    out.proof = g1_to_bytes(proof.unwrap().quotient_commitment);
    out.y = scalar_to_bytes(proof.unwrap().claimed_value);
    return out;
}

Result<bytes48, KZGError> KZGContext::compute_blob_kzg_proof(
    std::span<const byte> blob,
    const bytes48 &commitment
) const {
    auto poly = blob_to_polynomial(blob, domain_.cardinality);
    if (poly.is_err()) return poly.unwrap_err();

    // only decoded to reject malformed commitments
    auto C = g1_from_bytes(commitment);
    if (C.is_err()) return C.unwrap_err();

    blst_scalar z = config_.challenge(blob, commitment);

    auto proof = open_kzg(domain_, poly.unwrap(), z, keys_.commit_key);
    if (proof.is_err()) return proof.unwrap_err();
    return g1_to_bytes(proof.unwrap().quotient_commitment);
}


// ==============================================
// ================ VERIFIER ====================
// ==============================================

KZGError KZGContext::verify_kzg_proof(
    const bytes48 &commitment,
    const bytes32 &z,
    const bytes32 &y,
    const bytes48 &proof
) const {
    auto C = g1_from_bytes(commitment);
    if (C.is_err()) return C.unwrap_err();
    auto Q = g1_from_bytes(proof);
    if (Q.is_err()) return Q.unwrap_err();
    auto point = scalar_from_bytes(z);
    if (point.is_err()) return point.unwrap_err();
    auto value = scalar_from_bytes(y);
    if (value.is_err()) return value.unwrap_err();

    OpeningProof op{Q.unwrap(), point.unwrap(), value.unwrap()};
    return verify_kzg(C.unwrap(), op, keys_.opening_key);
}

// decodes one blob triple into the claim it makes at its challenge
static KZGError blob_claim(
    const KZGContext &ctx,
    std::span<const byte> blob,
    const bytes48 &commitment,
    const bytes48 &proof,
    Commitment &C,
    OpeningProof &op
) {
    auto poly = blob_to_polynomial(blob, ctx.domain().cardinality);
    if (poly.is_err()) return poly.unwrap_err();
    auto c = g1_from_bytes(commitment);
    if (c.is_err()) return c.unwrap_err();
    auto q = g1_from_bytes(proof);
    if (q.is_err()) return q.unwrap_err();

    blst_scalar z = ctx.config().challenge(blob, commitment);
    auto y = ctx.domain().evaluate(poly.unwrap(), z);
    if (y.is_err()) return y.unwrap_err();

    C = c.unwrap();
    op = OpeningProof{q.unwrap(), z, y.unwrap()};
    return KZGError::Ok;
}

KZGError KZGContext::verify_blob_kzg_proof(
    std::span<const byte> blob,
    const bytes48 &commitment,
    const bytes48 &proof
) const {
    Commitment C;
    OpeningProof op;
    KZGError err = blob_claim(*this, blob, commitment, proof, C, op);
    if (err != KZGError::Ok) return err;

    return verify_kzg(C, op, keys_.opening_key);
}

KZGError KZGContext::verify_blob_kzg_proof_batch(
    const std::vector<std::span<const byte>> &blobs,
    const std::vector<bytes48> &commitments,
    const std::vector<bytes48> &proofs
) const {
    if (blobs.size() != commitments.size() || blobs.size() != proofs.size())
        return KZGError::LengthMismatch;

    std::vector<Commitment> Cs(blobs.size());
    std::vector<OpeningProof> ops(blobs.size());

    for (size_t i = 0; i < blobs.size(); i++) {
        KZGError err = blob_claim(*this, blobs[i], commitments[i], proofs[i], Cs[i], ops[i]);
        if (err != KZGError::Ok) return err;
    }

    return batch_verify_kzg(Cs, ops, keys_.opening_key);
}
