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

#include <cassert>
#include <cstdio>
#include "blst.h"
#include "fft.h"
#include "fixtures.h"
#include "kzg.h"
#include "polynomial.h"
#include "settings.h"
#include "tests.h"

struct Fixture {
    Domain domain;
    SetupKeys keys;
};

static Fixture build(size_t n, bool bit_reversed) {
    TrustedSetup setup = insecure_setup(n, 2, test_secret());
    Domain domain = make_domain(n);
    auto keys = derive_setup_keys(setup, domain, bit_reversed);
    assert(keys.is_ok());
    return {domain, keys.unwrap()};
}

static blst_p1_affine g1_times(const blst_scalar &s) {
    blst_p1 p;
    p1_mult(p, *blst_p1_generator(), s);
    return p1_to_affine(p);
}


void test_commit_key(bool bit_reversed) {
    printf("TESTING commit key is [L_i(s)]_1 (bit_reversed=%d)\n", bit_reversed);
    const size_t N = 16;
    Fixture f = build(N, bit_reversed);
    assert(f.domain.bit_reversed == bit_reversed);
    assert(f.keys.commit_key.size() == N);

    scalar_vec L = f.domain.all_lagrange_coefficients(test_secret());
    for (size_t i = 0; i < N; i++)
        assert(p1_affine_equal(f.keys.commit_key[i], g1_times(L[i])));

    // C == [f(s)]_1
    Polynomial poly = seeded_poly(N, 10);
    auto C = commit(poly, f.keys.commit_key);
    assert(C.is_ok());
    blst_scalar fs = f.domain.evaluate(poly, test_secret()).unwrap();
    assert(p1_affine_equal(C.unwrap(), g1_times(fs)));

    Polynomial short_poly(N - 1, new_scalar(1));
    auto bad = commit(short_poly, f.keys.commit_key);
    assert(bad.is_err());
    assert(bad.unwrap_err() == KZGError::PolynomialLengthMismatch);

    auto bad_open = open_kzg(f.domain, short_poly, new_scalar(3), f.keys.commit_key);
    assert(bad_open.is_err());
    assert(bad_open.unwrap_err() == KZGError::PolynomialLengthMismatch);

    // poly and key agree but the domain is larger
    Fixture small = build(N / 2, bit_reversed);
    Polynomial half = seeded_poly(N / 2, 14);
    auto wrong_domain = open_kzg(f.domain, half, new_scalar(3), small.keys.commit_key);
    assert(wrong_domain.is_err());
    assert(wrong_domain.unwrap_err() == KZGError::DomainSizeMismatch);
}

void test_quotient() {
    printf("TESTING quotient against synthetic division\n");
    const size_t N = 16;
    Domain d = make_domain(N);
    Polynomial evals = seeded_poly(N, 11);
    scalar_vec coeffs = evals;
    inverse_fft_in_place(coeffs, d.roots_inv);

    auto check = [&](const blst_scalar &z) {
        blst_scalar y = eval_poly(coeffs, z);
        Polynomial q = derive_quotient(evals, z, y, d, d.find_index(z));

        scalar_vec qc = derive_q(coeffs, z);
        qc.resize(N, new_scalar());
        fft_in_place(qc, d.roots);

        for (size_t i = 0; i < N; i++)
            assert(equal_scalars(q[i], qc[i]));
    };

    check(sample_point_outside_domain(d, 1));
    for (size_t k = 0; k < N; k++)
        check(d.roots[k]);
}

void test_open_verify(bool bit_reversed) {
    printf("TESTING open -> verify (bit_reversed=%d)\n", bit_reversed);
    const size_t N = 16;
    Fixture f = build(N, bit_reversed);
    const OpeningKey &ok = f.keys.opening_key;

    Polynomial poly = seeded_poly(N, 12);
    Commitment C = commit(poly, f.keys.commit_key).unwrap();

    // off the domain
    blst_scalar z = sample_point_outside_domain(f.domain, 5);
    OpeningProof proof = open_kzg(f.domain, poly, z, f.keys.commit_key).unwrap();
    assert(equal_scalars(proof.claimed_value, f.domain.evaluate(poly, z).unwrap()));
    assert(verify_kzg(C, proof, ok) == KZGError::Ok);

    OpeningProof fake = proof;
    scalar_add_inplace(fake.claimed_value, new_scalar(1));
    assert(verify_kzg(C, fake, ok) == KZGError::VerificationFailed);

    fake = proof;
    fake.input_point = sample_point_outside_domain(f.domain, 6);
    assert(verify_kzg(C, fake, ok) == KZGError::VerificationFailed);

    // every root
    for (size_t i = 0; i < N; i++) {
        OpeningProof p = open_kzg(f.domain, poly, f.domain.roots[i], f.keys.commit_key).unwrap();
        assert(equal_scalars(p.claimed_value, poly[i]));
        assert(verify_kzg(C, p, ok) == KZGError::Ok);
    }

    // proof for another polynomial
    Polynomial other = seeded_poly(N, 13);
    OpeningProof wrong = open_kzg(f.domain, other, z, f.keys.commit_key).unwrap();
    assert(verify_kzg(C, wrong, ok) == KZGError::VerificationFailed);
}

void test_constant_polynomial() {
    printf("TESTING constant polynomial opens with the identity\n");
    const size_t N = 8;
    Fixture f = build(N, true);

    blst_scalar c = new_scalar(42);
    Polynomial poly(N, c);
    Commitment C = commit(poly, f.keys.commit_key).unwrap();
    assert(p1_affine_equal(C, g1_times(c)));

    blst_scalar z = sample_point_outside_domain(f.domain, 2);
    OpeningProof proof = open_kzg(f.domain, poly, z, f.keys.commit_key).unwrap();
    assert(blst_p1_affine_is_inf(&proof.quotient_commitment));
    assert(equal_scalars(proof.claimed_value, c));
    assert(verify_kzg(C, proof, f.keys.opening_key) == KZGError::Ok);

    // zero polynomial commits to the identity
    Polynomial zero(N, new_scalar());
    Commitment Z = commit(zero, f.keys.commit_key).unwrap();
    assert(blst_p1_affine_is_inf(&Z));
    OpeningProof zp = open_kzg(f.domain, zero, z, f.keys.commit_key).unwrap();
    assert(verify_kzg(Z, zp, f.keys.opening_key) == KZGError::Ok);
}

void test_batch_verify() {
    printf("TESTING batch verify\n");
    const size_t N = 16;
    const size_t K = 6;
    Fixture f = build(N, true);
    const OpeningKey &ok = f.keys.opening_key;

    std::vector<Commitment> Cs;
    std::vector<OpeningProof> proofs;
    for (size_t i = 0; i < K; i++) {
        Polynomial poly = seeded_poly(N, 20 + (int)i);
        Cs.push_back(commit(poly, f.keys.commit_key).unwrap());

        // mix points on and off the domain
        blst_scalar z = (i % 2 == 0)
            ? sample_point_outside_domain(f.domain, (int)i)
            : f.domain.roots[i];
        proofs.push_back(open_kzg(f.domain, poly, z, f.keys.commit_key).unwrap());
    }

    assert(batch_verify_kzg(Cs, proofs, ok) == KZGError::Ok);

    // any one bad claim spoils the batch
    for (size_t i = 0; i < K; i++) {
        auto bad = proofs;
        scalar_add_inplace(bad[i].claimed_value, new_scalar(1));
        assert(batch_verify_kzg(Cs, bad, ok) == KZGError::VerificationFailed);

        bad = proofs;
        bad[i].quotient_commitment = proofs[(i + 1) % K].quotient_commitment;
        assert(batch_verify_kzg(Cs, bad, ok) == KZGError::VerificationFailed);
    }

    // swapped commitments
    auto swapped = Cs;
    std::swap(swapped[0], swapped[1]);
    assert(batch_verify_kzg(swapped, proofs, ok) == KZGError::VerificationFailed);

    // empty, and a single pair agrees with verify_kzg either way
    assert(batch_verify_kzg({}, {}, ok) == KZGError::Ok);

    OpeningProof forged = proofs[0];
    scalar_add_inplace(forged.claimed_value, new_scalar(1));
    for (const OpeningProof &p : {proofs[0], forged}) {
        KZGError single = verify_kzg(Cs[0], p, ok);
        assert(batch_verify_kzg({Cs[0]}, {p}, ok) == single);
    }
    assert(verify_kzg(Cs[0], proofs[0], ok) == KZGError::Ok);
    assert(verify_kzg(Cs[0], forged, ok) == KZGError::VerificationFailed);

    std::vector<Commitment> short_Cs(Cs.begin(), Cs.end() - 1);
    assert(batch_verify_kzg(short_Cs, proofs, ok) == KZGError::LengthMismatch);
}

void main_kzg() {
    test_commit_key(false);
    test_commit_key(true);
    test_quotient();
    test_open_verify(false);
    test_open_verify(true);
    test_constant_polynomial();
    test_batch_verify();
    printf("=====================================\n");
}
