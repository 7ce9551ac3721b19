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
#include <vector>
#include "blst.h"
#include "domain.h"
#include "hashing.h"
#include "srs.h"
#include "utils.h"

// Deterministic setup from a known secret. Only for tests, anyone
// holding s can forge openings.
TrustedSetup insecure_setup(size_t n_g1, size_t n_g2, const blst_scalar &s);

// deterministic 32 bytes from a seed
void seeded_hash(Hash* out, int i);

// fixed secret shared by the suites
blst_scalar test_secret();

Domain make_domain(size_t n);

// seeded evaluations, reproducible across runs
Polynomial seeded_poly(size_t n, int seed);

// canonical scalar that is not a root of the domain
blst_scalar sample_point_outside_domain(const Domain &domain, int seed);

// coefficient form helpers
blst_scalar eval_poly(const scalar_vec &coeffs, const blst_scalar &z);
scalar_vec derive_q(const scalar_vec &coeffs, const blst_scalar &z);

std::vector<byte> poly_to_blob(const Polynomial &poly);
