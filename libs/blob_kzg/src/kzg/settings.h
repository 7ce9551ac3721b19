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
#include <array>
#include <vector>
#include "blst.h"
#include "domain.h"
#include "errors.h"
#include "result.h"
#include "srs.h"

// commit_key[i] = [L_i(s)]_1, indexed like domain.roots
using CommitKey = std::vector<blst_p1_affine>;

// blst precomputed miller loop lines for a fixed G2 point
using PairingLines = std::array<blst_fp6, 68>;

struct OpeningKey {
    blst_p1_affine gen_g1;
    blst_p2_affine gen_g2;
    blst_p2_affine alpha_g2;    // [s]_2

    PairingLines lines_gen_g2;
    PairingLines lines_alpha_g2;
};

struct SetupKeys {
    CommitKey commit_key;
    OpeningKey opening_key;
};

// Lagrange form commit key and opening key from a validated setup.
// On return the domain and the commit key share the same ordering,
// bit-reversed when `bit_reversed` is set.
Result<SetupKeys, KZGError> derive_setup_keys(
    const TrustedSetup &setup,
    Domain &domain,
    bool bit_reversed
);

// e(a, A) * e(b, B) == 1 with A, B given by their lines
bool pairing_lines_product_is_one(
    const blst_p1_affine &a,
    const PairingLines &a_lines,
    const blst_p1_affine &b,
    const PairingLines &b_lines
);
