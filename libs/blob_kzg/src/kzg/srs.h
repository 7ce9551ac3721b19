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
#include "errors.h"
#include <vector>

// =======================================
// ============= SRS =====================
// =======================================

// Unvalidated setup as loaded from storage:
//   g1_monomial[i] = [s^i]_1
//   g2_monomial[i] = [s^i]_2  (at least [1]_2 and [s]_2)
struct TrustedSetup {
    std::vector<blst_p1_affine> g1_monomial;
    std::vector<blst_p2_affine> g2_monomial;
};

// Checks, without knowing s, that both sequences are powers of the
// same s starting at the fixed generators. num_g1 is the degree bound
// the caller expects the setup to support.
KZGError check_trusted_setup(const TrustedSetup &setup, size_t num_g1);
