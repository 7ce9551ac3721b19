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
#include "result.h"
#include "settings.h"

using Commitment = blst_p1_affine;

// C = SUM( poly[i] * commit_key[i] ), both in the same order
Result<Commitment, KZGError> commit(
    const Polynomial &poly,
    const CommitKey &commit_key
);

// Evaluation form of q(x) = (f(x) - y) / (x - z) over the domain.
// index is the position of z in the domain, if it has one, and
// q at that root is recovered from the other evaluations.
Polynomial derive_quotient(
    const Polynomial &poly,
    const blst_scalar &z,
    const blst_scalar &y,
    const Domain &domain,
    std::optional<size_t> index
);
