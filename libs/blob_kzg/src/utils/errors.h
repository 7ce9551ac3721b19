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

enum class KZGError : int {
    Ok = 0,

    // malformed bytes: point off curve / out of subgroup, scalar >= r, wrong length
    DeserializationError,

    // caller passed collections of inconsistent length
    DomainSizeMismatch,
    PolynomialLengthMismatch,
    LengthMismatch,

    // requested domain exceeds the 2-adicity of the scalar field
    DomainTooLarge,

    // trusted setup rejected, fatal to context construction
    EmptySRS,
    SRSLengthMismatch,
    MalformedTrustedSetup,
    SetupFileError,

    // a well-formed proof that does not verify
    VerificationFailed,
};

const char* error_str(KZGError err);
