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

#include "errors.h"

const char* error_str(KZGError err) {
    switch (err) {
        case KZGError::Ok:                       return "Ok";
        case KZGError::DeserializationError:     return "DeserializationError";
        case KZGError::DomainSizeMismatch:       return "DomainSizeMismatch";
        case KZGError::PolynomialLengthMismatch: return "PolynomialLengthMismatch";
        case KZGError::LengthMismatch:           return "LengthMismatch";
        case KZGError::DomainTooLarge:           return "DomainTooLarge";
        case KZGError::EmptySRS:                 return "EmptySRS";
        case KZGError::SRSLengthMismatch:        return "SRSLengthMismatch";
        case KZGError::MalformedTrustedSetup:    return "MalformedTrustedSetup";
        case KZGError::SetupFileError:           return "SetupFileError";
        case KZGError::VerificationFailed:       return "VerificationFailed";
    }
    return "Unknown";
}
