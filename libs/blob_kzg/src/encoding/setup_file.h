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
#include "errors.h"
#include "result.h"
#include "srs.h"
#include <string>

// Text setup file:
//   <number of g1 points>
//   <number of g2 points>
//   <compressed g1 hex>   x g1 count, monomial order
//   <compressed g2 hex>   x g2 count, monomial order
//
// The setup is only decoded here, check_trusted_setup validates it.
Result<TrustedSetup, KZGError> load_trusted_setup(const std::string &path);

KZGError write_trusted_setup(const std::string &path, const TrustedSetup &setup);
