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

#include "serialize.h"

// ---------------- scalars ----------------

Result<blst_scalar, KZGError> scalar_from_bytes(std::span<const byte> in) {
    if (in.size() != BYTES_PER_SCALAR) return KZGError::DeserializationError;

    blst_scalar s;
    blst_scalar_from_bendian(&s, in.data());
    if (!blst_scalar_fr_check(&s)) return KZGError::DeserializationError;
    return s;
}

bytes32 scalar_to_bytes(const blst_scalar &s) {
    bytes32 out;
    blst_bendian_from_scalar(out.data(), &s);
    return out;
}

// ---------------- points -----------------

Result<blst_p1_affine, KZGError> g1_from_bytes(std::span<const byte> in) {
    if (in.size() != BYTES_PER_G1) return KZGError::DeserializationError;

    blst_p1_affine p;
    if (blst_p1_uncompress(&p, in.data()) != BLST_SUCCESS)
        return KZGError::DeserializationError;
    if (blst_p1_affine_is_inf(&p)) return p;
    if (!blst_p1_affine_in_g1(&p)) return KZGError::DeserializationError;
    return p;
}

bytes48 g1_to_bytes(const blst_p1_affine &p) {
    return compress_p1_affine(p);
}

Result<blst_p2_affine, KZGError> g2_from_bytes(std::span<const byte> in) {
    if (in.size() != BYTES_PER_G2) return KZGError::DeserializationError;

    blst_p2_affine p;
    if (blst_p2_uncompress(&p, in.data()) != BLST_SUCCESS)
        return KZGError::DeserializationError;
    if (blst_p2_affine_is_inf(&p)) return p;
    if (!blst_p2_affine_in_g2(&p)) return KZGError::DeserializationError;
    return p;
}

bytes96 g2_to_bytes(const blst_p2_affine &p) {
    return compress_p2_affine(p);
}

// ---------------- blobs ------------------

Result<Polynomial, KZGError> blob_to_polynomial(std::span<const byte> blob, size_t n) {
    if (blob.size() != n * BYTES_PER_SCALAR) return KZGError::DeserializationError;

    Polynomial poly(n);
    for (size_t i = 0; i < n; i++) {
        auto s = scalar_from_bytes(blob.subspan(i * BYTES_PER_SCALAR, BYTES_PER_SCALAR));
        if (s.is_err()) return s.unwrap_err();
        poly[i] = s.unwrap();
    }
    return poly;
}

// ---------------- hex --------------------

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<byte>> hex_to_bytes(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) hex.remove_prefix(2);
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<byte> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hex_val(hex[2 * i]);
        int lo = hex_val(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<byte>((hi << 4) | lo);
    }
    return out;
}

std::string bytes_to_hex(std::span<const byte> in) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(in.size() * 2);
    for (byte b : in) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}
