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

// extern.h
#pragma once
#include <cstddef>
#include <cstdint>

extern "C" {

    extern const int KZG_OK;
    extern const int KZG_DESERIALIZATION_ERROR;
    extern const int KZG_DOMAIN_SIZE_MISMATCH;
    extern const int KZG_POLYNOMIAL_LENGTH_MISMATCH;
    extern const int KZG_LENGTH_MISMATCH;
    extern const int KZG_DOMAIN_TOO_LARGE;
    extern const int KZG_EMPTY_SRS;
    extern const int KZG_SRS_LENGTH_MISMATCH;
    extern const int KZG_MALFORMED_TRUSTED_SETUP;
    extern const int KZG_SETUP_FILE_ERROR;
    extern const int KZG_VERIFICATION_FAILED;
    extern const int KZG_INTERNAL_ERROR;
    extern const int KZG_NULL_PARAMETER;

    // nullptr on failure, reason printed to stderr
    void* kzg_ctx_open(
        const char* path,
        size_t domain_size,
        bool bit_reversed
    );

    void kzg_ctx_close(void* ctx);

    size_t kzg_blob_size(void* ctx);

    int kzg_blob_to_commitment(
        void* ctx,
        const unsigned char* blob,
        size_t blob_size,
        unsigned char* commitment_out   // 48
    );

    int kzg_compute_proof(
        void* ctx,
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char* z,         // 32
        unsigned char* proof_out,       // 48
        unsigned char* y_out            // 32
    );

    int kzg_compute_blob_proof(
        void* ctx,
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char* commitment,
        unsigned char* proof_out
    );

    int kzg_verify_proof(
        void* ctx,
        const unsigned char* commitment,
        const unsigned char* z,
        const unsigned char* y,
        const unsigned char* proof
    );

    int kzg_verify_blob_proof(
        void* ctx,
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char* commitment,
        const unsigned char* proof
    );

    // blobs back to back, blob_size bytes each, count of them
    int kzg_verify_blob_proof_batch(
        void* ctx,
        const unsigned char* blobs,
        size_t blob_size,
        const unsigned char* commitments,
        const unsigned char* proofs,
        size_t count
    );
}
