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

#include "extern.h"
#include "blob_kzg.h"
#include <cstdio>
#include <cstring>
#include <exception>

static const KZGContext* as_ctx(void* ctx) {
    return static_cast<const KZGContext*>(ctx);
}

static int code(KZGError err) {
    return static_cast<int>(err);
}

template <size_t N>
static std::array<byte, N> to_array(const unsigned char* p) {
    std::array<byte, N> out;
    std::memcpy(out.data(), p, N);
    return out;
}

static void log_exception(const char* fn, const std::exception &e) {
    fprintf(stderr, "%s: %s\n", fn, e.what());
}

static int internal_error(const char* fn, const std::exception &e) {
    log_exception(fn, e);
    return KZG_INTERNAL_ERROR;
}


void* kzg_ctx_open(const char* path, size_t domain_size, bool bit_reversed) {
    if (!path) return nullptr;
    try {
        ContextConfig config;
        config.domain_size = domain_size;
        config.bit_reversed = bit_reversed;

        auto ctx = KZGContext::from_file(path, config);
        if (ctx.is_err()) {
            fprintf(stderr, "kzg_ctx_open: %s (%s)\n", error_str(ctx.unwrap_err()), path);
            return nullptr;
        }
        return new KZGContext(std::move(ctx.unwrap()));
    } catch (const std::exception &e) {
        log_exception("kzg_ctx_open", e);
        return nullptr;
    }
}

void kzg_ctx_close(void* ctx) {
    delete static_cast<KZGContext*>(ctx);
}

size_t kzg_blob_size(void* ctx) {
    if (!ctx) return 0;
    return as_ctx(ctx)->blob_size();
}


int kzg_blob_to_commitment(
    void* ctx,
    const unsigned char* blob,
    size_t blob_size,
    unsigned char* commitment_out
) {
    if (!ctx || !blob || !commitment_out) return KZG_NULL_PARAMETER;
    try {
        auto C = as_ctx(ctx)->blob_to_commitment({blob, blob_size});
        if (C.is_err()) return code(C.unwrap_err());
        std::memcpy(commitment_out, C.unwrap().data(), 48);
        return KZG_OK;
    } catch (const std::exception &e) {
        return internal_error("kzg_blob_to_commitment", e);
    }
}

int kzg_compute_proof(
    void* ctx,
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char* z,
    unsigned char* proof_out,
    unsigned char* y_out
) {
    if (!ctx || !blob || !z || !proof_out || !y_out) return KZG_NULL_PARAMETER;
    try {
        auto res = as_ctx(ctx)->compute_kzg_proof({blob, blob_size}, to_array<32>(z));
        if (res.is_err()) return code(res.unwrap_err());
        std::memcpy(proof_out, res.unwrap().proof.data(), 48);
        std::memcpy(y_out, res.unwrap().y.data(), 32);
        return KZG_OK;
    } catch (const std::exception &e) {
        return internal_error("kzg_compute_proof", e);
    }
}

int kzg_compute_blob_proof(
    void* ctx,
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char* commitment,
    unsigned char* proof_out
) {
    if (!ctx || !blob || !commitment || !proof_out) return KZG_NULL_PARAMETER;
    try {
        auto res = as_ctx(ctx)->compute_blob_kzg_proof(
            {blob, blob_size}, to_array<48>(commitment));
        if (res.is_err()) return code(res.unwrap_err());
        std::memcpy(proof_out, res.unwrap().data(), 48);
        return KZG_OK;
    } catch (const std::exception &e) {
        return internal_error("kzg_compute_blob_proof", e);
    }
}


int kzg_verify_proof(
    void* ctx,
    const unsigned char* commitment,
    const unsigned char* z,
    const unsigned char* y,
    const unsigned char* proof
) {
    if (!ctx || !commitment || !z || !y || !proof) return KZG_NULL_PARAMETER;
    try {
        return code(as_ctx(ctx)->verify_kzg_proof(
            to_array<48>(commitment),
            to_array<32>(z),
            to_array<32>(y),
            to_array<48>(proof)));
    } catch (const std::exception &e) {
        return internal_error("kzg_verify_proof", e);
    }
}

int kzg_verify_blob_proof(
    void* ctx,
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char* commitment,
    const unsigned char* proof
) {
    if (!ctx || !blob || !commitment || !proof) return KZG_NULL_PARAMETER;
    try {
        return code(as_ctx(ctx)->verify_blob_kzg_proof(
            {blob, blob_size},
            to_array<48>(commitment),
            to_array<48>(proof)));
    } catch (const std::exception &e) {
        return internal_error("kzg_verify_blob_proof", e);
    }
}

int kzg_verify_blob_proof_batch(
    void* ctx,
    const unsigned char* blobs,
    size_t blob_size,
    const unsigned char* commitments,
    const unsigned char* proofs,
    size_t count
) {
    if (!ctx) return KZG_NULL_PARAMETER;
    if (count == 0) return KZG_OK;
    if (!blobs || !commitments || !proofs) return KZG_NULL_PARAMETER;
    try {
        std::vector<std::span<const byte>> bs(count);
        std::vector<bytes48> cs(count);
        std::vector<bytes48> ps(count);
        for (size_t i = 0; i < count; i++) {
            bs[i] = std::span<const byte>(blobs + i * blob_size, blob_size);
            cs[i] = to_array<48>(commitments + i * 48);
            ps[i] = to_array<48>(proofs + i * 48);
        }
        return code(as_ctx(ctx)->verify_blob_kzg_proof_batch(bs, cs, ps));
    } catch (const std::exception &e) {
        return internal_error("kzg_verify_blob_proof_batch", e);
    }
}
