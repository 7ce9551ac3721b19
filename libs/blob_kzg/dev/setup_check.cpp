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

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include "blob_kzg.h"
#include "setup_file.h"

static int check_setup(const char* path, const ContextConfig &config) {
    auto start = std::chrono::steady_clock::now();

    auto setup = load_trusted_setup(path);
    if (setup.is_err()) {
        printf("load failed: %s\n", error_str(setup.unwrap_err()));
        return 1;
    }
    printf("loaded %zu g1, %zu g2 points\n",
        setup.unwrap().g1_monomial.size(),
        setup.unwrap().g2_monomial.size());

    auto ctx = KZGContext::create(setup.unwrap(), config);
    if (ctx.is_err()) {
        printf("setup rejected: %s\n", error_str(ctx.unwrap_err()));
        return 1;
    }

    auto end = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    printf("setup ok\n");
    printf("domain size:     %llu\n", (unsigned long long)ctx.unwrap().domain().cardinality);
    printf("commit key size: %zu\n", ctx.unwrap().keys().commit_key.size());
    printf("blob size:       %zu bytes\n", ctx.unwrap().blob_size());
    printf("took:            %lld ms\n", (long long)ms);
    printf("[s]_2:           ");
    print_p2_affine(ctx.unwrap().keys().opening_key.alpha_g2);
    return 0;
}

// blob_kzg_setup_check <setup.txt> [domain_size]
int main(int argc, char* argv[]) {
    if (argc < 2) {
        printf("usage: %s <setup.txt> [domain_size]\n", argv[0]);
        return 2;
    }

    ContextConfig config;
    if (argc > 2) config.domain_size = std::strtoull(argv[2], nullptr, 10);

    try {
        return check_setup(argv[1], config);
    } catch (const std::exception &e) {
        fprintf(stderr, "setup check failed: %s\n", e.what());
        return 1;
    }
}
