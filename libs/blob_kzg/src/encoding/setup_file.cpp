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

#include "setup_file.h"
#include "serialize.h"
#include <cctype>
#include <charconv>
#include <fstream>

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// no domain holds more points than the field's 2-adicity allows
const size_t MAX_SETUP_POINTS = size_t(1) << MAX_ORDER_ROOT;

static std::optional<size_t> read_count(std::ifstream &in) {
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;

    std::string_view v = trim(line);
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec != std::errc() || ptr != v.data() + v.size()) return std::nullopt;
    if (n > MAX_SETUP_POINTS) return std::nullopt;
    return n;
}

// nullopt when the file ends early, an empty vector for bad hex
static std::optional<std::vector<byte>> read_point(std::ifstream &in) {
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    auto raw = hex_to_bytes(trim(line));
    if (!raw) return std::vector<byte>{};
    return raw;
}


Result<TrustedSetup, KZGError> load_trusted_setup(const std::string &path) {
    std::ifstream in(path);
    if (!in) return KZGError::SetupFileError;

    auto n_g1 = read_count(in);
    auto n_g2 = read_count(in);
    if (!n_g1 || !n_g2) return KZGError::SetupFileError;

    // counts are untrusted, the vectors grow with the lines actually read
    TrustedSetup setup;

    for (size_t i = 0; i < *n_g1; i++) {
        auto raw = read_point(in);
        if (!raw) return KZGError::SetupFileError;

        auto p = g1_from_bytes(*raw);
        if (p.is_err()) return p.unwrap_err();
        setup.g1_monomial.push_back(p.unwrap());
    }

    for (size_t i = 0; i < *n_g2; i++) {
        auto raw = read_point(in);
        if (!raw) return KZGError::SetupFileError;

        auto p = g2_from_bytes(*raw);
        if (p.is_err()) return p.unwrap_err();
        setup.g2_monomial.push_back(p.unwrap());
    }

    return setup;
}


KZGError write_trusted_setup(const std::string &path, const TrustedSetup &setup) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) return KZGError::SetupFileError;

    out << setup.g1_monomial.size() << '\n';
    out << setup.g2_monomial.size() << '\n';

    for (auto &p : setup.g1_monomial)
        out << bytes_to_hex(g1_to_bytes(p)) << '\n';
    for (auto &p : setup.g2_monomial)
        out << bytes_to_hex(g2_to_bytes(p)) << '\n';

    out.flush();
    return out ? KZGError::Ok : KZGError::SetupFileError;
}
