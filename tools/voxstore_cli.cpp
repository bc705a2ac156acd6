#include "voxstore/errors.hpp"
#include "voxstore/host/host_writer.hpp"
#include "voxstore/io/pattern_json.hpp"
#include "voxstore/rx/reader.hpp"
#include "voxstore/sim/noise.hpp"
#include <cstdio>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace voxstore;

static void usage(const char* a0) {
    std::fprintf(stderr,
        "Usage: %s <data> [--grid XxYxZ] [--levels IxP] [--ecc none|hamming74|parity8] [--no-scramble]\n"
        "          [--noise-intensity s] [--noise-polarization s] [--seed n] [--save pattern.json] [--summary]\n"
        "       %s --load pattern.json\n",
        a0, a0);
}

// Parse "AxBxC" style lists.
static bool parse_dims(const std::string& s, std::vector<int>& out, size_t expected) {
    out.clear();
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, 'x')) {
        if (part.empty()) return false;
        try {
            size_t used = 0;
            int v = std::stoi(part, &used);
            if (used != part.size()) return false;
            out.push_back(v);
        } catch (const std::exception&) {
            return false;
        }
    }
    return out.size() == expected;
}

static void print_summary(const StoragePattern& pattern) {
    for (const auto& [key, value] : pattern.summary()) {
        std::string k = key;
        k.resize(26, ' ');
        std::cout << k << ": " << value << "\n";
    }
}

static int load_and_read(const std::string& path) {
    auto pattern = io::load_pattern(path);
    print_summary(pattern);
    auto res = rx::LaserReader(pattern).read();
    std::cout << "Recovered " << res.data.size() << " bytes: "
              << std::string(res.data.begin(), res.data.end()) << "\n";
    std::cout << "corrected_errors=" << res.corrected_errors
              << " detected_uncorrectable=" << res.detected_uncorrectable << "\n";
    return res.detected_uncorrectable == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
    std::string data; bool have_data = false;
    std::string grid = "8x8x2", levels = "4x4", ecc_name = "hamming74";
    std::string save_path, load_path;
    bool scramble = true, summary = false;
    double noise_i = 0.0, noise_p = 0.0;
    bool add_noise = false;
    std::optional<uint32_t> seed;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        try {
            if (a == "--grid" && i+1 < argc) grid = argv[++i];
            else if (a == "--levels" && i+1 < argc) levels = argv[++i];
            else if (a == "--ecc" && i+1 < argc) ecc_name = argv[++i];
            else if (a == "--no-scramble") scramble = false;
            else if (a == "--noise-intensity" && i+1 < argc) { noise_i = std::stod(argv[++i]); add_noise = true; }
            else if (a == "--noise-polarization" && i+1 < argc) { noise_p = std::stod(argv[++i]); add_noise = true; }
            else if (a == "--seed" && i+1 < argc) seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            else if (a == "--save" && i+1 < argc) save_path = argv[++i];
            else if (a == "--load" && i+1 < argc) load_path = argv[++i];
            else if (a == "--summary") summary = true;
            else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
            else if (!a.empty() && a[0] != '-' && !have_data) { data = a; have_data = true; }
            else { std::cerr << "Unknown argument: " << a << "\n"; usage(argv[0]); return 2; }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << a << ": " << e.what() << "\n";
            return 2;
        }
    }

    try {
        if (!load_path.empty())
            return load_and_read(load_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to read " << load_path << ": " << e.what() << "\n";
        return 1;
    }

    if (!have_data) { usage(argv[0]); return 2; }

    std::vector<int> g, l;
    if (!parse_dims(grid, g, 3) || !parse_dims(levels, l, 2)) {
        std::cerr << "Invalid --grid/--levels: expected XxYxZ and IxP\n";
        return 2;
    }
    if (ecc_name != "none" && ecc_name != "hamming74" && ecc_name != "parity8") {
        std::cerr << "Invalid --ecc: " << ecc_name << "\n";
        return 2;
    }

    host::HostConfig cfg;
    cfg.grid = {g[0], g[1], g[2]};
    cfg.intensity_levels = l[0];
    cfg.polarization_states = l[1];
    cfg.ecc = fec::ErrorCorrection::from_name(ecc_name);
    cfg.scramble = scramble;

    try {
        host::HostWriter hw(cfg);
        std::vector<uint8_t> payload(data.begin(), data.end());
        auto pattern = hw.write(payload);
        if (summary) print_summary(pattern);
        if (!save_path.empty()) {
            io::save_pattern(pattern, save_path);
            std::cout << "Saved pattern to " << save_path << "\n";
        }

        host::HostReadback rb;
        if (add_noise) {
            auto noisy = sim::apply_gaussian_noise(pattern, noise_i, noise_p, seed);
            rb = hw.verify(pattern, std::span<const Voxel>(noisy));
        } else {
            rb = hw.verify(pattern);
        }

        bool ok = rb.data == payload && rb.crc_ok && rb.read_result.detected_uncorrectable == 0;
        std::cout << "Wrote pattern with " << pattern.voxel_count()
                  << " voxels; corrected_errors=" << rb.read_result.corrected_errors << "\n";
        std::cout << "Roundtrip: " << (ok ? "OK" : "MISMATCH") << "\n";
        return ok ? 0 : 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    } catch (const CapacityError& e) {
        std::cerr << "Capacity error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
