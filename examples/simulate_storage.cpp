#include "voxstore/rx/reader.hpp"
#include "voxstore/sim/noise.hpp"
#include "voxstore/tx/writer.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace voxstore;

// Example: write a short message into a glass-like lattice, perturb the
// measurement, and read it back.
int main() {
    std::cout << "=== 5D Optical Storage Example ===" << std::endl;

    const std::string message = "5D optical storage with femtosecond lasers!";
    std::vector<uint8_t> payload(message.begin(), message.end());

    tx::WriterConfig cfg;
    cfg.grid = {64, 64, 8};
    cfg.pitch = {5.0, 5.0, 15.0};
    cfg.intensity_levels = 16;
    cfg.polarization_states = 8;
    cfg.intensity_range = {0.2, 1.0};
    cfg.polarization_range = {0.0, 3.14159};
    cfg.ecc = fec::ErrorCorrection(fec::Scheme::Hamming74);

    tx::LaserWriter writer(cfg);
    auto pattern = writer.write(payload);

    std::cout << "\n--- Write phase ---" << std::endl;
    for (const auto& [key, value] : pattern.summary())
        std::cout << std::left << std::setw(26) << key << ": " << value << std::endl;

    // Simulate measurement noise
    auto noisy = sim::apply_gaussian_noise(pattern, 0.005, 0.005, 7u);

    rx::LaserReader reader(pattern);
    auto result = reader.read(noisy);

    std::cout << "\n--- Read phase ---" << std::endl;
    std::cout << "Recovered payload        : " << std::string(result.data.begin(), result.data.end()) << std::endl;
    std::cout << "Corrected single-bit errs: " << result.corrected_errors << std::endl;
    std::cout << "Detected uncorrectable   : " << result.detected_uncorrectable << std::endl;
    std::cout << "Voxels processed         : " << result.voxels_used << std::endl;

    std::cout << "\n=== Example completed ===" << std::endl;
    return result.data == payload ? 0 : 1;
}
