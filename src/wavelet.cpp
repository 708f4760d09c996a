#include "wavelet.hpp"

#include "errors.hpp"

#include <cmath>
#include <utility>

static Wavelet haar_bank() {
    double const s = std::sqrt(0.5);
    return Wavelet{
        .name = "haar",
        .dec_lo = { s, s},
        .dec_hi = {-s, s},
        .rec_lo = { s, s},
        .rec_hi = { s, -s},
    };
}

// Accepted names, aliases included, and the bank each one builds.
static std::pair<char const*, Wavelet (*)()> const kWaveletFactories[] = {
    {"haar", &haar_bank},
    {"db1", &haar_bank},
};

std::vector<std::string> wavelet_names() {
    std::vector<std::string> names;
    for (auto const& entry : kWaveletFactories) {
        names.emplace_back(entry.first);
    }
    return names;
}

Wavelet make_wavelet(std::string const& name) {
    for (auto const& [accepted, factory] : kWaveletFactories) {
        if (name == accepted) {
            return factory();
        }
    }
    throw ConfigurationError("Unknown wavelet: " + name);
}
