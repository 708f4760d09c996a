#pragma once

#include <string>
#include <vector>

/// Two-channel filter bank behind wavelet_squeeze.
/// dec_lo/dec_hi fill the lowpass and highpass halves of the analysis matrix
/// (construct_a); rec_lo/rec_hi are time-reversed into the synthesis matrix
/// (construct_s).
struct Wavelet {
    std::string name;
    std::vector<double> dec_lo;
    std::vector<double> dec_hi;
    std::vector<double> rec_lo;
    std::vector<double> rec_hi;

    int dec_len() const { return static_cast<int>(dec_lo.size()); }
    int rec_len() const { return static_cast<int>(rec_lo.size()); }

    /// Two-tap banks tile the signal in disjoint pairs, so their one-level
    /// matrices need no boundary correction.
    bool is_two_tap() const { return dec_len() == 2 && rec_len() == 2; }
};

/// Every name make_wavelet accepts, aliases included.
std::vector<std::string> wavelet_names();

/// Look up a filter bank by name ("haar", or its alias "db1").
/// Throws ConfigurationError for anything else.
Wavelet make_wavelet(std::string const& name);
