#include "errors.hpp"
#include "matrix_build.hpp"
#include "sparse_math.hpp"

#include "test_util.hpp"

// A and S are square (length x length) sparse matrices.
static void test_shapes() {
    auto const w = make_wavelet("haar");

    for (int64_t len : {2, 8, 16}) {
        auto a = construct_a(w, len, f64());
        auto s = construct_s(w, len, f64());
        assert(a.is_sparse() && s.is_sparse());
        assert(a.size(0) == len && a.size(1) == len);
        assert(s.size(0) == len && s.size(1) == len);
    }
    std::cout << "  test_shapes passed." << std::endl;
}

// For Haar, S @ A = I exactly (two-tap filters, no boundary effects).
static void test_haar_perfect_reconstruction() {
    auto const w = make_wavelet("haar");
    int64_t const n = 8;

    auto a = construct_a(w, n, f64()).to_dense();
    auto s = construct_s(w, n, f64()).to_dense();
    assert_close(torch::mm(s, a), torch::eye(n, f64()), "S @ A");
    std::cout << "  test_haar_perfect_reconstruction passed." << std::endl;
}

// Top half of A is the dec_lo strided conv, bottom half the dec_hi one:
// applied to a ramp, the lowpass rows give scaled pair sums and the
// highpass rows scaled pair differences.
static void test_a_lowpass_highpass_split() {
    auto const w = make_wavelet("haar");
    int64_t const n = 8;

    auto a = construct_a(w, n, f64()).to_dense();
    auto expected_lo = construct_strided_conv_matrix(torch::tensor(w.dec_lo, f64()), n, 2).to_dense();
    auto expected_hi = construct_strided_conv_matrix(torch::tensor(w.dec_hi, f64()), n, 2).to_dense();

    assert_close(a.slice(0, 0, n / 2), expected_lo, "A top half");
    assert_close(a.slice(0, n / 2, n), expected_hi, "A bottom half");

    auto ramp = torch::arange(n, f64()).unsqueeze(1);
    auto coeffs = torch::mm(a, ramp).squeeze(1);
    double const s = std::sqrt(2.0) / 2.0;
    for (int64_t i = 0; i < n / 2; ++i) {
        double const x0 = 2.0 * i;
        double const x1 = 2.0 * i + 1.0;
        assert_near(coeffs[i].item<double>(), s * (x0 + x1), "lowpass");
        assert_near(std::abs(coeffs[n / 2 + i].item<double>()), s, "highpass");
    }
    std::cout << "  test_a_lowpass_highpass_split passed." << std::endl;
}

static void test_odd_length_rejected() {
    auto const w = make_wavelet("haar");
    expect_throws<ShapeError>([&] { construct_a(w, 7, f64()); }, "odd A");
    expect_throws<ShapeError>([&] { construct_s(w, 0, f64()); }, "empty S");
    std::cout << "  test_odd_length_rejected passed." << std::endl;
}

int main() {
    test_shapes();
    test_haar_perfect_reconstruction();
    test_a_lowpass_highpass_split();
    test_odd_length_rejected();

    std::cout << "All matrix_build tests passed." << std::endl;
    return 0;
}
