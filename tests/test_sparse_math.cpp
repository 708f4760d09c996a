#include "errors.hpp"
#include "sparse_math.hpp"
#include "wavelet.hpp"

#include "test_util.hpp"

// filter [1,2,3,4], input_length=8 -> dense 8x8 with filter coefficients at
// sameshift positions (center tap on the diagonal).
static void test_conv_matrix_structure() {
    auto filter = torch::tensor({1.0, 2.0, 3.0, 4.0}, f64());
    auto dense = construct_conv_matrix(filter, 8).to_dense();

    assert(dense.size(0) == 8);
    assert(dense.size(1) == 8);

    double expected[8][8] = {
        {2, 1, 0, 0, 0, 0, 0, 0},
        {3, 2, 1, 0, 0, 0, 0, 0},
        {4, 3, 2, 1, 0, 0, 0, 0},
        {0, 4, 3, 2, 1, 0, 0, 0},
        {0, 0, 4, 3, 2, 1, 0, 0},
        {0, 0, 0, 4, 3, 2, 1, 0},
        {0, 0, 0, 0, 4, 3, 2, 1},
        {0, 0, 0, 0, 0, 4, 3, 2},
    };

    auto acc = dense.accessor<double, 2>();
    for (int r = 0; r < 8; ++r) {
        for (int c = 0; c < 8; ++c) {
            auto msg = "matrix[" + std::to_string(r) + "][" + std::to_string(c) + "]";
            assert_near(acc[r][c], expected[r][c], msg.c_str());
        }
    }
    std::cout << "  test_conv_matrix_structure passed." << std::endl;
}

// Strided version with stride=2 keeps rows 1, 3, 5, ... of the full matrix.
static void test_strided_conv_matrix_selects_odd_rows() {
    auto filter = torch::tensor({1.0, 2.0, 3.0, 4.0}, f64());
    int64_t const n = 8;

    auto full = construct_conv_matrix(filter, n).to_dense();
    auto strided = construct_strided_conv_matrix(filter, n, 2).to_dense();

    assert(strided.size(0) == n / 2);
    assert(strided.size(1) == n);
    assert_close(strided, full.slice(0, 1, n, 2), "strided rows");
    std::cout << "  test_strided_conv_matrix_selects_odd_rows passed." << std::endl;
}

// Other strides select the same rows of the square matrix; an odd length
// keeps the last row when it lands on the stride.
static void test_strided_conv_matrix_other_strides() {
    auto filter = torch::tensor({1.0, 2.0, 3.0}, f64());
    int64_t const n = 8;
    auto full = construct_conv_matrix(filter, n).to_dense();

    auto every_third = construct_strided_conv_matrix(filter, n, 3).to_dense();
    assert(every_third.size(0) == 3);
    assert_close(every_third, full.index_select(0, torch::tensor({1, 4, 7}, torch::kLong)), "stride 3");

    auto odd = construct_strided_conv_matrix(filter, 7, 2).to_dense();
    assert(odd.size(0) == 3);
    assert_close(odd, construct_conv_matrix(filter, 7).to_dense().slice(0, 1, 7, 2), "odd length");

    expect_throws<ConfigurationError>([&] { construct_strided_conv_matrix(filter, n, 0); }, "zero stride");
    expect_throws<ConfigurationError>([&] { construct_conv_matrix(filter, 0); }, "empty length");
    std::cout << "  test_strided_conv_matrix_other_strides passed." << std::endl;
}

// Haar analysis rows (dec_lo and dec_hi stacked, stride 2) are orthonormal.
static void test_strided_haar_orthogonality() {
    auto const w = make_wavelet("haar");
    int64_t const n = 8;

    auto a_lo = construct_strided_conv_matrix(torch::tensor(w.dec_lo, f64()), n, 2).to_dense();
    auto a_hi = construct_strided_conv_matrix(torch::tensor(w.dec_hi, f64()), n, 2).to_dense();
    auto a = torch::cat({a_lo, a_hi}, /*dim=*/0);

    assert_close(torch::mm(a, a.t()), torch::eye(n, f64()), "A @ A^T");
    std::cout << "  test_strided_haar_orthogonality passed." << std::endl;
}

// Applying along an axis equals a dense contraction over that axis, for
// every axis of a (nx, ny, c, batch) tensor.
static void test_apply_matrix_along_axis() {
    seed(1);
    auto data = torch::randn({4, 6, 2, 3}, f64());

    for (int64_t axis = 0; axis < data.dim(); ++axis) {
        int64_t const n = data.size(axis);
        auto dense = torch::randn({n + 1, n}, f64());
        auto sparse = dense.to_sparse();

        auto result = apply_matrix_along_axis(sparse, data, axis);
        auto expected = torch::movedim(
            torch::tensordot(dense, data, {1}, {axis}), 0, axis);

        assert(result.size(axis) == n + 1);
        auto msg = "axis " + std::to_string(axis);
        assert_close(result, expected, msg.c_str());
    }
    std::cout << "  test_apply_matrix_along_axis passed." << std::endl;
}

static void test_apply_matrix_width_mismatch() {
    auto matrix = torch::eye(5, f64()).to_sparse();
    auto data = torch::zeros({4, 4, 1, 1}, f64());
    expect_throws<ShapeError>([&] { apply_matrix_along_axis(matrix, data, 0); }, "width mismatch");
    std::cout << "  test_apply_matrix_width_mismatch passed." << std::endl;
}

int main() {
    test_conv_matrix_structure();
    test_strided_conv_matrix_selects_odd_rows();
    test_strided_conv_matrix_other_strides();
    test_strided_haar_orthogonality();
    test_apply_matrix_along_axis();
    test_apply_matrix_width_mismatch();

    std::cout << "All sparse_math tests passed." << std::endl;
    return 0;
}
