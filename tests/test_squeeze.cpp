#include "errors.hpp"
#include "squeeze.hpp"

#include "test_util.hpp"

// 4x4 single-channel image with value 10*i + j at (i, j).
static torch::Tensor numbered_image() {
    auto i = torch::arange(4, f64()).reshape({4, 1});
    auto j = torch::arange(4, f64()).reshape({1, 4});
    return (10.0 * i + j).reshape({4, 4, 1, 1});
}

// Patch squeeze of 4x4x1x1 -> 2x2x4x1: group g takes the half-block whose
// offset bits along (axis 0, axis 1) are the bits of g.
static void test_patch_mapping() {
    auto x = numbered_image();
    auto y = squeeze(x, SqueezePattern::patch);

    assert(y.sizes() == torch::IntArrayRef({2, 2, 4, 1}));
    auto xa = x.accessor<double, 4>();
    auto ya = y.accessor<double, 4>();
    for (int64_t g = 0; g < 4; ++g) {
        for (int64_t i = 0; i < 2; ++i) {
            for (int64_t j = 0; j < 2; ++j) {
                double const expected = xa[i + 2 * (g & 1)][j + 2 * (g >> 1)][0][0];
                auto msg = "patch group " + std::to_string(g);
                assert_near(ya[i][j][g][0], expected, msg.c_str());
            }
        }
    }
    // Group 0 is the top-left block {0, 1, 10, 11}.
    assert_near(ya[1][1][0][0], 11.0, "top-left block corner");
    std::cout << "  test_patch_mapping passed." << std::endl;
}

// Checkerboard squeeze: group g takes the positions with parity bits g.
static void test_checkerboard_mapping() {
    auto x = numbered_image();
    auto y = squeeze(x, SqueezePattern::checkerboard);

    auto xa = x.accessor<double, 4>();
    auto ya = y.accessor<double, 4>();
    for (int64_t g = 0; g < 4; ++g) {
        for (int64_t i = 0; i < 2; ++i) {
            for (int64_t j = 0; j < 2; ++j) {
                double const expected = xa[2 * i + (g & 1)][2 * j + (g >> 1)][0][0];
                assert_near(ya[i][j][g][0], expected, "checkerboard");
            }
        }
    }
    std::cout << "  test_checkerboard_mapping passed." << std::endl;
}

// Column squeeze is a plain reshape of the same storage order.
static void test_column_is_reshape() {
    auto x = numbered_image();
    auto y = squeeze(x, SqueezePattern::column);
    assert(y.sizes() == torch::IntArrayRef({2, 2, 4, 1}));
    assert(torch::equal(y.flatten(), x.flatten()));
    std::cout << "  test_column_is_reshape passed." << std::endl;
}

// unsqueeze(squeeze(x)) == x for every pattern, 2-D and 3-D, with several
// channels and a batch.
static void test_round_trips() {
    seed(3);
    auto image = torch::randn({6, 4, 3, 2}, f64());
    auto volume = torch::randn({4, 2, 6, 2, 3}, f64());

    for (auto pattern : {SqueezePattern::column, SqueezePattern::patch, SqueezePattern::checkerboard}) {
        auto y = squeeze(image, pattern);
        assert(y.sizes() == torch::IntArrayRef({3, 2, 12, 2}));
        assert(torch::equal(unsqueeze(y, pattern), image));

        auto [first, second] = unsqueeze(y, y * 2.0, pattern);
        assert(torch::equal(first, image));
        assert_close(second, image * 2.0, "paired unsqueeze");
    }
    for (auto pattern : {SqueezePattern::column, SqueezePattern::patch}) {
        auto y = squeeze(volume, pattern);
        assert(y.sizes() == torch::IntArrayRef({2, 1, 3, 16, 3}));
        assert(torch::equal(unsqueeze(y, pattern), volume));
    }
    std::cout << "  test_round_trips passed." << std::endl;
}

static void test_errors() {
    auto volume = torch::zeros({2, 2, 2, 1, 1}, f64());
    expect_throws<UnsupportedPatternError>(
        [&] { squeeze(volume, SqueezePattern::checkerboard); }, "checkerboard 3-D squeeze");
    expect_throws<UnsupportedPatternError>(
        [&] { unsqueeze(torch::zeros({1, 1, 1, 8, 1}, f64()), SqueezePattern::checkerboard); },
        "checkerboard 3-D unsqueeze");
    expect_throws<UnsupportedPatternError>([] { parse_squeeze_pattern("diagonal"); }, "unknown pattern");
    expect_throws<ShapeError>(
        [] { squeeze(torch::zeros({3, 4, 1, 1}, f64()), SqueezePattern::column); }, "odd spatial extent");
    expect_throws<ShapeError>(
        [] { unsqueeze(torch::zeros({2, 2, 3, 1}, f64()), SqueezePattern::patch); }, "channels not divisible");
    expect_throws<ShapeError>([] { squeeze(torch::zeros({4, 4, 1}, f64()), SqueezePattern::column); }, "3-D tensor");

    assert(parse_squeeze_pattern("patch") == SqueezePattern::patch);
    assert(to_string(SqueezePattern::checkerboard) == "checkerboard");
    std::cout << "  test_errors passed." << std::endl;
}

int main() {
    test_patch_mapping();
    test_checkerboard_mapping();
    test_column_is_reshape();
    test_round_trips();
    test_errors();

    std::cout << "All squeeze tests passed." << std::endl;
    return 0;
}
