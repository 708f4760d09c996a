#include "errors.hpp"
#include "tensor_split.hpp"

#include "test_util.hpp"

// Default split halves the channel axis and tensor_cat undoes it.
static void test_split_cat_inverse() {
    seed(2);
    for (auto const& shape : {std::vector<int64_t>{4, 4, 6, 2}, std::vector<int64_t>{2, 4, 2, 8, 3}}) {
        auto x = torch::randn(shape, f64());
        auto [a, b] = tensor_split(x);
        int64_t const ch = x.dim() - 2;

        assert(a.size(ch) == x.size(ch) / 2);
        assert(b.size(ch) == x.size(ch) / 2);
        assert(torch::equal(tensor_cat(a, b), x));
        assert(torch::equal(tensor_cat(tensor_split(x)), x));
    }
    std::cout << "  test_split_cat_inverse passed." << std::endl;
}

// An explicit split index puts that many channels in the first part.
static void test_explicit_index() {
    auto x = torch::arange(5, f64()).reshape({1, 1, 5, 1});
    auto [a, b] = tensor_split_at(x, 2);
    assert(a.size(2) == 2);
    assert(b.size(2) == 3);
    assert_near(b[0][0][0][0].item<double>(), 2.0, "first channel of second part");
    assert(torch::equal(tensor_cat(a, b), x));
    std::cout << "  test_explicit_index passed." << std::endl;
}

// Split indices 0 and total give an empty half, and concatenation with an
// empty operand returns the other operand.
static void test_degenerate_halves() {
    auto x = torch::ones({2, 2, 3, 1}, f64());

    auto [empty, all] = tensor_split_at(x, 0);
    assert(empty.size(2) == 0);
    assert(torch::equal(all, x));
    assert(torch::equal(tensor_cat(empty, all), x));

    auto [whole, none] = tensor_split_at(x, 3);
    assert(none.size(2) == 0);
    assert(torch::equal(tensor_cat(whole, none), x));
    std::cout << "  test_degenerate_halves passed." << std::endl;
}

// Vectors are split along their only axis.
static void test_one_dimensional() {
    auto v = torch::arange(6, f64());
    auto [a, b] = tensor_split(v);
    assert(a.size(0) == 3);
    assert_near(b[0].item<double>(), 3.0, "second half start");
    std::cout << "  test_one_dimensional passed." << std::endl;
}

static void test_shape_errors() {
    auto odd = torch::zeros({2, 2, 3, 1}, f64());
    expect_throws<ShapeError>([&] { tensor_split(odd); }, "odd channel count");
    expect_throws<ShapeError>([&] { tensor_split_at(odd, 4); }, "index past end");
    expect_throws<ShapeError>([&] { tensor_split_at(odd, -1); }, "negative index");

    auto a = torch::zeros({2, 2, 1, 1}, f64());
    auto b = torch::zeros({2, 4, 1, 1}, f64());
    auto c = torch::zeros({2, 2, 1, 1, 1}, f64());
    expect_throws<ShapeError>([&] { tensor_cat(a, b); }, "spatial mismatch");
    expect_throws<ShapeError>([&] { tensor_cat(a, c); }, "rank mismatch");
    std::cout << "  test_shape_errors passed." << std::endl;
}

int main() {
    test_split_cat_inverse();
    test_explicit_index();
    test_degenerate_halves();
    test_one_dimensional();
    test_shape_errors();

    std::cout << "All tensor_split tests passed." << std::endl;
    return 0;
}
