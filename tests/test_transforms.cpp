#include <splot/parser/opseq.hpp>
#include <splot/runtime/transforms.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>
#include <vector>

using Catch::Approx;
using splot::ErrorKind;
using splot::Point;
using splot::Table;
using namespace splot::runtime;

namespace {

auto make_table(std::vector<Point> points) -> Table {
    return Table{"x", "y", std::move(points)};
}

auto run(const char* opseq, Table table) -> splot::Result<Table> {
    auto seq = splot::parser::parse(opseq);
    REQUIRE(seq.has_value());
    for (const auto& op : seq->ops()) {
        auto next = apply(op, std::move(table));
        if (!next) {
            return next;
        }
        table = std::move(*next);
    }
    return table;
}

}  // namespace

TEST_CASE("sort orders by x and is idempotent") {
    auto input = make_table({{3.0, 1.0}, {1.0, 2.0}, {2.0, 3.0}, {1.0, 4.0}});
    auto once = sort(input);
    REQUIRE(once.has_value());
    REQUIRE(once->points == std::vector<Point>{{1.0, 2.0}, {1.0, 4.0}, {2.0, 3.0}, {3.0, 1.0}});
    auto twice = sort(*once);
    REQUIRE(twice.has_value());
    REQUIRE(*twice == *once);
    REQUIRE(once->y_name == "y");
}

TEST_CASE("sort rejects non-finite x") {
    auto input = make_table({{1.0, 1.0}, {std::numeric_limits<double>::infinity(), 2.0}});
    auto out = sort(input);
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == ErrorKind::NonFiniteValue);
}

TEST_CASE("cdf is non-decreasing and ends at one") {
    auto input = make_table({{0.0, 5.0}, {1.0, 1.0}, {2.0, 3.0}, {3.0, 3.0}});
    auto out = cdf(input);
    REQUIRE(out.has_value());
    REQUIRE(out->x_name == "y");
    REQUIRE(out->y_name == "CDF");
    REQUIRE(out->rows() == 4);
    for (std::size_t i = 1; i < out->rows(); ++i) {
        REQUIRE(out->points[i].x >= out->points[i - 1].x);
        REQUIRE(out->points[i].y >= out->points[i - 1].y);
    }
    REQUIRE(out->points.front() == Point{1.0, 0.25});
    REQUIRE(out->points.back().y == Approx(1.0));
}

TEST_CASE("cdf of an empty table is empty") {
    auto out = cdf(make_table({}));
    REQUIRE(out.has_value());
    REQUIRE(out->empty());
}

TEST_CASE("derivative with zero window differentiates consecutive pairs") {
    auto input = make_table({{2.0, 4.0}, {0.0, 0.0}, {1.0, 1.0}, {4.0, 16.0}});
    auto out = derivative(input, {});
    REQUIRE(out.has_value());
    REQUIRE(out->y_name == "y:Derivation");
    REQUIRE(out->points == std::vector<Point>{{1.0, 1.0}, {2.0, 3.0}, {4.0, 6.0}});
}

TEST_CASE("derivative with a window emits once per span") {
    Table input{"t", "v"};
    for (int i = 0; i <= 10; ++i) {
        input.add_row(i, 2.0 * i);
    }
    auto out = derivative(input, {.left = 3.0, .right = 0.0});
    REQUIRE(out.has_value());
    REQUIRE(out->y_name == "v:Derivation(3,0)");
    REQUIRE(out->points == std::vector<Point>{{3.0, 2.0}, {6.0, 2.0}, {9.0, 2.0}});
}

TEST_CASE("derivative fails on duplicate x") {
    auto input = make_table({{1.0, 1.0}, {2.0, 2.0}, {1.0, 3.0}});
    auto out = derivative(input, {});
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == ErrorKind::DuplicateKey);
    REQUIRE(out.error().message.find("derivative") != std::string::npos);
}

TEST_CASE("integral fails on duplicate x") {
    auto out = integral(make_table({{1.0, 1.0}, {1.0, 2.0}}));
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == ErrorKind::DuplicateKey);
    REQUIRE(out.error().message.find("integral") != std::string::npos);
}

TEST_CASE("integral accumulates y over x increments") {
    auto out = integral(make_table({{0.0, 1.0}, {2.0, 3.0}, {3.0, 5.0}}));
    REQUIRE(out.has_value());
    REQUIRE(out->y_name == "y:Integral");
    REQUIRE(out->points == std::vector<Point>{{0.0, 0.0}, {2.0, 6.0}, {3.0, 11.0}});
}

TEST_CASE("integral then derivative recovers y after the first point") {
    std::vector<Point> points;
    for (int i = 0; i < 20; ++i) {
        const double x = 0.5 * i + 0.01 * i * i;
        points.push_back({x, 3.0 * x - 0.2 * i});
    }
    auto out = run("id", make_table(points));
    REQUIRE(out.has_value());
    REQUIRE(out->rows() == points.size() - 1);
    for (std::size_t i = 0; i < out->rows(); ++i) {
        REQUIRE(out->points[i].x == points[i + 1].x);
        REQUIRE(out->points[i].y == Approx(points[i + 1].y));
    }
}

TEST_CASE("merge sums consecutive runs only") {
    auto out = merge(make_table({{1.0, 2.0}, {1.0, 3.0}, {2.0, 4.0}, {1.0, 2.0}}));
    REQUIRE(out.has_value());
    REQUIRE(out->points == std::vector<Point>{{1.0, 5.0}, {2.0, 4.0}, {1.0, 2.0}});
    REQUIRE(out->y_name == "y:Merge");
}

TEST_CASE("step differences consecutive rows without sorting") {
    auto out = step(make_table({{3.0, 1.0}, {1.0, 4.0}, {2.0, 2.0}}));
    REQUIRE(out.has_value());
    REQUIRE(out->points == std::vector<Point>{{1.0, 3.0}, {2.0, -2.0}});
    REQUIRE(out->y_name == "y:Step");

    auto single = step(make_table({{1.0, 1.0}}));
    REQUIRE(single.has_value());
    REQUIRE(single->empty());
}

TEST_CASE("average keeps one row per input row in input order") {
    auto input = make_table({{2.0, 20.0}, {0.0, 0.0}, {1.0, 10.0}, {5.0, 50.0}});
    auto out = average(input, {.left = 1.0, .right = 1.0});
    REQUIRE(out.has_value());
    REQUIRE(out->y_name == "y:Average(1,1)");
    REQUIRE(out->rows() == 4);
    REQUIRE(out->points[0] == Point{2.0, 15.0});
    REQUIRE(out->points[1] == Point{0.0, 5.0});
    REQUIRE(out->points[2] == Point{1.0, 10.0});
    REQUIRE(out->points[3] == Point{5.0, 50.0});
}

TEST_CASE("average with an asymmetric window") {
    auto input = make_table({{0.0, 1.0}, {1.0, 2.0}, {2.0, 3.0}, {3.0, 4.0}});
    auto out = average(input, {.left = 2.0, .right = 0.0});
    REQUIRE(out.has_value());
    REQUIRE(out->points[0].y == Approx(1.0));
    REQUIRE(out->points[1].y == Approx(1.5));
    REQUIRE(out->points[2].y == Approx(2.0));
    REQUIRE(out->points[3].y == Approx(3.0));
}

TEST_CASE("average is not disturbed by a large y elsewhere in the table") {
    auto input = make_table({{0.0, 1e20}, {10.0, 1.0}, {11.0, 3.0}});

    auto exact = average(input, {.left = 0.0, .right = 0.0});
    REQUIRE(exact.has_value());
    REQUIRE(exact->points == input.points);

    auto trailing = average(input, {.left = 1.0, .right = 0.0});
    REQUIRE(trailing.has_value());
    REQUIRE(trailing->points[0] == Point{0.0, 1e20});
    REQUIRE(trailing->points[1] == Point{10.0, 1.0});
    REQUIRE(trailing->points[2] == Point{11.0, 2.0});
}

TEST_CASE("average keeps small values next to a large one in the same window") {
    auto out = average(make_table({{0.0, 1e16}, {1.0, 1.0}, {2.0, -1e16}}),
                       {.left = 2.0, .right = 0.0});
    REQUIRE(out.has_value());
    REQUIRE(out->points[2].y == Approx(1.0 / 3.0));
}

TEST_CASE("finite drops NaN and infinite y") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    auto out = finite(make_table({{1.0, nan}, {2.0, 2.0}, {3.0, -inf}, {4.0, 4.0}}));
    REQUIRE(out.has_value());
    REQUIRE(out->points == std::vector<Point>{{2.0, 2.0}, {4.0, 4.0}});
}

TEST_CASE("unique keeps the first row per x in input order") {
    auto out = unique(make_table({{2.0, 1.0}, {1.0, 2.0}, {2.0, 3.0}, {-0.0, 4.0}, {0.0, 5.0}}));
    REQUIRE(out.has_value());
    REQUIRE(out->points == std::vector<Point>{{2.0, 1.0}, {1.0, 2.0}, {-0.0, 4.0}});
}

TEST_CASE("rotate swaps columns and names") {
    Table input{"time", "speed", {{1.0, 10.0}, {2.0, 20.0}}};
    auto out = rotate(input);
    REQUIRE(out.has_value());
    REQUIRE(out->x_name == "speed");
    REQUIRE(out->y_name == "time");
    REQUIRE(out->points == std::vector<Point>{{10.0, 1.0}, {20.0, 2.0}});
}

TEST_CASE("computed non-finite values are rejected") {
    const double big = std::numeric_limits<double>::max();
    auto summed = merge(make_table({{1.0, big}, {1.0, big}}));
    REQUIRE_FALSE(summed.has_value());
    REQUIRE(summed.error().kind == ErrorKind::NonFiniteValue);

    auto stepped = step(make_table({{1.0, -big}, {2.0, big}}));
    REQUIRE_FALSE(stepped.has_value());
    REQUIRE(stepped.error().kind == ErrorKind::NonFiniteValue);
}

TEST_CASE("cdf rejects non-finite input") {
    auto out = cdf(make_table({{1.0, std::numeric_limits<double>::quiet_NaN()}}));
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == ErrorKind::NonFiniteValue);
}

TEST_CASE("apply passes dump operators through") {
    auto input = make_table({{2.0, 1.0}, {1.0, 2.0}});
    auto out = run("COP", input);
    REQUIRE(out.has_value());
    REQUIRE(*out == input);
}
