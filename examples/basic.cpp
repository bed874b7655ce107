#include <splot/parser/opseq.hpp>
#include <splot/runtime/csv.hpp>
#include <splot/runtime/transforms.hpp>

#include <fmt/core.h>

#include <iostream>

auto main() -> int {
    // Noisy samples of y = x^2
    splot::Table table{"t", "position"};
    for (int i = 0; i < 10; ++i) {
        const double x = i * 0.5;
        table.add_row(x, x * x + ((i % 3) - 1) * 0.1);
    }

    fmt::print("=== Operator sequence ===\n");
    auto seq = splot::parser::parse("od1,0a0.5,0.5");
    if (!seq) {
        fmt::print("parse failed: {}\n", seq.error().format());
        return 1;
    }
    fmt::print("canonical: {}\n", seq->to_string());
    fmt::print("cache key: {}\n", seq->key());

    fmt::print("\n=== Transforms ===\n");
    for (const auto& op : seq->ops()) {
        auto next = splot::runtime::apply(op, std::move(table));
        if (!next) {
            fmt::print("{} failed: {}\n", op.canonical(), next.error().format());
            return 1;
        }
        table = std::move(*next);
        fmt::print("{}: {} rows, y = {}\n", op.canonical(), table.rows(), table.y_name);
    }

    fmt::print("\n=== Result ===\n");
    splot::runtime::write_table(table, std::cout);
    return 0;
}
