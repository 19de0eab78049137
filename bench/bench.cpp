/**
 * @file bench.cpp
 * @brief Performance benchmarks for the sudokulogic deduction engine.
 *
 * Measures per-technique apply() cost on propagated grids and the cost of
 * complete solves, for regression testing during development. Use the
 * numbers for relative comparisons only.
 *
 * Usage:
 *   ./build/bench              # Run with default 1000 iterations
 *   ./build/bench 10000        # Run with custom iteration count
 */

#include <sudokulogic/sudokulogic.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>

using namespace sudokulogic;

static constexpr int DEFAULT_ITERATIONS = 1000;

struct SamplePuzzle {
    const char* name;
    const char* text;
};

static constexpr SamplePuzzle SAMPLES[] = {
    {"easy", "53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79"},
    {"euler-01", "..3.2.6..9..3.5..1..18.64....81.29..7.......8..67.82....26.95..8..2.3..9..5.1.3.."},
    {"sparse-17", "4.....8.5.3..........7......2.....6.....8.4......1.......6.3.7.5..2.....1.4......"},
    {"inkala", "8..........36......7..9.2...5...7.......457.....1...3...1....68..85...1..9....4.."},
};

// Givens placed and propagated: the state most techniques first see.
static bool propagated_grid(const char* text, TechniqueGrid& grid) {
    DigitGrid puzzle;
    if (DigitGrid::parse(text, puzzle) != Error::Ok) {
        return false;
    }
    grid = TechniqueGrid::from_digit_grid(puzzle);
    NakedSingle propagation;
    bool changed = true;
    while (changed) {
        if (propagation.apply(grid, changed) != Error::Ok) {
            return false;
        }
    }
    return true;
}

static void bench_technique(const Technique& technique, const TechniqueGrid& start, int iterations) {
    // Warmup run
    TechniqueGrid warmup = start;
    bool changed = false;
    Error result = technique.apply(warmup, changed);

    auto begin = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        TechniqueGrid grid = start;
        result = technique.apply(grid, changed);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - begin).count();
    double per_iter_us = total_us / static_cast<double>(iterations);

    std::printf("  %-22s %8.2f µs/apply  %s\n", technique.name(), per_iter_us,
                result != Error::Ok ? "inconsistent" : (changed ? "progress" : "no change"));
}

static void bench_solve(const char* name, const char* text, const TechniqueSolver& solver,
                        int iterations) {
    DigitGrid puzzle;
    if (DigitGrid::parse(text, puzzle) != Error::Ok) {
        std::printf("%-12s SKIP (invalid puzzle)\n", name);
        return;
    }

    bool solved = false;
    TechniqueSolverStats stats;
    Error result = Error::Ok;

    auto begin = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        TechniqueGrid grid = TechniqueGrid::from_digit_grid(puzzle);
        result = solver.solve(grid, solved, stats);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - begin).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    auto hardest = stats.max_tier(solver);

    std::printf("%-12s %10.2f µs/solve  %4zu steps  %-8s %s\n", name, per_iter_us,
                stats.total_steps(),
                result != Error::Ok ? "error" : (solved ? "solved" : "stuck"),
                hardest ? tier_name(*hardest) : "-");
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("sudokulogic Benchmarks (C++ Implementation)\n");
    std::printf("===========================================\n");
    std::printf("Iterations: %d\n", iterations);

    const auto techniques = all_techniques();
    for (const SamplePuzzle& sample : SAMPLES) {
        TechniqueGrid start;
        if (!propagated_grid(sample.text, start)) {
            std::printf("\n%s: SKIP (invalid puzzle)\n", sample.name);
            continue;
        }
        std::printf("\nTechnique apply (%s, propagated):\n", sample.name);
        for (const BoxedTechnique& technique : techniques) {
            bench_technique(*technique, start, iterations);
        }
    }

    const TechniqueSolver all = TechniqueSolver::with_all_techniques();
    const TechniqueSolver fundamental = TechniqueSolver::with_fundamental_techniques();

    std::printf("\nFull solve (all techniques):\n");
    for (const SamplePuzzle& sample : SAMPLES) {
        bench_solve(sample.name, sample.text, all, iterations);
    }

    std::printf("\nFull solve (fundamental techniques):\n");
    for (const SamplePuzzle& sample : SAMPLES) {
        bench_solve(sample.name, sample.text, fundamental, iterations);
    }

    std::printf("\nNote: Use these results for relative comparisons only.\n");

    return 0;
}
