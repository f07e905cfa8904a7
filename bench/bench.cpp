/**
 * @file bench.cpp
 * @brief Performance benchmarks for DCD encoding.
 *
 * Measures encoding throughput for regression testing during development.
 *
 * Usage:
 *   ./build/dcdgen_bench              # Run with default 1000 iterations
 *   ./build/dcdgen_bench 10000        # Run with custom iteration count
 */

#include <dcdgen/dcdgen.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace dcdgen;

static constexpr int DEFAULT_ITERATIONS = 1000;

/// Writes alternating in op so that no two neighbours merge
static std::vector<Command> make_mixed(std::size_t count) {
    std::vector<Command> commands;
    commands.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto address = static_cast<std::uint32_t>(0x400F'C000U + (i * 4U));
        switch (i % 4) {
        case 0:
            commands.push_back(set_reg(Width::B4, address, 1U << (i % 32)));
            break;
        case 1:
            commands.push_back(clear_reg(Width::B4, address, 1U << (i % 32)));
            break;
        case 2:
            commands.push_back(check_all_set(Width::B4, address, 0x8000'0000U));
            break;
        default:
            commands.push_back(Nop{});
            break;
        }
    }
    return commands;
}

/// One long mergeable run
static std::vector<Command> make_run(std::size_t count) {
    std::vector<Command> commands;
    commands.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        commands.push_back(
            write_reg(Width::B4, static_cast<std::uint32_t>(0x401F'8000U + (i * 4U)), 0x10B0U));
    }
    return commands;
}

static void bench_encode(const char* name, const std::vector<Command>& commands, int iterations) {
    std::size_t length = 0;
    if (block_length(commands.data(), commands.size(), length) != Error::Ok) {
        std::printf("%-20s SKIP (block too large)\n", name);
        return;
    }

    VectorSink sink;
    std::size_t written = 0;

    // Warmup run
    (void)encode(sink, commands, written);

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        VectorSink out;
        (void)encode(out, commands, written);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_command_ns = (per_iter_us * 1000.0) / static_cast<double>(commands.size());

    std::printf("%-20s %8.2f µs/iter  %6.1f ns/cmd  %6zu bytes  (%zu cmds)\n", name, per_iter_us,
                per_command_ns, written, commands.size());
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iterations must be positive\n");
            return 1;
        }
    }

    std::printf("dcdgen %s encode benchmark (%d iterations)\n\n", version(), iterations);

    bench_encode("mixed-64", make_mixed(64), iterations);
    bench_encode("mixed-4096", make_mixed(4096), iterations);
    bench_encode("merged-64", make_run(64), iterations);
    bench_encode("merged-8000", make_run(8000), iterations);

    return 0;
}
