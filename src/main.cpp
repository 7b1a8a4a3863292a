// main.cpp
#include <iostream>
#include <chrono>
#include <filesystem>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <stdexcept>
#include <string>
#include <utility>

#include "utilities.h"
#include "loop.h"
#include "garage.h"
#include "io.h"
#include "diagnostics.h"

// set by SIGINT, polled between slices
static std::atomic<bool> stop_requested{false};

extern "C" void handle_sigint(int) {
    stop_requested.store(true);
}

int main(int argc, char** argv) try {
    using clock_t = std::chrono::steady_clock;

    std::cout << "Preparing simulation\n";

    const auto t0_total = clock_t::now();

    // Parse CLI
    Cli cli;
    if (!parse_args(argc, argv, cli)) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    // Parse input file
    Garage garage;
    if (!parse_input_file(cli.input, garage)) {
        return EXIT_FAILURE;
    }

    XiStepper stepper(garage);
    Diagnostics diags(garage, stepper.grid());

    if (!cli.resume.empty()) {
        SimulationState state;
        if (!read_checkpoint(cli.resume, state)) {
            return EXIT_FAILURE;
        }
        stepper.restore(std::move(state));
        diags.skip_census(stepper.state().beam.census.size());
        std::cout << "Resuming at slice " << stepper.state().xi_index
                  << " (xi = " << stepper.state().xi << ")\n";
    }

    if (!create_output(cli.output)) {
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handle_sigint);

    // every slice feeds the histories and the checkpoint cadence
    const auto every_slice = [&](const SimulationState& s) {
        diags.record(s);
        if (stepper.checkpoint_due() && !write_checkpoint(garage.checkpoint_path, s)) {
            throw std::runtime_error("checkpoint write failed at slice " + std::to_string(s.xi_index));
        }
    };
    // console line and snapshot at the diagnostics cadence
    const auto observer = [&](const SimulationState& s) {
        if (!garage.quiet) std::cout << diags.line() << "\n";
        if (garage.diagnostics_snapshots && !write_snapshot(cli.output, s)) {
            throw std::runtime_error("snapshot write failed at slice " + std::to_string(s.xi_index));
        }
    };

    std::cout << "Running qswake simulation\n";
    const auto t0_sim = clock_t::now();
    if (!stepper.run(&stop_requested, observer, every_slice)) {
        std::cerr << "WARN: interrupted at slice " << stepper.state().xi_index << "\n";
    }
    const auto t1_sim = clock_t::now();

    // an interrupted run can always be continued
    if (!stepper.finished() && !garage.checkpoint_path.empty()) {
        if (!write_checkpoint(garage.checkpoint_path, stepper.state())) return EXIT_FAILURE;
        std::cout << "Checkpoint written to " << garage.checkpoint_path << "\n";
    }

    const auto t1_total = clock_t::now();

    const double sim_s   = std::chrono::duration<double>(t1_sim   - t0_sim  ).count();
    const double total_s = std::chrono::duration<double>(t1_total - t0_total).count();

    std::cout.setf(std::ios::fixed);
    std::cout.precision(6);
    std::cout << "Slices         : " << stepper.state().xi_index << " (" << stepper.retries() << " retries)\n";
    std::cout << "Simulation time: " << sim_s   << " s\n";
    std::cout << "Total time     : " << total_s << " s\n";

    if (!write_output(cli.output, stepper, diags, sim_s, total_s)) {
        return EXIT_FAILURE;
    }

    return stepper.finished() ? EXIT_SUCCESS : EXIT_FAILURE;
}
catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return EXIT_FAILURE;
}
catch (...) {
    std::cerr << "Unhandled non-standard exception.\n";
    return EXIT_FAILURE;
}
