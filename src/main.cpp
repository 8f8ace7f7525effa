#include "EventSystem.h"
#include "QuadrupoleGravity.h"
#include "ScenarioFactory.h"

#include <cstdlib>
#include <iostream>
#include <string>

// Usage: gravity_demo [scenario] [steps] [particle count]
int main(int argc, char** argv) {
    const std::string name = argc > 1 ? argv[1] : "plummer";
    const long steps = argc > 2 ? std::strtol(argv[2], nullptr, 10) : 200;
    const long count = argc > 3 ? std::strtol(argv[3], nullptr, 10) : 0;

    if (steps <= 0 || count < 0) {
        std::cerr << "usage: " << argv[0] << " [scenario] [steps > 0] [count >= 0]\n";
        return EXIT_FAILURE;
    }

    try {
        ScenarioFactory factory;
        Scenario scenario = factory.by_name(name, static_cast<size_t>(count));

        EventBus bus;
        bus.subscribe<BoundsUpdatedEvent>(Events::BOUNDS_UPDATED, [](const BoundsUpdatedEvent& e) {
            std::cout << "bounds refreshed: [" << e.min_x << ", " << e.min_y << ", " << e.min_z
                      << "] .. [" << e.max_x << ", " << e.max_y << ", " << e.max_z << "] ("
                      << e.valid_particles << " particles)\n";
        });

        QuadrupoleGravity sim(bus, scenario.config, scenario.position_mass, scenario.velocity);
        const SimulationDiagnostics start = sim.capture_diagnostics();
        std::cout << "start: " << start.summary() << "\n";

        const long report_every = steps >= 10 ? steps / 10 : 1;
        for (long i = 1; i <= steps; ++i) {
            sim.step();
            if (i % report_every == 0) {
                std::cout << sim.capture_diagnostics(false).summary() << "\n";
            }
        }

        const SimulationDiagnostics end = sim.capture_diagnostics();
        std::cout << "end:   " << end.summary() << "\n";
        if (start.total_energy() != 0.0) {
            std::cout << "relative energy drift: "
                      << (end.total_energy() - start.total_energy()) / std::abs(start.total_energy()) << "\n";
        }
        sim.print_performance_analysis();
        sim.dispose();
    } catch (const std::exception& e) {
        std::cerr << "gravity_demo: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
