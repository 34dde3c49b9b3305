/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ostr.h>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::shared_ptr<satsim::Planet> makePlanet(const satsim::Config &config) {
    return std::make_shared<satsim::Planet>(config.getPlanetMu(), config.getPlanetRadius(), config.getPlanetDay());
}

/** Build a simulation holding every --sat of the configuration */
satsim::Simulation makeSimulation(const satsim::Config &config) {
    using namespace satsim;

    auto planet = makePlanet(config);
    Simulation simulation(planet, "satsim", config.getSpeed(), config.getTimeStep());
    simulation.setVerbose(config.getVerbose());

    for (const auto &specStr : config.getSatellites()) {
        auto spec = parseSatelliteSpec(specStr);
        spec.name = simulation.makeUniqueName(spec.name);
        simulation.addSatellite(Satellite::fromSpec(spec, planet, config.getPropagator(), Constants()));
    }
    return simulation;
}

void printPositions(const satsim::Simulation &simulation) {
    constexpr std::string_view rowFormat = "{:>10.1f} {:<20} {:>12.3f} {:>12.3f} {:>12.3f} {:>10.4f}";

    for (const auto &satellite : simulation.getSatellites()) {
        auto position = satellite.getCurrentPosition().asCartesian();
        std::cout << fmt::format(rowFormat,
            simulation.getTime(),
            satellite.getName().substr(0, 20),
            position.x,
            position.y,
            position.z,
            satellite.getOrbit().getSpeed()) << std::endl;
    }
}

void runSimulation(const satsim::Config &config) {
    using namespace std::chrono;

    auto simulation = makeSimulation(config);
    satsim::StepLog log;

    constexpr std::string_view headerFormat = "{:>10} {:<20} {:>12} {:>12} {:>12} {:>10}";
    std::cout << fmt::format(headerFormat, "t (s)", "Satellite", "x (km)", "y (km)", "z (km)", "v (km/s)") << std::endl;
    std::cout << std::string(81, '-') << std::endl;

    printPositions(simulation);
    log.record(simulation);

    auto steps = static_cast<long>(std::ceil(config.getDuration() / config.getTimeStep()));
    double nextOutput = config.getOutputInterval();
    auto tick = duration<double>(config.getTimeStep() / config.getSpeed());

    spdlog::debug("Running {} steps of {} s with the {} propagator", steps, config.getTimeStep(),
                  fmt::streamed(config.getPropagator()));

    for (long step = 0; step < steps; step++) {
        auto start = steady_clock::now();
        simulation.update();

        if (simulation.getTime() + 1e-9 >= nextOutput) {
            printPositions(simulation);
            log.record(simulation);
            while (nextOutput <= simulation.getTime() + 1e-9) {
                nextOutput += config.getOutputInterval();
            }
        }

        if (config.getRealtime()) {
            std::this_thread::sleep_until(start + duration_cast<steady_clock::duration>(tick));
        }
    }

    if (config.hasExportLog()) {
        log.write(expandTilde(config.getExportLog()), simulation);
    }
}

/** Program entry point */
int main(int argc, char* argv[]) {

    satsim::Config config;
    config.setTimeStep(satsim::DEFAULT_TIME_STEP);
    config.setDuration(satsim::DEFAULT_DURATION);
    config.setVerbose(false);
    spdlog::set_level(spdlog::level::info);

    auto configFile = expandTilde("~/.satsim.toml");

    CLI::App app{"SatSim"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");
    app.add_option_function<double>("--mu",
        [&config](const double mu) { config.setPlanetMu(mu); },
        "Gravitational parameter of the planet in km³/s² (default Earth)");
    app.add_option_function<double>("--radius",
        [&config](const double r) { config.setPlanetRadius(r); },
        "Radius of the planet in km (default Earth)");
    app.add_option_function<double>("--day",
        [&config](const double d) { config.setPlanetDay(d); },
        "Sidereal day of the planet in seconds (default Earth)");

    app.ignore_case();

    auto addSatelliteOption = [&config](CLI::App *command) {
        command->add_option_function<std::vector<std::string>>("--sat",
            [&config](const std::vector<std::string> &specs) {
                for (const auto &spec : specs) {
                    config.addSatellite(spec);
                }
            },
            "Satellite as name:a:e:i:Omega:omega[:tp] (km, degrees, seconds); may be repeated");
    };

    // Run command - step the simulation and print positions
    auto runCommand = app.add_subcommand("run", "Propagate satellites and print their positions");
    addSatelliteOption(runCommand);
    runCommand->add_option_function<double>("--dt",
        [&config](const double dt) { config.setTimeStep(dt); },
        "Time step in seconds (default 1, range 0.001 to 60)");
    runCommand->add_option_function<double>("--duration",
        [&config](const double d) { config.setDuration(d); },
        "Simulated time in seconds (default 5400)");
    runCommand->add_option_function<double>("--speed",
        [&config](const double s) { config.setSpeed(s); },
        "Simulation speed factor when running in real time (default 1)");
    runCommand->add_option_function<double>("--interval",
        [&config](const double i) { config.setOutputInterval(i); },
        "Simulated seconds between printed positions (default 60)");
    runCommand->add_option_function<std::string>("--propagator",
        [&config](const std::string &name) { config.setPropagator(satsim::parsePropagatorType(name)); },
        "Propagation strategy: kepler, rk4 or rkf78 (default kepler)");
    runCommand->add_flag_function("--realtime",
        [&config](const int64_t r) { config.setRealtime(r > 0); },
        "Pace the simulation to wall-clock time divided by the speed factor");
    runCommand->add_option_function<std::string>("--export-log",
        [&config](const std::string &path) { config.setExportLog(path); },
        "Write the printed steps to this file as JSON");

    // Info command - describe the planet and the orbits
    auto infoCommand = app.add_subcommand("info", "Display planet and orbit information");
    addSatelliteOption(infoCommand);

    // Trajectory command - sample whole orbits without moving the satellites
    auto trajectoryCommand = app.add_subcommand("trajectory", "Print positions sampled around each orbit");
    addSatelliteOption(trajectoryCommand);
    trajectoryCommand->add_option_function<int>("--points",
        [&config](const int points) { config.setTrajectoryPoints(points); },
        "Number of samples per orbit (default 36)");

    // Command callbacks

    runCommand->final_callback([runCommand, &config](void) {
        if (!config.hasSatellites()) {
            std::cerr << "Please provide at least one satellite." << std::endl;
            std::cerr << runCommand->help() << std::endl;
            std::exit(1);
        }
        try {
            runSimulation(config);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    infoCommand->final_callback([&config](void) {
        try {
            auto simulation = makeSimulation(config);
            auto planet = simulation.getPlanet();

            std::cout << "Planet: " << planet->getName() << std::endl;
            std::cout << "  Gravitational Parameter: " << planet->getMu() << " km³/s²" << std::endl;
            std::cout << "  Radius: " << planet->getRadius() << " km" << std::endl;
            std::cout << "  Sidereal Day: " << planet->getDay() << " s" << std::endl;
            std::cout << "  Geostationary Radius: " << planet->getGeostationaryRadius() << " km" << std::endl;
            std::cout << std::endl;

            for (const auto &satellite : simulation.getSatellites()) {
                satellite.printInfo(std::cout);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    trajectoryCommand->final_callback([trajectoryCommand, &config](void) {
        using namespace satsim;
        if (!config.hasSatellites()) {
            std::cerr << "Please provide at least one satellite." << std::endl;
            std::cerr << trajectoryCommand->help() << std::endl;
            std::exit(1);
        }
        try {
            auto simulation = makeSimulation(config);

            constexpr std::string_view headerFormat = "{:>10} {:>12} {:>12} {:>12} {:>12}";
            constexpr std::string_view rowFormat = "{:>10.2f} {:>12.3f} {:>12.3f} {:>12.3f} {:>12.3f}";

            for (const auto &satellite : simulation.getSatellites()) {
                const auto &orbit = satellite.getOrbit();
                int points = config.getTrajectoryPoints();

                std::cout << "Trajectory of " << satellite.getName() << ":" << std::endl;
                std::cout << fmt::format(headerFormat, "M (deg)", "x (km)", "y (km)", "z (km)", "r (km)") << std::endl;
                std::cout << std::string(62, '-') << std::endl;

                for (int k = 0; k < points; k++) {
                    double m = TWO_PI * k / points;
                    auto point = orbit.getPointAt(m);
                    auto position = point.asCartesian();
                    std::cout << fmt::format(rowFormat,
                        m * RADIANS_TO_DEGREES,
                        position.x,
                        position.y,
                        position.z,
                        point.getRadius()) << std::endl;
                }
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
