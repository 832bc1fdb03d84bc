/**
 * gattbench CLI - BLE GATT throughput test harness
 *
 * Drives throughput / latency / RSSI trials and full sweeps against the
 * in-process simulated peripheral.
 */

#include "client/simulated_link.hpp"
#include "client/trial_runner.hpp"
#include "common/cancel_token.hpp"
#include "common/clock.hpp"
#include "config/sweep_settings.hpp"
#include "peripheral/fault_profile.hpp"
#include "peripheral/peripheral_session.hpp"
#include "runner/trial_orchestrator.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

using namespace gattbench;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cerr << "gattbench - BLE GATT throughput test harness\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  sweep           Scenarios x PHYs x payloads x repeats, plus latency and RSSI runs\n";
    std::cerr << "  throughput      One throughput trial\n";
    std::cerr << "  latency         One latency run\n";
    std::cerr << "  rssi            One RSSI sampling run\n";
    std::cerr << "  profiles        Print the fault presets\n";
    std::cerr << "  info            Show service layout and defaults\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c, --config <file>     Settings file (default: $GATTBENCH_CONFIG or ~/.config/gattbench/sweep.ini)\n";
    std::cerr << "  --save-config <file>    Write the effective settings and exit\n";
    std::cerr << "  --set <key=value>       Override any settings key\n";
    std::cerr << "  --<key> <value>         Same as --set, dashes become underscores\n";
    std::cerr << "                            e.g. --payloads 20,120 --phys auto,2m --duration-s 5\n";
    std::cerr << "  --preset <name>         Fault preset for single trials (default: from scenario)\n";
    std::cerr << "  --resume                Skip trials already in the throughput table\n";
    std::cerr << "  --skip-throughput, --skip-latency, --skip-rssi\n";
    std::cerr << "  --no-faults             Run the peripheral without fault injection\n";
    std::cerr << "  --log <file>            Write log output to a file\n";
    std::cerr << "  -v, -vv                 Debug / trace logging\n";
    std::cerr << "  -q                      Warnings and errors only\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " throughput --payloads 20 --duration-s 5 --preset best\n";
    std::cerr << "  " << prog << " sweep --scenarios baseline,phone_in_pocket --repeats 2 --resume\n";
    std::cerr << "\n";
}

void printInfo(const config::SweepSettings& settings) {
    std::cout << "=== gattbench ===\n\n";
    std::cout << "Service:\n";
    std::cout << "  Service UUID:   " << SERVICE_UUID << "\n";
    std::cout << "  TX (notify):    " << TX_CHAR_UUID << "\n";
    std::cout << "  RX (write):     " << RX_CHAR_UUID << "\n";
    std::cout << "  RSSI (read):    " << RSSI_CHAR_UUID << "\n\n";

    std::cout << "Notification:  [SEQ_LO][SEQ_HI][TS_LO][TS_HI][DATA x N] (filler 0xAA)\n";
    std::cout << "Commands:      START=0x" << std::hex << settings.start_opcode
              << " [payload u8][count u16 LE], STOP=0x" << settings.stop_opcode
              << ", RESET=0x" << settings.reset_opcode << std::dec << "\n\n";

    std::cout << "Defaults:\n";
    std::cout << "  Notify rate:    " << settings.notify_hz << " Hz\n";
    std::cout << "  Payloads:       " << config::joinList(settings.payloads) << " bytes\n";
    std::cout << "  PHYs:           " << config::joinList(settings.phys) << "\n";
    std::cout << "  Scenarios:      " << config::joinList(settings.scenarios) << "\n";
    std::cout << "  Trial duration: " << settings.duration_s << " s\n";
    std::cout << "  Settings file:  " << config::SweepSettings::getDefaultPath() << "\n";
}

void printProfiles() {
    for (const auto& name : peripheral::presetNames()) {
        auto profile = peripheral::presetProfile(name);
        std::cout << name << ":\n  " << profile.describe() << "\n";
    }
}

// ============================================================================
// Simulated test bench: virtual clock + peripheral + link + trial runner
// ============================================================================

struct SimBench {
    SimClock clock;
    std::unique_ptr<peripheral::PeripheralSession> peer;
    std::unique_ptr<client::SimulatedLink> link;
    std::unique_ptr<client::GattTrialRunner> runner;

    SimBench(const config::SweepSettings& settings, const CancelToken& cancel) {
        clock.setMaxSpeedup(settings.sim_speedup);
        peer = std::make_unique<peripheral::PeripheralSession>(settings.toPeripheralConfig());
        link = std::make_unique<client::SimulatedLink>(clock, *peer, settings.toSimLinkConfig(), settings.seed + 1);
        runner = std::make_unique<client::GattTrialRunner>(*link, clock, cancel, settings.toRunnerConfig());
        peripheral::PeripheralSession* session = peer.get();
        runner->setPeerConfigurator([session](const peripheral::FaultProfile& profile) {
            return session->configure(profile);
        });
    }

    ~SimBench() {
        // Link unregisters from the clock and the peer before they go away
        runner.reset();
        link.reset();
        peer.reset();
    }
};

std::optional<peripheral::FaultProfile> singleTrialProfile(const config::SweepSettings& settings,
                                                           const runner::TrialOrchestrator& orchestrator,
                                                           const std::string& preset,
                                                           const std::string& scenario) {
    if (!settings.fault_profiles) {
        return std::nullopt;
    }
    std::string name = preset.empty() ? orchestrator.presetForScenario(scenario) : preset;
    return peripheral::resolveFaultProfile(name, orchestrator.plan().overrides);
}

int runSingle(const std::string& command, const config::SweepSettings& settings,
              const std::string& preset, const CancelToken& cancel) {
    SimBench bench(settings, cancel);
    runner::SweepPlan plan = settings.toSweepPlan();
    runner::TrialOrchestrator mapping(*bench.runner, cancel, plan);

    runner::AdapterLock lock(plan.lock_dir, plan.adapter);
    runner::ScopedAdapterLock hold(lock, plan.lock_mode,
                                   static_cast<uint32_t>(plan.lock_timeout_s * 1000.0), cancel);

    std::string scenario = settings.scenarios.empty() ? "baseline" : settings.scenarios.front();
    std::string phy = settings.phys.empty() ? "auto" : settings.phys.front();
    auto profile = singleTrialProfile(settings, mapping, preset, scenario);

    if (command == "throughput") {
        client::ThroughputTrialParams params;
        params.scenario = scenario;
        params.phy = phy;
        params.payload_bytes = settings.payloads.empty() ? 20 : settings.payloads.front();
        params.duration_s = settings.duration_s;
        params.packet_count = static_cast<uint16_t>(settings.packet_count);
        params.fault_profile = profile;
        auto r = bench.runner->runThroughput(params);
        printf("%s | %s | %d bytes: %llu packets, %llu lost, %llu reordered, %llu malformed\n",
               r.scenario.c_str(), r.phy.c_str(), r.payload_bytes,
               static_cast<unsigned long long>(r.packets_received),
               static_cast<unsigned long long>(r.estimated_lost),
               static_cast<unsigned long long>(r.reordered_packets),
               static_cast<unsigned long long>(r.malformed_packets));
        printf("  %.2f kbps, %.1f notifications/s over %.3fs, jitter %.2f ms, %d connection attempts, status %s\n",
               r.throughput_kbps, r.notification_rate_per_s, r.duration_s, r.jitter_ms,
               r.connection_attempts_used, trialStatusToString(r.status));
        if (!r.log_paths.json.empty()) printf("  log: %s\n", r.log_paths.json.c_str());
        if (!r.notes.empty()) printf("  notes: %s\n", r.notes.c_str());
        return r.status == TrialStatus::OK ? 0 : 1;
    }

    if (command == "latency") {
        client::LatencyTrialParams params;
        params.scenario = scenario;
        params.phy = phy;
        params.mode = settings.latency_mode;
        params.iterations = settings.latency_iterations;
        params.timeout_s = settings.latency_timeout_s;
        params.payload_bytes = settings.latency_payload_bytes > 0 ? settings.latency_payload_bytes
                             : (settings.payloads.empty() ? 20 : settings.payloads.front());
        params.fault_profile = profile;
        auto r = bench.runner->runLatency(params);
        if (r.avg_latency_s) {
            printf("%s | %s | %s: avg %.2f ms, min %.2f ms, max %.2f ms (%d samples, %d timeouts)\n",
                   r.scenario.c_str(), r.phy.c_str(), r.mode.c_str(), *r.avg_latency_s * 1000.0,
                   *r.min_latency_s * 1000.0, *r.max_latency_s * 1000.0, r.samples, r.timeouts);
        } else {
            printf("%s | %s | %s: no latency samples (%d timeouts)\n",
                   r.scenario.c_str(), r.phy.c_str(), r.mode.c_str(), r.timeouts);
        }
        if (!r.log_paths.json.empty()) printf("  log: %s\n", r.log_paths.json.c_str());
        return r.avg_latency_s ? 0 : 1;
    }

    client::RssiTrialParams params;
    params.scenario = scenario;
    params.phy = phy;
    params.samples = settings.rssi_samples;
    params.interval_s = settings.rssi_interval_s;
    params.fault_profile = profile;
    auto r = bench.runner->runRssi(params);
    printf("%s | %s: %d samples, RSSI %s\n", r.scenario.c_str(), r.phy.c_str(),
           r.samples_collected, r.rssi_available ? "available" : "unavailable");
    if (!r.log_paths.json.empty()) printf("  log: %s\n", r.log_paths.json.c_str());
    return 0;
}

int runSweep(const config::SweepSettings& settings, const CancelToken& cancel) {
    SimBench bench(settings, cancel);
    runner::TrialOrchestrator orchestrator(*bench.runner, cancel, settings.toSweepPlan());
    auto result = orchestrator.run();

    printf("\n=== Scenario Comparison ===\n");
    for (const auto& scenario : settings.scenarios) {
        for (const auto& phy : settings.phys) {
            std::vector<TrialRecord> rows;
            for (const auto& r : result.throughput) {
                if (r.scenario == scenario && r.phy == phy) rows.push_back(r);
            }
            if (auto s = runner::summarizeThroughput(rows)) {
                printf("%s | PHY %s: %.2f kbps avg, packets %llu, loss %llu\n", scenario.c_str(), phy.c_str(),
                       s->avg_throughput_kbps, static_cast<unsigned long long>(s->total_packets),
                       static_cast<unsigned long long>(s->total_loss));
            } else {
                printf("%s | PHY %s: no throughput data\n", scenario.c_str(), phy.c_str());
            }
        }
    }
    if (!result.errors.empty()) {
        printf("\nCompleted with errors:\n");
        for (const auto& e : result.errors) {
            printf("  - %s|%s %s: [%s] %s\n", e.scenario.c_str(), e.phy.c_str(), e.stage.c_str(),
                   e.kind.c_str(), e.message.c_str());
        }
    }
    printf("\nThroughput table: %s\nManifest: %s\n", orchestrator.throughputTablePath().c_str(),
           result.manifest_path.c_str());

    if (result.interrupted) return 130;
    return result.errors.empty() ? 0 : 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2 || strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string command = argv[1];
    std::string config_path;
    std::string save_path;
    std::string preset;
    std::string log_path;
    LogLevel level = LogLevel::INFO;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--save-config" && i + 1 < argc) {
            save_path = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            log_path = argv[++i];
        } else if (arg == "-v") {
            level = LogLevel::DEBUG;
        } else if (arg == "-vv") {
            level = LogLevel::TRACE;
        } else if (arg == "-q") {
            level = LogLevel::WARN;
        } else if (arg == "--resume") {
            overrides.emplace_back("resume", "1");
        } else if (arg == "--skip-throughput" || arg == "--skip-latency" || arg == "--skip-rssi") {
            std::string key = arg.substr(2);
            std::replace(key.begin(), key.end(), '-', '_');
            overrides.emplace_back(key, "1");
        } else if (arg == "--no-faults") {
            overrides.emplace_back("fault_profiles", "0");
        } else if (arg == "--set" && i + 1 < argc) {
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                std::cerr << "--set expects key=value, got '" << kv << "'\n";
                return 1;
            }
            overrides.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0 && i + 1 < argc) {
            std::string key = arg.substr(2);
            std::replace(key.begin(), key.end(), '-', '_');
            overrides.emplace_back(key, argv[++i]);
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    setLogLevel(level);
    FILE* log_file = nullptr;
    if (!log_path.empty()) {
        log_file = fopen(log_path.c_str(), "a");
        if (!log_file) {
            std::cerr << "Error: Cannot open log file " << log_path << "\n";
            return 1;
        }
        setLogFile(log_file);
    }

    int rc = 0;
    try {
        config::SweepSettings settings;
        if (!settings.load(config_path) && !config_path.empty()) {
            throw ConfigError("cannot read settings file " + config_path);
        }
        for (const auto& [key, value] : overrides) {
            if (!config::applySetting(settings, key, value)) {
                throw ConfigError("unknown setting '" + key + "'");
            }
        }
        settings.validate();

        if (!save_path.empty()) {
            if (!settings.save(save_path)) {
                throw ConfigError("cannot write settings file " + save_path);
            }
            std::cout << "Settings written to " << save_path << "\n";
        } else if (command == "info") {
            printInfo(settings);
        } else if (command == "profiles") {
            printProfiles();
        } else if (command == "sweep" || command == "throughput" || command == "latency" || command == "rssi") {
            std::signal(SIGINT, signalHandler);
            std::signal(SIGTERM, signalHandler);

            // Bridges the signal flag to the cancel token every wait observes
            CancelToken cancel;
            std::atomic<bool> done{false};
            std::thread watcher([&cancel, &done]() {
                while (!done) {
                    if (!g_running) {
                        cancel.cancel();
                        break;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
            });

            try {
                rc = command == "sweep" ? runSweep(settings, cancel) : runSingle(command, settings, preset, cancel);
            } catch (...) {
                done = true;
                watcher.join();
                throw;
            }
            done = true;
            watcher.join();
        } else {
            std::cerr << "Unknown command: " << command << "\n\n";
            printUsage(argv[0]);
            rc = 1;
        }
    } catch (const LockContentionError& e) {
        LOG_RUNNER(ERROR, "%s", e.what());
        std::cerr << "Error: adapter busy (" << e.lockPath() << ")\n";
        rc = 2;
    } catch (const CancelledError&) {
        std::cerr << "Interrupted\n";
        rc = 130;
    } catch (const Error& e) {
        std::cerr << "Error [" << e.kind() << "]: " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal exception in gattbench: " << e.what() << "\n";
        rc = 3;
    }

    if (log_file) {
        setLogFile(nullptr);
        fclose(log_file);
    }
    return rc;
}
