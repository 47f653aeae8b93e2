// pump-sim - Launchpad simulation CLI
//
// Runs a launch against an in-process venue and prints the outcome as JSON.

#include "pump/launchpad.hpp"
#include "pump/log.hpp"
#include "pump/state.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    bool verbose = false;
    uint32_t traders = 8;
    std::string buy_amount = "2000000e18";
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

pump::Amount parse_amount_or_exit(const std::string& text) {
    auto amount = pump::amount_from_string(text);
    if (!amount) {
        std::cerr << "Invalid amount: " << text << "\n";
        std::exit(1);
    }
    return *amount;
}

json progress_json(const pump::curve::Progress& p) {
    return json{
        {"raised", pump::to_string(p.raised)},
        {"target", pump::to_string(p.target)},
        {"progress_bps", p.progress_bps},
        {"tokens_sold", pump::to_string(p.tokens_sold)},
    };
}

json stats_json(const pump::Launchpad::Stats& s) {
    return json{
        {"tokens_created", s.tokens_created},
        {"tokens_graduated", s.tokens_graduated},
        {"buys", s.buys},
        {"sells", s.sells},
        {"burns", s.burns},
        {"failed_graduations", s.failed_graduations},
        {"total_volume", pump::to_string(s.total_volume)},
    };
}

// Creator plus funded traders on a launchpad wired to a local venue
struct Simulation {
    pump::Launchpad launchpad;
    std::shared_ptr<pump::LocalVenue> venue;
    pump::Address creator = pump::addresses::from_index(100);
    pump::TokenId token = 0;

    explicit Simulation(const pump::LaunchpadConfig& config)
        : launchpad(config), venue(std::make_shared<pump::LocalVenue>()) {
        pump::CallContext owner{config.accounts.owner};
        pump::ErrorCode err = launchpad.set_liquidity_venue(owner, venue);
        if (err != pump::ErrorCode::Ok) {
            std::cerr << "Failed to set venue: " << pump::to_string(err) << "\n";
            std::exit(1);
        }

        pump::Amount fee = launchpad.admin().schedule().creation_fee;
        if (fee > 0) {
            err = launchpad.vault().deposit(creator, fee);
            if (err != pump::ErrorCode::Ok) {
                std::cerr << "Failed to fund creator: " << pump::to_string(err) << "\n";
                std::exit(1);
            }
        }

        auto created = launchpad.create_token(pump::CallContext{creator, fee}, "Simulated",
                                              "SIM", "pump-sim launch", "ipfs://sim");
        if (!created) {
            std::cerr << "Token creation failed: " << pump::to_string(created.error) << "\n";
            std::exit(1);
        }
        token = created.value;
    }
};

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

void cmd_simulate(const pump::LaunchpadConfig& config, const Options& options, bool dump_state) {
    Simulation sim(config);
    pump::Amount buy_amount = parse_amount_or_exit(options.buy_amount);

    json trades = json::array();
    uint32_t round = 0;
    while (sim.launchpad.token(sim.token)->is_active() && round < 1000) {
        pump::Address trader = pump::addresses::from_index(1000 + (round % options.traders));
        pump::ErrorCode err = sim.launchpad.vault().deposit(trader, buy_amount);
        if (err != pump::ErrorCode::Ok) {
            std::cerr << "Deposit failed: " << pump::to_string(err) << "\n";
            std::exit(1);
        }

        auto bought = sim.launchpad.buy(pump::CallContext{trader}, sim.token, buy_amount, 0);
        if (!bought) {
            std::cerr << "Buy " << round << " failed: " << pump::to_string(bought.error) << "\n";
            std::exit(1);
        }
        trades.push_back({
            {"trader", pump::to_hex(trader)},
            {"base_in", pump::to_string(buy_amount)},
            {"tokens_out", pump::to_string(bought.value)},
            {"price", pump::to_string(sim.launchpad.price(sim.token).value)},
        });
        ++round;
    }

    if (dump_state) {
        std::cout << sim.launchpad.export_state().dump(2) << "\n";
        return;
    }

    json out = {
        {"token", *sim.launchpad.token(sim.token)},
        {"progress", progress_json(sim.launchpad.progress(sim.token).value)},
        {"holders", sim.launchpad.holder_count(sim.token)},
        {"trades", trades},
        {"stats", stats_json(sim.launchpad.get_stats())},
        {"venue_pools", sim.venue->pool_count()},
    };
    std::cout << out.dump(2) << "\n";
}

void cmd_quote(const pump::LaunchpadConfig& config, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: pump-sim quote <base_in>\n";
        std::exit(1);
    }
    Simulation sim(config);
    pump::Amount base_in = parse_amount_or_exit(args[1]);

    auto quote = sim.launchpad.quote_buy(sim.token, base_in);
    if (!quote) {
        std::cerr << "Quote failed: " << pump::to_string(quote.error) << "\n";
        std::exit(1);
    }
    json out = {
        {"base_in", pump::to_string(base_in)},
        {"tokens_out", pump::to_string(quote.value)},
        {"price", pump::to_string(sim.launchpad.price(sim.token).value)},
    };
    std::cout << out.dump(2) << "\n";
}

void run_command(const pump::LaunchpadConfig& config, const Options& options) {
    const auto& args = options.command_args;
    std::string cmd = args.empty() ? "simulate" : args[0];

    if (cmd == "simulate") {
        cmd_simulate(config, options, false);
    } else if (cmd == "export") {
        cmd_simulate(config, options, true);
    } else if (cmd == "quote") {
        cmd_quote(config, args);
    } else if (cmd == "config") {
        std::cout << json(config).dump(2) << "\n";
    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        std::exit(1);
    }
}

void print_usage(const char* prog) {
    std::cout << "pump-sim - Bonding-curve launchpad simulator\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>   TOML configuration file\n"
              << "  -t, --traders <n>     Distinct simulated traders (default: 8)\n"
              << "  -b, --buy <amount>    Base amount per buy (default: 2000000e18)\n"
              << "  -v, --verbose         Debug logging\n"
              << "  -h, --help            Show this help message\n\n"
              << "Commands:\n"
              << "  simulate              Buy until the token graduates (default)\n"
              << "  export                Simulate, then print the state snapshot\n"
              << "  quote <base_in>       Quote a first buy\n"
              << "  config                Print the effective configuration\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-t" || arg == "--traders") {
            if (i + 1 >= argc) {
                std::cerr << "Missing trader count\n";
                std::exit(1);
            }
            try {
                options.traders = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception& e) {
                std::cerr << "Invalid trader count: " << e.what() << "\n";
                std::exit(1);
            }
            if (options.traders == 0) {
                std::cerr << "Trader count must be positive\n";
                std::exit(1);
            }
        } else if (arg == "-b" || arg == "--buy") {
            if (i + 1 >= argc) {
                std::cerr << "Missing buy amount\n";
                std::exit(1);
            }
            options.buy_amount = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    pump::LaunchpadConfig config;
    try {
        if (!options.config_path.empty()) {
            config = pump::LaunchpadConfig::from_file(options.config_path);
        }
        if (options.verbose) {
            config.set_log_level("debug");
        }
        config.validate();
    } catch (const pump::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    run_command(config, options);
    return 0;
}
