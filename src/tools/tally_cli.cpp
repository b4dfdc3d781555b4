#include "common/config.h"
#include "common/crypto_utils.h"
#include "common/logging.h"
#include "counter/instruction.h"
#include "counter/processor.h"
#include "counter/state.h"
#include "svm/engine.h"
#include <iostream>
#include <memory>
#include <string>

using namespace tally;

void print_usage() {
    std::cout << "Tally counter program runner\n";
    std::cout << "Usage: tally-cli [options]\n\n";
    std::cout << "Creates a counter account in an in-process runtime, increments it\n";
    std::cout << "and prints the resulting state.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE          Path to JSON configuration file\n";
    std::cout << "  --log-level LEVEL      Log level (trace, debug, info, warn, error)\n";
    std::cout << "  --json-logs            Emit structured JSON log lines\n";
    std::cout << "  --initial-value N      Counter start value (default: 0)\n";
    std::cout << "  --increments K         Number of increment calls (default: 1)\n";
    std::cout << "  --compute-budget UNITS Per-transaction compute budget\n";
    std::cout << "  --help                 Show this help message\n";
}

bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stoull(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void print_logs(const svm::ExecutionOutcome& outcome) {
    for (const auto& line : outcome.logs) {
        std::cout << "  " << line << std::endl;
    }
}

int main(int argc, char* argv[]) {
    common::RuntimeConfig config;

    // Config file first so command-line flags override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            auto loaded = common::load_config_file(argv[++i], config);
            if (loaded.is_err()) {
                std::cerr << "❌ " << loaded.error() << std::endl;
                return 1;
            }
            config = loaded.value();
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--json-logs") {
            config.json_logs = true;
        } else if (arg == "--initial-value" && i + 1 < argc) {
            if (!parse_u64(argv[++i], config.initial_value)) {
                std::cerr << "❌ Invalid --initial-value: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--increments" && i + 1 < argc) {
            if (!parse_u64(argv[++i], config.increments)) {
                std::cerr << "❌ Invalid --increments: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--compute-budget" && i + 1 < argc) {
            if (!parse_u64(argv[++i], config.max_compute_units)) {
                std::cerr << "❌ Invalid --compute-budget: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage();
            return 1;
        }
    }

    auto valid = common::validate_config(config);
    if (valid.is_err()) {
        std::cerr << "❌ Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }
    common::apply_logging_config(config);

    svm::ExecutionEngine engine(config);
    auto program = std::make_unique<counter::CounterProgram>();
    common::PublicKey program_id = program->get_program_id();
    engine.register_builtin_program(std::move(program));

    auto payer = common::CryptoUtils::generate_address();
    auto counter_key = common::CryptoUtils::generate_address();
    if (payer.is_err() || counter_key.is_err()) {
        std::cerr << "❌ Failed to generate account addresses" << std::endl;
        return 1;
    }

    svm::AccountMap accounts;
    svm::Account payer_account;
    payer_account.lamports = config.payer_funding;
    accounts[payer.value()] = payer_account;

    LOG_INFO("cli", "Program ", common::to_hex(program_id));
    LOG_INFO("cli", "Counter account ", common::to_hex(counter_key.value()));

    auto init = engine.execute_transaction(
        {counter::make_initialize_instruction(program_id, counter_key.value(),
                                              payer.value(), config.initial_value)},
        accounts);
    std::cout << "InitializeCounter(" << config.initial_value << "): "
              << svm::to_string(init.result) << std::endl;
    print_logs(init);
    if (!init.is_success()) {
        std::cerr << "❌ " << init.error_details << std::endl;
        return 1;
    }

    for (uint64_t n = 0; n < config.increments; ++n) {
        auto outcome = engine.execute_transaction(
            {counter::make_increment_instruction(program_id, counter_key.value())},
            accounts);
        if (!outcome.is_success()) {
            std::cout << "IncrementCounter: " << svm::to_string(outcome.result) << std::endl;
            print_logs(outcome);
            std::cerr << "❌ " << outcome.error_details << std::endl;
            return 1;
        }
        LOG_DEBUG("cli", "Increment ", n + 1, " consumed ",
                  outcome.compute_units_consumed, " compute units");
    }

    auto state = counter::read_counter_state(accounts[counter_key.value()].data);
    if (state.is_err()) {
        std::cerr << "❌ Counter account unreadable: " << counter::to_string(state.error())
                  << std::endl;
        return 1;
    }

    const auto& stored = accounts[counter_key.value()];
    std::cout << "✅ Counter value: " << state.value().count << std::endl;
    std::cout << "   Account lamports: " << stored.lamports
              << " (rent exempt: "
              << (engine.rent().is_rent_exempt(stored.lamports, stored.data.size()) ? "yes" : "no")
              << ")" << std::endl;
    std::cout << "   Transactions: " << engine.get_total_instructions_executed()
              << " instructions, " << engine.get_total_compute_units_consumed()
              << " compute units" << std::endl;
    return 0;
}
