#include "core/orchestrator.hpp"
#include "common/errors.hpp"
#include "execution/symbol_state_machine.hpp"
#include <spdlog/spdlog.h>

namespace tarb {

Orchestrator::Orchestrator(const StrategyConfig& config, SharedMarketState& state, Collaborators collaborators)
    : config_(config)
    , state_(state)
    , collab_(collaborators)
    , resolver_(config, collaborators.venue, collaborators.settlement, state.pnl, collaborators.clock, shutdown_)
{
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::run() {
    spdlog::info("Starting reference price stream");
    collab_.reference_stream.start();
    stream_started_ = true;

    sleep_unless_stopped(collab_.clock, std::chrono::seconds(WARM_UP_SECS), shutdown_);

    std::vector<std::thread> workers;
    workers.reserve(config_.symbols.size());
    for (const auto& symbol : config_.symbols) {
        workers.emplace_back(&Orchestrator::run_symbol, this, symbol);
    }
    spdlog::info("Running {} symbol loop(s)", workers.size());

    for (auto& t : workers) {
        t.join();
    }
    spdlog::info("All symbol loops finished");
    finished_ = true;
}

void Orchestrator::run_symbol(const std::string& symbol) {
    SymbolStateMachine machine(symbol, config_, state_, collab_.venue, collab_.orders,
                               collab_.book_stream, resolver_, collab_.clock, shutdown_);
    try {
        machine.run();
    } catch (const std::exception& e) {
        spdlog::error("Symbol loop {} terminated: {}", symbol, e.what());
        std::lock_guard<std::mutex> lock(failures_mutex_);
        failures_[symbol] = e.what();
    }
}

void Orchestrator::stop() {
    shutdown_ = true;
    if (stream_started_.exchange(false)) {
        collab_.reference_stream.stop();
    }
}

std::map<std::string, std::string> Orchestrator::failed_symbols() const {
    std::lock_guard<std::mutex> lock(failures_mutex_);
    return failures_;
}

} // namespace tarb
