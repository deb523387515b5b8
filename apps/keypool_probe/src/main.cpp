// apps/keypool_probe/src/main.cpp
// keypool: keypool_probe
// Purpose: load a proxy config, build the API key manager exactly as the proxy
// would, and show which keys N requests would be routed to.
//
// Usage:
//   ./keypool_probe <config.yaml> [count] [strategy]
//
// Notes:
// - strategy defaults to `selection_strategy` from the config (round_robin if unset).
// - Secrets are never printed; stats show an 8-character preview only.
// - Exit codes: 0 ok, 1 usage, 2 config error, 3 validation error, 4 unknown strategy.

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "keypool/config/config_loader.hpp"
#include "keypool/obs/observability.hpp"
#include "keypool/selection/selection_manager.hpp"
#include "keypool/version.hpp"

using keypool::config::Loader;
using keypool::selection::ManagerOptions;
using keypool::selection::SelectionManager;

namespace {

// Tallies picks per label and forwards to the process logging observer.
class TallyObserver final : public keypool::obs::Observer {
public:
    explicit TallyObserver(std::shared_ptr<keypool::obs::Observer> next) : next_(std::move(next)) {}

    void record(const keypool::obs::SelectionEvent& e) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            hits_[e.label]++;
        }
        next_->record(e);
    }
    keypool::obs::Counters snapshot() const override { return next_->snapshot(); }

    std::map<std::string, int> hits() const {
        std::lock_guard<std::mutex> lk(mu_);
        return hits_;
    }

private:
    std::shared_ptr<keypool::obs::Observer> next_;
    mutable std::mutex mu_;
    std::map<std::string, int> hits_;
};

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> [count] [strategy]" << std::endl;
        return 1;
    }
    const std::string path = argv[1];
    int count = 10;
    if (argc > 2) {
        try {
            count = std::stoi(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "count must be an integer: " << argv[2] << std::endl;
            return 1;
        }
    }

    auto cfg = Loader::load_from_file(path);
    if (!cfg) {
        std::cerr << "config error: " << cfg.error().to_string() << std::endl;
        return 2;
    }
    keypool::obs::init_logging(cfg->log_level);

    std::cout << "keypool_probe " << keypool::version_string << std::endl;
    std::cout << "Config: " << path << std::endl;

    const auto specs = keypool::config::to_credential_specs(*cfg);
    auto tally = std::make_shared<TallyObserver>(keypool::obs::make_logging_observer());
    auto mgr = SelectionManager::create(specs, ManagerOptions{.rng = nullptr, .observer = tally});
    if (!mgr) {
        std::cerr << "validation error: " << mgr.error().to_string() << std::endl;
        return 3;
    }
    auto& manager = **mgr;

    const auto st = manager.stats();
    std::cout << "Keys: " << st.total_keys << ", total weight: " << st.total_weight << std::endl;
    for (const auto& k : st.keys) {
        std::cout << "  " << std::left << std::setw(16) << k.label
                  << " weight=" << k.weight << " key=" << k.preview << std::endl;
    }

    const std::string strategy = (argc > 3) ? argv[3]
                                            : std::string(keypool::selection::to_string(cfg->strategy));
    for (int i = 0; i < count; ++i) {
        auto picked = manager.select(strategy);
        if (!picked) {
            std::cerr << picked.error().to_string() << std::endl;
            return 4;
        }
    }

    std::cout << "\n" << count << " selections (" << strategy << "):" << std::endl;
    for (const auto& [label, n] : tally->hits()) {
        std::cout << "  " << std::left << std::setw(16) << label << " " << n << std::endl;
    }
    return 0;
}
