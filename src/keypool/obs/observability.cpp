/**
 * @file observability.cpp
 * @brief spdlog-backed Observer and logger bring-up.
 */
#include "keypool/obs/observability.hpp"
#include "keypool/config/constants.hpp"

#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace keypool::obs {

    namespace {

    class LoggingObserver : public Observer {
    public:
        void record(const SelectionEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.selections++;
                if (e.strategy == keypool::selection::Strategy::Weighted) ctr_.weighted++;
                else ctr_.round_robin++;
            }
            if (e.weight) {
                spdlog::debug("Selected API key ({}): {} (weight={})",
                              keypool::selection::to_string(e.strategy), e.label, *e.weight);
            } else {
                spdlog::debug("Selected API key ({}): {}",
                              keypool::selection::to_string(e.strategy), e.label);
            }
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    std::once_flag g_log_once;

    } // namespace

    std::shared_ptr<Observer> make_logging_observer() {
        static const auto obs = std::make_shared<LoggingObserver>(); // process-wide singleton
        return obs;
    }

    void init_logging(std::string_view level) {
        std::call_once(g_log_once, [] {
            auto logger = spdlog::stdout_color_mt("keypool");
            logger->set_pattern(keypool::config::constants::LOG_PATTERN);
            spdlog::set_default_logger(std::move(logger));
        });
        // from_str maps unknown names to "off"; treat those as info instead.
        const std::string name(level);
        auto lvl = spdlog::level::from_str(name);
        if (lvl == spdlog::level::off && name != "off") lvl = spdlog::level::info;
        spdlog::set_level(lvl);
    }

} // namespace keypool::obs
