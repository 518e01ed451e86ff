/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "schedcfg/obs/observability.hpp"
#include <mutex>

#include <spdlog/spdlog.h>

namespace schedcfg::obs {

    class LogObserver : public Observer {
    public:
        void record(const DefaultingEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                switch (e.action) {
                    case Action::ArgsDefaulted: ctr_.args_defaulted++; break;
                    case Action::ArgsAppended:  ctr_.args_appended++;  break;
                    case Action::OpaqueSkipped: ctr_.opaque_skipped++; break;
                    case Action::NoArgsKind:    ctr_.no_args_kind++;   break;
                }
            }
            spdlog::debug(R"({{"profile":"{}","plugin":"{}","kind":"{}","action":"{}"}})",
                          e.profile, e.plugin, e.kind, to_string(e.action));
        }
        void profile_done(const std::string& profile) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.profiles++;
            spdlog::debug("profile {} defaulted", profile);
        }
        void configuration_done(bool ok) override {
            std::lock_guard<std::mutex> lk(mu_);
            if (ok) ctr_.configurations++;
            else    ctr_.failures++;
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

    const char* to_string(Action a) noexcept {
        switch (a) {
            case Action::ArgsDefaulted: return "defaulted";
            case Action::ArgsAppended:  return "appended";
            case Action::OpaqueSkipped: return "opaque-skipped";
            case Action::NoArgsKind:    return "no-args-kind";
        }
        return "unknown";
    }

} // namespace schedcfg::obs
