/**
* @file observability.cpp
 * @brief printf-backed implementation of Observer.
 */
#include "sticky/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace sticky::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::CallIntercepted:     return "call_intercepted";
            case EventKind::CallBypassed:        return "call_bypassed";
            case EventKind::KeyResolutionFailed: return "key_resolution_failed";
            case EventKind::Bound:               return "bound";
            case EventKind::Unbound:             return "unbound";
            case EventKind::CallCompleted:       return "call_completed";
            case EventKind::ReleasedOnError:     return "released_on_error";
            case EventKind::CallAbandoned:       return "call_abandoned";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        explicit SimpleObserver(bool echo) : echo_(echo) {}

        void record(const AffinityEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.kind) {
                case EventKind::CallIntercepted:     ctr_.intercepted++; break;
                case EventKind::CallBypassed:        ctr_.bypassed++; break;
                case EventKind::KeyResolutionFailed: ctr_.key_resolution_failures++; break;
                case EventKind::Bound:               ctr_.binds++; break;
                case EventKind::Unbound:             ctr_.unbinds++; break;
                case EventKind::CallCompleted:       ctr_.completed++; break;
                case EventKind::ReleasedOnError:     ctr_.released_on_error++; break;
                case EventKind::CallAbandoned:       ctr_.abandoned++; break;
            }
            if (!echo_) return;
            // JSON-ish line (swap for structured logger later)
            if (e.has_channel) {
                std::fprintf(stderr,
                  R"({"event":"%s","method":"%s","key":"%s","channel":%zu,"reason":"%s"})" "\n",
                  to_string(e.kind), e.method_path.c_str(), e.affinity_key.c_str(),
                  e.channel_id, e.reason.c_str());
            } else {
                std::fprintf(stderr,
                  R"({"event":"%s","method":"%s","key":"%s","field_path":"%s","reason":"%s"})" "\n",
                  to_string(e.kind), e.method_path.c_str(), e.affinity_key.c_str(),
                  e.field_path.c_str(), e.reason.c_str());
            }
            std::fflush(stderr);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        const bool echo_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs{true}; // process-wide singleton
        return &obs;
    }

    Observer* make_counting_observer() {
        static SimpleObserver obs{false};
        return &obs;
    }

} // namespace sticky::obs
