#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: affinity events + counters.
 * @details Every component takes an optional Observer*; nullptr selects the
 *          process-wide default (printf-backed) observer.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace sticky::obs {

    /** @enum EventKind
     *  @brief What happened to a call or to the binding table.
     */
    enum class EventKind : uint8_t {
        CallIntercepted,      ///< Pool target recognized; channel selected
        CallBypassed,         ///< Foreign/absent channel target; call untouched
        KeyResolutionFailed,  ///< Affinity key could not be extracted (diagnostic)
        Bound,                ///< Binding table gained/overwrote an entry
        Unbound,              ///< Binding table lost an entry
        CallCompleted,        ///< Success status observed; post-processing ran
        ReleasedOnError,      ///< Non-success status; reservation released only
        CallAbandoned         ///< Observer destroyed before any terminal status
    };

    /// Stable lowercase label used in log lines.
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for affinity decisions.
     */
    struct Counters {
        uint64_t intercepted{0};             ///< Calls routed through the pool
        uint64_t bypassed{0};                ///< Calls dispatched unmodified
        uint64_t key_resolution_failures{0}; ///< Diagnostics from key extraction
        uint64_t binds{0};                   ///< Binding table writes
        uint64_t unbinds{0};                 ///< Binding table removals
        uint64_t completed{0};               ///< Success-gated post-processing runs
        uint64_t released_on_error{0};       ///< Failed/cancelled calls released
        uint64_t abandoned{0};               ///< Calls released without a status
    };

    /** @struct AffinityEvent
     *  @brief Payload describing a single affinity event.
     */
    struct AffinityEvent {
        EventKind   kind{EventKind::CallIntercepted}; ///< Event type
        std::string method_path;                      ///< "/pkg.Service/Method"
        std::string affinity_key;                     ///< Key involved (may be empty)
        std::string field_path;                       ///< Configured key locator (diagnostics)
        std::size_t channel_id{0};                    ///< Pool-local channel index
        bool        has_channel{false};               ///< Whether channel_id is meaningful
        std::string reason;                           ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const AffinityEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide observer that prints one line per event to stderr.
    Observer* make_simple_observer();

    /// Process-wide observer that only counts (benchmarks, noisy workloads).
    Observer* make_counting_observer();

    /// Resolve an optional sink to a usable one.
    inline Observer* or_default(Observer* o) { return o ? o : make_simple_observer(); }

} // namespace sticky::obs
