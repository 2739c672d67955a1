#ifndef BANDWIDTH_THROTTLE_H
#define BANDWIDTH_THROTTLE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

class ConfigManager;

/**
 * Wall-clock window [start, end) in local "HH:MM". The window may wrap past
 * midnight (start > end). max_bytes_per_second of 0 pauses transfers.
 */
struct QuietHours {
    std::string start;
    std::string end;
    int64_t max_bytes_per_second = 0;
};

struct ThrottleSettings {
    std::optional<int64_t> max_bytes_per_second;    // absent = unthrottled
    bool adaptive_throttling = false;
    std::optional<QuietHours> quiet_hours;
};

// Builds settings from the "bandwidth" config section. A cap of 0 means unthrottled.
ThrottleSettings throttle_settings_from_config(const ConfigManager& config);

/**
 * Shared rate limiter consulted before each chunk.
 *
 * Senders reserve consecutive slots on a single timeline: a chunk of s bytes
 * starts no earlier than the end of the previous reservation and occupies
 * s / rate seconds, so the aggregate rate across all workers stays within the
 * cap plus one chunk of burst. In adaptive mode the pacing rate shrinks
 * multiplicatively while measured throughput is over the cap and grows
 * additively while it is under.
 */
class BandwidthThrottle {
public:
    using Clock = std::chrono::steady_clock;
    using AbortPredicate = std::function<bool()>;
    using MinuteOfDaySource = std::function<int()>;

    explicit BandwidthThrottle(std::chrono::milliseconds measurement_window = std::chrono::milliseconds(2000));

    BandwidthThrottle(const BandwidthThrottle&) = delete;
    BandwidthThrottle& operator=(const BandwidthThrottle&) = delete;

    /**
     * Replace the settings. Invalid settings are rejected and the previous
     * settings stay in effect.
     * @param error Filled with the reason on rejection
     */
    bool configure(const ThrottleSettings& settings, std::string* error = nullptr);
    ThrottleSettings settings() const;

    static bool validate(const ThrottleSettings& settings, std::string* error);

    // "HH:MM" -> minute of day, nullopt if malformed.
    static std::optional<int> parse_hhmm(const std::string& text);
    static bool is_within_window(int minute_of_day, int start_minute, int end_minute);

    /**
     * Cap in force at the given minute of day, ignoring adaptation.
     * nullopt = unthrottled, 0 = paused.
     */
    std::optional<int64_t> effective_rate_at(int minute_of_day) const;

    /**
     * Reserve a slot for bytes and return how long the caller must wait.
     * nullopt while transfers are paused by quiet hours.
     */
    std::optional<Clock::duration> reserve(int64_t bytes);

    /**
     * Block until bytes may be sent. Sleeps in short slices so a cancelled
     * job stops waiting promptly. An aborted wait hands its slot back when
     * no later reservation has been queued behind it.
     * @return false if should_abort became true first
     */
    bool acquire(int64_t bytes, const AbortPredicate& should_abort = nullptr);

    // Report bytes actually sent, for measured throughput and adaptation.
    void record_sent(int64_t bytes);

    // Measured bytes/sec over the measurement window.
    double current_usage() const;

    // Pacing rate currently used (adapted in adaptive mode). 0 when unthrottled.
    int64_t pacing_rate() const;

    uint64_t total_delay_ms() const { return m_total_delay_ms.load(); }

    void set_minute_of_day_source(MinuteOfDaySource source);

private:
    struct Sample {
        Clock::time_point at;
        int64_t bytes;
    };

    struct Reservation {
        Clock::duration wait = Clock::duration::zero();
        Clock::time_point start;
        Clock::time_point end;
    };

    // nullopt while paused. An unthrottled reservation has zero wait and no slot.
    std::optional<Reservation> reserve_slot(int64_t bytes);
    void release(const Reservation& reservation);

    int minute_of_day_locked() const;
    std::optional<int64_t> pacing_rate_locked(int minute_of_day) const;
    void prune_samples_locked(Clock::time_point now) const;
    double measured_rate_locked(Clock::time_point now) const;
    void adapt_locked(Clock::time_point now);

    static bool sleep_sliced(Clock::duration wait, const AbortPredicate& should_abort);

    const std::chrono::milliseconds m_window;

    mutable std::mutex m_mutex;
    ThrottleSettings m_settings;
    Clock::time_point m_next_send;
    int64_t m_adaptive_rate = 0;
    Clock::time_point m_last_adapt;
    mutable std::deque<Sample> m_samples;
    MinuteOfDaySource m_minute_source;

    std::atomic<uint64_t> m_total_delay_ms{0};
};

#endif // BANDWIDTH_THROTTLE_H
