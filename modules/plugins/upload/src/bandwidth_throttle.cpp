#include "bandwidth_throttle.h"
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <ctime>
#include <thread>

namespace {
constexpr auto SLEEP_SLICE = std::chrono::milliseconds(50);
constexpr auto QUIET_HOURS_POLL = std::chrono::milliseconds(250);

std::optional<int64_t> cap_for(const ThrottleSettings& settings, int minute_of_day) {
    if (settings.quiet_hours) {
        const auto start = BandwidthThrottle::parse_hhmm(settings.quiet_hours->start);
        const auto end = BandwidthThrottle::parse_hhmm(settings.quiet_hours->end);
        if (start && end && BandwidthThrottle::is_within_window(minute_of_day, *start, *end)) {
            const int64_t quiet = settings.quiet_hours->max_bytes_per_second;
            if (quiet <= 0) {
                return 0;
            }
            if (settings.max_bytes_per_second) {
                return std::min(*settings.max_bytes_per_second, quiet);
            }
            return quiet;
        }
    }
    return settings.max_bytes_per_second;
}
} // namespace

ThrottleSettings throttle_settings_from_config(const ConfigManager& config) {
    ThrottleSettings settings;
    const int64_t cap = config.getMaxBytesPerSecond();
    if (cap > 0) {
        settings.max_bytes_per_second = cap;
    }
    settings.adaptive_throttling = config.isAdaptiveThrottling();
    if (config.isQuietHoursEnabled()) {
        QuietHours quiet;
        quiet.start = config.getQuietHoursStart();
        quiet.end = config.getQuietHoursEnd();
        quiet.max_bytes_per_second = config.getQuietHoursMaxBytesPerSecond();
        settings.quiet_hours = quiet;
    }
    return settings;
}

BandwidthThrottle::BandwidthThrottle(std::chrono::milliseconds measurement_window)
    : m_window(measurement_window.count() > 0 ? measurement_window : std::chrono::milliseconds(2000)),
      m_next_send(Clock::now()) {}

// ============================================================================
// CONFIGURATION
// ============================================================================

std::optional<int> BandwidthThrottle::parse_hhmm(const std::string& text) {
    if (text.size() != 5 || text[2] != ':') {
        return std::nullopt;
    }
    for (size_t i : {0u, 1u, 3u, 4u}) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
    }
    const int hours = (text[0] - '0') * 10 + (text[1] - '0');
    const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

bool BandwidthThrottle::is_within_window(int minute_of_day, int start_minute, int end_minute) {
    if (start_minute == end_minute) {
        return false;
    }
    if (start_minute < end_minute) {
        return minute_of_day >= start_minute && minute_of_day < end_minute;
    }
    // Wraps past midnight
    return minute_of_day >= start_minute || minute_of_day < end_minute;
}

bool BandwidthThrottle::validate(const ThrottleSettings& settings, std::string* error) {
    auto fail = [error](const std::string& why) {
        if (error) *error = why;
        return false;
    };

    if (settings.max_bytes_per_second && *settings.max_bytes_per_second <= 0) {
        return fail("max_bytes_per_second must be greater than 0");
    }
    if (settings.quiet_hours) {
        const auto& quiet = *settings.quiet_hours;
        const auto start = parse_hhmm(quiet.start);
        const auto end = parse_hhmm(quiet.end);
        if (!start || !end) {
            return fail("quiet_hours must include start and end times as HH:MM");
        }
        if (*start == *end) {
            return fail("quiet_hours start and end must differ");
        }
        if (quiet.max_bytes_per_second < 0) {
            return fail("quiet_hours max_bytes_per_second must not be negative");
        }
    }
    return true;
}

bool BandwidthThrottle::configure(const ThrottleSettings& settings, std::string* error) {
    std::string why;
    if (!validate(settings, &why)) {
        LOG_WARN("BT: Rejected throttle settings: " + why);
        if (error) *error = why;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings = settings;
    m_adaptive_rate = settings.max_bytes_per_second.value_or(0);
    m_next_send = Clock::now();
    m_last_adapt = Clock::time_point();

    std::string desc = settings.max_bytes_per_second
        ? std::to_string(*settings.max_bytes_per_second) + " B/s"
        : std::string("unthrottled");
    if (settings.adaptive_throttling) desc += ", adaptive";
    if (settings.quiet_hours) {
        desc += ", quiet " + settings.quiet_hours->start + "-" + settings.quiet_hours->end +
                " @ " + std::to_string(settings.quiet_hours->max_bytes_per_second) + " B/s";
    }
    LOG_INFO("BT: Throttle configured (" + desc + ")");
    return true;
}

ThrottleSettings BandwidthThrottle::settings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

void BandwidthThrottle::set_minute_of_day_source(MinuteOfDaySource source) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minute_source = std::move(source);
}

std::optional<int64_t> BandwidthThrottle::effective_rate_at(int minute_of_day) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return cap_for(m_settings, minute_of_day);
}

int BandwidthThrottle::minute_of_day_locked() const {
    if (m_minute_source) {
        return m_minute_source();
    }
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return tm_buf.tm_hour * 60 + tm_buf.tm_min;
}

std::optional<int64_t> BandwidthThrottle::pacing_rate_locked(int minute_of_day) const {
    auto cap = cap_for(m_settings, minute_of_day);
    if (!cap || *cap == 0) {
        return cap;
    }
    if (m_settings.adaptive_throttling && m_adaptive_rate > 0) {
        return std::min(*cap, m_adaptive_rate);
    }
    return cap;
}

int64_t BandwidthThrottle::pacing_rate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return pacing_rate_locked(minute_of_day_locked()).value_or(0);
}

// ============================================================================
// PACING
// ============================================================================

std::optional<BandwidthThrottle::Reservation> BandwidthThrottle::reserve_slot(int64_t bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto rate = pacing_rate_locked(minute_of_day_locked());
    if (!rate) {
        return Reservation{};
    }
    if (*rate == 0) {
        return std::nullopt;
    }

    const auto now = Clock::now();
    Reservation reservation;
    reservation.start = std::max(now, m_next_send);
    reservation.end = reservation.start + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(static_cast<double>(std::max<int64_t>(bytes, 0)) /
                                      static_cast<double>(*rate)));
    reservation.wait = reservation.start - now;
    m_next_send = reservation.end;

    m_total_delay_ms += static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(reservation.wait).count());
    return reservation;
}

std::optional<BandwidthThrottle::Clock::duration> BandwidthThrottle::reserve(int64_t bytes) {
    const auto reservation = reserve_slot(bytes);
    if (!reservation) {
        return std::nullopt;
    }
    return reservation->wait;
}

void BandwidthThrottle::release(const Reservation& reservation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Only the newest reservation can be handed back; later ones are already queued behind it.
    if (m_next_send == reservation.end) {
        m_next_send = reservation.start;
    }
}

bool BandwidthThrottle::sleep_sliced(Clock::duration wait, const AbortPredicate& should_abort) {
    const auto deadline = Clock::now() + wait;
    while (true) {
        if (should_abort && should_abort()) {
            return false;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(deadline - now, SLEEP_SLICE));
    }
}

bool BandwidthThrottle::acquire(int64_t bytes, const AbortPredicate& should_abort) {
    bool logged_pause = false;
    while (true) {
        if (should_abort && should_abort()) {
            return false;
        }
        const auto reservation = reserve_slot(bytes);
        if (!reservation) {
            if (!logged_pause) {
                LOG_DEBUG("BT: Quiet hours pause in effect, holding chunk of " + std::to_string(bytes) + " bytes");
                logged_pause = true;
            }
            if (!sleep_sliced(QUIET_HOURS_POLL, should_abort)) {
                return false;
            }
            continue;
        }
        if (reservation->wait <= Clock::duration::zero()) {
            return true;
        }
        if (!sleep_sliced(reservation->wait, should_abort)) {
            release(*reservation);
            return false;
        }
        return true;
    }
}

// ============================================================================
// MEASUREMENT / ADAPTATION
// ============================================================================

void BandwidthThrottle::prune_samples_locked(Clock::time_point now) const {
    while (!m_samples.empty() && now - m_samples.front().at > m_window) {
        m_samples.pop_front();
    }
}

double BandwidthThrottle::measured_rate_locked(Clock::time_point now) const {
    prune_samples_locked(now);
    int64_t total = 0;
    for (const auto& s : m_samples) {
        total += s.bytes;
    }
    const double seconds = std::chrono::duration<double>(m_window).count();
    return static_cast<double>(total) / seconds;
}

void BandwidthThrottle::adapt_locked(Clock::time_point now) {
    if (!m_settings.adaptive_throttling || !m_settings.max_bytes_per_second) {
        return;
    }
    if (now - m_last_adapt < m_window / 4) {
        return;
    }
    m_last_adapt = now;

    const int64_t cap = *m_settings.max_bytes_per_second;
    const int64_t floor_rate = std::max<int64_t>(1, cap / 10);
    const double measured = measured_rate_locked(now);

    if (measured > static_cast<double>(cap)) {
        const int64_t reduced = std::max(floor_rate, m_adaptive_rate * 3 / 4);
        if (reduced != m_adaptive_rate) {
            LOG_DEBUG("BT: Over budget (" + std::to_string(static_cast<int64_t>(measured)) +
                      " B/s), pacing rate " + std::to_string(m_adaptive_rate) + " -> " + std::to_string(reduced));
            m_adaptive_rate = reduced;
        }
    } else if (measured < static_cast<double>(cap) * 0.9) {
        const int64_t raised = std::min(cap, m_adaptive_rate + std::max<int64_t>(1, cap / 20));
        if (raised != m_adaptive_rate) {
            LOG_DEBUG("BT: Under budget, pacing rate " + std::to_string(m_adaptive_rate) +
                      " -> " + std::to_string(raised));
            m_adaptive_rate = raised;
        }
    }
}

void BandwidthThrottle::record_sent(int64_t bytes) {
    if (bytes <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = Clock::now();
    m_samples.push_back(Sample{now, bytes});
    prune_samples_locked(now);
    adapt_locked(now);
}

double BandwidthThrottle::current_usage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return measured_rate_locked(Clock::now());
}
