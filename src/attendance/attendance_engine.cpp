#include "quickroll/attendance/attendance_engine.hpp"
#include "quickroll/utils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace quickroll {

const char* to_string(AttendanceAction action) {
    switch (action) {
        case AttendanceAction::AUTO_MARK: return "AUTO_MARK";
        case AttendanceAction::MAYBE:     return "MAYBE";
        case AttendanceAction::UNKNOWN:   return "UNKNOWN";
        case AttendanceAction::COOLDOWN:  return "COOLDOWN";
    }
    return "UNKNOWN";
}

AttendanceEngine::AttendanceEngine(std::shared_ptr<FaceStore> store,
                                   const AttendanceConfig& config, Clock clock)
    : store(std::move(store)), config(config), clock(std::move(clock))
{
    if (!this->store) {
        throw std::invalid_argument("AttendanceEngine requiere un FaceStore");
    }
    if (!this->clock) {
        this->clock = [] { return std::chrono::system_clock::now(); };
    }

    load_today();

    spdlog::info("📋 Attendance Engine initialized");
    spdlog::info("   Cooldown: {}s", this->config.cooldown_seconds);
    spdlog::info("   Thresholds: HIGH={:.2f} LOW={:.2f}",
                 this->config.high_confidence, this->config.low_confidence);
    spdlog::info("   Registros de hoy ({}): {}", today_date, today.size());
}

void AttendanceEngine::load_today() {
    today_date = format_date(clock());
    today = store->todays_attendance(today_date);

    for (const auto& rec : today) {
        std::chrono::system_clock::time_point marked_at;
        if (!parse_local_datetime(rec.date, rec.time, marked_at)) {
            spdlog::warn("Registro con fecha invalida ignorado: {} {} {}",
                         rec.identity, rec.date, rec.time);
            continue;
        }

        auto it = last_marked.find(rec.identity);
        if (it == last_marked.end() || it->second < marked_at) {
            last_marked[rec.identity] = marked_at;
        }
    }
}

void AttendanceEngine::roll_day(const std::string& date) {
    spdlog::info("Nuevo dia {} -> {}: lista de asistencia reiniciada", today_date, date);
    today.clear();
    today_date = date;
}

int AttendanceEngine::cooldown_remaining(const std::string& identity) const {
    auto it = last_marked.find(identity);
    if (it == last_marked.end()) {
        return 0;
    }

    double elapsed = std::chrono::duration<double>(clock() - it->second).count();
    if (elapsed >= config.cooldown_seconds) {
        return 0;
    }
    return static_cast<int>(config.cooldown_seconds - elapsed);
}

// ==================== DECIDE ====================

AttendanceDecision AttendanceEngine::decide(const std::string& identity, float confidence) const {
    AttendanceDecision decision;

    auto it = identity.empty() ? last_marked.end() : last_marked.find(identity);
    if (it != last_marked.end()) {
        double elapsed = std::chrono::duration<double>(clock() - it->second).count();
        if (elapsed < config.cooldown_seconds) {
            int remaining = static_cast<int>(config.cooldown_seconds - elapsed);
            decision.action = AttendanceAction::COOLDOWN;
            decision.status = RecognitionStatus::COOLDOWN;
            decision.can_mark = false;
            decision.cooldown_remaining = remaining;
            decision.message = fmt::format("Already marked (wait {}s)", remaining);
            return decision;
        }
    }

    if (confidence >= config.high_confidence) {
        decision.action = AttendanceAction::AUTO_MARK;
        decision.status = RecognitionStatus::RECOGNIZED;
        decision.requires_verification = false;
        decision.message = "High confidence - auto marking";
    } else if (confidence >= config.low_confidence) {
        decision.action = AttendanceAction::MAYBE;
        decision.status = RecognitionStatus::MAYBE;
        decision.requires_verification = true;
        decision.message = fmt::format("Medium confidence ({:.0f}%) - verification optional",
                                       confidence * 100.0f);
    } else {
        decision.action = AttendanceAction::UNKNOWN;
        decision.status = RecognitionStatus::UNKNOWN;
        decision.requires_verification = true;
        decision.message = "Unknown person";
    }

    return decision;
}

// ==================== MARK ====================

MarkResult AttendanceEngine::mark(const std::string& identity, const std::string& name,
                                  float confidence, const std::string& source) {
    MarkResult result;

    if (identity.empty()) {
        result.message = "Invalid identity";
        return result;
    }

    auto now = clock();

    auto it = last_marked.find(identity);
    if (it != last_marked.end()) {
        double elapsed = std::chrono::duration<double>(now - it->second).count();
        if (elapsed < config.cooldown_seconds) {
            int remaining = static_cast<int>(config.cooldown_seconds - elapsed);
            result.message = fmt::format("Already marked (wait {}s)", remaining);
            return result;
        }
    }

    AttendanceRecord record;
    record.identity = identity;
    record.name = name;
    record.date = format_date(now);
    record.time = format_time(now);
    record.confidence = confidence;
    record.source = source;

    if (!store->append_attendance(record)) {
        spdlog::error("✗ No se pudo registrar asistencia de {}", identity);
        result.message = "Database error";
        return result;
    }

    if (record.date != today_date) {
        roll_day(record.date);
    }

    today.push_back(record);
    last_marked[identity] = now;

    spdlog::info("✓ [ATTENDANCE] {} ({}) a las {} (conf {:.2f})",
                 name, identity, record.time, confidence);

    result.success = true;
    result.message = "Marked present";
    return result;
}

ConfidenceStats AttendanceEngine::confidence_stats() const {
    ConfidenceStats stats;
    if (today.empty()) {
        return stats;
    }

    double sum = 0.0;
    for (const auto& rec : today) {
        if (rec.confidence >= config.high_confidence) stats.high_count++;
        if (rec.confidence < config.low_confidence) stats.low_count++;
        sum += rec.confidence;
    }
    stats.mean_confidence = static_cast<float>(sum / today.size());
    return stats;
}

}  // namespace quickroll
