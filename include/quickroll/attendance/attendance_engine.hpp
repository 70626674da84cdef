// ============= include/quickroll/attendance/attendance_engine.hpp =============
/*
 * Attendance Engine - cooldown + bandas de confianza
 *
 * DECISION (decide):
 * 1. identidad en cooldown -> COOLDOWN, "Already marked (wait Ns)"
 * 2. confianza >= HIGH     -> AUTO_MARK (sin verificacion)
 * 3. LOW <= conf < HIGH    -> MAYBE (verificacion opcional)
 * 4. conf < LOW            -> UNKNOWN
 *
 * MARCADO (mark):
 * - Revalida cooldown (autoritativo)
 * - Escribe en el store; si falla NO arranca el cooldown
 * - Exito: registro en la lista de hoy + last_marked = now
 *
 * ESTADO:
 * - last_marked y registros de hoy se cargan del store al construir
 * - Cambio de dia: la lista de hoy se vacia, los cooldowns se mantienen
 *
 * NO es thread-safe: un engine por stream.
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include "quickroll/database/face_store.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quickroll {

struct AttendanceConfig {
    int cooldown_seconds = Config::COOLDOWN_SECONDS;
    float high_confidence = Config::HIGH_CONFIDENCE;
    float low_confidence = Config::LOW_CONFIDENCE;
};

enum class AttendanceAction {
    AUTO_MARK,
    MAYBE,
    UNKNOWN,
    COOLDOWN
};

const char* to_string(AttendanceAction action);

struct AttendanceDecision {
    AttendanceAction action = AttendanceAction::UNKNOWN;
    RecognitionStatus status = RecognitionStatus::UNKNOWN;
    bool requires_verification = true;
    bool can_mark = true;
    std::string message = "Unknown person";
    int cooldown_remaining = 0;         // segundos, solo en COOLDOWN
};

struct MarkResult {
    bool success = false;
    std::string message;
};

struct ConfidenceStats {
    int high_count = 0;                 // >= HIGH
    int low_count = 0;                  // < LOW
    float mean_confidence = 0.0f;
};

class AttendanceEngine {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    AttendanceEngine(std::shared_ptr<FaceStore> store,
                     const AttendanceConfig& config = AttendanceConfig(),
                     Clock clock = Clock());

    AttendanceDecision decide(const std::string& identity, float confidence) const;

    MarkResult mark(const std::string& identity, const std::string& name, float confidence,
                    const std::string& source = Config::DEFAULT_SOURCE);

    ConfidenceStats confidence_stats() const;

    // Segundos restantes de cooldown (0 = puede marcar)
    int cooldown_remaining(const std::string& identity) const;

    const std::vector<AttendanceRecord>& todays_records() const { return today; }
    size_t todays_count() const { return today.size(); }

    const AttendanceConfig& get_config() const { return config; }

private:
    std::shared_ptr<FaceStore> store;
    AttendanceConfig config;
    Clock clock;

    std::map<std::string, std::chrono::system_clock::time_point> last_marked;
    std::vector<AttendanceRecord> today;
    std::string today_date;

    void load_today();
    void roll_day(const std::string& date);
};

}  // namespace quickroll
