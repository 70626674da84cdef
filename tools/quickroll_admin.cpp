// ============= tools/quickroll_admin.cpp =============
/*
 * Herramienta de administracion para la base de QuickRoll
 *
 * EJEMPLOS DE USO:
 *
 *   ./build/bin/quickroll_admin data/quickroll.db --list
 *   ./quickroll_admin data/quickroll.db --today
 *   ./quickroll_admin data/quickroll.db --date 2025-11-24
 *   ./quickroll_admin data/quickroll.db --mark S1          (marcado manual)
 *   ./quickroll_admin data/quickroll.db --delete S1
 *   ./quickroll_admin data/quickroll.db --stats
 */

#include "quickroll/attendance/attendance_engine.hpp"
#include "quickroll/config.hpp"
#include "quickroll/database/face_store.hpp"
#include "quickroll/utils.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace quickroll;

namespace {

void print_usage(const char* prog) {
    std::cout << "Uso: " << prog << " <database.db> [opciones]\n"
              << "  --list              identidades enroladas\n"
              << "  --today             asistencia de hoy\n"
              << "  --date YYYY-MM-DD   asistencia de una fecha\n"
              << "  --mark <id>         marcado manual (respeta cooldown)\n"
              << "  --delete <id>       borra identidad, embeddings y asistencia\n"
              << "  --stats             estadisticas de confianza de hoy\n"
              << "  --images <dir>      raiz de imagenes (default " << Config::DEFAULT_IMAGE_ROOT << ")\n";
}

void print_identities(SqliteFaceStore& store) {
    auto identities = store.load_identities();

    std::cout << "\n═══════════════════════════════════════════════\n";
    std::cout << "   IDENTIDADES (" << identities.size() << " con embeddings, "
              << store.count_identities() << " registradas)\n";
    std::cout << "═══════════════════════════════════════════════\n";
    for (const auto& identity : identities) {
        std::cout << std::left << std::setw(16) << identity.id
                  << std::setw(28) << identity.name
                  << identity.references.size() << " poses\n";
    }
}

void print_records(const std::vector<AttendanceRecord>& records, const std::string& date) {
    std::cout << "\n═══════════════════════════════════════════════\n";
    std::cout << "   ASISTENCIA " << date << " (" << records.size() << ")\n";
    std::cout << "═══════════════════════════════════════════════\n";
    for (const auto& rec : records) {
        std::cout << rec.time << "  "
                  << std::left << std::setw(12) << rec.identity
                  << std::setw(24) << rec.name
                  << std::fixed << std::setprecision(2) << rec.confidence << "  "
                  << rec.source << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    std::string db_path = argv[1];
    std::string image_root = Config::DEFAULT_IMAGE_ROOT;

    for (int i = 2; i < argc; i++) {
        if (std::string(argv[i]) == "--images" && i + 1 < argc) {
            image_root = argv[i + 1];
        }
    }

    try {
        auto store = std::make_shared<SqliteFaceStore>(db_path, image_root);

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--list") {
                print_identities(*store);
            }
            else if (arg == "--today") {
                std::string today = format_date(std::chrono::system_clock::now());
                print_records(store->todays_attendance(today), today);
            }
            else if (arg == "--date" && i + 1 < argc) {
                std::string date = argv[++i];
                print_records(store->todays_attendance(date), date);
            }
            else if (arg == "--mark" && i + 1 < argc) {
                std::string id = argv[++i];
                std::string name = id;
                for (const auto& identity : store->load_identities()) {
                    if (identity.id == id) name = identity.name;
                }

                AttendanceEngine engine(store);
                MarkResult result = engine.mark(id, name, 1.0f, "manual");
                std::cout << id << ": " << result.message << "\n";
                if (!result.success) return 1;
            }
            else if (arg == "--delete" && i + 1 < argc) {
                std::string id = argv[++i];
                if (!store->delete_identity(id)) {
                    std::cerr << "No se pudo borrar " << id << "\n";
                    return 1;
                }
                std::cout << "Borrado: " << id << "\n";
            }
            else if (arg == "--stats") {
                AttendanceEngine engine(store);
                ConfidenceStats stats = engine.confidence_stats();
                std::cout << "Registros hoy:   " << engine.todays_count() << "\n"
                          << "Alta confianza:  " << stats.high_count << "\n"
                          << "Baja confianza:  " << stats.low_count << "\n"
                          << "Media:           " << std::fixed << std::setprecision(3)
                          << stats.mean_confidence << "\n";
            }
            else if (arg == "--images") {
                i++;
            }
            else {
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
