#include "quickroll/database/face_store.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/imgcodecs.hpp>
#include <cstring>
#include <filesystem>
#include <map>
#include <stdexcept>

namespace quickroll {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

bool valid_identity_key(const std::string& id) {
    return !id.empty() && id.find('/') == std::string::npos &&
           id.find('\\') == std::string::npos && id != "." && id != "..";
}

}  // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteFaceStore::SqliteFaceStore(const std::string& db_path, const std::string& image_root)
    : db(nullptr), db_path(db_path), image_root(image_root)
{
    spdlog::info("Inicializando Face Store");
    spdlog::info("   Database: {}", db_path);
    spdlog::info("   Images: {}", image_root);

    std::error_code ec;
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    std::filesystem::create_directories(image_root, ec);
    if (ec) {
        spdlog::warn("No se pudo crear {}: {}", image_root, ec.message());
    }

    if (!init_database()) {
        throw std::runtime_error("No se pudo inicializar la base de datos: " + db_path);
    }

    spdlog::info("✓ Face Store ready ({} identities)", count_identities());
}

SqliteFaceStore::~SqliteFaceStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool SqliteFaceStore::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", sqlite3_errmsg(db));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }

    exec("PRAGMA journal_mode=WAL");

    if (!create_tables()) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

bool SqliteFaceStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS students (
            student_id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
        CREATE TABLE IF NOT EXISTS embeddings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            student_id TEXT,
            embedding BLOB NOT NULL,
            pose TEXT,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY (student_id) REFERENCES students(student_id)
        );
        CREATE TABLE IF NOT EXISTS attendance_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            student_id TEXT,
            date TEXT,
            time TEXT,
            confidence REAL,
            marked_by TEXT,
            status TEXT DEFAULT 'Present',
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY (student_id) REFERENCES students(student_id)
        );
        CREATE INDEX IF NOT EXISTS idx_embeddings_student ON embeddings(student_id);
        CREATE INDEX IF NOT EXISTS idx_attendance_date ON attendance_logs(date);
    )";

    return exec(sql);
}

bool SqliteFaceStore::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> SqliteFaceStore::serialize_embedding(const Embedding& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    std::memcpy(blob.data(), emb.data(), blob.size());
    return blob;
}

Embedding SqliteFaceStore::deserialize_embedding(const void* data, int size) {
    Embedding emb(size / sizeof(float));
    if (!emb.empty()) {
        std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    }
    return emb;
}

// ==================== IDENTITIES ====================

std::vector<EnrolledIdentity> SqliteFaceStore::load_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<EnrolledIdentity> identities;

    // rowid conserva el orden de alta
    const char* sql = R"(
        SELECT s.student_id, s.name, e.embedding
        FROM students s
        JOIN embeddings e ON e.student_id = s.student_id
        ORDER BY s.rowid, e.id
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return identities;
    }

    std::map<std::string, size_t> index;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string id = column_text(stmt, 0);
        const void* blob = sqlite3_column_blob(stmt, 2);
        int blob_size = sqlite3_column_bytes(stmt, 2);
        if (!blob || blob_size <= 0) continue;

        auto it = index.find(id);
        if (it == index.end()) {
            EnrolledIdentity identity;
            identity.id = id;
            identity.name = column_text(stmt, 1);
            identities.push_back(identity);
            it = index.emplace(id, identities.size() - 1).first;
        }
        identities[it->second].references.push_back(deserialize_embedding(blob, blob_size));
    }

    sqlite3_finalize(stmt);
    return identities;
}

bool SqliteFaceStore::add_identity(const std::string& id, const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "INSERT OR IGNORE INTO students (student_id, name) VALUES (?, ?)";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to add student {}: {}", id, sqlite3_errmsg(db));
        return false;
    }
    return true;
}

bool SqliteFaceStore::add_embedding(const std::string& id, const Embedding& embedding,
                                    const std::string& pose) {
    if (embedding.empty()) {
        spdlog::error("Empty embedding for {}", id);
        return false;
    }

    std::lock_guard<std::mutex> lock(db_mutex);
    auto blob = serialize_embedding(embedding);

    const char* sql = "INSERT INTO embeddings (student_id, embedding, pose) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, pose.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to add embedding for {}: {}", id, sqlite3_errmsg(db));
        return false;
    }

    spdlog::info("✓ Embedding guardado: {} ({})", id, pose);
    return true;
}

bool SqliteFaceStore::delete_identity(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* statements[] = {
        "DELETE FROM embeddings WHERE student_id = ?",
        "DELETE FROM attendance_logs WHERE student_id = ?",
        "DELETE FROM students WHERE student_id = ?"
    };

    if (!exec("BEGIN TRANSACTION")) return false;

    for (const char* sql : statements) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare delete: {}", sqlite3_errmsg(db));
            exec("ROLLBACK");
            return false;
        }
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to delete {}: {}", id, sqlite3_errmsg(db));
            exec("ROLLBACK");
            return false;
        }
    }

    return exec("COMMIT");
}

int SqliteFaceStore::count_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "SELECT COUNT(*) FROM students";
    sqlite3_stmt* stmt;

    int count = 0;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return count;
}

// ==================== ATTENDANCE ====================

bool SqliteFaceStore::append_attendance(const AttendanceRecord& record) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = R"(
        INSERT INTO attendance_logs (student_id, date, time, confidence, marked_by, status)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, record.identity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.time.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, record.confidence);
    sqlite3_bind_text(stmt, 5, record.source.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.status.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to mark attendance: {}", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

std::vector<AttendanceRecord> SqliteFaceStore::todays_attendance(const std::string& date) {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<AttendanceRecord> records;

    const char* sql = R"(
        SELECT a.student_id, s.name, a.date, a.time, a.status, a.confidence, a.marked_by
        FROM attendance_logs a
        LEFT JOIN students s ON a.student_id = s.student_id
        WHERE a.date = ?
        ORDER BY a.time, a.id
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return records;
    }

    sqlite3_bind_text(stmt, 1, date.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AttendanceRecord rec;
        rec.identity = column_text(stmt, 0);
        rec.name = column_text(stmt, 1);
        rec.date = column_text(stmt, 2);
        rec.time = column_text(stmt, 3);
        rec.status = column_text(stmt, 4);
        rec.confidence = static_cast<float>(sqlite3_column_double(stmt, 5));
        rec.source = column_text(stmt, 6);
        records.push_back(rec);
    }

    sqlite3_finalize(stmt);
    return records;
}

// ==================== IMAGES ====================

bool SqliteFaceStore::create_identity_storage(const std::string& id) {
    if (!valid_identity_key(id)) {
        spdlog::error("Invalid identity key: '{}'", id);
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(image_root) / id, ec);
    if (ec) {
        spdlog::error("No se pudo crear carpeta para {}: {}", id, ec.message());
        return false;
    }
    return true;
}

std::optional<std::string> SqliteFaceStore::save_captured_image(const std::string& id,
                                                                const cv::Mat& image,
                                                                const std::string& pose) {
    if (image.empty() || !create_identity_storage(id)) {
        return std::nullopt;
    }

    std::filesystem::path path = std::filesystem::path(image_root) / id / (pose + ".jpg");
    try {
        if (!cv::imwrite(path.string(), image)) {
            spdlog::error("Failed to save image: {}", path.string());
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        spdlog::error("Failed to save image {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    return path.string();
}

}  // namespace quickroll
