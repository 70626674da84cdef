// ============= include/quickroll/database/face_store.hpp =============
/*
 * Face Store - SQLite Backend
 *
 * TABLAS:
 * students        (student_id TEXT PK, name, created_at)
 * embeddings      (id, student_id, embedding BLOB, pose, created_at)
 * attendance_logs (id, student_id, date, time, confidence,
 *                  marked_by, status, created_at)
 *
 * IMAGENES:
 * <image_root>/<student_id>/<pose>.jpg
 *
 * OPERACIONES:
 * - load_identities(): embeddings + nombres en orden de alta
 * - append_attendance() / todays_attendance()
 * - save_captured_image() / create_identity_storage()
 *
 * Todas las operaciones van serializadas por db_mutex.
 * Los errores se loguean y se devuelven como false / vacio.
 */

#pragma once
#include "quickroll/core/types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace quickroll {

class FaceStore {
public:
    virtual ~FaceStore() = default;

    virtual std::vector<EnrolledIdentity> load_identities() = 0;

    virtual bool add_identity(const std::string& id, const std::string& name) = 0;
    virtual bool add_embedding(const std::string& id, const Embedding& embedding,
                               const std::string& pose) = 0;
    virtual bool delete_identity(const std::string& id) = 0;

    virtual bool append_attendance(const AttendanceRecord& record) = 0;
    virtual std::vector<AttendanceRecord> todays_attendance(const std::string& date) = 0;

    virtual std::optional<std::string> save_captured_image(const std::string& id,
                                                           const cv::Mat& image,
                                                           const std::string& pose) = 0;
    virtual bool create_identity_storage(const std::string& id) = 0;
};

class SqliteFaceStore : public FaceStore {
public:
    SqliteFaceStore(const std::string& db_path, const std::string& image_root);
    ~SqliteFaceStore() override;

    SqliteFaceStore(const SqliteFaceStore&) = delete;
    SqliteFaceStore& operator=(const SqliteFaceStore&) = delete;

    std::vector<EnrolledIdentity> load_identities() override;

    bool add_identity(const std::string& id, const std::string& name) override;
    bool add_embedding(const std::string& id, const Embedding& embedding,
                       const std::string& pose) override;
    bool delete_identity(const std::string& id) override;

    bool append_attendance(const AttendanceRecord& record) override;
    std::vector<AttendanceRecord> todays_attendance(const std::string& date) override;

    std::optional<std::string> save_captured_image(const std::string& id,
                                                   const cv::Mat& image,
                                                   const std::string& pose) override;
    bool create_identity_storage(const std::string& id) override;

    int count_identities();
    std::string get_db_path() const { return db_path; }
    bool is_open() const { return db != nullptr; }

private:
    sqlite3* db;
    std::string db_path;
    std::string image_root;
    std::mutex db_mutex;

    bool init_database();
    bool create_tables();
    bool exec(const char* sql);

    static std::vector<unsigned char> serialize_embedding(const Embedding& emb);
    static Embedding deserialize_embedding(const void* data, int size);
};

}  // namespace quickroll
