// ============= test/test_sqlite_store.cpp =============
//
// SqliteFaceStore sobre un directorio temporal:
// identidades, embeddings, asistencia e imagenes
//

#include "quickroll/database/face_store.hpp"
#include "test_common.hpp"
#include <chrono>
#include <filesystem>

using namespace quickroll;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string& tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("quickroll_" + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

struct TempStore {
    fs::path dir;
    std::unique_ptr<SqliteFaceStore> store;

    explicit TempStore(const std::string& tag) : dir(make_temp_dir(tag)) {
        store = std::make_unique<SqliteFaceStore>((dir / "quickroll.db").string(),
                                                  (dir / "students").string());
    }

    ~TempStore() {
        store.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

AttendanceRecord record(const std::string& id, const std::string& date,
                        const std::string& time, float confidence) {
    AttendanceRecord r;
    r.identity = id;
    r.date = date;
    r.time = time;
    r.confidence = confidence;
    return r;
}

}  // namespace

void test_identities_and_embeddings() {
    TempStore t("identities");
    SqliteFaceStore& store = *t.store;

    CHECK(store.is_open());
    CHECK(store.count_identities() == 0);

    CHECK(store.add_identity("S2", "Bob"));
    CHECK(store.add_identity("S1", "Alice"));
    CHECK(store.add_identity("S3", "Carol"));
    CHECK(store.count_identities() == 3);

    CHECK(store.add_embedding("S2", {0.1f, 0.2f, 0.3f}, "front"));
    CHECK(store.add_embedding("S1", {1.0f, 0.0f, 0.0f}, "front"));
    CHECK(store.add_embedding("S1", {0.0f, 1.0f, 0.0f}, "left"));
    CHECK(!store.add_embedding("S1", {}, "right"));

    auto identities = store.load_identities();
    // S3 sin embeddings no aparece; orden de alta
    CHECK(identities.size() == 2);
    if (identities.size() == 2) {
        CHECK(identities[0].id == "S2");
        CHECK(identities[0].name == "Bob");
        CHECK(identities[0].references.size() == 1);
        CHECK(identities[1].id == "S1");
        CHECK(identities[1].references.size() == 2);
        if (identities[1].references.size() == 2) {
            CHECK(identities[1].references[0] == Embedding({1.0f, 0.0f, 0.0f}));
            CHECK(identities[1].references[1] == Embedding({0.0f, 1.0f, 0.0f}));
        }
    }
}

void test_add_identity_is_idempotent() {
    TempStore t("idempotent");
    CHECK(t.store->add_identity("S1", "Alice"));
    CHECK(t.store->add_identity("S1", "Alice"));
    CHECK(t.store->count_identities() == 1);
}

void test_attendance_by_date() {
    TempStore t("attendance");
    SqliteFaceStore& store = *t.store;
    CHECK(store.add_identity("S1", "Alice"));

    CHECK(store.append_attendance(record("S1", "2026-03-10", "09:15:00", 0.82f)));
    CHECK(store.append_attendance(record("S1", "2026-03-10", "08:30:00", 0.91f)));
    CHECK(store.append_attendance(record("S9", "2026-03-10", "10:00:00", 0.60f)));
    CHECK(store.append_attendance(record("S1", "2026-03-09", "09:00:00", 0.77f)));

    auto today = store.todays_attendance("2026-03-10");
    CHECK(today.size() == 3);
    if (today.size() == 3) {
        CHECK(today[0].time == "08:30:00");
        CHECK(today[0].name == "Alice");
        CHECK_NEAR(today[0].confidence, 0.91f, 1e-5f);
        CHECK(today[0].status == "Present");
        CHECK(today[0].source == "face_recognition");
        CHECK(today[1].time == "09:15:00");
        // Identidad sin fila en students: nombre vacio
        CHECK(today[2].identity == "S9");
        CHECK(today[2].name.empty());
    }

    CHECK(store.todays_attendance("2026-03-11").empty());
}

void test_delete_identity() {
    TempStore t("delete");
    SqliteFaceStore& store = *t.store;

    CHECK(store.add_identity("S1", "Alice"));
    CHECK(store.add_embedding("S1", {1.0f}, "front"));
    CHECK(store.append_attendance(record("S1", "2026-03-10", "09:00:00", 0.9f)));

    CHECK(store.delete_identity("S1"));
    CHECK(store.count_identities() == 0);
    CHECK(store.load_identities().empty());
    CHECK(store.todays_attendance("2026-03-10").empty());

    // Borrar algo inexistente no es error
    CHECK(store.delete_identity("S404"));
}

void test_reopen_keeps_data() {
    fs::path dir = make_temp_dir("reopen");
    std::string db = (dir / "quickroll.db").string();
    std::string images = (dir / "students").string();

    {
        SqliteFaceStore store(db, images);
        CHECK(store.add_identity("S1", "Alice"));
        CHECK(store.add_embedding("S1", {0.5f, 0.5f}, "front"));
    }
    {
        SqliteFaceStore store(db, images);
        auto identities = store.load_identities();
        CHECK(identities.size() == 1);
        CHECK(store.get_db_path() == db);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_captured_images() {
    TempStore t("images");
    SqliteFaceStore& store = *t.store;

    cv::Mat face = test::checkerboard(64, 64);
    auto path = store.save_captured_image("S1", face, "front");
    CHECK(path.has_value());
    if (path) {
        CHECK(fs::path(*path) == t.dir / "students" / "S1" / "front.jpg");
        CHECK(fs::exists(*path));
    }

    CHECK(!store.save_captured_image("S1", cv::Mat(), "left").has_value());
    CHECK(!store.save_captured_image("../escape", face, "front").has_value());
    CHECK(!fs::exists(t.dir / "escape"));
}

void test_identity_storage_keys() {
    TempStore t("keys");
    SqliteFaceStore& store = *t.store;

    CHECK(store.create_identity_storage("S1"));
    CHECK(fs::is_directory(t.dir / "students" / "S1"));

    CHECK(!store.create_identity_storage(""));
    CHECK(!store.create_identity_storage(".."));
    CHECK(!store.create_identity_storage("a/b"));
    CHECK(!store.create_identity_storage("a\\b"));
}

void test_open_failure_throws() {
    fs::path dir = make_temp_dir("badopen");
    bool thrown = false;
    try {
        // Un directorio no se puede abrir como base de datos
        SqliteFaceStore store(dir.string(), (dir / "students").string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    RUN_TEST(test_identities_and_embeddings);
    RUN_TEST(test_add_identity_is_idempotent);
    RUN_TEST(test_attendance_by_date);
    RUN_TEST(test_delete_identity);
    RUN_TEST(test_reopen_keeps_data);
    RUN_TEST(test_captured_images);
    RUN_TEST(test_identity_storage_keys);
    RUN_TEST(test_open_failure_throws);

    return test::test_result("test_sqlite_store");
}
