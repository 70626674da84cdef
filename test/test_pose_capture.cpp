// ============= test/test_pose_capture.cpp =============
//
// Maquina de estados de la captura guiada front -> left -> right
// (detector/embedder/store falsos + reloj manual)
//

#include "quickroll/capture/pose_capture.hpp"
#include "test_common.hpp"

using namespace quickroll;
using namespace std::chrono;

namespace {

const cv::Rect FACE_BOX(200, 100, 200, 200);

// yaw 0, +0.6, -0.6
Detection front_face() { return test::make_detection(FACE_BOX, 260, 300, 340); }
Detection left_face()  { return test::make_detection(FACE_BOX, 290, 300, 340); }
Detection right_face() { return test::make_detection(FACE_BOX, 260, 300, 310); }

struct Fixture {
    std::shared_ptr<test::FakeDetector> detector = std::make_shared<test::FakeDetector>();
    std::shared_ptr<test::FakeEmbedder> embedder = std::make_shared<test::FakeEmbedder>();
    std::shared_ptr<test::FakeStore> store = std::make_shared<test::FakeStore>();
    steady_clock::time_point now{};
    cv::Mat frame = test::checkerboard(640, 480);

    PoseCapture make(bool mirrored = false) {
        PoseCaptureConfig config;
        config.mirrored = mirrored;
        return PoseCapture(detector, embedder, store, config, [this] { return now; });
    }

    CaptureFrameResult show(PoseCapture& capture, const Detection& face) {
        detector->next = {face};
        return capture.process(frame);
    }
};

}  // namespace

void test_full_session() {
    Fixture f;
    PoseCapture capture = f.make();

    CHECK(capture.state() == CaptureState::WAITING);
    CHECK(capture.status_message() == "Ready");
    CHECK(capture.start_session("S1"));
    CHECK(capture.state() == CaptureState::CAPTURING);
    CHECK(capture.status_message() == "Look Straight Ahead");
    CHECK(capture.target_pose() == CapturePose::FRONT);
    CHECK_NEAR(capture.progress(), 0.0f, 1e-6f);

    auto r1 = f.show(capture, front_face());
    CHECK(r1.captured);
    CHECK(r1.message == "Turn Head LEFT (Show Right Profile)");
    CHECK_NEAR(r1.progress, 1.0f / 3.0f, 1e-5f);
    CHECK(capture.target_pose() == CapturePose::LEFT);

    f.now += seconds(1);
    auto r2 = f.show(capture, left_face());
    CHECK(r2.captured);
    CHECK_NEAR(r2.yaw, 0.6f, 1e-5f);
    CHECK(r2.message == "Turn Head RIGHT (Show Left Profile)");
    CHECK_NEAR(r2.progress, 2.0f / 3.0f, 1e-5f);

    f.now += seconds(1);
    auto r3 = f.show(capture, right_face());
    CHECK(r3.captured);
    CHECK(r3.state == CaptureState::COMPLETED);
    CHECK(r3.message == "All Captures Complete!");
    CHECK_NEAR(r3.progress, 1.0f, 1e-6f);
    CHECK(!capture.target_pose().has_value());

    CHECK(capture.captured().size() == 3);
    CHECK(f.store->images.count("S1/front") == 1);
    CHECK(f.store->images.count("S1/left") == 1);
    CHECK(f.store->images.count("S1/right") == 1);

    CHECK(f.store->embeddings_added.size() == 3);
    if (f.store->embeddings_added.size() == 3) {
        CHECK(f.store->embeddings_added[0].second == "front");
        CHECK(f.store->embeddings_added[1].second == "left");
        CHECK(f.store->embeddings_added[2].second == "right");
    }
    // Embedding alineado con landmarks en cada pose
    CHECK(f.embedder->aligned_calls == 3);

    // COMPLETED no vuelve a capturar
    f.now += seconds(5);
    auto r4 = f.show(capture, front_face());
    CHECK(!r4.captured);
    CHECK(r4.state == CaptureState::COMPLETED);
    CHECK(f.store->embeddings_added.size() == 3);
}

void test_wrong_pose_does_not_advance() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    auto turned = f.show(capture, left_face());
    CHECK(!turned.captured);
    CHECK(turned.message == "Look Straight");
    CHECK(capture.target_pose() == CapturePose::FRONT);

    CHECK(f.show(capture, front_face()).captured);
    f.now += seconds(2);

    auto straight = f.show(capture, front_face());
    CHECK(!straight.captured);
    CHECK(straight.message == "Turn MORE Left");

    auto wrong_side = f.show(capture, right_face());
    CHECK(!wrong_side.captured);
    CHECK(wrong_side.message == "Turn MORE Left");
    CHECK(capture.captured().size() == 1);
}

void test_capture_interval() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    CHECK(f.show(capture, front_face()).captured);

    f.now += milliseconds(500);
    auto early = f.show(capture, left_face());
    CHECK(!early.captured);
    CHECK(early.message == "Turn Head LEFT (Show Right Profile)");

    f.now += milliseconds(500);
    CHECK(f.show(capture, left_face()).captured);
}

void test_mirrored_flips_yaw() {
    Fixture f;
    PoseCapture capture = f.make(true);
    CHECK(capture.start_session("S1"));

    CHECK(f.show(capture, front_face()).captured);
    f.now += seconds(1);

    // En espejo los landmarks de "derecha" son un giro a la izquierda
    auto r = f.show(capture, right_face());
    CHECK(r.captured);
    CHECK_NEAR(r.yaw, 0.6f, 1e-5f);
    CHECK(capture.captured().count(CapturePose::LEFT) == 1);
}

void test_save_failure_retries() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    f.store->fail_save = true;
    auto failed = f.show(capture, front_face());
    CHECK(!failed.captured);
    CHECK(failed.message == "Save Failed - Retrying");
    CHECK(capture.target_pose() == CapturePose::FRONT);
    CHECK(capture.captured().empty());
    CHECK(f.store->embeddings_added.empty());

    f.store->fail_save = false;
    CHECK(f.show(capture, front_face()).captured);
    CHECK(capture.target_pose() == CapturePose::LEFT);
}

void test_missing_embedding_still_advances() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    f.embedder->probe.clear();
    CHECK(f.show(capture, front_face()).captured);
    CHECK(capture.target_pose() == CapturePose::LEFT);
    CHECK(f.store->embeddings_added.empty());
}

void test_no_face_and_bad_quality() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    f.detector->next.clear();
    auto none = capture.process(f.frame);
    CHECK(!none.captured);
    CHECK(none.message == "No Face Detected");
    CHECK(!none.frame.empty());

    f.frame = cv::Mat(480, 640, CV_8UC3, cv::Scalar(128, 128, 128));
    auto blurry = f.show(capture, front_face());
    CHECK(!blurry.captured);
    CHECK(blurry.message == "Quality: Blurry");
    CHECK(blurry.issues.size() == 1);
    CHECK(capture.target_pose() == CapturePose::FRONT);
}

void test_detector_failure_is_no_face() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    f.detector->next = {front_face()};
    f.detector->fail = true;
    auto r = capture.process(f.frame);
    CHECK(!r.captured);
    CHECK(r.message == "No Face Detected");
    CHECK(capture.target_pose() == CapturePose::FRONT);

    f.detector->fail = false;
    CHECK(capture.process(f.frame).captured);
}

void test_largest_face_wins() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));

    Detection small_turned = test::make_detection(cv::Rect(20, 20, 80, 80), 45, 50, 90);
    f.detector->next = {small_turned, front_face()};
    auto r = capture.process(f.frame);

    CHECK(r.captured);
    CHECK(capture.captured().count(CapturePose::FRONT) == 1);
}

void test_session_guards() {
    Fixture f;
    PoseCapture capture = f.make();

    // Sin sesion: el frame pasa sin cambios
    f.detector->next = {front_face()};
    auto idle = capture.process(f.frame);
    CHECK(idle.state == CaptureState::WAITING);
    CHECK(!idle.captured);
    CHECK(f.detector->calls == 0);

    CHECK(!capture.start_session(""));
    CHECK(capture.state() == CaptureState::WAITING);

    f.store->fail_storage = true;
    CHECK(!capture.start_session("S1"));
    CHECK(capture.state() == CaptureState::WAITING);

    f.store->fail_storage = false;
    CHECK(capture.start_session("S1"));
    CHECK(capture.identity() == "S1");
    CHECK(capture.process(cv::Mat()).frame.empty());
}

void test_reset() {
    Fixture f;
    PoseCapture capture = f.make();
    CHECK(capture.start_session("S1"));
    CHECK(f.show(capture, front_face()).captured);

    capture.reset();
    CHECK(capture.state() == CaptureState::WAITING);
    CHECK(capture.captured().empty());
    CHECK(capture.identity().empty());
    CHECK(capture.status_message() == "Ready");
    CHECK_NEAR(capture.progress(), 0.0f, 1e-6f);

    // Nueva sesion: primera captura inmediata
    CHECK(capture.start_session("S2"));
    CHECK(f.show(capture, front_face()).captured);
}

void test_padded_box() {
    cv::Size size(640, 480);
    CHECK(PoseCapture::padded_box(FACE_BOX, size, 0.2f) == cv::Rect(160, 60, 280, 280));
    CHECK(PoseCapture::padded_box(cv::Rect(0, 0, 100, 100), size, 0.2f) == cv::Rect(0, 0, 120, 120));
    CHECK(PoseCapture::padded_box(cv::Rect(700, 500, 50, 50), size, 0.2f).area() == 0);
}

void test_null_collaborators_throw() {
    Fixture f;
    bool thrown = false;
    try {
        PoseCapture capture(f.detector, f.embedder, nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    CHECK(thrown);
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    RUN_TEST(test_full_session);
    RUN_TEST(test_wrong_pose_does_not_advance);
    RUN_TEST(test_capture_interval);
    RUN_TEST(test_mirrored_flips_yaw);
    RUN_TEST(test_save_failure_retries);
    RUN_TEST(test_missing_embedding_still_advances);
    RUN_TEST(test_no_face_and_bad_quality);
    RUN_TEST(test_detector_failure_is_no_face);
    RUN_TEST(test_largest_face_wins);
    RUN_TEST(test_session_guards);
    RUN_TEST(test_reset);
    RUN_TEST(test_padded_box);
    RUN_TEST(test_null_collaborators_throw);

    return test::test_result("test_pose_capture");
}
