// ============= test/test_template_tracker.cpp =============
//
// Template tracker (NCC) + seleccion de backend
//

#include "quickroll/tracking/visual_tracker.hpp"
#include "quickroll/tracking/frame_tracker.hpp"
#include "test_common.hpp"
#include <cstdint>

using namespace quickroll;

namespace {

cv::Mat noise(int width, int height, uint64_t seed) {
    cv::RNG rng(seed);
    cv::Mat img(height, width, CV_8UC3);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);
    return img;
}

}  // namespace

void test_follows_shifted_content() {
    cv::Mat world = noise(400, 300, 7);
    cv::Mat frame0 = world(cv::Rect(20, 20, 320, 240)).clone();
    // Mismo contenido movido +5, +3 en coordenadas del frame
    cv::Mat frame1 = world(cv::Rect(15, 17, 320, 240)).clone();

    TemplateTracker tracker;
    CHECK(tracker.init(frame0, cv::Rect(100, 80, 60, 60)));

    cv::Rect box;
    CHECK(tracker.update(frame1, box));
    CHECK(box == cv::Rect(105, 83, 60, 60));
    CHECK(tracker.last_score() > 0.9f);
}

void test_fails_on_unrelated_frame() {
    cv::Mat frame0 = noise(320, 240, 1);
    cv::Mat other = noise(320, 240, 2);

    TemplateTracker tracker;
    CHECK(tracker.init(frame0, cv::Rect(100, 80, 60, 60)));

    cv::Rect box;
    CHECK(!tracker.update(other, box));
    CHECK(tracker.last_score() <= Config::TEMPLATE_MATCH_THRESHOLD);
    // Box sin cambios cuando falla
    CHECK(box == cv::Rect(100, 80, 60, 60));
}

void test_fails_when_window_smaller_than_template() {
    cv::Mat frame0 = noise(320, 240, 3);

    TemplateTracker tracker;
    CHECK(tracker.init(frame0, cv::Rect(100, 80, 60, 60)));

    cv::Rect box;
    cv::Mat tiny = noise(40, 40, 3);
    CHECK(!tracker.update(tiny, box));
}

void test_init_rejects_empty_box() {
    cv::Mat frame0 = noise(320, 240, 4);
    TemplateTracker tracker;

    CHECK(!tracker.init(frame0, cv::Rect(400, 400, 50, 50)));
    CHECK(!tracker.init(cv::Mat(), cv::Rect(0, 0, 50, 50)));

    cv::Rect box;
    CHECK(!tracker.update(frame0, box));
}

void test_clamped_template_near_border() {
    cv::Mat world = noise(400, 300, 9);
    cv::Mat frame0 = world(cv::Rect(40, 40, 320, 240)).clone();
    cv::Mat frame1 = world(cv::Rect(42, 40, 320, 240)).clone();

    // Box que se sale por la derecha: el template se recorta al frame
    TemplateTracker tracker;
    CHECK(tracker.init(frame0, cv::Rect(280, 100, 60, 60)));

    cv::Rect box;
    CHECK(tracker.update(frame1, box));
    CHECK(box.width == 40);
    CHECK(box.x == 278);
}

void test_backend_parsing() {
    CHECK(parse_tracker_backend("template") == TrackerBackend::TEMPLATE);
    CHECK(parse_tracker_backend("native") == TrackerBackend::NATIVE);
    CHECK(parse_tracker_backend("mil") == TrackerBackend::NATIVE);
    CHECK(parse_tracker_backend("auto") == TrackerBackend::AUTO);
    CHECK(parse_tracker_backend("kcf?") == TrackerBackend::AUTO);
}

void test_template_factory() {
    TrackerFactory factory = make_tracker_factory(TrackerBackend::TEMPLATE);
    auto tracker = factory();
    CHECK(dynamic_cast<TemplateTracker*>(tracker.get()) != nullptr);

    // AUTO siempre entrega algun tracker usable
    auto any = make_tracker_factory(TrackerBackend::AUTO)();
    CHECK(any != nullptr);
}

void test_iou() {
    CHECK_NEAR(FrameTracker::compute_iou(cv::Rect(0, 0, 10, 10), cv::Rect(0, 0, 10, 10)), 1.0f, 1e-6f);
    CHECK_NEAR(FrameTracker::compute_iou(cv::Rect(0, 0, 10, 10), cv::Rect(20, 20, 10, 10)), 0.0f, 1e-6f);
    // 50 / (100 + 100 - 50)
    CHECK_NEAR(FrameTracker::compute_iou(cv::Rect(0, 0, 10, 10), cv::Rect(5, 0, 10, 10)), 1.0f / 3.0f, 1e-5f);
    CHECK_NEAR(FrameTracker::compute_iou(cv::Rect(), cv::Rect()), 0.0f, 1e-6f);
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    RUN_TEST(test_follows_shifted_content);
    RUN_TEST(test_fails_on_unrelated_frame);
    RUN_TEST(test_fails_when_window_smaller_than_template);
    RUN_TEST(test_init_rejects_empty_box);
    RUN_TEST(test_clamped_template_near_border);
    RUN_TEST(test_backend_parsing);
    RUN_TEST(test_template_factory);
    RUN_TEST(test_iou);

    return test::test_result("test_template_tracker");
}
