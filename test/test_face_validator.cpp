// ============= test/test_face_validator.cpp =============
//
// Gate de calidad (tamano, nitidez, brillo) + yaw por landmarks
//

#include "quickroll/capture/face_validator.hpp"
#include "test_common.hpp"

using namespace quickroll;

namespace {

bool has_issue(const QualityReport& report, const std::string& issue) {
    return std::find(report.issues.begin(), report.issues.end(), issue) != report.issues.end();
}

}  // namespace

void test_sharp_face_passes() {
    cv::Mat frame = test::checkerboard(640, 480);
    auto report = FaceValidator::check_quality(frame, cv::Rect(200, 100, 200, 200));

    CHECK(report.passed);
    CHECK(report.issues.empty());
    CHECK(report.sharpness > Config::BLUR_THRESHOLD);
    CHECK(report.brightness > 100.0 && report.brightness < 160.0);
}

void test_uniform_face_is_blurry() {
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(128, 128, 128));
    auto report = FaceValidator::check_quality(frame, cv::Rect(200, 100, 200, 200));

    CHECK(!report.passed);
    CHECK(report.issues.size() == 1);
    CHECK(has_issue(report, "Blurry"));
    CHECK_NEAR(report.sharpness, 0.0, 1e-9);
}

void test_dark_and_bright() {
    cv::Mat dark = test::checkerboard(640, 480) * 0.1;
    auto dark_report = FaceValidator::check_quality(dark, cv::Rect(200, 100, 200, 200));
    CHECK(!dark_report.passed);
    CHECK(has_issue(dark_report, "Too Dark"));
    CHECK(!has_issue(dark_report, "Too Bright"));

    cv::Mat bright(480, 640, CV_8UC3, cv::Scalar(250, 250, 250));
    auto bright_report = FaceValidator::check_quality(bright, cv::Rect(200, 100, 200, 200));
    CHECK(!bright_report.passed);
    CHECK(has_issue(bright_report, "Too Bright"));
    CHECK(!has_issue(bright_report, "Too Dark"));
}

void test_small_face() {
    cv::Mat frame = test::checkerboard(640, 480);
    auto report = FaceValidator::check_quality(frame, cv::Rect(200, 100, 50, 50));

    CHECK(!report.passed);
    CHECK(report.issues.size() == 1);
    CHECK(has_issue(report, "Too Small (50x50)"));
}

void test_invalid_roi() {
    cv::Mat frame = test::checkerboard(640, 480);

    auto outside = FaceValidator::check_quality(frame, cv::Rect(1000, 1000, 100, 100));
    CHECK(!outside.passed);
    CHECK(outside.issues.size() == 1);
    CHECK(has_issue(outside, "Invalid ROI"));

    auto empty = FaceValidator::check_quality(cv::Mat(), cv::Rect(0, 0, 100, 100));
    CHECK(!empty.passed);
    CHECK(has_issue(empty, "Invalid ROI"));
}

void test_partially_outside_is_clamped() {
    cv::Mat frame = test::checkerboard(640, 480);
    auto report = FaceValidator::check_quality(frame, cv::Rect(560, 400, 200, 200));

    CHECK(report.passed);
}

void test_gray_and_bgra_input() {
    cv::Mat bgr = test::checkerboard(320, 240);
    cv::Mat gray, bgra;
    cv::extractChannel(bgr, gray, 0);
    cv::Mat channels[] = {gray, gray, gray, cv::Mat(gray.size(), CV_8UC1, cv::Scalar(255))};
    cv::merge(channels, 4, bgra);

    CHECK(FaceValidator::check_quality(gray, cv::Rect(50, 50, 100, 100)).passed);
    CHECK(FaceValidator::check_quality(bgra, cv::Rect(50, 50, 100, 100)).passed);
}

void test_yaw_estimate() {
    cv::Rect box(200, 100, 200, 200);

    CHECK_NEAR(FaceValidator::estimate_yaw(test::frontal_detection(box)), 0.0f, 1e-5f);
    // d_re = 10, d_le = 40
    CHECK_NEAR(FaceValidator::estimate_yaw(test::make_detection(box, 290, 300, 340)), 0.6f, 1e-5f);
    // d_re = 40, d_le = 10
    CHECK_NEAR(FaceValidator::estimate_yaw(test::make_detection(box, 260, 300, 310)), -0.6f, 1e-5f);
    // Landmarks colapsados
    CHECK_NEAR(FaceValidator::estimate_yaw(test::make_detection(box, 300, 300, 300)), 0.0f, 1e-6f);
}

void test_join_issues() {
    CHECK(FaceValidator::join_issues({}).empty());
    CHECK(FaceValidator::join_issues({"Blurry"}) == "Blurry");
    CHECK(FaceValidator::join_issues({"Blurry", "Too Dark"}) == "Blurry, Too Dark");
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    RUN_TEST(test_sharp_face_passes);
    RUN_TEST(test_uniform_face_is_blurry);
    RUN_TEST(test_dark_and_bright);
    RUN_TEST(test_small_face);
    RUN_TEST(test_invalid_roi);
    RUN_TEST(test_partially_outside_is_clamped);
    RUN_TEST(test_gray_and_bgra_input);
    RUN_TEST(test_yaw_estimate);
    RUN_TEST(test_join_issues);

    return test::test_result("test_face_validator");
}
