#include "core/Overlay.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>
#include <utility>
#include <vector>

namespace core {

namespace {

// Readout layout
constexpr int TEXT_TOP = 30;
constexpr int LINE_HEIGHT = 20;
constexpr int LEFT_COLUMN_X = 10;
constexpr int RIGHT_COLUMN_OFFSET = 250;   // From the right edge

const std::vector<std::pair<int, int>> HAND_CONNECTIONS = {
    {0, 1}, {1, 2}, {2, 3}, {3, 4},         // Thumb
    {0, 5}, {5, 6}, {6, 7}, {7, 8},         // Index
    {5, 9}, {9, 10}, {10, 11}, {11, 12},    // Middle
    {9, 13}, {13, 14}, {14, 15}, {15, 16},  // Ring
    {13, 17}, {0, 17}, {17, 18}, {18, 19}, {19, 20}  // Pinky
};

} // namespace

PreviewWindow::PreviewWindow(std::string title)
    : title_(std::move(title)) {
    cv::namedWindow(title_, cv::WINDOW_AUTOSIZE);
}

PreviewWindow::~PreviewWindow() {
    cv::destroyWindow(title_);
}

void PreviewWindow::show(const cv::Mat& frame) {
    cv::imshow(title_, frame);
}

int PreviewWindow::pollKey() {
    return cv::waitKey(1);
}

void Overlay::beginFrame() {
    frameCount_++;
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastFpsTime_).count();
    if (elapsed >= 1000) {
        currentFps_ = frameCount_ * 1000.0f / elapsed;
        frameCount_ = 0;
        lastFpsTime_ = now;
    }
}

void Overlay::drawHand(cv::Mat& frame, const HandMetrics& metrics, CalibrationStatus status) const {
    const char* hand = handName(metrics.hand);

    // Left hand readout on the left side, right hand on the right side
    int x = (metrics.hand == Hand::Left) ? LEFT_COLUMN_X : frame.cols - RIGHT_COLUMN_OFFSET;
    int y = TEXT_TOP;

    char line[96];
    for (MetricName metric : ALL_METRICS) {
        std::snprintf(line, sizeof(line), "%s %s: %.2f", hand, metricName(metric),
                      metrics.values[static_cast<size_t>(metric)]);
        cv::putText(frame, line, cv::Point(x, y), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
        y += LINE_HEIGHT;
    }

    cv::Scalar statusColor = (status == CalibrationStatus::Unlocked) ? cv::Scalar(150, 150, 150)
                                                                     : cv::Scalar(0, 255, 255);
    std::snprintf(line, sizeof(line), "%s calib: %s", hand, CalibrationController::getStatusName(status));
    cv::putText(frame, line, cv::Point(x, y), cv::FONT_HERSHEY_SIMPLEX, 0.5, statusColor, 1);

    // Skeleton
    std::vector<cv::Point> points;
    points.reserve(LANDMARK_COUNT);
    for (const auto& lm : metrics.landmarks) {
        points.emplace_back(static_cast<int>(lm.x * static_cast<float>(frame.cols)),
                            static_cast<int>(lm.y * static_cast<float>(frame.rows)));
    }

    for (const auto& conn : HAND_CONNECTIONS) {
        cv::line(frame, points[conn.first], points[conn.second], cv::Scalar(0, 255, 0), 2);
    }
    for (size_t j = 0; j < points.size(); ++j) {
        int radius = (j == 0) ? 6 : 4; // Larger wrist
        cv::circle(frame, points[j], radius, cv::Scalar(0, 0, 255), -1);
        cv::circle(frame, points[j], radius, cv::Scalar(255, 255, 255), 1);
    }
}

void Overlay::drawStatus(cv::Mat& frame, int handCount) const {
    char line[64];
    std::snprintf(line, sizeof(line), "FPS: %.1f  Hands: %d", currentFps_, handCount);

    cv::Scalar fpsColor = (currentFps_ >= 28) ? cv::Scalar(0, 255, 0) :
                          (currentFps_ >= 20) ? cv::Scalar(0, 255, 255) : cv::Scalar(0, 0, 255);
    cv::putText(frame, line, cv::Point(LEFT_COLUMN_X, frame.rows - 12),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, fpsColor, 1);
}

} // namespace core
