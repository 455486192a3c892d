#include "fixcap_rt/stimulus/geometry.hpp"
#include <opencv2/core.hpp>

namespace fixcap_rt::stimulus {

using fixcap::core::Orientation;

bool IsVertical(Orientation orientation) {
    return orientation == Orientation::UP || orientation == Orientation::DOWN;
}

bool IsMirrored(Orientation orientation) {
    return orientation == Orientation::LEFT || orientation == Orientation::UP;
}

cv::Size CanvasSize(cv::Size screen, Orientation orientation) {
    if (IsVertical(orientation)) {
        return {screen.height, screen.width};
    }
    return screen;
}

cv::Point ToCanvas(cv::Point center, cv::Size screen, Orientation orientation) {
    cv::Point point = IsVertical(orientation) ? cv::Point(center.y, center.x)
                                              : center;
    if (IsMirrored(orientation)) {
        point = MirrorPoint(point, CanvasSize(screen, orientation).width);
    }
    return point;
}

cv::Point MirrorPoint(cv::Point point, int width) {
    return {width - point.x, point.y};
}

void MirrorFrame(cv::Mat &frame) { cv::flip(frame, frame, 1); }

cv::Mat FromCanvas(const cv::Mat &canvas, Orientation orientation) {
    cv::Mat frame = canvas;
    if (IsMirrored(orientation)) {
        frame = canvas.clone();
        MirrorFrame(frame);
    }
    if (IsVertical(orientation)) {
        cv::Mat transposed;
        cv::transpose(frame, transposed);
        return transposed;
    }
    return frame;
}

} // namespace fixcap_rt::stimulus
