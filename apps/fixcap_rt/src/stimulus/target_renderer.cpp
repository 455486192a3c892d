#include "fixcap_rt/stimulus/target_renderer.hpp"
#include "fixcap_rt/stimulus/geometry.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace fixcap_rt::stimulus {

TargetRenderer::TargetRenderer(
    TargetStyle style, std::shared_ptr<fixcap::core::IRandomSource> random)
    : style_(std::move(style)), random_(std::move(random)) {
    if (!random_) {
        throw std::invalid_argument("TargetRenderer requires a random source");
    }
    int baseline = 0;
    glyphSize_ = cv::getTextSize(style_.glyph, style_.font, style_.text_scale,
                                 style_.text_thickness, &baseline);
}

RenderResult TargetRenderer::Render(cv::Size screen, cv::Point center,
                                    double shrink_factor,
                                    fixcap::core::Orientation orientation) {
    double threshold = random_->uniform(kThresholdMin, kThresholdMax);
    return Render(screen, center, shrink_factor, orientation,
                  shrink_factor < threshold);
}

RenderResult TargetRenderer::Render(cv::Size screen, cv::Point center,
                                    double shrink_factor,
                                    fixcap::core::Orientation orientation,
                                    bool terminated) const {
    cv::Mat canvas =
        cv::Mat::zeros(CanvasSize(screen, orientation), CV_32FC3);
    drawTarget_(canvas, ToCanvas(center, screen, orientation), shrink_factor,
                terminated);

    cv::Mat frame;
    FromCanvas(canvas, orientation).convertTo(frame, CV_32FC3, 1.0 / 255.0);

    return {frame, shrink_factor * kShrinkRate, terminated};
}

int TargetRenderer::DiscRadius(double shrink_factor) const {
    return static_cast<int>(glyphSize_.width * kDiscScale * shrink_factor);
}

void TargetRenderer::drawTarget_(cv::Mat &canvas, cv::Point center,
                                 double shrink_factor, bool terminated) const {
    cv::circle(canvas, center, DiscRadius(shrink_factor), kDiscColor,
               cv::FILLED);

    cv::Point origin(center.x - glyphSize_.width / 2,
                     center.y + glyphSize_.height / 2);
    cv::putText(canvas, style_.glyph, origin, style_.font, style_.text_scale,
                terminated ? kCueColor : kGlyphColor, style_.text_thickness,
                cv::LINE_AA);
}

} // namespace fixcap_rt::stimulus
