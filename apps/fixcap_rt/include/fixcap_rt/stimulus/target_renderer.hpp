#pragma once

#include <fixcap/core/core.hpp>
#include <fixcap/core/random.hpp>
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

namespace fixcap_rt::stimulus {

// Drawing colors, BGR in [0, 255]
inline const cv::Scalar kDiscColor{32, 32, 32};
inline const cv::Scalar kGlyphColor{170, 112, 17}; // muted blue
inline const cv::Scalar kCueColor{11, 125, 252};   // orange, last frame only

struct TargetStyle {
    std::string glyph{"E"};
    int font{cv::FONT_HERSHEY_SIMPLEX};
    double text_scale{0.5};
    int text_thickness{2};
};

struct RenderResult {
    cv::Mat frame; // CV_32FC3, screen sized, values in [0, 1]
    double next_shrink_factor;
    bool terminated;
};

class TargetRenderer {
  public:
    static constexpr double kShrinkRate = 0.9;
    static constexpr double kDiscScale = 5.0;
    static constexpr double kThresholdMin = 0.1;
    static constexpr double kThresholdMax = 0.5;

    TargetRenderer(TargetStyle style,
                   std::shared_ptr<fixcap::core::IRandomSource> random);

    // Draws a fresh termination threshold t ~ U(0.1, 0.5) on every call and
    // terminates when shrink_factor < t.
    RenderResult Render(cv::Size screen, cv::Point center, double shrink_factor,
                        fixcap::core::Orientation orientation);

    RenderResult Render(cv::Size screen, cv::Point center, double shrink_factor,
                        fixcap::core::Orientation orientation,
                        bool terminated) const;

    int DiscRadius(double shrink_factor) const;
    const TargetStyle &GetStyle() const { return style_; }

  private:
    void drawTarget_(cv::Mat &canvas, cv::Point center, double shrink_factor,
                     bool terminated) const;

    TargetStyle style_;
    cv::Size glyphSize_;
    std::shared_ptr<fixcap::core::IRandomSource> random_;
};

} // namespace fixcap_rt::stimulus
