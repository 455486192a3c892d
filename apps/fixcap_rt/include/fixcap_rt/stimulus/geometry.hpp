#pragma once

#include <fixcap/core/core.hpp>
#include <opencv2/core.hpp>

// The target is authored for a horizontal (LEFT/RIGHT) layout. Vertical
// orientations are drawn on a canvas with swapped axes and transposed back
// afterwards; mirrored orientations (LEFT, UP) mirror the center before
// drawing and the finished frame after it, so the target lands where the
// caller asked while the glyph ends up mirrored.
namespace fixcap_rt::stimulus {

bool IsVertical(fixcap::core::Orientation orientation);
bool IsMirrored(fixcap::core::Orientation orientation);

// Size of the drawing canvas for a screen of the given size
cv::Size CanvasSize(cv::Size screen, fixcap::core::Orientation orientation);

// Screen point -> canvas point, including the pre-draw mirror
cv::Point ToCanvas(cv::Point center, cv::Size screen,
                   fixcap::core::Orientation orientation);

// x' = width - x
cv::Point MirrorPoint(cv::Point point, int width);

// Horizontal flip in place
void MirrorFrame(cv::Mat &frame);

// Undo the canvas transform on a finished frame: mirror then transpose
cv::Mat FromCanvas(const cv::Mat &canvas, fixcap::core::Orientation orientation);

} // namespace fixcap_rt::stimulus
