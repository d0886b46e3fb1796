#pragma once

#include "SemanticClass.h"

#include <opencv2/core.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// A frozen segmentation model and its fixed input/output contract.
struct SegmentationModel {
  // Takes an NCHW float blob, returns class scores shaped [1, C, H, W] or [1, C].
  using InferenceFn = std::function<cv::Mat(const cv::Mat& blob)>;

  InferenceFn infer;
  cv::Size inputSize{320, 320};
  double scale = 1.0 / 255.0;
  cv::Scalar mean{0.0, 0.0, 0.0};
  bool swapRB = true;
  std::vector<SemanticClass> classes;  // output channel i -> classes[i]

  // Loads an ONNX file with OpenCV's dnn module. The returned model serializes
  // forward passes so it can be shared by concurrent runs.
  // Throws ModelInferenceError if the file cannot be loaded.
  static SegmentationModel FromOnnx(const std::string& path);
};

// SegmentationAdapter:
// - Capability gated: holds either a model or nothing.
// - Disabled (no model): every pixel is SemanticClass::Unknown.
// - Enabled: the model runs once per image; the caller keeps the resulting label map
//   for the rest of the run.
// - Segmentation only biases color choices, so Segment() never lets a model failure
//   escape: it logs a warning and returns the all-unknown map instead.
class SegmentationAdapter {
public:
  SegmentationAdapter() = default;
  explicit SegmentationAdapter(std::optional<SegmentationModel> model,
                               std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  bool Enabled() const { return model_.has_value(); }

  // Label map (CV_8UC1, same size as |bgr|). Falls back to all-unknown on failure.
  cv::Mat Segment(const cv::Mat& bgr, const std::string& imageId) const;

  // Same as Segment() but reports failures as ModelInferenceError.
  cv::Mat Infer(const cv::Mat& bgr, const std::string& imageId) const;

  static cv::Mat UnknownLabels(const cv::Size& size);

private:
  cv::Mat DecodeScores(const cv::Mat& scores, const cv::Size& imageSize, const std::string& imageId) const;

  std::optional<SegmentationModel> model_;
  std::chrono::milliseconds timeout_{0};  // 0 = no budget
};
