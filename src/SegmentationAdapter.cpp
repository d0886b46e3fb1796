#include "SegmentationAdapter.h"
#include "MappingErrors.h"

#include <cmath>
#include <memory>
#include <mutex>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

SegmentationModel SegmentationModel::FromOnnx(const std::string& path) {
  auto net = std::make_shared<cv::dnn::Net>();
  try {
    *net = cv::dnn::readNetFromONNX(path);
  } catch (const cv::Exception& e) {
    throw ModelInferenceError("failed to load model '" + path + "': " + e.what(), Stage::Startup);
  }
  if (net->empty()) {
    throw ModelInferenceError("model '" + path + "' has no layers", Stage::Startup);
  }

  // cv::dnn::Net is not reentrant.
  auto lock = std::make_shared<std::mutex>();

  SegmentationModel model;
  model.infer = [net, lock](const cv::Mat& blob) {
    std::lock_guard<std::mutex> guard(*lock);
    net->setInput(blob);
    return net->forward().clone();
  };
  return model;
}

SegmentationAdapter::SegmentationAdapter(std::optional<SegmentationModel> model,
                                         std::chrono::milliseconds timeout)
    : model_(std::move(model)), timeout_(timeout) {}

cv::Mat SegmentationAdapter::UnknownLabels(const cv::Size& size) {
  return cv::Mat(size, CV_8UC1, cv::Scalar(static_cast<int>(SemanticClass::Unknown)));
}

cv::Mat SegmentationAdapter::Segment(const cv::Mat& bgr, const std::string& imageId) const {
  if (!Enabled()) return UnknownLabels(bgr.size());

  try {
    return Infer(bgr, imageId);
  } catch (const ModelInferenceError& e) {
    CV_LOG_WARNING(NULL, "segmentation disabled for '" << imageId << "': " << e.Detail());
    return UnknownLabels(bgr.size());
  }
}

cv::Mat SegmentationAdapter::Infer(const cv::Mat& bgr, const std::string& imageId) const {
  if (!Enabled()) {
    throw ModelInferenceError("no segmentation model", Stage::Segment, imageId);
  }
  const SegmentationModel& model = *model_;
  if (!model.infer) {
    throw ModelInferenceError("model has no inference function", Stage::Segment, imageId);
  }
  if (model.classes.empty()) {
    throw ModelInferenceError("model has no output classes", Stage::Segment, imageId);
  }
  if (bgr.empty() || bgr.depth() != CV_8U || (bgr.channels() != 3 && bgr.channels() != 4)) {
    throw ModelInferenceError("malformed model input image", Stage::Segment, imageId);
  }

  cv::Mat scores;
  cv::TickMeter timer;
  try {
    cv::Mat input = bgr;
    if (bgr.channels() == 4) cv::cvtColor(bgr, input, cv::COLOR_BGRA2BGR);

    cv::Mat blob = cv::dnn::blobFromImage(input, model.scale, model.inputSize, model.mean,
                                          model.swapRB, false, CV_32F);
    timer.start();
    scores = model.infer(blob);
    timer.stop();
  } catch (const cv::Exception& e) {
    throw ModelInferenceError(std::string("inference failed: ") + e.what(), Stage::Segment, imageId);
  } catch (const std::exception& e) {
    throw ModelInferenceError(std::string("inference failed: ") + e.what(), Stage::Segment, imageId);
  }

  // The forward pass cannot be interrupted; a result that arrives late is discarded.
  if (timeout_.count() > 0 && timer.getTimeMilli() > static_cast<double>(timeout_.count())) {
    throw ModelInferenceError("inference exceeded " + std::to_string(timeout_.count()) + " ms",
                              Stage::Segment, imageId);
  }

  return DecodeScores(scores, bgr.size(), imageId);
}

cv::Mat SegmentationAdapter::DecodeScores(const cv::Mat& scores, const cv::Size& imageSize,
                                          const std::string& imageId) const {
  const int numClasses = static_cast<int>(model_->classes.size());

  if (scores.empty() || scores.type() != CV_32F) {
    throw ModelInferenceError("model output is empty or not float", Stage::Segment, imageId);
  }
  cv::Mat s = scores.isContinuous() ? scores : scores.clone();
  const float* data = s.ptr<float>();

  // [1, C]: one label for the whole image.
  if (s.dims == 2) {
    if (s.rows != 1 || s.cols != numClasses) {
      throw ModelInferenceError("output shape does not match class count", Stage::Segment, imageId);
    }
    int best = 0;
    for (int c = 0; c < numClasses; ++c) {
      if (std::isnan(data[c])) {
        throw ModelInferenceError("model output contains NaN", Stage::Segment, imageId);
      }
      if (data[c] > data[best]) best = c;
    }
    return cv::Mat(imageSize, CV_8UC1, cv::Scalar(static_cast<int>(model_->classes[best])));
  }

  // [1, C, H, W]: argmax over the class axis per cell.
  if (s.dims != 4 || s.size[0] != 1 || s.size[1] != numClasses) {
    throw ModelInferenceError("output shape does not match [1, C, H, W] with C = " +
                                  std::to_string(numClasses),
                              Stage::Segment, imageId);
  }
  const int h = s.size[2];
  const int w = s.size[3];
  if (h <= 0 || w <= 0) {
    throw ModelInferenceError("output has empty spatial size", Stage::Segment, imageId);
  }
  const size_t plane = static_cast<size_t>(h) * static_cast<size_t>(w);

  cv::Mat small(h, w, CV_8UC1);
  for (int y = 0; y < h; ++y) {
    uchar* row = small.ptr<uchar>(y);
    for (int x = 0; x < w; ++x) {
      const size_t offset = static_cast<size_t>(y) * w + x;
      int best = 0;
      float bestScore = data[offset];
      for (int c = 0; c < numClasses; ++c) {
        const float v = data[c * plane + offset];
        if (std::isnan(v)) {
          throw ModelInferenceError("model output contains NaN", Stage::Segment, imageId);
        }
        if (v > bestScore) {
          bestScore = v;
          best = c;
        }
      }
      row[x] = static_cast<uchar>(model_->classes[best]);
    }
  }

  if (small.size() == imageSize) return small;

  cv::Mat labels;
  cv::resize(small, labels, imageSize, 0.0, 0.0, cv::INTER_NEAREST);
  return labels;
}
