#pragma once

#include "MappingConfig.h"
#include "MappingErrors.h"
#include "NordPalette.h"
#include "RegionAwareMapper.h"
#include "SegmentationAdapter.h"

#include <opencv2/core.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// One image of a batch.
struct ImageJob {
  std::string id;
  cv::Mat image;
  std::optional<float> ditherStrength;  // overrides the configured strength for this image
};

struct BatchResult {
  std::string id;
  cv::Mat output;      // empty unless the run succeeded
  std::string error;   // classified error message when the run failed
  bool cancelled = false;

  bool Ok() const { return !output.empty(); }
};

// MappingOrchestrator:
// - Runs one image through validate -> Lab -> segmentation -> raster mapping with
//   error diffusion -> render of native palette values.
// - Either returns a complete image (same size and channel count as the input, every
//   pixel a palette color) or throws a MappingError naming the stage and image id.
// - Immutable after construction; each run owns its own buffers, so one orchestrator
//   can serve concurrent runs.
class MappingOrchestrator {
public:
  using ProgressFn = std::function<void(Stage stage, double fraction)>;

  // Validates |config| (throws ConfigurationError). |palette| must outlive the orchestrator.
  MappingOrchestrator(const NordPalette& palette, const MappingConfig& config,
                      SegmentationAdapter segmentation = SegmentationAdapter());

  // Input must be CV_8UC3 (BGR) or CV_8UC4 (BGRA).
  cv::Mat Map(const cv::Mat& source, const std::string& imageId,
              const ProgressFn& progress = ProgressFn()) const;

  // Same, with a dither strength for this image only. Throws ConfigurationError unless
  // |ditherStrength| is in [0, 1].
  cv::Mat Map(const cv::Mat& source, const std::string& imageId, float ditherStrength,
              const ProgressFn& progress = ProgressFn()) const;

  // Independent images in parallel. |cancel| is checked before each image starts.
  std::vector<BatchResult> MapBatch(const std::vector<ImageJob>& jobs,
                                    const std::atomic<bool>* cancel = nullptr) const;

  bool SegmentationEnabled() const { return segmentation_.Enabled(); }

private:
  cv::Mat RunStages(const cv::Mat& source, const std::string& imageId,
                    float ditherStrength, const ProgressFn& progress, Stage& stage) const;
  cv::Mat QuantizeRaster(const cv::Mat& lab, const cv::Mat& labels, float ditherStrength,
                         const ProgressFn& progress) const;
  cv::Mat Render(const cv::Mat& ids, const cv::Mat& source) const;

  const NordPalette& palette_;
  RegionAwareMapper mapper_;
  SegmentationAdapter segmentation_;
  DitherKernel kernel_;
  float ditherStrength_;
  int maxPixels_;
  std::optional<RgbColor> background_;
};
