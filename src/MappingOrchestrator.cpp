#include "MappingOrchestrator.h"
#include "ColorSpaceConverter.h"
#include "Disperser.h"
#include "ImageUtils.h"

#include <algorithm>
#include <cstdint>
#include <new>
#include <opencv2/core/utils/logger.hpp>

namespace {
ClassPreferences ValidatedPreferences(const MappingConfig& config) {
  config.Validate();
  return config.BuildPreferences();
}

void Report(const MappingOrchestrator::ProgressFn& progress, Stage stage, double fraction) {
  if (progress) progress(stage, fraction);
}
} // namespace

MappingOrchestrator::MappingOrchestrator(const NordPalette& palette, const MappingConfig& config,
                                         SegmentationAdapter segmentation)
    : palette_(palette),
      mapper_(palette, ValidatedPreferences(config)),
      segmentation_(std::move(segmentation)),
      kernel_(config.ditherKernel),
      ditherStrength_(config.ditherStrength),
      maxPixels_(config.maxPixels),
      background_(config.Background()) {}

cv::Mat MappingOrchestrator::Map(const cv::Mat& source, const std::string& imageId,
                                 const ProgressFn& progress) const {
  return Map(source, imageId, ditherStrength_, progress);
}

cv::Mat MappingOrchestrator::Map(const cv::Mat& source, const std::string& imageId, float ditherStrength,
                                 const ProgressFn& progress) const {
  Stage stage = Stage::Validate;
  try {
    return RunStages(source, imageId, ditherStrength, progress, stage);
  } catch (const UnsupportedFormatError& e) {
    throw UnsupportedFormatError(e.Detail(), e.GetStage(), imageId);
  } catch (const ResourceExhaustionError& e) {
    throw ResourceExhaustionError(e.Detail(), e.GetStage(), imageId);
  } catch (const MappingError&) {
    throw;
  } catch (const std::bad_alloc&) {
    throw ResourceExhaustionError("buffer allocation failed", stage, imageId);
  } catch (const cv::Exception& e) {
    if (e.code == cv::Error::StsNoMem) {
      throw ResourceExhaustionError("buffer allocation failed: " + e.msg, stage, imageId);
    }
    throw MappingError("OpenCV error: " + e.msg, stage, imageId);
  } catch (const std::exception& e) {
    throw MappingError(e.what(), stage, imageId);
  }
}

cv::Mat MappingOrchestrator::RunStages(const cv::Mat& source, const std::string& imageId,
                                       float ditherStrength, const ProgressFn& progress,
                                       Stage& stage) const {
  // Step 1: Reject shapes the converter cannot handle and images above the pixel limit.
  stage = Stage::Validate;
  ColorSpaceConverter::CheckFormat(source);
  const std::int64_t pixels = static_cast<std::int64_t>(source.rows) * source.cols;
  if (pixels > maxPixels_) {
    throw ResourceExhaustionError("image has " + std::to_string(pixels) + " pixels, limit is " +
                                      std::to_string(maxPixels_),
                                  stage, imageId);
  }

  // Step 2: Forward conversion. Transparent inputs are flattened first when a
  // background color is configured.
  stage = Stage::Convert;
  Report(progress, stage, 0.0);
  cv::Mat working = source;
  if (source.channels() == 4 && background_) {
    working = CompositeOver(source, *background_);
  }
  const cv::Mat lab = ColorSpaceConverter::ToLab(working);
  Report(progress, stage, 1.0);

  // Step 3: Optional segmentation, once per image. Failures come back as all-unknown.
  stage = Stage::Segment;
  Report(progress, stage, 0.0);
  cv::Mat labels = segmentation_.Segment(working, imageId);
  if (labels.size() != lab.size() || labels.type() != CV_8UC1) {
    CV_LOG_WARNING(NULL, "segmentation for '" << imageId << "' returned a mismatched label map, ignoring it");
    labels = SegmentationAdapter::UnknownLabels(lab.size());
  }
  Report(progress, stage, 1.0);

  // Step 4: Raster-order mapping with error diffusion.
  stage = Stage::Map;
  const cv::Mat ids = QuantizeRaster(lab, labels, ditherStrength, progress);

  // Step 5: Native palette values into a fresh destination buffer.
  stage = Stage::Render;
  Report(progress, stage, 0.0);
  cv::Mat out = Render(ids, source);
  Report(progress, stage, 1.0);
  return out;
}

cv::Mat MappingOrchestrator::QuantizeRaster(const cv::Mat& lab, const cv::Mat& labels,
                                            float ditherStrength, const ProgressFn& progress) const {
  Disperser disperser(kernel_, ditherStrength);
  disperser.Reset(lab.size());

  cv::Mat ids(lab.size(), CV_8UC1);
  const int reportEvery = std::max(1, lab.rows / 16);

  for (int y = 0; y < lab.rows; ++y) {
    const cv::Vec3f* labRow = lab.ptr<cv::Vec3f>(y);
    uchar* idRow = ids.ptr<uchar>(y);

    for (int x = 0; x < lab.cols; ++x) {
      // Error pushed by earlier pixels can move the value out of range; clamp before resolving.
      const cv::Vec3f value = ColorSpaceConverter::ClampLab(labRow[x] + disperser.Consume(y, x));
      const PixelMapping m = mapper_.MapPixel(value, RegionAwareMapper::LabelAt(labels, y, x));

      idRow[x] = static_cast<uchar>(m.match.id);
      disperser.Push(y, x, m.error);
    }

    if ((y + 1) % reportEvery == 0 || y + 1 == lab.rows) {
      Report(progress, Stage::Map, static_cast<double>(y + 1) / lab.rows);
    }
  }
  return ids;
}

cv::Mat MappingOrchestrator::Render(const cv::Mat& ids, const cv::Mat& source) const {
  const bool hasAlpha = source.channels() == 4;
  cv::Mat out(ids.size(), source.type());

  for (int y = 0; y < ids.rows; ++y) {
    const uchar* idRow = ids.ptr<uchar>(y);
    if (hasAlpha) {
      const cv::Vec4b* srcRow = source.ptr<cv::Vec4b>(y);
      cv::Vec4b* dstRow = out.ptr<cv::Vec4b>(y);
      for (int x = 0; x < ids.cols; ++x) {
        const cv::Vec3b& c = palette_.At(idRow[x]).bgr;
        // Flattened inputs become opaque; otherwise alpha passes through untouched.
        const uchar alpha = background_ ? 255 : srcRow[x][3];
        dstRow[x] = cv::Vec4b(c[0], c[1], c[2], alpha);
      }
    } else {
      cv::Vec3b* dstRow = out.ptr<cv::Vec3b>(y);
      for (int x = 0; x < ids.cols; ++x) {
        dstRow[x] = palette_.At(idRow[x]).bgr;
      }
    }
  }
  return out;
}

std::vector<BatchResult> MappingOrchestrator::MapBatch(const std::vector<ImageJob>& jobs,
                                                       const std::atomic<bool>* cancel) const {
  std::vector<BatchResult> results(jobs.size());
  for (size_t i = 0; i < jobs.size(); ++i) results[i].id = jobs[i].id;

  // Each worker writes only its own result slot.
  cv::parallel_for_(cv::Range(0, static_cast<int>(jobs.size())), [&](const cv::Range& range) {
    for (int i = range.start; i < range.end; ++i) {
      BatchResult& r = results[i];
      if (cancel && cancel->load()) {
        r.cancelled = true;
        continue;
      }
      try {
        const ImageJob& job = jobs[i];
        r.output = Map(job.image, job.id, job.ditherStrength.value_or(ditherStrength_));
      } catch (const MappingError& e) {
        r.error = e.what();
        CV_LOG_ERROR(NULL, e.what());
      }
    }
  });
  return results;
}
