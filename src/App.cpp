#include "App.h"

#include "ImageLoader.h"
#include "ImageUtils.h"
#include "MappingErrors.h"
#include "MappingOrchestrator.h"
#include "NordPalette.h"

#include <opencv2/core/utility.hpp>
#include <opencv2/core/utils/logger.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace {
const char* const kKeys =
    "{help h usage ?   |      | print this message }"
    "{config c         |      | YAML/JSON config file }"
    "{output o         |      | output file (single input) or directory }"
    "{dither d         |      | dithering strength in [0, 1], 0 disables }"
    "{kernel k         |      | floyd_steinberg, sierra_lite or stucki }"
    "{model m          |      | ONNX segmentation model (enables segmentation) }"
    "{no-segmentation  |      | ignore any configured segmentation model }"
    "{background b     |      | flatten transparent inputs over this hex color }"
    "{threshold t      |      | skip images darker than this brightness (0..1) }"
    "{auto-adjust a    |      | scale dither strength by each image's brightness }"
    "{verbose v        |      | debug logging }";

// Options that take a value; CommandLineParser only reads them as --key=value.
bool IsValuedOption(const std::string& arg) {
  static const char* const kValued[] = {"c", "config", "o", "output", "d", "dither", "k", "kernel",
                                        "m", "model", "b", "background", "t", "threshold"};
  if (arg.size() < 2 || arg[0] != '-' || arg.find('=') != std::string::npos) return false;
  const size_t start = arg.find_first_not_of('-');
  if (start == std::string::npos) return false;
  const std::string name = arg.substr(start);
  for (const char* key : kValued) {
    if (name == key) return true;
  }
  return false;
}

// Set by SIGINT; checked between images.
std::atomic<bool> g_cancel{false};

void OnInterrupt(int) { g_cancel.store(true); }
} // namespace

bool App::Initialize(int argc, const char* const argv[]) {
  cv::CommandLineParser parser(argc, argv, kKeys);
  parser.about("image2nord: remap images to the Nord color palette\n"
               "Options are written as --key=value.");

  if (parser.has("help")) {
    parser.printMessage();
    exitCode_ = 0;
    return false;
  }

  if (parser.has("config")) configPath_ = parser.get<std::string>("config");
  if (parser.has("output")) outputPath_ = parser.get<std::string>("output");
  if (parser.has("kernel")) kernel_ = parser.get<std::string>("kernel");
  if (parser.has("model")) model_ = parser.get<std::string>("model");
  if (parser.has("background")) background_ = parser.get<std::string>("background");
  if (parser.has("dither")) dither_ = parser.get<float>("dither");
  if (parser.has("threshold")) threshold_ = parser.get<float>("threshold");
  noSegmentation_ = parser.has("no-segmentation");
  autoAdjust_ = parser.has("auto-adjust");
  verbose_ = parser.has("verbose");

  if (!parser.check()) {
    parser.printErrors();
    exitCode_ = 2;
    return false;
  }

  // Options are "--key=value"; every other argument is an input image.
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.empty() || arg[0] == '-') continue;
    if (IsValuedOption(argv[i - 1])) {
      CV_LOG_ERROR(NULL, "'" << argv[i - 1] << " " << arg << "': write options as --key=value");
      exitCode_ = 2;
      return false;
    }
    inputs_.push_back(arg);
  }
  if (inputs_.empty()) {
    parser.printMessage();
    exitCode_ = 2;
    return false;
  }
  return true;
}

MappingConfig App::BuildConfig() const {
  MappingConfig config = configPath_.empty() ? MappingConfig() : MappingConfig::Load(configPath_);

  if (dither_ >= 0.0f) config.ditherStrength = dither_;
  if (threshold_ >= 0.0f) config.brightnessThreshold = threshold_;
  if (!background_.empty()) config.background = background_;
  if (!kernel_.empty() && !ParseDitherKernel(kernel_, config.ditherKernel)) {
    throw ConfigurationError("unknown dither kernel '" + kernel_ + "'");
  }
  if (!model_.empty()) {
    config.segmentation.enabled = true;
    config.segmentation.modelPath = model_;
  }
  if (noSegmentation_) config.segmentation.enabled = false;
  if (autoAdjust_) config.autoAdjust = true;

  config.Validate();
  return config;
}

SegmentationAdapter App::BuildSegmentation(const MappingConfig& config) {
  const MappingConfig::Segmentation& seg = config.segmentation;
  if (!seg.enabled) return SegmentationAdapter();

  try {
    SegmentationModel model = SegmentationModel::FromOnnx(seg.modelPath);
    model.inputSize = cv::Size(seg.inputWidth, seg.inputHeight);
    model.scale = seg.scale;
    model.mean = seg.mean;
    model.swapRB = seg.swapRB;
    model.classes = config.ModelClasses();
    CV_LOG_INFO(NULL, "segmentation model loaded: " << seg.modelPath);
    return SegmentationAdapter(std::move(model), std::chrono::milliseconds(seg.timeoutMs));
  } catch (const ModelInferenceError& e) {
    CV_LOG_WARNING(NULL, "continuing without segmentation: " << e.Detail());
    return SegmentationAdapter();
  }
}

std::string App::OutputPathFor(const std::string& input, const std::string& output, bool singleInput) {
  const fs::path in(input);
  const std::string fileName = in.stem().string() + "_nord.png";

  if (output.empty()) {
    return (in.parent_path() / fileName).string();
  }
  std::error_code ec;
  if (singleInput && !fs::is_directory(output, ec)) {
    return output;
  }
  return (fs::path(output) / fileName).string();
}

int App::Run() {
  cv::utils::logging::setLogLevel(verbose_ ? cv::utils::logging::LOG_LEVEL_DEBUG
                                           : cv::utils::logging::LOG_LEVEL_INFO);

  MappingConfig config;
  try {
    config = BuildConfig();
  } catch (const ConfigurationError& e) {
    CV_LOG_ERROR(NULL, e.what());
    return exitCode_ = 2;
  }

  const bool singleInput = inputs_.size() == 1;
  if (!singleInput && !outputPath_.empty()) {
    std::error_code ec;
    fs::create_directories(outputPath_, ec);
    if (ec) {
      CV_LOG_ERROR(NULL, "cannot create output directory '" << outputPath_ << "': " << ec.message());
      return exitCode_ = 2;
    }
  }

  int failures = 0;
  try {
    const NordPalette palette;
    const MappingOrchestrator orchestrator(palette, config, BuildSegmentation(config));

    // Step 1: Decode every input; dim images are skipped like a no-op.
    std::vector<ImageJob> jobs;
    std::map<std::string, std::string> claimed;  // output path -> input that writes it
    for (const std::string& path : inputs_) {
      const std::string target = fs::path(OutputPathFor(path, outputPath_, singleInput)).lexically_normal().string();
      const auto owner = claimed.find(target);
      if (owner != claimed.end()) {
        CV_LOG_ERROR(NULL, "'" << path << "' would overwrite the output of '" << owner->second << "' ("
                                << target << "), skipping it");
        ++failures;
        continue;
      }
      claimed.emplace(target, path);

      ImageJob job;
      job.id = path;
      std::string err;
      if (!ImageLoader::Load(path, job.image, err)) {
        CV_LOG_ERROR(NULL, err);
        ++failures;
        continue;
      }

      if (config.brightnessThreshold > 0.0f || config.autoAdjust) {
        // Format problems are reported by the mapping run itself.
        if (job.image.depth() == CV_8U && (job.image.channels() == 3 || job.image.channels() == 4)) {
          const ImageInformation info = AnalyzeBrightness(job.image);
          std::ostringstream score;
          score << std::fixed << std::setprecision(1) << info.Score();
          if (info.average < config.brightnessThreshold) {
            CV_LOG_INFO(NULL, "skipping '" << path << "': brightness " << score.str() << " of 9 is below the threshold");
            continue;
          }
          CV_LOG_DEBUG(NULL, "'" << path << "' brightness " << score.str() << " of 9");
          if (config.autoAdjust) {
            job.ditherStrength = AutoDitherStrength(info, config.ditherStrength);
            CV_LOG_INFO(NULL, "'" << path << "' dither strength adjusted to " << *job.ditherStrength);
          }
        }
      }
      jobs.push_back(std::move(job));
    }

    // Step 2: Map. Ctrl+C stops before the next image starts.
    std::signal(SIGINT, OnInterrupt);
    const std::vector<BatchResult> results = orchestrator.MapBatch(jobs, &g_cancel);
    std::signal(SIGINT, SIG_DFL);

    // Step 3: Encode.
    for (const BatchResult& r : results) {
      if (r.cancelled) {
        CV_LOG_WARNING(NULL, "cancelled before '" << r.id << "' was processed");
        ++failures;
        continue;
      }
      if (!r.Ok()) {
        ++failures;
        continue;
      }
      const std::string target = OutputPathFor(r.id, outputPath_, singleInput);
      std::string err;
      if (!ImageLoader::Save(target, r.output, err)) {
        CV_LOG_ERROR(NULL, err);
        ++failures;
        continue;
      }
      CV_LOG_INFO(NULL, "wrote " << target);
    }
  } catch (const ConfigurationError& e) {
    CV_LOG_ERROR(NULL, e.what());
    return exitCode_ = 2;
  }

  return exitCode_ = (failures > 0 ? 1 : 0);
}
