#include "App.h"
#include "ImageLoader.h"
#include "NordPalette.h"

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
// Owns argv storage for App::Initialize.
struct Args {
  explicit Args(std::vector<std::string> a) : args(std::move(a)) {
    for (const std::string& s : args) ptrs.push_back(s.c_str());
  }
  int argc() const { return static_cast<int>(ptrs.size()); }
  const char* const* argv() const { return ptrs.data(); }

  std::vector<std::string> args;
  std::vector<const char*> ptrs;
};

fs::path TempDir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("image2nord_app_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}
} // namespace

TEST(App, OutputPathDefaultsToInputDirectory) {
  EXPECT_EQ(App::OutputPathFor("photos/cat.jpg", "", true), (fs::path("photos") / "cat_nord.png").string());
}

TEST(App, OutputPathUsesExplicitFileForSingleInput) {
  EXPECT_EQ(App::OutputPathFor("cat.jpg", "result.png", true), "result.png");
}

TEST(App, OutputPathPlacesBatchResultsInDirectory) {
  const fs::path dir = TempDir("outdir");
  EXPECT_EQ(App::OutputPathFor("a/cat.jpg", dir.string(), false), (dir / "cat_nord.png").string());
  EXPECT_EQ(App::OutputPathFor("a/cat.jpg", dir.string(), true), (dir / "cat_nord.png").string());
}

TEST(App, HelpExitsWithoutRunning) {
  App app;
  const Args args({"image2nord", "--help"});
  EXPECT_FALSE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.ExitCode(), 0);
}

TEST(App, MissingInputsIsAUsageError) {
  App app;
  const Args args({"image2nord", "--dither=0.5"});
  EXPECT_FALSE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.ExitCode(), 2);
}

TEST(App, InvalidDitherIsAConfigurationError) {
  const fs::path dir = TempDir("baddither");
  const std::string input = (dir / "in.png").string();
  ASSERT_TRUE(cv::imwrite(input, cv::Mat(2, 2, CV_8UC3, cv::Scalar(1, 2, 3))));

  App app;
  const Args args({"image2nord", "--dither=3", input});
  ASSERT_TRUE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.Run(), 2);
}

TEST(App, MapsAnImageFileToPaletteColors) {
  const fs::path dir = TempDir("run");
  const std::string input = (dir / "in.png").string();
  const std::string output = (dir / "out.png").string();

  cv::Mat image(6, 6, CV_8UC3);
  cv::RNG(17).fill(image, cv::RNG::UNIFORM, 0, 256);
  ASSERT_TRUE(cv::imwrite(input, image));

  App app;
  const Args args({"image2nord", "--kernel=sierra_lite", "--output=" + output, input});
  ASSERT_TRUE(app.Initialize(args.argc(), args.argv()));
  ASSERT_EQ(app.Run(), 0);

  cv::Mat result;
  std::string err;
  ASSERT_TRUE(ImageLoader::Load(output, result, err)) << err;
  ASSERT_EQ(result.size(), image.size());

  const NordPalette palette;
  for (int y = 0; y < result.rows; ++y) {
    for (int x = 0; x < result.cols; ++x) {
      EXPECT_GE(palette.IdOf(result.at<cv::Vec3b>(y, x)), 0);
    }
  }
}

TEST(App, DarkImagesBelowThresholdAreSkipped) {
  const fs::path dir = TempDir("threshold");
  const std::string input = (dir / "dark.png").string();
  ASSERT_TRUE(cv::imwrite(input, cv::Mat(3, 3, CV_8UC3, cv::Scalar(5, 5, 5))));

  App app;
  const Args args({"image2nord", "--threshold=0.5", input});
  ASSERT_TRUE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.Run(), 0);
  EXPECT_FALSE(fs::exists(dir / "dark_nord.png"));
}

TEST(App, UnreadableInputFailsTheRun) {
  const fs::path dir = TempDir("missing");
  App app;
  const Args args({"image2nord", (dir / "nope.png").string()});
  ASSERT_TRUE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.Run(), 1);
}

TEST(App, SameStemInputsDoNotOverwriteEachOther) {
  const fs::path dir = TempDir("collide");
  fs::create_directories(dir / "a");
  fs::create_directories(dir / "b");
  fs::create_directories(dir / "out");
  const std::string first = (dir / "a" / "cat.png").string();
  const std::string second = (dir / "b" / "cat.png").string();
  ASSERT_TRUE(cv::imwrite(first, cv::Mat(2, 2, CV_8UC3, cv::Scalar(255, 255, 255))));
  ASSERT_TRUE(cv::imwrite(second, cv::Mat(2, 2, CV_8UC3, cv::Scalar(0, 0, 0))));

  App app;
  const Args args({"image2nord", "--dither=0", "--output=" + (dir / "out").string(), first, second});
  ASSERT_TRUE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.Run(), 1);

  // The first input keeps its result; the second is reported instead of replacing it.
  cv::Mat result;
  std::string err;
  ASSERT_TRUE(ImageLoader::Load((dir / "out" / "cat_nord.png").string(), result, err)) << err;
  const NordPalette palette;
  EXPECT_EQ(result.at<cv::Vec3b>(0, 0), palette.At(6).bgr);
}

TEST(App, SpaceSeparatedOptionValueIsAUsageError) {
  App app;
  const Args args({"image2nord", "-o", "out.png", "in.png"});
  EXPECT_FALSE(app.Initialize(args.argc(), args.argv()));
  EXPECT_EQ(app.ExitCode(), 2);
}

TEST(App, FlagsWithoutValuesStillAcceptInputs) {
  App app;
  const Args args({"image2nord", "--no-segmentation", "--auto-adjust", "in.png"});
  EXPECT_TRUE(app.Initialize(args.argc(), args.argv()));
}

TEST(App, AutoAdjustMapsImagesWithScaledDithering) {
  const fs::path dir = TempDir("auto");
  const std::string input = (dir / "gradient.png").string();
  cv::Mat image(8, 8, CV_8UC3);
  for (int y = 0; y < image.rows; ++y) {
    for (int x = 0; x < image.cols; ++x) {
      image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 30), static_cast<uchar>(y * 30), 128);
    }
  }
  ASSERT_TRUE(cv::imwrite(input, image));

  App app;
  const Args args({"image2nord", "--auto-adjust", input});
  ASSERT_TRUE(app.Initialize(args.argc(), args.argv()));
  ASSERT_EQ(app.Run(), 0);
  EXPECT_TRUE(fs::exists(dir / "gradient_nord.png"));
}
