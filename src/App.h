#ifndef APP_H
#define APP_H

#include "MappingConfig.h"
#include "SegmentationAdapter.h"

#include <string>
#include <vector>

// Command line application: parses options, builds the configuration once, then maps
// every input image to the Nord palette and writes the results.
class App {
public:
  App() = default;

  // Parses the command line. Returns false when the program should exit right away
  // (help printed or invalid arguments); ExitCode() then holds the status.
  bool Initialize(int argc, const char* const argv[]);

  // Processes all inputs. Returns the process exit code:
  // 0 all images written, 1 at least one image failed, 2 configuration error.
  int Run();

  int ExitCode() const { return exitCode_; }

  // Output path for |input|: explicit file, file inside an output directory, or
  // "<stem>_nord.png" beside the input.
  static std::string OutputPathFor(const std::string& input, const std::string& output, bool singleInput);

private:
  // Config file (if any) with command line overrides applied. Throws ConfigurationError.
  MappingConfig BuildConfig() const;

  // Loads the model named by the configuration; returns a disabled adapter on failure.
  static SegmentationAdapter BuildSegmentation(const MappingConfig& config);

  std::vector<std::string> inputs_;
  std::string configPath_;
  std::string outputPath_;
  std::string kernel_;
  std::string model_;
  std::string background_;
  float dither_ = -1.0f;     // < 0: not given
  float threshold_ = -1.0f;  // < 0: not given
  bool noSegmentation_ = false;
  bool autoAdjust_ = false;
  bool verbose_ = false;
  int exitCode_ = 0;
};

#endif // APP_H
