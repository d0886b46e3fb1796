#include "App.h"

int main(int argc, char** argv) {
  App app;
  if (!app.Initialize(argc, argv)) {
    return app.ExitCode();
  }
  return app.Run();
}
