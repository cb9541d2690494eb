#include <QCoreApplication>
#include <QTextStream>

#include "cli/cli.h"

namespace {
void set_app_metadata(QCoreApplication& app) {
  app.setApplicationName("RigFu");
  app.setOrganizationName("RigFu");
  app.setApplicationVersion(RIGFU_VERSION);
}
}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  set_app_metadata(app);

  CliOptions options;
  QString output;
  const CliParseResult result = parse_cli(app, options, &output);
  if (result == CliParseResult::ExitOk) {
    if (!output.isEmpty()) {
      QTextStream(stdout) << output;
    }
    return 0;
  }
  if (result == CliParseResult::ExitError) {
    if (!output.isEmpty()) {
      QTextStream(stderr) << output;
    }
    return 1;
  }

  return run_cli(options);
}
