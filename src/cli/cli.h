#pragma once

#include <QString>

class QCoreApplication;

struct CliOptions {
  bool info = false;
  bool bones = false;
  bool morphs = false;
  bool import_scene = false;
  bool save_defaults = false;
  bool no_physics = false;
  bool no_morphs = false;
  bool y_up = false;
  double scale = 0.0;  // 0 keeps the saved default.
  QString pmx_path;
};

enum class CliParseResult {
  Ok,
  ExitOk,
  ExitError,
};

CliParseResult parse_cli(QCoreApplication& app, CliOptions& options, QString* output);
int run_cli(const CliOptions& options);
