#pragma once

#include <QString>

class QSettings;

struct ImportOptions {
  float scale = 1.0f;
  bool import_physics = true;
  bool import_morphs = true;
  // Convert PMX Y-up space to a Z-up scene.
  bool z_up = true;
};

// Loads the saved defaults. Missing settings yield ImportOptions{}; invalid
// ones yield ImportOptions{} and set `error`.
[[nodiscard]] ImportOptions load_import_options(QString* error = nullptr);
[[nodiscard]] ImportOptions load_import_options(const QSettings& settings, QString* error = nullptr);

[[nodiscard]] bool save_import_options(const ImportOptions& options, QString* error = nullptr);
[[nodiscard]] bool save_import_options(QSettings& settings, const ImportOptions& options, QString* error = nullptr);
