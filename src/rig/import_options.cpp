#include "rig/import_options.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>

#include <cmath>

namespace {
constexpr char kOptionsKey[] = "import/optionsJson";
constexpr int kOptionsVersion = 1;
}  // namespace

ImportOptions load_import_options(const QSettings& settings, QString* error) {
  if (error) {
    error->clear();
  }

  const QString raw = settings.value(kOptionsKey).toString().trimmed();
  if (raw.isEmpty()) {
    return {};
  }

  QJsonParseError parse_error;
  const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parse_error);
  if (doc.isNull() || !doc.isObject()) {
    if (error) {
      *error = parse_error.errorString().isEmpty() ? "Invalid import settings." : parse_error.errorString();
    }
    return {};
  }

  const QJsonObject root = doc.object();
  const int version = root.value("version").toInt(0);
  if (version != kOptionsVersion) {
    if (error) {
      *error = QString("Unsupported import settings version: %1").arg(version);
    }
    return {};
  }

  const ImportOptions defaults;
  ImportOptions out;
  const double scale = root.value("scale").toDouble(defaults.scale);
  if (!std::isfinite(scale) || scale <= 0.0) {
    if (error) {
      *error = QString("Invalid import scale: %1").arg(scale);
    }
    return {};
  }
  out.scale = static_cast<float>(scale);
  out.import_physics = root.value("importPhysics").toBool(defaults.import_physics);
  out.import_morphs = root.value("importMorphs").toBool(defaults.import_morphs);
  out.z_up = root.value("zUp").toBool(defaults.z_up);
  return out;
}

ImportOptions load_import_options(QString* error) {
  const QSettings settings;
  return load_import_options(settings, error);
}

bool save_import_options(QSettings& settings, const ImportOptions& options, QString* error) {
  if (error) {
    error->clear();
  }

  QJsonObject root;
  root.insert("version", kOptionsVersion);
  root.insert("scale", static_cast<double>(options.scale));
  root.insert("importPhysics", options.import_physics);
  root.insert("importMorphs", options.import_morphs);
  root.insert("zUp", options.z_up);

  const QJsonDocument doc(root);
  settings.setValue(kOptionsKey, QString::fromUtf8(doc.toJson(QJsonDocument::Compact)));
  settings.sync();

  if (settings.status() != QSettings::NoError) {
    if (error) {
      *error = "Failed to save import settings.";
    }
    return false;
  }
  return true;
}

bool save_import_options(const ImportOptions& options, QString* error) {
  QSettings settings;
  return save_import_options(settings, options, error);
}
