#include "rig/pmx_import.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include "formats/pmx_decoder.h"

std::optional<ImportSummary> import_pmx_file(const QString& file_path,
                                             const ImportOptions& options,
                                             SceneCollaborator& scene,
                                             ImportError* error,
                                             const ImportProgressFn& progress) {
  ImportError local_error;
  ImportError* err = error ? error : &local_error;
  err->clear();

  QElapsedTimer timer;
  timer.start();
  qInfo() << "PmxImport: importing" << QFileInfo(file_path).fileName();

  QFile f(file_path);
  if (!f.open(QIODevice::ReadOnly)) {
    set_import_error(err, ImportErrorKind::FileUnreadable, file_path, 0, f.errorString());
    qWarning() << "PmxImport:" << describe_import_error(*err);
    return std::nullopt;
  }
  const QByteArray bytes = f.readAll();
  f.close();

  const std::optional<PmxDocument> doc = decode_pmx(bytes, err);
  if (!doc) {
    qWarning() << "PmxImport:" << describe_import_error(*err);
    return std::nullopt;
  }

  std::optional<ImportSummary> summary = build_scene(*doc, scene, options, err, progress);
  if (!summary) {
    qWarning() << "PmxImport:" << describe_import_error(*err);
    return std::nullopt;
  }

  for (const QString& w : summary->warnings) {
    qWarning() << "PmxImport:" << w;
  }
  if (!summary->skipped_morphs.isEmpty()) {
    qInfo() << "PmxImport: skipped" << summary->skipped_morphs.size() << "morph(s) of unsupported kinds";
  }
  qInfo() << "PmxImport: completed in" << timer.elapsed() / 1000.0 << "seconds";
  return summary;
}
