#pragma once

#include <QString>

enum class ImportErrorKind {
  None = 0,
  FileUnreadable,
  TruncatedInput,
  InvalidHeader,
  UnsupportedVersion,
  CorruptSection,
  InvalidWeightType,
  MaterialFaceCountMismatch,
  DanglingIndex,
  CyclicBoneHierarchy,
  HostRejected,
  InvalidOptions,
};

// section names the part of the file (or, for DanglingIndex and HostRejected,
// the reference kind or scene operation) the error is about. value carries the
// offending tag, index or count.
struct ImportError {
  ImportErrorKind kind = ImportErrorKind::None;
  QString section;
  qint64 value = 0;
  QString message;

  bool is_set() const { return kind != ImportErrorKind::None; }
  void clear() { *this = ImportError(); }
};

[[nodiscard]] QString import_error_kind_key(ImportErrorKind kind);
[[nodiscard]] QString describe_import_error(const ImportError& error);

// Fills *out (when non-null) and returns false so callers can `return set_import_error(...)`.
bool set_import_error(ImportError* out,
                      ImportErrorKind kind,
                      const QString& section,
                      qint64 value = 0,
                      const QString& message = QString());
