#include "formats/import_error.h"

QString import_error_kind_key(ImportErrorKind kind) {
  switch (kind) {
    case ImportErrorKind::None:
      return "none";
    case ImportErrorKind::FileUnreadable:
      return "file_unreadable";
    case ImportErrorKind::TruncatedInput:
      return "truncated_input";
    case ImportErrorKind::InvalidHeader:
      return "invalid_header";
    case ImportErrorKind::UnsupportedVersion:
      return "unsupported_version";
    case ImportErrorKind::CorruptSection:
      return "corrupt_section";
    case ImportErrorKind::InvalidWeightType:
      return "invalid_weight_type";
    case ImportErrorKind::MaterialFaceCountMismatch:
      return "material_face_count_mismatch";
    case ImportErrorKind::DanglingIndex:
      return "dangling_index";
    case ImportErrorKind::CyclicBoneHierarchy:
      return "cyclic_bone_hierarchy";
    case ImportErrorKind::HostRejected:
      return "host_rejected";
    case ImportErrorKind::InvalidOptions:
      return "invalid_options";
  }
  return "none";
}

QString describe_import_error(const ImportError& error) {
  QString text;
  switch (error.kind) {
    case ImportErrorKind::None:
      return {};
    case ImportErrorKind::FileUnreadable:
      text = QString("Unable to read file: %1").arg(error.section);
      break;
    case ImportErrorKind::TruncatedInput:
      text = QString("PMX data is truncated in section '%1'.").arg(error.section);
      break;
    case ImportErrorKind::InvalidHeader:
      text = "PMX header is invalid.";
      break;
    case ImportErrorKind::UnsupportedVersion:
      text = "Unsupported PMX version.";
      break;
    case ImportErrorKind::CorruptSection:
      text = QString("PMX section '%1' is corrupt (value %2).").arg(error.section).arg(error.value);
      break;
    case ImportErrorKind::InvalidWeightType:
      text = QString("Invalid vertex weight type: %1.").arg(error.value);
      break;
    case ImportErrorKind::MaterialFaceCountMismatch:
      text = QString("Material face counts do not partition the face list (%1).").arg(error.value);
      break;
    case ImportErrorKind::DanglingIndex:
      text = QString("Dangling %1 index: %2.").arg(error.section).arg(error.value);
      break;
    case ImportErrorKind::CyclicBoneHierarchy:
      text = QString("Bone %1 is its own ancestor.").arg(error.value);
      break;
    case ImportErrorKind::HostRejected:
      text = QString("Scene rejected operation '%1'.").arg(error.section);
      break;
    case ImportErrorKind::InvalidOptions:
      text = QString("Invalid import option '%1'.").arg(error.section);
      break;
  }
  if (!error.message.isEmpty()) {
    text += ' ' + error.message;
  }
  return text;
}

bool set_import_error(ImportError* out,
                      ImportErrorKind kind,
                      const QString& section,
                      qint64 value,
                      const QString& message) {
  if (out) {
    out->kind = kind;
    out->section = section;
    out->value = value;
    out->message = message;
  }
  return false;
}
