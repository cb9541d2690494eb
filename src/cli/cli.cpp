#include "cli.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>

#include <optional>

#include "formats/pmx_decoder.h"
#include "rig/import_options.h"
#include "rig/memory_scene.h"
#include "rig/pmx_import.h"

namespace {
QString normalize_output(const QString& text) {
  return text.endsWith('\n') ? text : text + '\n';
}

QString encoding_name(TextEncoding encoding) {
  return encoding == TextEncoding::Utf8 ? "UTF-8" : "UTF-16LE";
}

QString panel_name(PmxMorphPanel panel) {
  switch (panel) {
    case PmxMorphPanel::System:
      return "system";
    case PmxMorphPanel::Eyebrow:
      return "eyebrow";
    case PmxMorphPanel::Eye:
      return "eye";
    case PmxMorphPanel::Mouth:
      return "mouth";
    case PmxMorphPanel::Other:
      return "other";
  }
  return "other";
}

QString first_line(const QString& text) {
  const int nl = text.indexOf(QRegularExpression("[\r\n]"));
  return nl >= 0 ? text.left(nl) : text;
}

std::optional<PmxDocument> load_document(const QString& path, QTextStream& err) {
  QFile f(path);
  if (!f.open(QIODevice::ReadOnly)) {
    err << "Unable to open file: " << path << "\n";
    return std::nullopt;
  }
  ImportError decode_err;
  std::optional<PmxDocument> doc = decode_pmx(f.readAll(), &decode_err);
  if (!doc) {
    err << describe_import_error(decode_err) << "\n";
  }
  return doc;
}

void print_info(const PmxDocument& doc, QTextStream& out) {
  out << "Format: PMX " << QString::number(doc.header.version, 'f', 1) << "\n";
  out << "Encoding: " << encoding_name(doc.header.encoding) << "\n";
  out << "Model: " << doc.header.model_name;
  if (!doc.header.model_name_en.isEmpty()) {
    out << " (" << doc.header.model_name_en << ")";
  }
  out << "\n";
  if (!doc.header.comment.isEmpty()) {
    out << "Comment: " << first_line(doc.header.comment) << "\n";
  }
  out << "Additional UVs: " << doc.header.additional_vec4_count << "\n";
  out << "Vertices: " << doc.vertices.size() << "\n";
  out << "Triangles: " << doc.faces.size() << "\n";
  out << "Textures: " << doc.textures.size() << "\n";
  out << "Materials: " << doc.materials.size() << "\n";
  out << "Bones: " << doc.bones.size() << "\n";
  out << "Morphs: " << doc.morphs.size() << "\n";
  out << "Display frames: " << doc.display_frames.size() << "\n";
  out << "Rigid bodies: " << doc.rigid_bodies.size() << "\n";
  out << "Joints: " << doc.joints.size() << "\n";
  if (!doc.soft_bodies.isEmpty()) {
    out << "Soft bodies: " << doc.soft_bodies.size() << "\n";
  }
}

void print_bones(const PmxDocument& doc, QTextStream& out) {
  for (int i = 0; i < doc.bones.size(); ++i) {
    const PmxBone& b = doc.bones[i];
    out << i << "\t" << b.parent_index << "\t" << b.name;
    if (b.is_ik) {
      out << "\t[IK target=" << b.ik_target << " links=" << b.ik_links.size() << " loops=" << b.loop_count << "]";
    }
    if (b.additional_transform) {
      out << "\t[inherit " << b.additional_transform->source_bone << " x" << b.additional_transform->ratio << "]";
    }
    out << "\n";
  }
}

void print_morphs(const PmxDocument& doc, QTextStream& out) {
  for (int i = 0; i < doc.morphs.size(); ++i) {
    const PmxMorph& m = doc.morphs[i];
    out << i << "\t" << panel_name(m.panel) << "\t" << pmx_morph_kind_name(m.kind) << "\t" << m.name << "\n";
  }
}
}  // namespace

CliParseResult parse_cli(QCoreApplication& app, CliOptions& options, QString* output) {
  QCommandLineParser parser;
  parser.setApplicationDescription("RigFu PMX model importer");
  parser.addHelpOption();
  parser.addVersionOption();

  const QCommandLineOption info_option({"i", "info"}, "Show model summary information.");
  const QCommandLineOption bones_option({"b", "bones"}, "List bones with parents, IK and inheritance.");
  const QCommandLineOption morphs_option({"m", "morphs"}, "List morphs with panel and kind.");
  const QCommandLineOption import_option("import", "Rebuild the model as a scene and print the scene report.");
  const QCommandLineOption scale_option("scale", "Scene units per model unit.", "factor");
  const QCommandLineOption no_physics_option("no-physics", "Skip rigid bodies and joints.");
  const QCommandLineOption no_morphs_option("no-morphs", "Skip shape keys and material morphs.");
  const QCommandLineOption y_up_option("y-up", "Keep the model's Y-up axes instead of converting to Z-up.");
  const QCommandLineOption save_defaults_option(
    "save-defaults",
    "Store --scale, --no-physics, --no-morphs and --y-up as the default import options.");

  parser.addOption(info_option);
  parser.addOption(bones_option);
  parser.addOption(morphs_option);
  parser.addOption(import_option);
  parser.addOption(scale_option);
  parser.addOption(no_physics_option);
  parser.addOption(no_morphs_option);
  parser.addOption(y_up_option);
  parser.addOption(save_defaults_option);
  parser.addPositionalArgument("model", "Path to a PMX model.");

  if (!parser.parse(app.arguments())) {
    if (output) {
      *output = normalize_output(parser.errorText()) + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  if (parser.isSet("help")) {
    if (output) {
      *output = parser.helpText();
    }
    return CliParseResult::ExitOk;
  }

  if (parser.isSet("version")) {
    if (output) {
      *output = normalize_output(app.applicationName() + ' ' + app.applicationVersion());
    }
    return CliParseResult::ExitOk;
  }

  options.info = parser.isSet(info_option);
  options.bones = parser.isSet(bones_option);
  options.morphs = parser.isSet(morphs_option);
  options.import_scene = parser.isSet(import_option);
  options.save_defaults = parser.isSet(save_defaults_option);
  options.no_physics = parser.isSet(no_physics_option);
  options.no_morphs = parser.isSet(no_morphs_option);
  options.y_up = parser.isSet(y_up_option);

  if (parser.isSet(scale_option)) {
    bool ok = false;
    const double scale = parser.value(scale_option).toDouble(&ok);
    if (!ok || scale <= 0.0) {
      if (output) {
        *output = normalize_output("Invalid scale: " + parser.value(scale_option)) + '\n' + parser.helpText();
      }
      return CliParseResult::ExitError;
    }
    options.scale = scale;
  }

  const QStringList positional = parser.positionalArguments();
  if (!positional.isEmpty()) {
    options.pmx_path = positional.first();
  }

  const bool any_action = options.info || options.bones || options.morphs || options.import_scene ||
                          options.save_defaults;
  if (!any_action && options.pmx_path.isEmpty()) {
    if (output) {
      *output = parser.helpText();
    }
    return CliParseResult::ExitOk;
  }

  if (!any_action && !options.pmx_path.isEmpty()) {
    options.info = true;
  }

  if ((options.info || options.bones || options.morphs || options.import_scene) && options.pmx_path.isEmpty()) {
    if (output) {
      *output = normalize_output("Missing model path.") + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  return CliParseResult::Ok;
}

int run_cli(const CliOptions& options) {
  QTextStream out(stdout);
  QTextStream err(stderr);

  QString load_err;
  ImportOptions import_options = load_import_options(&load_err);
  if (!load_err.isEmpty()) {
    err << "Ignoring saved import options: " << load_err << "\n";
  }
  if (options.scale > 0.0) {
    import_options.scale = static_cast<float>(options.scale);
  }
  if (options.no_physics) {
    import_options.import_physics = false;
  }
  if (options.no_morphs) {
    import_options.import_morphs = false;
  }
  if (options.y_up) {
    import_options.z_up = false;
  }

  if (options.save_defaults) {
    QString save_err;
    if (!save_import_options(import_options, &save_err)) {
      err << (save_err.isEmpty() ? "Failed to save import options.\n" : save_err + "\n");
      return 2;
    }
    out << "Saved import defaults: scale=" << import_options.scale
        << " physics=" << (import_options.import_physics ? "on" : "off")
        << " morphs=" << (import_options.import_morphs ? "on" : "off")
        << " axes=" << (import_options.z_up ? "z-up" : "y-up") << "\n";
    if (options.pmx_path.isEmpty()) {
      return 0;
    }
  }

  if (options.pmx_path.isEmpty()) {
    err << "No model path provided.\n";
    return 2;
  }

  const QFileInfo model_info(options.pmx_path);
  if (!model_info.exists()) {
    err << "Model not found: " << options.pmx_path << "\n";
    return 2;
  }
  const QString path = model_info.absoluteFilePath();

  if (options.info || options.bones || options.morphs) {
    const std::optional<PmxDocument> doc = load_document(path, err);
    if (!doc) {
      return 2;
    }
    if (options.info) {
      out << "Model file: " << path << "\n";
      print_info(*doc, out);
    }
    if (options.bones) {
      print_bones(*doc, out);
    }
    if (options.morphs) {
      print_morphs(*doc, out);
    }
  }

  if (options.import_scene) {
    MemoryScene scene;
    ImportError import_err;
    const auto progress = [&out](ImportStage stage, int step, int total) {
      out << "[" << step << "/" << total << "] " << import_stage_name(stage) << "\n";
    };
    const std::optional<ImportSummary> summary = import_pmx_file(path, import_options, scene, &import_err, progress);
    if (!summary) {
      err << describe_import_error(import_err) << "\n";
      return 2;
    }

    out << scene.report();
    out << "Objects: " << summary->object_count << "\n";
    for (const QString& name : summary->skipped_morphs) {
      out << "Skipped morph: " << name << "\n";
    }
    for (const QString& w : summary->warnings) {
      err << "Warning: " << w << "\n";
    }
  }

  return 0;
}
