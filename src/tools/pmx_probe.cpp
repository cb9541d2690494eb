#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include "formats/pmx_decoder.h"

namespace {
void print_section(QTextStream& out, const char* name, int offset, qsizetype count) {
  out << name << ": ";
  if (offset < 0) {
    out << "absent\n";
    return;
  }
  out << count << " @ 0x" << QString::number(offset, 16) << "\n";
}
}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QTextStream out(stdout);
  QTextStream err(stderr);

  const QStringList args = app.arguments();
  if (args.size() < 2) {
    err << "Usage: pmx_probe <file.pmx>\n";
    return 2;
  }

  const QString file_path = QFileInfo(args[1]).absoluteFilePath();
  QFile f(file_path);
  if (!f.open(QIODevice::ReadOnly)) {
    err << "Unable to open file.\n";
    return 2;
  }
  const QByteArray bytes = f.readAll();

  if (!looks_like_pmx(bytes)) {
    err << "Not a PMX file.\n";
    return 2;
  }

  ImportError decode_err;
  const std::optional<PmxDocument> doc = decode_pmx(bytes, &decode_err);
  if (!doc) {
    err << describe_import_error(decode_err) << "\n";
    err << "Error kind: " << import_error_kind_key(decode_err.kind) << "\n";
    return 2;
  }

  const PmxHeader& h = doc->header;
  out << "Size: " << bytes.size() << " bytes\n";
  out << "Version: " << QString::number(h.version, 'f', 1) << "\n";
  out << "Index widths: vertex=" << h.vertex_index_width << " texture=" << h.texture_index_width
      << " material=" << h.material_index_width << " bone=" << h.bone_index_width << " morph=" << h.morph_index_width
      << " rigid=" << h.rigid_body_index_width << "\n";

  const PmxSectionOffsets& o = doc->section_offsets;
  print_section(out, "Vertices", o.vertices, doc->vertices.size());
  print_section(out, "Faces", o.faces, doc->faces.size());
  print_section(out, "Textures", o.textures, doc->textures.size());
  print_section(out, "Materials", o.materials, doc->materials.size());
  print_section(out, "Bones", o.bones, doc->bones.size());
  print_section(out, "Morphs", o.morphs, doc->morphs.size());
  print_section(out, "Display frames", o.display_frames, doc->display_frames.size());
  print_section(out, "Rigid bodies", o.rigid_bodies, doc->rigid_bodies.size());
  print_section(out, "Joints", o.joints, doc->joints.size());
  print_section(out, "Soft bodies", o.soft_bodies, doc->soft_bodies.size());

  const int max_materials = 12;
  qint64 face_vertices = 0;
  for (int i = 0; i < doc->materials.size() && i < max_materials; ++i) {
    const PmxMaterial& m = doc->materials[i];
    out << "Material " << i << ": name=" << m.name << " first=" << face_vertices / 3
        << " triangles=" << m.face_vertex_count / 3 << " texture=" << m.texture_index << "\n";
    face_vertices += m.face_vertex_count;
  }

  return 0;
}
