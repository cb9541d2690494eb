#include "formats/pmx_decoder.h"

#include <algorithm>
#include <cmath>

namespace {
const QByteArray kPmxMagic("PMX ", 4);
constexpr int kMinHeaderGlobals = 8;
constexpr int kMaxAdditionalVec4 = 4;
constexpr float kQuadWeightTolerance = 1e-4f;

constexpr quint8 kWeightBdef1 = 0;
constexpr quint8 kWeightBdef2 = 1;
constexpr quint8 kWeightBdef4 = 2;
constexpr quint8 kWeightSdef = 3;
constexpr quint8 kWeightQdef = 4;

bool is_supported_version(float version) {
  return std::abs(version - 2.0f) < 1e-3f || std::abs(version - 2.1f) < 1e-3f;
}

void normalize_quad_weights(PmxSkinQuad* quad) {
  float sum = 0.0f;
  for (float w : quad->weights) {
    sum += w;
  }
  if (sum <= 0.0f || std::abs(sum - 1.0f) <= kQuadWeightTolerance) {
    return;
  }
  for (float& w : quad->weights) {
    w /= sum;
  }
}

class PmxDecoder {
public:
  PmxDecoder(const QByteArray& bytes, ImportError* error) : cur_(&bytes), error_(error) {}

  std::optional<PmxDocument> run();

private:
  bool read_failed(const QString& section);
  bool read_count(const QString& section, int* out);
  int reserve_hint(int count, int min_record_bytes) const;

  bool read_header();
  bool read_vertices();
  bool read_skin(quint8 tag, PmxSkinBinding* out);
  bool read_faces();
  bool read_textures();
  bool read_materials();
  bool read_bones();
  bool read_bone(PmxBone* bone);
  bool read_morphs();
  bool read_material_offset(PmxMaterialOffset* out);
  bool read_display_frames();
  bool read_rigid_bodies();
  bool read_joints();
  bool read_soft_bodies();

  bool text(QString* out) { return cur_.read_text(doc_.header.encoding, out); }

  BinaryCursor cur_;
  ImportError* error_ = nullptr;
  PmxDocument doc_;
};

bool PmxDecoder::read_failed(const QString& section) {
  if (cur_.fault() == BinaryCursor::Fault::Malformed) {
    return set_import_error(error_, ImportErrorKind::CorruptSection, section, cur_.pos(), "Malformed field.");
  }
  return set_import_error(error_, ImportErrorKind::TruncatedInput, section, cur_.pos());
}

bool PmxDecoder::read_count(const QString& section, int* out) {
  qint32 count = 0;
  if (!cur_.read_i32(&count)) {
    return read_failed(section);
  }
  if (count < 0 || count > kPmxMaxSectionCount) {
    return set_import_error(error_, ImportErrorKind::CorruptSection, section, count, "Implausible element count.");
  }
  *out = count;
  return true;
}

int PmxDecoder::reserve_hint(int count, int min_record_bytes) const {
  if (min_record_bytes <= 0) {
    return count;
  }
  return std::min(count, cur_.remaining() / min_record_bytes);
}

bool PmxDecoder::read_header() {
  const QString section = "header";
  PmxHeader& h = doc_.header;

  QByteArray magic;
  if (!cur_.peek_bytes(kPmxMagic.size(), &magic)) {
    return set_import_error(error_, ImportErrorKind::TruncatedInput, section, 0);
  }
  if (magic != kPmxMagic) {
    return set_import_error(error_, ImportErrorKind::InvalidHeader, section, 0, "Missing PMX signature.");
  }
  if (!cur_.skip(kPmxMagic.size())) {
    return read_failed(section);
  }

  if (!cur_.read_f32(&h.version)) {
    return read_failed(section);
  }
  if (!is_supported_version(h.version)) {
    return set_import_error(error_,
                            ImportErrorKind::UnsupportedVersion,
                            section,
                            0,
                            QString("Version %1.").arg(static_cast<double>(h.version)));
  }

  quint8 header_size = 0;
  if (!cur_.read_u8(&header_size)) {
    return read_failed(section);
  }
  if (header_size < kMinHeaderGlobals) {
    return set_import_error(error_, ImportErrorKind::InvalidHeader, section, header_size, "Header globals too short.");
  }

  quint8 globals[kMinHeaderGlobals] = {};
  for (quint8& g : globals) {
    if (!cur_.read_u8(&g)) {
      return read_failed(section);
    }
  }
  if (!cur_.skip(header_size - kMinHeaderGlobals)) {
    return read_failed(section);
  }

  if (globals[0] > 1) {
    return set_import_error(error_, ImportErrorKind::InvalidHeader, section, globals[0], "Unknown text encoding.");
  }
  h.encoding = globals[0] == 0 ? TextEncoding::Utf16Le : TextEncoding::Utf8;

  if (globals[1] > kMaxAdditionalVec4) {
    return set_import_error(error_, ImportErrorKind::InvalidHeader, section, globals[1], "Too many additional vec4s.");
  }
  h.additional_vec4_count = globals[1];

  for (int i = 2; i < kMinHeaderGlobals; ++i) {
    if (!is_valid_index_width(globals[i])) {
      return set_import_error(error_, ImportErrorKind::InvalidHeader, section, globals[i], "Index width must be 1, 2 or 4.");
    }
  }
  h.vertex_index_width = globals[2];
  h.texture_index_width = globals[3];
  h.material_index_width = globals[4];
  h.bone_index_width = globals[5];
  h.morph_index_width = globals[6];
  h.rigid_body_index_width = globals[7];

  if (!text(&h.model_name) || !text(&h.model_name_en) || !text(&h.comment) || !text(&h.comment_en)) {
    return read_failed(section);
  }
  return true;
}

bool PmxDecoder::read_skin(quint8 tag, PmxSkinBinding* out) {
  const int bw = doc_.header.bone_index_width;
  switch (tag) {
    case kWeightBdef1: {
      PmxSkinSingle s;
      if (!cur_.read_indexed(bw, &s.bone)) {
        return false;
      }
      *out = s;
      return true;
    }
    case kWeightBdef2: {
      PmxSkinDual d;
      if (!cur_.read_indexed(bw, &d.bone_a) || !cur_.read_indexed(bw, &d.bone_b) || !cur_.read_f32(&d.weight_a)) {
        return false;
      }
      *out = d;
      return true;
    }
    case kWeightBdef4:
    case kWeightQdef: {
      PmxSkinQuad q;
      q.dual_quaternion = (tag == kWeightQdef);
      for (qint64& b : q.bones) {
        if (!cur_.read_indexed(bw, &b)) {
          return false;
        }
      }
      for (float& w : q.weights) {
        if (!cur_.read_f32(&w)) {
          return false;
        }
      }
      normalize_quad_weights(&q);
      *out = q;
      return true;
    }
    case kWeightSdef: {
      PmxSkinSphericalDual s;
      if (!cur_.read_indexed(bw, &s.bone_a) || !cur_.read_indexed(bw, &s.bone_b) || !cur_.read_f32(&s.weight_a) ||
          !cur_.read_vec3(&s.center) || !cur_.read_vec3(&s.r0) || !cur_.read_vec3(&s.r1)) {
        return false;
      }
      *out = s;
      return true;
    }
    default:
      break;
  }
  return false;
}

bool PmxDecoder::read_vertices() {
  const QString section = "vertices";
  doc_.section_offsets.vertices = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  doc_.header.vertex_count = count;

  const int additional = doc_.header.additional_vec4_count;
  // position + normal + uv + weight tag + one bone index + edge scale.
  const int min_bytes = 12 + 12 + 8 + additional * 16 + 1 + 1 + 4;
  doc_.vertices.reserve(reserve_hint(count, min_bytes));

  for (int i = 0; i < count; ++i) {
    PmxVertex v;
    if (!cur_.read_vec3(&v.position) || !cur_.read_vec3(&v.normal) || !cur_.read_vec2(&v.uv)) {
      return read_failed(section);
    }
    v.additional_vec4s.resize(additional);
    for (int k = 0; k < additional; ++k) {
      if (!cur_.read_vec4(&v.additional_vec4s[k])) {
        return read_failed(section);
      }
    }

    quint8 tag = 0;
    if (!cur_.read_u8(&tag)) {
      return read_failed(section);
    }
    if (tag > kWeightQdef) {
      return set_import_error(error_, ImportErrorKind::InvalidWeightType, section, tag, QString("Vertex %1.").arg(i));
    }
    if (!read_skin(tag, &v.skin)) {
      return read_failed(section);
    }
    if (!cur_.read_f32(&v.edge_scale)) {
      return read_failed(section);
    }
    doc_.vertices.push_back(v);
  }
  return true;
}

bool PmxDecoder::read_faces() {
  const QString section = "faces";
  doc_.section_offsets.faces = cur_.pos();
  int index_count = 0;
  if (!read_count(section, &index_count)) {
    return false;
  }
  if ((index_count % 3) != 0) {
    return set_import_error(error_, ImportErrorKind::CorruptSection, section, index_count, "Index count is not a multiple of 3.");
  }

  const int width = doc_.header.vertex_index_width;
  const int tri_count = index_count / 3;
  doc_.faces.reserve(reserve_hint(tri_count, width * 3));

  // Range checks run after the whole section is read so a short file reports truncation first.
  for (int t = 0; t < tri_count; ++t) {
    qint64 idx[3] = {0, 0, 0};
    for (qint64& v : idx) {
      if (!cur_.read_vertex_index(width, &v)) {
        return read_failed(section);
      }
    }
    PmxFace f;
    f.a = static_cast<std::uint32_t>(idx[0] < 0 ? UINT32_MAX : idx[0]);
    f.b = static_cast<std::uint32_t>(idx[1] < 0 ? UINT32_MAX : idx[1]);
    f.c = static_cast<std::uint32_t>(idx[2] < 0 ? UINT32_MAX : idx[2]);
    doc_.faces.push_back(f);
  }

  const std::uint32_t vcount = static_cast<std::uint32_t>(doc_.vertices.size());
  for (const PmxFace& f : doc_.faces) {
    for (std::uint32_t v : {f.a, f.b, f.c}) {
      if (v >= vcount) {
        return set_import_error(error_,
                                ImportErrorKind::CorruptSection,
                                section,
                                v == UINT32_MAX ? -1 : static_cast<qint64>(v),
                                "Face references a vertex out of range.");
      }
    }
  }
  return true;
}

bool PmxDecoder::read_textures() {
  const QString section = "textures";
  doc_.section_offsets.textures = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  doc_.textures.reserve(reserve_hint(count, 4));
  for (int i = 0; i < count; ++i) {
    QString path;
    if (!text(&path)) {
      return read_failed(section);
    }
    doc_.textures.push_back(path);
  }
  return true;
}

bool PmxDecoder::read_materials() {
  const QString section = "materials";
  doc_.section_offsets.materials = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  const int tw = doc_.header.texture_index_width;
  doc_.materials.reserve(reserve_hint(count, 8 + 16 + 12 + 4 + 12 + 1 + 16 + 4 + tw * 2 + 2 + 1 + 4 + 4));

  for (int i = 0; i < count; ++i) {
    PmxMaterial m;
    quint8 sphere_mode = 0;
    quint8 shared_toon = 0;
    if (!text(&m.name) || !text(&m.name_en) || !cur_.read_vec4(&m.diffuse) || !cur_.read_vec3(&m.specular) ||
        !cur_.read_f32(&m.specular_strength) || !cur_.read_vec3(&m.ambient) || !cur_.read_u8(&m.draw_flags) ||
        !cur_.read_vec4(&m.edge_color) || !cur_.read_f32(&m.edge_size) || !cur_.read_indexed(tw, &m.texture_index) ||
        !cur_.read_indexed(tw, &m.sphere_texture_index) || !cur_.read_u8(&sphere_mode) || !cur_.read_u8(&shared_toon)) {
      return read_failed(section);
    }
    if (sphere_mode > static_cast<quint8>(PmxSphereMode::SubTexture)) {
      return set_import_error(error_, ImportErrorKind::CorruptSection, section, sphere_mode, "Unknown sphere mode.");
    }
    m.sphere_mode = static_cast<PmxSphereMode>(sphere_mode);
    m.shared_toon = shared_toon != 0;
    if (m.shared_toon) {
      quint8 slot = 0;
      if (!cur_.read_u8(&slot)) {
        return read_failed(section);
      }
      m.toon_texture_index = slot;
    } else if (!cur_.read_indexed(tw, &m.toon_texture_index)) {
      return read_failed(section);
    }

    qint32 face_vertex_count = 0;
    if (!text(&m.memo) || !cur_.read_i32(&face_vertex_count)) {
      return read_failed(section);
    }
    if (face_vertex_count < 0) {
      return set_import_error(error_, ImportErrorKind::CorruptSection, section, face_vertex_count, "Negative material face count.");
    }
    m.face_vertex_count = static_cast<std::uint32_t>(face_vertex_count);
    doc_.materials.push_back(m);
  }
  return true;
}

bool PmxDecoder::read_bone(PmxBone* bone) {
  const int bw = doc_.header.bone_index_width;
  if (!text(&bone->name) || !text(&bone->name_en) || !cur_.read_vec3(&bone->position) ||
      !cur_.read_indexed(bw, &bone->parent_index) || !cur_.read_i32(&bone->layer) || !cur_.read_u16(&bone->flags)) {
    return false;
  }

  if (bone->flags & pmx_bone_flags::kTailIsBone) {
    PmxTailBone t;
    if (!cur_.read_indexed(bw, &t.bone)) {
      return false;
    }
    bone->tail = t;
  } else {
    PmxTailOffset t;
    if (!cur_.read_vec3(&t.offset)) {
      return false;
    }
    bone->tail = t;
  }

  const bool inherit_rot = (bone->flags & pmx_bone_flags::kInheritRotation) != 0;
  const bool inherit_trans = (bone->flags & pmx_bone_flags::kInheritTranslation) != 0;
  if (inherit_rot || inherit_trans) {
    PmxAdditionalTransform at;
    at.rotation = inherit_rot;
    at.translation = inherit_trans;
    if (!cur_.read_indexed(bw, &at.source_bone) || !cur_.read_f32(&at.ratio)) {
      return false;
    }
    bone->additional_transform = at;
  }

  if (bone->flags & pmx_bone_flags::kFixedAxis) {
    QVector3D axis;
    if (!cur_.read_vec3(&axis)) {
      return false;
    }
    bone->fixed_axis = axis;
  }

  if (bone->flags & pmx_bone_flags::kLocalAxes) {
    QVector3D x;
    QVector3D z;
    if (!cur_.read_vec3(&x) || !cur_.read_vec3(&z)) {
      return false;
    }
    bone->local_axis_x = x;
    bone->local_axis_z = z;
  }

  if (bone->flags & pmx_bone_flags::kExternalParent) {
    qint32 key = 0;
    if (!cur_.read_i32(&key)) {
      return false;
    }
    bone->external_key = key;
  }

  if (bone->flags & pmx_bone_flags::kIk) {
    bone->is_ik = true;
    if (!cur_.read_indexed(bw, &bone->ik_target) || !cur_.read_i32(&bone->loop_count) ||
        !cur_.read_f32(&bone->limit_angle)) {
      return false;
    }
    int link_count = 0;
    if (!read_count("bones", &link_count)) {
      return false;
    }
    bone->ik_links.reserve(reserve_hint(link_count, bw + 1));
    for (int k = 0; k < link_count; ++k) {
      PmxIkLink link;
      quint8 has_limit = 0;
      if (!cur_.read_indexed(bw, &link.bone_index) || !cur_.read_u8(&has_limit)) {
        return false;
      }
      if (has_limit) {
        PmxAngleLimit limit;
        if (!cur_.read_vec3(&limit.min) || !cur_.read_vec3(&limit.max)) {
          return false;
        }
        link.angle_limit = limit;
      }
      bone->ik_links.push_back(link);
    }
  }
  return true;
}

bool PmxDecoder::read_bones() {
  const QString section = "bones";
  doc_.section_offsets.bones = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  const int bw = doc_.header.bone_index_width;
  doc_.bones.reserve(reserve_hint(count, 8 + 12 + bw + 4 + 2 + bw));
  for (int i = 0; i < count; ++i) {
    PmxBone bone;
    if (!read_bone(&bone)) {
      // read_count already reported an implausible IK link count.
      if (error_ && error_->is_set()) {
        return false;
      }
      return read_failed(section);
    }
    doc_.bones.push_back(bone);
  }
  return true;
}

bool PmxDecoder::read_material_offset(PmxMaterialOffset* out) {
  quint8 op = 0;
  PmxMaterialBlend& b = out->blend;
  if (!cur_.read_indexed(doc_.header.material_index_width, &out->material_index) || !cur_.read_u8(&op) ||
      !cur_.read_vec4(&b.diffuse) || !cur_.read_vec3(&b.specular) || !cur_.read_f32(&b.specular_strength) ||
      !cur_.read_vec3(&b.ambient) || !cur_.read_vec4(&b.edge_color) || !cur_.read_f32(&b.edge_size) ||
      !cur_.read_vec4(&b.texture_tint) || !cur_.read_vec4(&b.sphere_tint) || !cur_.read_vec4(&b.toon_tint)) {
    return false;
  }
  out->op = op == 0 ? PmxMaterialMorphOp::Multiply : PmxMaterialMorphOp::Add;
  return true;
}

bool PmxDecoder::read_morphs() {
  const QString section = "morphs";
  doc_.section_offsets.morphs = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  const PmxHeader& h = doc_.header;
  doc_.morphs.reserve(reserve_hint(count, 8 + 1 + 1 + 4));

  for (int i = 0; i < count; ++i) {
    PmxMorph morph;
    quint8 panel = 0;
    if (!text(&morph.name) || !text(&morph.name_en) || !cur_.read_u8(&panel) || !cur_.read_u8(&morph.kind)) {
      return read_failed(section);
    }
    morph.panel = panel <= static_cast<quint8>(PmxMorphPanel::Other) ? static_cast<PmxMorphPanel>(panel)
                                                                     : PmxMorphPanel::Other;
    int element_count = 0;
    if (!read_count(section, &element_count)) {
      return false;
    }

    if (morph.kind == pmx_morph_kind::kVertex) {
      PmxVertexMorph vm;
      vm.offsets.reserve(reserve_hint(element_count, h.vertex_index_width + 12));
      for (int k = 0; k < element_count; ++k) {
        PmxVertexOffset o;
        if (!cur_.read_vertex_index(h.vertex_index_width, &o.vertex_index) || !cur_.read_vec3(&o.offset)) {
          return read_failed(section);
        }
        vm.offsets.push_back(o);
      }
      morph.data = vm;
    } else if (morph.kind == pmx_morph_kind::kMaterial) {
      PmxMaterialMorph mm;
      mm.offsets.reserve(reserve_hint(element_count, h.material_index_width + 113));
      for (int k = 0; k < element_count; ++k) {
        PmxMaterialOffset o;
        if (!read_material_offset(&o)) {
          return read_failed(section);
        }
        mm.offsets.push_back(o);
      }
      morph.data = mm;
    } else {
      int element_bytes = 0;
      switch (morph.kind) {
        case pmx_morph_kind::kGroup:
        case pmx_morph_kind::kFlip:
          element_bytes = h.morph_index_width + 4;
          break;
        case pmx_morph_kind::kBone:
          element_bytes = h.bone_index_width + 12 + 16;
          break;
        case pmx_morph_kind::kImpulse:
          element_bytes = h.rigid_body_index_width + 1 + 12 + 12;
          break;
        default:
          if (morph.kind >= pmx_morph_kind::kUv && morph.kind <= pmx_morph_kind::kAdditionalUv4) {
            element_bytes = h.vertex_index_width + 16;
          }
          break;
      }
      if (element_bytes == 0) {
        return set_import_error(error_, ImportErrorKind::CorruptSection, section, morph.kind, "Unknown morph kind.");
      }
      const qint64 total = static_cast<qint64>(element_bytes) * element_count;
      if (total > cur_.remaining()) {
        return set_import_error(error_, ImportErrorKind::TruncatedInput, section, cur_.pos());
      }
      PmxUnhandledMorph um;
      um.kind = morph.kind;
      um.element_count = element_count;
      if (!cur_.read_bytes(static_cast<int>(total), &um.raw)) {
        return read_failed(section);
      }
      morph.data = um;
    }
    doc_.morphs.push_back(morph);
  }
  return true;
}

bool PmxDecoder::read_display_frames() {
  const QString section = "display_frames";
  doc_.section_offsets.display_frames = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  doc_.display_frames.reserve(reserve_hint(count, 8 + 1 + 4));
  for (int i = 0; i < count; ++i) {
    PmxDisplayFrame frame;
    quint8 special = 0;
    if (!text(&frame.name) || !text(&frame.name_en) || !cur_.read_u8(&special)) {
      return read_failed(section);
    }
    frame.special = special != 0;
    int element_count = 0;
    if (!read_count(section, &element_count)) {
      return false;
    }
    frame.elements.reserve(reserve_hint(element_count, 2));
    for (int k = 0; k < element_count; ++k) {
      quint8 target = 0;
      if (!cur_.read_u8(&target)) {
        return read_failed(section);
      }
      if (target > 1) {
        return set_import_error(error_, ImportErrorKind::CorruptSection, section, target, "Unknown display element target.");
      }
      PmxDisplayElement e;
      e.is_morph = target == 1;
      const int width = e.is_morph ? doc_.header.morph_index_width : doc_.header.bone_index_width;
      if (!cur_.read_indexed(width, &e.index)) {
        return read_failed(section);
      }
      frame.elements.push_back(e);
    }
    doc_.display_frames.push_back(frame);
  }
  return true;
}

bool PmxDecoder::read_rigid_bodies() {
  const QString section = "rigid_bodies";
  doc_.section_offsets.rigid_bodies = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  const int bw = doc_.header.bone_index_width;
  doc_.rigid_bodies.reserve(reserve_hint(count, 8 + bw + 1 + 2 + 1 + 36 + 20 + 1));
  for (int i = 0; i < count; ++i) {
    PmxRigidBody rb;
    quint8 shape = 0;
    quint8 mode = 0;
    if (!text(&rb.name) || !text(&rb.name_en) || !cur_.read_indexed(bw, &rb.bone_index) || !cur_.read_u8(&rb.group) ||
        !cur_.read_u16(&rb.non_collision_mask) || !cur_.read_u8(&shape) || !cur_.read_vec3(&rb.size) ||
        !cur_.read_vec3(&rb.position) || !cur_.read_vec3(&rb.rotation) || !cur_.read_f32(&rb.mass) ||
        !cur_.read_f32(&rb.linear_damping) || !cur_.read_f32(&rb.angular_damping) || !cur_.read_f32(&rb.restitution) ||
        !cur_.read_f32(&rb.friction) || !cur_.read_u8(&mode)) {
      return read_failed(section);
    }
    if (shape > static_cast<quint8>(PmxRigidShape::Capsule)) {
      return set_import_error(error_, ImportErrorKind::CorruptSection, section, shape, "Unknown rigid body shape.");
    }
    if (mode > static_cast<quint8>(PmxPhysicsMode::DynamicWithBone)) {
      return set_import_error(error_, ImportErrorKind::CorruptSection, section, mode, "Unknown physics mode.");
    }
    rb.shape = static_cast<PmxRigidShape>(shape);
    rb.mode = static_cast<PmxPhysicsMode>(mode);
    doc_.rigid_bodies.push_back(rb);
  }
  return true;
}

bool PmxDecoder::read_joints() {
  const QString section = "joints";
  doc_.section_offsets.joints = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  const int rw = doc_.header.rigid_body_index_width;
  doc_.joints.reserve(reserve_hint(count, 8 + 1 + rw * 2 + 12 * 8));
  for (int i = 0; i < count; ++i) {
    PmxJoint j;
    if (!text(&j.name) || !text(&j.name_en) || !cur_.read_u8(&j.type) || !cur_.read_indexed(rw, &j.rigid_body_a) ||
        !cur_.read_indexed(rw, &j.rigid_body_b) || !cur_.read_vec3(&j.position) || !cur_.read_vec3(&j.rotation) ||
        !cur_.read_vec3(&j.linear_lower) || !cur_.read_vec3(&j.linear_upper) || !cur_.read_vec3(&j.angular_lower) ||
        !cur_.read_vec3(&j.angular_upper) || !cur_.read_vec3(&j.linear_spring) || !cur_.read_vec3(&j.angular_spring)) {
      return read_failed(section);
    }
    doc_.joints.push_back(j);
  }
  return true;
}

bool PmxDecoder::read_soft_bodies() {
  const QString section = "soft_bodies";
  doc_.section_offsets.soft_bodies = cur_.pos();
  int count = 0;
  if (!read_count(section, &count)) {
    return false;
  }
  const PmxHeader& h = doc_.header;
  doc_.soft_bodies.reserve(reserve_hint(count, 8 + 1 + h.material_index_width + 1 + 2 + 1 + 4 * 5 + 4 * 25 + 8));
  for (int i = 0; i < count; ++i) {
    PmxSoftBody sb;
    if (!text(&sb.name) || !text(&sb.name_en) || !cur_.read_u8(&sb.shape) ||
        !cur_.read_indexed(h.material_index_width, &sb.material_index) || !cur_.read_u8(&sb.group) ||
        !cur_.read_u16(&sb.non_collision_mask) || !cur_.read_u8(&sb.flags) || !cur_.read_i32(&sb.bending_link_distance) ||
        !cur_.read_i32(&sb.cluster_count) || !cur_.read_f32(&sb.total_mass) || !cur_.read_f32(&sb.collision_margin) ||
        !cur_.read_i32(&sb.aero_model)) {
      return read_failed(section);
    }
    for (float& f : sb.config) {
      if (!cur_.read_f32(&f)) {
        return read_failed(section);
      }
    }
    for (float& f : sb.cluster) {
      if (!cur_.read_f32(&f)) {
        return read_failed(section);
      }
    }
    for (qint32& it : sb.iterations) {
      if (!cur_.read_i32(&it)) {
        return read_failed(section);
      }
    }
    for (float& f : sb.material) {
      if (!cur_.read_f32(&f)) {
        return read_failed(section);
      }
    }

    int anchor_count = 0;
    if (!read_count(section, &anchor_count)) {
      return false;
    }
    sb.anchors.reserve(reserve_hint(anchor_count, h.rigid_body_index_width + h.vertex_index_width + 1));
    for (int k = 0; k < anchor_count; ++k) {
      PmxSoftBodyAnchor a;
      quint8 near_mode = 0;
      if (!cur_.read_indexed(h.rigid_body_index_width, &a.rigid_body_index) ||
          !cur_.read_vertex_index(h.vertex_index_width, &a.vertex_index) || !cur_.read_u8(&near_mode)) {
        return read_failed(section);
      }
      a.near_mode = near_mode != 0;
      sb.anchors.push_back(a);
    }

    int pin_count = 0;
    if (!read_count(section, &pin_count)) {
      return false;
    }
    sb.pinned_vertices.reserve(reserve_hint(pin_count, h.vertex_index_width));
    for (int k = 0; k < pin_count; ++k) {
      qint64 v = 0;
      if (!cur_.read_vertex_index(h.vertex_index_width, &v)) {
        return read_failed(section);
      }
      sb.pinned_vertices.push_back(v);
    }
    doc_.soft_bodies.push_back(sb);
  }
  return true;
}

std::optional<PmxDocument> PmxDecoder::run() {
  if (error_) {
    error_->clear();
  }
  if (!read_header() || !read_vertices() || !read_faces() || !read_textures() || !read_materials() || !read_bones() ||
      !read_morphs() || !read_display_frames() || !read_rigid_bodies() || !read_joints()) {
    return std::nullopt;
  }
  // Soft bodies only exist in 2.1 files, and older 2.1 exporters omit the section entirely.
  if (doc_.header.version > 2.05f && !cur_.at_end()) {
    if (!read_soft_bodies()) {
      return std::nullopt;
    }
  }
  return doc_;
}
}  // namespace

QString pmx_morph_kind_name(quint8 kind) {
  switch (kind) {
    case pmx_morph_kind::kGroup:
      return "group";
    case pmx_morph_kind::kVertex:
      return "vertex";
    case pmx_morph_kind::kBone:
      return "bone";
    case pmx_morph_kind::kUv:
      return "uv";
    case pmx_morph_kind::kMaterial:
      return "material";
    case pmx_morph_kind::kFlip:
      return "flip";
    case pmx_morph_kind::kImpulse:
      return "impulse";
    default:
      break;
  }
  if (kind >= pmx_morph_kind::kAdditionalUv1 && kind <= pmx_morph_kind::kAdditionalUv4) {
    return QString("additional_uv%1").arg(kind - pmx_morph_kind::kAdditionalUv1 + 1);
  }
  return QString("kind_%1").arg(kind);
}

bool looks_like_pmx(const QByteArray& bytes) {
  return bytes.startsWith(kPmxMagic);
}

std::optional<PmxDocument> decode_pmx(const QByteArray& bytes, ImportError* error) {
  PmxDecoder decoder(bytes, error);
  return decoder.run();
}
