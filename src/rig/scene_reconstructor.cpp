#include "rig/scene_reconstructor.h"

#include <algorithm>
#include <cmath>

#include "rig/bone_math.h"

namespace {
QString element_name(const QString& name, const char* fallback, int index) {
  return name.isEmpty() ? QString("%1_%2").arg(QString::fromLatin1(fallback)).arg(index) : name;
}

class SceneBuilder {
public:
  SceneBuilder(const PmxDocument& doc,
               SceneCollaborator& target,
               const ImportOptions& options,
               ImportError* error,
               const ImportProgressFn& progress)
      : doc_(doc), target_(target), options_(options), error_(error), progress_(progress) {
    conv_.scale = options.scale;
    conv_.z_up = options.z_up;
  }

  std::optional<ImportSummary> run() {
    if (error_) {
      error_->clear();
    }
    if (!std::isfinite(options_.scale) || options_.scale <= 0.0f) {
      set_import_error(error_, ImportErrorKind::InvalidOptions, "scale", 0,
                       QString("Scale %1 must be finite and positive.").arg(static_cast<double>(options_.scale)));
      return std::nullopt;
    }
    if (!check_bone_hierarchy(doc_.bones, error_)) {
      return std::nullopt;
    }
    summary_.model_name = doc_.header.model_name;

    if (!build_geometry() || !apply_weights()) {
      return std::nullopt;
    }
    checkpoint(ImportStage::Vertices);

    if (!build_materials()) {
      return std::nullopt;
    }
    checkpoint(ImportStage::Materials);

    if (!assign_faces()) {
      return std::nullopt;
    }
    checkpoint(ImportStage::Faces);

    if (!build_bones()) {
      return std::nullopt;
    }
    wire_constraints();
    checkpoint(ImportStage::Bones);

    if (options_.import_morphs) {
      build_morphs();
    }
    checkpoint(ImportStage::Morphs);

    if (options_.import_physics) {
      build_physics();
    }
    checkpoint(ImportStage::Physics);

    if (!target_.bind_mesh_to_armature(mesh_, armature_)) {
      return host_rejected("bind_mesh_to_armature", 0);
    }
    summary_.object_count = summary_.mesh_count + (armature_.valid() ? 1 : 0) + summary_.rigid_body_count +
                            summary_.joint_count;
    checkpoint(ImportStage::Finalize);
    return summary_;
  }

private:
  void checkpoint(ImportStage stage) {
    if (progress_) {
      progress_(stage, static_cast<int>(stage) + 1, kImportStageCount);
    }
  }

  std::nullopt_t host_rejected(const char* op, qint64 index) {
    set_import_error(error_, ImportErrorKind::HostRejected, QString::fromLatin1(op), index);
    return std::nullopt;
  }

  void warn(const QString& text) { summary_.warnings.push_back(text); }

  bool valid_bone(qint64 index) const { return index >= 0 && index < doc_.bones.size(); }

  QString bone_label(qint64 index) const {
    return valid_bone(index) ? element_name(doc_.bones[index].name, "bone", static_cast<int>(index))
                             : QString::number(index);
  }

  bool build_geometry() {
    MeshDesc mesh;
    mesh.name = element_name(doc_.header.model_name, "model", 0);
    mesh.positions.reserve(doc_.vertices.size());
    mesh.normals.reserve(doc_.vertices.size());
    mesh.uvs.reserve(doc_.vertices.size());
    for (const PmxVertex& v : doc_.vertices) {
      mesh.positions.push_back(conv_.point(v.position));
      mesh.normals.push_back(conv_.direction(v.normal));
      // PMX UVs run top-down.
      mesh.uvs.push_back(QVector2D(v.uv.x(), 1.0f - v.uv.y()));
    }

    const std::uint32_t vertex_count = static_cast<std::uint32_t>(doc_.vertices.size());
    mesh.triangles.reserve(doc_.faces.size());
    for (int i = 0; i < doc_.faces.size(); ++i) {
      const PmxFace& f = doc_.faces[i];
      const std::uint32_t worst = std::max({f.a, f.b, f.c});
      if (worst >= vertex_count) {
        return set_import_error(error_, ImportErrorKind::DanglingIndex, "face vertex", worst,
                                QString("face %1").arg(i));
      }
      mesh.triangles.push_back(conv_.triangle(f.a, f.b, f.c));
    }

    mesh_ = target_.create_mesh(mesh);
    if (!mesh_.valid()) {
      host_rejected("create_mesh", 0);
      return false;
    }
    summary_.mesh_count = 1;

    groups_.reserve(doc_.bones.size());
    for (int i = 0; i < doc_.bones.size(); ++i) {
      const VertexGroupHandle group = target_.create_vertex_group(mesh_, bone_label(i));
      if (!group.valid()) {
        host_rejected("create_vertex_group", i);
        return false;
      }
      groups_.push_back(group);
    }
    return true;
  }

  bool assign(int vertex, qint64 bone, float weight, WeightMode mode) {
    if (bone < 0 || bone >= groups_.size()) {
      return set_import_error(error_, ImportErrorKind::DanglingIndex, "skin bone", bone,
                              QString("vertex %1").arg(vertex));
    }
    if (!target_.assign_weight(groups_[static_cast<int>(bone)], vertex, weight, mode)) {
      host_rejected("assign_weight", vertex);
      return false;
    }
    return true;
  }

  // Two-bone bindings write both slots, zero weights included, so both bone
  // references are always checked. Slots naming the same bone are merged.
  bool assign_pair(int vertex, qint64 bone_a, qint64 bone_b, float weight_a) {
    const float wa = std::clamp(weight_a, 0.0f, 1.0f);
    if (bone_a == bone_b) {
      return assign(vertex, bone_a, 1.0f, WeightMode::Replace);
    }
    return assign(vertex, bone_a, wa, WeightMode::Replace) && assign(vertex, bone_b, 1.0f - wa, WeightMode::Replace);
  }

  bool apply_weights() {
    for (int i = 0; i < doc_.vertices.size(); ++i) {
      const PmxSkinBinding& skin = doc_.vertices[i].skin;
      bool ok = true;
      if (const auto* single = std::get_if<PmxSkinSingle>(&skin)) {
        ok = assign(i, single->bone, 1.0f, WeightMode::Replace);
      } else if (const auto* dual = std::get_if<PmxSkinDual>(&skin)) {
        ok = assign_pair(i, dual->bone_a, dual->bone_b, dual->weight_a);
      } else if (const auto* sdef = std::get_if<PmxSkinSphericalDual>(&skin)) {
        ok = assign_pair(i, sdef->bone_a, sdef->bone_b, sdef->weight_a);
      } else if (const auto* quad = std::get_if<PmxSkinQuad>(&skin)) {
        for (int slot = 0; slot < 4 && ok; ++slot) {
          if (quad->weights[slot] > 0.0f) {
            ok = assign(i, quad->bones[slot], quad->weights[slot], WeightMode::Add);
          }
        }
      }
      if (!ok) {
        return false;
      }
    }
    return true;
  }

  QString texture_path(qint64 index, const QString& material, const QString& slot) {
    if (index < 0) {
      return {};
    }
    if (index >= doc_.textures.size()) {
      warn(QString("Material '%1': %2 texture index %3 is out of range.").arg(material, slot).arg(index));
      return {};
    }
    return doc_.textures[static_cast<int>(index)];
  }

  bool build_materials() {
    materials_.reserve(doc_.materials.size());
    for (int i = 0; i < doc_.materials.size(); ++i) {
      const PmxMaterial& m = doc_.materials[i];
      MaterialDesc desc;
      desc.name = element_name(m.name, "material", i);
      desc.name_en = m.name_en;
      desc.diffuse = m.diffuse;
      desc.specular = m.specular;
      desc.specular_strength = m.specular_strength;
      desc.ambient = m.ambient;
      desc.edge_color = m.edge_color;
      desc.edge_size = m.edge_size;
      desc.double_sided = (m.draw_flags & 0x01) != 0;
      desc.texture_path = texture_path(m.texture_index, desc.name, "base");
      desc.sphere_texture_path = texture_path(m.sphere_texture_index, desc.name, "sphere");
      desc.sphere_mode = desc.sphere_texture_path.isEmpty() ? PmxSphereMode::Disabled : m.sphere_mode;
      if (m.shared_toon) {
        if (m.toon_texture_index >= 0 && m.toon_texture_index <= 9) {
          desc.shared_toon_slot = static_cast<int>(m.toon_texture_index);
          desc.toon_texture_path = QString("toon%1.bmp").arg(m.toon_texture_index + 1, 2, 10, QChar('0'));
        } else {
          warn(QString("Material '%1': shared toon slot %2 is out of range.").arg(desc.name).arg(m.toon_texture_index));
        }
      } else {
        desc.toon_texture_path = texture_path(m.toon_texture_index, desc.name, "toon");
      }

      const MaterialHandle handle = target_.create_material(desc);
      if (!handle.valid()) {
        host_rejected("create_material", i);
        return false;
      }
      materials_.push_back(handle);
      ++summary_.material_count;
    }
    return true;
  }

  // Materials own contiguous runs of face_vertex_count / 3 triangles, in order.
  bool assign_faces() {
    qint64 total = 0;
    for (int i = 0; i < doc_.materials.size(); ++i) {
      const std::uint32_t count = doc_.materials[i].face_vertex_count;
      if (count % 3 != 0) {
        return set_import_error(error_, ImportErrorKind::MaterialFaceCountMismatch, "materials", i,
                                QString("Material %1 covers %2 face vertices.").arg(i).arg(count));
      }
      total += count / 3;
    }
    if (total != doc_.faces.size()) {
      return set_import_error(error_, ImportErrorKind::MaterialFaceCountMismatch, "materials", total,
                              QString("Materials cover %1 triangles, the mesh has %2.").arg(total).arg(doc_.faces.size()));
    }

    int first = 0;
    for (int i = 0; i < doc_.materials.size(); ++i) {
      const int count = static_cast<int>(doc_.materials[i].face_vertex_count / 3);
      if (count > 0 && !target_.assign_faces_to_material(mesh_, first, count, materials_[i])) {
        host_rejected("assign_faces_to_material", i);
        return false;
      }
      first += count;
    }
    return true;
  }

  QVector3D bone_tail(int index, const QVector3D& head) {
    const PmxBone& bone = doc_.bones[index];
    if (const auto* offset = std::get_if<PmxTailOffset>(&bone.tail)) {
      if (!offset->offset.isNull()) {
        return conv_.point(bone.position + offset->offset);
      }
    } else if (const auto* linked = std::get_if<PmxTailBone>(&bone.tail)) {
      if (valid_bone(linked->bone) && linked->bone != index) {
        return conv_.point(doc_.bones[static_cast<int>(linked->bone)].position);
      }
      if (linked->bone >= doc_.bones.size()) {
        warn(QString("Bone '%1': tail bone index %2 is out of range.").arg(bone_label(index)).arg(linked->bone));
      }
    }
    return head + QVector3D(0, kDefaultTailLength * conv_.scale, 0);
  }

  bool build_bones() {
    armature_ = target_.create_armature(element_name(doc_.header.model_name, "model", 0) + "_arm");
    if (!armature_.valid()) {
      host_rejected("create_armature", 0);
      return false;
    }

    bones_.fill(BoneHandle{}, doc_.bones.size());
    for (const int index : bone_creation_order(doc_.bones)) {
      const PmxBone& bone = doc_.bones[index];
      const QVector3D head = conv_.point(bone.position);
      const QVector3D tail = enforce_minimum_bone_length(head, bone_tail(index, head), QVector3D(0, 1, 0));
      std::optional<BoneHandle> parent;
      if (bone.parent_index >= 0) {
        parent = bones_[static_cast<int>(bone.parent_index)];
      }
      const BoneHandle handle = target_.create_bone(armature_, bone_label(index), head, tail, parent);
      if (!handle.valid()) {
        host_rejected("create_bone", index);
        return false;
      }
      bones_[index] = handle;
      ++summary_.bone_count;
    }
    return true;
  }

  // IK targets and links may point anywhere in the bone list, so this runs
  // only after every bone exists.
  void wire_constraints() {
    for (int i = 0; i < doc_.bones.size(); ++i) {
      const PmxBone& bone = doc_.bones[i];
      if (bone.is_ik) {
        wire_ik(i, bone);
      }
      if (bone.additional_transform) {
        const PmxAdditionalTransform& at = *bone.additional_transform;
        if (!valid_bone(at.source_bone) || at.source_bone == i) {
          warn(QString("Bone '%1': inherit source %2 is invalid.").arg(bone_label(i)).arg(at.source_bone));
        } else if (!target_.create_transform_inheritance(bones_[i], bones_[static_cast<int>(at.source_bone)],
                                                         at.ratio, at.rotation, at.translation)) {
          warn(QString("Bone '%1': scene refused transform inheritance.").arg(bone_label(i)));
        }
      }
    }
  }

  void wire_ik(int index, const PmxBone& bone) {
    if (!valid_bone(bone.ik_target)) {
      warn(QString("IK bone '%1': target index %2 is out of range.").arg(bone_label(index)).arg(bone.ik_target));
    } else if (!target_.create_ik_constraint(bones_[index], bones_[static_cast<int>(bone.ik_target)],
                                             static_cast<int>(bone.ik_links.size()), bone.loop_count)) {
      warn(QString("IK bone '%1': scene refused the IK constraint.").arg(bone_label(index)));
    } else {
      ++summary_.ik_constraint_count;
    }

    for (const PmxIkLink& link : bone.ik_links) {
      if (!valid_bone(link.bone_index)) {
        warn(QString("IK bone '%1': link index %2 is out of range.").arg(bone_label(index)).arg(link.bone_index));
        continue;
      }
      if (!link.angle_limit) {
        continue;
      }
      QVector3D min;
      QVector3D max;
      conv_.angle_limits(link.angle_limit->min, link.angle_limit->max, &min, &max);
      if (!target_.set_bone_angle_limits(bones_[static_cast<int>(link.bone_index)], min, max)) {
        warn(QString("IK link '%1': scene refused angle limits.").arg(bone_label(link.bone_index)));
      }
    }
  }

  void build_morphs() {
    ShapeKeyHandle basis;
    bool basis_failed = false;
    for (int i = 0; i < doc_.morphs.size(); ++i) {
      const PmxMorph& morph = doc_.morphs[i];
      const QString name = element_name(morph.name, "morph", i);

      if (const auto* vertex = std::get_if<PmxVertexMorph>(&morph.data)) {
        if (!basis.valid() && !basis_failed) {
          basis = target_.create_shape_key(mesh_, "Basis");
          basis_failed = !basis.valid();
          if (basis_failed) {
            warn("Scene refused the basis shape key; vertex morphs skipped.");
          } else {
            ++summary_.shape_key_count;
          }
        }
        if (basis_failed) {
          continue;
        }
        build_vertex_morph(name, *vertex);
      } else if (const auto* material = std::get_if<PmxMaterialMorph>(&morph.data)) {
        build_material_morph(name, *material);
      } else if (const auto* other = std::get_if<PmxUnhandledMorph>(&morph.data)) {
        summary_.skipped_morphs.push_back(QString("%1 (%2)").arg(name, pmx_morph_kind_name(other->kind)));
      }
    }
  }

  void build_vertex_morph(const QString& name, const PmxVertexMorph& morph) {
    const ShapeKeyHandle key = target_.create_shape_key(mesh_, name);
    if (!key.valid()) {
      warn(QString("Morph '%1': scene refused the shape key.").arg(name));
      return;
    }
    ++summary_.shape_key_count;

    int bad = 0;
    for (const PmxVertexOffset& o : morph.offsets) {
      if (o.vertex_index < 0 || o.vertex_index >= doc_.vertices.size() ||
          !target_.set_shape_key_offset(key, static_cast<int>(o.vertex_index), conv_.point(o.offset))) {
        ++bad;
      }
    }
    if (bad > 0) {
      warn(QString("Morph '%1': %2 vertex offset(s) skipped.").arg(name).arg(bad));
    }
  }

  void build_material_morph(const QString& name, const PmxMaterialMorph& morph) {
    for (const PmxMaterialOffset& o : morph.offsets) {
      if (o.material_index < -1 || o.material_index >= materials_.size()) {
        warn(QString("Morph '%1': material index %2 is out of range.").arg(name).arg(o.material_index));
        continue;
      }
      const int first = o.material_index < 0 ? 0 : static_cast<int>(o.material_index);
      const int last = o.material_index < 0 ? static_cast<int>(materials_.size()) - 1 : first;
      for (int m = first; m <= last; ++m) {
        if (!target_.apply_material_morph(materials_[m], name, o.op, o.blend)) {
          warn(QString("Morph '%1': scene refused material %2.").arg(name).arg(m));
        }
      }
    }
  }

  QVector3D body_size(const PmxRigidBody& body) const {
    switch (body.shape) {
      case PmxRigidShape::Sphere:
        return QVector3D(body.size.x(), 0, 0) * conv_.scale;
      case PmxRigidShape::Box:
        return conv_.point(body.size);
      case PmxRigidShape::Capsule:
        return QVector3D(body.size.x(), body.size.y(), 0) * conv_.scale;
    }
    return body.size * conv_.scale;
  }

  void build_physics() {
    bodies_.fill(BodyHandle{}, doc_.rigid_bodies.size());
    for (int i = 0; i < doc_.rigid_bodies.size(); ++i) {
      const PmxRigidBody& rb = doc_.rigid_bodies[i];
      RigidBodyDesc desc;
      desc.name = element_name(rb.name, "rigid", i);
      desc.shape = rb.shape;
      desc.size = body_size(rb);
      desc.position = conv_.point(rb.position);
      desc.rotation = conv_.euler(rb.rotation);
      desc.mass = rb.mass;
      desc.friction = rb.friction;
      desc.restitution = rb.restitution;
      desc.linear_damping = rb.linear_damping;
      desc.angular_damping = rb.angular_damping;
      desc.collision_group = rb.group;
      desc.collision_mask = rb.non_collision_mask;
      desc.mode = rb.mode;

      const BodyHandle handle = target_.create_rigid_body(desc);
      if (!handle.valid()) {
        warn(QString("Rigid body '%1': scene refused it.").arg(desc.name));
        continue;
      }
      bodies_[i] = handle;
      ++summary_.rigid_body_count;

      if (rb.bone_index < 0) {
        continue;
      }
      if (!valid_bone(rb.bone_index)) {
        warn(QString("Rigid body '%1': bone index %2 is out of range; left unattached.").arg(desc.name).arg(rb.bone_index));
      } else if (!target_.pin_body_to_bone(handle, bones_[static_cast<int>(rb.bone_index)])) {
        warn(QString("Rigid body '%1': scene refused pinning to '%2'.").arg(desc.name, bone_label(rb.bone_index)));
      }
    }

    for (int i = 0; i < doc_.joints.size(); ++i) {
      const PmxJoint& j = doc_.joints[i];
      JointDesc desc;
      desc.name = element_name(j.name, "joint", i);
      desc.body_a = joint_body(desc.name, j.rigid_body_a);
      desc.body_b = joint_body(desc.name, j.rigid_body_b);
      desc.position = conv_.point(j.position);
      desc.rotation = conv_.euler(j.rotation);
      desc.linear_lower = conv_.point(j.linear_lower);
      desc.linear_upper = conv_.point(j.linear_upper);
      conv_.angle_limits(j.angular_lower, j.angular_upper, &desc.angular_lower, &desc.angular_upper);
      desc.linear_spring = conv_.direction(j.linear_spring);
      desc.angular_spring = conv_.direction(j.angular_spring);

      if (!target_.create_joint(desc).valid()) {
        warn(QString("Joint '%1': scene refused it.").arg(desc.name));
        continue;
      }
      ++summary_.joint_count;
    }

    if (!doc_.soft_bodies.isEmpty()) {
      const int count = static_cast<int>(doc_.soft_bodies.size());
      warn(QString("%1 soft bod%2 not imported.").arg(count).arg(QString(count == 1 ? "y" : "ies")));
    }
  }

  std::optional<BodyHandle> joint_body(const QString& joint, qint64 index) {
    if (index < 0) {
      return std::nullopt;
    }
    if (index >= bodies_.size()) {
      warn(QString("Joint '%1': rigid body index %2 is out of range; left unconstrained.").arg(joint).arg(index));
      return std::nullopt;
    }
    const BodyHandle body = bodies_[static_cast<int>(index)];
    if (!body.valid()) {
      warn(QString("Joint '%1': rigid body %2 was not created; left unconstrained.").arg(joint).arg(index));
      return std::nullopt;
    }
    return body;
  }

  const PmxDocument& doc_;
  SceneCollaborator& target_;
  const ImportOptions& options_;
  ImportError* error_ = nullptr;
  const ImportProgressFn& progress_;
  AxisConversion conv_;
  ImportSummary summary_;

  MeshHandle mesh_;
  ArmatureHandle armature_;
  QVector<VertexGroupHandle> groups_;
  QVector<MaterialHandle> materials_;
  QVector<BoneHandle> bones_;
  QVector<BodyHandle> bodies_;
};
}  // namespace

QString import_stage_name(ImportStage stage) {
  switch (stage) {
    case ImportStage::Vertices:
      return "vertices";
    case ImportStage::Materials:
      return "materials";
    case ImportStage::Faces:
      return "faces";
    case ImportStage::Bones:
      return "bones";
    case ImportStage::Morphs:
      return "morphs";
    case ImportStage::Physics:
      return "physics";
    case ImportStage::Finalize:
      return "finalize";
  }
  return "unknown";
}

bool check_bone_hierarchy(const QVector<PmxBone>& bones, ImportError* error) {
  for (int i = 0; i < bones.size(); ++i) {
    const qint64 parent = bones[i].parent_index;
    if (parent < -1 || parent >= bones.size()) {
      return set_import_error(error, ImportErrorKind::DanglingIndex, "bone parent", parent,
                              QString("Bone %1.").arg(i));
    }
  }

  // 0 = unvisited, 1 = on the current walk, 2 = known to reach a root.
  QVector<quint8> state(bones.size(), 0);
  QVector<int> walk;
  for (int i = 0; i < bones.size(); ++i) {
    walk.clear();
    int cur = i;
    while (cur >= 0 && state[cur] == 0) {
      state[cur] = 1;
      walk.push_back(cur);
      cur = static_cast<int>(bones[cur].parent_index);
    }
    if (cur >= 0 && state[cur] == 1) {
      return set_import_error(error, ImportErrorKind::CyclicBoneHierarchy, "bones", cur);
    }
    for (const int b : walk) {
      state[b] = 2;
    }
  }
  return true;
}

QVector<int> bone_creation_order(const QVector<PmxBone>& bones) {
  QVector<int> order;
  order.reserve(bones.size());
  QVector<bool> placed(bones.size(), false);
  QVector<int> chain;
  for (int i = 0; i < bones.size(); ++i) {
    chain.clear();
    for (int cur = i; cur >= 0 && !placed[cur]; cur = static_cast<int>(bones[cur].parent_index)) {
      chain.push_back(cur);
    }
    for (auto it = chain.crbegin(); it != chain.crend(); ++it) {
      placed[*it] = true;
      order.push_back(*it);
    }
  }
  return order;
}

std::optional<ImportSummary> build_scene(const PmxDocument& doc,
                                         SceneCollaborator& target,
                                         const ImportOptions& options,
                                         ImportError* error,
                                         const ImportProgressFn& progress) {
  SceneBuilder builder(doc, target, options, error, progress);
  return builder.run();
}
