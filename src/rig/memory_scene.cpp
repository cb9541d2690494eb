#include "rig/memory_scene.h"

#include <QTextStream>

#include "rig/bone_math.h"

namespace {
QString vec3_text(const QVector3D& v) {
  return QString("(%1, %2, %3)").arg(v.x(), 0, 'g', 6).arg(v.y(), 0, 'g', 6).arg(v.z(), 0, 'g', 6);
}

QString shape_name(PmxRigidShape shape) {
  switch (shape) {
    case PmxRigidShape::Sphere:
      return "sphere";
    case PmxRigidShape::Box:
      return "box";
    case PmxRigidShape::Capsule:
      return "capsule";
  }
  return "unknown";
}

QString physics_mode_name(PmxPhysicsMode mode) {
  switch (mode) {
    case PmxPhysicsMode::Static:
      return "static";
    case PmxPhysicsMode::Dynamic:
      return "dynamic";
    case PmxPhysicsMode::DynamicWithBone:
      return "dynamic+bone";
  }
  return "unknown";
}
}  // namespace

MeshHandle MemoryScene::create_mesh(const MeshDesc& mesh) {
  for (const SceneTriangle& t : mesh.triangles) {
    const std::uint32_t count = static_cast<std::uint32_t>(mesh.positions.size());
    if (t.a >= count || t.b >= count || t.c >= count) {
      return {};
    }
  }
  SceneMesh m;
  m.desc = mesh;
  m.face_materials.fill(-1, mesh.triangles.size());
  meshes_.push_back(m);
  return MeshHandle{static_cast<int>(meshes_.size()) - 1};
}

VertexGroupHandle MemoryScene::create_vertex_group(MeshHandle mesh, const QString& name) {
  if (!valid_mesh(mesh.id)) {
    return {};
  }
  SceneVertexGroup g;
  g.mesh = mesh.id;
  g.name = name;
  groups_.push_back(g);
  return VertexGroupHandle{static_cast<int>(groups_.size()) - 1};
}

bool MemoryScene::assign_weight(VertexGroupHandle group, int vertex, float weight, WeightMode mode) {
  if (group.id < 0 || group.id >= groups_.size()) {
    return false;
  }
  SceneVertexGroup& g = groups_[group.id];
  if (vertex < 0 || vertex >= meshes_[g.mesh].desc.positions.size() || weight < 0.0f) {
    return false;
  }
  if (mode == WeightMode::Add) {
    g.weights[vertex] += weight;
  } else {
    g.weights[vertex] = weight;
  }
  return true;
}

ArmatureHandle MemoryScene::create_armature(const QString& name) {
  SceneArmature a;
  a.name = name;
  armatures_.push_back(a);
  return ArmatureHandle{static_cast<int>(armatures_.size()) - 1};
}

BoneHandle MemoryScene::create_bone(ArmatureHandle armature,
                                    const QString& name,
                                    const QVector3D& head,
                                    const QVector3D& tail,
                                    std::optional<BoneHandle> parent) {
  if (armature.id < 0 || armature.id >= armatures_.size()) {
    return {};
  }
  SceneBone b;
  b.armature = armature.id;
  b.name = name;
  b.head = head;
  b.tail = enforce_minimum_bone_length(head, tail, QVector3D(0, 1, 0));
  if (parent) {
    if (!valid_bone(parent->id) || bones_[parent->id].armature != armature.id) {
      return {};
    }
    b.parent = parent->id;
  }
  bones_.push_back(b);
  return BoneHandle{static_cast<int>(bones_.size()) - 1};
}

bool MemoryScene::set_bone_tail(BoneHandle bone, const QVector3D& tail) {
  if (!valid_bone(bone.id)) {
    return false;
  }
  SceneBone& b = bones_[bone.id];
  b.tail = enforce_minimum_bone_length(b.head, tail, QVector3D(0, 1, 0));
  return true;
}

bool MemoryScene::create_ik_constraint(BoneHandle bone, BoneHandle target, int chain_length, int iterations) {
  if (!valid_bone(bone.id) || !valid_bone(target.id) || chain_length < 0) {
    return false;
  }
  SceneIkConstraint ik;
  ik.bone = bone.id;
  ik.target = target.id;
  ik.chain_length = chain_length;
  ik.iterations = iterations;
  ik_constraints_.push_back(ik);
  return true;
}

bool MemoryScene::set_bone_angle_limits(BoneHandle bone, const QVector3D& min, const QVector3D& max) {
  if (!valid_bone(bone.id)) {
    return false;
  }
  SceneBone& b = bones_[bone.id];
  b.has_angle_limits = true;
  b.limit_min = min;
  b.limit_max = max;
  return true;
}

bool MemoryScene::create_transform_inheritance(BoneHandle bone,
                                               BoneHandle source,
                                               float influence,
                                               bool rotation,
                                               bool translation) {
  if (!valid_bone(bone.id) || !valid_bone(source.id) || bone.id == source.id) {
    return false;
  }
  SceneTransformInheritance t;
  t.bone = bone.id;
  t.source = source.id;
  t.influence = influence;
  t.rotation = rotation;
  t.translation = translation;
  inheritances_.push_back(t);
  return true;
}

MaterialHandle MemoryScene::create_material(const MaterialDesc& material) {
  SceneMaterial m;
  m.desc = material;
  materials_.push_back(m);
  return MaterialHandle{static_cast<int>(materials_.size()) - 1};
}

bool MemoryScene::assign_faces_to_material(MeshHandle mesh, int first_face, int face_count, MaterialHandle material) {
  if (!valid_mesh(mesh.id) || material.id < 0 || material.id >= materials_.size()) {
    return false;
  }
  QVector<int>& faces = meshes_[mesh.id].face_materials;
  if (first_face < 0 || face_count < 0 || first_face > faces.size() - face_count) {
    return false;
  }
  for (int i = first_face; i < first_face + face_count; ++i) {
    faces[i] = material.id;
  }
  return true;
}

ShapeKeyHandle MemoryScene::create_shape_key(MeshHandle mesh, const QString& name) {
  if (!valid_mesh(mesh.id)) {
    return {};
  }
  SceneShapeKey k;
  k.mesh = mesh.id;
  k.name = name;
  shape_keys_.push_back(k);
  return ShapeKeyHandle{static_cast<int>(shape_keys_.size()) - 1};
}

bool MemoryScene::set_shape_key_offset(ShapeKeyHandle key, int vertex, const QVector3D& offset) {
  if (key.id < 0 || key.id >= shape_keys_.size()) {
    return false;
  }
  SceneShapeKey& k = shape_keys_[key.id];
  if (vertex < 0 || vertex >= meshes_[k.mesh].desc.positions.size()) {
    return false;
  }
  k.offsets[vertex] = offset;
  return true;
}

bool MemoryScene::apply_material_morph(MaterialHandle material,
                                       const QString& morph_name,
                                       PmxMaterialMorphOp op,
                                       const PmxMaterialBlend& blend) {
  if (material.id < 0 || material.id >= materials_.size()) {
    return false;
  }
  SceneMaterialMorph m;
  m.morph_name = morph_name;
  m.op = op;
  m.blend = blend;
  materials_[material.id].morphs.push_back(m);
  return true;
}

BodyHandle MemoryScene::create_rigid_body(const RigidBodyDesc& body) {
  SceneBody b;
  b.desc = body;
  bodies_.push_back(b);
  return BodyHandle{static_cast<int>(bodies_.size()) - 1};
}

bool MemoryScene::pin_body_to_bone(BodyHandle body, BoneHandle bone) {
  if (body.id < 0 || body.id >= bodies_.size() || !valid_bone(bone.id)) {
    return false;
  }
  bodies_[body.id].pinned_bone = bone.id;
  return true;
}

JointHandle MemoryScene::create_joint(const JointDesc& joint) {
  const auto valid_body = [this](const std::optional<BodyHandle>& h) {
    return !h || (h->id >= 0 && h->id < bodies_.size());
  };
  if (!valid_body(joint.body_a) || !valid_body(joint.body_b)) {
    return {};
  }
  SceneJoint j;
  j.desc = joint;
  joints_.push_back(j);
  return JointHandle{static_cast<int>(joints_.size()) - 1};
}

bool MemoryScene::bind_mesh_to_armature(MeshHandle mesh, ArmatureHandle armature) {
  if (!valid_mesh(mesh.id) || armature.id < 0 || armature.id >= armatures_.size()) {
    return false;
  }
  meshes_[mesh.id].armature = armature.id;
  return true;
}

int MemoryScene::find_bone(const QString& name) const {
  for (int i = 0; i < bones_.size(); ++i) {
    if (bones_[i].name == name) {
      return i;
    }
  }
  return -1;
}

int MemoryScene::find_vertex_group(const QString& name) const {
  for (int i = 0; i < groups_.size(); ++i) {
    if (groups_[i].name == name) {
      return i;
    }
  }
  return -1;
}

QString MemoryScene::report() const {
  QString text;
  QTextStream out(&text);

  out << "Meshes: " << meshes_.size() << "\n";
  for (const SceneMesh& m : meshes_) {
    out << "  " << m.desc.name << ": " << m.desc.positions.size() << " vertices, " << m.desc.triangles.size()
        << " triangles";
    if (m.armature >= 0) {
      out << ", armature=" << armatures_[m.armature].name;
    }
    out << "\n";
  }

  int weighted = 0;
  for (const SceneVertexGroup& g : groups_) {
    if (!g.weights.isEmpty()) {
      ++weighted;
    }
  }
  out << "Vertex groups: " << groups_.size() << " (" << weighted << " weighted)\n";

  out << "Armatures: " << armatures_.size() << "\n";
  out << "Bones: " << bones_.size() << "\n";
  for (int i = 0; i < bones_.size(); ++i) {
    const SceneBone& b = bones_[i];
    out << "  [" << i << "] " << b.name << " parent=" << b.parent << " head=" << vec3_text(b.head)
        << " tail=" << vec3_text(b.tail);
    if (b.has_angle_limits) {
      out << " limits=" << vec3_text(b.limit_min) << ".." << vec3_text(b.limit_max);
    }
    out << "\n";
  }
  for (const SceneIkConstraint& ik : ik_constraints_) {
    out << "  IK " << bones_[ik.bone].name << " -> " << bones_[ik.target].name << " chain=" << ik.chain_length
        << " iterations=" << ik.iterations << "\n";
  }
  for (const SceneTransformInheritance& t : inheritances_) {
    out << "  Inherit " << bones_[t.bone].name << " <- " << bones_[t.source].name << " influence=" << t.influence
        << (t.rotation ? " rotation" : "") << (t.translation ? " translation" : "") << "\n";
  }

  out << "Materials: " << materials_.size() << "\n";
  for (int i = 0; i < materials_.size(); ++i) {
    int faces = 0;
    for (const SceneMesh& m : meshes_) {
      faces += m.face_materials.count(i);
    }
    const SceneMaterial& mat = materials_[i];
    out << "  " << mat.desc.name << ": " << faces << " triangles";
    if (!mat.desc.texture_path.isEmpty()) {
      out << " texture=" << mat.desc.texture_path;
    }
    if (!mat.morphs.isEmpty()) {
      out << " morphs=" << mat.morphs.size();
    }
    out << "\n";
  }

  out << "Shape keys: " << shape_keys_.size() << "\n";
  for (const SceneShapeKey& k : shape_keys_) {
    out << "  " << k.name << ": " << k.offsets.size() << " offsets\n";
  }

  out << "Rigid bodies: " << bodies_.size() << "\n";
  for (const SceneBody& b : bodies_) {
    out << "  " << b.desc.name << ": " << shape_name(b.desc.shape) << " " << physics_mode_name(b.desc.mode)
        << " mass=" << b.desc.mass;
    if (b.pinned_bone >= 0) {
      out << " bone=" << bones_[b.pinned_bone].name;
    }
    out << "\n";
  }

  out << "Joints: " << joints_.size() << "\n";
  for (const SceneJoint& j : joints_) {
    const auto body_name = [this](const std::optional<BodyHandle>& h) -> QString {
      return h ? bodies_[h->id].desc.name : QString("(none)");
    };
    out << "  " << j.desc.name << ": " << body_name(j.desc.body_a) << " <-> " << body_name(j.desc.body_b) << "\n";
  }

  out.flush();
  return text;
}
