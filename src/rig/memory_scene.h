#pragma once

#include <QMap>
#include <QString>
#include <QVector>

#include "rig/scene_collaborator.h"

struct SceneMesh {
  MeshDesc desc;
  int armature = -1;
  QVector<int> face_materials;  // Material id per triangle, -1 when unassigned.
};

struct SceneVertexGroup {
  int mesh = -1;
  QString name;
  QMap<int, float> weights;
};

struct SceneArmature {
  QString name;
};

struct SceneBone {
  int armature = -1;
  QString name;
  QVector3D head;
  QVector3D tail;
  int parent = -1;
  bool has_angle_limits = false;
  QVector3D limit_min;
  QVector3D limit_max;
};

struct SceneIkConstraint {
  int bone = -1;
  int target = -1;
  int chain_length = 0;
  int iterations = 0;
};

struct SceneTransformInheritance {
  int bone = -1;
  int source = -1;
  float influence = 0.0f;
  bool rotation = false;
  bool translation = false;
};

struct SceneMaterialMorph {
  QString morph_name;
  PmxMaterialMorphOp op = PmxMaterialMorphOp::Multiply;
  PmxMaterialBlend blend;
};

struct SceneMaterial {
  MaterialDesc desc;
  QVector<SceneMaterialMorph> morphs;
};

struct SceneShapeKey {
  int mesh = -1;
  QString name;
  QMap<int, QVector3D> offsets;
};

struct SceneBody {
  RigidBodyDesc desc;
  int pinned_bone = -1;
};

struct SceneJoint {
  JointDesc desc;
};

// Scene graph held in memory. Backs the command-line import and the tests.
class MemoryScene : public SceneCollaborator {
public:
  MeshHandle create_mesh(const MeshDesc& mesh) override;
  VertexGroupHandle create_vertex_group(MeshHandle mesh, const QString& name) override;
  bool assign_weight(VertexGroupHandle group, int vertex, float weight, WeightMode mode) override;

  ArmatureHandle create_armature(const QString& name) override;
  BoneHandle create_bone(ArmatureHandle armature,
                         const QString& name,
                         const QVector3D& head,
                         const QVector3D& tail,
                         std::optional<BoneHandle> parent) override;
  bool create_ik_constraint(BoneHandle bone, BoneHandle target, int chain_length, int iterations) override;
  bool set_bone_angle_limits(BoneHandle bone, const QVector3D& min, const QVector3D& max) override;
  bool create_transform_inheritance(BoneHandle bone,
                                    BoneHandle source,
                                    float influence,
                                    bool rotation,
                                    bool translation) override;

  MaterialHandle create_material(const MaterialDesc& material) override;
  bool assign_faces_to_material(MeshHandle mesh, int first_face, int face_count, MaterialHandle material) override;

  ShapeKeyHandle create_shape_key(MeshHandle mesh, const QString& name) override;
  bool set_shape_key_offset(ShapeKeyHandle key, int vertex, const QVector3D& offset) override;
  bool apply_material_morph(MaterialHandle material,
                            const QString& morph_name,
                            PmxMaterialMorphOp op,
                            const PmxMaterialBlend& blend) override;

  BodyHandle create_rigid_body(const RigidBodyDesc& body) override;
  bool pin_body_to_bone(BodyHandle body, BoneHandle bone) override;
  JointHandle create_joint(const JointDesc& joint) override;

  bool bind_mesh_to_armature(MeshHandle mesh, ArmatureHandle armature) override;

  // Moves a bone tail, keeping the bone at least kMinimumBoneLength long.
  bool set_bone_tail(BoneHandle bone, const QVector3D& tail);

  const QVector<SceneMesh>& meshes() const { return meshes_; }
  const QVector<SceneVertexGroup>& vertex_groups() const { return groups_; }
  const QVector<SceneArmature>& armatures() const { return armatures_; }
  const QVector<SceneBone>& bones() const { return bones_; }
  const QVector<SceneIkConstraint>& ik_constraints() const { return ik_constraints_; }
  const QVector<SceneTransformInheritance>& inheritances() const { return inheritances_; }
  const QVector<SceneMaterial>& materials() const { return materials_; }
  const QVector<SceneShapeKey>& shape_keys() const { return shape_keys_; }
  const QVector<SceneBody>& bodies() const { return bodies_; }
  const QVector<SceneJoint>& joints() const { return joints_; }

  [[nodiscard]] int find_bone(const QString& name) const;
  [[nodiscard]] int find_vertex_group(const QString& name) const;

  // Human-readable dump of everything in the scene.
  [[nodiscard]] QString report() const;

private:
  bool valid_mesh(int id) const { return id >= 0 && id < meshes_.size(); }
  bool valid_bone(int id) const { return id >= 0 && id < bones_.size(); }

  QVector<SceneMesh> meshes_;
  QVector<SceneVertexGroup> groups_;
  QVector<SceneArmature> armatures_;
  QVector<SceneBone> bones_;
  QVector<SceneIkConstraint> ik_constraints_;
  QVector<SceneTransformInheritance> inheritances_;
  QVector<SceneMaterial> materials_;
  QVector<SceneShapeKey> shape_keys_;
  QVector<SceneBody> bodies_;
  QVector<SceneJoint> joints_;
};
