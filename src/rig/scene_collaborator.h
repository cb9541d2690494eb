#pragma once

#include <QString>
#include <QVector>
#include <QVector2D>
#include <QVector3D>
#include <QVector4D>

#include <cstdint>
#include <optional>

#include "formats/pmx_document.h"

// Typed id of an object owned by the host scene. A negative id means the host refused to create it.
template <typename Tag>
struct SceneHandle {
  int id = -1;

  bool valid() const { return id >= 0; }
  bool operator==(const SceneHandle& other) const { return id == other.id; }
  bool operator!=(const SceneHandle& other) const { return id != other.id; }
};

using MeshHandle = SceneHandle<struct MeshHandleTag>;
using VertexGroupHandle = SceneHandle<struct VertexGroupHandleTag>;
using ArmatureHandle = SceneHandle<struct ArmatureHandleTag>;
using BoneHandle = SceneHandle<struct BoneHandleTag>;
using MaterialHandle = SceneHandle<struct MaterialHandleTag>;
using ShapeKeyHandle = SceneHandle<struct ShapeKeyHandleTag>;
using BodyHandle = SceneHandle<struct BodyHandleTag>;
using JointHandle = SceneHandle<struct JointHandleTag>;

enum class WeightMode {
  Replace,
  Add,
};

struct SceneTriangle {
  std::uint32_t a = 0;
  std::uint32_t b = 0;
  std::uint32_t c = 0;
};

struct MeshDesc {
  QString name;
  QVector<QVector3D> positions;
  QVector<QVector3D> normals;
  QVector<QVector2D> uvs;
  QVector<SceneTriangle> triangles;
};

struct MaterialDesc {
  QString name;
  QString name_en;
  QVector4D diffuse;
  QVector3D specular;
  float specular_strength = 0.0f;
  QVector3D ambient;
  QVector4D edge_color;
  float edge_size = 0.0f;
  bool double_sided = false;
  QString texture_path;
  QString sphere_texture_path;
  PmxSphereMode sphere_mode = PmxSphereMode::Disabled;
  QString toon_texture_path;
  int shared_toon_slot = -1;
};

struct RigidBodyDesc {
  QString name;
  PmxRigidShape shape = PmxRigidShape::Sphere;
  QVector3D size;
  QVector3D position;
  QVector3D rotation;  // Euler XYZ, radians.
  float mass = 0.0f;
  float friction = 0.0f;
  float restitution = 0.0f;
  float linear_damping = 0.0f;
  float angular_damping = 0.0f;
  int collision_group = 0;
  quint16 collision_mask = 0;
  PmxPhysicsMode mode = PmxPhysicsMode::Static;
};

struct JointDesc {
  QString name;
  std::optional<BodyHandle> body_a;
  std::optional<BodyHandle> body_b;
  QVector3D position;
  QVector3D rotation;
  QVector3D linear_lower;
  QVector3D linear_upper;
  QVector3D angular_lower;
  QVector3D angular_upper;
  QVector3D linear_spring;
  QVector3D angular_spring;
};

// Editing capability of the application the model is imported into.
//
// Creators return an invalid handle and mutators return false when the host
// refuses an operation. Calls arrive on one thread, in import order.
class SceneCollaborator {
public:
  virtual ~SceneCollaborator() = default;

  virtual MeshHandle create_mesh(const MeshDesc& mesh) = 0;
  virtual VertexGroupHandle create_vertex_group(MeshHandle mesh, const QString& name) = 0;
  virtual bool assign_weight(VertexGroupHandle group, int vertex, float weight, WeightMode mode) = 0;

  virtual ArmatureHandle create_armature(const QString& name) = 0;
  virtual BoneHandle create_bone(ArmatureHandle armature,
                                 const QString& name,
                                 const QVector3D& head,
                                 const QVector3D& tail,
                                 std::optional<BoneHandle> parent) = 0;
  virtual bool create_ik_constraint(BoneHandle bone, BoneHandle target, int chain_length, int iterations) = 0;
  virtual bool set_bone_angle_limits(BoneHandle bone, const QVector3D& min, const QVector3D& max) = 0;
  virtual bool create_transform_inheritance(BoneHandle bone,
                                            BoneHandle source,
                                            float influence,
                                            bool rotation,
                                            bool translation) = 0;

  virtual MaterialHandle create_material(const MaterialDesc& material) = 0;
  virtual bool assign_faces_to_material(MeshHandle mesh, int first_face, int face_count, MaterialHandle material) = 0;

  virtual ShapeKeyHandle create_shape_key(MeshHandle mesh, const QString& name) = 0;
  virtual bool set_shape_key_offset(ShapeKeyHandle key, int vertex, const QVector3D& offset) = 0;
  virtual bool apply_material_morph(MaterialHandle material,
                                    const QString& morph_name,
                                    PmxMaterialMorphOp op,
                                    const PmxMaterialBlend& blend) = 0;

  virtual BodyHandle create_rigid_body(const RigidBodyDesc& body) = 0;
  virtual bool pin_body_to_bone(BodyHandle body, BoneHandle bone) = 0;
  virtual JointHandle create_joint(const JointDesc& joint) = 0;

  virtual bool bind_mesh_to_armature(MeshHandle mesh, ArmatureHandle armature) = 0;
};
