#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QVector2D>
#include <QVector3D>
#include <QVector4D>

#include <array>
#include <cstdint>
#include <optional>
#include <variant>

#include "formats/binary_cursor.h"

struct PmxHeader {
  float version = 2.0f;
  TextEncoding encoding = TextEncoding::Utf16Le;
  int additional_vec4_count = 0;
  int vertex_index_width = 4;
  int texture_index_width = 4;
  int material_index_width = 4;
  int bone_index_width = 4;
  int morph_index_width = 4;
  int rigid_body_index_width = 4;
  int vertex_count = 0;

  QString model_name;
  QString model_name_en;
  QString comment;
  QString comment_en;
};

// BDEF1
struct PmxSkinSingle {
  qint64 bone = -1;
};

// BDEF2. weight_b is 1 - weight_a.
struct PmxSkinDual {
  qint64 bone_a = -1;
  qint64 bone_b = -1;
  float weight_a = 1.0f;
};

// BDEF4, and QDEF which shares its layout.
struct PmxSkinQuad {
  std::array<qint64, 4> bones{{-1, -1, -1, -1}};
  std::array<float, 4> weights{{0.0f, 0.0f, 0.0f, 0.0f}};
  bool dual_quaternion = false;
};

// SDEF. center/r0/r1 are carried for deformers that blend spherically.
struct PmxSkinSphericalDual {
  qint64 bone_a = -1;
  qint64 bone_b = -1;
  float weight_a = 1.0f;
  QVector3D center;
  QVector3D r0;
  QVector3D r1;
};

using PmxSkinBinding = std::variant<PmxSkinSingle, PmxSkinDual, PmxSkinQuad, PmxSkinSphericalDual>;

struct PmxVertex {
  QVector3D position;
  QVector3D normal;
  QVector2D uv;
  QVector<QVector4D> additional_vec4s;
  PmxSkinBinding skin;
  float edge_scale = 1.0f;
};

struct PmxFace {
  std::uint32_t a = 0;
  std::uint32_t b = 0;
  std::uint32_t c = 0;
};

enum class PmxSphereMode : quint8 {
  Disabled = 0,
  Multiply = 1,
  Add = 2,
  SubTexture = 3,
};

struct PmxMaterial {
  QString name;
  QString name_en;
  QVector4D diffuse;
  QVector3D specular;
  float specular_strength = 0.0f;
  QVector3D ambient;
  quint8 draw_flags = 0;
  QVector4D edge_color;
  float edge_size = 0.0f;
  qint64 texture_index = -1;
  qint64 sphere_texture_index = -1;
  PmxSphereMode sphere_mode = PmxSphereMode::Disabled;
  bool shared_toon = false;
  // Shared toon slot (0..9) when shared_toon is set, else a texture index.
  qint64 toon_texture_index = -1;
  QString memo;
  std::uint32_t face_vertex_count = 0;
};

namespace pmx_bone_flags {
constexpr quint16 kTailIsBone = 0x0001;
constexpr quint16 kRotatable = 0x0002;
constexpr quint16 kMovable = 0x0004;
constexpr quint16 kVisible = 0x0008;
constexpr quint16 kEnabled = 0x0010;
constexpr quint16 kIk = 0x0020;
constexpr quint16 kInheritRotation = 0x0100;
constexpr quint16 kInheritTranslation = 0x0200;
constexpr quint16 kFixedAxis = 0x0400;
constexpr quint16 kLocalAxes = 0x0800;
constexpr quint16 kPhysicsAfterDeform = 0x1000;
constexpr quint16 kExternalParent = 0x2000;
}  // namespace pmx_bone_flags

struct PmxTailOffset {
  QVector3D offset;
};

struct PmxTailBone {
  qint64 bone = -1;
};

using PmxTailRef = std::variant<PmxTailOffset, PmxTailBone>;

struct PmxAdditionalTransform {
  qint64 source_bone = -1;
  float ratio = 0.0f;
  bool rotation = false;
  bool translation = false;
};

struct PmxAngleLimit {
  QVector3D min;
  QVector3D max;
};

struct PmxIkLink {
  qint64 bone_index = -1;
  std::optional<PmxAngleLimit> angle_limit;
};

struct PmxBone {
  QString name;
  QString name_en;
  QVector3D position;
  qint64 parent_index = -1;
  qint32 layer = 0;
  quint16 flags = 0;
  PmxTailRef tail;
  std::optional<PmxAdditionalTransform> additional_transform;
  std::optional<QVector3D> fixed_axis;
  std::optional<QVector3D> local_axis_x;
  std::optional<QVector3D> local_axis_z;
  std::optional<qint32> external_key;

  bool is_ik = false;
  qint64 ik_target = -1;
  qint32 loop_count = 0;
  float limit_angle = 0.0f;
  QVector<PmxIkLink> ik_links;
};

enum class PmxMorphPanel : quint8 {
  System = 0,
  Eyebrow = 1,
  Eye = 2,
  Mouth = 3,
  Other = 4,
};

namespace pmx_morph_kind {
constexpr quint8 kGroup = 0;
constexpr quint8 kVertex = 1;
constexpr quint8 kBone = 2;
constexpr quint8 kUv = 3;
constexpr quint8 kAdditionalUv1 = 4;
constexpr quint8 kAdditionalUv4 = 7;
constexpr quint8 kMaterial = 8;
constexpr quint8 kFlip = 9;
constexpr quint8 kImpulse = 10;
}  // namespace pmx_morph_kind

struct PmxVertexOffset {
  qint64 vertex_index = 0;
  QVector3D offset;
};

enum class PmxMaterialMorphOp : quint8 {
  Multiply = 0,
  Add = 1,
};

struct PmxMaterialBlend {
  QVector4D diffuse;
  QVector3D specular;
  float specular_strength = 0.0f;
  QVector3D ambient;
  QVector4D edge_color;
  float edge_size = 0.0f;
  QVector4D texture_tint;
  QVector4D sphere_tint;
  QVector4D toon_tint;
};

struct PmxMaterialOffset {
  // -1 addresses every material.
  qint64 material_index = -1;
  PmxMaterialMorphOp op = PmxMaterialMorphOp::Multiply;
  PmxMaterialBlend blend;
};

struct PmxVertexMorph {
  QVector<PmxVertexOffset> offsets;
};

struct PmxMaterialMorph {
  QVector<PmxMaterialOffset> offsets;
};

// Kinds this importer does not reconstruct keep their raw element bytes.
struct PmxUnhandledMorph {
  quint8 kind = 0;
  int element_count = 0;
  QByteArray raw;
};

using PmxMorphData = std::variant<PmxVertexMorph, PmxMaterialMorph, PmxUnhandledMorph>;

struct PmxMorph {
  QString name;
  QString name_en;
  PmxMorphPanel panel = PmxMorphPanel::Other;
  quint8 kind = 0;
  PmxMorphData data;
};

struct PmxDisplayElement {
  bool is_morph = false;
  qint64 index = -1;
};

struct PmxDisplayFrame {
  QString name;
  QString name_en;
  bool special = false;
  QVector<PmxDisplayElement> elements;
};

enum class PmxRigidShape : quint8 {
  Sphere = 0,
  Box = 1,
  Capsule = 2,
};

enum class PmxPhysicsMode : quint8 {
  Static = 0,
  Dynamic = 1,
  DynamicWithBone = 2,
};

struct PmxRigidBody {
  QString name;
  QString name_en;
  qint64 bone_index = -1;
  quint8 group = 0;
  quint16 non_collision_mask = 0;
  PmxRigidShape shape = PmxRigidShape::Sphere;
  QVector3D size;
  QVector3D position;
  QVector3D rotation;
  float mass = 0.0f;
  float linear_damping = 0.0f;
  float angular_damping = 0.0f;
  float restitution = 0.0f;
  float friction = 0.0f;
  PmxPhysicsMode mode = PmxPhysicsMode::Static;
};

struct PmxJoint {
  QString name;
  QString name_en;
  quint8 type = 0;
  qint64 rigid_body_a = -1;
  qint64 rigid_body_b = -1;
  QVector3D position;
  QVector3D rotation;
  QVector3D linear_lower;
  QVector3D linear_upper;
  QVector3D angular_lower;
  QVector3D angular_upper;
  QVector3D linear_spring;
  QVector3D angular_spring;
};

struct PmxSoftBodyAnchor {
  qint64 rigid_body_index = -1;
  qint64 vertex_index = -1;
  bool near_mode = false;
};

struct PmxSoftBody {
  QString name;
  QString name_en;
  quint8 shape = 0;
  qint64 material_index = -1;
  quint8 group = 0;
  quint16 non_collision_mask = 0;
  quint8 flags = 0;
  qint32 bending_link_distance = 0;
  qint32 cluster_count = 0;
  float total_mass = 0.0f;
  float collision_margin = 0.0f;
  qint32 aero_model = 0;
  std::array<float, 12> config{};
  std::array<float, 6> cluster{};
  std::array<qint32, 4> iterations{};
  std::array<float, 3> material{};
  QVector<PmxSoftBodyAnchor> anchors;
  QVector<qint64> pinned_vertices;
};

struct PmxSectionOffsets {
  int vertices = -1;
  int faces = -1;
  int textures = -1;
  int materials = -1;
  int bones = -1;
  int morphs = -1;
  int display_frames = -1;
  int rigid_bodies = -1;
  int joints = -1;
  int soft_bodies = -1;
};

struct PmxDocument {
  PmxHeader header;
  QVector<PmxVertex> vertices;
  QVector<PmxFace> faces;
  QVector<QString> textures;
  QVector<PmxMaterial> materials;
  QVector<PmxBone> bones;
  QVector<PmxMorph> morphs;
  QVector<PmxDisplayFrame> display_frames;
  QVector<PmxRigidBody> rigid_bodies;
  QVector<PmxJoint> joints;
  QVector<PmxSoftBody> soft_bodies;
  PmxSectionOffsets section_offsets;
};

[[nodiscard]] QString pmx_morph_kind_name(quint8 kind);
