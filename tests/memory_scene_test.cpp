#include <gtest/gtest.h>

#include "rig/bone_math.h"
#include "rig/memory_scene.h"

namespace {
MeshDesc quad_mesh() {
  MeshDesc mesh;
  mesh.name = "quad";
  mesh.positions = {QVector3D(0, 0, 0), QVector3D(1, 0, 0), QVector3D(1, 1, 0), QVector3D(0, 1, 0)};
  mesh.triangles = {SceneTriangle{0, 1, 2}, SceneTriangle{0, 2, 3}};
  return mesh;
}
}  // namespace

TEST(memory_scene, rejects_mesh_with_bad_triangle) {
  MemoryScene scene;
  MeshDesc mesh = quad_mesh();
  mesh.triangles.push_back(SceneTriangle{0, 1, 4});
  EXPECT_FALSE(scene.create_mesh(mesh).valid());
  EXPECT_TRUE(scene.meshes().isEmpty());
}

TEST(memory_scene, weight_modes) {
  MemoryScene scene;
  const MeshHandle mesh = scene.create_mesh(quad_mesh());
  const VertexGroupHandle group = scene.create_vertex_group(mesh, "arm");
  ASSERT_TRUE(group.valid());

  EXPECT_TRUE(scene.assign_weight(group, 0, 0.25f, WeightMode::Add));
  EXPECT_TRUE(scene.assign_weight(group, 0, 0.25f, WeightMode::Add));
  EXPECT_FLOAT_EQ(scene.vertex_groups()[0].weights.value(0), 0.5f);
  EXPECT_TRUE(scene.assign_weight(group, 0, 0.1f, WeightMode::Replace));
  EXPECT_FLOAT_EQ(scene.vertex_groups()[0].weights.value(0), 0.1f);

  EXPECT_FALSE(scene.assign_weight(group, 4, 1.0f, WeightMode::Replace));
  EXPECT_FALSE(scene.assign_weight(group, 1, -0.5f, WeightMode::Replace));
  EXPECT_FALSE(scene.assign_weight(VertexGroupHandle{7}, 0, 1.0f, WeightMode::Replace));
  EXPECT_EQ(scene.find_vertex_group("arm"), 0);
  EXPECT_EQ(scene.find_vertex_group("leg"), -1);
}

TEST(memory_scene, bone_parent_must_share_armature) {
  MemoryScene scene;
  const ArmatureHandle first = scene.create_armature("first");
  const ArmatureHandle second = scene.create_armature("second");
  const BoneHandle root = scene.create_bone(first, "root", QVector3D(), QVector3D(0, 1, 0), std::nullopt);
  ASSERT_TRUE(root.valid());

  EXPECT_TRUE(scene.create_bone(first, "child", QVector3D(0, 1, 0), QVector3D(0, 2, 0), root).valid());
  EXPECT_FALSE(scene.create_bone(second, "stray", QVector3D(), QVector3D(0, 1, 0), root).valid());
  EXPECT_FALSE(scene.create_bone(ArmatureHandle{}, "none", QVector3D(), QVector3D(0, 1, 0), std::nullopt).valid());
  EXPECT_EQ(scene.bones().size(), 2);
  EXPECT_EQ(scene.bones()[1].parent, root.id);
}

TEST(memory_scene, bones_keep_minimum_length) {
  MemoryScene scene;
  const ArmatureHandle arm = scene.create_armature("arm");
  const BoneHandle bone = scene.create_bone(arm, "flat", QVector3D(1, 1, 1), QVector3D(1, 1, 1), std::nullopt);
  ASSERT_TRUE(bone.valid());
  EXPECT_EQ(scene.bones()[0].tail, QVector3D(1, 1 + kMinimumBoneLength, 1));

  ASSERT_TRUE(scene.set_bone_tail(bone, QVector3D(1, 3, 1)));
  EXPECT_EQ(scene.bones()[0].tail, QVector3D(1, 3, 1));
  EXPECT_FALSE(scene.set_bone_tail(BoneHandle{4}, QVector3D()));
}

TEST(memory_scene, constraints_validate_bones) {
  MemoryScene scene;
  const ArmatureHandle arm = scene.create_armature("arm");
  const BoneHandle a = scene.create_bone(arm, "a", QVector3D(), QVector3D(0, 1, 0), std::nullopt);
  const BoneHandle b = scene.create_bone(arm, "b", QVector3D(0, 1, 0), QVector3D(0, 2, 0), a);

  EXPECT_TRUE(scene.create_ik_constraint(b, a, 1, 20));
  EXPECT_FALSE(scene.create_ik_constraint(b, BoneHandle{9}, 1, 20));
  EXPECT_FALSE(scene.create_transform_inheritance(a, a, 1.0f, true, false));
  EXPECT_TRUE(scene.create_transform_inheritance(b, a, 0.5f, false, true));
  EXPECT_TRUE(scene.set_bone_angle_limits(a, QVector3D(-1, 0, 0), QVector3D(1, 0, 0)));
  EXPECT_TRUE(scene.bones()[0].has_angle_limits);
  EXPECT_EQ(scene.ik_constraints().size(), 1);
  EXPECT_EQ(scene.inheritances().size(), 1);
}

TEST(memory_scene, face_assignment_stays_in_range) {
  MemoryScene scene;
  const MeshHandle mesh = scene.create_mesh(quad_mesh());
  const MaterialHandle mat = scene.create_material(MaterialDesc{});

  EXPECT_FALSE(scene.assign_faces_to_material(mesh, 1, 2, mat));
  EXPECT_FALSE(scene.assign_faces_to_material(mesh, 0, 1, MaterialHandle{3}));
  EXPECT_TRUE(scene.assign_faces_to_material(mesh, 1, 1, mat));
  EXPECT_EQ(scene.meshes()[0].face_materials, QVector<int>({-1, 0}));
}

TEST(memory_scene, joints_need_existing_bodies) {
  MemoryScene scene;
  const BodyHandle body = scene.create_rigid_body(RigidBodyDesc{});

  JointDesc joint;
  joint.body_a = body;
  EXPECT_TRUE(scene.create_joint(joint).valid());
  joint.body_b = BodyHandle{5};
  EXPECT_FALSE(scene.create_joint(joint).valid());
  EXPECT_EQ(scene.joints().size(), 1);
}

TEST(memory_scene, report_lists_objects) {
  MemoryScene scene;
  const MeshHandle mesh = scene.create_mesh(quad_mesh());
  const ArmatureHandle arm = scene.create_armature("quad_arm");
  scene.create_bone(arm, "spine", QVector3D(), QVector3D(0, 1, 0), std::nullopt);
  ASSERT_TRUE(scene.bind_mesh_to_armature(mesh, arm));

  const QString report = scene.report();
  EXPECT_TRUE(report.contains("quad: 4 vertices, 2 triangles, armature=quad_arm"));
  EXPECT_TRUE(report.contains("spine"));
  EXPECT_TRUE(report.contains("Joints: 0"));
}

TEST(bone_math, z_up_swaps_axes_and_winding) {
  AxisConversion conv;
  conv.scale = 0.5f;
  EXPECT_EQ(conv.point(QVector3D(2, 4, 6)), QVector3D(1, 3, 2));
  EXPECT_EQ(conv.direction(QVector3D(2, 4, 6)), QVector3D(2, 6, 4));
  EXPECT_EQ(conv.euler(QVector3D(1, 2, 3)), QVector3D(-1, -3, -2));

  const SceneTriangle t = conv.triangle(0, 1, 2);
  EXPECT_EQ(t.b, 2u);
  EXPECT_EQ(t.c, 1u);

  AxisConversion identity;
  identity.z_up = false;
  EXPECT_EQ(identity.point(QVector3D(2, 4, 6)), QVector3D(2, 4, 6));
  EXPECT_EQ(identity.triangle(0, 1, 2).b, 1u);
}

TEST(bone_math, minimum_length_uses_bone_direction) {
  const QVector3D head(0, 0, 0);
  EXPECT_EQ(enforce_minimum_bone_length(head, QVector3D(1, 0, 0), QVector3D(0, 1, 0)), QVector3D(1, 0, 0));

  const QVector3D stretched = enforce_minimum_bone_length(head, QVector3D(0.0001f, 0, 0), QVector3D(0, 1, 0));
  EXPECT_NEAR(stretched.x(), kMinimumBoneLength, 1e-7f);
  EXPECT_FLOAT_EQ(stretched.y(), 0.0f);

  const QVector3D degenerate = enforce_minimum_bone_length(head, head, QVector3D(0, 0, 2));
  EXPECT_FLOAT_EQ(degenerate.z(), kMinimumBoneLength);
}
