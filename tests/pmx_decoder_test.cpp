#include <gtest/gtest.h>

#include <cmath>

#include "formats/pmx_decoder.h"
#include "pmx_test_writer.h"

namespace {
// Offset of the first vertex's weight tag.
int first_weight_tag_offset(const PmxDocument& decoded) {
  return decoded.section_offsets.vertices + 4 + 12 + 12 + 8 + decoded.header.additional_vec4_count * 16;
}

void put_i32(QByteArray* bytes, int offset, qint32 v) {
  for (int i = 0; i < 4; ++i) {
    (*bytes)[offset + i] = static_cast<char>((static_cast<quint32>(v) >> (8 * i)) & 0xFF);
  }
}
}  // namespace

TEST(pmx_decoder, decodes_single_triangle) {
  ImportError err;
  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(single_triangle_document()), &err);
  ASSERT_TRUE(doc.has_value()) << describe_import_error(err).toStdString();
  EXPECT_FALSE(err.is_set());

  EXPECT_EQ(doc->header.model_name, QString("triangle"));
  EXPECT_EQ(doc->header.encoding, TextEncoding::Utf8);
  EXPECT_EQ(doc->vertices.size(), 3);
  EXPECT_EQ(doc->header.vertex_count, 3);
  ASSERT_EQ(doc->faces.size(), 1);
  EXPECT_EQ(doc->faces[0].a, 0u);
  EXPECT_EQ(doc->faces[0].b, 1u);
  EXPECT_EQ(doc->faces[0].c, 2u);
  ASSERT_EQ(doc->materials.size(), 1);
  EXPECT_EQ(doc->materials[0].face_vertex_count, 3u);
  ASSERT_EQ(doc->bones.size(), 1);
  EXPECT_EQ(doc->bones[0].parent_index, -1);
  ASSERT_TRUE(std::holds_alternative<PmxSkinSingle>(doc->vertices[0].skin));
  EXPECT_EQ(std::get<PmxSkinSingle>(doc->vertices[0].skin).bone, 0);
}

TEST(pmx_decoder, count_invariants_hold) {
  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(rich_document()));
  ASSERT_TRUE(doc.has_value());

  EXPECT_EQ(doc->vertices.size(), doc->header.vertex_count);
  qint64 triangles = 0;
  for (const PmxMaterial& m : doc->materials) {
    triangles += m.face_vertex_count / 3;
  }
  EXPECT_EQ(triangles, doc->faces.size());
  for (const PmxFace& f : doc->faces) {
    EXPECT_LT(f.a, static_cast<std::uint32_t>(doc->vertices.size()));
    EXPECT_LT(f.b, static_cast<std::uint32_t>(doc->vertices.size()));
    EXPECT_LT(f.c, static_cast<std::uint32_t>(doc->vertices.size()));
  }
}

TEST(pmx_decoder, decodes_every_section) {
  ImportError err;
  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(rich_document()), &err);
  ASSERT_TRUE(doc.has_value()) << describe_import_error(err).toStdString();

  EXPECT_EQ(doc->header.additional_vec4_count, 1);
  ASSERT_EQ(doc->vertices[0].additional_vec4s.size(), 1);
  EXPECT_FLOAT_EQ(doc->vertices[0].additional_vec4s[0].w(), 0.4f);
  EXPECT_TRUE(std::holds_alternative<PmxSkinDual>(doc->vertices[1].skin));
  EXPECT_TRUE(std::holds_alternative<PmxSkinQuad>(doc->vertices[2].skin));
  ASSERT_TRUE(std::holds_alternative<PmxSkinSphericalDual>(doc->vertices[3].skin));
  EXPECT_FLOAT_EQ(std::get<PmxSkinSphericalDual>(doc->vertices[3].skin).r0.y(), 1.1f);

  ASSERT_EQ(doc->textures.size(), 2);
  EXPECT_EQ(doc->textures[0], QString("tex/body.png"));
  EXPECT_TRUE(doc->materials[0].shared_toon);
  EXPECT_EQ(doc->materials[0].toon_texture_index, 1);
  EXPECT_EQ(doc->materials[1].memo, QString("memo"));

  ASSERT_EQ(doc->bones.size(), 5);
  ASSERT_TRUE(std::holds_alternative<PmxTailBone>(doc->bones[1].tail));
  EXPECT_EQ(std::get<PmxTailBone>(doc->bones[1].tail).bone, 2);
  const PmxBone& ik = doc->bones[3];
  EXPECT_TRUE(ik.is_ik);
  EXPECT_EQ(ik.ik_target, 2);
  EXPECT_EQ(ik.loop_count, 40);
  ASSERT_EQ(ik.ik_links.size(), 2);
  ASSERT_TRUE(ik.ik_links[0].angle_limit.has_value());
  EXPECT_FLOAT_EQ(ik.ik_links[0].angle_limit->min.x(), -3.0f);
  EXPECT_FALSE(ik.ik_links[1].angle_limit.has_value());
  const PmxBone& twist = doc->bones[4];
  ASSERT_TRUE(twist.additional_transform.has_value());
  EXPECT_EQ(twist.additional_transform->source_bone, 2);
  EXPECT_TRUE(twist.additional_transform->rotation);
  EXPECT_FALSE(twist.additional_transform->translation);
  EXPECT_TRUE(twist.fixed_axis.has_value());
  EXPECT_TRUE(twist.local_axis_z.has_value());
  ASSERT_TRUE(twist.external_key.has_value());
  EXPECT_EQ(*twist.external_key, 7);

  ASSERT_EQ(doc->morphs.size(), 6);
  EXPECT_TRUE(std::holds_alternative<PmxVertexMorph>(doc->morphs[0].data));
  EXPECT_EQ(doc->morphs[0].panel, PmxMorphPanel::Mouth);
  ASSERT_TRUE(std::holds_alternative<PmxMaterialMorph>(doc->morphs[1].data));
  EXPECT_EQ(std::get<PmxMaterialMorph>(doc->morphs[1].data).offsets[0].material_index, -1);

  ASSERT_EQ(doc->display_frames.size(), 2);
  EXPECT_TRUE(doc->display_frames[0].special);
  EXPECT_TRUE(doc->display_frames[1].elements[1].is_morph);

  ASSERT_EQ(doc->rigid_bodies.size(), 2);
  EXPECT_EQ(doc->rigid_bodies[0].shape, PmxRigidShape::Box);
  EXPECT_EQ(doc->rigid_bodies[0].non_collision_mask, 0xFFFE);
  EXPECT_EQ(doc->rigid_bodies[1].mode, PmxPhysicsMode::Dynamic);
  ASSERT_EQ(doc->joints.size(), 1);
  EXPECT_EQ(doc->joints[0].rigid_body_b, 1);
  EXPECT_TRUE(doc->soft_bodies.isEmpty());
  EXPECT_EQ(doc->section_offsets.soft_bodies, -1);
}

TEST(pmx_decoder, unhandled_morphs_keep_raw_bytes) {
  const PmxDocument source = rich_document();
  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(source));
  ASSERT_TRUE(doc.has_value());

  for (int i = 2; i < source.morphs.size(); ++i) {
    ASSERT_TRUE(std::holds_alternative<PmxUnhandledMorph>(doc->morphs[i].data)) << i;
    const PmxUnhandledMorph& got = std::get<PmxUnhandledMorph>(doc->morphs[i].data);
    const PmxUnhandledMorph& want = std::get<PmxUnhandledMorph>(source.morphs[i].data);
    EXPECT_EQ(got.kind, want.kind);
    EXPECT_EQ(got.element_count, want.element_count);
    EXPECT_EQ(got.raw, want.raw);
  }
}

TEST(pmx_decoder, decodes_utf16_text) {
  PmxDocument source = single_triangle_document();
  source.header.encoding = TextEncoding::Utf16Le;
  source.header.model_name = QString::fromUtf8("初音ミク");
  source.bones[0].name = QString::fromUtf8("センター");
  source.textures.push_back(QString::fromUtf8("テクスチャ/肌.png"));

  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(source));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->header.encoding, TextEncoding::Utf16Le);
  EXPECT_EQ(doc->header.model_name, source.header.model_name);
  EXPECT_EQ(doc->bones[0].name, source.bones[0].name);
  EXPECT_EQ(doc->textures[0], source.textures[0]);
}

TEST(pmx_decoder, quad_weights_sum_to_one) {
  PmxDocument source = single_triangle_document();
  PmxSkinQuad unnormalized;
  unnormalized.bones = {{0, 0, 0, 0}};
  unnormalized.weights = {{1.0f, 1.0f, 2.0f, 0.0f}};
  PmxSkinQuad qdef;
  qdef.bones = {{0, -1, -1, -1}};
  qdef.weights = {{1.0f, 0.0f, 0.0f, 0.0f}};
  qdef.dual_quaternion = true;
  source.vertices[0].skin = unnormalized;
  source.vertices[1].skin = qdef;

  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(source));
  ASSERT_TRUE(doc.has_value());
  for (const PmxVertex& v : doc->vertices) {
    const auto* quad = std::get_if<PmxSkinQuad>(&v.skin);
    if (!quad) {
      continue;
    }
    float sum = 0.0f;
    for (const float w : quad->weights) {
      sum += w;
    }
    EXPECT_NEAR(sum, 1.0f, 1e-4f);
  }
  const PmxSkinQuad& first = std::get<PmxSkinQuad>(doc->vertices[0].skin);
  EXPECT_NEAR(first.weights[2], 0.5f, 1e-6f);
  EXPECT_FALSE(first.dual_quaternion);
  EXPECT_TRUE(std::get<PmxSkinQuad>(doc->vertices[1].skin).dual_quaternion);
}

TEST(pmx_decoder, decoding_is_deterministic) {
  const QByteArray bytes = write_pmx(rich_document());
  const std::optional<PmxDocument> a = decode_pmx(bytes);
  const std::optional<PmxDocument> b = decode_pmx(bytes);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(write_pmx(*a), write_pmx(*b));
  EXPECT_EQ(write_pmx(*a), bytes);
}

TEST(pmx_decoder, every_truncation_reports_truncated_input) {
  const QByteArray bytes = write_pmx(rich_document());
  for (int n = 0; n < bytes.size(); ++n) {
    ImportError err;
    const std::optional<PmxDocument> doc = decode_pmx(bytes.left(n), &err);
    ASSERT_FALSE(doc.has_value()) << "prefix " << n;
    ASSERT_EQ(err.kind, ImportErrorKind::TruncatedInput)
      << "prefix " << n << ": " << describe_import_error(err).toStdString();
  }
}

TEST(pmx_decoder, truncation_names_the_section) {
  const QByteArray bytes = write_pmx(rich_document());
  const std::optional<PmxDocument> full = decode_pmx(bytes);
  ASSERT_TRUE(full.has_value());

  ImportError err;
  EXPECT_FALSE(decode_pmx(bytes.left(full->section_offsets.bones + 6), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::TruncatedInput);
  EXPECT_EQ(err.section, QString("bones"));
}

TEST(pmx_decoder, rejects_unknown_weight_type) {
  QByteArray bytes = write_pmx(single_triangle_document());
  const std::optional<PmxDocument> doc = decode_pmx(bytes);
  ASSERT_TRUE(doc.has_value());
  bytes[first_weight_tag_offset(*doc)] = 7;

  ImportError err;
  EXPECT_FALSE(decode_pmx(bytes, &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::InvalidWeightType);
  EXPECT_EQ(err.value, 7);
}

TEST(pmx_decoder, rejects_bad_header) {
  const QByteArray good = write_pmx(single_triangle_document());

  QByteArray magic = good;
  magic[0] = 'Q';
  ImportError err;
  EXPECT_FALSE(decode_pmx(magic, &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::InvalidHeader);
  EXPECT_FALSE(looks_like_pmx(magic));
  EXPECT_TRUE(looks_like_pmx(good));

  QByteArray width = good;
  width[4 + 4 + 1 + 5] = 3;  // bone index width
  EXPECT_FALSE(decode_pmx(width, &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::InvalidHeader);

  QByteArray encoding = good;
  encoding[4 + 4 + 1] = 2;
  EXPECT_FALSE(decode_pmx(encoding, &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::InvalidHeader);
}

TEST(pmx_decoder, rejects_unknown_version) {
  PmxDocument source = single_triangle_document();
  source.header.version = 3.0f;
  ImportError err;
  EXPECT_FALSE(decode_pmx(write_pmx(source), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::UnsupportedVersion);
}

TEST(pmx_decoder, rejects_implausible_counts) {
  QByteArray bytes = write_pmx(single_triangle_document());
  const std::optional<PmxDocument> doc = decode_pmx(bytes);
  ASSERT_TRUE(doc.has_value());

  QByteArray negative = bytes;
  put_i32(&negative, doc->section_offsets.vertices, -5);
  ImportError err;
  EXPECT_FALSE(decode_pmx(negative, &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("vertices"));
  EXPECT_EQ(err.value, -5);

  QByteArray huge = bytes;
  put_i32(&huge, doc->section_offsets.textures, kPmxMaxSectionCount + 1);
  EXPECT_FALSE(decode_pmx(huge, &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("textures"));
}

TEST(pmx_decoder, rejects_face_index_out_of_range) {
  PmxDocument source = single_triangle_document();
  source.faces[0].c = 3;
  ImportError err;
  EXPECT_FALSE(decode_pmx(write_pmx(source), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("faces"));
  EXPECT_EQ(err.value, 3);
}

TEST(pmx_decoder, rejects_unknown_morph_kind) {
  PmxDocument source = single_triangle_document();
  PmxMorph odd;
  odd.name = "odd";
  odd.kind = 11;
  odd.data = PmxUnhandledMorph{11, 0, QByteArray()};
  source.morphs.push_back(odd);

  ImportError err;
  EXPECT_FALSE(decode_pmx(write_pmx(source), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("morphs"));
  EXPECT_EQ(err.value, 11);
}

TEST(pmx_decoder, rejects_unknown_enum_bytes) {
  PmxDocument bad_sphere = single_triangle_document();
  bad_sphere.materials[0].sphere_mode = static_cast<PmxSphereMode>(7);
  ImportError err;
  EXPECT_FALSE(decode_pmx(write_pmx(bad_sphere), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("materials"));
  EXPECT_EQ(err.value, 7);

  PmxDocument bad_shape = rich_document();
  bad_shape.rigid_bodies[1].shape = static_cast<PmxRigidShape>(7);
  EXPECT_FALSE(decode_pmx(write_pmx(bad_shape), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("rigid_bodies"));
  EXPECT_EQ(err.value, 7);

  PmxDocument bad_mode = rich_document();
  bad_mode.rigid_bodies[0].mode = static_cast<PmxPhysicsMode>(3);
  EXPECT_FALSE(decode_pmx(write_pmx(bad_mode), &err).has_value());
  EXPECT_EQ(err.kind, ImportErrorKind::CorruptSection);
  EXPECT_EQ(err.section, QString("rigid_bodies"));
  EXPECT_EQ(err.value, 3);
}

TEST(pmx_decoder, single_byte_indices_use_minus_one_for_none) {
  PmxDocument source = single_triangle_document();
  source.header.vertex_index_width = 1;
  source.header.bone_index_width = 1;
  source.header.texture_index_width = 1;
  source.bones.push_back(make_bone("child", QVector3D(0, 1, 0), 0));

  const std::optional<PmxDocument> doc = decode_pmx(write_pmx(source));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->bones[0].parent_index, -1);
  EXPECT_EQ(doc->bones[1].parent_index, 0);
  EXPECT_EQ(doc->materials[0].texture_index, -1);
}

TEST(pmx_decoder, reads_soft_bodies_in_version_2_1) {
  PmxDocument source = single_triangle_document();
  source.header.version = 2.1f;
  PmxSoftBody cloth;
  cloth.name = "skirt";
  cloth.material_index = 0;
  cloth.total_mass = 1.5f;
  cloth.anchors.push_back(PmxSoftBodyAnchor{-1, 2, true});
  cloth.pinned_vertices = {0, 1};
  source.soft_bodies.push_back(cloth);

  const QByteArray bytes = write_pmx(source);
  ImportError err;
  const std::optional<PmxDocument> doc = decode_pmx(bytes, &err);
  ASSERT_TRUE(doc.has_value()) << describe_import_error(err).toStdString();
  ASSERT_EQ(doc->soft_bodies.size(), 1);
  EXPECT_EQ(doc->soft_bodies[0].name, QString("skirt"));
  ASSERT_EQ(doc->soft_bodies[0].anchors.size(), 1);
  EXPECT_TRUE(doc->soft_bodies[0].anchors[0].near_mode);
  EXPECT_EQ(doc->soft_bodies[0].pinned_vertices.size(), 2);

  // Older 2.1 exporters stop after the joints.
  const std::optional<PmxDocument> without = decode_pmx(bytes.left(doc->section_offsets.soft_bodies));
  ASSERT_TRUE(without.has_value());
  EXPECT_TRUE(without->soft_bodies.isEmpty());
}

TEST(pmx_decoder, morph_kind_names) {
  EXPECT_EQ(pmx_morph_kind_name(pmx_morph_kind::kVertex), QString("vertex"));
  EXPECT_EQ(pmx_morph_kind_name(5), QString("additional_uv2"));
  EXPECT_EQ(pmx_morph_kind_name(42), QString("kind_42"));
}
