#pragma once

#include <QVector3D>

#include "rig/scene_collaborator.h"

// Bones shorter than this (in scene units) are stretched to it.
constexpr float kMinimumBoneLength = 0.001f;
// Tail length, in model units, for bones without an explicit tail. The tail
// points along scene +Y.
constexpr float kDefaultTailLength = 0.1f;

// Maps PMX model space (left-handed, Y up) into scene space.
//
// With z_up set the Y and Z axes are swapped, which mirrors the space, so
// triangle winding and rotation signs flip with it.
struct AxisConversion {
  float scale = 1.0f;
  bool z_up = true;

  QVector3D point(const QVector3D& p) const;
  QVector3D direction(const QVector3D& d) const;
  QVector3D euler(const QVector3D& r) const;
  SceneTriangle triangle(std::uint32_t a, std::uint32_t b, std::uint32_t c) const;
  // Rotation limits mirror with the space, so min and max trade places.
  void angle_limits(const QVector3D& min, const QVector3D& max, QVector3D* out_min, QVector3D* out_max) const;
};

// Returns tail, moved away from head along the bone (or `fallback_axis` for a
// degenerate bone) so the bone is at least kMinimumBoneLength long.
[[nodiscard]] QVector3D enforce_minimum_bone_length(const QVector3D& head,
                                                    const QVector3D& tail,
                                                    const QVector3D& fallback_axis);
