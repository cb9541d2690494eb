#include "rig/bone_math.h"

QVector3D AxisConversion::direction(const QVector3D& d) const {
  return z_up ? QVector3D(d.x(), d.z(), d.y()) : d;
}

QVector3D AxisConversion::point(const QVector3D& p) const {
  return direction(p) * scale;
}

QVector3D AxisConversion::euler(const QVector3D& r) const {
  return z_up ? -direction(r) : r;
}

SceneTriangle AxisConversion::triangle(std::uint32_t a, std::uint32_t b, std::uint32_t c) const {
  SceneTriangle t;
  t.a = a;
  t.b = z_up ? c : b;
  t.c = z_up ? b : c;
  return t;
}

void AxisConversion::angle_limits(const QVector3D& min,
                                  const QVector3D& max,
                                  QVector3D* out_min,
                                  QVector3D* out_max) const {
  if (!z_up) {
    *out_min = min;
    *out_max = max;
    return;
  }
  *out_min = euler(max);
  *out_max = euler(min);
}

QVector3D enforce_minimum_bone_length(const QVector3D& head, const QVector3D& tail, const QVector3D& fallback_axis) {
  const QVector3D delta = tail - head;
  const float length = delta.length();
  if (length >= kMinimumBoneLength) {
    return tail;
  }
  QVector3D dir = length > 1e-9f ? delta / length : fallback_axis.normalized();
  if (dir.lengthSquared() < 1e-12f) {
    dir = QVector3D(0, 0, 1);
  }
  return head + dir * kMinimumBoneLength;
}
