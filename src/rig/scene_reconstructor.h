#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <optional>

#include "formats/import_error.h"
#include "formats/pmx_document.h"
#include "rig/import_options.h"
#include "rig/scene_collaborator.h"

struct ImportSummary {
  QString model_name;
  QStringList warnings;
  QStringList skipped_morphs;

  int mesh_count = 0;
  int object_count = 0;
  int bone_count = 0;
  int material_count = 0;
  int shape_key_count = 0;
  int rigid_body_count = 0;
  int joint_count = 0;
  int ik_constraint_count = 0;
};

enum class ImportStage {
  Vertices = 0,
  Materials,
  Faces,
  Bones,
  Morphs,
  Physics,
  Finalize,
};

constexpr int kImportStageCount = 7;

[[nodiscard]] QString import_stage_name(ImportStage stage);

// Called once per stage, in ImportStage order. step is 1-based.
using ImportProgressFn = std::function<void(ImportStage stage, int step, int total)>;

// Checks that every parent index is -1 or in range and that no bone is its
// own ancestor.
[[nodiscard]] bool check_bone_hierarchy(const QVector<PmxBone>& bones, ImportError* error = nullptr);

// Bone indices ordered so each parent precedes its children; otherwise in
// document order. Requires a hierarchy accepted by check_bone_hierarchy().
[[nodiscard]] QVector<int> bone_creation_order(const QVector<PmxBone>& bones);

// Builds `doc` into `target`. Geometry, weights, materials, face assignment
// and bones are mandatory and abort on the first error; constraints, morphs
// and physics skip bad elements and record warnings. Objects created before
// an error stay in the scene.
[[nodiscard]] std::optional<ImportSummary> build_scene(const PmxDocument& doc,
                                                       SceneCollaborator& target,
                                                       const ImportOptions& options,
                                                       ImportError* error = nullptr,
                                                       const ImportProgressFn& progress = {});
