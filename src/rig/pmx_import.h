#pragma once

#include <QString>

#include <optional>

#include "formats/import_error.h"
#include "rig/import_options.h"
#include "rig/scene_collaborator.h"
#include "rig/scene_reconstructor.h"

// Reads, decodes and reconstructs a PMX file into `scene`. There is no
// rollback: on failure, objects created by completed passes stay in the scene.
[[nodiscard]] std::optional<ImportSummary> import_pmx_file(const QString& file_path,
                                                           const ImportOptions& options,
                                                           SceneCollaborator& scene,
                                                           ImportError* error = nullptr,
                                                           const ImportProgressFn& progress = {});
