#include <gtest/gtest.h>

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include "rig/import_options.h"

namespace {
QString settings_path(const QTemporaryDir& dir) {
  return QDir(dir.path()).filePath("rigfu.ini");
}
}  // namespace

TEST(import_options, missing_settings_give_defaults) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QSettings settings(settings_path(dir), QSettings::IniFormat);

  QString err = "stale";
  const ImportOptions opts = load_import_options(settings, &err);
  EXPECT_TRUE(err.isEmpty());
  EXPECT_FLOAT_EQ(opts.scale, 1.0f);
  EXPECT_TRUE(opts.import_physics);
  EXPECT_TRUE(opts.import_morphs);
  EXPECT_TRUE(opts.z_up);
}

TEST(import_options, saved_options_load_back) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());

  ImportOptions saved;
  saved.scale = 0.08f;
  saved.import_physics = false;
  saved.z_up = false;
  {
    QSettings settings(settings_path(dir), QSettings::IniFormat);
    QString err;
    ASSERT_TRUE(save_import_options(settings, saved, &err)) << err.toStdString();
  }

  const QSettings settings(settings_path(dir), QSettings::IniFormat);
  QString err;
  const ImportOptions loaded = load_import_options(settings, &err);
  EXPECT_TRUE(err.isEmpty());
  EXPECT_FLOAT_EQ(loaded.scale, 0.08f);
  EXPECT_FALSE(loaded.import_physics);
  EXPECT_TRUE(loaded.import_morphs);
  EXPECT_FALSE(loaded.z_up);
}

TEST(import_options, invalid_json_falls_back_to_defaults) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  QSettings settings(settings_path(dir), QSettings::IniFormat);
  settings.setValue("import/optionsJson", "{not json");

  QString err;
  const ImportOptions opts = load_import_options(settings, &err);
  EXPECT_FALSE(err.isEmpty());
  EXPECT_FLOAT_EQ(opts.scale, 1.0f);
  EXPECT_TRUE(opts.import_physics);
}

TEST(import_options, rejects_other_versions_and_bad_scale) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  QSettings settings(settings_path(dir), QSettings::IniFormat);

  settings.setValue("import/optionsJson", R"({"version":2,"scale":3.0,"importPhysics":false})");
  QString err;
  ImportOptions opts = load_import_options(settings, &err);
  EXPECT_TRUE(err.contains("version"));
  EXPECT_FLOAT_EQ(opts.scale, 1.0f);
  EXPECT_TRUE(opts.import_physics);

  settings.setValue("import/optionsJson", R"({"version":1,"scale":-2.0})");
  opts = load_import_options(settings, &err);
  EXPECT_TRUE(err.contains("scale"));
  EXPECT_FLOAT_EQ(opts.scale, 1.0f);
}
