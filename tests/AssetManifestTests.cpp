#include <gtest/gtest.h>

#include "Assets/AssetManifest.h"

namespace {

TEST(AssetManifestTests, ParsesTexturesAndFonts) {
    AssetManifest manifest;
    ASSERT_TRUE(manifest.loadFromString(
        "# backgrounds\n"
        "texture bg_medieval assets/bg_medieval.png\n"
        "font ui_font assets/ui.ttf 20\n"
        "\n"));

    ASSERT_NE(manifest.texturePath("bg_medieval"), nullptr);
    EXPECT_EQ(*manifest.texturePath("bg_medieval"), "assets/bg_medieval.png");

    const FontDef *font = manifest.fontDef("ui_font");
    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->path, "assets/ui.ttf");
    EXPECT_EQ(font->size, 20);
    EXPECT_EQ(manifest.invalidLines(), 0);
}

TEST(AssetManifestTests, CountsInvalidLines) {
    AssetManifest manifest;
    manifest.loadFromString(
        "texture only_id\n"
        "font title assets/title.ttf 0\n"
        "sound jump assets/jump.wav\n"
        "font ok assets/ok.ttf 12\n");

    EXPECT_EQ(manifest.invalidLines(), 3);
    EXPECT_EQ(manifest.textureCount(), 0u);
    EXPECT_EQ(manifest.fontCount(), 1u);
    EXPECT_EQ(manifest.fontDef("title"), nullptr);
}

TEST(AssetManifestTests, ReloadReplacesEntries) {
    AssetManifest manifest;
    manifest.loadFromString("texture a a.png\n");
    manifest.loadFromString("texture b b.png\n");
    EXPECT_EQ(manifest.texturePath("a"), nullptr);
    EXPECT_NE(manifest.texturePath("b"), nullptr);
}

TEST(AssetManifestTests, MissingFileFails) {
    AssetManifest manifest;
    EXPECT_FALSE(manifest.loadFromFile("does/not/exist.txt"));
    EXPECT_EQ(manifest.textureCount(), 0u);
}

} // namespace
