#pragma once
#include <string>
#include <unordered_map>

struct FontDef
{
    std::string path;
    int size = 0;
};

// assets/manifest.txt:
//   texture <id> <path>
//   font <id> <path> <size>
class AssetManifest
{
public:
    bool loadFromFile(const std::string &path);
    bool loadFromString(const std::string &text);

    const std::string *texturePath(const std::string &id) const;
    const FontDef *fontDef(const std::string &id) const;

    std::size_t textureCount() const { return textures_.size(); }
    std::size_t fontCount() const { return fonts_.size(); }
    int invalidLines() const { return invalidLines_; }

private:
    std::unordered_map<std::string, std::string> textures_;
    std::unordered_map<std::string, FontDef> fonts_;
    int invalidLines_ = 0;
};
