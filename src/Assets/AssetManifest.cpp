#include "AssetManifest.h"
#include <cstdio>
#include <fstream>
#include <sstream>

static bool IsCommentOrEmpty(const std::string &line)
{
    for (char c : line)
    {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
            continue;
        return (c == '#' || c == ';');
    }
    return true;
}

bool AssetManifest::loadFromFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::printf("AssetManifest: failed to open '%s'\n", path.c_str());
        textures_.clear();
        fonts_.clear();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

bool AssetManifest::loadFromString(const std::string &text)
{
    textures_.clear();
    fonts_.clear();
    invalidLines_ = 0;

    std::istringstream input(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line))
    {
        lineNumber++;
        if (IsCommentOrEmpty(line))
            continue;

        std::istringstream iss(line);
        std::string type;
        iss >> type;
        if (type == "texture")
        {
            std::string id;
            std::string filePath;
            iss >> id >> filePath;
            if (id.empty() || filePath.empty())
            {
                std::printf("AssetManifest: invalid texture line %d\n", lineNumber);
                invalidLines_++;
                continue;
            }
            textures_[id] = filePath;
        }
        else if (type == "font")
        {
            std::string id;
            std::string filePath;
            int size = 0;
            iss >> id >> filePath >> size;
            if (id.empty() || filePath.empty() || size <= 0)
            {
                std::printf("AssetManifest: invalid font line %d\n", lineNumber);
                invalidLines_++;
                continue;
            }
            fonts_[id] = FontDef{filePath, size};
        }
        else
        {
            std::printf("AssetManifest: unknown entry '%s' on line %d\n", type.c_str(), lineNumber);
            invalidLines_++;
        }
    }

    return true;
}

const std::string *AssetManifest::texturePath(const std::string &id) const
{
    auto it = textures_.find(id);
    if (it == textures_.end())
        return nullptr;
    return &it->second;
}

const FontDef *AssetManifest::fontDef(const std::string &id) const
{
    auto it = fonts_.find(id);
    if (it == fonts_.end())
        return nullptr;
    return &it->second;
}
