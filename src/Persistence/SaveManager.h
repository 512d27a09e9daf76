#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../Game/GameSnapshot.h"

enum class SaveType
{
    Manual,
    Checkpoint,
    Suspend
};

const char *SaveTypeName(SaveType type);
std::optional<SaveType> ParseSaveType(const std::string &name);

struct SaveFileInfo
{
    SaveType type = SaveType::Manual;
    int slot = 0;
    std::string timestamp;
    std::string era;
    std::filesystem::path path;
};

struct SaveListing
{
    std::vector<SaveFileInfo> manual;
    std::vector<SaveFileInfo> checkpoint;
    std::vector<SaveFileInfo> suspend;
};

// Arquivos save_<tipo>_<slot>.json = { "game_data": {...}, "checksum": sha256(game_data) }
class SaveManager
{
public:
    static constexpr int kCheckpointSlots = 3;

    explicit SaveManager(std::filesystem::path saveDir);

    bool saveGame(const GameSnapshot &snapshot, SaveType type, int slot = 0);

    // Checksum invalido: tenta o checkpoint valido mais recente (mtime)
    std::optional<GameSnapshot> loadGame(SaveType type, int slot = 0) const;

    // slots 0..kCheckpointSlots-1 em rodizio
    bool createCheckpoint(const GameSnapshot &snapshot);

    bool createSuspendSave(const GameSnapshot &snapshot);
    void cleanupSuspendSave();
    bool hasSuspendSave() const;
    bool suspendCleanupPending() const;

    SaveListing listSaveFiles() const;

    std::filesystem::path pathFor(SaveType type, int slot) const;
    const std::filesystem::path &directory() const { return dir_; }
    int nextCheckpointSlot() const { return nextCheckpointSlot_; }

    static nlohmann::json ToJson(const GameSnapshot &snapshot);
    static std::optional<GameSnapshot> FromJson(const nlohmann::json &gameData);
    static std::string Checksum(const nlohmann::json &gameData);

private:
    bool ensureDirectory() const;
    std::optional<nlohmann::json> readVerified(const std::filesystem::path &path) const;
    std::optional<GameSnapshot> loadFallback() const;

private:
    std::filesystem::path dir_;
    int nextCheckpointSlot_ = 0;
};
