#include "SaveManager.h"
#include <openssl/evp.h>
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static const char *kSuspendMarker = ".suspend_cleanup";

const char *SaveTypeName(SaveType type)
{
    switch (type)
    {
    case SaveType::Manual:
        return "manual";
    case SaveType::Checkpoint:
        return "checkpoint";
    case SaveType::Suspend:
        return "suspend";
    }
    return "manual";
}

std::optional<SaveType> ParseSaveType(const std::string &name)
{
    if (name == "manual")
        return SaveType::Manual;
    if (name == "checkpoint")
        return SaveType::Checkpoint;
    if (name == "suspend")
        return SaveType::Suspend;
    return std::nullopt;
}

static std::string CurrentTimestamp()
{
    std::time_t now = std::time(nullptr);
    char buf[32] = {};
    if (const std::tm *local = std::localtime(&now))
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", local);
    return buf;
}

// "save_checkpoint_2.json" -> (Checkpoint, 2)
static bool ParseSaveFileName(const std::string &name, SaveType &type, int &slot)
{
    const std::string prefix = "save_";
    const std::string suffix = ".json";
    if (name.size() <= prefix.size() + suffix.size() ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
        return false;

    std::string core = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    std::size_t sep = core.rfind('_');
    if (sep == std::string::npos)
        return false;

    auto parsed = ParseSaveType(core.substr(0, sep));
    if (!parsed)
        return false;

    // slot fora do alcance de int: arquivo estranho, nao e save nosso
    const std::string digits = core.substr(sep + 1);
    int value = 0;
    const char *first = digits.data();
    const char *last = digits.data() + digits.size();
    auto [end, ec] = std::from_chars(first, last, value);
    if (digits.empty() || ec != std::errc{} || end != last || value < 0)
        return false;

    type = *parsed;
    slot = value;
    return true;
}

SaveManager::SaveManager(fs::path saveDir)
    : dir_(std::move(saveDir))
{
    ensureDirectory();

    // continua o rodizio depois do checkpoint mais novo
    std::error_code ec;
    fs::file_time_type newest{};
    int newestSlot = -1;
    for (const auto &entry : fs::directory_iterator(dir_, ec))
    {
        SaveType type;
        int slot = 0;
        if (!ParseSaveFileName(entry.path().filename().string(), type, slot) || type != SaveType::Checkpoint)
            continue;

        std::error_code timeEc;
        auto t = fs::last_write_time(entry.path(), timeEc);
        if (timeEc)
            continue;
        if (newestSlot < 0 || t > newest)
        {
            newest = t;
            newestSlot = slot;
        }
    }
    if (newestSlot >= 0)
        nextCheckpointSlot_ = (newestSlot + 1) % kCheckpointSlots;
}

bool SaveManager::ensureDirectory() const
{
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
    {
        std::printf("SaveManager: cannot create '%s': %s\n", dir_.string().c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

fs::path SaveManager::pathFor(SaveType type, int slot) const
{
    return dir_ / ("save_" + std::string(SaveTypeName(type)) + "_" + std::to_string(slot) + ".json");
}

std::string SaveManager::Checksum(const nlohmann::json &gameData)
{
    const std::string text = gameData.dump();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(text.data(), text.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1)
    {
        std::printf("SaveManager: SHA-256 failed\n");
        return {};
    }

    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i)
    {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

nlohmann::json SaveManager::ToJson(const GameSnapshot &snapshot)
{
    nlohmann::json data;
    data["player"] = {
        {"x", snapshot.player.x},
        {"y", snapshot.player.y},
        {"health", snapshot.player.health},
        {"stamina", snapshot.player.stamina},
        {"era", EraName(snapshot.player.era)}};
    data["state"] = {
        {"level_index", snapshot.world.levelIndex},
        {"checkpoint_index", snapshot.world.checkpointIndex},
        {"enemies_defeated", snapshot.world.enemiesDefeated},
        {"current_era", EraName(snapshot.player.era)}};
    data["timestamp"] = snapshot.timestamp;
    data["save_type"] = snapshot.saveType;
    return data;
}

std::optional<GameSnapshot> SaveManager::FromJson(const nlohmann::json &gameData)
{
    try
    {
        const auto &player = gameData.at("player");
        const auto &state = gameData.at("state");

        GameSnapshot snap;
        snap.player.x = player.at("x").get<float>();
        snap.player.y = player.at("y").get<float>();
        snap.player.health = player.at("health").get<int>();
        snap.player.stamina = player.at("stamina").get<float>();
        if (!ParseEra(player.at("era").get<std::string>(), snap.player.era))
        {
            std::printf("SaveManager: unknown era '%s'\n", player.at("era").get<std::string>().c_str());
            return std::nullopt;
        }

        snap.world.levelIndex = state.at("level_index").get<int>();
        snap.world.checkpointIndex = state.at("checkpoint_index").get<int>();
        snap.world.enemiesDefeated = state.at("enemies_defeated").get<int>();

        snap.timestamp = gameData.value("timestamp", std::string());
        snap.saveType = gameData.value("save_type", std::string());
        return snap;
    }
    catch (const nlohmann::json::exception &e)
    {
        std::printf("SaveManager: malformed game_data: %s\n", e.what());
        return std::nullopt;
    }
}

bool SaveManager::saveGame(const GameSnapshot &snapshot, SaveType type, int slot)
{
    if (!ensureDirectory())
        return false;

    GameSnapshot stamped = snapshot;
    stamped.timestamp = CurrentTimestamp();
    stamped.saveType = SaveTypeName(type);

    nlohmann::json file;
    file["game_data"] = ToJson(stamped);
    file["checksum"] = Checksum(file["game_data"]);

    const fs::path path = pathFor(type, slot);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        std::printf("SaveManager: failed to open '%s' for writing\n", path.string().c_str());
        return false;
    }

    out << file.dump(2);
    if (!out.good())
    {
        std::printf("SaveManager: write failed for '%s'\n", path.string().c_str());
        return false;
    }

    std::printf("SaveManager: saved %s\n", path.filename().string().c_str());
    return true;
}

std::optional<nlohmann::json> SaveManager::readVerified(const fs::path &path) const
{
    std::ifstream in(path);
    if (!in.is_open())
        return std::nullopt;

    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json file = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (file.is_discarded() || !file.is_object())
    {
        std::printf("SaveManager: '%s' is not valid JSON\n", path.filename().string().c_str());
        return std::nullopt;
    }

    auto data = file.find("game_data");
    auto checksum = file.find("checksum");
    if (data == file.end() || checksum == file.end() || !checksum->is_string())
    {
        std::printf("SaveManager: '%s' is missing game_data or checksum\n", path.filename().string().c_str());
        return std::nullopt;
    }

    if (Checksum(*data) != checksum->get<std::string>())
    {
        std::printf("SaveManager: checksum mismatch in '%s'\n", path.filename().string().c_str());
        return std::nullopt;
    }

    return *data;
}

std::optional<GameSnapshot> SaveManager::loadGame(SaveType type, int slot) const
{
    const fs::path path = pathFor(type, slot);

    std::error_code ec;
    if (!fs::exists(path, ec))
        return std::nullopt;

    if (auto data = readVerified(path))
    {
        if (auto snap = FromJson(*data))
            return snap;
    }

    std::printf("SaveManager: save corruption detected, trying checkpoints\n");
    return loadFallback();
}

std::optional<GameSnapshot> SaveManager::loadFallback() const
{
    struct Candidate
    {
        fs::path path;
        fs::file_time_type time;
    };
    std::vector<Candidate> candidates;

    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(dir_, ec))
    {
        SaveType type;
        int slot = 0;
        if (!ParseSaveFileName(entry.path().filename().string(), type, slot) || type != SaveType::Checkpoint)
            continue;

        std::error_code timeEc;
        auto t = fs::last_write_time(entry.path(), timeEc);
        if (!timeEc)
            candidates.push_back({entry.path(), t});
    }
    if (ec)
        std::printf("SaveManager: cannot list '%s': %s\n", dir_.string().c_str(), ec.message().c_str());

    std::sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b)
              { return a.time > b.time; });

    for (const auto &c : candidates)
    {
        auto data = readVerified(c.path);
        if (!data)
            continue;
        if (auto snap = FromJson(*data))
        {
            std::printf("SaveManager: recovered from %s\n", c.path.filename().string().c_str());
            return snap;
        }
    }

    std::printf("SaveManager: no valid checkpoint to fall back to\n");
    return std::nullopt;
}

bool SaveManager::createCheckpoint(const GameSnapshot &snapshot)
{
    if (!saveGame(snapshot, SaveType::Checkpoint, nextCheckpointSlot_))
        return false;
    nextCheckpointSlot_ = (nextCheckpointSlot_ + 1) % kCheckpointSlots;
    return true;
}

bool SaveManager::createSuspendSave(const GameSnapshot &snapshot)
{
    if (!saveGame(snapshot, SaveType::Suspend, 0))
        return false;

    // removido no proximo carregamento
    std::ofstream marker(dir_ / kSuspendMarker, std::ios::trunc);
    if (!marker.is_open())
    {
        std::printf("SaveManager: failed to write suspend marker\n");
        return true;
    }
    marker << CurrentTimestamp();
    return true;
}

void SaveManager::cleanupSuspendSave()
{
    std::error_code ec;
    fs::remove(pathFor(SaveType::Suspend, 0), ec);
    if (ec)
        std::printf("SaveManager: cannot remove suspend save: %s\n", ec.message().c_str());

    ec.clear();
    fs::remove(dir_ / kSuspendMarker, ec);
    if (ec)
        std::printf("SaveManager: cannot remove suspend marker: %s\n", ec.message().c_str());
}

bool SaveManager::hasSuspendSave() const
{
    std::error_code ec;
    return fs::exists(pathFor(SaveType::Suspend, 0), ec);
}

bool SaveManager::suspendCleanupPending() const
{
    std::error_code ec;
    return fs::exists(dir_ / kSuspendMarker, ec);
}

SaveListing SaveManager::listSaveFiles() const
{
    SaveListing listing;

    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(dir_, ec))
    {
        SaveFileInfo info;
        if (!ParseSaveFileName(entry.path().filename().string(), info.type, info.slot))
            continue;
        info.path = entry.path();

        auto data = readVerified(entry.path());
        if (!data)
            continue;
        info.timestamp = data->value("timestamp", std::string());
        auto state = data->find("state");
        info.era = (state != data->end() && state->is_object())
                       ? state->value("current_era", std::string("unknown"))
                       : std::string("unknown");

        switch (info.type)
        {
        case SaveType::Manual:
            listing.manual.push_back(info);
            break;
        case SaveType::Checkpoint:
            listing.checkpoint.push_back(info);
            break;
        case SaveType::Suspend:
            listing.suspend.push_back(info);
            break;
        }
    }
    if (ec)
        std::printf("SaveManager: cannot list '%s': %s\n", dir_.string().c_str(), ec.message().c_str());

    auto bySlot = [](const SaveFileInfo &a, const SaveFileInfo &b)
    { return a.slot < b.slot; };
    std::sort(listing.manual.begin(), listing.manual.end(), bySlot);
    std::sort(listing.checkpoint.begin(), listing.checkpoint.end(), bySlot);
    std::sort(listing.suspend.begin(), listing.suspend.end(), bySlot);
    return listing;
}
