#include "gameConfig.hpp"
#include <raymath.h>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace
{
    constexpr char gradientKey[] = "gradient";

    std::string Trim(const std::string &s)
    {
        size_t first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos)
            return "";
        size_t last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    bool ApplyValue(ConfigParam &p, const std::string &text)
    {
        size_t used = 0;
        if (p.floatPtr)
        {
            float v = std::stof(text, &used);
            if (used != text.size() || !std::isfinite(v))
                return false;
            *p.floatPtr = v;
        }
        else if (p.intPtr)
        {
            int v = std::stoi(text, &used);
            if (used != text.size())
                return false;
            *p.intPtr = v;
        }
        return true;
    }
}

std::vector<ConfigParam> GetConfigParams(GameConfig &cfg)
{
    std::vector<ConfigParam> params;
    params.push_back({"gridSize", nullptr, &cfg.gridSize});
    params.push_back({"poolSmall", nullptr, &cfg.poolSizes[0]});
    params.push_back({"poolMedium", nullptr, &cfg.poolSizes[1]});
    params.push_back({"poolLarge", nullptr, &cfg.poolSizes[2]});
    params.push_back({"spawnWaitTime", &cfg.spawnWaitTime, nullptr});
    params.push_back({"spawnSpeed", &cfg.spawnSpeed, nullptr});
    params.push_back({"spawnAnimationTime", &cfg.spawnAnimationTime, nullptr});
    params.push_back({"plainDeathAnimationTime", &cfg.plainDeathAnimationTime, nullptr});
    params.push_back({"coloredDeathAnimationTime", &cfg.coloredDeathAnimationTime, nullptr});
    params.push_back({"hitAnimationTime", &cfg.hitAnimationTime, nullptr});
    params.push_back({"orbitSpeed", &cfg.orbitSpeed, nullptr});
    return params;
}

void ClampConfig(GameConfig &cfg)
{
    // NaN and infinity fall back to the compiled-in default
    GameConfig defaults{};
    auto params = GetConfigParams(cfg);
    auto defaultParams = GetConfigParams(defaults);
    for (size_t i = 0; i < params.size(); i++)
    {
        if (params[i].floatPtr && !std::isfinite(*params[i].floatPtr))
            *params[i].floatPtr = *defaultParams[i].floatPtr;
    }

    if (cfg.gridSize < 0)
        cfg.gridSize = 0;
    if (cfg.gridSize > MAX_GRID_SIZE)
        cfg.gridSize = MAX_GRID_SIZE;
    for (int &size : cfg.poolSizes)
    {
        if (size < 0)
            size = 0;
    }
    cfg.spawnWaitTime = Clamp(cfg.spawnWaitTime, 0.0f, MAX_SPAWN_SLIDER);
    cfg.spawnSpeed = Clamp(cfg.spawnSpeed, 0.0f, MAX_SPAWN_SLIDER);
    cfg.spawnAnimationTime = fmaxf(cfg.spawnAnimationTime, 0.0f);
    cfg.plainDeathAnimationTime = fmaxf(cfg.plainDeathAnimationTime, 0.0f);
    cfg.coloredDeathAnimationTime = fmaxf(cfg.coloredDeathAnimationTime, 0.0f);
    cfg.hitAnimationTime = fmaxf(cfg.hitAnimationTime, 0.0f);
}

bool LoadConfig(const std::string &path, GameConfig &cfg)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        TraceLog(LOG_WARNING, "Config file %s not found, using defaults", path.c_str());
        return false;
    }

    auto params = GetConfigParams(cfg);
    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
            continue;

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            TraceLog(LOG_WARNING, "%s:%d: expected key=value", path.c_str(), lineNumber);
            continue;
        }
        std::string key = Trim(trimmed.substr(0, eq));
        std::string value = Trim(trimmed.substr(eq + 1));

        if (key == gradientKey)
        {
            if (!cfg.healthGradient.fromString(value))
                TraceLog(LOG_WARNING, "%s:%d: bad gradient '%s'", path.c_str(), lineNumber, value.c_str());
            continue;
        }

        bool known = false;
        for (auto &p : params)
        {
            if (p.name != key)
                continue;
            known = true;
            try
            {
                if (!ApplyValue(p, value))
                    TraceLog(LOG_WARNING, "%s:%d: '%s' is not a finite number", path.c_str(), lineNumber, value.c_str());
            }
            catch (const std::invalid_argument &)
            {
                TraceLog(LOG_WARNING, "%s:%d: '%s' is not a number", path.c_str(), lineNumber, value.c_str());
            }
            catch (const std::out_of_range &)
            {
                TraceLog(LOG_WARNING, "%s:%d: '%s' is out of range", path.c_str(), lineNumber, value.c_str());
            }
            break;
        }
        if (!known)
            TraceLog(LOG_WARNING, "%s:%d: unknown key '%s'", path.c_str(), lineNumber, key.c_str());
    }

    ClampConfig(cfg);
    TraceLog(LOG_INFO, "Config loaded from %s", path.c_str());
    return true;
}

bool SaveConfig(const std::string &path, const GameConfig &cfg)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        TraceLog(LOG_WARNING, "Could not write config to %s", path.c_str());
        return false;
    }

    auto params = GetConfigParams(const_cast<GameConfig &>(cfg));
    for (const auto &p : params)
    {
        if (p.floatPtr)
            file << p.name << "=" << *p.floatPtr << "\n";
        else if (p.intPtr)
            file << p.name << "=" << *p.intPtr << "\n";
    }
    file << gradientKey << "=" << cfg.healthGradient.toString() << "\n";
    TraceLog(LOG_INFO, "Config saved to %s", path.c_str());
    return true;
}
