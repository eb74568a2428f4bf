#pragma once
/// @file Settings.hpp
/// @brief Sample value type: application settings persisted as a JSON object

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

/// @brief Settings of a fictional media player
struct Settings {
    std::string user;                    ///< profile name
    int volume = 50;                     ///< 0..100
    double playbackRate = 1.0;           ///< speed multiplier
    std::vector<std::string> recent;     ///< recently opened files, newest last
    std::map<std::string, bool> plugins; ///< plugin name -> enabled

    bool operator==(const Settings& o) const {
        return user == o.user && volume == o.volume && playbackRate == o.playbackRate &&
               recent == o.recent && plugins == o.plugins;
    }
    bool operator!=(const Settings& o) const { return !(*this == o); }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Settings, user, volume, playbackRate, recent, plugins)
