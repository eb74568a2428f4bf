#pragma once
/// @file Counter.hpp
/// @brief Sample value type whose two fields are always updated together

#include <nlohmann/json.hpp>

/// @brief Pair of counters; every writer sets both to the same number
///
/// A persisted Counter with first != second would mean the file captured a
/// half-applied update.
struct Counter {
    long first = 0;
    long second = 0;

    bool consistent() const { return first == second; }
};

inline void to_json(nlohmann::json& j, const Counter& c) {
    j = nlohmann::json{{"first", c.first}, {"second", c.second}};
}

inline void from_json(const nlohmann::json& j, Counter& c) {
    j.at("first").get_to(c.first);
    j.at("second").get_to(c.second);
}
