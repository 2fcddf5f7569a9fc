#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrappers that expose `nlohmann::json` as `json` and the
 * insertion ordered variant as `ordered_json`.
 */
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;
