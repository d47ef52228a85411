#pragma once

#include "util/server_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace staticfs::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, ServerConfig& cfg, std::string& err);

} // namespace staticfs::config::detail
