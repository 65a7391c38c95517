#pragma once
#include <string>
#include "core/config.hpp"

namespace tbn {

// Loads YAML at 'path', applies defaults, validates, throws on error
RunnerConfig LoadConfigFromYamlFile(const std::string& path);

// Same as above for an in-memory document
RunnerConfig LoadConfigFromYamlString(const std::string& yaml);

// Throws error if config is invalid
void ValidateOrThrow(const RunnerConfig& cfg);

}
