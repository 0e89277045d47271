#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include "config_constants.hpp"
#include "logwriter.hpp"

struct SpoolPaths
{
	std::filesystem::path LiveBaseDirectory{ConfigConstants::DefaultValues::liveBaseDirectory};
	std::filesystem::path SpoolADirectory{ConfigConstants::DefaultValues::spoolADirectory}; // copy target
	std::filesystem::path SpoolBDirectory{ConfigConstants::DefaultValues::spoolBDirectory}; // move target
};

class Configuration
{
public:
	LogLevels LogLevel{LogLevels::Warn};
	bool SyslogFallback{ConfigConstants::DefaultValues::syslogFallback};
	SpoolPaths Paths{};

	Configuration() = default;
	~Configuration() = default;

	/// @brief Loads the configuration from disk, if available. Otherwise, loads defaults. Generates a log writer based on the loaded configuration.
	/// @param ConfigFile TOML file to read. A missing file is not an error.
	/// @param LogStream Stream the generated log writer writes to.
	/// @return std::unique_ptr<ILogWriter> The log writer to use for the duration of the program.
	std::unique_ptr<ILogWriter> Load(const std::filesystem::path &ConfigFile = std::filesystem::path{ConfigConstants::ConfigFilePath}, FILE *LogStream = stderr);
};
