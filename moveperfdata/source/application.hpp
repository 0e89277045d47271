#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include "config.hpp"
#include "config_constants.hpp"
#include "logwriter.hpp"

class Application
{
private:
	Configuration Config{};
	std::unique_ptr<ILogWriter> Log{nullptr};

public:
	Application() = default;
	~Application() = default;
	Application(const Application &) = delete;
	Application &operator=(const Application &) = delete;
	Application(Application &&) = default;
	Application &operator=(Application &&) = default;

	/// @brief Loads the configuration, validates the arguments and routes one category's perfdata.
	/// @return One of ConfigConstants::ExitCodes
	int Run(int argc, char *argv[], const std::filesystem::path &ConfigFile = std::filesystem::path{ConfigConstants::ConfigFilePath}, FILE *LogStream = stderr);
};
