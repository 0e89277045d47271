#include <cstdio>
#include <filesystem>
#include "application.hpp"
#include "commandline.hpp"
#include "config_constants.hpp"
#include "perfdatarouter.hpp"

int Application::Run(int argc, char *argv[], const std::filesystem::path &ConfigFile, FILE *LogStream)
{
	Log = Config.Load(ConfigFile, LogStream);

	auto Request{CommandLine::Parse(argc, argv, *Log)};
	if (!Request.has_value())
	{
		return ConfigConstants::ExitCodes::UsageError;
	}

	PerfdataRouter Router{*Log, Config.Paths};
	return Router.Route(Request->Category, Request->Timestamp).Succeeded() ? ConfigConstants::ExitCodes::Success : ConfigConstants::ExitCodes::RoutingFailed;
}
