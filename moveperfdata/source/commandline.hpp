#pragma once

#include <optional>
#include <string>
#include "logwriter.hpp"
#include "perfdatarouter.hpp"

struct RouteRequest
{
	PerfdataCategory Category{PerfdataCategory::Host};
	std::string Timestamp{};
};

namespace CommandLine
{
	/// @brief Validates "-c <host|service> -t <timestamp>". Every rejection is written to Log at fatal severity.
	/// @return The request, or std::nullopt on any usage error
	std::optional<RouteRequest> Parse(int argc, char *argv[], ILogWriter &Log);
}
