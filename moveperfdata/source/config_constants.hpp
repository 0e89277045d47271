#pragma once

#define __MOVEPERF_PACKAGE_NAME__ "moveperfdata"

#include <string>
#include <string_view>

namespace ConfigConstants
{
	constexpr const std::string_view appname{__MOVEPERF_PACKAGE_NAME__ "\0"}; // used in C APIs, do not assume NUL-termination
	constexpr const std::string_view ConfigFilePath{"/etc/" __MOVEPERF_PACKAGE_NAME__ "/" __MOVEPERF_PACKAGE_NAME__ ".toml"};

	namespace Headers
	{
		constexpr const std::string_view logging{"logging"};
		constexpr const std::string_view paths{"paths"};
	};

	namespace Fields
	{
		constexpr const std::string_view level{"level"};
		constexpr const std::string_view syslogFallback{"syslog_fallback"};
		constexpr const std::string_view liveBaseDirectory{"live_base_directory"};
		constexpr const std::string_view spoolADirectory{"spool_a_directory"};
		constexpr const std::string_view spoolBDirectory{"spool_b_directory"};
	};

	namespace Values
	{
		constexpr const std::string_view debug{"debug"};
		constexpr const std::string_view info{"info"};
		constexpr const std::string_view warn{"warn"};
		constexpr const std::string_view error{"error"};
		constexpr const std::string_view fatal{"fatal"};
	};

	namespace DefaultValues
	{
		constexpr const std::string_view logLevel{Values::warn};
		constexpr const bool syslogFallback{true};
		constexpr const std::string_view liveBaseDirectory{"/opt/monitor/var"};
		constexpr const std::string_view spoolADirectory{"/opt/monitor/var/nagfluxspool/perfdata"}; // nagflux, receives a copy
		constexpr const std::string_view spoolBDirectory{"/opt/monitor/var/spool/perfdata"};		 // pnp, receives the snapshot itself
	};

	namespace ExitCodes
	{
		constexpr const int Success{0};
		constexpr const int UsageError{1};
		constexpr const int RoutingFailed{2};
	};
}
