#include <array>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include <syslog.h>
#include "config_constants.hpp"
#include "logwriter.hpp"
#include "utility.hpp"

struct SyslogMapping
{
	LogLevels Severity;
	std::string_view Tag;
	int Priority;
};

static constexpr std::array<SyslogMapping, 5> SyslogMappings{{{LogLevels::Debug, "[DEBUG]", LOG_DEBUG},
																				  {LogLevels::Info, "[INFO]", LOG_INFO},
																				  {LogLevels::Warn, "[WARN]", LOG_WARNING},
																				  {LogLevels::Error, "[ERROR]", LOG_ERR},
																				  {LogLevels::Fatal, "[FATAL]", LOG_CRIT}}};

// anything unmapped goes out as info
static const SyslogMapping &GetSyslogMapping(const LogLevels Severity)
{
	for (const auto &Mapping : SyslogMappings)
	{
		if (Mapping.Severity == Severity)
		{
			return Mapping;
		}
	}
	return SyslogMappings[1];
}

static void WriteToSysLog(const std::string_view &Message, const LogLevels Severity)
{
	const SyslogMapping &Mapping{GetSyslogMapping(Severity)};
	std::string TaggedMessage{Mapping.Tag};
	TaggedMessage.append(1, ' ').append(Message);
	syslog(Mapping.Priority, "%s", TaggedMessage.c_str());
}

StreamLogWriter::StreamLogWriter(const LogLevels MinimumSeverity, FILE *Stream, const bool FallbackToSyslog)
	 : MinimumSeverity(MinimumSeverity),
		Stream{Stream},
		FallbackToSyslog{FallbackToSyslog}
{
}

StreamLogWriter::~StreamLogWriter()
{
	if (UseSyslog)
	{
		closelog();
	}
	else if (Stream != nullptr)
	{
		std::fflush(Stream);
	}
}

void StreamLogWriter::WriteEntry(const LogLevels Severity, const std::string_view &Message)
{
	if (!ShouldWrite(Severity))
	{
		return;
	}

	if (!UseSyslog)
	{
		std::string Line{"["};
		Line.append(Utility::GetIsoTimestamp(std::time(nullptr))).append("]: ").append(Message).append(1, '\n');
		if (Stream != nullptr && std::fputs(Line.c_str(), Stream) != EOF && std::fflush(Stream) == 0)
		{
			return;
		}
		if (!FallbackToSyslog)
		{
			return;
		}
		// appname carries its own terminator, openlog keeps the pointer
		openlog(ConfigConstants::appname.data(), LOG_PID, LOG_USER);
		UseSyslog = true;
	}
	WriteToSysLog(Message, Severity);
}

std::unique_ptr<ILogWriter> LogWriterFactory::CreateLogWriter(const LogLevels MinimumSeverity, FILE *Stream, const bool FallbackToSyslog)
{
	if (MinimumSeverity != LogLevels::None)
	{
		return std::make_unique<StreamLogWriter>(MinimumSeverity, Stream, FallbackToSyslog);
	}
	return std::make_unique<PassiveLogWriter>();
}
