#pragma once

#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

enum class LogLevels
{
	None,
	Debug,
	Info,
	Warn,
	Error,
	Fatal
};

class ILogWriter
{
public:
	ILogWriter() = default;
	virtual ~ILogWriter() = default;
	ILogWriter(const ILogWriter &) = delete;
	ILogWriter &operator=(const ILogWriter &) = delete;
	ILogWriter(ILogWriter &&) = default;
	ILogWriter &operator=(ILogWriter &&) = default;
	virtual bool ShouldWrite(const LogLevels Severity) const = 0;
	virtual void WriteEntry(const LogLevels, const std::string_view &Message) = 0;
	void WriteFatal(const std::string_view &Message) { WriteEntry(LogLevels::Fatal, Message); }

	/// @brief Writes "Activity (Item)" or "Activity (Item): ErrorMessage". The message is only assembled if Severity will be written.
	void WriteAnnotatedEntry(const LogLevels Severity, const std::string_view &Activity, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		if (!ShouldWrite(Severity))
		{
			return;
		}
		std::string Message{Activity};
		Message.append(" (").append(Item).append(1, ')');
		if (!ErrorMessage.empty())
		{
			Message.append(": ").append(ErrorMessage);
		}
		WriteEntry(Severity, Message);
	}

	void WriteDebugAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &ErrorMessage = "") { WriteAnnotatedEntry(LogLevels::Debug, Activity, Item, ErrorMessage); }
	void WriteInfoAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &ErrorMessage = "") { WriteAnnotatedEntry(LogLevels::Info, Activity, Item, ErrorMessage); }
	void WriteWarnAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &ErrorMessage = "") { WriteAnnotatedEntry(LogLevels::Warn, Activity, Item, ErrorMessage); }
	void WriteErrorAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &ErrorMessage = "") { WriteAnnotatedEntry(LogLevels::Error, Activity, Item, ErrorMessage); }
	void WriteFatalAnnotated(const std::string_view &Activity, const std::string_view &Item, const std::string_view &ErrorMessage = "") { WriteAnnotatedEntry(LogLevels::Fatal, Activity, Item, ErrorMessage); }
};

/// @brief Writes "[timestamp]: message" lines to a stream. Switches to syslog for the rest of the run if the stream stops accepting writes.
class StreamLogWriter : public ILogWriter
{
private:
	LogLevels MinimumSeverity;
	FILE *Stream;
	bool FallbackToSyslog{true};
	bool UseSyslog{false};

public:
	/// @param Stream Not owned. Must outlive the writer.
	StreamLogWriter(const LogLevels MinimumSeverity, FILE *Stream, const bool FallbackToSyslog);
	virtual ~StreamLogWriter();
	virtual bool ShouldWrite(const LogLevels Severity) const override { return Severity >= MinimumSeverity; }
	virtual void WriteEntry(const LogLevels, const std::string_view &Message) override;
	bool WritingToSyslog() const { return UseSyslog; }
};

class PassiveLogWriter : public ILogWriter
{
public:
	PassiveLogWriter() = default;
	virtual ~PassiveLogWriter() = default;
	virtual bool ShouldWrite(const LogLevels) const override { return false; }
	virtual void WriteEntry(const LogLevels, const std::string_view &) override {}
};

class LogWriterFactory
{
private:
	LogWriterFactory() = default;

public:
	/// @return A PassiveLogWriter for LogLevels::None, a StreamLogWriter otherwise
	static std::unique_ptr<ILogWriter> CreateLogWriter(const LogLevels MinimumSeverity, FILE *Stream, const bool FallbackToSyslog);
};
