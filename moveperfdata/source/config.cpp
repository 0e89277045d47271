#include <concepts>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include "config_constants.hpp"
#include "config.hpp"
#include "logwriter.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

constexpr const std::string_view ConfigurationLoaded{"Configuration loaded"};
constexpr const std::string_view ParseConfigFile{"Unable to parse configuration file"};
constexpr const std::string_view LocateConfigFile{"Unable to locate configuration file"};
constexpr const std::string_view UnknownLogLevel{"Unknown log level, using default"};

// log levels
static const std::map<const std::string_view, const LogLevels> LogLevelsMap{
	 {ConfigConstants::Values::debug, LogLevels::Debug},
	 {ConfigConstants::Values::info, LogLevels::Info},
	 {ConfigConstants::Values::warn, LogLevels::Warn},
	 {ConfigConstants::Values::error, LogLevels::Error},
	 {ConfigConstants::Values::fatal, LogLevels::Fatal}};

template <typename T>
concept has_size = requires(T t) {
	{ t.size() } -> std::convertible_to<std::size_t>;
};

template <typename T>
bool HasUsableValue(const T &Value)
{
	if constexpr (std::is_class_v<T>)
	{
		if constexpr (has_size<T>)
		{
			return Value.size() > 0;
		}
		else if constexpr (std::is_same_v<T, std::optional<typename T::value_type>>)
		{
			return Value.has_value() && HasUsableValue(Value.value());
		}
		else
		{
			static_assert(sizeof(T) == 0, "Unsupported type");
		}
	}
	else
	{
		return true; // a primitive read from the file is always usable
	}
	return false;
}

template <typename ReturnType>
	requires(!std::is_class_v<ReturnType>)
static ReturnType GetConfigurationValueOrDefault(const toml::table &TomlTable, const std::string_view &KeyName, ReturnType DefaultValue)
{
	auto OptVal{TomlTable[KeyName].value<ReturnType>()};
	return HasUsableValue(OptVal) ? OptVal.value() : DefaultValue;
}

static std::string GetConfigurationValueOrDefault(const toml::table &TomlTable, const std::string_view &KeyName, const std::string_view &DefaultValue)
{
	auto OptVal{TomlTable[KeyName].value<std::string>()};
	return HasUsableValue(OptVal) ? OptVal.value() : std::string{DefaultValue};
}

static const toml::table &GetSubTable(const toml::table &TomlConfig, const std::string_view &Header)
{
	static const toml::table EmptyTable{};
	const toml::table *SubTable{TomlConfig[Header].as_table()};
	return SubTable != nullptr ? *SubTable : EmptyTable;
}

std::unique_ptr<ILogWriter> Configuration::Load(const std::filesystem::path &ConfigFile, FILE *LogStream)
{
	toml::table TomlConfig{};
	std::string ConfigError{};
	std::string_view ConfigErrorActivity{};
	bool FileLoaded{false};

	std::error_code ErrorCode{};
	if (std::filesystem::exists(ConfigFile, ErrorCode))
	{
		auto TomlParseResult{toml::parse_file(ConfigFile.string())};
		if (!TomlParseResult)
		{
			ConfigErrorActivity = ParseConfigFile;
			ConfigError = std::string{TomlParseResult.error().description()};
			ConfigError.append(" at line ").append(std::to_string(TomlParseResult.error().source().begin.line));
		}
		else
		{
			TomlConfig = std::move(TomlParseResult.table());
			FileLoaded = true;
		}
	}
	else if (ErrorCode)
	{
		ConfigErrorActivity = LocateConfigFile;
		ConfigError = ErrorCode.message();
	}

	const toml::table &TomlLogConfig{GetSubTable(TomlConfig, ConfigConstants::Headers::logging)};
	const std::string LogLevelString{GetConfigurationValueOrDefault(TomlLogConfig, ConfigConstants::Fields::level, ConfigConstants::DefaultValues::logLevel)};
	bool LogLevelKnown{LogLevelsMap.contains(LogLevelString)};
	LogLevel = LogLevelKnown ? LogLevelsMap.at(LogLevelString) : LogLevelsMap.at(ConfigConstants::DefaultValues::logLevel);
	SyslogFallback = GetConfigurationValueOrDefault(TomlLogConfig, ConfigConstants::Fields::syslogFallback, ConfigConstants::DefaultValues::syslogFallback);

	std::unique_ptr<ILogWriter> Log{LogWriterFactory::CreateLogWriter(LogLevel, LogStream, SyslogFallback)};
	if (!ConfigError.empty())
	{
		Log->WriteErrorAnnotated(ConfigErrorActivity, ConfigFile.string(), ConfigError);
	}
	if (!LogLevelKnown)
	{
		Log->WriteWarnAnnotated(UnknownLogLevel, LogLevelString);
	}

	const toml::table &PathsConfigTable{GetSubTable(TomlConfig, ConfigConstants::Headers::paths)};
	Paths.LiveBaseDirectory = GetConfigurationValueOrDefault(PathsConfigTable, ConfigConstants::Fields::liveBaseDirectory, ConfigConstants::DefaultValues::liveBaseDirectory);
	Paths.SpoolADirectory = GetConfigurationValueOrDefault(PathsConfigTable, ConfigConstants::Fields::spoolADirectory, ConfigConstants::DefaultValues::spoolADirectory);
	Paths.SpoolBDirectory = GetConfigurationValueOrDefault(PathsConfigTable, ConfigConstants::Fields::spoolBDirectory, ConfigConstants::DefaultValues::spoolBDirectory);

	if (FileLoaded)
	{
		Log->WriteDebugAnnotated(ConfigurationLoaded, ConfigFile.string());
	}
	return Log;
}
