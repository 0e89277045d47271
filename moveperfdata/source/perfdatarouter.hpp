#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include "config.hpp"
#include "logwriter.hpp"

enum class PerfdataCategory
{
	Host,
	Service
};

/// @return "host" or "service"
std::string_view GetCategoryName(const PerfdataCategory Category);

/// @brief Accepts exactly "host" or "service"
std::optional<PerfdataCategory> ParseCategory(const std::string_view &Name);

enum class StepResult
{
	Skipped,
	Completed,
	Failed
};

struct RouteOutcome
{
	StepResult Snapshot{StepResult::Skipped};
	StepResult SpoolACopy{StepResult::Skipped};
	StepResult SpoolBMove{StepResult::Skipped};
	StepResult Cleanup{StepResult::Skipped};

	bool Succeeded() const
	{
		return Snapshot != StepResult::Failed && SpoolACopy != StepResult::Failed && SpoolBMove != StepResult::Failed && Cleanup != StepResult::Failed;
	}
};

/// @brief Fans the live perfdata file of one category out to whichever spool directories exist.
///
/// The live file is renamed to a per-run snapshot first so the monitoring host can keep appending to a fresh file.
/// Spool A gets a copy, spool B gets the snapshot itself, and whatever is left of the snapshot is removed.
/// Filesystem failures are logged and reported through RouteOutcome, never thrown.
class PerfdataRouter
{
private:
	ILogWriter &Log;
	const SpoolPaths Paths;
	std::function<std::string()> NonceSource;

	StepResult TakeSnapshot(const std::filesystem::path &LivePath, const std::filesystem::path &SnapshotPath);
	StepResult CopyToSpoolA(const std::filesystem::path &SnapshotPath, const std::string &OutputFileName);
	StepResult MoveToSpoolB(const std::filesystem::path &SnapshotPath, const std::string &OutputFileName);
	StepResult RemoveSnapshot(const std::filesystem::path &SnapshotPath);

public:
	/// @param NonceSource Produces the snapshot suffix, called once per Route().
	PerfdataRouter(ILogWriter &Log, SpoolPaths Paths, std::function<std::string()> NonceSource);
	PerfdataRouter(ILogWriter &Log, SpoolPaths Paths);
	~PerfdataRouter() = default;
	PerfdataRouter(const PerfdataRouter &) = delete;
	PerfdataRouter &operator=(const PerfdataRouter &) = delete;
	PerfdataRouter(PerfdataRouter &&) = delete;
	PerfdataRouter &operator=(PerfdataRouter &&) = delete;

	std::filesystem::path GetLivePath(const PerfdataCategory Category) const;
	std::filesystem::path GetSnapshotPath(const PerfdataCategory Category, const std::string_view &Nonce) const;
	static std::string GetOutputFileName(const PerfdataCategory Category, const std::string_view &Timestamp);

	/// @param Timestamp Event time supplied by the monitoring host, already validated as digits only.
	RouteOutcome Route(const PerfdataCategory Category, const std::string_view &Timestamp);
};
