#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include "perfdatarouter.hpp"
#include "utility.hpp"

namespace fs = std::filesystem;

constexpr const std::string_view HostName{"host"};
constexpr const std::string_view ServiceName{"service"};
constexpr const std::string_view LiveFileSuffix{"-perfdata"};
constexpr const std::string_view OutputFileSuffix{"_perfdata."};

// router logging constants
constexpr const std::string_view NoPerfdataThisCycle{"No performance data this cycle"};
constexpr const std::string_view LocateLiveFile{"Locate live perfdata file"};
constexpr const std::string_view SnapshotExists{"Snapshot already exists, leaving live file in place"};
constexpr const std::string_view SnapshotCreated{"Snapshot created"};
constexpr const std::string_view SnapshotFailed{"Failed to snapshot live perfdata file"};
constexpr const std::string_view SpoolMissing{"Spool directory not present"};
constexpr const std::string_view LocateSpool{"Locate spool directory"};
constexpr const std::string_view CopiedToSpool{"Copied perfdata to spool"};
constexpr const std::string_view CopyFailed{"Failed to copy perfdata to spool"};
constexpr const std::string_view MovedToSpool{"Moved perfdata to spool"};
constexpr const std::string_view MoveFailed{"Failed to move perfdata to spool"};
constexpr const std::string_view CrossDeviceMove{"Spool is on another filesystem, copying instead"};
constexpr const std::string_view DiscardedSnapshot{"Discarded unconsumed snapshot"};
constexpr const std::string_view DiscardFailed{"Failed to discard snapshot"};

std::string_view GetCategoryName(const PerfdataCategory Category)
{
	return Category == PerfdataCategory::Host ? HostName : ServiceName;
}

std::optional<PerfdataCategory> ParseCategory(const std::string_view &Name)
{
	if (Name == HostName)
	{
		return PerfdataCategory::Host;
	}
	if (Name == ServiceName)
	{
		return PerfdataCategory::Service;
	}
	return std::nullopt;
}

// returns true if the directory exists, logs anything other than plain absence
static bool SpoolDirectoryPresent(ILogWriter &Log, const fs::path &Directory)
{
	std::error_code ErrorCode{};
	bool Present{fs::is_directory(Directory, ErrorCode)};
	if (ErrorCode && ErrorCode != std::errc::no_such_file_or_directory)
	{
		Log.WriteErrorAnnotated(LocateSpool, Directory.string(), ErrorCode.message());
	}
	else if (!Present)
	{
		Log.WriteDebugAnnotated(SpoolMissing, Directory.string());
	}
	return Present;
}

PerfdataRouter::PerfdataRouter(ILogWriter &Log, SpoolPaths Paths, std::function<std::string()> NonceSource)
	 : Log{Log}, Paths{std::move(Paths)}, NonceSource{std::move(NonceSource)}
{
}

PerfdataRouter::PerfdataRouter(ILogWriter &Log, SpoolPaths Paths) : PerfdataRouter(Log, std::move(Paths), Utility::MakeRunNonce)
{
}

fs::path PerfdataRouter::GetLivePath(const PerfdataCategory Category) const
{
	std::string FileName{GetCategoryName(Category)};
	FileName.append(LiveFileSuffix);
	return Paths.LiveBaseDirectory / FileName;
}

fs::path PerfdataRouter::GetSnapshotPath(const PerfdataCategory Category, const std::string_view &Nonce) const
{
	fs::path SnapshotPath{GetLivePath(Category)};
	SnapshotPath += "-";
	SnapshotPath += Nonce;
	return SnapshotPath;
}

std::string PerfdataRouter::GetOutputFileName(const PerfdataCategory Category, const std::string_view &Timestamp)
{
	std::string FileName{GetCategoryName(Category)};
	FileName.append(OutputFileSuffix).append(Timestamp);
	return FileName;
}

StepResult PerfdataRouter::TakeSnapshot(const fs::path &LivePath, const fs::path &SnapshotPath)
{
	std::error_code ErrorCode{};
	if (!fs::exists(LivePath, ErrorCode))
	{
		if (ErrorCode)
		{
			Log.WriteErrorAnnotated(LocateLiveFile, LivePath.string(), ErrorCode.message());
			return StepResult::Failed;
		}
		Log.WriteDebugAnnotated(NoPerfdataThisCycle, LivePath.string());
		return StepResult::Skipped;
	}

	// rename() would silently replace an existing snapshot
	if (fs::exists(SnapshotPath, ErrorCode) || ErrorCode)
	{
		Log.WriteErrorAnnotated(SnapshotExists, SnapshotPath.string(), ErrorCode ? ErrorCode.message() : std::string{});
		return StepResult::Failed;
	}

	fs::rename(LivePath, SnapshotPath, ErrorCode);
	if (ErrorCode == std::errc::no_such_file_or_directory)
	{
		Log.WriteDebugAnnotated(NoPerfdataThisCycle, LivePath.string());
		return StepResult::Skipped;
	}
	if (ErrorCode)
	{
		Log.WriteErrorAnnotated(SnapshotFailed, LivePath.string(), ErrorCode.message());
		return StepResult::Failed;
	}
	Log.WriteDebugAnnotated(SnapshotCreated, SnapshotPath.string());
	return StepResult::Completed;
}

StepResult PerfdataRouter::CopyToSpoolA(const fs::path &SnapshotPath, const std::string &OutputFileName)
{
	if (!SpoolDirectoryPresent(Log, Paths.SpoolADirectory))
	{
		return StepResult::Skipped;
	}

	const fs::path Destination{Paths.SpoolADirectory / OutputFileName};
	std::error_code ErrorCode{};
	fs::copy_file(SnapshotPath, Destination, fs::copy_options::overwrite_existing, ErrorCode);
	if (ErrorCode)
	{
		Log.WriteErrorAnnotated(CopyFailed, Destination.string(), ErrorCode.message());
		return StepResult::Failed;
	}
	Log.WriteInfoAnnotated(CopiedToSpool, Destination.string());
	return StepResult::Completed;
}

StepResult PerfdataRouter::MoveToSpoolB(const fs::path &SnapshotPath, const std::string &OutputFileName)
{
	if (!SpoolDirectoryPresent(Log, Paths.SpoolBDirectory))
	{
		return StepResult::Skipped;
	}

	const fs::path Destination{Paths.SpoolBDirectory / OutputFileName};
	std::error_code ErrorCode{};
	fs::rename(SnapshotPath, Destination, ErrorCode);
	if (ErrorCode == std::errc::cross_device_link)
	{
		Log.WriteDebugAnnotated(CrossDeviceMove, Destination.string());
		ErrorCode.clear();
		// a snapshot left behind here is removed by the cleanup step
		Utility::MoveByCopy(SnapshotPath, Destination, ErrorCode);
	}
	if (ErrorCode)
	{
		Log.WriteErrorAnnotated(MoveFailed, Destination.string(), ErrorCode.message());
		return StepResult::Failed;
	}
	Log.WriteInfoAnnotated(MovedToSpool, Destination.string());
	return StepResult::Completed;
}

StepResult PerfdataRouter::RemoveSnapshot(const fs::path &SnapshotPath)
{
	std::error_code ErrorCode{};
	if (!fs::exists(SnapshotPath, ErrorCode) && !ErrorCode)
	{
		return StepResult::Skipped;
	}
	if (!ErrorCode)
	{
		fs::remove(SnapshotPath, ErrorCode);
	}
	if (ErrorCode)
	{
		Log.WriteErrorAnnotated(DiscardFailed, SnapshotPath.string(), ErrorCode.message());
		return StepResult::Failed;
	}
	Log.WriteInfoAnnotated(DiscardedSnapshot, SnapshotPath.string());
	return StepResult::Completed;
}

RouteOutcome PerfdataRouter::Route(const PerfdataCategory Category, const std::string_view &Timestamp)
{
	RouteOutcome Outcome{};
	const fs::path SnapshotPath{GetSnapshotPath(Category, NonceSource())};

	Outcome.Snapshot = TakeSnapshot(GetLivePath(Category), SnapshotPath);
	if (Outcome.Snapshot != StepResult::Completed)
	{
		return Outcome;
	}

	const std::string OutputFileName{GetOutputFileName(Category, Timestamp)};
	Outcome.SpoolACopy = CopyToSpoolA(SnapshotPath, OutputFileName);
	Outcome.SpoolBMove = MoveToSpoolB(SnapshotPath, OutputFileName);
	Outcome.Cleanup = RemoveSnapshot(SnapshotPath);
	return Outcome;
}
