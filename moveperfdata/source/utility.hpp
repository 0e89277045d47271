#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace Utility
{
	/// @brief Checks if a string is composed only of digits
	/// @param s
	/// @return True if no non-digit characters found, false at the first non-digit character. An empty string is not digits only.
	bool IsDigitsOnly(const std::string_view &s);

	/// @brief Formats a point in time as local time, e.g. 2018-11-28T14:33:23+0100
	std::string GetIsoTimestamp(const std::time_t Time);

	/// @brief Suffix that keeps this run's snapshot apart from any other process's snapshot
	/// @return "<unix seconds>-<process id>"
	std::string MakeRunNonce();

	/// @brief Stands in for rename() when Destination is on another filesystem. Copies, then removes Source.
	/// A failed copy removes whatever part of Destination was written. A Source that cannot be removed afterwards is left for the caller.
	/// @param ErrorCode Set if the copy failed
	void MoveByCopy(const std::filesystem::path &Source, const std::filesystem::path &Destination, std::error_code &ErrorCode);
}
