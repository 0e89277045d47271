#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include "utility.hpp"

bool Utility::IsDigitsOnly(const std::string_view &s)
{
	return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c)
												{ return std::isdigit(c); });
}

std::string Utility::GetIsoTimestamp(const std::time_t Time)
{
	std::tm TimeInfo{};
	if (::localtime_r(&Time, &TimeInfo) == nullptr)
	{
		return std::to_string(Time);
	}
	char TimeBuffer[64];
	auto Length{std::strftime(TimeBuffer, sizeof(TimeBuffer), "%Y-%m-%dT%H:%M:%S%z", &TimeInfo)};
	return std::string{TimeBuffer, Length};
}

std::string Utility::MakeRunNonce()
{
	std::string Nonce{std::to_string(std::time(nullptr))};
	Nonce.append(1, '-').append(std::to_string(::getpid()));
	return Nonce;
}

void Utility::MoveByCopy(const std::filesystem::path &Source, const std::filesystem::path &Destination, std::error_code &ErrorCode)
{
	std::filesystem::copy_file(Source, Destination, std::filesystem::copy_options::overwrite_existing, ErrorCode);
	std::error_code RemoveErrorCode{};
	if (ErrorCode)
	{
		if (std::filesystem::is_regular_file(Destination, RemoveErrorCode))
		{
			std::filesystem::remove(Destination, RemoveErrorCode);
		}
		return;
	}
	std::filesystem::remove(Source, RemoveErrorCode);
}
