#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <unistd.h>
#include "commandline.hpp"
#include "utility.hpp"

constexpr const char *OptionString{"+:c:t:"}; // stop at the first positional, report missing values as ':'

// usage logging constants
constexpr const std::string_view NoArguments{"No arguments given: use both -c [host|service] and -t [timestamp]"};
constexpr const std::string_view InvalidOption{"Invalid option"};
constexpr const std::string_view MissingArgument{"Missing argument"};
constexpr const std::string_view InvalidCategory{"The value for -c must be 'service' or 'host'"};
constexpr const std::string_view InvalidTimestamp{"The value for -t must be a non-negative integer"};
constexpr const std::string_view UnexpectedArgument{"Unexpected argument"};
constexpr const std::string_view MissingOption{"Required option not given"};

static std::string FlagName(const int Option)
{
	std::string Flag{"-"};
	Flag.push_back(static_cast<char>(Option));
	return Flag;
}

std::optional<RouteRequest> CommandLine::Parse(int argc, char *argv[], ILogWriter &Log)
{
	if (argc < 2)
	{
		Log.WriteFatal(NoArguments);
		return std::nullopt;
	}

	std::optional<PerfdataCategory> Category{};
	std::optional<std::string> Timestamp{};

	::opterr = 0;
#if defined(__GLIBC__)
	::optind = 0; // also drops glibc's pointer into the previous argv
#else
	::optind = 1;
	::optreset = 1;
#endif
	int Option{0};
	while ((Option = ::getopt(argc, argv, OptionString)) != -1)
	{
		switch (Option)
		{
		case 'c':
			Category = ParseCategory(::optarg);
			if (!Category.has_value())
			{
				Log.WriteFatalAnnotated(InvalidCategory, ::optarg);
				return std::nullopt;
			}
			break;
		case 't':
			if (!Utility::IsDigitsOnly(::optarg))
			{
				Log.WriteFatalAnnotated(InvalidTimestamp, ::optarg);
				return std::nullopt;
			}
			Timestamp = ::optarg;
			break;
		case ':':
			Log.WriteFatalAnnotated(MissingArgument, FlagName(::optopt));
			return std::nullopt;
		default:
			Log.WriteFatalAnnotated(InvalidOption, FlagName(::optopt));
			return std::nullopt;
		}
	}

	if (::optind < argc)
	{
		Log.WriteFatalAnnotated(UnexpectedArgument, argv[::optind]);
		return std::nullopt;
	}
	if (!Category.has_value())
	{
		Log.WriteFatalAnnotated(MissingOption, "-c");
		return std::nullopt;
	}
	if (!Timestamp.has_value())
	{
		Log.WriteFatalAnnotated(MissingOption, "-t");
		return std::nullopt;
	}
	return RouteRequest{Category.value(), std::move(Timestamp.value())};
}
