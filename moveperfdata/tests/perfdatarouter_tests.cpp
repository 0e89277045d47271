#include <filesystem>
#include <string>
#include "perfdatarouter.hpp"
#include "testsupport.hpp"

namespace fs = std::filesystem;
using TestSupport::Fail;
using TestSupport::RecordingLogWriter;

namespace
{
	constexpr const char *Perfdata{"[HOSTPERFDATA]\t1543412003\tweb01\tHOST CHECK\trta=0.042ms;3000.000;5000.000;0; pl=0%;80;100;;\n"};

	// lays out a live directory plus the two spool directories, creating only the spools asked for
	struct RouterFixture
	{
		TestSupport::TemporaryDirectory Root;
		SpoolPaths Paths{};
		RecordingLogWriter Log{};
		int NonceCounter{0};
		PerfdataRouter Router;

		RouterFixture(const std::string &Name, const bool WithSpoolA, const bool WithSpoolB)
			 : Root{Name},
				Paths{Root.Path() / "var", Root.Path() / "var" / "nagfluxspool" / "perfdata", Root.Path() / "var" / "spool" / "perfdata"},
				Router{Log, Paths, [this]
						 { return "1543412003-" + std::to_string(++NonceCounter); }}
		{
			fs::create_directories(Paths.LiveBaseDirectory);
			if (WithSpoolA)
			{
				fs::create_directories(Paths.SpoolADirectory);
			}
			if (WithSpoolB)
			{
				fs::create_directories(Paths.SpoolBDirectory);
			}
		}

		fs::path LivePath(const PerfdataCategory Category = PerfdataCategory::Host) const { return Router.GetLivePath(Category); }
		size_t Snapshots(const PerfdataCategory Category = PerfdataCategory::Host) const
		{
			return TestSupport::CountEntries(Paths.LiveBaseDirectory, LivePath(Category).filename().string() + "-");
		}
	};

	int TestNaming()
	{
		RouterFixture Fixture{"naming", false, false};
		if (Fixture.LivePath(PerfdataCategory::Host) != Fixture.Paths.LiveBaseDirectory / "host-perfdata" ||
			 Fixture.LivePath(PerfdataCategory::Service) != Fixture.Paths.LiveBaseDirectory / "service-perfdata")
		{
			return Fail("Unexpected live file names.");
		}
		if (Fixture.Router.GetSnapshotPath(PerfdataCategory::Service, "42-7") != Fixture.Paths.LiveBaseDirectory / "service-perfdata-42-7")
		{
			return Fail("Unexpected snapshot name.");
		}
		if (PerfdataRouter::GetOutputFileName(PerfdataCategory::Host, "1543412003") != "host_perfdata.1543412003" ||
			 PerfdataRouter::GetOutputFileName(PerfdataCategory::Service, "0") != "service_perfdata.0")
		{
			return Fail("Unexpected output file names.");
		}
		if (ParseCategory("host") != PerfdataCategory::Host || ParseCategory("service") != PerfdataCategory::Service || ParseCategory("Host").has_value())
		{
			return Fail("Unexpected category parsing.");
		}
		return 0;
	}

	int TestFullFanOut()
	{
		RouterFixture Fixture{"fanout", true, true};
		TestSupport::WriteFile(Fixture.LivePath(), Perfdata);

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "1543412003")};
		if (!Outcome.Succeeded() || Outcome.Snapshot != StepResult::Completed || Outcome.SpoolACopy != StepResult::Completed ||
			 Outcome.SpoolBMove != StepResult::Completed || Outcome.Cleanup != StepResult::Skipped)
		{
			return Fail("Full fan-out should copy, move and leave nothing to clean up.");
		}
		if (TestSupport::ReadFile(Fixture.Paths.SpoolADirectory / "host_perfdata.1543412003") != Perfdata ||
			 TestSupport::ReadFile(Fixture.Paths.SpoolBDirectory / "host_perfdata.1543412003") != Perfdata)
		{
			return Fail("Both spools should hold the live file's contents.");
		}
		if (fs::exists(Fixture.LivePath()) || Fixture.Snapshots() != 0)
		{
			return Fail("Live file and snapshot should both be gone after fan-out.");
		}
		if (Fixture.Log.Count(LogLevels::Error) != 0)
		{
			return Fail("Full fan-out should not log errors.");
		}
		return 0;
	}

	int TestNoConsumers()
	{
		RouterFixture Fixture{"noconsumers", false, false};
		TestSupport::WriteFile(Fixture.LivePath(PerfdataCategory::Service), Perfdata);

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Service, "1543412003")};
		if (!Outcome.Succeeded() || Outcome.SpoolACopy != StepResult::Skipped || Outcome.SpoolBMove != StepResult::Skipped || Outcome.Cleanup != StepResult::Completed)
		{
			return Fail("Without consumers the snapshot should only be discarded.");
		}
		if (fs::exists(Fixture.LivePath(PerfdataCategory::Service)) || Fixture.Snapshots(PerfdataCategory::Service) != 0)
		{
			return Fail("Without consumers nothing should be left in the live directory.");
		}
		if (TestSupport::CountEntries(Fixture.Paths.LiveBaseDirectory) != 0)
		{
			return Fail("Without consumers no file should be created anywhere.");
		}
		return 0;
	}

	int TestOnlySpoolB()
	{
		RouterFixture Fixture{"onlyspoolb", false, true};
		TestSupport::WriteFile(Fixture.LivePath(), Perfdata);

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "1543412003")};
		if (!Outcome.Succeeded() || Outcome.SpoolACopy != StepResult::Skipped || Outcome.SpoolBMove != StepResult::Completed || Outcome.Cleanup != StepResult::Skipped)
		{
			return Fail("With only spool B the snapshot should be moved.");
		}
		if (fs::exists(Fixture.Paths.SpoolADirectory))
		{
			return Fail("Spool A must not be created.");
		}
		if (TestSupport::ReadFile(Fixture.Paths.SpoolBDirectory / "host_perfdata.1543412003") != Perfdata || Fixture.Snapshots() != 0)
		{
			return Fail("Spool B should hold the data and no snapshot should remain.");
		}
		return 0;
	}

	int TestOnlySpoolA()
	{
		RouterFixture Fixture{"onlyspoola", true, false};
		TestSupport::WriteFile(Fixture.LivePath(), Perfdata);

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "1543412003")};
		if (!Outcome.Succeeded() || Outcome.SpoolACopy != StepResult::Completed || Outcome.SpoolBMove != StepResult::Skipped || Outcome.Cleanup != StepResult::Completed)
		{
			return Fail("With only spool A the snapshot should be copied then discarded.");
		}
		if (TestSupport::ReadFile(Fixture.Paths.SpoolADirectory / "host_perfdata.1543412003") != Perfdata || TestSupport::CountEntries(Fixture.Paths.SpoolADirectory) != 1)
		{
			return Fail("Spool A should hold exactly one copy.");
		}
		if (Fixture.Snapshots() != 0 || fs::exists(Fixture.LivePath()))
		{
			return Fail("The snapshot should be cleaned up when spool B is absent.");
		}
		return 0;
	}

	int TestSequentialRunsKeepDistinctFiles()
	{
		RouterFixture Fixture{"sequential", true, true};
		TestSupport::WriteFile(Fixture.LivePath(), "first\n");
		auto First{Fixture.Router.Route(PerfdataCategory::Host, "1000")};
		TestSupport::WriteFile(Fixture.LivePath(), "second\n");
		auto Second{Fixture.Router.Route(PerfdataCategory::Host, "1060")};

		if (!First.Succeeded() || !Second.Succeeded())
		{
			return Fail("Sequential runs should both succeed.");
		}
		for (const auto &Spool : {Fixture.Paths.SpoolADirectory, Fixture.Paths.SpoolBDirectory})
		{
			if (TestSupport::ReadFile(Spool / "host_perfdata.1000") != "first\n" || TestSupport::ReadFile(Spool / "host_perfdata.1060") != "second\n")
			{
				return Fail("Each run should keep its own output file in " + Spool.string());
			}
		}
		return 0;
	}

	int TestMissingLiveFileIsNoOp()
	{
		RouterFixture Fixture{"nolive", true, true};

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "1543412003")};
		if (!Outcome.Succeeded() || Outcome.Snapshot != StepResult::Skipped || Outcome.SpoolACopy != StepResult::Skipped ||
			 Outcome.SpoolBMove != StepResult::Skipped || Outcome.Cleanup != StepResult::Skipped)
		{
			return Fail("A missing live file should skip every step.");
		}
		if (TestSupport::CountEntries(Fixture.Paths.SpoolADirectory) != 0 || TestSupport::CountEntries(Fixture.Paths.SpoolBDirectory) != 0)
		{
			return Fail("A missing live file should not produce output.");
		}
		if (!Fixture.Log.Contains(LogLevels::Debug, "No performance data this cycle") || Fixture.Log.Count(LogLevels::Error) != 0)
		{
			return Fail("A missing live file should only be noted at debug level.");
		}
		return 0;
	}

	int TestOtherCategoryUntouched()
	{
		RouterFixture Fixture{"othercategory", false, true};
		TestSupport::WriteFile(Fixture.LivePath(PerfdataCategory::Service), Perfdata);

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "5")};
		if (!Outcome.Succeeded() || Outcome.Snapshot != StepResult::Skipped)
		{
			return Fail("Routing host data should not see service data.");
		}
		if (TestSupport::ReadFile(Fixture.LivePath(PerfdataCategory::Service)) != Perfdata)
		{
			return Fail("The service live file must not be touched by a host run.");
		}
		return 0;
	}

	int TestExistingSnapshotIsNotReplaced()
	{
		RouterFixture Fixture{"collision", false, true};
		TestSupport::WriteFile(Fixture.LivePath(), "live\n");
		// the fixture's first nonce
		TestSupport::WriteFile(Fixture.Router.GetSnapshotPath(PerfdataCategory::Host, "1543412003-1"), "older run\n");

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "7")};
		if (Outcome.Succeeded() || Outcome.Snapshot != StepResult::Failed || Outcome.SpoolBMove != StepResult::Skipped)
		{
			return Fail("An existing snapshot should fail the run without routing.");
		}
		if (TestSupport::ReadFile(Fixture.LivePath()) != "live\n" || TestSupport::ReadFile(Fixture.Router.GetSnapshotPath(PerfdataCategory::Host, "1543412003-1")) != "older run\n")
		{
			return Fail("Neither the live file nor the existing snapshot may change.");
		}
		if (!Fixture.Log.Contains(LogLevels::Error, "Snapshot already exists"))
		{
			return Fail("The collision should be logged as an error.");
		}
		return 0;
	}

	int TestFailedCopyStillMoves()
	{
		RouterFixture Fixture{"failedcopy", true, true};
		TestSupport::WriteFile(Fixture.LivePath(), Perfdata);
		// a directory in the way makes the copy fail regardless of privileges
		fs::create_directories(Fixture.Paths.SpoolADirectory / "host_perfdata.9" / "occupied");

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "9")};
		if (Outcome.Succeeded() || Outcome.SpoolACopy != StepResult::Failed || Outcome.SpoolBMove != StepResult::Completed)
		{
			return Fail("A failed copy to spool A should not prevent the move to spool B.");
		}
		if (TestSupport::ReadFile(Fixture.Paths.SpoolBDirectory / "host_perfdata.9") != Perfdata || Fixture.Snapshots() != 0)
		{
			return Fail("Spool B should still receive the data.");
		}
		if (!Fixture.Log.Contains(LogLevels::Error, "Failed to copy perfdata to spool"))
		{
			return Fail("The failed copy should be logged as an error.");
		}
		return 0;
	}

	int TestFailedMoveStillCleansUp()
	{
		RouterFixture Fixture{"failedmove", true, true};
		TestSupport::WriteFile(Fixture.LivePath(), Perfdata);
		fs::create_directories(Fixture.Paths.SpoolBDirectory / "host_perfdata.11" / "occupied");

		auto Outcome{Fixture.Router.Route(PerfdataCategory::Host, "11")};
		if (Outcome.Succeeded() || Outcome.SpoolACopy != StepResult::Completed || Outcome.SpoolBMove != StepResult::Failed || Outcome.Cleanup != StepResult::Completed)
		{
			return Fail("A failed move to spool B should still let cleanup run.");
		}
		if (TestSupport::ReadFile(Fixture.Paths.SpoolADirectory / "host_perfdata.11") != Perfdata)
		{
			return Fail("Spool A should hold its copy.");
		}
		if (Fixture.Snapshots() != 0)
		{
			return Fail("The snapshot must not outlive the run.");
		}
		if (!Fixture.Log.Contains(LogLevels::Error, "Failed to move perfdata to spool"))
		{
			return Fail("The failed move should be logged as an error.");
		}
		return 0;
	}
}

int main()
{
	int Result{0};
	if ((Result = TestNaming()) ||
		 (Result = TestFullFanOut()) ||
		 (Result = TestNoConsumers()) ||
		 (Result = TestOnlySpoolB()) ||
		 (Result = TestOnlySpoolA()) ||
		 (Result = TestSequentialRunsKeepDistinctFiles()) ||
		 (Result = TestMissingLiveFileIsNoOp()) ||
		 (Result = TestOtherCategoryUntouched()) ||
		 (Result = TestExistingSnapshotIsNotReplaced()) ||
		 (Result = TestFailedCopyStillMoves()) ||
		 (Result = TestFailedMoveStillCleansUp()))
	{
		return Result;
	}

	std::cout << "Perfdata router tests passed." << std::endl;
	return 0;
}
