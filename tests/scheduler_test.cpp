// filename: scheduler_test.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/errors.hpp"
#include "tidalha/scheduler.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main() {
    using namespace tidalha;
    namespace fs = std::filesystem;
    testsupport::Checker check;

    check.expect(shellQuote("plain") == "'plain'", "plain word quoted");
    check.expect(shellQuote("it's") == "'it'\\''s'", "embedded quote escaped");

    const fs::path dir = testsupport::scratchDir("scheduler");
    const fs::path workDir = dir / "work dir";
    fs::create_directories(workDir);
    const fs::path script = workDir / "run_001";
    testsupport::writeText(script, "#!/bin/sh\n");

    // Stand-in for qsub: a blank line, the job id, and the script argument recorded in the cwd.
    const fs::path fakeQsub = dir / "fake_qsub";
    testsupport::writeText(fakeQsub,
                           "#!/bin/sh\n"
                           "echo\n"
                           "echo \"  42.pbs  \"\n"
                           "echo \"$1\" > seen_script\n");
    const fs::path rejectingQsub = dir / "rejecting_qsub";
    testsupport::writeText(rejectingQsub,
                           "#!/bin/sh\n"
                           "echo \"qsub: Job rejected by all possible destinations\" >&2\n"
                           "exit 3\n");

    {
        CommandJobSubmitter submitter(workDir.string(), "sh " + shellQuote(fakeQsub.string()), "true");
        JobHandle handle{};
        bool ok = true;
        try {
            handle = submitter.submit(1, script.string(), (workDir / "scrn.out_001").string());
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << '\n';
            ok = false;
        }
        check.expect(ok, "submission through the command succeeds");
        check.expect(handle.jobId == "42.pbs", "job id is the first non-empty output line, trimmed");
        check.expect(handle.submitted && handle.taskIndex == 1, "handle marked submitted for its task");
        check.expect(handle.logPath == (workDir / "scrn.out_001").string(), "log path carried on the handle");

        const std::vector<std::string> seen = testsupport::readLines(workDir / "seen_script");
        check.expect(seen.size() == 1 && seen[0] == script.string(),
                     "command runs in the work directory with the script as argument");
        check.expect(!fs::exists(script.string() + ".submit"), "capture file removed after submission");

        check.expect(submitter.cancel(handle), "cancel succeeds when the cancel command exits 0");

        JobHandle noId = handle;
        noId.jobId.clear();
        check.expect(!submitter.cancel(noId), "handle without job id is not cancelled");
        JobHandle unsubmitted = handle;
        unsubmitted.submitted = false;
        check.expect(!submitter.cancel(unsubmitted), "unsubmitted handle is not cancelled");
    }

    {
        CommandJobSubmitter submitter(workDir.string(), "sh " + shellQuote(rejectingQsub.string()), "false");
        bool threw = false;
        try {
            (void)submitter.submit(7, script.string(), (workDir / "scrn.out_007").string());
        } catch (const SubmissionError& ex) {
            threw = ex.taskIndex == 7 &&
                    std::string(ex.what()).find("Job rejected") != std::string::npos;
        }
        check.expect(threw, "non-zero exit is a SubmissionError carrying task and scheduler output");
        check.expect(!fs::exists(script.string() + ".submit"), "capture file removed after a rejection");

        JobHandle handle{};
        handle.taskIndex = 7;
        handle.jobId = "43.pbs";
        handle.submitted = true;
        check.expect(!submitter.cancel(handle), "failing cancel command reports false");
    }

    {
        const fs::path log = workDir / "scrn.out_002";
        LogMarkerWatcher watcher("Done ha_sub");
        JobHandle handle{};
        handle.logPath = log.string();
        check.expect(!watcher.isComplete(handle), "missing log is not complete");
        testsupport::writeText(log, "extracting stack 2\n");
        check.expect(!watcher.isComplete(handle), "log without marker is not complete");
        testsupport::writeText(log, "extracting stack 2\nDone ha_sub 002\n");
        check.expect(watcher.isComplete(handle), "marker anywhere in the log completes the task");
    }

    fs::remove_all(dir);
    return check.result();
}
