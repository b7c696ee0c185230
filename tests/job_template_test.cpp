// filename: job_template_test.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/errors.hpp"
#include "tidalha/job_template.hpp"

#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    using namespace tidalha;
    testsupport::Checker check;

    const JobTemplate tmpl = JobTemplate::parse(testsupport::kPbsTemplate, TemplateMarkers{});
    check.expect(tmpl.lines().size() == 6, "one template line per input line");
    check.expect(tmpl.lines()[1].kind == JobTemplate::LineKind::JobName, "#PBS -N line is the job name slot");
    check.expect(tmpl.lines()[2].kind == JobTemplate::LineKind::Literal, "#PBS -l line passes through");
    check.expect(tmpl.lines()[5].kind == JobTemplate::LineKind::Entrypoint, "mvp line is the entrypoint slot");
    check.expect(tmpl.entrypointCount() == 1 && tmpl.hasJobName(), "slot counts");

    WorkerInvocation invocation{};
    invocation.extractExecutable = "/opt/bin/read_output8_allnodes_simple";
    invocation.analysisExecutable = "/opt/bin/tidal_analysis";
    invocation.constantsFile = "/opt/tidal_const.dat";
    invocation.taskIndex = 3;
    invocation.startStack = 2;
    invocation.endStack = 4;
    invocation.nodeCount = 4;
    invocation.logFile = "scrn.out_003";

    const std::vector<std::string> lines = splitLines(tmpl.render(invocation, "EXTRACT_003"));
    check.expect(lines.size() == 6, "rendered script keeps the line count");
    check.expect(lines[0] == "#!/bin/tcsh", "shebang unchanged");
    check.expect(lines[1] == "#PBS -N EXTRACT_003", "job name embeds the task index");
    check.expect(lines[3] == "#PBS -l walltime=04:00:00", "resource line unchanged");
    check.expect(lines[5] ==
                     "./ha_sub.pl /opt/bin/read_output8_allnodes_simple /opt/bin/tidal_analysis "
                     "/opt/tidal_const.dat 3 2 4 4 >& scrn.out_003",
                 "entrypoint replaced by the worker invocation");

    // Slurm style template with an explicit placeholder and custom markers.
    {
        TemplateMarkers markers{};
        markers.entrypoint = {"@HA_ENTRYPOINT@"};
        markers.jobNameDirective = "#SBATCH";
        markers.jobNameFlag = "--job-name";
        const JobTemplate slurm = JobTemplate::parse(
            "#!/bin/bash\n#SBATCH --job-name=ha\n#SBATCH --time=1:00:00\nsrun @HA_ENTRYPOINT@\n", markers);
        invocation.redirect = ">";
        const std::vector<std::string> out = splitLines(slurm.render(invocation, "HA_003"));
        check.expect(out[1] == "#SBATCH --job-name HA_003", "custom job name directive");
        check.expect(out[2] == "#SBATCH --time=1:00:00", "other directives pass through");
        check.expect(out[3].rfind("./ha_sub.pl ", 0) == 0 && out[3].find("> scrn.out_003") != std::string::npos,
                     "custom redirect used");
    }

    {
        bool threw = false;
        try {
            (void)JobTemplate::parse("#!/bin/sh\n#PBS -N job\necho nothing\n", TemplateMarkers{});
        } catch (const FormatError&) {
            threw = true;
        }
        check.expect(threw, "template without an entrypoint is rejected");
    }

    {
        bool threw = false;
        try {
            (void)JobTemplate::load("/nonexistent/run_comb", TemplateMarkers{});
        } catch (const IOError&) {
            threw = true;
        }
        check.expect(threw, "missing template is an IOError");
    }

    return check.result();
}
