// filename: result_assembler_test.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/errors.hpp"
#include "tidalha/mesh_index.hpp"
#include "tidalha/partition.hpp"
#include "tidalha/result_assembler.hpp"
#include "tidalha/types.hpp"

#include "test_support.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

double lastColumn(const std::string& line) {
    std::istringstream fields(line);
    std::string id;
    std::string x;
    std::string y;
    double value = 0.0;
    fields >> id >> x >> y >> value;
    return value;
}

}  // namespace

int main() {
    using namespace tidalha;
    namespace fs = std::filesystem;
    testsupport::Checker check;

    const fs::path dir = testsupport::scratchDir("result_assembler");
    testsupport::writeText(dir / "hgrid.gr3", testsupport::kSmallMesh);
    testsupport::writeText(dir / "include.gr3", testsupport::kSmallMask);

    const MeshIndex mesh = MeshIndex::load((dir / "hgrid.gr3").string(), (dir / "include.gr3").string());
    // Active {1,2,3,5} over two tasks: task 1 -> {1,2}, task 2 -> {3,5}.
    const Partition partition = partitionActiveNodes(mesh.activeNodes(), mesh.nodeCount(), 2);

    // Task 2 reports only its second node for M2, so node 3 stays unresolved.
    testsupport::writeText(dir / "M2_001", "1 0 0.50 0.0\n2 0 0.25 3.14159265358979323846\n");
    testsupport::writeText(dir / "M2_002", "\n2 0 0.75 -1.5707963267948966\n");
    testsupport::writeText(dir / "K1_001", "2 0 0.10 1.0\n1 0 0.20 0.5\n");
    testsupport::writeText(dir / "K1_002", "1 0 0.30 0.25\n2 0 0.40 2.0\n");

    {
        ResultAssembler assembler(mesh, partition, {"M2", "K1"});
        assembler.mergeAll(dir.string());

        const AssembledField& m2 = assembler.field("M2");
        check.expect(testsupport::approxEqual(m2.amplitude[0], 0.50), "M2 node 1 amplitude");
        check.expect(testsupport::approxEqual(m2.phaseDeg[1], 180.0), "pi radians becomes 180 degrees");
        check.expect(testsupport::approxEqual(m2.amplitude[4], 0.75) && testsupport::approxEqual(m2.phaseDeg[4], -90.0),
                     "task 2 local 2 lands on global node 5");
        check.expect(m2.amplitude[2] == kUnresolved && m2.phaseDeg[2] == kUnresolved,
                     "node missing from partial results keeps the sentinel");
        check.expect(m2.amplitude[3] == kUnresolved, "inactive node keeps the sentinel");
        check.expect(assembler.unresolvedCount("M2") == 2, "two unresolved M2 nodes");

        const AssembledField& k1 = assembler.field("K1");
        check.expect(testsupport::approxEqual(k1.phaseDeg[0], 0.5 * 180.0 / kPi, 1e-12), "phase conversion p*180/pi");
        check.expect(testsupport::approxEqual(k1.amplitude[1], 0.10), "rows may arrive out of order");
        check.expect(testsupport::approxEqual(k1.amplitude[2], 0.30), "K1 node 3 from task 2");

        const std::vector<std::string> written = assembler.writeOutputs(dir.string());
        check.expect(written.size() == 4, "amplitude and phase file per constituent");

        const std::vector<std::string> amp = testsupport::readLines(dir / "amp_m2.gr3");
        check.expect(amp.size() == 2 + 5 + 2, "output has header, node and element lines");
        check.expect(amp[0] == "small test mesh" && amp[1] == "2 5", "header reproduced verbatim");
        check.expect(amp[2] == "1 0.0 0.0 0.5", "body row uses the mesh coordinate text");
        check.expect(amp[4] == "3 1.0 1.0 -9999", "sentinel written for node 3");
        check.expect(amp[7] == "1 3 1 2 5" && amp[8] == "2 3 2 3 5", "element block reproduced verbatim");

        const std::vector<std::string> pha = testsupport::readLines(dir / "pha_m2.gr3");
        check.expect(pha.size() == 9 && testsupport::approxEqual(lastColumn(pha[6]), -90.0), "phase file in degrees");
        check.expect(fs::exists(dir / "amp_k1.gr3") && fs::exists(dir / "pha_k1.gr3"), "K1 outputs written");
    }

    {
        ResultAssembler assembler(mesh, partition, {"M2"});
        bool threw = false;
        try {
            assembler.mergeRows(1, "M2", {PartialRow{3, 1.0, 0.0}});
        } catch (const FormatError& ex) {
            threw = std::string(ex.what()).find("M2_001") != std::string::npos;
        }
        check.expect(threw, "local index outside the task is a FormatError naming the file");
    }

    {
        testsupport::writeText(dir / "bad_rows", "1 0 0.5\n");
        bool threw = false;
        try {
            (void)readPartialResult((dir / "bad_rows").string());
        } catch (const FormatError& ex) {
            threw = std::string(ex.what()).find(":1:") != std::string::npos;
        }
        check.expect(threw, "short row is a FormatError with its line");
    }

    {
        testsupport::writeText(dir / "nan_rows", "1 0 NaN NaN\n2 0 inf -Infinity\n3 0 0.5 1e-3\n");
        std::vector<PartialRow> rows;
        bool ok = true;
        try {
            rows = readPartialResult((dir / "nan_rows").string());
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << '\n';
            ok = false;
        }
        check.expect(ok && rows.size() == 3, "NaN and Infinity rows are accepted");
        if (rows.size() == 3) {
            check.expect(std::isnan(rows[0].amplitude) && std::isnan(rows[0].phaseRad), "NaN kept as NaN");
            check.expect(std::isinf(rows[1].amplitude) && rows[1].phaseRad < 0.0, "infinities kept with sign");
            check.expect(testsupport::approxEqual(rows[2].phaseRad, 1e-3), "exponent notation parsed");
        }

        testsupport::writeText(dir / "junk_rows", "1 0 0.5x 0.1\n");
        bool threw = false;
        try {
            (void)readPartialResult((dir / "junk_rows").string());
        } catch (const FormatError&) {
            threw = true;
        }
        check.expect(threw, "trailing garbage after a number is a FormatError");
    }

    {
        // A blocked output path must not leave the other outputs behind.
        const fs::path blocked = testsupport::scratchDir("result_assembler_blocked");
        fs::create_directory(blocked / "pha_k1.gr3");
        ResultAssembler assembler(mesh, partition, {"M2", "K1"});
        assembler.mergeAll(dir.string());
        bool threw = false;
        try {
            (void)assembler.writeOutputs(blocked.string());
        } catch (const IOError& ex) {
            threw = std::string(ex.what()).find("pha_k1.gr3") != std::string::npos;
        }
        check.expect(threw, "blocked output is an IOError naming the file");
        check.expect(!fs::exists(blocked / "amp_m2.gr3") && !fs::exists(blocked / "pha_m2.gr3") &&
                         !fs::exists(blocked / "amp_k1.gr3"),
                     "no partial output set is left on failure");
        bool staged = false;
        for (const auto& entry : fs::directory_iterator(blocked)) {
            if (entry.path().extension() == ".tmp") {
                staged = true;
            }
        }
        check.expect(!staged, "staging files are removed on failure");
        check.expect(fs::is_directory(blocked / "pha_k1.gr3"), "blocking entry left untouched");
        fs::remove_all(blocked);
    }

    {
        fs::remove(dir / "K1_002");
        ResultAssembler assembler(mesh, partition, {"M2", "K1"});
        bool threw = false;
        try {
            assembler.mergeAll(dir.string());
        } catch (const IOError& ex) {
            threw = std::string(ex.what()).find("K1_002") != std::string::npos;
        }
        check.expect(threw, "missing partial result is an IOError naming the file");
    }

    fs::remove_all(dir);
    return check.result();
}
