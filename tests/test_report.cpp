// tests/test_report.cpp
//
// TSV and JSON writers:
//   - header line and row layout of every TSV writer
//   - hop rows carry time_ps = timestep / 1000 and the event name
//   - the JSON summary emits only the blocks whose inputs are present

#include "evbkit/hop_classifier.hpp"
#include "evbkit/report.hpp"
#include "evbkit/version.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

int test_hop_tsv() {
    std::cout << "Testing hop TSV...\n";
    int failed = 0;

    const std::vector<evbkit::Timestep> ts = {0, 1500, 3000};
    const std::vector<evbkit::CenterId> centers = {4, 9, 4};
    const evbkit::HopTrace trace = evbkit::classify_hops(centers);

    std::ostringstream out;
    evbkit::write_hop_tsv(out, ts, centers, trace);
    expect(out.str() ==
               "timestep\ttime_ps\tcenter\tevent\thop\n"
               "0\t0.000\t4\tnone\t0\n"
               "1500\t1.500\t9\tforward\t1\n"
               "3000\t3.000\t4\tbackward\t0\n",
           "hop TSV layout", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_profile_tsvs() {
    std::cout << "Testing profile and amplitude TSVs...\n";
    int failed = 0;

    std::ostringstream energy;
    evbkit::write_energy_profile_tsv(energy, {{0.25, 1.5}, {-0.5, 0.0}});
    expect(energy.str() ==
               "coordinate\tfree_energy_kcal_mol\n"
               "0.250000\t1.500000\n"
               "-0.500000\t0.000000\n",
           "energy profile TSV", failed);

    std::ostringstream density;
    evbkit::write_density_profile_tsv(density, {{0.5, 2.0, 0.125}});
    expect(density.str() ==
               "coordinate\tpdf_dominant\tpdf_secondary\n"
               "0.500000\t2.000000\t0.125000\n",
           "density profile TSV", failed);

    evbkit::AmplitudeSamples samples;
    samples.dominant_sq = {0.81, 0.49};
    samples.secondary_sq = {0.09, 0.25};
    std::ostringstream amps;
    evbkit::write_amplitudes_tsv(amps, {10, 20}, samples);
    expect(amps.str() ==
               "timestep\tc1_sq\tc2_sq\tdiff\n"
               "10\t0.810000\t0.090000\t0.720000\n"
               "20\t0.490000\t0.250000\t0.240000\n",
           "amplitudes TSV", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_summary_blocks() {
    std::cout << "Testing JSON summary blocks...\n";
    int failed = 0;

    // Bare summary: no optional block
    evbkit::RunSummary bare;
    bare.command = "hop";
    bare.n_frames = 3;
    std::ostringstream a;
    evbkit::write_summary_json(a, bare);
    const std::string sa = a.str();
    expect(contains(sa, std::string("\"version\": \"") + EVBKIT_VERSION + "\""), "version field", failed);
    expect(contains(sa, "\"command\": \"hop\""), "command field", failed);
    expect(contains(sa, "\"frames\": 3"), "frames field", failed);
    expect(!contains(sa, "\"hops\"") && !contains(sa, "\"amplitudes\"") && !contains(sa, "\"profile\""),
           "no optional blocks without inputs", failed);
    expect(sa.front() == '{' && sa.size() >= 3 && sa.compare(sa.size() - 3, 3, "\n}\n") == 0,
           "object closed", failed);

    // Hop block only
    const evbkit::HopTrace trace = evbkit::classify_hops({4, 9, 4});
    evbkit::RunSummary hop = bare;
    hop.trace = &trace;
    std::ostringstream b;
    evbkit::write_summary_json(b, hop);
    const std::string sb = b.str();
    expect(contains(sb, "\"hops\"") && contains(sb, "\"forward\": 1") &&
           contains(sb, "\"backward\": 1") && contains(sb, "\"net_displacement\": 0"),
           "hop block", failed);
    expect(!contains(sb, "\"amplitudes\"") && !contains(sb, "\"profile\""), "only the hop block", failed);

    // Amplitude and profile blocks
    evbkit::AmplitudeSamples samples;
    samples.dominant_sq = {0.81, 0.49};
    samples.secondary_sq = {0.09, 0.25};
    const evbkit::EnergyProfile profile = {{0.0, 2.0}, {0.5, 0.0}, {1.0, 3.0}};

    evbkit::RunSummary civec;
    civec.command = "civec";
    civec.n_frames = 2;
    civec.samples = &samples;
    civec.profile = &profile;
    civec.mode = "free-energy";
    civec.nbins = 3;
    std::ostringstream c;
    evbkit::write_summary_json(c, civec);
    const std::string sc = c.str();
    expect(!contains(sc, "\"hops\""), "no hop block for civec", failed);
    expect(contains(sc, "\"mean_c1_sq\": 0.650000") && contains(sc, "\"mean_c2_sq\": 0.170000"),
           "amplitude means", failed);
    expect(contains(sc, "\"mode\": \"free-energy\"") && contains(sc, "\"nbins\": 3"), "profile mode", failed);
    expect(contains(sc, "\"points\": 3") && contains(sc, "\"min_coordinate\": 0.500000") &&
           contains(sc, "\"max_energy\": 3.000000"), "profile extrema", failed);

    // Density mode: profile block without energy extrema
    evbkit::RunSummary dens = civec;
    dens.profile = nullptr;
    dens.mode = "density";
    std::ostringstream d;
    evbkit::write_summary_json(d, dens);
    const std::string sd = d.str();
    expect(contains(sd, "\"mode\": \"density\"") && !contains(sd, "\"points\""),
           "density summary has no extrema", failed);
    expect(std::count(sd.begin(), sd.end(), '{') == std::count(sd.begin(), sd.end(), '}'),
           "braces balanced", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_hop_tsv();
    total += test_profile_tsvs();
    total += test_summary_blocks();

    if (total == 0) {
        std::cout << "\nAll report tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
