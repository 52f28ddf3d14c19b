#ifndef SWEEP_H
#define SWEEP_H

#include <cstdint>
#include <string>
#include <vector>
#include "kernel/OpinionModel.h"

// Ensemble settings for one seed over the (alphaIn, alphaOut) grid.
struct SweepSettings {
    ModelConfig base;                       // alphaIn/alphaOut are overwritten per cell
    std::vector<double> alphaIns{0.25, 0.5, 0.75};
    std::vector<double> alphaOuts{0.25, 0.5, 0.75};
    std::string outputDir = "data";
};

struct SweepResult {
    double alphaIn = 0.0;
    double alphaOut = 0.0;
    std::uint64_t seed = 0;
    std::int64_t consensusTime = -1;
    double consensusMean = 0.0;
    std::vector<Observation> observations;
};

std::vector<double> lowResolutionGrid();
std::vector<double> highResolutionGrid();

// Checkpoints 0..T: step 100 for T <= 1000, else min(5000, T/10)
std::vector<std::uint64_t> defaultTrackTimes(std::uint64_t horizon);

// Output files of one alphaIn row: aggregate CSV and, with an agent reporter, per-agent CSV
std::string sweepFilePath(const SweepSettings& settings, double alphaIn);
std::string sweepAgentFilePath(const SweepSettings& settings, double alphaIn);

// alphaIns whose aggregate CSV does not exist yet
std::vector<double> pendingAlphaIns(const SweepSettings& settings);

/**
 * Ensemble runs over the (alphaIn, alphaOut) grid for one seed.
 *
 * For alphaIns[n] every alphaOut in alphaOuts[0..n] is run (lower triangle,
 * out-group never more transparent than in-group when the grids match).
 * Rows whose output file already exists are not run again.
 * Cells are independent engines and run in parallel with OpenMP.
 * Throws ConfigurationError before any run starts if a cell is invalid.
 */
std::vector<SweepResult> runSweep(const SweepSettings& settings);

// One CSV per alphaIn (plus a per-agent CSV with an agent reporter), each
// starting with "# key=value" provenance lines. Existing files are left
// untouched. Returns paths written.
std::vector<std::string> writeSweep(const std::vector<SweepResult>& results,
                                    const SweepSettings& settings);

#endif
