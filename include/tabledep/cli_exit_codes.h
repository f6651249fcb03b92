#pragma once

#include <tabledep/models.h>

namespace tabledep {

constexpr int kExitNoDependencies = 0;
constexpr int kExitError = 1;
constexpr int kExitDependenciesFound = 2;
constexpr int kExitCancelled = 3;

int ScanExitCode(const ScanOutcome &outcome);

} // namespace tabledep
