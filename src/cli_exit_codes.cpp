#include <tabledep/cli_exit_codes.h>

namespace tabledep {

int ScanExitCode(const ScanOutcome &outcome) {
  switch (outcome.status) {
  case ScanStatus::kCancelled:
    return kExitCancelled;
  case ScanStatus::kCompleted:
    return outcome.evidence.empty() ? kExitNoDependencies
                                    : kExitDependenciesFound;
  }
  return kExitError;
}

} // namespace tabledep
