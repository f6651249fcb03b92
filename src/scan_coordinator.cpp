#include <tabledep/scan_coordinator.h>

namespace tabledep {

ScanCoordinator::Lease::Lease(Lease &&other) noexcept : owner_(other.owner_) {
  other.owner_ = nullptr;
}

ScanCoordinator::Lease::~Lease() {
  if (owner_ != nullptr) {
    owner_->active_.store(false);
  }
}

ScanCoordinator::Lease ScanCoordinator::Acquire() {
  bool expected = false;
  if (!active_.compare_exchange_strong(expected, true)) {
    throw ScanInProgressError();
  }
  return Lease(this);
}

ScanCoordinator &GlobalScanCoordinator() {
  static ScanCoordinator coordinator;
  return coordinator;
}

} // namespace tabledep
