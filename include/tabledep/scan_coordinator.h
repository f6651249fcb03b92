#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace tabledep {

class ScanInProgressError : public std::runtime_error {
public:
  ScanInProgressError()
      : std::runtime_error("A scan is already in progress.") {}
};

// Admits at most one active scan. Callers hold a Lease for the duration of
// the scan; a second Acquire while a lease is live throws
// ScanInProgressError instead of queueing.
class ScanCoordinator {
public:
  class Lease {
  public:
    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&) = delete;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    ~Lease();

  private:
    friend class ScanCoordinator;
    explicit Lease(ScanCoordinator *owner) : owner_(owner) {}

    ScanCoordinator *owner_;
  };

  Lease Acquire();
  bool busy() const { return active_.load(); }

private:
  std::atomic<bool> active_{false};
};

ScanCoordinator &GlobalScanCoordinator();

} // namespace tabledep
