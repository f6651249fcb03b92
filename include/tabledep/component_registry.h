#pragma once

#include <tabledep/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tabledep {

class ComponentRegistry {
public:
  using ScannerFactory = std::function<std::unique_ptr<Scanner>(
      const ScanTarget &, const SchemaIndex &)>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  // Scanners run in registration order, which also decides which record
  // survives deduplication when two scanners tie on confidence.
  void RegisterScanner(const std::string &name, ScannerFactory factory);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  // Instantiates the named scanners in registration order; an empty
  // selection means all of them.
  std::vector<std::unique_ptr<Scanner>>
  CreateScanners(const ScanTarget &target, const SchemaIndex &index,
                 const std::vector<std::string> &selection = {}) const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> ScannerNames() const;
  std::vector<std::string> ReporterNames() const;
  const std::string &DefaultReporterName() const;

  // Throws std::invalid_argument naming the first unregistered scanner.
  void ValidateScannerSelection(const std::vector<std::string> &selection) const;

private:
  std::vector<std::pair<std::string, ScannerFactory>> scanners_;
  std::unordered_map<std::string, ReporterFactory> reporters_;
  std::string default_reporter_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace tabledep
