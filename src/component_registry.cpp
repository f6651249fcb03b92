#include <tabledep/component_registry.h>

#include <tabledep/scanners/association_scanner.h>
#include <tabledep/scanners/config_scanner.h>
#include <tabledep/scanners/contextual_scanner.h>
#include <tabledep/scanners/migration_scanner.h>
#include <tabledep/scanners/polymorphic_resolver.h>
#include <tabledep/scanners/raw_query_scanner.h>
#include <tabledep/scanners/schema_scanner.h>
#include <tabledep/tabular_reporter.h>

#include <algorithm>
#include <stdexcept>

namespace {

constexpr const char kDefaultReporter[] = "tabular";

std::string JoinNames(const std::vector<std::string> &names) {
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
void RequireRegistrable(const std::string &name, const Factory &factory) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
}

} // namespace

namespace tabledep {

void ComponentRegistry::RegisterScanner(const std::string &name,
                                        ScannerFactory factory) {
  RequireRegistrable(name, factory);
  const auto duplicate =
      std::any_of(scanners_.begin(), scanners_.end(),
                  [&](const auto &entry) { return entry.first == name; });
  if (duplicate) {
    throw std::invalid_argument("Scanner with name '" + name +
                                "' already registered");
  }
  scanners_.emplace_back(name, std::move(factory));
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RequireRegistrable(name, factory);
  if (reporters_.count(name) != 0) {
    throw std::invalid_argument("Reporter with name '" + name +
                                "' already registered");
  }
  reporters_.emplace(name, std::move(factory));
  if (set_as_default || default_reporter_.empty()) {
    default_reporter_ = name;
  }
}

void ComponentRegistry::ValidateScannerSelection(
    const std::vector<std::string> &selection) const {
  const auto names = ScannerNames();
  for (const auto &name : selection) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
      throw std::invalid_argument("Unknown scanner '" + name +
                                  "'. Registered: " + JoinNames(names));
    }
  }
}

std::vector<std::unique_ptr<Scanner>>
ComponentRegistry::CreateScanners(const ScanTarget &target,
                                  const SchemaIndex &index,
                                  const std::vector<std::string> &selection) const {
  ValidateScannerSelection(selection);

  std::vector<std::unique_ptr<Scanner>> scanners;
  for (const auto &[name, factory] : scanners_) {
    if (!selection.empty() &&
        std::find(selection.begin(), selection.end(), name) ==
            selection.end()) {
      continue;
    }
    auto scanner = factory(target, index);
    if (!scanner) {
      throw std::runtime_error("Factory for scanner '" + name +
                               "' returned null");
    }
    scanners.push_back(std::move(scanner));
  }
  return scanners;
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  const auto target_name = name.empty() ? default_reporter_ : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default reporter registered");
  }
  const auto found = reporters_.find(target_name);
  if (found == reporters_.end()) {
    throw std::invalid_argument("Unknown reporter '" + target_name +
                                "'. Registered: " + JoinNames(ReporterNames()));
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for reporter '" + target_name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::string> ComponentRegistry::ScannerNames() const {
  std::vector<std::string> names;
  names.reserve(scanners_.size());
  for (const auto &entry : scanners_) {
    names.push_back(entry.first);
  }
  return names;
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  std::vector<std::string> names;
  names.reserve(reporters_.size());
  for (const auto &entry : reporters_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return default_reporter_;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterScanner("SchemaScanner",
                           [](const ScanTarget &target, const SchemaIndex &) {
                             return std::make_unique<SchemaScanner>(target);
                           });
  registry.RegisterScanner("MigrationScanner",
                           [](const ScanTarget &target, const SchemaIndex &) {
                             return std::make_unique<MigrationScanner>(target);
                           });
  registry.RegisterScanner(
      "AssociationScanner",
      [](const ScanTarget &target, const SchemaIndex &index) {
        return std::make_unique<AssociationScanner>(target, index.known_tables);
      });
  registry.RegisterScanner("RawQueryScanner",
                           [](const ScanTarget &target, const SchemaIndex &) {
                             return std::make_unique<RawQueryScanner>(target);
                           });
  registry.RegisterScanner("ConfigScanner",
                           [](const ScanTarget &target, const SchemaIndex &) {
                             return std::make_unique<ConfigScanner>(target);
                           });
  registry.RegisterScanner("ContextualScanner",
                           [](const ScanTarget &target, const SchemaIndex &) {
                             return std::make_unique<ContextualScanner>(target);
                           });
  registry.RegisterScanner(
      "PolymorphicResolver",
      [](const ScanTarget &target, const SchemaIndex &) {
        return std::make_unique<PolymorphicResolver>(target);
      });
  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<TabularReporter>(); },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace tabledep
