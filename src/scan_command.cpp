#include <tabledep/scan_command.h>

#include <tabledep/cli_exit_codes.h>
#include <tabledep/component_registry.h>
#include <tabledep/default_scan_pipeline.h>
#include <tabledep/scan_pipeline_builder.h>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using tabledep::ScanOptions;

volatile std::sig_atomic_t g_interrupted = 0;

void HandleInterrupt(int) { g_interrupted = 1; }

// Routes SIGINT into the scan's cancellation predicate while alive.
class InterruptGuard {
public:
  InterruptGuard() {
    g_interrupted = 0;
    previous_ = std::signal(SIGINT, HandleInterrupt);
  }
  ~InterruptGuard() { std::signal(SIGINT, previous_); }
  InterruptGuard(const InterruptGuard &) = delete;
  InterruptGuard &operator=(const InterruptGuard &) = delete;

private:
  void (*previous_)(int) = SIG_DFL;
};

void PrintScanUsage() {
  std::cout
      << "Usage: tabledep-scan scan --root <path> --table <name> [options]\n"
      << "Options:\n"
      << "  --root <path>            Root directory of the Rails application\n"
      << "  --table <name>           Table whose dependents are reported\n"
      << "  --foreign-key <column>   Foreign key column name override\n"
      << "  --primary-key <column>   Primary key of the table (default: id)\n"
      << "  --min-confidence <level> HIGH, MEDIUM or LOW (default: LOW)\n"
      << "  --strict                 Drop columns missing from db/schema.rb\n"
      << "                           instead of downgrading them\n"
      << "  --format <list>          Comma-separated list of output formats\n"
      << "                           (supported: csv,markdown,json; default: "
         "csv)\n"
      << "  --out <path>             Directory for report files (default: "
         "stdout)\n"
      << "  --config <file>          Optional YAML config file\n"
      << "  --scanners <list>        Comma-separated subset of scanners to run\n"
      << "  --reporter <name>        Reporter plug-in to render outputs\n"
      << "  --log-level <level>      Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose                Shortcut for --log-level info\n"
      << "  --debug                  Shortcut for --log-level debug\n"
      << "  --help                   Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value, const std::string &key_name) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a boolean, got: " + value);
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format != "csv" && format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, ScanOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = tabledep::ParseLogLevel(
        Trim(RequireValue(arguments, index, argument)));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = tabledep::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = tabledep::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleTargetOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ScanOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--table") {
    options.table = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--foreign-key") {
    options.foreign_key = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--primary-key") {
    options.primary_key = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--min-confidence") {
    options.min_confidence =
        tabledep::ParseConfidence(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--strict") {
    options.strict = true;
    return true;
  }
  return false;
}

bool HandlePluginSelection(const std::vector<std::string> &arguments,
                           std::size_t &index, ScanOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--scanners") {
    AppendValues(RequireValue(arguments, index, argument), options.scanners);
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool DispatchScanOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ScanOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  return HandleTargetOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options) ||
         HandlePluginSelection(arguments, index, options);
}

void ValidateScanOptions(const ScanOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
  if (!options.table || Trim(*options.table).empty()) {
    throw std::invalid_argument("--table is required (or set in config file)");
  }
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "root",     "table",     "foreign_key", "primary_key",
      "min_confidence",        "strict",      "formats",
      "out",      "log_level", "scanners",    "reporter"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"local_path", "root"},
      {"table_name", "table"},
      {"fk_column", "foreign_key"},
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>(), key_name);
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "scanners") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "strict") {
    return ConfigValue{ExtractBool(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, ScanOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "root") {
      options.root = std::get<std::string>(value);
      continue;
    }
    if (key == "table") {
      options.table = std::get<std::string>(value);
      continue;
    }
    if (key == "foreign_key") {
      options.foreign_key = std::get<std::string>(value);
      continue;
    }
    if (key == "primary_key") {
      options.primary_key = std::get<std::string>(value);
      continue;
    }
    if (key == "min_confidence") {
      options.min_confidence =
          tabledep::ParseConfidence(std::get<std::string>(value));
      continue;
    }
    if (key == "strict") {
      options.strict = std::get<bool>(value);
      continue;
    }
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "out") {
      options.output_directory = std::get<std::string>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level =
          tabledep::ParseLogLevel(Trim(std::get<std::string>(value)));
      continue;
    }
    if (key == "scanners") {
      options.scanners = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "reporter") {
      options.reporter = std::get<std::string>(value);
      continue;
    }
    ThrowUnknownKey(key);
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const ScanOptions &options, const tabledep::Report &report) {
  if (!options.output_directory) {
    std::cout << report.csv << report.markdown << report.json;
    if (!report.json.empty()) {
      std::cout << "\n";
    }
    return;
  }
  const auto &root = *options.output_directory;
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "tabledep_report.csv", report.csv);
  WriteFileIfContent(root / "tabledep_report.md", report.markdown);
  WriteFileIfContent(root / "tabledep_report.json", report.json);
  std::cerr << "Results written to " << root.string() << "\n";
}

tabledep::LoggingConfig BuildLoggingConfig(const ScanOptions &options) {
  tabledep::LoggingConfig logging;
  logging.level = options.log_level.value_or(tabledep::LogLevel::kWarn);
  return logging;
}

} // namespace

namespace tabledep {

ScanOptions ParseScanArguments(const std::vector<std::string> &arguments) {
  ScanOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchScanOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

ScanOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  ScanOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

ScanOptions MergeOptions(const ScanOptions &config_options,
                         const ScanOptions &cli_options) {
  ScanOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.table, cli_options.table);
  override_value(merged.foreign_key, cli_options.foreign_key);
  override_value(merged.primary_key, cli_options.primary_key);
  override_value(merged.min_confidence, cli_options.min_confidence);
  override_value(merged.strict, cli_options.strict);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  if (!cli_options.scanners.empty()) {
    merged.scanners = cli_options.scanners;
  }
  return merged;
}

ScanOptions ResolveScanOptions(const ScanOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  ScanOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateScanOptions(merged);
  return merged;
}

ScanRequest BuildScanRequest(const ScanOptions &options) {
  ScanRequest request;
  request.root_path = options.root ? options.root->string() : "";
  request.table_name = Trim(options.table.value_or(""));
  request.foreign_key = options.foreign_key.value_or("");
  request.primary_key = options.primary_key.value_or("");
  request.min_confidence = options.min_confidence.value_or(Confidence::kLow);
  request.validation = options.strict.value_or(false) ? ValidationMode::kStrict
                                                      : ValidationMode::kLenient;
  return request;
}

ReportConfig BuildReportConfig(const ScanOptions &options) {
  ReportConfig config;
  config.root_path = options.root ? options.root->string() : "";
  config.table_name = Trim(options.table.value_or(""));
  config.min_confidence = options.min_confidence.value_or(Confidence::kLow);
  config.formats = options.formats.empty() ? std::vector<std::string>{"csv"}
                                           : options.formats;
  return config;
}

void PrintScanSummary(const ScanOutcome &outcome, Confidence min_confidence,
                      std::ostream &stream) {
  if (outcome.status == ScanStatus::kCancelled) {
    stream << "Scan cancelled.\n";
    return;
  }
  const auto &statistics = outcome.statistics;
  stream << "Found " << statistics.total_files_scanned
         << " scannable files.\n";
  for (const auto &[name, count] : statistics.scanner_hits) {
    stream << "  " << name << ": " << count << " hits\n";
  }
  stream << "\n"
         << statistics.after_filter << " results (min confidence: "
         << ConfidenceName(min_confidence) << ").\n";
}

int RunScan(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseScanArguments(arguments);
  if (cli_options.show_help) {
    PrintScanUsage();
    return 0;
  }

  const auto merged = ResolveScanOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  ScanPipelineBuilder builder;
  builder.WithLogger(logger);
  if (!merged.scanners.empty()) {
    builder.WithScannerNames(merged.scanners);
  }
  auto pipeline = builder.Build();
  auto reporter =
      GlobalComponentRegistry().CreateReporter(merged.reporter.value_or(""));

  auto request = BuildScanRequest(merged);
  std::cerr << "Scanning " << request.root_path << " for '"
            << request.table_name << "' references...\n";

  InterruptGuard interrupt_guard;
  request.is_cancelled = []() { return g_interrupted != 0; };
  const auto outcome = pipeline.Run(request);

  PrintScanSummary(outcome, request.min_confidence, std::cerr);
  if (outcome.status == ScanStatus::kCompleted) {
    WriteReports(merged, reporter->Render(outcome, BuildReportConfig(merged)));
  }
  return ScanExitCode(outcome);
}

int RunListScanners(const std::vector<std::string> &arguments) {
  for (const auto &argument : arguments) {
    if (argument == "--help" || argument == "-h") {
      std::cout << "Usage: tabledep-scan scanners\n"
                << "Lists the registered scanners in run order.\n";
      return 0;
    }
    throw std::invalid_argument("Unknown scanners argument: " + argument);
  }
  for (const auto &name : GlobalComponentRegistry().ScannerNames()) {
    std::cout << name << "\n";
  }
  return 0;
}

} // namespace tabledep
