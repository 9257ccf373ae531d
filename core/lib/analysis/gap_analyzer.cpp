// odx/analysis/gap_analyzer.cpp - Pattern and gap analysis of orchestrations
#include "odx/analysis/gap_analyzer.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>
#include <system_error>

#include "odx/analysis/shape_walker.hpp"
#include "odx/basic/error.hpp"
#include "odx/basic/string_utils.hpp"
#include "odx/parse/orchestration_loader.hpp"

namespace odx
{

namespace
{

namespace fs = std::filesystem;

// clang-format off
constexpr std::array<std::string_view, 32> k_supported_shapes = {
  "Receive", "Send", "Construct", "Transform", "MessageAssignment",
  "VariableAssignment", "Expression", "Decide", "If", "Else",
  "Loop", "Parallel", "Scope", "Catch", "CatchException",
  "Throw", "Terminate", "Suspend", "Call", "Start",
  "Task", "Listen", "Delay", "While", "Until",
  "AtomicTransaction", "LongRunningTransaction", "Compensation",
  "Compensate", "CallRules", "CallPolicy", "Group",
};

constexpr std::array<std::string_view, 6> k_partial_shapes = {
  "CallRules", "CallPolicy", "Compensation", "Compensate",
  "AtomicTransaction", "LongRunningTransaction",
};
// clang-format on

template <size_t N>
bool contains_icase(const std::array<std::string_view, N> & set, std::string_view value)
{
  return std::any_of(
    set.begin(), set.end(), [&](std::string_view s) { return iequals(s, value); });
}

void add_unique(std::vector<std::string> & list, const std::string & value)
{
  if (std::find(list.begin(), list.end(), value) == list.end()) {
    list.push_back(value);
  }
}

// Feature flags keyed on the reported shape type
void detect_features(std::string_view shape_type, AnalysisResult & r)
{
  const std::string t = to_lower(shape_type);
  if (t == "correlationdeclaration" || t == "initializecorrelation" || t == "followscorrelation") {
    r.has_correlation_sets = true;
  } else if (t == "dynamicport") {
    r.has_dynamic_ports = true;
  } else if (t == "atomictransaction" || t == "longrunningtransaction") {
    r.has_transactions = true;
  } else if (t == "catch" || t == "catchexception") {
    r.has_exception_handling = true;
  } else if (t == "callrules" || t == "callpolicy") {
    r.has_business_rules = true;
  } else if (t == "compensation" || t == "compensate") {
    r.has_compensation = true;
  } else if (t == "loop" || t == "foreach" || t == "while" || t == "until") {
    r.has_loops = true;
  } else if (t == "parallel") {
    r.has_parallel = true;
  } else if (t == "listen") {
    r.has_listen = true;
  } else if (t == "delay") {
    r.has_delay = true;
  } else if (t == "call" || t == "start" || t == "startorchestration") {
    r.has_call_orchestration = true;
  } else if (t == "transform") {
    r.has_transform = true;
  }
}

struct PatternCounts
{
  int receive = 0;
  int send = 0;
  int decide = 0;
  int parallel = 0;
  int construct = 0;
  int transform = 0;
};

void detect_design_patterns(const PatternCounts & c, AnalysisResult & r)
{
  r.has_aggregator = c.receive >= 2 && r.has_correlation_sets && (c.construct > 0 || c.transform > 0);
  r.has_content_based_routing = c.decide > 0 && c.send >= 2;
  r.has_scatter_gather = c.parallel > 0 && c.send >= 2 && c.receive >= 2;
  r.has_message_broker = c.receive >= 2 && c.decide > 0 && c.send >= 2;
}

bool matches_extension(const fs::path & file, const std::vector<std::string> & extensions)
{
  const std::string ext = file.extension().string();
  return std::any_of(extensions.begin(), extensions.end(), [&](const std::string & e) {
    return iequals(e, ext);
  });
}

}  // namespace

// ============================================================================
// FrequencyTable
// ============================================================================

void FrequencyTable::add(const std::string & key, int n)
{
  for (auto & e : entries_) {
    if (e.first == key) {
      e.second += n;
      return;
    }
  }
  entries_.emplace_back(key, n);
}

int FrequencyTable::count(std::string_view key) const
{
  for (const auto & e : entries_) {
    if (e.first == key) {
      return e.second;
    }
  }
  return 0;
}

bool FrequencyTable::contains(std::string_view key) const
{
  return std::any_of(
    entries_.begin(), entries_.end(), [&](const Entry & e) { return e.first == key; });
}

std::vector<FrequencyTable::Entry> FrequencyTable::by_frequency() const
{
  std::vector<Entry> sorted = entries_;
  std::stable_sort(sorted.begin(), sorted.end(), [](const Entry & a, const Entry & b) {
    return a.second > b.second;
  });
  return sorted;
}

// ============================================================================
// Support sets
// ============================================================================

bool is_supported_shape(std::string_view shape_type)
{
  return contains_icase(k_supported_shapes, shape_type);
}

bool is_partially_supported_shape(std::string_view shape_type)
{
  return contains_icase(k_partial_shapes, shape_type);
}

// ============================================================================
// GapAnalysisReport
// ============================================================================

const std::vector<std::string> * GapAnalysisReport::examples_for(std::string_view shape_type) const
{
  for (const auto & e : unsupported_shape_examples) {
    if (e.first == shape_type) {
      return &e.second;
    }
  }
  return nullptr;
}

double GapAnalysisReport::success_rate() const
{
  if (total_files == 0) {
    return 0.0;
  }
  return parsed_files * 100.0 / total_files;
}

// ============================================================================
// Per-model analysis
// ============================================================================

void analyze_model(const OrchestrationModel & model, AnalysisResult & result)
{
  PatternCounts counts;
  int activating_receives = 0;
  int correlation_sets = 0;

  ShapeWalker walker(model);
  walker.walk([&](ShapeId, const Shape & shape, size_t) {
    const std::string type = shape.shape_type.empty() ? std::string("Unknown") : shape.shape_type;

    add_unique(result.shape_types, type);
    result.shape_type_counts.add(type);

    if (!is_supported_shape(type) && type != "Unknown") {
      add_unique(result.unsupported_shapes, type);
    } else if (is_partially_supported_shape(type)) {
      add_unique(result.partially_supported_shapes, type);
    }

    detect_features(type, result);

    if (iequals(type, "Receive")) ++counts.receive;
    if (iequals(type, "Send")) ++counts.send;
    if (iequals(type, "Decide") || iequals(type, "If")) ++counts.decide;
    if (iequals(type, "Parallel")) ++counts.parallel;
    if (iequals(type, "Construct")) ++counts.construct;
    if (iequals(type, "Transform")) ++counts.transform;

    if (const auto * recv = shape.as<ReceivePayload>(); recv != nullptr && recv->activate) {
      ++activating_receives;
    }
    if (shape.is(ShapeKind::CorrelationDeclaration)) {
      ++correlation_sets;
    }
  });

  result.port_count = static_cast<int>(model.ports.size());
  result.message_count = static_cast<int>(model.messages.size());
  result.correlation_set_count = correlation_sets;
  if (correlation_sets > 0) {
    result.has_correlation_sets = true;
  }

  result.has_convoy = activating_receives > 1 || correlation_sets > 1;

  result.has_solicit_response =
    std::any_of(model.ports.begin(), model.ports.end(), [](const PortModel & p) {
      return p.direction == PortDirection::ReceiveSend || p.direction == PortDirection::SendReceive;
    });

  detect_design_patterns(counts, result);
}

AnalysisResult analyze_file(const fs::path & path, DiagnosticBag * diags)
{
  AnalysisResult result;
  result.file_name = path.filename().string();

  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  result.file_size_bytes = ec ? 0 : size;

  try {
    const OrchestrationModel model = load_orchestration(path, diags);
    result.parsed = true;
    analyze_model(model, result);
  } catch (const OdxError & e) {
    result.parsed = false;
    result.parse_error = e.what();
  } catch (const std::exception & e) {
    result.parsed = false;
    result.parse_error = e.what();
  }

  if (!result.parsed && diags != nullptr) {
    diags->report_error(0, result.parse_error).with_code("A001").with_source(result.file_name);
  }
  return result;
}

// ============================================================================
// Aggregation
// ============================================================================

void accumulate(GapAnalysisReport & report, AnalysisResult result)
{
  ++report.total_files;
  if (!result.parsed) {
    ++report.failed_files;
    report.file_details.push_back(std::move(result));
    return;
  }

  ++report.parsed_files;
  const std::string & name = result.file_name;

  for (const auto & [type, n] : result.shape_type_counts.entries()) {
    report.shape_type_frequency.add(type, n);
  }

  for (const auto & type : result.unsupported_shapes) {
    report.unsupported_shape_frequency.add(type);
    auto it = std::find_if(
      report.unsupported_shape_examples.begin(), report.unsupported_shape_examples.end(),
      [&](const auto & e) { return e.first == type; });
    if (it == report.unsupported_shape_examples.end()) {
      report.unsupported_shape_examples.emplace_back(type, std::vector<std::string>{});
      it = std::prev(report.unsupported_shape_examples.end());
    }
    if (it->second.size() < GapAnalysisReport::k_max_examples) {
      it->second.push_back(name);
    }
  }

  if (result.has_correlation_sets) report.files_with_correlation.push_back(name);
  if (result.has_dynamic_ports) report.files_with_dynamic_ports.push_back(name);
  if (result.has_transactions) report.files_with_transactions.push_back(name);
  if (result.has_business_rules) report.files_with_business_rules.push_back(name);
  if (result.has_compensation) report.files_with_compensation.push_back(name);
  if (result.has_convoy) report.files_with_convoy.push_back(name);
  if (result.has_aggregator) report.files_with_aggregator.push_back(name);
  if (result.has_content_based_routing) report.files_with_content_based_routing.push_back(name);
  if (result.has_scatter_gather) report.files_with_scatter_gather.push_back(name);
  if (result.has_message_broker) report.files_with_message_broker.push_back(name);

  report.file_details.push_back(std::move(result));
}

void generate_recommendations(GapAnalysisReport & report)
{
  auto & out = report.recommendations;
  out.clear();

  if (!report.files_with_business_rules.empty()) {
    out.push_back(fmt::format(
      "P0 - Business Rules Engine Support: {} files use CallRules. "
      "Implement Logic Apps Rules Engine.",
      report.files_with_business_rules.size()));
  }
  if (!report.files_with_correlation.empty()) {
    out.push_back(fmt::format(
      "P0 - Advanced Correlation Support: {} files use correlation sets. "
      "Enhance correlation mapping to use Logic Apps state management (stateful).",
      report.files_with_correlation.size()));
  }
  if (!report.files_with_convoy.empty()) {
    out.push_back(fmt::format(
      "P1 - Convoy Pattern Support: {} files use convoy patterns. "
      "Implement sequential/parallel convoy conversion using Service Bus sessions.",
      report.files_with_convoy.size()));
  }
  if (!report.files_with_dynamic_ports.empty()) {
    out.push_back(fmt::format(
      "P1 - Dynamic Port Support: {} files use dynamic ports. "
      "Implement late-binding connector selection using Logic Apps dynamic content or Azure "
      "Functions.",
      report.files_with_dynamic_ports.size()));
  }
  if (!report.files_with_compensation.empty()) {
    out.push_back(fmt::format(
      "P1 - Compensation Logic Support: {} files use compensation. "
      "Implement compensating transactions using Scope error handlers.",
      report.files_with_compensation.size()));
  }
  if (!report.files_with_transactions.empty()) {
    out.push_back(fmt::format(
      "P2 - Transaction Scope Support: {} files use transactions. "
      "Document transaction boundary conversion to Logic Apps Scope with error handling.",
      report.files_with_transactions.size()));
  }
  if (!report.files_with_aggregator.empty()) {
    out.push_back(fmt::format(
      "P2 - Aggregator Pattern: {} files implement aggregator pattern. "
      "Convert using stateful Logic Apps with session-enabled Service Bus queues for message "
      "correlation and aggregation.",
      report.files_with_aggregator.size()));
  }
  if (!report.files_with_content_based_routing.empty()) {
    out.push_back(fmt::format(
      "P2 - Content-Based Routing: {} files use content-based routing. "
      "Implement using Switch/Condition actions with expression-based routing logic.",
      report.files_with_content_based_routing.size()));
  }
  if (!report.files_with_scatter_gather.empty()) {
    out.push_back(fmt::format(
      "P2 - Scatter-Gather Pattern: {} files implement scatter-gather. "
      "Convert using parallel branches for fan-out and Compose action for fan-in aggregation.",
      report.files_with_scatter_gather.size()));
  }
  if (!report.files_with_message_broker.empty()) {
    out.push_back(fmt::format(
      "P2 - Message Broker Pattern: {} files implement message broker. "
      "Consider using Service Bus topics with subscriptions and filters for routing, or API "
      "Management for transformation.",
      report.files_with_message_broker.size()));
  }

  out.emplace_back(
    "P3 - Hybrid Deployment Option: Consider Azure Logic Apps Hybrid deployment model (Kubernetes) "
    "for on-premises deployment if required by industry regulations, data residency "
    "requirements, or latency constraints. This allows running Logic Apps in your own datacenter "
    "while maintaining cloud-native features.");

  for (const auto & [type, n] : report.unsupported_shape_frequency.by_frequency()) {
    std::string examples;
    if (const auto * list = report.examples_for(type)) {
      examples = fmt::format("{}", fmt::join(*list, ", "));
    }
    out.push_back(
      fmt::format("P? - Support for '{}' shape: Found {} occurrences in {}", type, n, examples));
  }
}

// ============================================================================
// Directory scan
// ============================================================================

std::vector<fs::path> list_orchestration_files(
  const fs::path & dir, const DirectoryScanOptions & options)
{
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw OdxError(ErrorKind::IoError, "Directory not found: " + dir.string());
  }

  std::vector<fs::path> files;
  auto consider = [&](const fs::directory_entry & entry) {
    if (entry.is_regular_file() && matches_extension(entry.path(), options.extensions)) {
      files.push_back(entry.path());
    }
  };

  try {
    if (options.recursive) {
      for (const auto & entry : fs::recursive_directory_iterator(dir)) consider(entry);
    } else {
      for (const auto & entry : fs::directory_iterator(dir)) consider(entry);
    }
  } catch (const fs::filesystem_error & e) {
    throw OdxError(ErrorKind::IoError, e.what());
  }
  std::sort(files.begin(), files.end());
  return files;
}

GapAnalysisReport analyze_directory(
  const fs::path & dir, const DirectoryScanOptions & options, DiagnosticBag * diags)
{
  const std::vector<fs::path> files = list_orchestration_files(dir, options);
  if (options.on_files_found) {
    options.on_files_found(files.size());
  }

  GapAnalysisReport report;
  report.directory = dir.string();

  for (const auto & file : files) {
    if (options.cancel != nullptr && options.cancel->load()) {
      report.cancelled = true;
      break;
    }
    AnalysisResult result = analyze_file(file, diags);
    if (options.on_file) {
      options.on_file(result);
    }
    accumulate(report, std::move(result));
  }

  generate_recommendations(report);
  return report;
}

}  // namespace odx
