#include "analysis/analysis_orchestrator.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/json_file_io.hpp"
#include "learning/profile_registry.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_IO_ERROR = 1;
constexpr int EXIT_REQUEST_ERROR = 2;

struct CommandLine {
  std::string config_path = "config.ini";
  std::optional<std::string> events_path;
  std::optional<std::string> feedback_path;
  std::optional<std::string> output_path;
  std::optional<std::string> user_id;
  std::optional<uint64_t> seed;
  bool parallel = false;
};

void print_usage(const char *program) {
  std::cerr << "Usage: " << program
            << " [config.ini] [--events PATH] [--feedback PATH]"
               " [--output PATH] [--user ID] [--seed N] [--parallel]\n";
}

// Returns nullopt (after printing the problem) on malformed arguments.
std::optional<CommandLine> parse_command_line(int argc, char *argv[]) {
  CommandLine cl;
  bool config_seen = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_value = [&](const char *flag) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "--events" || arg == "--feedback" || arg == "--output" ||
        arg == "--user" || arg == "--seed") {
      auto value = next_value(arg.c_str());
      if (!value)
        return std::nullopt;
      if (arg == "--events")
        cl.events_path = *value;
      else if (arg == "--feedback")
        cl.feedback_path = *value;
      else if (arg == "--output")
        cl.output_path = *value;
      else if (arg == "--user")
        cl.user_id = *value;
      else {
        cl.seed = Utils::string_to_number<uint64_t>(*value);
        if (!cl.seed || value->empty()) {
          std::cerr << "Invalid seed: " << *value << "\n";
          return std::nullopt;
        }
      }
    } else if (arg == "--parallel") {
      cl.parallel = true;
    } else if (!arg.empty() && arg[0] != '-' && !config_seen) {
      cl.config_path = arg;
      config_seen = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  return cl;
}

} // namespace

int main(int argc, char *argv[]) {
  auto command_line = parse_command_line(argc, argv);
  if (!command_line) {
    print_usage(argv[0]);
    return EXIT_REQUEST_ERROR;
  }
  const CommandLine &cl = *command_line;

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(cl.config_path))
    std::cerr << "Continuing with default configuration." << std::endl;

  Config::AppConfig config = *config_manager.get_config();
  if (cl.events_path)
    config.events_input_path = *cl.events_path;
  if (cl.feedback_path)
    config.feedback_input_path = *cl.feedback_path;
  if (cl.output_path)
    config.result_output_path = *cl.output_path;
  if (cl.user_id)
    config.user_id = *cl.user_id;
  if (cl.parallel)
    config.parallel_categories = true;

  // --- Initialize Logging ---
  if (config.logging.log_levels.empty())
    Config::apply_default_log_levels(config.logging);
  LogManager::instance().configure(config.logging);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Pattern analyzer starting for user " << config.user_id);

  analysis::AnalysisOrchestrator orchestrator(config);
  learning::ProfileRegistry registry(config.learning);
  const auto now_ms = static_cast<int64_t>(Utils::get_current_time_ms());

  try {
    // Feedback collected since the last run shapes this run's profile.
    if (!config.feedback_input_path.empty()) {
      auto feedback = JsonInput::read_feedback_file(config.feedback_input_path);
      auto summary = registry.submit(config.user_id, feedback, now_ms);
      LOG(LogLevel::INFO, LogComponent::LEARNING,
          "Profile for " << config.user_id << " now holds "
                         << summary.total_feedback
                         << " feedback entries, average rating "
                         << summary.average_rating);
    }

    JsonFileEventSource source(config.events_input_path);
    std::vector<Event> events = source.fetch_events();
    LOG(LogLevel::INFO, LogComponent::IO_READER,
        source.get_name() << " supplied " << events.size() << " events");

    analysis::AnalysisOptions options;
    options.reference_time_ms = now_ms;
    options.seed = cl.seed;

    auto outcome =
        orchestrator.analyze(events, registry.snapshot(config.user_id), options);

    JsonFileAnalysisSink sink(config.result_output_path,
                              config.pretty_print_result);
    if (!sink.store(outcome.result)) {
      LOG(LogLevel::FATAL, LogComponent::IO_WRITER,
          sink.get_name() << " could not write analysis result to "
                          << config.result_output_path);
      return EXIT_IO_ERROR;
    }
  } catch (const FeatureExtractionError &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE, "Rejected batch: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_REQUEST_ERROR;
  } catch (const InvalidBatchError &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE, "Rejected batch: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_REQUEST_ERROR;
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE, "Rejected request: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_REQUEST_ERROR;
  } catch (const std::runtime_error &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "I/O failure: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_IO_ERROR;
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Pattern analyzer finished.");
  return 0;
}
