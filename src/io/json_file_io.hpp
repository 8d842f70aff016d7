#ifndef JSON_FILE_IO_HPP
#define JSON_FILE_IO_HPP

#include "event_source.hpp"
#include "learning/learning_profile.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <string>
#include <vector>

// Reads a JSON array of events:
//   { "id", "dataType", "source", "value": number | object, "timestamp" }
class JsonFileEventSource : public IEventSource {
public:
  // Throws std::runtime_error when the file cannot be opened.
  explicit JsonFileEventSource(const std::string &filepath);

  // Throws InvalidBatchError for malformed content.
  std::vector<Event> fetch_events() override;
  const char *get_name() const override { return "JsonFileEventSource"; }

private:
  std::string filepath_;
  std::ifstream stream_;
};

// Writes each result as one JSON document. A path of "-" means stdout.
class JsonFileAnalysisSink : public IAnalysisSink {
public:
  JsonFileAnalysisSink(const std::string &filepath, bool pretty);
  ~JsonFileAnalysisSink() override;

  bool store(const analysis::AnalysisResult &result) override;
  const char *get_name() const override { return "JsonFileAnalysisSink"; }

private:
  std::string filepath_;
  bool pretty_;
  std::ofstream stream_;
};

namespace JsonInput {

// All of these throw InvalidBatchError on structural problems.
Event parse_event(const nlohmann::json &j);
std::vector<Event> parse_events(const nlohmann::json &j);
learning::Feedback parse_feedback_entry(const nlohmann::json &j);
std::vector<learning::Feedback> parse_feedback(const nlohmann::json &j);

// Throws std::runtime_error if the file cannot be opened and
// InvalidBatchError if its content is not a valid feedback list.
std::vector<learning::Feedback> read_feedback_file(const std::string &filepath);

} // namespace JsonInput

#endif // JSON_FILE_IO_HPP
