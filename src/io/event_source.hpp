#ifndef EVENT_SOURCE_HPP
#define EVENT_SOURCE_HPP

#include "analysis/analysis_result.hpp"
#include "core/event.hpp"

#include <vector>

// Where a user's event batch comes from.
class IEventSource {
public:
  virtual ~IEventSource() = default;

  // Returns the complete batch. An empty vector is a valid batch.
  virtual std::vector<Event> fetch_events() = 0;
  virtual const char *get_name() const = 0;
};

// Where finished analyses go.
class IAnalysisSink {
public:
  virtual ~IAnalysisSink() = default;
  virtual bool store(const analysis::AnalysisResult &result) = 0;
  virtual const char *get_name() const = 0;
};

#endif // EVENT_SOURCE_HPP
