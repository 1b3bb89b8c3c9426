#include "Solver.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace pythia {

SolverStatus OpeningStore::LoadFile(const std::string& path,
                                    OpeningStore* out,
                                    std::string* error) {
  std::ifstream input(path);
  if (!input) {
    if (error) {
      *error = "cannot open " + path;
    }
    return SolverStatus::kIoError;
  }

  OpeningStore store;
  std::string line;
  size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::istringstream fields(line);
    uint64_t fingerprint = 0;
    std::string metric_name;
    std::string word_text;
    std::string extra;
    fields >> std::hex >> fingerprint >> std::dec >> metric_name >> word_text;
    ScoreMetric metric = ScoreMetric::kEntropy;
    Word word;
    bool well_formed = !fields.fail() && !(fields >> extra) &&
                       ParseMetric(metric_name, &metric) &&
                       Word::Parse(word_text, &word);
    if (!well_formed) {
      if (error) {
        *error = path + ":" + std::to_string(line_number) +
                 ": expected '<fingerprint> <metric> <word>'";
      }
      return SolverStatus::kIoError;
    }
    store.entries_[{fingerprint, metric}] = word;
  }

  if (out) {
    *out = std::move(store);
  }
  return SolverStatus::kOk;
}

SolverStatus OpeningStore::SaveFile(const std::string& path,
                                    std::string* error) const {
  std::ofstream output(path, std::ios::trunc);
  if (!output) {
    if (error) {
      *error = "cannot write " + path;
    }
    return SolverStatus::kIoError;
  }
  for (const auto& entry : entries_) {
    output << std::hex << std::setw(16) << std::setfill('0')
           << entry.first.first << std::dec << std::setfill(' ') << " "
           << MetricName(entry.first.second) << " " << entry.second.text()
           << "\n";
  }
  output.flush();
  if (!output) {
    if (error) {
      *error = "write failed for " + path;
    }
    return SolverStatus::kIoError;
  }
  return SolverStatus::kOk;
}

bool OpeningStore::Lookup(const StrategySearch& search,
                          StrategyResult* result) const {
  const Dictionary& dictionary = search.dictionary();
  auto it = entries_.find({dictionary.Fingerprint(), search.options().metric});
  if (it == entries_.end()) {
    return false;
  }
  size_t index = 0;
  if (!dictionary.Find(it->second, &index)) {
    return false;
  }
  if (result) {
    result->index = index;
    result->guess = it->second;
    result->score =
        search.scorer().ScoreGuess(dictionary.AllIndices(), it->second);
    // The opening is scored against the whole dictionary.
    result->is_candidate = true;
  }
  return true;
}

void OpeningStore::Remember(const StrategySearch& search,
                            const StrategyResult& result) {
  entries_[{search.dictionary().Fingerprint(), search.options().metric}] =
      result.guess;
}

}  // namespace pythia
