#include "Solver.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace pythia {

const char* StateName(SessionState state) {
  switch (state) {
    case SessionState::kActive:
      return "active";
    case SessionState::kSolved:
      return "solved";
    case SessionState::kExhausted:
      return "exhausted";
    case SessionState::kContradiction:
      return "contradiction";
  }
  return "unknown";
}

SolverSession::SolverSession(OpeningCache& strategy, size_t max_guesses)
    : strategy_(strategy),
      max_guesses_(max_guesses),
      candidates_(strategy.search().dictionary().AllIndices()) {
  if (candidates_.empty()) {
    state_ = SessionState::kContradiction;
  } else if (max_guesses_ == 0) {
    state_ = SessionState::kExhausted;
  }
}

size_t SolverSession::guesses_left() const {
  return history_.size() >= max_guesses_ ? 0
                                         : max_guesses_ - history_.size();
}

SolverStatus SolverSession::Suggest(StrategyResult* out) const {
  if (IsTerminal()) {
    return SolverStatus::kInvalidState;
  }
  if (history_.empty()) {
    return strategy_.Get(out);
  }
  return strategy_.search().BestGuess(candidates_, out);
}

SolverStatus SolverSession::Suggest(Word* out) const {
  StrategyResult result;
  SolverStatus status = Suggest(&result);
  if (status == SolverStatus::kOk && out) {
    *out = result.guess;
  }
  return status;
}

SolverStatus SolverSession::Record(const Word& guess, Pattern pattern) {
  if (IsTerminal()) {
    return SolverStatus::kInvalidState;
  }
  if (guess.empty()) {
    return SolverStatus::kMalformedWord;
  }
  history_.push_back(GuessRecord{guess, pattern});
  FilterCandidates(dictionary(), candidates_, guess, pattern, &next_);
  candidates_.swap(next_);

  if (pattern.IsSolved()) {
    state_ = SessionState::kSolved;
  } else if (candidates_.empty()) {
    state_ = SessionState::kContradiction;
  } else if (history_.size() >= max_guesses_) {
    state_ = SessionState::kExhausted;
  }
  return SolverStatus::kOk;
}

SolverStatus SolverSession::Record(std::string_view guess,
                                   std::string_view pattern) {
  if (IsTerminal()) {
    return SolverStatus::kInvalidState;
  }
  Word parsed_guess;
  if (!Word::Parse(guess, &parsed_guess)) {
    return SolverStatus::kMalformedWord;
  }
  Pattern parsed_pattern;
  if (!Pattern::Parse(pattern, &parsed_pattern)) {
    return SolverStatus::kMalformedPattern;
  }
  return Record(parsed_guess, parsed_pattern);
}

SolverStatus SolveToTarget(OpeningCache& strategy,
                           const Word& target,
                           size_t max_steps,
                           std::vector<SolveStep>* steps,
                           SessionState* final_state) {
  if (target.empty()) {
    return SolverStatus::kMalformedWord;
  }
  std::vector<SolveStep> path;
  SolverSession session(strategy, max_steps);

  while (!session.IsTerminal()) {
    StrategyResult suggestion;
    SolverStatus status = session.Suggest(&suggestion);
    if (status != SolverStatus::kOk) {
      return status;
    }
    Pattern pattern = Score(suggestion.guess, target);
    size_t before = session.remaining();
    status = session.Record(suggestion.guess, pattern);
    if (status != SolverStatus::kOk) {
      return status;
    }

    SolveStep step;
    step.guess = suggestion.guess;
    step.pattern = pattern;
    step.score = suggestion.score;
    step.was_candidate = suggestion.is_candidate;
    step.remaining = before;
    step.remaining_after = session.remaining();
    if (step.remaining_after > 0 && before > 0) {
      double p = static_cast<double>(step.remaining_after) /
                 static_cast<double>(before);
      step.info_bits = -std::log2(p);
    }
    path.push_back(step);
  }

  if (steps) {
    steps->swap(path);
  }
  if (final_state) {
    *final_state = session.state();
  }
  return SolverStatus::kOk;
}

SolverStatus RunBenchmark(OpeningCache& strategy,
                          const BenchmarkOptions& options,
                          BenchmarkReport* report) {
  const Dictionary& dictionary = strategy.search().dictionary();
  BenchmarkReport out;
  out.histogram.assign(options.max_guesses + 1, 0);

  // Fail before the first game rather than once per game.
  SolverStatus status = strategy.Get(nullptr);
  if (status != SolverStatus::kOk) {
    return status;
  }

  size_t games = dictionary.size();
  if (options.limit > 0) {
    games = std::min(games, options.limit);
  }

  size_t total_guesses = 0;
  std::vector<SolveStep> steps;
  for (size_t i = 0; i < games; ++i) {
    SessionState state = SessionState::kActive;
    status = SolveToTarget(strategy, dictionary[i], options.max_guesses,
                           &steps, &state);
    if (status != SolverStatus::kOk) {
      return status;
    }
    ++out.games;
    switch (state) {
      case SessionState::kSolved:
        ++out.solved;
        out.histogram[steps.size()]++;
        total_guesses += steps.size();
        break;
      case SessionState::kExhausted:
        ++out.exhausted;
        break;
      case SessionState::kContradiction:
        ++out.contradictions;
        break;
      case SessionState::kActive:
        return SolverStatus::kInternalFault;
    }
  }

  if (out.solved > 0) {
    out.mean_guesses =
        static_cast<double>(total_guesses) / static_cast<double>(out.solved);
  }
  if (report) {
    *report = std::move(out);
  }
  return SolverStatus::kOk;
}

}  // namespace pythia
