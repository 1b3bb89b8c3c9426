#include "Solver.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <cmath>
#include <vector>

namespace pythia {

const char* MetricName(ScoreMetric metric) {
  switch (metric) {
    case ScoreMetric::kEntropy:
      return "entropy";
    case ScoreMetric::kMinimax:
      return "minimax";
  }
  return "unknown";
}

bool ParseMetric(std::string_view text, ScoreMetric* out) {
  ScoreMetric metric;
  if (text == "entropy") {
    metric = ScoreMetric::kEntropy;
  } else if (text == "minimax" || text == "worst-case") {
    metric = ScoreMetric::kMinimax;
  } else {
    return false;
  }
  if (out) {
    *out = metric;
  }
  return true;
}

GuessScorer::GuessScorer(const Dictionary& dictionary, ScoreMetric metric)
    : dictionary_(dictionary), metric_(metric) {}

PatternHistogram GuessScorer::PatternCounts(const CandidateSet& candidates,
                                            const Word& guess) const {
  PatternHistogram counts{};
  counts.fill(0);
  const PackedWord& packed_guess = guess.packed();
  for (size_t index : candidates) {
    counts[Score(packed_guess, dictionary_[index].packed()).code()]++;
  }
  return counts;
}

double GuessScorer::ScoreGuess(const CandidateSet& candidates,
                               const Word& guess) const {
  if (candidates.empty()) {
    return 0.0;
  }
  PatternHistogram counts = PatternCounts(candidates, guess);
  if (metric_ == ScoreMetric::kMinimax) {
    return -static_cast<double>(LargestBucket(counts));
  }
  return Entropy(counts, candidates.size());
}

double GuessScorer::Entropy(const PatternHistogram& counts, size_t total) {
  if (total == 0) {
    return 0.0;
  }
  double entropy = 0.0;
  const double inv_total = 1.0 / static_cast<double>(total);
  for (int count : counts) {
    if (count == 0) {
      continue;
    }
    double p = count * inv_total;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

int GuessScorer::LargestBucket(const PatternHistogram& counts) {
  return *std::max_element(counts.begin(), counts.end());
}

bool IsBetterGuess(const StrategyResult& a, const StrategyResult& b) {
  if (a.score > b.score + kScoreTolerance) {
    return true;
  }
  if (b.score > a.score + kScoreTolerance) {
    return false;
  }
  if (a.is_candidate != b.is_candidate) {
    return a.is_candidate;
  }
  return a.index < b.index;
}

StrategySearch::StrategySearch(const Dictionary& dictionary,
                               SearchOptions options)
    : dictionary_(dictionary),
      options_(options),
      scorer_(dictionary, options.metric) {
  if (options_.chunk_size == 0) {
    options_.chunk_size = kDefaultChunkSize;
  }
}

int StrategySearch::WorkerCount() const {
  if (options_.workers > 0) {
    return options_.workers;
  }
#ifdef _OPENMP
  return omp_get_max_threads();
#else
  return 1;
#endif
}

StrategySearch::ChunkBest StrategySearch::ScanChunk(
    const CandidateSet& pool,
    size_t begin,
    size_t end,
    const CandidateSet& candidates,
    const std::vector<uint8_t>& is_candidate) const {
  ChunkBest chunk;
  for (size_t i = begin; i < end; ++i) {
    size_t guess_index = pool[i];
    StrategyResult scored;
    scored.index = guess_index;
    scored.guess = dictionary_[guess_index];
    scored.score = scorer_.ScoreGuess(candidates, scored.guess);
    scored.is_candidate = is_candidate[guess_index] != 0;
    if (!chunk.has_best || IsBetterGuess(scored, chunk.best)) {
      chunk.best = scored;
      chunk.has_best = true;
    }
  }
  return chunk;
}

SolverStatus StrategySearch::BestGuess(const CandidateSet& candidates,
                                       StrategyResult* result) const {
  if (candidates.empty() || dictionary_.empty()) {
    return SolverStatus::kInvalidState;
  }

  // Every index is validated here, so the workers below only ever see
  // in-range pool entries.
  std::vector<uint8_t> is_candidate(dictionary_.size(), 0);
  for (size_t index : candidates) {
    if (index >= dictionary_.size()) {
      return SolverStatus::kInternalFault;
    }
    is_candidate[index] = 1;
  }

  const CandidateSet pool =
      options_.hard_mode ? candidates : dictionary_.AllIndices();
  const size_t chunk_size = std::min(options_.chunk_size, pool.size());
  const size_t chunk_count =
      pool.size() / chunk_size + (pool.size() % chunk_size != 0 ? 1 : 0);
  std::vector<ChunkBest> chunks(chunk_count);

  // Chunk boundaries depend only on chunk_size, so the fold below sees the
  // same winners for any number of workers.
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) num_threads(WorkerCount())
#endif
  for (size_t c = 0; c < chunk_count; ++c) {
    size_t begin = c * chunk_size;
    size_t end = begin + std::min(chunk_size, pool.size() - begin);
    chunks[c] = ScanChunk(pool, begin, end, candidates, is_candidate);
  }

  ChunkBest merged;
  for (const ChunkBest& chunk : chunks) {
    if (!chunk.has_best) {
      continue;
    }
    if (!merged.has_best || IsBetterGuess(chunk.best, merged.best)) {
      merged.best = chunk.best;
      merged.has_best = true;
    }
  }
  if (!merged.has_best) {
    return SolverStatus::kInternalFault;
  }
  if (result) {
    *result = merged.best;
  }
  return SolverStatus::kOk;
}

OpeningCache::OpeningCache(const StrategySearch& search) : search_(search) {}

SolverStatus OpeningCache::Get(StrategyResult* result) {
  std::call_once(once_, [this] {
    ++computations_;
    status_ = search_.BestGuess(search_.dictionary().AllIndices(), &result_);
    ready_.store(true, std::memory_order_release);
  });
  if (status_ != SolverStatus::kOk) {
    return status_;
  }
  if (result) {
    *result = result_;
  }
  return SolverStatus::kOk;
}

bool OpeningCache::Seed(const StrategyResult& result) {
  bool seeded = false;
  std::call_once(once_, [this, &result, &seeded] {
    result_ = result;
    status_ = SolverStatus::kOk;
    ready_.store(true, std::memory_order_release);
    seeded = true;
  });
  return seeded;
}

SolverStatus OpeningCache::BestOpeningGuess(Word* out) {
  StrategyResult result;
  SolverStatus status = Get(&result);
  if (status == SolverStatus::kOk && out) {
    *out = result.guess;
  }
  return status;
}

}  // namespace pythia
