#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pythia {

constexpr int kWordLen = 5;
constexpr int kAlphabet = 26;
constexpr int kPatternCount = 243;
constexpr size_t kDefaultMaxGuesses = 6;
constexpr size_t kDefaultChunkSize = 64;
constexpr double kScoreTolerance = 1e-9;

enum class SolverStatus {
  kOk,
  kInvalidState,
  kMalformedWord,
  kMalformedPattern,
  kInternalFault,
  kIoError,
};

const char* StatusName(SolverStatus status);

std::string TrimWhitespace(const std::string& input);
// Decimal digits only, rejecting values above `max_value`.
bool ParseCount(std::string_view text, size_t max_value, size_t* out);

struct PackedWord {
  uint32_t letters = 0;
  uint32_t mask = 0;
};

// Five lower case letters. Parse() is the only way to build a non-empty word.
class Word {
 public:
  Word() = default;

  // Accepts exactly five ASCII letters in either case.
  static bool Parse(std::string_view text, Word* out);

  std::string_view text() const { return std::string_view(text_.data()); }
  std::string ToString() const { return std::string(text()); }
  const PackedWord& packed() const { return packed_; }
  uint8_t LetterAt(int index) const;
  bool empty() const { return text_[0] == '\0'; }

  bool operator==(const Word& other) const {
    return packed_.letters == other.packed_.letters && text() == other.text();
  }
  bool operator!=(const Word& other) const { return !(*this == other); }
  bool operator<(const Word& other) const { return text() < other.text(); }

 private:
  std::array<char, kWordLen + 1> text_{};
  PackedWord packed_;
};

enum class Tag : uint8_t {
  kAbsent = 0,
  kPresent = 1,
  kExact = 2,
};

// Feedback for one guess, stored as the base-3 code sum(tag_i * 3^i).
class Pattern {
 public:
  static constexpr int kSolvedCode = kPatternCount - 1;

  Pattern() = default;
  explicit Pattern(int code) : code_(static_cast<uint8_t>(code)) {}

  static Pattern FromTags(const std::array<Tag, kWordLen>& tags);
  static Pattern Solved() { return Pattern(kSolvedCode); }

  // Reads "0/1/2" digits or "B/Y/G" letters (either case).
  static bool Parse(std::string_view text, Pattern* out);

  int code() const { return code_; }
  Tag At(int index) const;
  bool IsSolved() const { return code_ == kSolvedCode; }
  int CountOf(Tag tag) const;
  std::string ToString() const;
  std::string ToColorString() const;

  bool operator==(const Pattern& other) const { return code_ == other.code_; }
  bool operator!=(const Pattern& other) const { return code_ != other.code_; }
  bool operator<(const Pattern& other) const { return code_ < other.code_; }

 private:
  uint8_t code_ = 0;
};

// Feedback codec: greens consume the secret's letters before yellows are
// assigned left to right.
Pattern Score(const PackedWord& guess, const PackedWord& secret);
Pattern Score(const Word& guess, const Word& secret);

}  // namespace pythia

namespace std {
template <>
struct hash<pythia::Word> {
  size_t operator()(const pythia::Word& word) const noexcept {
    return std::hash<uint32_t>()(word.packed().letters);
  }
};

template <>
struct hash<pythia::Pattern> {
  size_t operator()(const pythia::Pattern& pattern) const noexcept {
    return std::hash<int>()(pattern.code());
  }
};
}  // namespace std

namespace pythia {

using CandidateSet = std::vector<size_t>;

class Dictionary {
 public:
  Dictionary() = default;

  // Fails on the first malformed entry; duplicates keep the first occurrence.
  static SolverStatus Create(const std::vector<std::string>& words,
                             Dictionary* out,
                             std::string* error);
  // Whitespace separated words, '#' starts a comment line.
  static SolverStatus LoadFile(const std::string& path,
                               Dictionary* out,
                               std::string* error);

  size_t size() const { return words_.size(); }
  bool empty() const { return words_.empty(); }
  const Word& operator[](size_t index) const { return words_[index]; }
  const std::vector<Word>& words() const { return words_; }

  bool Find(const Word& word, size_t* index_out) const;
  CandidateSet AllIndices() const;
  uint64_t Fingerprint() const;

 private:
  std::vector<Word> words_;
  std::unordered_map<Word, size_t> index_;
};

bool IsConsistent(const Word& candidate, const Word& guess, Pattern observed);

// Keeps the words of `remaining` that would answer `guess` with `observed`,
// in their input order. An empty result is legal.
void FilterCandidates(const Dictionary& dictionary,
                      const CandidateSet& remaining,
                      const Word& guess,
                      Pattern observed,
                      CandidateSet* out);

enum class ScoreMetric {
  kEntropy,
  kMinimax,
};

const char* MetricName(ScoreMetric metric);
bool ParseMetric(std::string_view text, ScoreMetric* out);

using PatternHistogram = std::array<int, kPatternCount>;

class GuessScorer {
 public:
  GuessScorer(const Dictionary& dictionary, ScoreMetric metric);

  PatternHistogram PatternCounts(const CandidateSet& candidates,
                                 const Word& guess) const;
  // Higher is better for every metric.
  double ScoreGuess(const CandidateSet& candidates, const Word& guess) const;

  static double Entropy(const PatternHistogram& counts, size_t total);
  static int LargestBucket(const PatternHistogram& counts);

  ScoreMetric metric() const { return metric_; }

 private:
  const Dictionary& dictionary_;
  ScoreMetric metric_;
};

struct StrategyResult {
  size_t index = 0;
  Word guess;
  double score = 0.0;
  bool is_candidate = false;
};

// Strict preference: higher score, then candidate membership, then the
// lower dictionary index.
bool IsBetterGuess(const StrategyResult& a, const StrategyResult& b);

struct SearchOptions {
  ScoreMetric metric = ScoreMetric::kEntropy;
  // Restricts guesses to the remaining candidates.
  bool hard_mode = false;
  // 0 uses the OpenMP default.
  int workers = 0;
  size_t chunk_size = kDefaultChunkSize;
};

class StrategySearch {
 public:
  explicit StrategySearch(const Dictionary& dictionary,
                          SearchOptions options = SearchOptions());

  SolverStatus BestGuess(const CandidateSet& candidates,
                         StrategyResult* result) const;

  const Dictionary& dictionary() const { return dictionary_; }
  const SearchOptions& options() const { return options_; }
  const GuessScorer& scorer() const { return scorer_; }

 private:
  struct ChunkBest {
    StrategyResult best;
    bool has_best = false;
  };

  ChunkBest ScanChunk(const CandidateSet& pool,
                      size_t begin,
                      size_t end,
                      const CandidateSet& candidates,
                      const std::vector<uint8_t>& is_candidate) const;
  int WorkerCount() const;

  const Dictionary& dictionary_;
  SearchOptions options_;
  GuessScorer scorer_;
};

// Best opening guess for one StrategySearch, computed on first use.
class OpeningCache {
 public:
  explicit OpeningCache(const StrategySearch& search);

  OpeningCache(const OpeningCache&) = delete;
  OpeningCache& operator=(const OpeningCache&) = delete;

  SolverStatus Get(StrategyResult* result);
  SolverStatus BestOpeningGuess(Word* out);
  // Installs a known opening instead of searching. Returns false once the
  // opening has already been fixed by an earlier Get or Seed.
  bool Seed(const StrategyResult& result);

  bool ready() const { return ready_.load(std::memory_order_acquire); }
  size_t computations() const { return computations_; }
  const StrategySearch& search() const { return search_; }

 private:
  const StrategySearch& search_;
  std::once_flag once_;
  std::atomic<bool> ready_{false};
  SolverStatus status_ = SolverStatus::kInternalFault;
  StrategyResult result_;
  size_t computations_ = 0;
};

// Opening guesses kept across runs, keyed by dictionary fingerprint and
// metric. One entry per line: "<fingerprint hex> <metric> <word>".
class OpeningStore {
 public:
  // Leaves `out` untouched on failure.
  static SolverStatus LoadFile(const std::string& path,
                               OpeningStore* out,
                               std::string* error);
  SolverStatus SaveFile(const std::string& path, std::string* error) const;

  // Succeeds only when the stored word is in the search's dictionary; the
  // score is recomputed against the full dictionary.
  bool Lookup(const StrategySearch& search, StrategyResult* result) const;
  void Remember(const StrategySearch& search, const StrategyResult& result);

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  std::map<std::pair<uint64_t, ScoreMetric>, Word> entries_;
};

enum class SessionState {
  kActive,
  kSolved,
  kExhausted,
  kContradiction,
};

const char* StateName(SessionState state);

struct GuessRecord {
  Word guess;
  Pattern pattern;
};

class SolverSession {
 public:
  explicit SolverSession(OpeningCache& strategy,
                         size_t max_guesses = kDefaultMaxGuesses);

  SolverStatus Suggest(StrategyResult* out) const;
  SolverStatus Suggest(Word* out) const;
  SolverStatus Record(const Word& guess, Pattern pattern);
  SolverStatus Record(std::string_view guess, std::string_view pattern);

  SessionState state() const { return state_; }
  bool IsTerminal() const { return state_ != SessionState::kActive; }
  size_t remaining() const { return candidates_.size(); }
  const CandidateSet& candidates() const { return candidates_; }
  const std::vector<GuessRecord>& history() const { return history_; }
  size_t max_guesses() const { return max_guesses_; }
  size_t guesses_left() const;
  const Dictionary& dictionary() const {
    return strategy_.search().dictionary();
  }

 private:
  OpeningCache& strategy_;
  size_t max_guesses_;
  CandidateSet candidates_;
  CandidateSet next_;
  std::vector<GuessRecord> history_;
  SessionState state_ = SessionState::kActive;
};

struct SolveStep {
  Word guess;
  Pattern pattern;
  double score = 0.0;
  bool was_candidate = false;
  size_t remaining = 0;
  size_t remaining_after = 0;
  double info_bits = 0.0;
};

SolverStatus SolveToTarget(OpeningCache& strategy,
                           const Word& target,
                           size_t max_steps,
                           std::vector<SolveStep>* steps,
                           SessionState* final_state);

struct BenchmarkOptions {
  size_t max_guesses = kDefaultMaxGuesses;
  // 0 plays every dictionary word.
  size_t limit = 0;
};

struct BenchmarkReport {
  size_t games = 0;
  size_t solved = 0;
  size_t exhausted = 0;
  size_t contradictions = 0;
  // histogram[n] counts games solved with n guesses.
  std::vector<size_t> histogram;
  double mean_guesses = 0.0;

  double SuccessRate() const {
    return games == 0 ? 0.0
                      : static_cast<double>(solved) /
                            static_cast<double>(games);
  }
};

SolverStatus RunBenchmark(OpeningCache& strategy,
                          const BenchmarkOptions& options,
                          BenchmarkReport* report);

}  // namespace pythia
