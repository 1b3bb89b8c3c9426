#include "Solver.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {
int g_failures = 0;

void ExpectTrue(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++g_failures;
  }
}

void ExpectFalse(bool condition, const char* message) {
  ExpectTrue(!condition, message);
}

void ExpectNear(double actual, double expected, const char* message) {
  if (std::fabs(actual - expected) > 1e-9) {
    std::cerr << "FAIL: " << message << " (got " << actual << ", want "
              << expected << ")\n";
    ++g_failures;
  }
}

pythia::Word W(const std::string& text) {
  pythia::Word word;
  if (!pythia::Word::Parse(text, &word)) {
    std::cerr << "FAIL: bad test word " << text << "\n";
    ++g_failures;
  }
  return word;
}

pythia::Pattern P(const std::string& text) {
  pythia::Pattern pattern;
  if (!pythia::Pattern::Parse(text, &pattern)) {
    std::cerr << "FAIL: bad test pattern " << text << "\n";
    ++g_failures;
  }
  return pattern;
}

pythia::Dictionary MakeDictionary(const std::vector<std::string>& words) {
  pythia::Dictionary dictionary;
  std::string error;
  if (pythia::Dictionary::Create(words, &dictionary, &error) !=
      pythia::SolverStatus::kOk) {
    std::cerr << "FAIL: dictionary rejected: " << error << "\n";
    ++g_failures;
  }
  return dictionary;
}

const std::vector<std::string> kAngleWords = {"apple", "angle", "ankle",
                                              "ample"};

// The last word splits the first four into singleton patterns.
const std::vector<std::string> kSplitWords = {"abcde", "fghij", "klmno",
                                              "pqrst", "afkpz"};

const std::vector<std::string> kLargerWords = {
    "cigar", "rebut", "sissy", "humph", "awake", "blush", "focal", "evade",
    "naval", "serve", "heath", "dwarf", "model", "karma", "stink", "grade",
    "quiet", "bench", "abate", "feign", "major", "death", "fresh", "crust",
    "stool", "colon", "abase", "marry", "react", "batty", "pride", "floss",
    "helix", "croak", "staff", "paper", "unfed", "whelp", "trawl", "outdo",
    "adobe", "crazy", "sower", "repay", "digit", "crate", "cluck", "spike",
    "mimic", "pound", "maxim", "linen", "unmet", "flesh", "booby", "forth",
    "first", "stand", "belly", "ivory", "seedy", "print", "yearn", "drain",
    "bribe", "stout", "panel", "crass", "flume", "offal", "agree", "error",
    "swirl", "argue", "bleed", "delta", "flick", "totem", "wooer", "front"};
}  // namespace

int main() {
  {
    pythia::Dictionary dictionary = MakeDictionary(kSplitWords);
    pythia::GuessScorer entropy(dictionary, pythia::ScoreMetric::kEntropy);
    pythia::GuessScorer minimax(dictionary, pythia::ScoreMetric::kMinimax);
    const pythia::CandidateSet four = {0, 1, 2, 3};

    pythia::PatternHistogram counts = entropy.PatternCounts(four, W("afkpz"));
    int buckets = 0;
    for (int count : counts) {
      if (count > 0) {
        ++buckets;
      }
    }
    ExpectTrue(buckets == 4, "perfect splitter yields four patterns");
    ExpectNear(entropy.ScoreGuess(four, W("afkpz")), std::log2(4.0),
               "perfect split scores log2 of the candidate count");
    ExpectNear(entropy.ScoreGuess(four, W("abcde")),
               -(0.25 * std::log2(0.25) + 0.75 * std::log2(0.75)),
               "one-versus-three split entropy");
    ExpectNear(minimax.ScoreGuess(four, W("afkpz")), -1.0,
               "perfect split has a worst case of one");
    ExpectNear(minimax.ScoreGuess(four, W("abcde")), -3.0,
               "worst case bucket of three");
    ExpectNear(entropy.ScoreGuess(pythia::CandidateSet(), W("abcde")), 0.0,
               "empty candidates score zero");
    ExpectNear(entropy.ScoreGuess({0}, W("afkpz")), 0.0,
               "single candidate carries no information");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kSplitWords);
    pythia::StrategySearch search(dictionary);
    pythia::StrategyResult result;
    ExpectTrue(search.BestGuess({0, 1, 2, 3}, &result) ==
                   pythia::SolverStatus::kOk,
               "search succeeds");
    ExpectTrue(result.guess == W("afkpz"),
               "non-candidate guess wins when it splits better");
    ExpectFalse(result.is_candidate, "winner is not a candidate");
    ExpectNear(result.score, 2.0, "winner score is two bits");

    pythia::SearchOptions hard;
    hard.hard_mode = true;
    pythia::StrategySearch hard_search(dictionary, hard);
    ExpectTrue(hard_search.BestGuess({0, 1, 2, 3}, &result) ==
                   pythia::SolverStatus::kOk,
               "hard mode search succeeds");
    ExpectTrue(result.guess == W("abcde"),
               "hard mode only guesses candidates");
    ExpectTrue(result.is_candidate, "hard mode winner is a candidate");

    pythia::SearchOptions worst;
    worst.metric = pythia::ScoreMetric::kMinimax;
    pythia::StrategySearch minimax_search(dictionary, worst);
    ExpectTrue(minimax_search.BestGuess({0, 1, 2, 3}, &result) ==
                   pythia::SolverStatus::kOk,
               "minimax search succeeds");
    ExpectTrue(result.guess == W("afkpz"), "minimax picks the splitter");
    ExpectNear(result.score, -1.0, "minimax score is minus worst bucket");
  }

  {
    // Every word below gives one bit on {abcde, fghij}.
    pythia::Dictionary dictionary =
        MakeDictionary({"ahhhh", "abcde", "fghij"});
    pythia::StrategySearch search(dictionary);
    pythia::StrategyResult result;
    ExpectTrue(search.BestGuess({1, 2}, &result) == pythia::SolverStatus::kOk,
               "tie search succeeds");
    ExpectTrue(result.index == 1,
               "ties prefer a candidate, then dictionary order");

    pythia::StrategyResult a;
    a.score = 1.0;
    a.index = 5;
    pythia::StrategyResult b = a;
    b.score = 1.0 + 1e-12;
    b.index = 7;
    ExpectTrue(pythia::IsBetterGuess(a, b),
               "scores within tolerance fall back to index order");
    b.is_candidate = true;
    ExpectTrue(pythia::IsBetterGuess(b, a),
               "candidate membership breaks score ties");
    b.score = 0.5;
    ExpectTrue(pythia::IsBetterGuess(a, b), "higher score wins outright");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kLargerWords);
    const pythia::CandidateSet all = dictionary.AllIndices();
    pythia::CandidateSet some;
    for (size_t i = 0; i < dictionary.size(); i += 3) {
      some.push_back(i);
    }

    pythia::SearchOptions base;
    base.workers = 1;
    base.chunk_size = 64;
    pythia::StrategySearch reference_search(dictionary, base);
    pythia::StrategyResult reference_all;
    pythia::StrategyResult reference_some;
    ExpectTrue(reference_search.BestGuess(all, &reference_all) ==
                       pythia::SolverStatus::kOk &&
                   reference_search.BestGuess(some, &reference_some) ==
                       pythia::SolverStatus::kOk,
               "reference searches succeed");

    bool same = true;
    const int worker_counts[] = {1, 2, 4, 8};
    const size_t chunk_sizes[] = {1, 3, 7, 64, 1000};
    for (int workers : worker_counts) {
      for (size_t chunk : chunk_sizes) {
        pythia::SearchOptions options;
        options.workers = workers;
        options.chunk_size = chunk;
        pythia::StrategySearch search(dictionary, options);
        for (int repeat = 0; repeat < 2; ++repeat) {
          pythia::StrategyResult result_all;
          pythia::StrategyResult result_some;
          same = same &&
                 search.BestGuess(all, &result_all) ==
                     pythia::SolverStatus::kOk &&
                 search.BestGuess(some, &result_some) ==
                     pythia::SolverStatus::kOk &&
                 result_all.index == reference_all.index &&
                 result_some.index == reference_some.index &&
                 result_all.score == reference_all.score;
        }
      }
    }
    ExpectTrue(same, "best guess is independent of workers and chunking");

    pythia::SearchOptions whole;
    whole.chunk_size = std::numeric_limits<size_t>::max();
    pythia::StrategySearch whole_search(dictionary, whole);
    pythia::StrategyResult result;
    ExpectTrue(whole_search.BestGuess(all, &result) ==
                       pythia::SolverStatus::kOk &&
                   result.index == reference_all.index,
               "maximal chunk size scans the pool as one chunk");
    whole.hard_mode = true;
    pythia::StrategySearch whole_hard(dictionary, whole);
    ExpectTrue(whole_hard.BestGuess(some, &result) == pythia::SolverStatus::kOk,
               "maximal chunk size works on a hard mode pool");
    pythia::OpeningCache whole_cache(whole_search);
    ExpectTrue(whole_cache.Get(&result) == pythia::SolverStatus::kOk &&
                   result.index == reference_all.index,
               "opening with maximal chunk size");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::StrategyResult result;
    ExpectTrue(search.BestGuess(pythia::CandidateSet(), &result) ==
                   pythia::SolverStatus::kInvalidState,
               "empty candidates cannot be searched");
    ExpectTrue(search.BestGuess({0, 42}, &result) ==
                   pythia::SolverStatus::kInternalFault,
               "out of range candidate aborts the search");

    pythia::Dictionary empty;
    pythia::StrategySearch empty_search(empty);
    pythia::OpeningCache empty_cache(empty_search);
    ExpectTrue(empty_cache.BestOpeningGuess(nullptr) ==
                   pythia::SolverStatus::kInvalidState,
               "empty dictionary has no opening");
    pythia::SolverSession session(empty_cache);
    ExpectTrue(session.state() == pythia::SessionState::kContradiction,
               "empty dictionary session starts in contradiction");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);
    ExpectFalse(cache.ready(), "cache is empty before first use");

    pythia::StrategyResult direct;
    ExpectTrue(search.BestGuess(dictionary.AllIndices(), &direct) ==
                   pythia::SolverStatus::kOk,
               "direct opening search succeeds");

    pythia::Word opening;
    ExpectTrue(cache.BestOpeningGuess(&opening) == pythia::SolverStatus::kOk,
               "opening guess is available");
    ExpectTrue(cache.ready(), "cache is populated after first use");
    ExpectTrue(opening == direct.guess, "cached opening matches the search");

    pythia::SolverSession first(cache);
    pythia::SolverSession second(cache);
    pythia::Word suggestion;
    ExpectTrue(first.Suggest(&suggestion) == pythia::SolverStatus::kOk &&
                   suggestion == opening,
               "new session suggests the cached opening");
    ExpectTrue(second.Suggest(&suggestion) == pythia::SolverStatus::kOk &&
                   suggestion == opening,
               "second session reuses the cached opening");
    ExpectTrue(cache.computations() == 1, "opening is computed once");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);
    pythia::SolverSession session(cache);
    const pythia::Word secret = W("angle");

    ExpectTrue(session.state() == pythia::SessionState::kActive,
               "new session is active");
    ExpectTrue(session.remaining() == 4, "session starts with the dictionary");

    pythia::StrategyResult opening;
    ExpectTrue(session.Suggest(&opening) == pythia::SolverStatus::kOk,
               "opening suggestion succeeds");
    ExpectTrue(opening.guess == W("apple"),
               "four-way tie resolves to the first dictionary word");
    ExpectNear(opening.score, 1.5, "opening splits 2-1-1");

    pythia::Pattern feedback = pythia::Score(opening.guess, secret);
    ExpectTrue(feedback == P("20022"), "apple against angle");
    ExpectTrue(session.Record(opening.guess, feedback) ==
                   pythia::SolverStatus::kOk,
               "record opening feedback");
    ExpectTrue(session.candidates() == pythia::CandidateSet({1, 2}),
               "angle and ankle remain");
    ExpectTrue(session.state() == pythia::SessionState::kActive,
               "still active after one guess");
    ExpectTrue(session.guesses_left() == 5, "five guesses left");

    size_t turns = 1;
    while (!session.IsTerminal() && turns < 4) {
      pythia::Word guess;
      ExpectTrue(session.Suggest(&guess) == pythia::SolverStatus::kOk,
                 "follow-up suggestion succeeds");
      ExpectTrue(session.Record(guess, pythia::Score(guess, secret)) ==
                     pythia::SolverStatus::kOk,
                 "record follow-up feedback");
      ++turns;
    }
    ExpectTrue(session.state() == pythia::SessionState::kSolved,
               "angle is solved");
    ExpectTrue(session.history().back().guess == secret,
               "last guess is the secret");
    ExpectTrue(session.history().size() == 2, "solved on the second guess");

    pythia::Word ignored;
    ExpectTrue(session.Suggest(&ignored) ==
                   pythia::SolverStatus::kInvalidState,
               "solved session refuses to suggest");
    ExpectTrue(session.Record(W("ankle"), P("22022")) ==
                   pythia::SolverStatus::kInvalidState,
               "solved session refuses to record");
    ExpectTrue(session.history().size() == 2,
               "refused record leaves history alone");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary({"apple"});
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);
    pythia::SolverSession session(cache);

    ExpectTrue(session.Record("apple", "00000") == pythia::SolverStatus::kOk,
               "inconsistent feedback is recorded");
    ExpectTrue(session.state() == pythia::SessionState::kContradiction,
               "session reaches contradiction");
    ExpectTrue(session.remaining() == 0, "no candidates remain");
    pythia::Word ignored;
    ExpectTrue(session.Suggest(&ignored) ==
                   pythia::SolverStatus::kInvalidState,
               "contradiction refuses to suggest");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);

    pythia::SolverSession session(cache);
    ExpectTrue(session.Record("app1e", "00000") ==
                   pythia::SolverStatus::kMalformedWord,
               "malformed guess is rejected");
    ExpectTrue(session.Record("apple", "0000x") ==
                   pythia::SolverStatus::kMalformedPattern,
               "malformed pattern is rejected");
    ExpectTrue(session.history().empty() &&
                   session.state() == pythia::SessionState::kActive,
               "rejected input leaves the session untouched");

    pythia::SolverSession short_game(cache, 1);
    ExpectTrue(short_game.Record("apple", "20022") ==
                   pythia::SolverStatus::kOk,
               "record within the limit");
    ExpectTrue(short_game.state() == pythia::SessionState::kExhausted,
               "guess limit reached without a solve");
    ExpectTrue(short_game.guesses_left() == 0, "no guesses left");

    pythia::SolverSession no_guesses(cache, 0);
    ExpectTrue(no_guesses.state() == pythia::SessionState::kExhausted,
               "zero guess limit starts exhausted");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);

    std::vector<pythia::SolveStep> steps;
    pythia::SessionState state = pythia::SessionState::kActive;
    ExpectTrue(pythia::SolveToTarget(cache, W("ankle"), 6, &steps, &state) ==
                   pythia::SolverStatus::kOk,
               "solve to target succeeds");
    ExpectTrue(state == pythia::SessionState::kSolved, "ankle is solved");
    ExpectTrue(steps.size() == 3, "apple, angle, ankle");
    if (steps.size() == 3) {
      ExpectTrue(steps[0].guess == W("apple") && steps[1].guess == W("angle") &&
                     steps[2].guess == W("ankle"),
                 "solution path order");
      ExpectTrue(steps[0].remaining == 4 && steps[0].remaining_after == 2,
                 "first step narrows four to two");
      ExpectNear(steps[0].info_bits, 1.0, "first step gains one bit");
      ExpectTrue(steps[2].pattern.IsSolved(), "last step is solved");
    }

    ExpectTrue(pythia::SolveToTarget(cache, W("crane"), 6, &steps, &state) ==
                   pythia::SolverStatus::kOk,
               "solve for a word outside the dictionary runs");
    ExpectTrue(state == pythia::SessionState::kContradiction,
               "word outside the dictionary ends in contradiction");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);

    pythia::BenchmarkReport report;
    ExpectTrue(pythia::RunBenchmark(cache, pythia::BenchmarkOptions(),
                                    &report) == pythia::SolverStatus::kOk,
               "benchmark succeeds");
    ExpectTrue(report.games == 4 && report.solved == 4,
               "every word is solved");
    ExpectTrue(report.histogram.size() == 7, "histogram covers 0..6");
    if (report.histogram.size() == 7) {
      ExpectTrue(report.histogram[1] == 1 && report.histogram[2] == 2 &&
                     report.histogram[3] == 1,
                 "guess distribution");
    }
    ExpectNear(report.mean_guesses, 2.0, "mean guesses");
    ExpectNear(report.SuccessRate(), 1.0, "success rate");

    pythia::BenchmarkOptions limited;
    limited.limit = 2;
    limited.max_guesses = 1;
    ExpectTrue(pythia::RunBenchmark(cache, limited, &report) ==
                   pythia::SolverStatus::kOk,
               "limited benchmark succeeds");
    ExpectTrue(report.games == 2 && report.solved == 1 &&
                   report.exhausted == 1,
               "one guess only solves the opening word");
    ExpectTrue(cache.computations() == 1,
               "benchmarks share one opening computation");
  }

  {
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);
    pythia::StrategyResult known;
    known.index = 2;
    known.guess = W("ankle");
    known.score = 0.25;
    ExpectTrue(cache.Seed(known), "seed fixes an unused cache");
    pythia::Word opening;
    ExpectTrue(cache.BestOpeningGuess(&opening) == pythia::SolverStatus::kOk &&
                   opening == W("ankle"),
               "seeded opening is returned");
    ExpectTrue(cache.computations() == 0, "seeded cache never searches");
    ExpectFalse(cache.Seed(known), "a fixed opening cannot be reseeded");

    pythia::OpeningCache computed(search);
    ExpectTrue(computed.Get(nullptr) == pythia::SolverStatus::kOk,
               "opening computes");
    ExpectFalse(computed.Seed(known), "seed after a search is refused");
    ExpectTrue(computed.BestOpeningGuess(&opening) ==
                       pythia::SolverStatus::kOk &&
                   opening == W("apple"),
               "computed opening survives a refused seed");
  }

  {
    const std::string path = "pythia_opening_store_test.txt";
    pythia::Dictionary dictionary = MakeDictionary(kAngleWords);
    pythia::StrategySearch search(dictionary);
    pythia::OpeningCache cache(search);
    pythia::StrategyResult opening;
    ExpectTrue(cache.Get(&opening) == pythia::SolverStatus::kOk,
               "opening for the store");

    pythia::OpeningStore store;
    ExpectFalse(store.Lookup(search, nullptr), "empty store has no opening");
    store.Remember(search, opening);
    std::string error;
    ExpectTrue(store.SaveFile(path, &error) == pythia::SolverStatus::kOk,
               "store saves");

    pythia::OpeningStore loaded;
    ExpectTrue(pythia::OpeningStore::LoadFile(path, &loaded, &error) ==
                   pythia::SolverStatus::kOk,
               "store loads");
    ExpectTrue(loaded.size() == 1, "one stored opening");
    pythia::StrategyResult restored;
    ExpectTrue(loaded.Lookup(search, &restored), "stored opening is found");
    ExpectTrue(restored.guess == opening.guess &&
                   restored.index == opening.index &&
                   restored.is_candidate,
               "stored opening matches the search");
    ExpectNear(restored.score, opening.score, "stored opening is rescored");

    pythia::OpeningCache seeded(search);
    ExpectTrue(seeded.Seed(restored), "loaded opening seeds a cache");
    pythia::SolverSession session(seeded);
    pythia::Word suggestion;
    ExpectTrue(session.Suggest(&suggestion) == pythia::SolverStatus::kOk &&
                   suggestion == opening.guess,
               "session starts from the stored opening");
    ExpectTrue(seeded.computations() == 0, "stored opening skips the search");

    pythia::Dictionary other = MakeDictionary({"apple", "angle", "ankle",
                                               "ample", "crane"});
    pythia::StrategySearch other_search(other);
    ExpectFalse(loaded.Lookup(other_search, nullptr),
                "different wordset does not match");
    pythia::SearchOptions minimax;
    minimax.metric = pythia::ScoreMetric::kMinimax;
    pythia::StrategySearch minimax_search(dictionary, minimax);
    ExpectFalse(loaded.Lookup(minimax_search, nullptr),
                "different metric does not match");

    {
      std::ofstream out(path, std::ios::trunc);
      out << std::hex << dictionary.Fingerprint() << std::dec
          << " entropy crane\n";
    }
    pythia::OpeningStore foreign;
    ExpectTrue(pythia::OpeningStore::LoadFile(path, &foreign, &error) ==
                   pythia::SolverStatus::kOk,
               "entry with a foreign word loads");
    ExpectFalse(foreign.Lookup(search, nullptr),
                "stored word outside the dictionary is rejected");

    {
      std::ofstream out(path, std::ios::trunc);
      out << "not-a-fingerprint entropy apple\n";
    }
    ExpectTrue(pythia::OpeningStore::LoadFile(path, &loaded, &error) ==
                   pythia::SolverStatus::kIoError,
               "malformed store line is rejected");
    ExpectTrue(loaded.size() == 1, "failed load keeps the previous store");
    std::remove(path.c_str());

    ExpectTrue(pythia::OpeningStore::LoadFile(path, &loaded, &error) ==
                   pythia::SolverStatus::kIoError,
               "missing store file reports i/o error");
  }

  if (g_failures > 0) {
    std::cerr << g_failures << " test(s) failed.\n";
    return 1;
  }
  std::cout << "All tests passed.\n";
  return 0;
}
