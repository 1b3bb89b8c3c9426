#include "Solver.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {
struct Config {
  std::string dict_path;
  std::string target;
  size_t max_steps = pythia::kDefaultMaxGuesses;
  bool interactive = false;
  bool opening = false;
  bool benchmark = false;
  size_t benchmark_limit = 0;
  bool profile = false;
  std::string cache_path;
  pythia::SearchOptions search;
};

void PrintUsage(const char* argv0) {
  std::cout
      << "Pythia: Wordle solver engine\n"
      << "Usage:\n"
      << "  " << argv0 << " --dict WORDS.txt [--opening]\n"
      << "  " << argv0
      << " --dict WORDS.txt --target CRANE [--max-steps 6]\n"
      << "  " << argv0 << " --dict WORDS.txt --interactive\n"
      << "  " << argv0
      << " --dict WORDS.txt --benchmark [--benchmark-limit N]\n"
      << "Options:\n"
      << "  --dict PATH            5-letter dictionary (one word per line)\n"
      << "  --target WORD          Secret word for a simulated solve\n"
      << "  --max-steps N          Guess limit per game (default 6)\n"
      << "  --interactive          Suggest guesses from entered feedback\n"
      << "  --opening              Print the best opening guess\n"
      << "  --benchmark            Solve every dictionary word and report\n"
      << "  --benchmark-limit N    Only play the first N dictionary words\n"
      << "  --hard                 Only guess words that are still candidates\n"
      << "  --metric NAME          entropy (default) or minimax\n"
      << "  --workers N            Search threads (default: all cores)\n"
      << "  --chunk N              Words per search task (default 64)\n"
      << "  --cache PATH           Reuse and record opening guesses per wordset\n"
      << "  --profile              Log search and filter timing per turn\n"
      << "  --help                 Show this help\n";
}

std::string ToUpperAscii(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string ToLowerAscii(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c >= 'A' && c <= 'Z') {
      out.push_back(static_cast<char>(c - 'A' + 'a'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

long long MicrosSince(std::chrono::high_resolution_clock::time_point start) {
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(end - start)
      .count();
}

void PrintInteractiveHelp() {
  std::cout
      << "Interactive commands:\n"
      << "  GUESS PATTERN   Report a guess and its feedback (e.g. CRANE 00102)\n"
      << "  PATTERN         Report feedback for the suggested guess\n"
      << "                  Patterns use 0/1/2 or B/Y/G per letter\n"
      << "  help or ?       Show this help\n"
      << "  quit or exit    Leave interactive mode\n";
}

void PrintColoredPattern(const pythia::Word& guess,
                         const pythia::Pattern& pattern) {
  const char* colors[] = {"\x1b[90m", "\x1b[33m", "\x1b[32m"};
  const char* reset = "\x1b[0m";
  std::string display = ToUpperAscii(guess.text());
  std::cout << "Feedback: ";
  for (int i = 0; i < pythia::kWordLen; ++i) {
    int value = static_cast<int>(pattern.At(i));
    std::cout << colors[value] << display[i] << reset;
  }
  std::cout << "\n";
}

void PrintEntropyBar(size_t remaining, size_t total) {
  if (total == 0) {
    return;
  }
  constexpr int kBarWidth = 20;
  double ratio = static_cast<double>(remaining) / static_cast<double>(total);
  int filled = static_cast<int>(std::round(ratio * kBarWidth));
  if (filled > kBarWidth) {
    filled = kBarWidth;
  }
  if (filled < 0) {
    filled = 0;
  }
  std::cout << "Uncertainty: [";
  for (int i = 0; i < kBarWidth; ++i) {
    std::cout << (i < filled ? '#' : '.');
  }
  std::cout << "] " << std::fixed << std::setprecision(1) << ratio * 100.0
            << "% remaining\n";
}

void PrintRemainingWords(const pythia::SolverSession& session) {
  constexpr size_t kMaxListed = 10;
  if (session.remaining() == 0 || session.remaining() > kMaxListed) {
    return;
  }
  std::cout << "Candidates:";
  for (size_t index : session.candidates()) {
    std::cout << " " << session.dictionary()[index].text();
  }
  std::cout << "\n";
}

void PrintOutcome(const pythia::SolverSession& session) {
  switch (session.state()) {
    case pythia::SessionState::kSolved:
      std::cout << "Solved in " << session.history().size() << " guesses.\n";
      break;
    case pythia::SessionState::kExhausted:
      std::cout << "Out of rounds (" << session.max_guesses() << ").\n";
      break;
    case pythia::SessionState::kContradiction:
      std::cout << "No dictionary word matches that feedback; the answer is "
                   "not in the dictionary or a pattern was mistyped.\n";
      break;
    case pythia::SessionState::kActive:
      break;
  }
}

int RunInteractive(pythia::OpeningCache& strategy, const Config& config) {
  pythia::SolverSession session(strategy, config.max_steps);
  const size_t initial_count = session.remaining();

  std::cout << "\n[Wordle Interactive]\n";
  if (config.search.hard_mode) {
    std::cout << "Hard mode enabled.\n";
  }
  std::cout << "Type '?' for help.\n";

  while (!session.IsTerminal()) {
    pythia::StrategyResult suggestion;
    auto start = std::chrono::high_resolution_clock::now();
    pythia::SolverStatus status = session.Suggest(&suggestion);
    long long micros = MicrosSince(start);
    if (status != pythia::SolverStatus::kOk) {
      std::cerr << "Search failed: " << pythia::StatusName(status) << "\n";
      return 1;
    }

    std::cout << "Suggested guess: " << ToUpperAscii(suggestion.guess.text())
              << " " << pythia::MetricName(config.search.metric) << "="
              << std::fixed << std::setprecision(4) << suggestion.score
              << (suggestion.is_candidate ? " (candidate)" : "") << "\n";
    std::cout << "Round " << (session.history().size() + 1) << " of "
              << session.max_guesses() << "\n";
    std::cout << "Remaining possibilities: " << session.remaining() << "\n";
    PrintEntropyBar(session.remaining(), initial_count);
    if (config.profile) {
      std::cout << "Search latency: " << micros << "us\n";
    }
    std::cout << "Enter guess and pattern (e.g., CRANE 00102) or a pattern "
                 "for the suggestion: ";

    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    line = pythia::TrimWhitespace(line);
    if (line.empty()) {
      continue;
    }
    std::string command = ToLowerAscii(line);
    if (command == "help" || command == "?") {
      PrintInteractiveHelp();
      continue;
    }
    if (command == "quit" || command == "exit") {
      break;
    }

    std::istringstream iss(line);
    std::string first;
    std::string second;
    iss >> first >> second;

    pythia::Word guess = suggestion.guess;
    std::string pattern_text = first;
    if (!second.empty()) {
      if (!pythia::Word::Parse(first, &guess)) {
        std::cout << "Invalid guess: " << first << "\n";
        continue;
      }
      pattern_text = second;
    }
    pythia::Pattern pattern;
    if (!pythia::Pattern::Parse(pattern_text, &pattern)) {
      std::cout << "Invalid pattern: " << pattern_text
                << " (use 5 of 0/1/2 or B/Y/G)\n";
      continue;
    }
    if (config.search.hard_mode) {
      size_t index = 0;
      bool allowed = session.dictionary().Find(guess, &index);
      if (allowed) {
        allowed = false;
        for (size_t candidate : session.candidates()) {
          if (candidate == index) {
            allowed = true;
            break;
          }
        }
      }
      if (!allowed) {
        std::cout << "Hard mode: guess must match all revealed hints.\n";
        continue;
      }
    }

    size_t before_count = session.remaining();
    auto filter_start = std::chrono::high_resolution_clock::now();
    status = session.Record(guess, pattern);
    long long filter_micros = MicrosSince(filter_start);
    if (status != pythia::SolverStatus::kOk) {
      std::cerr << "Record failed: " << pythia::StatusName(status) << "\n";
      return 1;
    }

    PrintColoredPattern(guess, pattern);
    std::cout << "Pattern: " << pattern.ToString() << "\n";
    if (config.profile) {
      std::cout << "Perf: filter=" << filter_micros << "us\n";
    }
    if (session.remaining() > 0) {
      double p = static_cast<double>(session.remaining()) /
                 static_cast<double>(before_count);
      std::cout << "Information gained: " << std::fixed
                << std::setprecision(4) << -std::log2(p) << " bits\n";
    }
    std::cout << "Remaining possibilities: " << session.remaining() << "\n";
    PrintRemainingWords(session);
  }

  PrintOutcome(session);
  return 0;
}

int RunTarget(pythia::OpeningCache& strategy, const Config& config) {
  pythia::Word target;
  if (!pythia::Word::Parse(config.target, &target)) {
    std::cerr << "Invalid target: " << config.target << "\n";
    return 1;
  }
  const pythia::Dictionary& dictionary = strategy.search().dictionary();
  if (!dictionary.Find(target, nullptr)) {
    std::cout << "Note: " << target.text() << " is not in the dictionary.\n";
  }

  auto start = std::chrono::high_resolution_clock::now();
  std::vector<pythia::SolveStep> steps;
  pythia::SessionState state = pythia::SessionState::kActive;
  pythia::SolverStatus status =
      pythia::SolveToTarget(strategy, target, config.max_steps, &steps, &state);
  long long micros = MicrosSince(start);
  if (status != pythia::SolverStatus::kOk) {
    std::cerr << "Solve failed: " << pythia::StatusName(status) << "\n";
    return 1;
  }

  std::cout << "Target: " << target.text() << "\n";
  std::cout << "Solution path:\n";
  for (size_t i = 0; i < steps.size(); ++i) {
    const auto& step = steps[i];
    std::cout << "  Step " << (i + 1) << ": guess=" << step.guess.text()
              << " pattern=" << step.pattern.ToString()
              << " score=" << std::fixed << std::setprecision(4) << step.score
              << " bits=" << step.info_bits << " remaining=" << step.remaining
              << " -> " << step.remaining_after << "\n";
  }
  std::cout << "Outcome: " << pythia::StateName(state) << "\n";
  std::cout << "Total latency: " << micros << "us\n";
  return state == pythia::SessionState::kSolved ? 0 : 2;
}

int RunBenchmarkMode(pythia::OpeningCache& strategy, const Config& config) {
  pythia::BenchmarkOptions options;
  options.max_guesses = config.max_steps;
  options.limit = config.benchmark_limit;

  auto start = std::chrono::high_resolution_clock::now();
  pythia::BenchmarkReport report;
  pythia::SolverStatus status =
      pythia::RunBenchmark(strategy, options, &report);
  long long micros = MicrosSince(start);
  if (status != pythia::SolverStatus::kOk) {
    std::cerr << "Benchmark failed: " << pythia::StatusName(status) << "\n";
    return 1;
  }

  std::cout << "\n[Benchmark] Games: " << report.games << "\n";
  for (size_t guesses = 1; guesses < report.histogram.size(); ++guesses) {
    std::cout << "  " << guesses << " guesses: " << report.histogram[guesses]
              << "\n";
  }
  std::cout << "Solved: " << report.solved << " (" << std::fixed
            << std::setprecision(1) << report.SuccessRate() * 100.0 << "%)\n";
  std::cout << "Exhausted: " << report.exhausted << "\n";
  std::cout << "Contradictions: " << report.contradictions << "\n";
  std::cout << "Mean guesses when solved: " << std::setprecision(3)
            << report.mean_guesses << "\n";
  std::cout << "Total latency: " << micros << "us\n";
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  constexpr size_t kMaxCount = std::numeric_limits<size_t>::max();
  constexpr size_t kMaxWorkers =
      static_cast<size_t>(std::numeric_limits<int>::max());
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dict" && i + 1 < argc) {
      config.dict_path = argv[++i];
    } else if (arg == "--target" && i + 1 < argc) {
      config.target = ToLowerAscii(argv[++i]);
    } else if (arg == "--max-steps" && i + 1 < argc) {
      if (!pythia::ParseCount(argv[++i], kMaxCount, &config.max_steps)) {
        std::cerr << "Invalid --max-steps: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--interactive") {
      config.interactive = true;
    } else if (arg == "--opening") {
      config.opening = true;
    } else if (arg == "--benchmark") {
      config.benchmark = true;
    } else if (arg == "--benchmark-limit" && i + 1 < argc) {
      if (!pythia::ParseCount(argv[++i], kMaxCount,
                              &config.benchmark_limit)) {
        std::cerr << "Invalid --benchmark-limit: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--hard") {
      config.search.hard_mode = true;
    } else if (arg == "--metric" && i + 1 < argc) {
      if (!pythia::ParseMetric(argv[++i], &config.search.metric)) {
        std::cerr << "Unknown metric: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--workers" && i + 1 < argc) {
      size_t workers = 0;
      if (!pythia::ParseCount(argv[++i], kMaxWorkers, &workers)) {
        std::cerr << "Invalid --workers: " << argv[i] << "\n";
        return 1;
      }
      config.search.workers = static_cast<int>(workers);
    } else if (arg == "--chunk" && i + 1 < argc) {
      if (!pythia::ParseCount(argv[++i], kMaxCount,
                              &config.search.chunk_size) ||
          config.search.chunk_size == 0) {
        std::cerr << "Invalid --chunk: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--cache" && i + 1 < argc) {
      config.cache_path = argv[++i];
    } else if (arg == "--profile") {
      config.profile = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  if (config.dict_path.empty()) {
    std::cerr << "Pythia requires --dict.\n";
    PrintUsage(argv[0]);
    return 1;
  }
  int modes = (config.interactive ? 1 : 0) + (config.benchmark ? 1 : 0) +
              (config.target.empty() ? 0 : 1);
  if (modes > 1) {
    std::cerr << "Choose one of --interactive, --target or --benchmark.\n";
    return 1;
  }

  pythia::Dictionary dictionary;
  std::string error;
  pythia::SolverStatus status =
      pythia::Dictionary::LoadFile(config.dict_path, &dictionary, &error);
  if (status != pythia::SolverStatus::kOk) {
    std::cerr << "Failed to load dictionary (" << pythia::StatusName(status)
              << "): " << error << "\n";
    return 1;
  }
  if (dictionary.empty()) {
    std::cerr << "Dictionary is empty: " << config.dict_path << "\n";
    return 1;
  }

  std::cout << "[Wordle] Dictionary size: " << dictionary.size()
            << " wordset " << std::hex << std::setw(16) << std::setfill('0')
            << dictionary.Fingerprint() << std::dec << std::setfill(' ')
            << "\n";

  pythia::StrategySearch search(dictionary, config.search);
  pythia::OpeningCache strategy(search);

  pythia::OpeningStore store;
  bool cached_opening = false;
  if (!config.cache_path.empty()) {
    status = pythia::OpeningStore::LoadFile(config.cache_path, &store, &error);
    if (status != pythia::SolverStatus::kOk) {
      std::cout << "No usable opening cache (" << error
                << "), computing one.\n";
    }
    pythia::StrategyResult seeded;
    if (store.Lookup(search, &seeded) && strategy.Seed(seeded)) {
      cached_opening = true;
      std::cout << "Using cached opening from " << config.cache_path << "\n";
    }
  }

  auto start = std::chrono::high_resolution_clock::now();
  pythia::StrategyResult opening;
  status = strategy.Get(&opening);
  long long micros = MicrosSince(start);
  if (status != pythia::SolverStatus::kOk) {
    std::cerr << "Opening precomputation failed: "
              << pythia::StatusName(status) << "\n";
    return 1;
  }
  if (!config.cache_path.empty() && !cached_opening) {
    store.Remember(search, opening);
    status = store.SaveFile(config.cache_path, &error);
    if (status != pythia::SolverStatus::kOk) {
      std::cerr << "Failed to write opening cache: " << error << "\n";
    } else {
      std::cout << "Cached opening in " << config.cache_path << "\n";
    }
  }
  std::cout << "Best opening guess: " << opening.guess.text() << " "
            << pythia::MetricName(config.search.metric) << "=" << std::fixed
            << std::setprecision(4) << opening.score << "\n";
  if (config.profile || config.opening) {
    std::cout << "Opening latency: " << micros << "us\n";
  }

  if (config.interactive) {
    return RunInteractive(strategy, config);
  }
  if (!config.target.empty()) {
    return RunTarget(strategy, config);
  }
  if (config.benchmark) {
    return RunBenchmarkMode(strategy, config);
  }
  return 0;
}
