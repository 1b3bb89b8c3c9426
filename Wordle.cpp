#include "Solver.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <numeric>
#include <utility>
#include <vector>

#if defined(PYTHIA_USE_HWY)
#include "hwy/highway.h"
#endif

namespace pythia {
namespace {
constexpr int kLetterBits = 5;
constexpr uint32_t kLetterMask = 0x1F;

uint8_t PackedLetterAt(const PackedWord& word, int index) {
  return static_cast<uint8_t>((word.letters >> (index * kLetterBits)) &
                              kLetterMask);
}

bool TagFromChar(char c, Tag* out) {
  switch (c) {
    case '0':
    case 'b':
    case 'B':
      *out = Tag::kAbsent;
      return true;
    case '1':
    case 'y':
    case 'Y':
      *out = Tag::kPresent;
      return true;
    case '2':
    case 'g':
    case 'G':
      *out = Tag::kExact;
      return true;
    default:
      return false;
  }
}

// Flags the entries of `remaining` whose packed letters equal `bits` under
// `mask`, i.e. that agree with the guess at every Exact position.
void MarkExactMatches(const Dictionary& dictionary,
                      const CandidateSet& remaining,
                      uint32_t mask,
                      uint32_t bits,
                      std::vector<uint8_t>* pass) {
  pass->assign(remaining.size(), 0);
  size_t i = 0;
#if defined(PYTHIA_USE_HWY)
  namespace hn = hwy::HWY_NAMESPACE;
  const hn::ScalableTag<uint32_t> d;
  const size_t lanes = hn::Lanes(d);
  std::vector<uint32_t> letters(remaining.size());
  for (size_t k = 0; k < remaining.size(); ++k) {
    letters[k] = dictionary[remaining[k]].packed().letters;
  }
  std::vector<uint32_t> hits(lanes);
  const auto mask_vec = hn::Set(d, mask);
  const auto bits_vec = hn::Set(d, bits);
  const auto one = hn::Set(d, 1u);
  for (; i + lanes <= remaining.size(); i += lanes) {
    auto matched = hn::Eq(hn::And(hn::LoadU(d, letters.data() + i), mask_vec),
                          bits_vec);
    hn::StoreU(hn::IfThenElseZero(matched, one), d, hits.data());
    for (size_t lane = 0; lane < lanes; ++lane) {
      (*pass)[i + lane] = static_cast<uint8_t>(hits[lane]);
    }
  }
#endif
  // Tail of the vector loop, or every entry in a scalar build.
  for (; i < remaining.size(); ++i) {
    (*pass)[i] =
        (dictionary[remaining[i]].packed().letters & mask) == bits ? 1 : 0;
  }
}

}  // namespace

std::string TrimWhitespace(const std::string& input) {
  size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    ++start;
  }
  size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(start, end - start);
}

bool ParseCount(std::string_view text, size_t max_value, size_t* out) {
  if (text.empty()) {
    return false;
  }
  size_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    size_t digit = static_cast<size_t>(c - '0');
    if (digit > max_value || value > (max_value - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  if (out) {
    *out = value;
  }
  return true;
}

const char* StatusName(SolverStatus status) {
  switch (status) {
    case SolverStatus::kOk:
      return "ok";
    case SolverStatus::kInvalidState:
      return "invalid state";
    case SolverStatus::kMalformedWord:
      return "malformed word";
    case SolverStatus::kMalformedPattern:
      return "malformed pattern";
    case SolverStatus::kInternalFault:
      return "internal fault";
    case SolverStatus::kIoError:
      return "i/o error";
  }
  return "unknown";
}

bool Word::Parse(std::string_view text, Word* out) {
  if (text.size() != kWordLen) {
    return false;
  }
  Word word;
  for (int i = 0; i < kWordLen; ++i) {
    char c = text[i];
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    if (c < 'a' || c > 'z') {
      return false;
    }
    uint32_t letter = static_cast<uint32_t>(c - 'a');
    word.text_[i] = c;
    word.packed_.letters |= letter << (i * kLetterBits);
    word.packed_.mask |= 1U << letter;
  }
  if (out) {
    *out = word;
  }
  return true;
}

uint8_t Word::LetterAt(int index) const {
  return PackedLetterAt(packed_, index);
}

Pattern Pattern::FromTags(const std::array<Tag, kWordLen>& tags) {
  int code = 0;
  int base = 1;
  for (int i = 0; i < kWordLen; ++i) {
    code += static_cast<int>(tags[i]) * base;
    base *= 3;
  }
  return Pattern(code);
}

bool Pattern::Parse(std::string_view text, Pattern* out) {
  if (text.size() != kWordLen) {
    return false;
  }
  std::array<Tag, kWordLen> tags{};
  for (int i = 0; i < kWordLen; ++i) {
    if (!TagFromChar(text[i], &tags[i])) {
      return false;
    }
  }
  if (out) {
    *out = FromTags(tags);
  }
  return true;
}

Tag Pattern::At(int index) const {
  int code = code_;
  for (int i = 0; i < index; ++i) {
    code /= 3;
  }
  return static_cast<Tag>(code % 3);
}

int Pattern::CountOf(Tag tag) const {
  int count = 0;
  for (int i = 0; i < kWordLen; ++i) {
    if (At(i) == tag) {
      ++count;
    }
  }
  return count;
}

std::string Pattern::ToString() const {
  std::string out(kWordLen, '0');
  int code = code_;
  for (int i = 0; i < kWordLen; ++i) {
    out[i] = static_cast<char>('0' + (code % 3));
    code /= 3;
  }
  return out;
}

std::string Pattern::ToColorString() const {
  static const char kLetters[] = {'B', 'Y', 'G'};
  std::string out(kWordLen, 'B');
  int code = code_;
  for (int i = 0; i < kWordLen; ++i) {
    out[i] = kLetters[code % 3];
    code /= 3;
  }
  return out;
}

Pattern Score(const PackedWord& guess, const PackedWord& secret) {
  std::array<uint8_t, kWordLen> guess_letters{};
  std::array<uint8_t, kWordLen> secret_letters{};
  for (int i = 0; i < kWordLen; ++i) {
    guess_letters[i] = PackedLetterAt(guess, i);
    secret_letters[i] = PackedLetterAt(secret, i);
  }

  std::array<int, kAlphabet> pool{};
  pool.fill(0);
  for (int i = 0; i < kWordLen; ++i) {
    pool[secret_letters[i]]++;
  }

  std::array<Tag, kWordLen> tags{};
  tags.fill(Tag::kAbsent);
  for (int i = 0; i < kWordLen; ++i) {
    if (guess_letters[i] == secret_letters[i]) {
      tags[i] = Tag::kExact;
      pool[guess_letters[i]]--;
    }
  }

  for (int i = 0; i < kWordLen; ++i) {
    if (tags[i] == Tag::kExact) {
      continue;
    }
    uint8_t letter = guess_letters[i];
    if ((secret.mask & (1U << letter)) == 0) {
      continue;
    }
    if (pool[letter] > 0) {
      tags[i] = Tag::kPresent;
      pool[letter]--;
    }
  }

  return Pattern::FromTags(tags);
}

Pattern Score(const Word& guess, const Word& secret) {
  return Score(guess.packed(), secret.packed());
}

SolverStatus Dictionary::Create(const std::vector<std::string>& words,
                                Dictionary* out,
                                std::string* error) {
  Dictionary dictionary;
  dictionary.words_.reserve(words.size());
  dictionary.index_.reserve(words.size());
  for (size_t line = 0; line < words.size(); ++line) {
    Word word;
    if (!Word::Parse(words[line], &word)) {
      if (error) {
        *error = "entry " + std::to_string(line + 1) + " \"" + words[line] +
                 "\" is not a five-letter word";
      }
      return SolverStatus::kMalformedWord;
    }
    if (dictionary.index_.count(word) != 0) {
      continue;
    }
    dictionary.index_.emplace(word, dictionary.words_.size());
    dictionary.words_.push_back(word);
  }
  if (out) {
    *out = std::move(dictionary);
  }
  return SolverStatus::kOk;
}

SolverStatus Dictionary::LoadFile(const std::string& path,
                                  Dictionary* out,
                                  std::string* error) {
  std::ifstream infile(path);
  if (!infile) {
    if (error) {
      *error = "cannot open " + path;
    }
    return SolverStatus::kIoError;
  }
  std::vector<std::string> words;
  std::string line;
  while (std::getline(infile, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    size_t start = 0;
    while (start < line.size()) {
      size_t end = line.find_first_of(" \t", start);
      if (end == std::string::npos) {
        end = line.size();
      }
      if (end > start) {
        words.push_back(line.substr(start, end - start));
      }
      start = end + 1;
    }
  }
  SolverStatus status = Create(words, out, error);
  if (status != SolverStatus::kOk && error) {
    *error = path + ": " + *error;
  }
  return status;
}

bool Dictionary::Find(const Word& word, size_t* index_out) const {
  auto it = index_.find(word);
  if (it == index_.end()) {
    return false;
  }
  if (index_out) {
    *index_out = it->second;
  }
  return true;
}

CandidateSet Dictionary::AllIndices() const {
  CandidateSet all(words_.size());
  std::iota(all.begin(), all.end(), 0);
  return all;
}

uint64_t Dictionary::Fingerprint() const {
  uint64_t hash = 1469598103934665603ULL;
  for (const Word& word : words_) {
    for (char c : word.text()) {
      hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
      hash *= 1099511628211ULL;
    }
    hash ^= static_cast<uint64_t>('\n');
    hash *= 1099511628211ULL;
  }
  return hash;
}

bool IsConsistent(const Word& candidate, const Word& guess, Pattern observed) {
  return Score(guess, candidate) == observed;
}

void FilterCandidates(const Dictionary& dictionary,
                      const CandidateSet& remaining,
                      const Word& guess,
                      Pattern observed,
                      CandidateSet* out) {
  if (!out) {
    return;
  }
  out->clear();
  if (remaining.empty()) {
    return;
  }

  uint32_t exact_mask = 0;
  for (int i = 0; i < kWordLen; ++i) {
    if (observed.At(i) == Tag::kExact) {
      exact_mask |= kLetterMask << (i * kLetterBits);
    }
  }
  if (exact_mask == 0) {
    for (size_t index : remaining) {
      if (IsConsistent(dictionary[index], guess, observed)) {
        out->push_back(index);
      }
    }
    return;
  }

  std::vector<uint8_t> pass;
  MarkExactMatches(dictionary, remaining, exact_mask,
                   guess.packed().letters & exact_mask, &pass);
  for (size_t i = 0; i < remaining.size(); ++i) {
    size_t index = remaining[i];
    if (pass[i] && IsConsistent(dictionary[index], guess, observed)) {
      out->push_back(index);
    }
  }
}

}  // namespace pythia
