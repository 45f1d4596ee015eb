#include "WordAlignment.hpp"
#include "LayoutErrors.hpp"
#include "Utf8.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace layout {

namespace {

/**
 * @brief A word of the transcription, in code points
 */
struct WordToken {
  size_t offset; ///< Index of the first code point in the transcription
  size_t length; ///< Number of code points
};

std::vector<WordToken> splitWords(const std::u32string &text) {
  std::vector<WordToken> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && isWordSeparator(text[i])) {
      ++i;
    }
    size_t start = i;
    while (i < text.size() && !isWordSeparator(text[i])) {
      ++i;
    }
    if (i > start) {
      words.push_back({start, i - start});
    }
  }
  return words;
}

std::string describeCharacter(char32_t c) {
  std::ostringstream out;
  out << "U+" << std::uppercase << std::hex << std::setw(4)
      << std::setfill('0') << static_cast<unsigned long>(c);
  return out.str();
}

} // anonymous namespace

void narrowLabels(std::vector<int> &path, int blankIndex, bool liberal) {
  const int replacement = liberal ? blankIndex - 1 : blankIndex;

  // Compare against the unmodified label of the previous frame, which may
  // already have been rewritten
  bool havePrevious = false;
  int previous = 0;
  for (size_t i = 0; i < path.size(); ++i) {
    const int label = path[i];
    if (havePrevious && label == previous && label != blankIndex) {
      path[i] = replacement;
    }
    previous = label;
    havePrevious = true;
  }
}

void narrowLabels(std::vector<int> &path, const cv::Mat &logits,
                  int blankIndex, NarrowingPolicy policy, bool liberal) {
  if (policy == NarrowingPolicy::FirstFrame) {
    narrowLabels(path, blankIndex, liberal);
    return;
  }

  const int replacement = liberal ? blankIndex - 1 : blankIndex;
  size_t i = 0;
  while (i < path.size()) {
    const int label = path[i];
    size_t j = i;
    while (j + 1 < path.size() && path[j + 1] == label) {
      ++j;
    }

    if (label != blankIndex && j > i) {
      std::vector<int> frames;
      for (size_t f = i; f <= j; ++f) {
        frames.push_back(static_cast<int>(f));
      }
      const int keep = findMostConfidentFrame(logits, frames, label);
      for (int f : frames) {
        if (f != keep) {
          path[f] = replacement;
        }
      }
    }

    i = j + 1;
  }
}

int findMostConfidentFrame(const cv::Mat &logits,
                           const std::vector<int> &frames, int label) {
  if (frames.empty()) {
    return -1;
  }
  if (logits.type() != CV_32F || label < 0 || label >= logits.cols) {
    throw LayoutError("Cannot rank frames for label " +
                      std::to_string(label));
  }

  int best = frames[0];
  for (int frame : frames) {
    if (frame < 0 || frame >= logits.rows) {
      throw LayoutError("Frame " + std::to_string(frame) +
                        " is outside of the logits");
    }
    if (logits.at<float>(frame, label) > logits.at<float>(best, label)) {
      best = frame;
    }
  }
  return best;
}

std::vector<WordSpan> walkWordBoundaries(const std::string &transcription,
                                         const std::vector<int> &path,
                                         int blankIndex,
                                         bool labelsIncludeSeparators) {
  const std::u32string text = decodeUtf8(transcription);
  const std::vector<WordToken> words = splitWords(text);
  const int frames = static_cast<int>(path.size());
  const int fullWidth = kColumnsPerFrame * frames;

  std::vector<WordSpan> spans;
  std::vector<bool> endsLine; // alignment ran out after this word
  spans.reserve(words.size());

  bool exhausted = false;
  size_t consumedLetters = 0;

  for (size_t w = 0; w < words.size(); ++w) {
    const WordToken &word = words[w];
    const bool lastWord = (w + 1 == words.size());

    WordSpan span;
    span.text = encodeUtf8(text.substr(word.offset, word.length));
    span.hasGap = !lastWord;

    if (exhausted) {
      span.hpos = fullWidth;
      span.width = 0;
      spans.push_back(span);
      endsLine.push_back(true);
      continue;
    }

    const size_t consumed =
        labelsIncludeSeparators ? word.offset : consumedLetters;

    // Every word scans the path from its first frame
    int start = -1;
    int end = -1;
    int next = -1;
    size_t seen = 0;
    for (int a = 0; a < frames; ++a) {
      if (path[a] == blankIndex) {
        continue;
      }
      if (end >= 0) {
        next = a;
        break;
      }
      if (start < 0 && seen == consumed) {
        start = a;
      }
      ++seen;
      if (start >= 0 && seen == consumed + word.length) {
        end = a;
        if (lastWord) {
          break;
        }
      }
    }

    bool finalWord = false;
    if (start < 0) {
      span.hpos = fullWidth;
      span.width = 0;
      finalWord = true;
    } else if (end < 0) {
      span.hpos = kColumnsPerFrame * start;
      span.width = fullWidth - span.hpos;
      finalWord = true;
    } else {
      span.hpos = kColumnsPerFrame * start;
      span.width = kColumnsPerFrame * end - span.hpos;
      finalWord = !lastWord && next < 0;
    }

    exhausted = finalWord;
    consumedLetters += word.length;
    spans.push_back(span);
    endsLine.push_back(finalWord);
  }

  for (size_t w = 0; w < spans.size(); ++w) {
    WordSpan &span = spans[w];
    if (!span.hasGap || endsLine[w]) {
      span.gapEnd = span.end();
    } else {
      span.gapEnd = std::max(span.end(), spans[w + 1].hpos);
    }
  }

  return spans;
}

cv::Rect projectColumns(const cv::Mat &grid, int startColumn, int columnCount,
                        int frameCount) {
  if (grid.empty() || frameCount <= 0) {
    return cv::Rect();
  }
  if (grid.type() != CV_32FC2) {
    throw LayoutError("Line coordinate grid must be CV_32FC2");
  }

  const double scale =
      grid.cols / static_cast<double>(kColumnsPerFrame * frameCount);
  const int first = static_cast<int>(startColumn * scale);
  const int count = static_cast<int>(columnCount * scale);
  const int begin = std::max(0, first);
  const int end = std::min(grid.cols, first + count);

  if (begin >= end) {
    // Zero-area box at the start of the range
    const int col = std::min(std::max(first, 0), grid.cols - 1);
    const cv::Vec2f &p = grid.at<cv::Vec2f>(0, col);
    return cv::Rect(static_cast<int>(p[0]), static_cast<int>(p[1]), 0, 0);
  }

  float minX = grid.at<cv::Vec2f>(0, begin)[0];
  float maxX = minX;
  float minY = grid.at<cv::Vec2f>(0, begin)[1];
  float maxY = minY;
  for (int row = 0; row < grid.rows; ++row) {
    const cv::Vec2f *coords = grid.ptr<cv::Vec2f>(row);
    for (int col = begin; col < end; ++col) {
      minX = std::min(minX, coords[col][0]);
      maxX = std::max(maxX, coords[col][0]);
      minY = std::min(minY, coords[col][1]);
      maxY = std::max(maxY, coords[col][1]);
    }
  }

  return cv::Rect(static_cast<int>(minX), static_cast<int>(minY),
                  static_cast<int>(maxX - minX), static_cast<int>(maxY - minY));
}

std::vector<WordBox> projectWords(const std::vector<WordSpan> &spans,
                                  const cv::Mat &grid, int frameCount) {
  std::vector<WordBox> boxes;
  boxes.reserve(spans.size());

  for (const auto &span : spans) {
    WordBox box;
    box.content = span.text;
    box.box = projectColumns(grid, span.hpos, span.width, frameCount);
    box.hasGap = span.hasGap;
    if (span.hasGap) {
      box.gap = projectColumns(grid, span.end(), span.gapEnd - span.end(),
                               frameCount);
    }
    boxes.push_back(box);
  }

  return boxes;
}

WordGeometryReconstructor::WordGeometryReconstructor(
    const LogitsStore &store, const ForcedAligner &aligner,
    const LineCropper &cropper, const LayoutConfig &config)
    : m_store(store), m_aligner(aligner), m_cropper(cropper),
      m_config(config) {}

void WordGeometryReconstructor::checkPrerequisites(
    const TextLine &line) const {
  if (line.baseline.empty()) {
    throw MissingPrerequisite("Line " + line.id + " has no baseline");
  }
  if (!line.heights) {
    throw MissingPrerequisite("Line " + line.id + " has no heights");
  }
  if (!m_store.contains(line.id)) {
    throw MissingPrerequisite("Line " + line.id + " has no logits");
  }

  const LogitsStore::LineLogits &data = m_store.get(line.id);
  if (data.alphabet.empty()) {
    throw MissingPrerequisite("Line " + line.id + " has no alphabet");
  }
  if (data.logits.size(0) == 0) {
    throw MissingPrerequisite("Line " + line.id + " has empty logits");
  }
  if (data.logits.size(1) != static_cast<int>(data.alphabet.size()) + 1) {
    throw MissingPrerequisite(
        "Logits of line " + line.id + " have " +
        std::to_string(data.logits.size(1)) + " columns, expected " +
        std::to_string(data.alphabet.size() + 1) +
        " (alphabet and blank)");
  }
}

std::vector<int>
WordGeometryReconstructor::alignedPath(const TextLine &line) const {
  checkPrerequisites(line);

  const Alphabet &alphabet = m_store.alphabet(line);
  const int blankIndex = static_cast<int>(alphabet.size());

  std::unordered_map<char32_t, int> charToIndex;
  for (size_t i = 0; i < alphabet.size(); ++i) {
    charToIndex.emplace(alphabet[i], static_cast<int>(i));
  }

  std::vector<int> labels;
  if (line.transcription) {
    for (char32_t c : decodeUtf8(*line.transcription)) {
      auto it = charToIndex.find(c);
      if (it == charToIndex.end()) {
        throw MissingPrerequisite("Character " + describeCharacter(c) +
                                  " of line " + line.id +
                                  " is not in its alphabet");
      }
      labels.push_back(it->second);
    }
  }

  cv::Mat costs = -m_store.logProbabilities(line, m_config.missingLogitValue);
  std::vector<int> path = m_aligner.align(costs, labels, blankIndex);
  if (static_cast<int>(path.size()) != costs.rows) {
    throw AlignmentError("Aligner returned " + std::to_string(path.size()) +
                         " labels for " + std::to_string(costs.rows) +
                         " frames of line " + line.id);
  }

  if (m_config.narrowingPolicy == NarrowingPolicy::FirstFrame) {
    narrowLabels(path, blankIndex, m_config.liberalNarrowing);
  } else {
    narrowLabels(path, m_store.dense(line, m_config.missingLogitValue),
                 blankIndex, m_config.narrowingPolicy,
                 m_config.liberalNarrowing);
  }

  return path;
}

std::vector<WordBox>
WordGeometryReconstructor::reconstruct(const TextLine &line) const {
  checkPrerequisites(line);

  if (!line.transcription ||
      splitWords(decodeUtf8(*line.transcription)).empty()) {
    return {};
  }

  const std::vector<int> path = alignedPath(line);
  const int blankIndex = static_cast<int>(m_store.alphabet(line).size());

  cv::Mat grid = m_cropper.cropCoordinates(line.baseline, *line.heights,
                                           m_config.cropHeight);

  std::vector<WordSpan> spans =
      walkWordBoundaries(*line.transcription, path, blankIndex, true);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Line " << line.id << ": " << path.size()
              << " frames, grid " << grid.cols << "x" << grid.rows << ", "
              << spans.size() << " words" << std::endl;
    for (const auto &span : spans) {
      std::cerr << "DEBUG:   \"" << span.text << "\" columns [" << span.hpos
                << ", " << span.end() << "), gap to " << span.gapEnd
                << std::endl;
    }
  }

  return projectWords(spans, grid, static_cast<int>(path.size()));
}

} // namespace layout
