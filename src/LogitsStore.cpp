#include "LogitsStore.hpp"
#include "LayoutErrors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace layout {

const char *const LogitsStore::kCharactersKey = "line_characters";

namespace {

const char *const kLinesKey = "lines";

std::vector<int> alphabetToCodes(const Alphabet &alphabet) {
  std::vector<int> codes;
  codes.reserve(alphabet.size());
  for (char32_t c : alphabet) {
    codes.push_back(static_cast<int>(c));
  }
  return codes;
}

Alphabet codesToAlphabet(const std::vector<int> &codes) {
  Alphabet alphabet;
  alphabet.reserve(codes.size());
  for (int code : codes) {
    alphabet.push_back(static_cast<char32_t>(code));
  }
  return alphabet;
}

} // anonymous namespace

void LogitsStore::attach(const TextLine &line, const cv::SparseMat &logits,
                         const Alphabet &alphabet) {
  attach(line.id, logits, alphabet);
}

void LogitsStore::attach(const std::string &lineId,
                         const cv::SparseMat &logits,
                         const Alphabet &alphabet) {
  if (logits.dims() != 2) {
    throw LayoutError("Logits of line " + lineId +
                      " must be a 2-D (frames x columns) matrix");
  }
  LineLogits &entry = m_lines[lineId];
  entry.logits = logits;
  entry.alphabet = alphabet;
}

bool LogitsStore::contains(const std::string &lineId) const {
  return m_lines.find(lineId) != m_lines.end();
}

const LogitsStore::LineLogits &
LogitsStore::get(const std::string &lineId) const {
  auto it = m_lines.find(lineId);
  if (it == m_lines.end()) {
    throw MissingPrerequisite("No logits attached to line " + lineId);
  }
  return it->second;
}

const Alphabet &LogitsStore::alphabet(const TextLine &line) const {
  return get(line.id).alphabet;
}

cv::Mat LogitsStore::dense(const TextLine &line, float missingValue) const {
  const LineLogits &entry = get(line.id);

  cv::Mat result;
  entry.logits.convertTo(result, CV_32F);
  result.setTo(cv::Scalar(missingValue), result == 0);
  return result;
}

cv::Mat LogitsStore::logProbabilities(const TextLine &line,
                                      float missingValue) const {
  return logSoftmax(dense(line, missingValue));
}

void LogitsStore::save(const Page &page, const std::string &path) const {
  // Check every line first so that no incomplete snapshot gets written
  for (const TextLine &line : page.lines()) {
    auto it = m_lines.find(line.id);
    if (it == m_lines.end()) {
      throw MissingPrerequisite("Missing logits for line " + line.id);
    }
    if (it->second.alphabet.empty()) {
      throw MissingPrerequisite("Missing logit mapping to characters for line " +
                                line.id);
    }
  }

  try {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
      throw LayoutError("Failed to open logits file for writing: " + path);
    }

    fs << kLinesKey << "[";
    for (const TextLine &line : page.lines()) {
      fs << "{" << "id" << line.id << "logits" << m_lines.at(line.id).logits
         << "}";
    }
    fs << "]";

    fs << kCharactersKey << "[";
    for (const TextLine &line : page.lines()) {
      fs << "{" << "id" << line.id << "characters"
         << alphabetToCodes(m_lines.at(line.id).alphabet) << "}";
    }
    fs << "]";

    fs.release();
  } catch (const cv::Exception &e) {
    throw LayoutError("Failed to write logits file " + path + ": " + e.what());
  }
}

LogitsStore LogitsStore::load(const Page &page, const std::string &path) {
  std::unordered_map<std::string, cv::SparseMat> logits;
  std::unordered_map<std::string, Alphabet> characters;
  bool hasCharacters = false;

  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      throw MalformedDocument("Failed to open logits file: " + path);
    }

    cv::FileNode linesNode = fs[kLinesKey];
    if (!linesNode.isSeq()) {
      throw MalformedDocument("Logits file " + path + " has no \"" +
                              kLinesKey + "\" sequence");
    }

    for (cv::FileNodeIterator it = linesNode.begin(); it != linesNode.end();
         ++it) {
      cv::FileNode entry = *it;
      std::string id;
      entry["id"] >> id;
      cv::SparseMat matrix;
      entry["logits"] >> matrix;
      if (id.empty() || matrix.dims() != 2) {
        throw MalformedDocument("Invalid line entry in logits file " + path);
      }
      logits[id] = matrix;
    }

    cv::FileNode charactersNode = fs[kCharactersKey];
    if (charactersNode.isSeq()) {
      hasCharacters = true;
      for (cv::FileNodeIterator it = charactersNode.begin();
           it != charactersNode.end(); ++it) {
        cv::FileNode entry = *it;
        std::string id;
        std::vector<int> codes;
        entry["id"] >> id;
        entry["characters"] >> codes;
        characters[id] = codesToAlphabet(codes);
      }
    }
  } catch (const cv::Exception &e) {
    throw MalformedDocument("Failed to read logits file " + path + ": " +
                            e.what());
  }

  if (!hasCharacters) {
    std::cerr << "Warning: logits file " << path
              << " has no character mapping, alphabets left empty"
              << std::endl;
  }

  LogitsStore store;
  for (const TextLine &line : page.lines()) {
    auto it = logits.find(line.id);
    if (it == logits.end()) {
      throw MissingLineData("Missing line id " + line.id + " in logits " +
                            path);
    }

    LineLogits &entry = store.m_lines[line.id];
    entry.logits = it->second;
    auto chars = characters.find(line.id);
    if (chars != characters.end()) {
      entry.alphabet = chars->second;
    }
  }

  return store;
}

cv::Mat logSoftmax(const cv::Mat &matrix) {
  if (matrix.type() != CV_32F) {
    throw LayoutError("logSoftmax expects a CV_32F matrix");
  }

  cv::Mat result(matrix.size(), CV_32F);
  for (int row = 0; row < matrix.rows; ++row) {
    const float *in = matrix.ptr<float>(row);
    float *out = result.ptr<float>(row);

    float maxValue = -std::numeric_limits<float>::infinity();
    for (int col = 0; col < matrix.cols; ++col) {
      maxValue = std::max(maxValue, in[col]);
    }

    double sum = 0.0;
    for (int col = 0; col < matrix.cols; ++col) {
      sum += std::exp(static_cast<double>(in[col] - maxValue));
    }
    const double logSumExp = maxValue + std::log(sum);

    for (int col = 0; col < matrix.cols; ++col) {
      out[col] = static_cast<float>(in[col] - logSumExp);
    }
  }

  return result;
}

} // namespace layout
