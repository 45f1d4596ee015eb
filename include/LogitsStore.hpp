#ifndef LAYOUT_LOGITS_STORE_HPP
#define LAYOUT_LOGITS_STORE_HPP

#include "PageLayout.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <unordered_map>

namespace layout {

/// Alphabet of a line: code point at index i labels logit column i
using Alphabet = std::u32string;

/**
 * @brief Per-line character logits and alphabets, keyed by line id
 *
 * The store is a side table owned by the caller. Lines are looked up by
 * their id, so line ids must be unique within a page.
 *
 * Example usage:
 * @code
 * layout::LogitsStore store = layout::LogitsStore::load(page, "page.logits.yml.gz");
 * cv::Mat logProbs = store.logProbabilities(line);
 * @endcode
 */
class LogitsStore {
public:
  /// Reserved snapshot key holding the line id -> alphabet mapping
  static const char *const kCharactersKey;

  /**
   * @brief Sparse logits and alphabet of one line
   */
  struct LineLogits {
    cv::SparseMat logits; ///< (frames x columns), zeros are not stored
    Alphabet alphabet;    ///< Empty when unknown (legacy snapshots)
  };

  /**
   * @brief Attach logits and alphabet to a line, replacing previous data
   * @param line Line the data belongs to
   * @param logits 2-D sparse matrix of shape (frames x columns)
   * @param alphabet Characters labelling the logit columns
   */
  void attach(const TextLine &line, const cv::SparseMat &logits,
              const Alphabet &alphabet);
  void attach(const std::string &lineId, const cv::SparseMat &logits,
              const Alphabet &alphabet);

  /**
   * @brief Check whether logits are attached to a line
   */
  bool contains(const std::string &lineId) const;

  /**
   * @brief Stored data of a line
   * @throws MissingPrerequisite if nothing is attached to the line
   */
  const LineLogits &get(const std::string &lineId) const;

  /**
   * @brief Alphabet of a line
   * @throws MissingPrerequisite if nothing is attached to the line
   */
  const Alphabet &alphabet(const TextLine &line) const;

  /**
   * @brief Dense logits with unstored entries replaced
   *
   * A log-probability is never exactly zero, so a zero entry means "no
   * evidence" and is replaced by @p missingValue.
   *
   * @param line Line to decode
   * @param missingValue Value substituted for structurally-zero entries
   * @return CV_32F matrix of shape (frames x columns)
   * @throws MissingPrerequisite if no logits are attached to the line
   */
  cv::Mat dense(const TextLine &line, float missingValue = -80.0f) const;

  /**
   * @brief Row-normalized log-probabilities of a line
   *
   * Applies a numerically stable log-softmax to every row of dense(), so
   * that every row sums to one in the probability domain.
   */
  cv::Mat logProbabilities(const TextLine &line,
                           float missingValue = -80.0f) const;

  /// Number of lines with attached data
  size_t size() const { return m_lines.size(); }

  /**
   * @brief Save the logits of every page line into one snapshot file
   *
   * The file is a cv::FileStorage document; its format follows the file
   * extension (.yml, .xml, .json, optionally followed by .gz).
   *
   * @throws MissingPrerequisite if a page line has no logits or alphabet
   */
  void save(const Page &page, const std::string &path) const;

  /**
   * @brief Load a snapshot for the lines of a page
   *
   * Snapshots without the alphabet mapping give every line an empty
   * alphabet.
   *
   * @return A new store holding the data of every page line
   * @throws MissingLineData if a page line has no entry in the snapshot
   * @throws MalformedDocument if the file cannot be read
   */
  static LogitsStore load(const Page &page, const std::string &path);

private:
  std::unordered_map<std::string, LineLogits> m_lines;
};

/**
 * @brief Row-wise log-softmax: x - logsumexp(x) per row
 * @param matrix CV_32F input
 * @return CV_32F matrix of the same shape
 */
cv::Mat logSoftmax(const cv::Mat &matrix);

} // namespace layout

#endif // LAYOUT_LOGITS_STORE_HPP
