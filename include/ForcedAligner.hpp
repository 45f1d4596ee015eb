#ifndef LAYOUT_FORCED_ALIGNER_HPP
#define LAYOUT_FORCED_ALIGNER_HPP

#include <opencv2/core.hpp>

#include <vector>

namespace layout {

/**
 * @brief Forced alignment of a label sequence to per-frame costs
 */
class ForcedAligner {
public:
  virtual ~ForcedAligner() = default;

  /**
   * @brief Assign one label to every frame
   * @param negLogProbs CV_32F (frames x columns) negative log-probabilities
   * @param labels Target label sequence (column indices)
   * @param blankIndex Column of the blank label
   * @return One label per row of @p negLogProbs
   * @throws AlignmentError if the labels cannot be aligned
   */
  virtual std::vector<int> align(const cv::Mat &negLogProbs,
                                 const std::vector<int> &labels,
                                 int blankIndex) const = 0;
};

/**
 * @brief Viterbi forced alignment over the CTC topology
 *
 * The label sequence is expanded to blank, l0, blank, l1, ..., blank. A
 * frame may stay in its state, advance by one, or skip a blank between two
 * different labels. The path with the lowest total cost that ends in the
 * last label or the trailing blank is returned.
 */
class CtcForcedAligner : public ForcedAligner {
public:
  std::vector<int> align(const cv::Mat &negLogProbs,
                         const std::vector<int> &labels,
                         int blankIndex) const override;
};

} // namespace layout

#endif // LAYOUT_FORCED_ALIGNER_HPP
