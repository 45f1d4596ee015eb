#ifndef LAYOUT_WORD_ALIGNMENT_HPP
#define LAYOUT_WORD_ALIGNMENT_HPP

#include "ForcedAligner.hpp"
#include "LayoutConfig.hpp"
#include "LineCropper.hpp"
#include "LogitsStore.hpp"
#include "PageLayout.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace layout {

/// Alignment columns per frame
constexpr int kColumnsPerFrame = 4;

/**
 * @brief Narrow runs of repeated labels to their first frame
 *
 * Every maximal run of consecutive, identical, non-blank labels keeps its
 * label on the first frame only; the other frames of the run become
 * @p blankIndex, or blankIndex - 1 in liberal mode. Two separated
 * occurrences of the same label are independent runs.
 *
 * @param path Alignment path, modified in place
 * @param blankIndex Blank label (alphabet size)
 * @param liberal Rewrite to blankIndex - 1 instead of blankIndex
 */
void narrowLabels(std::vector<int> &path, int blankIndex,
                  bool liberal = false);

/**
 * @brief Narrow runs of repeated labels using a selectable policy
 *
 * With NarrowingPolicy::MostConfidentFrame, the frame of the run with the
 * highest logit for the run's label keeps the label instead of the first.
 *
 * @param logits Dense (frames x columns) logits matching @p path
 */
void narrowLabels(std::vector<int> &path, const cv::Mat &logits,
                  int blankIndex, NarrowingPolicy policy,
                  bool liberal = false);

/**
 * @brief Frame of @p frames with the highest logit in column @p label
 *
 * Ties keep the earliest frame.
 * @return The chosen frame, -1 if @p frames is empty
 */
int findMostConfidentFrame(const cv::Mat &logits,
                           const std::vector<int> &frames, int label);

/**
 * @brief Extent of one word in alignment columns (frame index x 4)
 */
struct WordSpan {
  std::string text; ///< The word (UTF-8)
  int hpos = 0;     ///< First column of the word
  int width = 0;    ///< Columns covered by the word
  int gapEnd = 0;   ///< End column of the gap after the word
  bool hasGap = false; ///< False for the last word of the line

  int end() const { return hpos + width; }
};

/**
 * @brief Locate every whitespace-delimited word on a narrowed path
 *
 * Each word is searched from the first frame of the path. A word starts at
 * the non-blank frame preceded by exactly as many non-blank frames as
 * letters consumed by the previous words, and ends at the non-blank frame
 * that completes its letter count. When no non-blank frame follows a
 * completed word, it becomes the last word of the line and the remaining
 * words get zero width at the end of the line. A word that never completes
 * extends to the end of the line.
 *
 * @param transcription Line text
 * @param path Narrowed alignment path
 * @param blankIndex Blank label
 * @param labelsIncludeSeparators The aligned labels contain the whitespace
 * between words, so separators count as consumed letters too
 */
std::vector<WordSpan> walkWordBoundaries(const std::string &transcription,
                                         const std::vector<int> &path,
                                         int blankIndex,
                                         bool labelsIncludeSeparators = false);

/**
 * @brief Pixel bounding box of a range of alignment columns
 *
 * The columns are scaled by gridWidth / (4 * frameCount) onto the grid;
 * the box covers the sampled coordinates of all grid rows in that range.
 * An empty range gives a zero-area box.
 *
 * @param grid CV_32FC2 coordinate grid from a LineCropper
 * @param startColumn First alignment column
 * @param columnCount Number of alignment columns
 * @param frameCount Number of alignment frames
 */
cv::Rect projectColumns(const cv::Mat &grid, int startColumn, int columnCount,
                        int frameCount);

/**
 * @brief Reconstructed geometry of one word
 */
struct WordBox {
  std::string content;  ///< The word (UTF-8)
  cv::Rect box;         ///< Pixel box of the word
  bool hasGap = false;  ///< Whether a gap follows the word
  cv::Rect gap;         ///< Pixel box of the gap after the word
};

/**
 * @brief Project word spans through a line coordinate grid
 */
std::vector<WordBox> projectWords(const std::vector<WordSpan> &spans,
                                  const cv::Mat &grid, int frameCount);

/**
 * @brief Reconstructs word and gap boxes of text lines
 *
 * Borrows the logits store and the collaborators; all of them must outlive
 * the reconstructor. reconstruct() never modifies its inputs and can be
 * called for different lines independently.
 */
class WordGeometryReconstructor {
public:
  WordGeometryReconstructor(const LogitsStore &store,
                            const ForcedAligner &aligner,
                            const LineCropper &cropper,
                            const LayoutConfig &config = LayoutConfig());

  /**
   * @brief Word and gap boxes of a line
   * @return One box per word, empty for an absent or blank transcription
   * @throws MissingPrerequisite if the line has no baseline, heights,
   * logits or alphabet, or its text uses characters outside the alphabet
   * @throws AlignmentError if the forced alignment fails
   */
  std::vector<WordBox> reconstruct(const TextLine &line) const;

  /**
   * @brief Narrowed alignment path of a line
   *
   * First half of reconstruct(), exposed for inspection.
   */
  std::vector<int> alignedPath(const TextLine &line) const;

  const LayoutConfig &getConfig() const { return m_config; }

private:
  void checkPrerequisites(const TextLine &line) const;

  const LogitsStore &m_store;
  const ForcedAligner &m_aligner;
  const LineCropper &m_cropper;
  LayoutConfig m_config;
};

} // namespace layout

#endif // LAYOUT_WORD_ALIGNMENT_HPP
