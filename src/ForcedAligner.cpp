#include "ForcedAligner.hpp"
#include "LayoutErrors.hpp"

#include <limits>
#include <string>

namespace layout {

std::vector<int> CtcForcedAligner::align(const cv::Mat &negLogProbs,
                                         const std::vector<int> &labels,
                                         int blankIndex) const {
  if (negLogProbs.type() != CV_32F) {
    throw AlignmentError("Forced alignment expects a CV_32F cost matrix");
  }

  const int frames = negLogProbs.rows;
  const int columns = negLogProbs.cols;
  if (frames == 0) {
    throw AlignmentError("Cannot align labels to an empty cost matrix");
  }
  if (blankIndex < 0 || blankIndex >= columns) {
    throw AlignmentError("Blank index " + std::to_string(blankIndex) +
                         " is outside of the " + std::to_string(columns) +
                         " cost columns");
  }
  for (int label : labels) {
    if (label < 0 || label >= columns) {
      throw AlignmentError("Label " + std::to_string(label) +
                           " is outside of the " + std::to_string(columns) +
                           " cost columns");
    }
  }

  // Expanded CTC state sequence: blank, l0, blank, l1, ..., blank
  const int states = 2 * static_cast<int>(labels.size()) + 1;
  std::vector<int> statePath(states, blankIndex);
  for (size_t i = 0; i < labels.size(); ++i) {
    statePath[2 * i + 1] = labels[i];
  }

  // A blank may be skipped only between two different labels
  std::vector<bool> canSkip(states, false);
  for (int s = 2; s < states; ++s) {
    canSkip[s] = statePath[s] != statePath[s - 2];
  }

  const float INF = std::numeric_limits<float>::infinity();
  std::vector<std::vector<float>> cost(frames, std::vector<float>(states, INF));
  std::vector<std::vector<int>> backpointers(frames,
                                             std::vector<int>(states, 0));

  const float *firstRow = negLogProbs.ptr<float>(0);
  cost[0][0] = firstRow[statePath[0]];
  if (states > 1) {
    cost[0][1] = firstRow[statePath[1]];
  }

  for (int t = 1; t < frames; ++t) {
    const float *row = negLogProbs.ptr<float>(t);
    for (int s = 0; s < states; ++s) {
      float best = cost[t - 1][s];
      int bestPrev = s;

      if (s >= 1 && cost[t - 1][s - 1] < best) {
        best = cost[t - 1][s - 1];
        bestPrev = s - 1;
      }
      if (s >= 2 && canSkip[s] && cost[t - 1][s - 2] < best) {
        best = cost[t - 1][s - 2];
        bestPrev = s - 2;
      }

      if (best < INF) {
        cost[t][s] = best + row[statePath[s]];
        backpointers[t][s] = bestPrev;
      }
    }
  }

  // The path must end in the last label or the trailing blank
  int finalState = states - 1;
  if (states > 1 && cost[frames - 1][states - 2] < cost[frames - 1][finalState]) {
    finalState = states - 2;
  }
  if (!(cost[frames - 1][finalState] < INF)) {
    throw AlignmentError("Cannot align " + std::to_string(labels.size()) +
                         " labels to " + std::to_string(frames) + " frames");
  }

  std::vector<int> path(frames);
  int state = finalState;
  for (int t = frames - 1; t >= 0; --t) {
    path[t] = statePath[state];
    state = backpointers[t][state];
  }

  return path;
}

} // namespace layout
