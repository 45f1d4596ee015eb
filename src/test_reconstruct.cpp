#include "ForcedAligner.hpp"
#include "LayoutErrors.hpp"
#include "LineCropper.hpp"
#include "LogitsStore.hpp"
#include "WordAlignment.hpp"

#include <iostream>
#include <string>
#include <vector>

int failures = 0;

void check(bool condition, const std::string &name) {
  std::cout << (condition ? "[PASS] " : "[FAIL] ") << name << std::endl;
  if (!condition) {
    ++failures;
  }
}

// Logits peaking at one column per frame, every other entry left unstored
cv::SparseMat peakLogits(const std::vector<int> &peaks, int columns) {
  const int sizes[] = {static_cast<int>(peaks.size()), columns};
  cv::SparseMat logits(2, sizes, CV_32F);
  for (size_t t = 0; t < peaks.size(); ++t) {
    logits.ref<float>(static_cast<int>(t), peaks[t]) = 10.0f;
  }
  return logits;
}

layout::TextLine makeLine(const std::string &id,
                          const std::string &transcription) {
  layout::TextLine line;
  line.id = id;
  line.baseline = {{0, 50}, {100, 50}};
  line.polygon = {{0, 40}, {100, 40}, {100, 55}, {0, 55}};
  line.heights = layout::LineHeights{10.0f, 5.0f};
  line.transcription = transcription;
  return line;
}

bool sameLine(const layout::TextLine &a, const layout::TextLine &b) {
  return a.id == b.id && a.baseline == b.baseline && a.polygon == b.polygon &&
         a.heights == b.heights && a.transcription == b.transcription;
}

template <typename Exception, typename Function> bool throws(Function f) {
  try {
    f();
  } catch (const Exception &e) {
    std::cout << "  " << e.what() << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cout << "  unexpected exception: " << e.what() << std::endl;
    return false;
  }
  return false;
}

int main() {
  std::cout << "=== Test WordGeometryReconstructor ===" << std::endl
            << std::endl;

  // Alphabet {a:0, b:1, ' ':2, c:3}, blank 4
  const layout::Alphabet alphabet = U"ab c";
  layout::LogitsStore store;
  layout::TextLine line = makeLine("l1", "ab c");
  store.attach(line, peakLogits({0, 0, 1, 4, 2, 4, 4, 3, 4, 4}, 5), alphabet);

  layout::CtcForcedAligner aligner;
  layout::BaselineLineCropper cropper;
  layout::LayoutConfig config;
  config.cropHeight = 15; // one grid row per pixel of line height
  layout::WordGeometryReconstructor reconstructor(store, aligner, cropper,
                                                  config);

  std::vector<int> path = reconstructor.alignedPath(line);
  check(path == std::vector<int>({0, 4, 1, 4, 2, 4, 4, 3, 4, 4}),
        "aligned and narrowed path");

  const layout::TextLine before = line;
  std::vector<layout::WordBox> words = reconstructor.reconstruct(line);
  for (const auto &word : words) {
    std::cout << "  \"" << word.content << "\" " << word.box;
    if (word.hasGap) {
      std::cout << " gap " << word.gap;
    }
    std::cout << std::endl;
  }

  check(words.size() == 2, "one box per word");
  check(words[0].content == "ab" && words[1].content == "c", "word content");
  check(words[0].box == cv::Rect(0, 40, 19, 14), "first word box");
  check(words[0].hasGap && words[0].gap == cv::Rect(20, 40, 49, 14),
        "gap box reaches the next word");
  check(!words[1].hasGap, "last word has no gap");
  check(words[1].box == cv::Rect(70, 40, 0, 0),
        "single letter word has a zero-area box");
  check(sameLine(line, before), "line is not modified");

  std::vector<layout::WordBox> again = reconstructor.reconstruct(line);
  bool same = again.size() == words.size();
  for (size_t i = 0; same && i < words.size(); ++i) {
    same = again[i].content == words[i].content &&
           again[i].box == words[i].box && again[i].gap == words[i].gap &&
           again[i].hasGap == words[i].hasGap;
  }
  check(same, "reconstruction is idempotent");

  layout::TextLine blank = makeLine("l1", "   ");
  check(reconstructor.reconstruct(blank).empty(),
        "whitespace-only transcription has no words");
  layout::TextLine untranscribed = makeLine("l1", "");
  untranscribed.transcription.reset();
  check(reconstructor.reconstruct(untranscribed).empty(),
        "absent transcription has no words");

  std::cout << std::endl << "=== Test missing prerequisites ===" << std::endl
            << std::endl;

  layout::TextLine withoutLogits = makeLine("l2", "ab");
  const layout::TextLine copy = withoutLogits;
  check(throws<layout::MissingPrerequisite>(
            [&] { reconstructor.reconstruct(withoutLogits); }),
        "line without logits");
  check(sameLine(withoutLogits, copy), "failed line is left unchanged");

  layout::TextLine withoutBaseline = makeLine("l1", "ab c");
  withoutBaseline.baseline.clear();
  check(throws<layout::MissingPrerequisite>(
            [&] { reconstructor.reconstruct(withoutBaseline); }),
        "line without baseline");

  layout::TextLine withoutHeights = makeLine("l1", "ab c");
  withoutHeights.heights.reset();
  check(throws<layout::MissingPrerequisite>(
            [&] { reconstructor.reconstruct(withoutHeights); }),
        "line without heights");

  layout::TextLine unknownCharacter = makeLine("l1", "ab x");
  check(throws<layout::MissingPrerequisite>(
            [&] { reconstructor.reconstruct(unknownCharacter); }),
        "character outside of the alphabet");

  store.attach("l3", peakLogits({0, 1}, 5), layout::Alphabet());
  check(throws<layout::MissingPrerequisite>(
            [&] { reconstructor.reconstruct(makeLine("l3", "ab")); }),
        "empty alphabet");

  store.attach("l4", peakLogits({0, 1}, 3), alphabet);
  check(throws<layout::MissingPrerequisite>(
            [&] { reconstructor.reconstruct(makeLine("l4", "ab")); }),
        "logits without a blank column");

  store.attach("l5", peakLogits({0, 0}, 5), alphabet);
  check(throws<layout::AlignmentError>(
            [&] { reconstructor.reconstruct(makeLine("l5", "aa")); }),
        "too few frames for the transcription");

  std::cout << std::endl
            << (failures == 0 ? "All tests passed"
                              : std::to_string(failures) + " test(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
