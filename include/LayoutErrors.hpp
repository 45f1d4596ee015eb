#ifndef LAYOUT_ERRORS_HPP
#define LAYOUT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace layout {

/**
 * @brief Base class of all errors raised by the page layout library
 */
class LayoutError : public std::runtime_error {
public:
  explicit LayoutError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief A source document (or logits snapshot) is structurally invalid
 *
 * Raised at load time. Loading never returns a partially populated model.
 */
class MalformedDocument : public LayoutError {
public:
  explicit MalformedDocument(const std::string &message)
      : LayoutError(message) {}
};

/**
 * @brief A line lacks data required for word geometry reconstruction
 *
 * Fatal for the line only; callers iterating lines may continue with the
 * next one.
 */
class MissingPrerequisite : public LayoutError {
public:
  explicit MissingPrerequisite(const std::string &message)
      : LayoutError(message) {}
};

/**
 * @brief A logits snapshot has no entry for a line present in the page
 */
class MissingLineData : public LayoutError {
public:
  explicit MissingLineData(const std::string &message)
      : LayoutError(message) {}
};

/**
 * @brief The forced aligner could not place the labels into the frames
 */
class AlignmentError : public LayoutError {
public:
  explicit AlignmentError(const std::string &message)
      : LayoutError(message) {}
};

} // namespace layout

#endif // LAYOUT_ERRORS_HPP
