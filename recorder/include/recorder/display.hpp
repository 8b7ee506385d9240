#pragma once

#include <ostream>
#include <string>

#include "common/category.hpp"
#include "common/quiz.hpp"
#include "common/subject.hpp"

namespace tus::recorder {

// "Anatomi:\t  4D   1Y   0B ->  3.75 [D][D]..."
std::string format_subject_line(const Subject& subject);
// "Temel: (13/100) \t  4D   1Y   0B ->  3.75"
std::string format_category_header(const Category& category);

std::string help_banner();

// Draws the progress block and redraws it in place on later calls.
class Display {
 public:
  void paint(const Quiz& quiz, std::ostream& out);

  // Lines written by one paint for this quiz.
  static int line_count(const Quiz& quiz);

 private:
  void paint_category(const Category& category, std::ostream& out);

  bool painted_{false};
};

}  // namespace tus::recorder
