#include "recorder/display.hpp"

#include <iomanip>
#include <sstream>

#include "recorder/terminal.hpp"

namespace tus::recorder {

namespace {

void write_totals(std::ostream& out, int correct, int wrong, int empty, double net) {
  out << std::setw(3) << correct << to_code(Answer::Correct) << ' ' << std::setw(3) << wrong
      << to_code(Answer::Wrong) << ' ' << std::setw(3) << empty << to_code(Answer::Empty)
      << " -> " << std::fixed << std::setprecision(2) << std::setw(5) << net;
}

void overwrite_line(std::ostream& out, const std::string& line) {
  clear_line(out);
  out << line << '\n';
}

}  // namespace

std::string format_subject_line(const Subject& subject) {
  std::ostringstream oss;
  oss << subject.name() << ":\t";
  write_totals(oss, subject.num_correct(), subject.num_wrong(), subject.num_empty(),
               subject.num_net());
  oss << ' ';
  for (Answer a : subject.answers()) {
    oss << '[' << to_code(a) << ']';
  }
  return oss.str();
}

std::string format_category_header(const Category& category) {
  std::ostringstream oss;
  oss << category.name() << ": (" << std::setw(2) << category.view().cursor() << '/'
      << category.view().size() << ") \t";
  write_totals(oss, category.num_correct(), category.num_wrong(), category.num_empty(),
               category.num_net());
  return oss.str();
}

std::string help_banner() {
  std::ostringstream oss;
  for (Answer a : {Answer::Correct, Answer::Wrong, Answer::Empty}) {
    oss << to_code(a) << " -> " << to_label(a) << '\n';
  }
  oss << "Backspace -> Sil\n";
  oss << "CTRL+C -> İptal\n";
  return oss.str();
}

void Display::paint(const Quiz& quiz, std::ostream& out) {
  if (painted_) {
    cursor_up(out, line_count(quiz));
  } else {
    painted_ = true;
  }
  paint_category(quiz.theoretical(), out);
  paint_category(quiz.clinical(), out);
  out.flush();
}

int Display::line_count(const Quiz& quiz) {
  return static_cast<int>(quiz.subject_count()) + 2;
}

void Display::paint_category(const Category& category, std::ostream& out) {
  overwrite_line(out, format_category_header(category));
  for (const auto& s : category.subjects()) {
    overwrite_line(out, "\t" + format_subject_line(s));
  }
}

}  // namespace tus::recorder
