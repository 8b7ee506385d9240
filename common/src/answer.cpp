#include "common/answer.hpp"

#include <cctype>

namespace tus {

char to_code(Answer answer) {
  switch (answer) {
    case Answer::Correct:
      return 'D';
    case Answer::Wrong:
      return 'Y';
    case Answer::Empty:
      return 'B';
    case Answer::Missing:
      return ' ';
  }
  return ' ';
}

std::optional<Answer> answer_from_code(char code) {
  if (code == 'D') return Answer::Correct;
  if (code == 'Y') return Answer::Wrong;
  if (code == 'B') return Answer::Empty;
  if (code == ' ') return Answer::Missing;
  return std::nullopt;
}

std::optional<Answer> parse_answer_key(char key) {
  auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(key)));
  auto answer = answer_from_code(upper);
  if (!answer || *answer == Answer::Missing) return std::nullopt;
  return answer;
}

std::string to_label(Answer answer) {
  switch (answer) {
    case Answer::Correct:
      return "Doğru";
    case Answer::Wrong:
      return "Yanlış";
    case Answer::Empty:
      return "Boş";
    case Answer::Missing:
      return "";
  }
  return "";
}

}  // namespace tus
