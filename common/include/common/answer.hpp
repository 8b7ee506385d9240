#pragma once

#include <optional>
#include <string>

namespace tus {

enum class Answer { Correct, Wrong, Empty, Missing };

// Single-character code used on screen and in saved records.
char to_code(Answer answer);
std::optional<Answer> answer_from_code(char code);

// Maps a raw key to a user-enterable answer. Missing is never returned.
std::optional<Answer> parse_answer_key(char key);

std::string to_label(Answer answer);

}  // namespace tus
