#include "recorder/input.hpp"

namespace tus::recorder {

Command command_from_key(char key) {
  if (key == kKeyBackspace || key == kKeyDelete) return {CommandKind::Erase};
  if (key == kKeyInterrupt || key == kKeyEndOfText) return {CommandKind::Abort};
  if (auto answer = parse_answer_key(key)) return {CommandKind::Answer, *answer};
  return {CommandKind::Ignore};
}

}  // namespace tus::recorder
