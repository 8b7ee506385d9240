#pragma once

#include <functional>
#include <optional>

#include "common/answer.hpp"

namespace tus::recorder {

enum class CommandKind { Answer, Erase, Abort, Ignore };

struct Command {
  CommandKind kind{CommandKind::Ignore};
  Answer answer{Answer::Missing};  // set for CommandKind::Answer only
};

constexpr char kKeyBackspace = '\x08';
constexpr char kKeyDelete = '\x7f';
constexpr char kKeyInterrupt = '\x03';
constexpr char kKeyEndOfText = '\x04';

Command command_from_key(char key);

// Yields one key per call; std::nullopt means input is exhausted.
using KeySource = std::function<std::optional<char>()>;

}  // namespace tus::recorder
