#include "obseq/script/program.hpp"

namespace obseq {
namespace script {

void Program::add_command(Command command, int line) {
    commands_.push_back(std::move(command));
    lines_.push_back(line);
}

} // namespace script
} // namespace obseq
