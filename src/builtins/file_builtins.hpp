#pragma once

namespace lxterm {

class CommandRegistry;

// Emulated file and text commands: list, concat, filter, count, remove, makedir, echo.
void register_file_builtins(CommandRegistry &registry);

} // namespace lxterm
