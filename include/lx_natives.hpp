#pragma once

namespace loxvm {

class VM;

// Installs the built-in host functions (clock) as globals.
void register_builtin_natives(VM& vm);

} // namespace loxvm
