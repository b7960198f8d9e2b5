#include "lx_natives.hpp"
#include "lx_vm.hpp"
#include <chrono>

namespace loxvm {

namespace {

const auto kProcessStart = std::chrono::steady_clock::now();

Value native_clock(VM&, std::span<const Value>) {
    auto elapsed = std::chrono::steady_clock::now() - kProcessStart;
    return Value::from_number(std::chrono::duration<double>(elapsed).count());
}

} // namespace

void register_builtin_natives(VM& vm) {
    vm.define_native("clock", native_clock, 0);
}

} // namespace loxvm
