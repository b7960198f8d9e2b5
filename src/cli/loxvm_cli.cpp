// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file loxvm_cli.cpp
 * @brief loxvm command-line interface.
 *
 * With no script argument starts an interactive prompt that interprets one
 * line at a time against a single VM; with one argument runs that file.
 * Exit codes follow sysexits: 64 usage, 65 compile error, 70 runtime
 * error, 74 unreadable file.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "lx_vm.hpp"

using namespace loxvm;

namespace {

constexpr int kExitUsage = 64;
constexpr int kExitCompileError = 65;
constexpr int kExitRuntimeError = 70;
constexpr int kExitIoError = 74;

void print_usage() {
    std::cerr << "Usage: loxvm [--trace] [--print-code] [--stats] [path]\n";
}

int repl(VM& vm) {
    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        // Errors were already reported; the VM stays usable
        vm.interpret(line);
    }
    return 0;
}

int run_file(VM& vm, const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "Could not open file \"" << path.string() << "\".\n";
        return kExitIoError;
    }

    std::ostringstream source;
    source << in.rdbuf();
    if (in.bad()) {
        std::cerr << "Could not read file \"" << path.string() << "\".\n";
        return kExitIoError;
    }

    switch (vm.interpret(source.str())) {
        case InterpretResult::CompileError:
            return kExitCompileError;
        case InterpretResult::RuntimeError:
            return kExitRuntimeError;
        case InterpretResult::Ok:
            break;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    VMConfig config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--trace") {
            config.trace_execution = true;
        } else if (arg == "--print-code") {
            config.print_code = true;
        } else if (arg == "--stats") {
            config.enable_debug = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 1) {
        print_usage();
        return kExitUsage;
    }

    try {
        VM vm(std::cout, std::cerr, config);
        if (positional.empty()) {
            return repl(vm);
        }
        return run_file(vm, positional.front());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitRuntimeError;
    }
}
