#include <linecalc/engine.hpp>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <readline/history.h>
#include <readline/readline.h>

static const char* kHelpText =
    "  2+3*4, (2+3)*4, 5!, 2^10, 1.5E3   expressions\n"
    "  r = 2                             store a variable\n"
    "  area(x) = pi*x^2                  define a function of x\n"
    "  ans, preans                       last two results\n"
    "  vars | funcs | help | quit | exit\n";

static std::optional<std::string> read_line(const char* prompt) {
    char* line = ::readline(prompt);
    if (!line) return std::nullopt;
    std::string text(line);
    std::free(line);
    if (!text.empty()) add_history(text.c_str());
    return text;
}

static void print_variables(const linecalc::SymbolTable& symbols) {
    for (const auto& v : symbols.variables()) {
        std::cout << "  " << v.name() << " = " << linecalc::format_number(v.value());
        if (v.is_final()) std::cout << "  (const)";
        std::cout << "\n";
    }
}

static void print_functions(const linecalc::SymbolTable& symbols) {
    for (const auto& c : symbols.callables()) {
        std::cout << "  " << c.name() << "(x) = " << linecalc::debug(*c.value()) << "\n";
    }
}

int main() {
    linecalc::Engine engine;

    while (auto line = read_line("> ")) {
        if (*line == "quit" || *line == "exit") break;
        if (*line == "help") {
            std::cout << kHelpText;
        } else if (*line == "vars") {
            print_variables(engine.symbols());
        } else if (*line == "funcs") {
            print_functions(engine.symbols());
        } else if (line->find_first_not_of(" \t") == std::string::npos) {
            continue;
        } else {
            try {
                std::cout << linecalc::format_number(engine.run(*line)) << "\n";
            } catch (const std::exception& ex) {
                std::cerr << "error: " << ex.what() << "\n";
            }
        }
    }
    return 0;
}
