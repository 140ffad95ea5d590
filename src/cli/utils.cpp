#include "cli/utils.hpp"

#include "common.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace jcodec::cli {

std::string read_input(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    buffer << file.rdbuf();
    return buffer.str();
}

void print_usage() {
    std::cout << "jcodec " << VERSION << "\n\n";
    std::cout << "Usage: jcodec <command> [options] <file|->\n\n";
    std::cout << "Commands:\n";
    std::cout << "  fmt [--compact] <file>    Print the document (pretty by default)\n";
    std::cout << "  get <cursor> <file>       Print the value at a cursor\n";
    std::cout << "  delete <cursor> <file>    Print the document without the value at a cursor\n";
    std::cout << "  check <file>              Report whether the document parses\n\n";
    std::cout << "Cursors:\n";
    std::cout << "  .                         The whole document\n";
    std::cout << "  .name  .\"any name\"        An object member\n";
    std::cout << "  [3]                       An array element\n";
    std::cout << "  {obj} {arr} {str} {num} {bool} {null}\n";
    std::cout << "                            Require the current value's type\n\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h                Show this help\n";
    std::cout << "  --version, -V             Show version\n";
    std::cout << "  --log-level=<level>       trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>       Per-module levels, e.g. derive=trace,*=warn\n";
    std::cout << "  --log-file=<path>         Also write log records to a file\n";
    std::cout << "  --log-format=<text|json>  Log record format\n";
    std::cout << "  --log-pattern=<template>  Text record template, e.g. \"{level} {message}\"\n";
    std::cout << "  -v, -vv, -vvv, -q         Raise or silence logging\n";
}

void print_version() {
    std::cout << "jcodec " << VERSION << "\n";
}

} // namespace jcodec::cli
