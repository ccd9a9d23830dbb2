#include "commands/ResumeDump.hpp"
#include "commands/schema.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  resume-validate validate <file|-> [options]\n"
        << "  resume-validate dump <file|->\n"
        << "  resume-validate schema [--out <path>]\n"
        << "  resume-validate help\n"
        << "\n"
        << "run 'resume-validate <command> --help' for command options\n";
    return 1;
}

static int print_schema_help() {
    std::cerr
        << "usage:\n"
        << "  resume-validate schema [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 write the Draft-7 JSON Schema here instead of stdout\n";
    return 0;
}

static int print_dump_help() {
    std::cerr
        << "usage:\n"
        << "  resume-validate dump <file|->\n"
        << "\n"
        << "validates the resume, then prints a readable summary of it\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    if (cmd == "schema" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_schema_help();
    if (cmd == "dump"   && (argc >= 3 && std::string(argv[2]) == "--help")) return print_dump_help();

    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "schema")   return cmd_schema(argc - 1, argv + 1);
    if (cmd == "dump") {
        if (argc < 3) {
            std::cerr << "[error] missing input file\n";
            print_dump_help();
            return 1;
        }
        return resumeDump(argv[2]);
    }

    std::cerr << "unknown command\n";
    return print_usage();
}
