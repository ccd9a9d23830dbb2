#include "commands/validate.hpp"

#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

// first non-flag argument after the command name; --out and --normalized
// consume the following argument
static std::string get_positional(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--out" || a == "--normalized") {
            ++i;
            continue;
        }
        if (a.size() > 1 && a[0] == '-') continue;
        return a;
    }
    return "";
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  resume-validate validate <file|-> [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 write the JSON validation report\n"
        << "  --normalized <path>          write the normalized resume on success\n"
        << "  --quiet                      only print violations\n"
        << "  --no-semantic                skip date range and ordering checks\n"
        << "  --no-ordering                skip the workHistory ordering check\n"
        << "  --strict-ordering            treat OrderingViolation as an error\n"
        << "\n"
        << "exit codes: 0 valid, 1 violations, 2 malformed or unreadable input\n";
    return kExitInvalid;
}

resumeval::ValidationResult validate_input(const std::string& path, const resumeval::ValidatorConfig& cfg) {
    std::string text;
    try {
        text = (path == "-") ? resumeval::read_stream(std::cin) : resumeval::read_text_file(path);
    } catch (const std::exception& e) {
        resumeval::ValidationResult res;
        res.report.add(resumeval::make_violation("$", resumeval::ViolationKind::MalformedInput, e.what()));
        return res;
    }
    return resumeval::validate_text(text, cfg);
}

void print_violations(std::ostream& os, const resumeval::ValidationReport& rep) {
    for (const auto& v : rep.violations) {
        os << "- " << resumeval::kind_str(v.kind) << " at " << v.path << ": " << v.message << "\n";
    }
}

static void write_normalized(const fs::path& path, const resumeval::Resume& resume) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to write normalized resume: " + path.string());
    out << resumeval::resume_to_json(resume).dump(2) << "\n";
}

int exit_code_for(const resumeval::ValidationReport& rep) {
    if (rep.malformed()) return kExitMalformed;
    if (!rep.pass()) return kExitInvalid;
    return kExitOk;
}

int cmd_validate(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        validate_usage();
        return kExitOk;
    }

    const std::string input = get_positional(argc, argv);
    if (input.empty()) {
        std::cerr << "[error] missing input file\n";
        return validate_usage();
    }

    resumeval::ValidatorConfig cfg;
    cfg.semantic_checks   = !has_flag(argc, argv, "--no-semantic");
    cfg.check_ordering    = !has_flag(argc, argv, "--no-ordering");
    cfg.ordering_is_error = has_flag(argc, argv, "--strict-ordering");

    const bool quiet = has_flag(argc, argv, "--quiet");
    const std::string out_path        = get_arg(argc, argv, "--out", "");
    const std::string normalized_path = get_arg(argc, argv, "--normalized", "");

    const resumeval::ValidationResult res = validate_input(input, cfg);
    const resumeval::ValidationReport& rep = res.report;

    // a failed report write is logged; violations and exit code still
    // come from the report
    bool report_written = false;
    if (!out_path.empty()) {
        try {
            resumeval::write_validation_report(fs::path(out_path), rep);
            report_written = true;
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
        }
    }

    if (!rep.pass()) {
        std::cerr << "[error] validation failed: " << rep.error_count() << " error(s), "
                  << rep.warning_count() << " warning(s)\n";
        print_violations(std::cerr, rep);
        return exit_code_for(rep);
    }

    if (rep.warning_count() > 0) {
        std::cerr << "[warn] " << rep.warning_count() << " warning(s)\n";
        print_violations(std::cerr, rep);
    }

    if (!normalized_path.empty()) {
        try {
            write_normalized(fs::path(normalized_path), *res.resume);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return kExitInvalid;
        }
    }

    if (!quiet) {
        std::cout << "VALIDATION: pass\n";
        if (report_written) std::cout << "OUT_VALIDATE: " << out_path << "\n";
        if (!normalized_path.empty()) std::cout << "OUT_NORMALIZED: " << normalized_path << "\n";
    }
    return kExitOk;
}
