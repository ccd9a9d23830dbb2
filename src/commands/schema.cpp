#include "commands/schema.hpp"

#include "schema/SchemaModel.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_schema(int argc, char** argv) {
    const std::string out_path = get_arg(argc, argv, "--out", "");
    const std::string text = resumeval::to_json_schema(resumeval::resume_entity()).dump(2);

    if (out_path.empty()) {
        std::cout << text << "\n";
        return 0;
    }

    try {
        const fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::out | std::ios::trunc);
        if (!out) {
            std::cerr << "[error] failed to write schema: " << out_path << "\n";
            return 1;
        }
        out << text << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cout << "OUT_SCHEMA: " << out_path << "\n";
    return 0;
}
