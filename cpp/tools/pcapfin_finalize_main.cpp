#include <iostream>
#include <memory>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "pcapfin/config.h"
#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"
#include "pcapfin/finalizer.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: pcapfin_finalize <config.json> [--target cli|rest]\n";
        return 1;
    }

    std::filesystem::path config_path = argv[1];
    std::string target = "cli";

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--target") target = arg_value(i, argc, argv);
    }

    if (target != "cli" && target != "rest") {
        std::cerr << "Unknown --target: " << target << "\n";
        return 1;
    }

    try {
        auto fs = std::make_shared<pcapfin::LocalFileSystem>();
        auto cfg = pcapfin::load_finalizer_config_file(config_path, fs);

        pcapfin::Finalizer finalizer(target == "rest" ? pcapfin::rest_strategy() : pcapfin::cli_strategy());
        auto pages = finalizer.finalize_job(cfg);

        std::cout << pcapfin::to_json(pages).dump() << "\n";
        return 0;
    } catch (const pcapfin::JobException& e) {
        nlohmann::json j;
        j["error"] = pcapfin::error_code_name(e.code());
        j["message"] = e.what();
        std::cerr << "pcapfin_finalize failed: " << j.dump() << "\n";
        return 2;
    }
}
