// cpp/tools/pcapfin_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "pcapfin/filesystem.h"
#include "pcapfin/validator.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: pcapfin_validate <file.pcap> [file.pcap ...]\n";
        return 1;
    }

    std::vector<std::filesystem::path> files;
    for (int i = 1; i < argc; ++i) files.emplace_back(argv[i]);

    pcapfin::LocalFileSystem local;
    auto vr = pcapfin::validate_pages(local, pcapfin::ResultPages(std::move(files)));

    nlohmann::json j;
    j["ok"] = vr.ok;
    j["packets"] = vr.packets;
    j["errors"] = vr.errors;

    std::cout << j.dump() << "\n";
    return vr.ok ? 0 : 2;
}
