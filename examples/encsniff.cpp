#include <encsniff/detector.h>
#include <encsniff/encoding.h>
#include <encsniff/transcode.h>

#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    std::fprintf(stderr,
                 "usage: encsniff [--legacy-bom-order] FILE...\n"
                 "       encsniff [--legacy-bom-order] --utf8 FILE\n");
}

} // namespace

int main(int argc, char* argv[]) {
    encsniff::DetectorConfig config;
    bool to_utf8 = false;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--legacy-bom-order") {
            config.bom_order = encsniff::BomOrder::legacy;
        } else if (arg == "--utf8") {
            to_utf8 = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg.starts_with("--")) {
            std::fprintf(stderr, "encsniff: unknown option '%s'\n", argv[i]);
            print_usage();
            return 2;
        } else {
            paths.emplace_back(arg);
        }
    }

    if (paths.empty() || (to_utf8 && paths.size() != 1)) {
        print_usage();
        return 2;
    }

    if (to_utf8) {
        try {
            auto decoded = encsniff::decode_file(std::filesystem::path(paths[0]), config);
            std::fwrite(decoded.text.data(), 1, decoded.text.size(), stdout);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "encsniff: cannot decode '%s': %s\n",
                         paths[0].c_str(), e.what());
            return 1;
        }
        return 0;
    }

    int status = 0;
    for (const auto& path : paths) {
        try {
            auto label = encsniff::detect_encoding(std::filesystem::path(path), config);
            auto name = encsniff::to_string(label);
            std::printf("%s: %.*s\n", path.c_str(),
                        static_cast<int>(name.size()), name.data());
        } catch (const std::exception& e) {
            std::fprintf(stderr, "encsniff: cannot open '%s': %s\n",
                         path.c_str(), e.what());
            status = 1;
        }
    }
    return status;
}
