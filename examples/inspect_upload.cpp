// ═══════════════════════════════════════════════════════════════════
//  inspect_upload.cpp — Parse a captured multipart body from disk
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    formpp_inspect body.bin "multipart/form-data; boundary=XyZ" [save-dir]
//
//  Prints the parsed fields and files as JSON. When save-dir is given,
//  every uploaded file is copied there under its original filename.
//  Limits come from FORMPP_* environment variables.
//
// ═══════════════════════════════════════════════════════════════════

#include "formpp/formpp.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace formpp;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <body-file> <content-type> [save-dir]\n";
        return 2;
    }

    std::filesystem::path bodyPath = argv[1];
    std::string contentType = argv[2];

    std::ifstream in(bodyPath, std::ios::binary);
    if (!in.is_open()) {
        console::error("Cannot open", bodyPath.string());
        return 1;
    }

    try {
        auto options = multipart::Options::fromEnv();
        auto length = static_cast<std::size_t>(std::filesystem::file_size(bodyPath));

        IStreamReader body(in);
        multipart::MultipartParser parser(body, contentType, length, options);

        console::time("parse");
        auto [forms, files] = parser.parse();
        console::timeEnd("parse");

        nlohmann::json out = {
            {"forms", toJson(forms)},
            {"files", toJson(files)},
            {"bytes_read", parser.bytesRead()},
            {"peak_buffer", parser.peakBufferSize()}
        };
        std::cout << out.dump(2) << std::endl;

        if (argc > 3) {
            std::filesystem::path saveDir = argv[3];
            std::filesystem::create_directories(saveDir);
            for (const auto& [name, value] : files) {
                for (std::size_t i = 0; i < value.size(); ++i) {
                    const auto& upload = value.at(i);
                    auto dest = saveDir / std::filesystem::path(upload.filename).filename();
                    upload.file->saveAs(dest);
                    console::success("Saved", name, "->", dest.string());
                }
            }
        }
        // parser goes out of scope here and deletes its temp files
    } catch (const HttpError& e) {
        console::error("Rejected:", e.toJson().dump());
        return 1;
    } catch (const std::invalid_argument& e) {
        console::error("Bad configuration:", e.what());
        return 2;
    }
    return 0;
}
