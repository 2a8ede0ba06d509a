#include "cli_parser.hpp"
#include "codec_error.hpp"
#include "image_io.hpp"
#include "metrics.hpp"
#include "sonic_config.hpp"
#include "sonic_files.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

static void printUsage() {
    std::cout << "Usage:\n"
              << "  sonicpx encode-noise --in <audio> [--out <image.png>]\n"
              << "  sonicpx encode-stego --in <audio> --cover <image> [--out <image.png>] [--bpc 1..7] [--metrics]\n"
              << "  sonicpx decode --in <image.png> [--out-dir <dir>]\n";
}

static std::string defaultOutputName(const std::string& mode) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "sonic_pixel_" + mode + "_" + std::to_string(ms) + ".png";
}

static void fail(sonicpx::ErrorKind kind) {
    std::cerr << "[ERROR] " << sonicpx::describeError(kind) << "\n";
}

// PSNR/SSIM against the cover at the size it was embedded into
static void printStegoMetrics(const std::string& coverPath, const std::string& stegoPath,
                              const sonicpx::CapacityPlan& plan) {
    try {
        sonicpx::PixelBuffer cover = sonicpx::resampleCover(
            sonicpx::loadImageFile(coverPath), plan.newWidth, plan.newHeight, plan.scale > 1.0);
        sonicpx::forceOpaque(cover);
        const sonicpx::PixelBuffer stego = sonicpx::loadImageFile(stegoPath);
        std::cout << "[metrics] PSNR = " << sonicpx::metrics::computePSNR(cover, stego) << " dB\n"
                  << "[metrics] SSIM = " << sonicpx::metrics::computeSSIM(cover, stego) << "\n";
    } catch (const sonicpx::CodecError& e) {
        std::cerr << "[metrics] " << e.what() << "\n";
    }
}

int main(int argc, char** argv) {
    sonicpx::CliParser cli;
    cli.parse(argc, argv);

    if (cli.positionals().empty() || cli.has("help")) {
        printUsage();
        return 1;
    }
    const std::string command = cli.positionals().front();
    const std::string in = cli.get("in");
    if (in.empty()) {
        printUsage();
        return 1;
    }

    sonicpx::ErrorKind kind = sonicpx::ErrorKind::IoFailed;

    if (command == "encode-noise") {
        const std::string out = cli.get("out", defaultOutputName("noise"));
        if (!sonicpx::encodeNoiseFile(in, out, &kind)) {
            fail(kind);
            return 2;
        }
        return 0;
    }

    if (command == "encode-stego") {
        const std::string cover = cli.get("cover");
        if (cover.empty()) {
            printUsage();
            return 1;
        }
        int bpc = sonicpx::DEFAULT_BPC;
        try {
            bpc = cli.getInt("bpc", sonicpx::DEFAULT_BPC);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << e.what() << "\n";
            printUsage();
            return 1;
        }
        if (bpc < sonicpx::MIN_BPC || bpc > sonicpx::MAX_ENCODE_BPC) {
            std::cerr << "[ERROR] --bpc must be between " << sonicpx::MIN_BPC
                      << " and " << sonicpx::MAX_ENCODE_BPC << "\n";
            return 1;
        }

        const std::string out = cli.get("out", defaultOutputName("stego"));
        sonicpx::CapacityPlan plan;
        if (!sonicpx::encodeStegoFile(in, cover, out, bpc, &kind, &plan)) {
            fail(kind);
            return 2;
        }
        if (cli.has("metrics")) {
            printStegoMetrics(cover, out, plan);
        }
        return 0;
    }

    if (command == "decode") {
        sonicpx::DecodedFile file;
        if (!sonicpx::decodeImageFile(in, cli.get("out-dir", "."), file, &kind)) {
            fail(kind);
            return 2;
        }
        std::cout << "File: " << file.fileName << "\nType: " << file.mimeType
                  << "\nSize: " << file.data.size() << " bytes\n";
        return 0;
    }

    std::cerr << "[ERROR] Unknown command: " << command << "\n";
    printUsage();
    return 1;
}
