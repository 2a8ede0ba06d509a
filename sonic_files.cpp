#include "sonic_files.hpp"

#include "image_io.hpp"
#include "sonic_codec.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace sonicpx {

    static std::vector<uint8_t> readInputFile(const std::string& path) {
        std::vector<uint8_t> bytes = readFileBytes(path);
        if (bytes.size() > MAX_INPUT_BYTES) {
            throw CodecError(ErrorKind::InputTooLarge,
                             path + " is " + std::to_string(bytes.size()) + " bytes");
        }
        return bytes;
    }

    static void report(const char* tag, const CodecError& e, ErrorKind* errorOut) {
        std::cerr << "[" << tag << "] " << errorKindName(e.kind()) << ": " << e.what() << "\n";
        if (errorOut) {
            *errorOut = e.kind();
        }
    }

    // Stream and filesystem failures that escape as std exceptions
    static void report(const char* tag, const std::exception& e, ErrorKind* errorOut) {
        std::cerr << "[" << tag << "] " << errorKindName(ErrorKind::IoFailed) << ": " << e.what() << "\n";
        if (errorOut) {
            *errorOut = ErrorKind::IoFailed;
        }
    }

    std::string baseName(const std::string& path)
    {
        return fs::path(path).filename().string();
    }

    std::string guessMimeType(const std::string& path)
    {
        std::string ext = fs::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".mp3")  return "audio/mpeg";
        if (ext == ".wav")  return "audio/wav";
        if (ext == ".ogg" || ext == ".oga") return "audio/ogg";
        if (ext == ".flac") return "audio/flac";
        if (ext == ".m4a")  return "audio/mp4";
        if (ext == ".aac")  return "audio/aac";
        if (ext == ".webm") return "audio/webm";
        return "application/octet-stream";
    }

    bool encodeNoiseFile(const std::string& audioPath,
                         const std::string& outImagePath,
                         ErrorKind* errorOut)
    {
        try {
            const std::vector<uint8_t> data = readInputFile(audioPath);
            PixelBuffer img = encodeNoise(data, guessMimeType(audioPath), baseName(audioPath));
            saveImageFile(outImagePath, img);
            std::cout << "[noise] Done. " << img.width << "x" << img.height
                      << " saved: " << outImagePath << std::endl;
            return true;
        } catch (const CodecError& e) {
            report("noise", e, errorOut);
            return false;
        } catch (const std::exception& e) {
            report("noise", e, errorOut);
            return false;
        }
    }

    bool encodeStegoFile(const std::string& audioPath,
                         const std::string& coverImagePath,
                         const std::string& outImagePath,
                         int targetBpc,
                         ErrorKind* errorOut,
                         CapacityPlan* planOut)
    {
        try {
            const std::vector<uint8_t> data = readInputFile(audioPath);
            const PixelBuffer cover = loadImageFile(coverImagePath);
            PixelBuffer img = encodeStego(data, guessMimeType(audioPath), baseName(audioPath),
                                          cover, targetBpc, planOut);
            saveImageFile(outImagePath, img);
            std::cout << "[embed] Done. " << img.width << "x" << img.height << " @ " << targetBpc
                      << " bpc, saved: " << outImagePath << std::endl;
            return true;
        } catch (const CodecError& e) {
            report("embed", e, errorOut);
            return false;
        } catch (const std::exception& e) {
            report("embed", e, errorOut);
            return false;
        }
    }

    bool decodeImageFile(const std::string& imagePath,
                         const std::string& outDir,
                         DecodedFile& outFile,
                         ErrorKind* errorOut)
    {
        try {
            const PixelBuffer pixels = loadImageFile(imagePath);
            outFile = decode(pixels);

            // Never trust a stored name with directory parts
            std::string name = baseName(outFile.fileName);
            if (name.empty() || name == "." || name == "..") {
                name = "decoded.bin";
            }
            const std::string outPath = (fs::path(outDir.empty() ? "." : outDir) / name).string();
            writeFileBytes(outPath, outFile.data);

            std::cout << "[decode] Recovered " << outFile.data.size() << " bytes ("
                      << outFile.mimeType << ") -> " << outPath << std::endl;
            return true;
        } catch (const CodecError& e) {
            report("decode", e, errorOut);
            return false;
        } catch (const std::exception& e) {
            report("decode", e, errorOut);
            return false;
        }
    }

}
