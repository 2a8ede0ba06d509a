#ifndef SONIC_FILES_HPP
#define SONIC_FILES_HPP

#include <string>

#include "capacity_planner.hpp"
#include "codec_error.hpp"
#include "payload.hpp"
#include "sonic_config.hpp"

// File-to-file wrappers: log to stderr and return false on failure.
// errorOut, when given, receives the failure kind.
namespace sonicpx {

    bool encodeNoiseFile(const std::string& audioPath,
                         const std::string& outImagePath,
                         ErrorKind* errorOut = nullptr);

    bool encodeStegoFile(const std::string& audioPath,
                         const std::string& coverImagePath,
                         const std::string& outImagePath,
                         int targetBpc = DEFAULT_BPC,
                         ErrorKind* errorOut = nullptr,
                         CapacityPlan* planOut = nullptr);

    // Writes the recovered file into outDir under its stored name
    bool decodeImageFile(const std::string& imagePath,
                         const std::string& outDir,
                         DecodedFile& outFile,
                         ErrorKind* errorOut = nullptr);

    // By extension; application/octet-stream when unknown
    std::string guessMimeType(const std::string& path);

    // Filename component of a path, without directories
    std::string baseName(const std::string& path);

}

#endif // SONIC_FILES_HPP
