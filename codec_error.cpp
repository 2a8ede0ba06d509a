#include "codec_error.hpp"

namespace sonicpx {

    const char* errorKindName(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::InvalidArgument:          return "InvalidArgument";
            case ErrorKind::FieldTooLong:             return "FieldTooLong";
            case ErrorKind::InputTooLarge:            return "InputTooLarge";
            case ErrorKind::UnrecognizedFormat:       return "UnrecognizedFormat";
            case ErrorKind::InvalidStegoHeader:       return "InvalidStegoHeader";
            case ErrorKind::UnrecognizedPayloadMagic: return "UnrecognizedPayloadMagic";
            case ErrorKind::TruncatedHeader:          return "TruncatedHeader";
            case ErrorKind::DecompressionFailed:      return "DecompressionFailed";
            case ErrorKind::ImageDecodeFailed:        return "ImageDecodeFailed";
            case ErrorKind::ImageEncodeFailed:        return "ImageEncodeFailed";
            case ErrorKind::IoFailed:                 return "IoFailed";
        }
        return "Unknown";
    }

    std::string describeError(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::InvalidArgument:
                return "Invalid encoding options.";
            case ErrorKind::FieldTooLong:
                return "File name or type is too long to store (255 bytes max).";
            case ErrorKind::InputTooLarge:
                return "File too large. Please keep under 50MB.";
            case ErrorKind::UnrecognizedFormat:
                return "This image does not contain valid Sonic Pixelator data. "
                       "Please ensure you uploaded the correct PNG file.";
            case ErrorKind::InvalidStegoHeader:
                return "The hidden header is damaged (invalid density or length).";
            case ErrorKind::UnrecognizedPayloadMagic:
                return "Data Extraction Error: The hidden payload could not be verified. "
                       "Pixels may have been altered.";
            case ErrorKind::TruncatedHeader:
                return "Header Read Error: Buffer truncated.";
            case ErrorKind::DecompressionFailed:
                return "Failed to decompress audio data. The image pixels may have been "
                       "altered by compression.";
            case ErrorKind::ImageDecodeFailed:
                return "Could not read the image file.";
            case ErrorKind::ImageEncodeFailed:
                return "Image generation failed.";
            case ErrorKind::IoFailed:
                return "Could not read or write a file.";
        }
        return "Unknown error.";
    }

}
