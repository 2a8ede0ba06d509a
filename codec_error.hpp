#ifndef CODEC_ERROR_HPP
#define CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sonicpx {

    enum class ErrorKind {
        InvalidArgument,
        FieldTooLong,
        InputTooLarge,
        UnrecognizedFormat,
        InvalidStegoHeader,
        UnrecognizedPayloadMagic,
        TruncatedHeader,
        DecompressionFailed,
        ImageDecodeFailed,
        ImageEncodeFailed,
        IoFailed
    };

    // Thrown by the codec layer. The kind survives propagation so the
    // boundary can choose wording without matching on what().
    class CodecError : public std::runtime_error {
    public:
        CodecError(ErrorKind kind, const std::string& detail)
            : std::runtime_error(detail), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    const char* errorKindName(ErrorKind kind);

    // Message shown to an end user for a failed operation
    std::string describeError(ErrorKind kind);

}

#endif // CODEC_ERROR_HPP
