#include "image_io.hpp"

#include "codec_error.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace sonicpx {

    static cv::Mat wrapRgba(const PixelBuffer& pixels) {
        return cv::Mat(pixels.height, pixels.width, CV_8UC4,
                       const_cast<uint8_t*>(pixels.rgba.data()));
    }

    static PixelBuffer fromMat(const cv::Mat& decoded) {
        cv::Mat rgba;
        switch (decoded.channels()) {
            case 1: cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA); break;
            case 3: cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA); break;
            case 4: cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA); break;
            default:
                throw CodecError(ErrorKind::ImageDecodeFailed,
                                 "unsupported channel count " + std::to_string(decoded.channels()));
        }

        PixelBuffer out(rgba.cols, rgba.rows);
        for (int y = 0; y < rgba.rows; ++y) {
            std::memcpy(out.rgba.data() + static_cast<size_t>(y) * rgba.cols * 4,
                        rgba.ptr<uint8_t>(y), static_cast<size_t>(rgba.cols) * 4);
        }
        forceOpaque(out);
        return out;
    }

    PixelBuffer decodeImageBytes(const std::vector<uint8_t>& bytes)
    {
        if (bytes.empty()) {
            throw CodecError(ErrorKind::ImageDecodeFailed, "image data is empty");
        }
        const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));

        cv::Mat img;
        try {
            // UNCHANGED also skips EXIF rotation, so pixel order is the file's own
            img = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
        } catch (const cv::Exception& e) {
            std::cerr << "[image] Strict decode failed, falling back: " << e.what() << "\n";
            img.release();
        }

        // Anything but 8-bit samples would need a depth conversion; the default decode does that
        if (img.empty() || img.depth() != CV_8U) {
            if (!img.empty()) {
                std::cerr << "[image] Strict decode gave a non 8-bit image, falling back.\n";
            }
            try {
                img = cv::imdecode(raw, cv::IMREAD_COLOR);
            } catch (const cv::Exception& e) {
                throw CodecError(ErrorKind::ImageDecodeFailed, std::string("imdecode: ") + e.what());
            }
        }
        if (img.empty()) {
            throw CodecError(ErrorKind::ImageDecodeFailed, "unrecognised or corrupt image data");
        }
        return fromMat(img);
    }

    std::vector<uint8_t> encodeImageBytes(const PixelBuffer& pixels)
    {
        if (pixels.empty()) {
            throw CodecError(ErrorKind::ImageEncodeFailed, "nothing to encode");
        }
        // Alpha is always 255, so a 3-channel PNG holds every payload bit
        cv::Mat bgr = toBgrMat(pixels);

        std::vector<uchar> out;
        bool ok = false;
        try {
            ok = cv::imencode(".png", bgr, out);
        } catch (const cv::Exception& e) {
            throw CodecError(ErrorKind::ImageEncodeFailed, std::string("imencode: ") + e.what());
        }
        if (!ok) {
            throw CodecError(ErrorKind::ImageEncodeFailed, "PNG encoding failed");
        }
        return std::vector<uint8_t>(out.begin(), out.end());
    }

    PixelBuffer resampleCover(const PixelBuffer& cover, int newWidth, int newHeight, bool smooth)
    {
        if (cover.empty() || newWidth <= 0 || newHeight <= 0) {
            throw CodecError(ErrorKind::InvalidArgument, "cannot resample an empty image");
        }
        if (newWidth == cover.width && newHeight == cover.height) {
            return cover;
        }

        cv::Mat dst;
        try {
            cv::resize(wrapRgba(cover), dst, cv::Size(newWidth, newHeight), 0, 0,
                       smooth ? cv::INTER_CUBIC : cv::INTER_NEAREST);
        } catch (const cv::Exception& e) {
            throw CodecError(ErrorKind::InvalidArgument, std::string("resize: ") + e.what());
        }

        PixelBuffer out(newWidth, newHeight);
        for (int y = 0; y < newHeight; ++y) {
            std::memcpy(out.rgba.data() + static_cast<size_t>(y) * newWidth * 4,
                        dst.ptr<uint8_t>(y), static_cast<size_t>(newWidth) * 4);
        }
        return out;
    }

    cv::Mat toBgrMat(const PixelBuffer& pixels)
    {
        cv::Mat bgr;
        try {
            cv::cvtColor(wrapRgba(pixels), bgr, cv::COLOR_RGBA2BGR);
        } catch (const cv::Exception& e) {
            throw CodecError(ErrorKind::ImageEncodeFailed, std::string("cvtColor: ") + e.what());
        }
        return bgr;
    }

    std::vector<uint8_t> readFileBytes(const std::string& path)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            throw CodecError(ErrorKind::IoFailed, "is a directory: " + path);
        }
        std::ifstream ifs(path, std::ios::binary | std::ios::ate);
        if (!ifs.good()) {
            throw CodecError(ErrorKind::IoFailed, "cannot open file: " + path);
        }
        const std::streamoff size = ifs.tellg();
        if (size < 0) {
            throw CodecError(ErrorKind::IoFailed, "cannot size file: " + path);
        }
        ifs.seekg(0, std::ios::beg);

        std::vector<uint8_t> bytes(static_cast<size_t>(size));
        if (!bytes.empty()) {
            ifs.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        if (ifs.bad() || ifs.fail()) {
            throw CodecError(ErrorKind::IoFailed, "read failed: " + path);
        }
        return bytes;
    }

    void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes)
    {
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs.good()) {
            throw CodecError(ErrorKind::IoFailed, "cannot write file: " + path);
        }
        ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!ofs.good()) {
            throw CodecError(ErrorKind::IoFailed, "short write: " + path);
        }
    }

    PixelBuffer loadImageFile(const std::string& path)
    {
        return decodeImageBytes(readFileBytes(path));
    }

    void saveImageFile(const std::string& path, const PixelBuffer& pixels)
    {
        writeFileBytes(path, encodeImageBytes(pixels));
    }

}
