#include "export.hpp"

#include <png.h>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

using Bytes = std::vector<uint8_t>;

static bool has_suffix(const std::string& s, const char* suffix)
{
    const size_t n = std::strlen(suffix);
    if (s.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        char c = s[s.size() - n + i];
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (c != suffix[i]) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// File output shared by both encoders. The whole image is encoded in memory
// first, so a failed encode never leaves a truncated file behind.
// ---------------------------------------------------------------------------
struct FileCloser {
    void operator()(FILE* fp) const { std::fclose(fp); }
};

static std::string write_bytes(const char* path, const Bytes& data)
{
    std::unique_ptr<FILE, FileCloser> fp(std::fopen(path, "wb"));
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    const size_t written = std::fwrite(data.data(), 1, data.size(), fp.get());
    if (written != data.size())
        return std::string("Short write: ") + path;

    // Close explicitly so a failed flush is reported.
    if (std::fclose(fp.release()) != 0)
        return std::string("Error closing file: ") + path;
    return {};
}

// ---------------------------------------------------------------------------
// PNG
// ---------------------------------------------------------------------------
namespace {

// Owns the libpng write and info structs.
struct PngWriteGuard {
    png_structp png  = nullptr;
    png_infop   info = nullptr;

    PngWriteGuard()
    {
        png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (png)
            info = png_create_info_struct(png);
    }
    ~PngWriteGuard() { png_destroy_write_struct(&png, info ? &info : nullptr); }

    PngWriteGuard(const PngWriteGuard&)            = delete;
    PngWriteGuard& operator=(const PngWriteGuard&) = delete;
};

void png_append(png_structp png, png_bytep data, png_size_t len)
{
    auto* out = static_cast<Bytes*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + len);
}

void png_flush_noop(png_structp) {}

} // namespace

// libpng reports errors by longjmp. Nothing with a destructor may live in
// this frame, so the guard and the row table belong to the caller.
static bool png_encode_rows(png_structp png, png_infop info,
                            const PixelBuffer& buf, png_bytepp rows)
{
    if (setjmp(png_jmpbuf(png)))
        return false;

    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_rows(png, info, rows);
    png_write_png(png, info, PNG_TRANSFORM_IDENTITY, nullptr);
    return true;
}

std::string export_png(const char* path, const PixelBuffer& buf)
{
    if (buf.empty())
        return "Nothing to export";

    PngWriteGuard guard;
    if (!guard.png || !guard.info)
        return "Cannot create PNG encoder";

    // PixelBuffer rows are already packed RGB, top row first.
    std::vector<png_bytep> rows(static_cast<size_t>(buf.height));
    for (int y = 0; y < buf.height; ++y)
        rows[y] = const_cast<png_bytep>(buf.row(y));

    Bytes encoded;
    encoded.reserve(buf.rgb.size() / 2);
    png_set_write_fn(guard.png, &encoded, png_append, png_flush_noop);

    if (!png_encode_rows(guard.png, guard.info, buf, rows.data()))
        return "PNG encoding failed";
    return write_bytes(path, encoded);
}

// ---------------------------------------------------------------------------
// JPEG XL (lossless, 8-bit RGB)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
struct JxlEncoderDeleter {
    void operator()(JxlEncoder* enc) const { JxlEncoderDestroy(enc); }
};
using JxlEncoderOwner = std::unique_ptr<JxlEncoder, JxlEncoderDeleter>;

static std::string jxl_setup(JxlEncoder* enc, const PixelBuffer& buf)
{
    JxlBasicInfo info;
    JxlEncoderInitBasicInfo(&info);
    info.xsize                 = static_cast<uint32_t>(buf.width);
    info.ysize                 = static_cast<uint32_t>(buf.height);
    info.bits_per_sample       = 8;
    info.num_color_channels    = 3;
    info.uses_original_profile = JXL_TRUE;
    if (JxlEncoderSetBasicInfo(enc, &info) != JXL_ENC_SUCCESS)
        return "JPEG XL: rejected image header";

    JxlColorEncoding srgb;
    JxlColorEncodingSetToSRGB(&srgb, JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &srgb) != JXL_ENC_SUCCESS)
        return "JPEG XL: rejected sRGB color encoding";

    JxlEncoderFrameSettings* frame = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (!frame || JxlEncoderSetFrameLossless(frame, JXL_TRUE) != JXL_ENC_SUCCESS)
        return "JPEG XL: cannot enable lossless mode";

    const JxlPixelFormat format = {3, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(frame, &format, buf.rgb.data(), buf.rgb.size())
            != JXL_ENC_SUCCESS)
        return "JPEG XL: cannot add image frame";

    JxlEncoderCloseInput(enc);
    return {};
}

// Drains the encoder, growing the output buffer until it fits.
static bool jxl_drain(JxlEncoder* enc, Bytes& out)
{
    size_t used = 0;
    out.resize(1 << 16);
    for (;;) {
        uint8_t* next  = out.data() + used;
        size_t   avail = out.size() - used;
        const JxlEncoderStatus st = JxlEncoderProcessOutput(enc, &next, &avail);
        used = static_cast<size_t>(next - out.data());
        if (st == JXL_ENC_SUCCESS) {
            out.resize(used);
            return true;
        }
        if (st != JXL_ENC_NEED_MORE_OUTPUT)
            return false;
        out.resize(out.size() * 2);
    }
}

std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    if (buf.empty())
        return "Nothing to export";

    JxlEncoderOwner enc(JxlEncoderCreate(nullptr));
    if (!enc)
        return "Cannot create JPEG XL encoder";

    const std::string err = jxl_setup(enc.get(), buf);
    if (!err.empty())
        return err;

    Bytes encoded;
    if (!jxl_drain(enc.get(), encoded))
        return "JPEG XL encoding failed";
    return write_bytes(path, encoded);
}
#endif  // HAVE_JXL

// ---------------------------------------------------------------------------

std::string export_image(const std::string& path, const PixelBuffer& buf)
{
    if (buf.empty())
        return "Nothing to export";
    if (has_suffix(path, ".jxl")) {
#ifdef HAVE_JXL
        return export_jxl(path.c_str(), buf);
#else
        return "JPEG XL support not compiled in";
#endif
    }
    return export_png(path.c_str(), buf);
}

std::string export_file_name(const Viewport& vp, std::time_t when, const char* ext)
{
    char ts[32];
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &when);
#else
    localtime_r(&when, &tm_buf);
#endif
    std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", &tm_buf);

    char name[128];
    std::snprintf(name, sizeof(name), "mandelbrot_zoom%.3g_%s.%s", vp.zoom_level, ts, ext);
    return name;
}
