#pragma once

#include "renderer.hpp"

#include <ctime>
#include <string>

// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// Picks the encoder from the file extension (.jxl when available, else PNG).
std::string export_image(const std::string& path, const PixelBuffer& buf);

// "mandelbrot_zoom<z>_<YYYYmmdd_HHMMSS>.<ext>"
std::string export_file_name(const Viewport& vp, std::time_t when, const char* ext);

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
