#pragma once

// Local headers
#include "fitsmeta_filesystem.hxx"

// Standard library
#include <string>

namespace fitsmeta {
namespace test {

// A scratch directory removed, with its contents, on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path(const std::string& name) const;

private:
    fs::path dir_;
};

// Primary float32 image of `width` x `height` zero pixels and no extra keywords.
void write_float_image(const std::string& path, long width, long height);

// Header-only primary, a 3-D uint16 image extension, a binary table with 10 rows and an
// ASCII table with 3 rows.
void write_multi_extension(const std::string& path);

// Header-only primary exercising every kind of header record.
void write_header_zoo(const std::string& path);

// Header-only primary followed by a Rice-compressed 20 x 10 int16 image.
void write_compressed_image(const std::string& path);

// Valid float32 primary image followed by an image extension holding a string card
// without its closing quote.
void write_broken_extension(const std::string& path);

// Random groups primary with 7 groups.
void write_random_groups(const std::string& path);

void write_text_file(const std::string& path, const std::string& contents);

// The long string written by `write_header_zoo` under LONGSTR.
std::string long_string_value();
}  // namespace test
}  // namespace fitsmeta
