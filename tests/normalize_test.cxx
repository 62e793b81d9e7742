#include "fitsmeta/json_report.hxx"
#include "fitsmeta/normalize.hxx"

#include "test_files.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

namespace fitsmeta {

using test::TempDir;


TEST(NormalizeTest, DescribesSingleFloatImage)
{
    TempDir dir;
    const std::string path = dir.path("image.fits");
    test::write_float_image(path, 100, 100);

    const Report report = normalize(path);
    ASSERT_FALSE(report.is_error());
    ASSERT_EQ(report.hdus().size(), 1U);

    const HduDescriptor& hdu = report.hdus()[0];
    EXPECT_EQ(hdu.index, 0U);
    EXPECT_EQ(hdu.kind, HduKind::primary);
    EXPECT_EQ(hdu.data_shape, (std::vector<long long>{ 100, 100 }));
    EXPECT_EQ(hdu.data_type, "float32");
    ASSERT_NE(hdu.header.find("BITPIX"), nullptr);
    EXPECT_EQ(*hdu.header.find("BITPIX"), HeaderValue::from_integer(-32));
    EXPECT_EQ(*hdu.header.find("SIMPLE"), HeaderValue::from_bool(true));

    const json j = to_json(report);
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["type"], "PrimaryHDU");
    EXPECT_EQ(j[0]["data_shape"], json::array({ 100, 100 }));
    EXPECT_EQ(j[0]["data_type"], "float32");
}


TEST(NormalizeTest, DescribesEveryHduInOrder)
{
    TempDir dir;
    const std::string path = dir.path("multi.fits");
    test::write_multi_extension(path);

    const Report report = normalize(path);
    ASSERT_FALSE(report.is_error());
    const std::vector<HduDescriptor>& hdus = report.hdus();
    ASSERT_EQ(hdus.size(), 4U);
    for (size_t i = 0; i < hdus.size(); i++) EXPECT_EQ(hdus[i].index, i);

    EXPECT_EQ(hdus[0].kind, HduKind::primary);
    EXPECT_FALSE(hdus[0].has_data());

    EXPECT_EQ(hdus[1].kind, HduKind::image_extension);
    EXPECT_EQ(hdus[1].data_shape, (std::vector<long long>{ 3, 4, 5 }));
    EXPECT_EQ(hdus[1].data_type, "uint16");
    EXPECT_EQ(*hdus[1].header.find("EXTNAME"), HeaderValue::from_string("SCI"));

    EXPECT_EQ(hdus[2].kind, HduKind::binary_table);
    EXPECT_EQ(hdus[2].data_shape, (std::vector<long long>{ 10 }));
    EXPECT_EQ(hdus[2].data_type, "record[ID:int32, FLUX:float32, NAME:S16]");
    EXPECT_EQ(*hdus[2].header.find("TTYPE2"), HeaderValue::from_string("FLUX"));

    EXPECT_EQ(hdus[3].kind, HduKind::ascii_table);
    EXPECT_EQ(hdus[3].data_shape, (std::vector<long long>{ 3 }));
    EXPECT_EQ(hdus[3].data_type.find("record[RA:"), 0U);
    EXPECT_NE(hdus[3].data_type.find(", DEC:"), std::string::npos);
    EXPECT_EQ(*hdus[3].header.find("EXTNAME"), HeaderValue::from_string("COORDS"));
}


TEST(NormalizeTest, NormalizesHeaderRecords)
{
    TempDir dir;
    const std::string path = dir.path("zoo.fits");
    test::write_header_zoo(path);

    const Report report = normalize(path);
    ASSERT_FALSE(report.is_error());
    ASSERT_EQ(report.hdus().size(), 1U);
    const Header& header = report.hdus()[0].header;

    EXPECT_FALSE(header.contains(""));
    EXPECT_FALSE(header.contains("CONTINUE"));

    EXPECT_EQ(*header.find("OBJECT"), HeaderValue::from_string("M31"));
    EXPECT_EQ(*header.find("QUOTED"), HeaderValue::from_string("it's here"));
    EXPECT_EQ(*header.find("PADDED"), HeaderValue::from_string("  left"));
    EXPECT_EQ(*header.find("EXPOSURE"), HeaderValue::from_integer(120));
    EXPECT_EQ(*header.find("GAIN"), HeaderValue::from_float(1.5));
    EXPECT_EQ(*header.find("DGAIN"), HeaderValue::from_float(2500.0));
    EXPECT_EQ(*header.find("SIMPLEST"), HeaderValue::from_bool(true));
    EXPECT_EQ(*header.find("FLIPPED"), HeaderValue::from_bool(false));
    EXPECT_TRUE(header.find("UNDEF")->is_null());
    EXPECT_EQ(*header.find("CPLX"), HeaderValue::from_other("(1.0, 2.0)"));
    EXPECT_EQ(*header.find("HUGE"), HeaderValue::from_other("123456789012345678901234"));
    EXPECT_EQ(*header.find("ESO DET CHIP"), HeaderValue::from_string("CCD-1"));
    EXPECT_EQ(*header.find("DUP"), HeaderValue::from_integer(2));
    EXPECT_EQ(*header.find("LONGSTR"), HeaderValue::from_string(test::long_string_value()));
    EXPECT_EQ(*header.find("HISTORY"), HeaderValue::from_string("second history"));
    EXPECT_EQ(*header.find("COMMENT"), HeaderValue::from_string("last comment"));
}


TEST(NormalizeTest, HeaderValuesAreJsonScalars)
{
    TempDir dir;
    const std::string path = dir.path("zoo.fits");
    test::write_header_zoo(path);

    const json header = to_json(normalize(path))[0]["header"];
    for (auto it = header.begin(); it != header.end(); ++it) {
        EXPECT_FALSE(it.key().empty());
        EXPECT_TRUE(it->is_primitive()) << it.key();
    }
    EXPECT_TRUE(header["CPLX"].is_string());
    EXPECT_TRUE(header["UNDEF"].is_null());
}


TEST(NormalizeTest, EmptyAxisMeansNoData)
{
    TempDir dir;
    const std::string path = dir.path("empty_axis.fits");
    test::write_float_image(path, 0, 10);

    const Report report = normalize(path);
    ASSERT_FALSE(report.is_error());
    ASSERT_EQ(report.hdus().size(), 1U);
    EXPECT_FALSE(report.hdus()[0].has_data());
    EXPECT_TRUE(report.hdus()[0].data_type.empty());
}


TEST(NormalizeTest, DescribesRandomGroups)
{
    TempDir dir;
    const std::string path = dir.path("groups.fits");
    test::write_random_groups(path);

    const Report report = normalize(path);
    ASSERT_FALSE(report.is_error());
    ASSERT_EQ(report.hdus().size(), 1U);
    EXPECT_EQ(report.hdus()[0].kind, HduKind::random_groups);
    EXPECT_EQ(report.hdus()[0].data_shape, (std::vector<long long>{ 7 }));
    EXPECT_EQ(report.hdus()[0].data_type, "record");
    EXPECT_EQ(to_json(report)[0]["type"], "GroupsHDU");
}


TEST(NormalizeTest, DescribesCompressedImage)
{
    TempDir dir;
    const std::string path = dir.path("compressed.fits");
    test::write_compressed_image(path);

    const Report report = normalize(path);
    ASSERT_FALSE(report.is_error());
    ASSERT_EQ(report.hdus().size(), 2U);
    const HduDescriptor& hdu = report.hdus()[1];
    EXPECT_EQ(hdu.kind, HduKind::compressed_image);
    EXPECT_EQ(hdu.data_shape, (std::vector<long long>{ 10, 20 }));
    EXPECT_EQ(hdu.data_type, "int16");
    EXPECT_EQ(to_json(report)[1]["type"], "CompImageHDU");

    // The header is the one of the stored image, not of its binary table.
    EXPECT_EQ(*hdu.header.find("XTENSION"), HeaderValue::from_string("IMAGE"));
    EXPECT_EQ(*hdu.header.find("BITPIX"), HeaderValue::from_integer(16));
    EXPECT_EQ(*hdu.header.find("NAXIS1"), HeaderValue::from_integer(20));
    EXPECT_EQ(*hdu.header.find("NAXIS2"), HeaderValue::from_integer(10));
    EXPECT_FALSE(hdu.header.contains("ZIMAGE"));
    EXPECT_FALSE(hdu.header.contains("TTYPE1"));
}


TEST(NormalizeTest, FailureInLaterHduDiscardsEarlierOnes)
{
    TempDir dir;
    const std::string path = dir.path("broken.fits");
    test::write_broken_extension(path);

    const Report report = normalize(path);
    ASSERT_TRUE(report.is_error());
    EXPECT_FALSE(report.error().empty());

    const json j = to_json(report);
    ASSERT_TRUE(j.is_object());
    ASSERT_EQ(j.size(), 1U);
    EXPECT_TRUE(j.contains("error"));
}


TEST(NormalizeTest, IsIdempotent)
{
    TempDir dir;
    const std::string path = dir.path("multi.fits");
    test::write_multi_extension(path);

    const Report first  = normalize(path);
    const Report second = normalize(path);
    EXPECT_EQ(first, second);
    EXPECT_EQ(dump_report(first), dump_report(second));
}


TEST(NormalizeTest, MissingFileGivesErrorReport)
{
    TempDir dir;
    const Report report = normalize(dir.path("missing.fits"));
    ASSERT_TRUE(report.is_error());
    EXPECT_FALSE(report.error().empty());

    const json j = to_json(report);
    ASSERT_TRUE(j.is_object());
    ASSERT_EQ(j.size(), 1U);
    ASSERT_TRUE(j["error"].is_string());
    EXPECT_FALSE(j["error"].get<std::string>().empty());
}


TEST(NormalizeTest, TextFileGivesErrorReport)
{
    TempDir dir;
    const std::string path = dir.path("notes.fits");
    test::write_text_file(path, "this is not a FITS file\n");

    const Report report = normalize(path);
    ASSERT_TRUE(report.is_error());
    EXPECT_FALSE(report.error().empty());
    EXPECT_THROW(report.hdus(), std::logic_error);
}


TEST(NormalizeTest, ReportSurvivesJsonRoundTrip)
{
    TempDir dir;
    const std::string path = dir.path("multi.fits");
    test::write_multi_extension(path);

    const Report report = normalize(path);
    const json parsed   = json::parse(dump_report(report));
    EXPECT_EQ(parsed, to_json(report));
    ASSERT_EQ(parsed.size(), 4U);
    EXPECT_TRUE(parsed[0]["data_shape"].is_null());
    EXPECT_EQ(parsed[1]["data_shape"], json::array({ 3, 4, 5 }));
}

}  // namespace fitsmeta
