#include "zipmaker/Encoder.hpp"
#include "zipmaker/Zip/DosTime.hpp"
#include "zipmaker/Zip/ZipReader.hpp"
#include "zipmaker/Zip/ZipWriter.hpp"

#include "TestUtilities.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ctime>
#include <iterator>
#include <stdexcept>

namespace
{
    std::vector<unsigned char> ReadAll(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        return std::vector<unsigned char>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    uint16_t ReadU16(const std::vector<unsigned char>& data, const size_t offset)
    {
        return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
    }
}

SCENARIO("Writing zip archives")
{
    TemporaryDirectory dir;
    const std::filesystem::path archive_path = dir / "archive.zip";
    const uint32_t dos_time = DosTime::Now();

    const std::vector<unsigned char> text = RepeatedText("Hello zip world! ", 20000);
    const std::vector<unsigned char> random = RandomBytes(5000);

    GIVEN("one entry per compression method")
    {
        {
            ZipWriter writer(archive_path);
            writer.AddEntry("stored.bin", EncodeEntry(random, CompressionChoice::Store, EncoderSettings()), dos_time);
            writer.AddEntry("deflated.txt", EncodeEntry(text, CompressionChoice::Deflate, EncoderSettings()), dos_time);
            writer.AddEntry("bzipped.txt", EncodeEntry(text, CompressionChoice::Bzip2, EncoderSettings()), dos_time);
            writer.AddEntry("lzma.txt", EncodeEntry(text, CompressionChoice::Lzma, EncoderSettings()), dos_time);
            writer.Close();
            CHECK(writer.GetBytesWritten() == std::filesystem::file_size(archive_path));
        }

        WHEN("read back")
        {
            const ZipReader reader(archive_path);
            const std::vector<ZipEntry>& entries = reader.GetEntries();

            THEN("every entry has its native method")
            {
                REQUIRE(entries.size() == 4);
                CHECK(entries[0].name == "stored.bin");
                CHECK(entries[0].method == CompressionMethod::Store);
                CHECK(entries[1].method == CompressionMethod::Deflate);
                CHECK(entries[2].method == CompressionMethod::Bzip2);
                CHECK(entries[3].method == CompressionMethod::Lzma);
                CHECK(entries[3].flags == ZipConstants::flag_lzma_end_marker);
                CHECK(entries[0].dos_time == dos_time);
            }

            THEN("content is restored")
            {
                CHECK(reader.Verify().empty());
                CHECK(reader.Extract(0) == random);
                CHECK(reader.Extract(1) == text);
                CHECK(reader.Extract(2) == text);
                CHECK(reader.Extract(3) == text);
                CHECK_THROWS_AS(reader.Extract(4), std::runtime_error);
            }

            THEN("local headers announce the version needed by the method")
            {
                const std::vector<unsigned char> bytes = ReadAll(archive_path);
                CHECK(ReadU16(bytes, static_cast<size_t>(entries[0].header_offset) + 4) == 10);
                CHECK(ReadU16(bytes, static_cast<size_t>(entries[1].header_offset) + 4) == 20);
                CHECK(ReadU16(bytes, static_cast<size_t>(entries[2].header_offset) + 4) == 46);
                CHECK(ReadU16(bytes, static_cast<size_t>(entries[3].header_offset) + 4) == 63);
            }
        }
    }

    GIVEN("streamed entries")
    {
        const std::vector<unsigned char> big_text = RepeatedText("streamed line of text\n", 500000);
        WriteFile(dir / "big.txt", big_text);

        {
            ZipWriter writer(archive_path);
            const ZipEntry deflated = writer.AddFileEntry("big.txt", dir / "big.txt", CompressionMethod::Deflate, 9, dos_time);
            const ZipEntry stored = writer.AddFileEntry("big.txt", dir / "big.txt", CompressionMethod::Store, 0, dos_time);
            CHECK(deflated.raw_size == big_text.size());
            CHECK(deflated.compressed_size < big_text.size());
            CHECK(stored.compressed_size == big_text.size());
            CHECK(stored.name == "big (2).txt");
            CHECK_THROWS_AS(writer.AddFileEntry("nope.txt", dir / "big.txt", CompressionMethod::Lzma, 9, dos_time), std::runtime_error);
            writer.Close();
        }

        THEN("patched headers are valid")
        {
            const ZipReader reader(archive_path);
            REQUIRE(reader.GetEntries().size() == 2);
            CHECK(reader.Verify().empty());
            CHECK(reader.Extract(0) == big_text);
            CHECK(reader.Extract(1) == big_text);
        }
    }

    GIVEN("a streamed file that deflate can't shrink")
    {
        const std::vector<unsigned char> noise = RandomBytes(300000);
        WriteFile(dir / "noise.bin", noise);

        uint64_t bytes_written = 0;
        {
            ZipWriter writer(archive_path);
            const ZipEntry entry = writer.AddFileEntry("noise.bin", dir / "noise.bin", CompressionMethod::Deflate, 9, dos_time);
            CHECK(entry.method == CompressionMethod::Store);
            CHECK(entry.compressed_size == noise.size());
            CHECK(entry.raw_size == noise.size());
            writer.AddEntry("after.txt", EncodeEntry(text, CompressionChoice::Deflate, EncoderSettings()), dos_time);
            writer.Close();
            bytes_written = writer.GetBytesWritten();
        }

        THEN("it is stored and the following entries are intact")
        {
            CHECK(std::filesystem::file_size(archive_path) == bytes_written);
            const ZipReader reader(archive_path);
            REQUIRE(reader.GetEntries().size() == 2);
            CHECK(reader.GetEntries()[0].method == CompressionMethod::Store);
            CHECK(reader.Verify().empty());
            CHECK(reader.Extract(0) == noise);
            CHECK(reader.Extract(1) == text);

            const std::vector<unsigned char> bytes = ReadAll(archive_path);
            // Local header has the final method too
            CHECK(ReadU16(bytes, 8) == 0);
            CHECK(ReadU16(bytes, 4) == 10);
        }
    }

    GIVEN("the maximum number of entries")
    {
        ZipWriter writer(archive_path);
        const EncodedData data = EncodeEntry(ToBytes("x"), CompressionChoice::Store, EncoderSettings());
        for (size_t i = 0; i < ZipConstants::max_entries; ++i)
        {
            writer.AddEntry(std::to_string(i), data, dos_time);
        }

        THEN("one more entry is an error")
        {
            CHECK_THROWS_AS(writer.AddEntry("one_too_many", data, dos_time), std::runtime_error);
            writer.Close();

            const ZipReader reader(archive_path);
            CHECK(reader.GetEntries().size() == ZipConstants::max_entries);
        }
    }

    GIVEN("entries with the same name")
    {
        ZipWriter writer(archive_path);
        const EncodedData data = EncodeEntry(ToBytes("duplicate"), CompressionChoice::Store, EncoderSettings());

        THEN("names are made unique")
        {
            CHECK(writer.AddEntry("a.txt", data, dos_time) == "a.txt");
            CHECK(writer.AddEntry("a.txt", data, dos_time) == "a (2).txt");
            CHECK(writer.AddEntry("a.txt", data, dos_time) == "a (3).txt");
            CHECK(writer.AddEntry("README", data, dos_time) == "README");
            CHECK(writer.AddEntry("README", data, dos_time) == "README (2)");
            CHECK(writer.AddEntry(".hidden", data, dos_time) == ".hidden");
            CHECK(writer.AddEntry(".hidden", data, dos_time) == ".hidden (2)");
            writer.Close();

            const ZipReader reader(archive_path);
            CHECK(reader.GetEntries().size() == 7);
            CHECK(reader.Verify().empty());
        }
    }

    GIVEN("a non ASCII entry name")
    {
        {
            ZipWriter writer(archive_path);
            writer.AddEntry("r\xC3\xA9sum\xC3\xA9.txt", EncodeEntry(text, CompressionChoice::Deflate, EncoderSettings()), dos_time);
            writer.AddEntry("plain.txt", EncodeEntry(text, CompressionChoice::Deflate, EncoderSettings()), dos_time);
        }

        THEN("only its UTF-8 flag is set")
        {
            const ZipReader reader(archive_path);
            REQUIRE(reader.GetEntries().size() == 2);
            CHECK(reader.GetEntries()[0].name == "r\xC3\xA9sum\xC3\xA9.txt");
            CHECK((reader.GetEntries()[0].flags & ZipConstants::flag_utf8_name) != 0);
            CHECK((reader.GetEntries()[1].flags & ZipConstants::flag_utf8_name) == 0);
        }
    }

    GIVEN("an archive that is discarded")
    {
        ZipWriter writer(archive_path);
        writer.AddEntry("a.txt", EncodeEntry(text, CompressionChoice::Deflate, EncoderSettings()), dos_time);
        writer.Discard();

        THEN("the file is removed and no entry can be added")
        {
            CHECK_FALSE(std::filesystem::exists(archive_path));
            CHECK_THROWS_AS(writer.AddEntry("b.txt", EncodeEntry(text, CompressionChoice::Store, EncoderSettings()), dos_time), std::runtime_error);
        }
    }

    GIVEN("an output path that can't be created")
    {
        THEN("construction throws")
        {
            CHECK_THROWS_AS(ZipWriter(dir.path / "missing_folder" / "archive.zip"), std::runtime_error);
        }
    }

    GIVEN("an empty archive")
    {
        {
            ZipWriter writer(archive_path);
        }

        THEN("only the end of central directory is written")
        {
            CHECK(std::filesystem::file_size(archive_path) == ZipConstants::end_of_central_directory_size);
            const ZipReader reader(archive_path);
            CHECK(reader.GetEntries().empty());
        }
    }

    GIVEN("a file that is not a zip archive")
    {
        WriteFile(dir / "fake.zip", RandomBytes(100));

        THEN("reading it throws")
        {
            CHECK_THROWS_AS(ZipReader(dir / "fake.zip"), std::runtime_error);
        }
    }
}

TEST_CASE("MS-DOS timestamps")
{
    // 1970 is before the first representable date
    CHECK(DosTime::FromTimeT(0) == ((1u << 21) | (1u << 16)));

    std::tm date = {};
    date.tm_year = 2020 - 1900;
    date.tm_mon = 5;
    date.tm_mday = 15;
    date.tm_hour = 13;
    date.tm_min = 30;
    date.tm_sec = 42;
    date.tm_isdst = -1;
    const unsigned int dos = DosTime::FromTimeT(std::mktime(&date));

    CHECK((dos >> 25) == 40);
    CHECK(((dos >> 21) & 0x0F) == 6);
    CHECK(((dos >> 16) & 0x1F) == 15);
    CHECK(((dos >> 11) & 0x1F) == 13);
    CHECK(((dos >> 5) & 0x3F) == 30);
    CHECK((dos & 0x1F) == 21);

    SECTION("dates after 2107 are clamped")
    {
        std::tm far_date = {};
        far_date.tm_year = 2200 - 1900;
        far_date.tm_mon = 2;
        far_date.tm_mday = 1;
        far_date.tm_hour = 12;
        far_date.tm_isdst = -1;
        const unsigned int far_dos = DosTime::FromTimeT(std::mktime(&far_date));
        CHECK(far_dos == ((127u << 25) | (12u << 21) | (31u << 16) | (23u << 11) | (59u << 5) | 29u));
    }

    SECTION("dates after 2044 use the high bit")
    {
        std::tm late_date = {};
        late_date.tm_year = 2050 - 1900;
        late_date.tm_mon = 0;
        late_date.tm_mday = 2;
        late_date.tm_hour = 3;
        late_date.tm_isdst = -1;
        const unsigned int late_dos = DosTime::FromTimeT(std::mktime(&late_date));
        CHECK((late_dos >> 25) == 70);
        CHECK(((late_dos >> 21) & 0x0F) == 1);
        CHECK(((late_dos >> 16) & 0x1F) == 2);
        CHECK(((late_dos >> 11) & 0x1F) == 3);
    }
}
