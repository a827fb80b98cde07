#include "zipmaker/Compression.hpp"
#include "zipmaker/Encoder.hpp"

#include "TestUtilities.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::StartsWith;

SCENARIO("Encoding file contents")
{
    const EncoderSettings settings;

    GIVEN("a repetitive text file")
    {
        const std::vector<unsigned char> data = RepeatedText("some log line with a timestamp\n", 50000);

        WHEN("encoded with auto")
        {
            const EncodedData encoded = EncodeEntry(data, CompressionChoice::Auto, settings);

            THEN("deflate is used and restores the original")
            {
                CHECK(encoded.method == CompressionMethod::Deflate);
                CHECK_THAT(encoded.label, StartsWith("deflate-"));
                CHECK(encoded.raw_size == data.size());
                CHECK(encoded.crc == Crc32(data));
                CHECK(InflateRaw(encoded.payload.data(), encoded.payload.size(), encoded.raw_size) == data);
            }
        }

        WHEN("bzip2 is forced")
        {
            const EncodedData encoded = EncodeEntry(data, CompressionChoice::Bzip2, settings);

            THEN("bzip2 is used")
            {
                CHECK(encoded.method == CompressionMethod::Bzip2);
                CHECK(encoded.label == "bzip2");
                CHECK(encoded.reason == "user choice");
                CHECK(Bzip2Decompress(encoded.payload.data(), encoded.payload.size(), encoded.raw_size) == data);
            }
        }

        WHEN("lzma is forced")
        {
            const EncodedData encoded = EncodeEntry(data, CompressionChoice::Lzma, settings);

            THEN("lzma is used")
            {
                CHECK(encoded.method == CompressionMethod::Lzma);
                CHECK(LzmaDecompress(encoded.payload.data(), encoded.payload.size(), encoded.raw_size) == data);
            }
        }

        WHEN("store is forced")
        {
            const EncodedData encoded = EncodeEntry(data, CompressionChoice::Store, settings);

            THEN("data is kept as is")
            {
                CHECK(encoded.method == CompressionMethod::Store);
                CHECK(encoded.payload == data);
            }
        }
    }

    GIVEN("random data")
    {
        const std::vector<unsigned char> data = RandomBytes(50000);

        WHEN("encoded with auto")
        {
            const EncodedData encoded = EncodeEntry(data, CompressionChoice::Auto, settings);

            THEN("lzma is tried but does not help so data is stored")
            {
                CHECK(encoded.method == CompressionMethod::Store);
                CHECK(encoded.payload == data);
                CHECK(encoded.reason == "lzma did not reduce size");
            }
        }
    }

    GIVEN("a jpeg file")
    {
        std::vector<unsigned char> data = ToBytes("\xFF\xD8\xFF\xE0");
        const std::vector<unsigned char> text = RepeatedText("compressible", 10000);
        data.insert(data.end(), text.begin(), text.end());

        THEN("auto stores it without trying")
        {
            const EncodedData encoded = EncodeEntry(data, CompressionChoice::Auto, settings);
            CHECK(encoded.method == CompressionMethod::Store);
            CHECK(encoded.reason == "already compressed format");
        }
    }

    GIVEN("an empty file")
    {
        THEN("it is stored")
        {
            const EncodedData encoded = EncodeEntry({}, CompressionChoice::Auto, settings);
            CHECK(encoded.method == CompressionMethod::Store);
            CHECK(encoded.payload.empty());
            CHECK(encoded.raw_size == 0);
        }
    }
}

TEST_CASE("Text normalization")
{
    SECTION("whitespace runs are collapsed")
    {
        CHECK(NormalizeText(ToBytes("  hello \t\n  world  \n")) == ToBytes("hello world"));
    }

    SECTION("alphanumeric only text is lowercased")
    {
        CHECK(NormalizeText(ToBytes("HelloWorld42")) == ToBytes("helloworld42"));
        CHECK(NormalizeText(ToBytes("Hello World")) == ToBytes("Hello World"));
    }

    SECTION("invalid UTF-8 is left untouched")
    {
        const std::vector<unsigned char> binary = { 'a', ' ', ' ', 0xC3, 0x28, 'b' };
        CHECK(NormalizeText(binary) == binary);
    }

    SECTION("valid multi byte UTF-8 is normalized")
    {
        CHECK(NormalizeText(ToBytes("caf\xC3\xA9   au   lait")) == ToBytes("caf\xC3\xA9 au lait"));
    }

    SECTION("only ASCII letters and spaces are considered")
    {
        // Upper case E acute is not an ASCII alphanumeric character
        CHECK(NormalizeText(ToBytes("\xC3\x89" "COLE")) == ToBytes("\xC3\x89" "COLE"));
        // No-break spaces are kept
        CHECK(NormalizeText(ToBytes("a\xC2\xA0\xC2\xA0" "b")) == ToBytes("a\xC2\xA0\xC2\xA0" "b"));
    }

    SECTION("only applied by the encoder when enabled")
    {
        const std::vector<unsigned char> data = RepeatedText("word     ", 4000);

        EncoderSettings settings;
        const EncodedData raw = EncodeEntry(data, CompressionChoice::Deflate, settings);
        CHECK(raw.raw_size == data.size());

        settings.normalize_text = true;
        const EncodedData normalized = EncodeEntry(data, CompressionChoice::Deflate, settings);
        CHECK(normalized.raw_size < data.size());
        CHECK(normalized.crc == Crc32(NormalizeText(data)));
    }
}
