#include <gtest/gtest.h>
#include "../include/cli.hpp"
#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "test-helpers.hpp"

TEST(ParseSizeTest, AcceptsUnits)
{
    EXPECT_EQ(parse_size("512"), 512u);
    EXPECT_EQ(parse_size("16B"), 16u);
    EXPECT_EQ(parse_size("64KiB"), 64u * 1024);
    EXPECT_EQ(parse_size("16MiB"), 16u * 1024 * 1024);
    EXPECT_EQ(parse_size("2GiB"), 2ull * 1024 * 1024 * 1024);
}

TEST(ParseSizeTest, RejectsGarbage)
{
    EXPECT_THROW(parse_size(""), ConfigError);
    EXPECT_THROW(parse_size("KiB"), ConfigError);
    EXPECT_THROW(parse_size("12kb"), ConfigError);
    EXPECT_THROW(parse_size("99999999999TiB"), ConfigError);
}

TEST(PackConfigTest, AverageSizeBecomesFilterBits)
{
    EXPECT_EQ(filter_bits_for(64 * 1024), 16u);
    EXPECT_EQ(filter_bits_for(100 * 1024), 16u);
    EXPECT_EQ(filter_bits_for(1), 0u);

    PackConfig config;
    config.output = "out";
    EXPECT_EQ(config.chunker_params().chunk_filter_bits, 16u);
    EXPECT_NO_THROW(config.validate());
}

TEST(PackConfigTest, SizeOrderIsChecked)
{
    PackConfig config;
    config.output = "out";

    config.min_chunk_size = config.avg_chunk_size + 1;
    EXPECT_THROW(config.validate(), ConfigError);

    config.min_chunk_size = DEFAULT_MIN_CHUNK_SIZE;
    config.max_chunk_size = config.avg_chunk_size - 1;
    EXPECT_THROW(config.validate(), ConfigError);

    config.max_chunk_size = DEFAULT_MAX_CHUNK_SIZE;
    config.compression_level = 10;
    EXPECT_THROW(config.validate(), ConfigError);

    config.compression_level = 6;
    config.compression = "GZIP";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(PackConfigTest, CompressionNoneStoresRaw)
{
    PackConfig config;
    config.compression = "NONE";
    EXPECT_FALSE(config.chunk_compression().has_value());

    config.compression = "LZMA";
    config.compression_level = 3;
    ASSERT_TRUE(config.chunk_compression().has_value());
    EXPECT_EQ(config.chunk_compression()->level, 3u);
}

TEST(PackConfigTest, JsonOverridesDefaults)
{
    PackConfig config;

    apply_pack_config(json{{"avg_chunk_size", "128KiB"},
                           {"min_chunk_size", 4096},
                           {"compression", "NONE"},
                           {"chunk_dir", "chunks"},
                           {"unknown_key", true}},
                      config);

    EXPECT_EQ(config.avg_chunk_size, 128u * 1024);
    EXPECT_EQ(config.min_chunk_size, 4096u);
    EXPECT_EQ(config.compression, "NONE");
    EXPECT_EQ(config.chunk_location(), ChunkLocation(PerChunkLocation{"chunks"}));
}

TEST(PackConfigTest, BadJsonIsConfigError)
{
    PackConfig config;

    EXPECT_THROW(apply_pack_config(json::array(), config), ConfigError);
    EXPECT_THROW(apply_pack_config(json{{"threads", "many"}}, config), ConfigError);
    EXPECT_THROW(apply_pack_config(json{{"avg_chunk_size", true}}, config), ConfigError);
}

class CommandLineTest : public TempDirTest
{
};

TEST_F(CommandLineTest, PackFlags)
{
    const Command command = parse_command_line({"pack", "-i", "source.bin", "--avg-chunk-size", "32KiB",
                                                "--min-chunk-size", "8KiB", "--compression", "NONE",
                                                "--chunk-file", "out.chunks", "--threads", "3", "-f", "out.cvlt"});

    ASSERT_EQ(command.type, CommandType::PACK);
    EXPECT_EQ(command.pack.input, std::optional<std::string>("source.bin"));
    EXPECT_EQ(command.pack.output, "out.cvlt");
    EXPECT_EQ(command.pack.avg_chunk_size, 32u * 1024);
    EXPECT_EQ(command.pack.min_chunk_size, 8u * 1024);
    EXPECT_EQ(command.pack.compression, "NONE");
    EXPECT_EQ(command.pack.chunk_file, std::optional<std::string>("out.chunks"));
    EXPECT_EQ(command.pack.threads, 3u);
    EXPECT_TRUE(command.pack.force_create);
}

TEST_F(CommandLineTest, FlagsOverrideConfigFile)
{
    const fs::path config_path = temp_dir / "pack.json";
    write_file(config_path, R"({"avg_chunk_size": "128KiB", "compression_level": 9})");

    const Command command = parse_command_line({"pack", "--config", config_path.string(), "--compression-level", "2", "out.cvlt"});

    EXPECT_EQ(command.pack.avg_chunk_size, 128u * 1024);
    EXPECT_EQ(command.pack.compression_level, 2u);
    EXPECT_FALSE(command.pack.input.has_value());
}

TEST_F(CommandLineTest, ConfigAsFlagValueIsNotLoaded)
{
    // "--config" here is the input file name, out.cvlt doesn't exist as a config
    const Command command = parse_command_line({"pack", "-i", "--config", "out.cvlt"});

    ASSERT_EQ(command.type, CommandType::PACK);
    EXPECT_EQ(command.pack.input, std::optional<std::string>("--config"));
    EXPECT_EQ(command.pack.output, "out.cvlt");
    EXPECT_EQ(command.pack.avg_chunk_size, static_cast<uint64_t>(DEFAULT_AVG_CHUNK_SIZE));
}

TEST_F(CommandLineTest, UnpackAndInfo)
{
    const Command unpack = parse_command_line({"unpack", "--seed", "a", "--seed", "b", "--no-verify", "in.cvlt", "out.bin"});

    ASSERT_EQ(unpack.type, CommandType::UNPACK);
    EXPECT_EQ(unpack.unpack.seed_files, (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(unpack.unpack.verify);
    EXPECT_EQ(unpack.unpack.input, "in.cvlt");
    EXPECT_EQ(unpack.unpack.output, "out.bin");

    const Command info = parse_command_line({"info", "--json", "in.cvlt"});
    ASSERT_EQ(info.type, CommandType::INFO);
    EXPECT_TRUE(info.info.as_json);
}

TEST_F(CommandLineTest, BadUsageIsConfigError)
{
    EXPECT_THROW(parse_command_line({"shrink"}), ConfigError);
    EXPECT_THROW(parse_command_line({"pack"}), ConfigError);
    EXPECT_THROW(parse_command_line({"pack", "--threads"}), ConfigError);
    EXPECT_THROW(parse_command_line({"pack", "--threads", "x", "out"}), ConfigError);
    EXPECT_THROW(parse_command_line({"pack", "--bogus", "out"}), ConfigError);
    EXPECT_THROW(parse_command_line({"pack", "--chunk-file", "a", "--chunk-dir", "b", "out"}), ConfigError);
    EXPECT_THROW(parse_command_line({"unpack", "only-one"}), ConfigError);

    EXPECT_EQ(parse_command_line({}).type, CommandType::HELP);
}
