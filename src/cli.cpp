#include <algorithm>
#include <charconv>
#include <optional>
#include <utility>
#include <format>
#include "../include/cli.hpp"
#include "../include/errors.hpp"
#include "../include/version.hpp"

// walks over the arguments of one sub command
class ArgReader
{
    const std::vector<std::string> &args;
    size_t pos;

public:
    ArgReader(const std::vector<std::string> &args, size_t start) : args(args), pos(start) {}

    bool done() const { return pos >= args.size(); }

    const std::string &next() { return args[pos++]; }

    const std::string &value_for(const std::string &flag)
    {
        if (done())
            throw ConfigError(std::format("{} needs a value", flag));
        return next();
    }
};

static uint64_t parse_number(const std::string &flag, const std::string &value)
{
    uint64_t number = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);

    if (ec != std::errc() || ptr != value.data() + value.size())
        throw ConfigError(std::format("{} expects a number, got '{}'", flag, value));

    return number;
}

// flags of pack that take a value, the rest are switches
static bool pack_flag_takes_value(const std::string &flag)
{
    static const std::vector<std::string> flags = {
        "-i", "--input", "--avg-chunk-size", "--min-chunk-size", "--max-chunk-size", "--hash-window",
        "--hash-length", "--compression", "--compression-level", "--chunk-file", "--chunk-dir", "--threads", "--config"};

    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

static void apply_pack_flag(const std::string &flag, const std::string &value, PackConfig &config)
{
    if (flag == "-i" || flag == "--input")
        config.input = value;
    else if (flag == "--avg-chunk-size")
        config.avg_chunk_size = parse_size(value);
    else if (flag == "--min-chunk-size")
        config.min_chunk_size = parse_size(value);
    else if (flag == "--max-chunk-size")
        config.max_chunk_size = parse_size(value);
    else if (flag == "--hash-window")
        config.hash_window_size = static_cast<uint32_t>(parse_size(value));
    else if (flag == "--hash-length")
        config.chunk_hash_length = static_cast<uint32_t>(parse_number(flag, value));
    else if (flag == "--compression")
        config.compression = value;
    else if (flag == "--compression-level")
        config.compression_level = static_cast<uint32_t>(parse_number(flag, value));
    else if (flag == "--chunk-file")
        config.chunk_file = value;
    else if (flag == "--chunk-dir")
        config.chunk_dir = value;
    else if (flag == "--threads")
        config.threads = parse_number(flag, value);
    else if (flag == "-f" || flag == "--force-create")
        config.force_create = true;
    else if (flag == "-v" || flag == "--verbose")
        config.verbose = true;
    else if (flag == "--no-progress")
        config.progress = false;
    else
        throw ConfigError(std::format("unknown pack option {}", flag));
}

static PackConfig parse_pack(const std::vector<std::string> &args)
{
    PackConfig config;
    std::optional<std::string> config_path;
    std::vector<std::pair<std::string, std::string>> flags;
    std::vector<std::string> positional;
    ArgReader reader(args, 1);

    while (!reader.done())
    {
        const std::string &arg = reader.next();

        if (arg == "--config")
            config_path = reader.value_for(arg);
        else if (pack_flag_takes_value(arg))
            flags.emplace_back(arg, reader.value_for(arg));
        else if (arg.starts_with("-") && arg != "-")
            flags.emplace_back(arg, "");
        else
            positional.push_back(arg);
    }

    // the config file goes first so flags can override it
    if (config_path)
        load_pack_config_file(*config_path, config);

    for (const auto &[flag, value] : flags)
        apply_pack_flag(flag, value, config);

    if (positional.size() != 1)
        throw ConfigError("pack needs exactly one OUTPUT archive");

    config.output = positional.front();

    // "-" reads from stdin as well
    if (config.input && *config.input == "-")
        config.input.reset();

    config.validate();
    return config;
}

static UnpackConfig parse_unpack(const std::vector<std::string> &args)
{
    UnpackConfig config;
    std::vector<std::string> positional;
    ArgReader reader(args, 1);

    while (!reader.done())
    {
        const std::string &arg = reader.next();

        if (arg == "--seed")
            config.seed_files.push_back(reader.value_for(arg));
        else if (arg == "--store")
            config.store = reader.value_for(arg);
        else if (arg == "--no-verify")
            config.verify = false;
        else if (arg == "--threads")
            config.threads = parse_number(arg, reader.value_for(arg));
        else if (arg == "-f" || arg == "--force-create")
            config.force_create = true;
        else if (arg == "-v" || arg == "--verbose")
            config.verbose = true;
        else if (arg == "--no-progress")
            config.progress = false;
        else if (arg.starts_with("-"))
            throw ConfigError(std::format("unknown unpack option {}", arg));
        else
            positional.push_back(arg);
    }

    if (positional.size() != 2)
        throw ConfigError("unpack needs an ARCHIVE and an OUTPUT file");

    config.input = positional[0];
    config.output = positional[1];

    return config;
}

static InfoConfig parse_info(const std::vector<std::string> &args)
{
    InfoConfig config;
    std::vector<std::string> positional;
    ArgReader reader(args, 1);

    while (!reader.done())
    {
        const std::string &arg = reader.next();

        if (arg == "--json")
            config.as_json = true;
        else if (arg.starts_with("-"))
            throw ConfigError(std::format("unknown info option {}", arg));
        else
            positional.push_back(arg);
    }

    if (positional.size() != 1)
        throw ConfigError("info needs exactly one ARCHIVE");

    config.input = positional.front();
    return config;
}

Command parse_command_line(const std::vector<std::string> &args)
{
    Command command;

    if (args.empty() || args[0] == "-h" || args[0] == "--help" || args[0] == "help")
        return command;

    const std::string &name = args[0];

    if (name == "--version")
        command.type = CommandType::VERSION;
    else if (name == "pack")
    {
        command.type = CommandType::PACK;
        command.pack = parse_pack(args);
    }
    else if (name == "unpack")
    {
        command.type = CommandType::UNPACK;
        command.unpack = parse_unpack(args);
    }
    else if (name == "info")
    {
        command.type = CommandType::INFO;
        command.info = parse_info(args);
    }
    else
        throw ConfigError(std::format("unknown command {}", name));

    return command;
}

void print_usage(std::ostream &out)
{
    out << std::format("{} {}, content defined chunking archiver\n\n", CHUNKVAULT_NAME, CHUNKVAULT_VERSION)
        << "usage:\n"
        << "  chunkvault pack [options] OUTPUT\n"
        << "      -i, --input FILE          file to pack, stdin when omitted\n"
        << "      --avg-chunk-size SIZE     target average chunk size (64KiB)\n"
        << "      --min-chunk-size SIZE     minimal chunk size (16KiB)\n"
        << "      --max-chunk-size SIZE     maximal chunk size (16MiB)\n"
        << "      --hash-window SIZE        rolling hash window (16B)\n"
        << "      --hash-length N           stored checksum length in bytes (64)\n"
        << "      --compression TYPE        LZMA or NONE (LZMA)\n"
        << "      --compression-level N     0-9 (6)\n"
        << "      --chunk-file FILE         store chunk data in a separate file\n"
        << "      --chunk-dir DIR           store every chunk in its own file\n"
        << "      --threads N               worker threads\n"
        << "      --config FILE             JSON file with pack options\n"
        << "      -f, --force-create        overwrite existing output\n"
        << "  chunkvault unpack [options] ARCHIVE OUTPUT\n"
        << "      --seed FILE               reuse chunks found in FILE, repeatable\n"
        << "      --store PATH              relocated chunk file or chunk directory\n"
        << "      --no-verify               skip the final checksum check\n"
        << "      --threads N               worker threads\n"
        << "      -f, --force-create        overwrite existing output\n"
        << "  chunkvault info [--json] ARCHIVE\n\n"
        << "common options: -v, --verbose  --no-progress\n"
        << "sizes take B, KiB, MiB, GiB or TiB suffixes\n";
}
