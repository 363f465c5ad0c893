#include <iostream>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <format>
#include <string>
#include <vector>
#include "../include/cancellation.hpp"
#include "../include/cli.hpp"
#include "../include/commands.hpp"
#include "../include/errors.hpp"
#include "../include/version.hpp"

std::function<void(int)> signal_lambda = nullptr;

void signal_handler(int sig)
{
    if (signal_lambda)
        signal_lambda(sig);
}

int main(int argc, char *argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);

    CancellationToken token;

    // ctrl + c stops the running pack or unpack at the next chunk
    signal_lambda = [&token](int _)
    {
        token.cancel();
    };
    signal(SIGINT, signal_handler);

    try
    {
        const Command command = parse_command_line(args);

        switch (command.type)
        {
        case CommandType::PACK:
            run_pack(command.pack, token);
            break;
        case CommandType::UNPACK:
            run_unpack(command.unpack, token);
            break;
        case CommandType::INFO:
            run_info(command.info);
            break;
        case CommandType::VERSION:
            std::cout << std::format("{} {}", CHUNKVAULT_NAME, CHUNKVAULT_VERSION) << std::endl;
            break;
        case CommandType::HELP:
            print_usage(std::cout);
            break;
        }
    }
    catch (const ConfigError &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        std::cerr << "run 'chunkvault --help' for usage" << std::endl;
        return EXIT_FAILURE;
    }
    catch (const CancelledError &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
