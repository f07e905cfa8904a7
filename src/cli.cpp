/**
 * @file cli.cpp
 * @brief dcdgen command line interface.
 *
 * Encodes a command script into a DCD block file, or dumps an existing
 * block as hex and as commands.
 */

#include <dcdgen/dcdgen.hpp>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace dcdgen;

static void print_version() {
    std::printf("dcdgen %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\ni.MX RT Device Configuration Data generator (v%s)\n", version());
    std::printf("=================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <script> [output]\n", prog_name);
    std::printf("  %s -d <block.bin>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -d             Dump an encoded block (default is encode)\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Script lines:\n");
    std::printf("  nop\n");
    std::printf("  write|set|clear <width> <address> <value>\n");
    std::printf("  check all_clear|any_clear|all_set|any_set <width> <address> <mask> [count]\n");
    std::printf("  # comment\n\n");
    std::printf("  width is 1, 2 or 4 bytes; numbers may be decimal or 0x hex.\n");
    std::printf("  Consecutive writes with the same width and op are merged.\n\n");
    std::printf("Output:\n");
    std::printf("  Encode: [output] or <script>.bin\n\n");
    std::printf("Examples:\n");
    std::printf("  %s clocks.dcd                   # writes clocks.dcd.bin\n", prog_name);
    std::printf("  %s -d clocks.dcd.bin            # dump\n\n", prog_name);
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    return static_cast<bool>(file.read(reinterpret_cast<char*>(data.data()), size));
}

static bool read_text(const std::string& path, std::string& text) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    text = contents.str();
    return true;
}

static int do_encode(const char* script_path, const std::string& output_path) {
    std::string text;
    if (!read_text(script_path, text)) {
        std::fprintf(stderr, "Error: Cannot read script: %s\n", script_path);
        return 1;
    }

    std::vector<Command> commands;
    std::size_t error_line = 0;
    Error result = parse_script(text, commands, error_line);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s:%zu: invalid command\n", script_path, error_line);
        return 1;
    }
    if (commands.empty()) {
        std::fprintf(stderr, "Error: No commands in script: %s\n", script_path);
        return 1;
    }

    // Encode in memory so a failure never leaves a partial file behind
    VectorSink block;
    std::size_t written = 0;
    result = encode(block, commands, written);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Encoding failed: %s\n", error_string(result));
        return 1;
    }

    std::ofstream file(output_path, std::ios::binary);
    if (!file) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }
    StreamSink out(file);
    result = out.write(block.bytes().data(), block.bytes().size());
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    std::vector<Run> runs;
    partition_runs(commands.data(), commands.size(), runs);

    std::printf("Input:       %s (%zu commands)\n", script_path, commands.size());
    std::printf("Output:      %s (%zu bytes)\n", output_path.c_str(), written);
    std::printf("Records:     %zu\n", runs.size());

    return 0;
}

static int do_dump(const char* input_path) {
    std::vector<std::uint8_t> block;
    if (!read_file(input_path, block)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    std::printf("%zu\n", block.size());
    for (std::size_t row = 0; row < block.size(); row += 16) {
        for (std::size_t i = row; i < block.size() && i < row + 16; ++i) {
            std::printf("%02X ", block[i]);
        }
        std::printf("\n");
    }

    std::vector<Command> commands;
    Error result = decode(block, commands);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Invalid DCD block: %s\n", error_string(result));
        return 1;
    }

    std::printf("\n");
    for (const auto& command : commands) {
        std::printf("%s\n", format_command(command).c_str());
    }

    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "-d") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: Dump requires 1 argument after -d\n");
            std::fprintf(stderr, "Usage: %s -d <block.bin>\n", argv[0]);
            return 1;
        }
        return do_dump(argv[2]);
    }

    if (argc > 3) {
        std::fprintf(stderr, "Error: Too many arguments\n");
        std::fprintf(stderr, "Usage: %s <script> [output]\n", argv[0]);
        return 1;
    }

    std::string output_path = (argc == 3) ? argv[2] : std::string(argv[1]) + ".bin";
    return do_encode(argv[1], output_path);
}
