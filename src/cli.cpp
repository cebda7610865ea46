/**
 * @file cli.cpp
 * @brief yEnc command line interface.
 *
 * Decodes a .yenc file to disk, or encodes a binary file to yEnc.
 */

#include <yenc/yenc.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace yenc;

static void print_version() {
    std::printf("yenc %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("yEnc decoder/encoder (v%s C++)\n", version());
    std::printf("==============================\n\n");
    std::printf("References:\n");
    std::printf("  yEnc 1.3 draft: http://www.yenc.org/yenc-draft.1.3.txt\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input.yenc> [output]\n", prog_name);
    std::printf("  %s -e <input> [line_length]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -e             Encode (default is decode)\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Decode arguments:\n");
    std::printf("  input.yenc     yEnc encoded input file\n");
    std::printf("  output         Output file (default: name from the =ybegin header)\n\n");
    std::printf("Encode arguments:\n");
    std::printf("  input          Binary file to encode\n");
    std::printf("  line_length    Encoded columns per line (default %zu)\n\n",
                DEFAULT_LINE_LENGTH);
    std::printf("Output:\n");
    std::printf("  Decode: first part of the input\n");
    std::printf("  Encode: <input>.yenc\n\n");
    std::printf("Examples:\n");
    std::printf("  %s picture.jpg.yenc              # decode\n", prog_name);
    std::printf("  %s -e picture.jpg 128            # encode\n\n", prog_name);
}

static std::string base_name(const std::string& path) {
    std::size_t slash = path.find_last_of("/\\");
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    return size == 0 || static_cast<bool>(file.read(reinterpret_cast<char*>(buffer.data()), size));
}

static bool write_file(const std::string& path, const void* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    return file.good();
}

static int do_decode(const char* input_path, const char* output_arg) {
    std::ifstream input(input_path, std::ios::binary);
    if (!input) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    Part part;
    std::string message;
    Error result = decode(input, part, &message);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Decoding failed (%s): %s\n", error_string(result),
                     message.c_str());
        return 1;
    }

    // Never let the header pick a directory
    std::string output_path = (output_arg != nullptr) ? output_arg : base_name(part.name);
    if (output_path.empty() || output_path == "." || output_path == "..") {
        std::fprintf(stderr, "Error: No usable file name in header, give an output path\n");
        return 1;
    }

    if (!write_file(output_path, part.body.data(), part.body.size())) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    std::printf("Input:       %s\n", input_path);
    std::printf("Output:      %s (%zu bytes)\n", output_path.c_str(), part.body.size());
    if (part.number > 0) {
        std::printf("Part:        %d (bytes %lld-%lld of %lld)\n", part.number,
                    static_cast<long long>(part.begin), static_cast<long long>(part.end),
                    static_cast<long long>(part.header_size));
    }
    std::printf("CRC-32:      %08x\n", static_cast<unsigned>(part.crc.value()));

    return 0;
}

static int do_encode(const char* input_path, std::size_t line_length) {
    std::vector<std::uint8_t> input_data;
    if (!read_file(input_path, input_data)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    std::string output_path = std::string(input_path) + ".yenc";

    EncodeParams params;
    params.line_length = line_length;

    std::string output;
    Error result = encode(input_data.data(), input_data.size(), base_name(input_path), output,
                          params);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Encoding failed with code %d\n", static_cast<int>(result));
        return 1;
    }

    if (!write_file(output_path, output.data(), output.size())) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    double overhead = input_data.empty()
                          ? 0.0
                          : static_cast<double>(output.size()) /
                                static_cast<double>(input_data.size());
    std::printf("Input:       %s (%zu bytes)\n", input_path, input_data.size());
    std::printf("Output:      %s (%zu bytes)\n", output_path.c_str(), output.size());
    std::printf("Expansion:   %.3fx\n", overhead);
    std::printf("Parameters:  line=%zu\n", line_length);

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

    if (std::strcmp(argv[1], "-e") == 0) {
        // Encode mode: -e <input> [line_length]
        if (argc != 3 && argc != 4) {
            std::fprintf(stderr, "Error: Encode requires 1 or 2 arguments after -e\n");
            std::fprintf(stderr, "Usage: %s -e <input> [line_length]\n", argv[0]);
            return 1;
        }

        long line_length = static_cast<long>(DEFAULT_LINE_LENGTH);
        if (argc == 4) {
            line_length = std::atol(argv[3]);
        }
        if (line_length <= 0 || line_length > static_cast<long>(MAX_LINE_LENGTH)) {
            std::fprintf(stderr, "Error: line_length must be 1-%zu\n", MAX_LINE_LENGTH);
            return 1;
        }

        return do_encode(argv[2], static_cast<std::size_t>(line_length));
    }

    // Decode mode: <input.yenc> [output]
    if (argc != 2 && argc != 3) {
        std::fprintf(stderr, "Error: Decode takes an input and an optional output\n");
        std::fprintf(stderr, "Usage: %s <input.yenc> [output]\n", argv[0]);
        return 1;
    }

    return do_decode(argv[1], (argc == 3) ? argv[2] : nullptr);
}
