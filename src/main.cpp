#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "Png/png.hpp"
#include "Png/blankImage.hpp"
#include "Commands/commands.hpp"
#include "Commands/chunkSummary.hpp"
#include "IO/pngFileIO.hpp"
#include "Utility/pngError.hpp"
#include "Utility/utils.hpp"

using namespace std;

/* -------------------------- DECLARATIONS -------------------------- */
int runEncode(const string& inputFile, const string& chunkType, const string& message, string outputFile);
int runDecode(const string& inputFile, const string& chunkType);
int runRemove(const string& inputFile, const string& chunkType);
int runPrint(const string& inputFile, bool asJson);
int runDemo(const string& outputFile);
int reportError(const PngError& error);
expected<Png, PngError> loadPng(const string& path);

bool verbose = false;

/* -------------------------- MAIN FUNCTION -------------------------- */

int main(int argc, char** argv) {

    CLI::App app{"pngme - Hide messages in a PNG file"};
    app.set_version_flag("--version", PNGME_VERSION.toString());
    app.add_flag("-v,--verbose", verbose, "Print progress messages");

    string inputFile;
    string outputFile;
    string chunkType;
    string message;
    bool asJson = false;

    // ENCODE subcommand
    CLI::App* encodeCmd = app.add_subcommand("encode", "Hide a message in a PNG file");
    encodeCmd->add_option("input", inputFile, "Input PNG file")->required()->check(CLI::ExistingFile);
    encodeCmd->add_option("chunk_type", chunkType, "Chunk type, 4 ASCII letters (e.g. ruSt)")->required();
    encodeCmd->add_option("message", message, "Message to hide")->required();
    encodeCmd->add_option("output", outputFile, "Output PNG file (defaults to the input file)");

    // DECODE subcommand
    CLI::App* decodeCmd = app.add_subcommand("decode", "Read a hidden message from a PNG file");
    decodeCmd->add_option("file", inputFile, "PNG file")->required()->check(CLI::ExistingFile);
    decodeCmd->add_option("chunk_type", chunkType, "Chunk type holding the message")->required();

    // REMOVE subcommand
    CLI::App* removeCmd = app.add_subcommand("remove", "Remove a hidden message from a PNG file");
    removeCmd->add_option("file", inputFile, "PNG file")->required()->check(CLI::ExistingFile);
    removeCmd->add_option("chunk_type", chunkType, "Chunk type to remove")->required();

    // PRINT subcommand
    CLI::App* printCmd = app.add_subcommand("print", "Print every chunk of a PNG file");
    printCmd->add_option("file", inputFile, "PNG file")->required()->check(CLI::ExistingFile);
    printCmd->add_flag("--json", asJson, "Print the chunk list as JSON");

    // DEMO subcommand
    string demoOutput = "pngme_demo.png";
    CLI::App* demoCmd = app.add_subcommand("demo", "Create a blank PNG and run every operation on it");
    demoCmd->add_option("-o,--output", demoOutput, "Where to write the demo PNG")->capture_default_str();

    // Require that one subcommand is given
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    if (*encodeCmd) return runEncode(inputFile, chunkType, message, outputFile);
    if (*decodeCmd) return runDecode(inputFile, chunkType);
    if (*removeCmd) return runRemove(inputFile, chunkType);
    if (*printCmd) return runPrint(inputFile, asJson);
    if (*demoCmd) return runDemo(demoOutput);

    return 0;
}

/* -------------------------- COMMANDS -------------------------- */

expected<Png, PngError> loadPng(const string& path) {
    if (verbose) cout << "Reading " << path << endl;

    auto bytes = PngFileIO::readFile(path);
    if (!bytes) return unexpected(bytes.error());

    auto png = Png::parse(bytes.value());
    if (png && verbose) {
        cout << "Parsed " << png->chunks().size() << " chunks" << endl;
    }
    return png;
}

int reportError(const PngError& error) {
    cerr << "Error [" << error.kind << "]: " << error.toString() << endl;
    return error_kind_exit_code(error.kind);
}

int runEncode(const string& inputFile, const string& chunkType, const string& message, string outputFile) {
    if (outputFile.empty()) outputFile = inputFile;

    auto png = loadPng(inputFile);
    if (!png) return reportError(png.error());

    auto encoded = encode(png.value(), chunkType, message);
    if (!encoded) return reportError(encoded.error());

    if (verbose) cout << "Writing " << encoded->size() << " bytes to " << outputFile << endl;
    auto written = PngFileIO::writeFile(outputFile, encoded.value());
    if (!written) return reportError(written.error());

    cout << "Chunk written successfully." << endl;
    return 0;
}

int runDecode(const string& inputFile, const string& chunkType) {
    auto png = loadPng(inputFile);
    if (!png) return reportError(png.error());

    auto text = decode(png.value(), chunkType);
    if (!text) return reportError(text.error());

    cout << *png->chunkByType(chunkType) << endl;
    cout << "Chunk data : " << text.value() << endl;
    return 0;
}

int runRemove(const string& inputFile, const string& chunkType) {
    auto png = loadPng(inputFile);
    if (!png) return reportError(png.error());

    auto removed = remove(png.value(), chunkType);
    if (!removed) return reportError(removed.error());

    auto written = PngFileIO::writeFile(inputFile, removed->bytes);
    if (!written) return reportError(written.error());

    cout << "Removed chunk: " << removed->removed << endl;
    return 0;
}

int runPrint(const string& inputFile, bool asJson) {
    auto png = loadPng(inputFile);
    if (!png) return reportError(png.error());

    if (asJson) {
        cout << summarize(png.value()).dump(2) << endl;
        return 0;
    }

    for (const ChunkSummary& summary : print(png.value())) {
        cout << summary << endl;
    }
    return 0;
}

int runDemo(const string& outputFile) {
    const string demoType = "ruSt";
    const string demoMessage = "This is where your secret message will be!";

    cout << "\n" << string(60, '=') << "\n";
    cout << "                  PNGME DEMONSTRATION\n";
    cout << string(60, '=') << "\n\n";

    cout << "STEP 1: CREATING A BLANK PNG\n";
    cout << string(40, '-') << "\n";
    auto canvas = BlankImage::create(16, 16, {0x20, 0x60, 0xC0});
    if (!canvas) return reportError(canvas.error());

    auto written = PngFileIO::writeFile(outputFile, canvas.value());
    if (!written) return reportError(written.error());
    cout << "16x16 RGB image written to " << outputFile << "\n\n";

    cout << "STEP 2: ENCODING A MESSAGE\n";
    cout << string(40, '-') << "\n";
    auto png = loadPng(outputFile);
    if (!png) return reportError(png.error());

    auto encoded = encode(png.value(), demoType, demoMessage);
    if (!encoded) return reportError(encoded.error());

    written = PngFileIO::writeFile(outputFile, encoded.value());
    if (!written) return reportError(written.error());
    cout << "Message hidden in chunk " << demoType << "\n\n";

    cout << "STEP 3: DECODING THE MESSAGE\n";
    cout << string(40, '-') << "\n";
    png = loadPng(outputFile);
    if (!png) return reportError(png.error());

    auto text = decode(png.value(), demoType);
    if (!text) return reportError(text.error());
    cout << "Decoded: " << text.value() << "\n\n";

    cout << "STEP 4: LISTING CHUNKS\n";
    cout << string(40, '-') << "\n";
    for (const ChunkSummary& summary : print(png.value())) {
        cout << "  " << summary << "\n";
    }
    cout << "\n";

    cout << "STEP 5: REMOVING THE MESSAGE\n";
    cout << string(40, '-') << "\n";
    auto removed = remove(png.value(), demoType);
    if (!removed) return reportError(removed.error());

    written = PngFileIO::writeFile(outputFile, removed->bytes);
    if (!written) return reportError(written.error());
    cout << "Removed chunk: " << removed->removed << "\n\n";

    cout << "Demo complete, " << outputFile << " is back to its original chunks\n";
    return 0;
}
