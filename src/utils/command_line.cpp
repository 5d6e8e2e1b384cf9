#include "utils/command_line.hpp"
#include "utils/error_handler.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>

namespace convo {
namespace utils {

namespace {

int parseInt(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationException("Invalid integer for " + option + ": " + value, "command line");
    }
    if (consumed != value.size()) {
        throw ConfigurationException("Invalid integer for " + option + ": " + value, "command line");
    }
    return parsed;
}

std::optional<double> parseThreshold(const std::string& value) {
    if (value == "auto") {
        return std::nullopt;
    }
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationException("Invalid threshold: " + value, "command line");
    }
    if (consumed != value.size()) {
        throw ConfigurationException("Invalid threshold: " + value, "command line");
    }
    return parsed;
}

std::string defaultOutputPath(const std::string& input) {
    std::filesystem::path path(input);
    path.replace_filename(path.stem().string() + "_stats.json");
    return path.string();
}

} // namespace

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " <stereo.wav> [options]\n"
        << "Options:\n"
        << "  -o, --output <json>       Stats output path (default: <input>_stats.json)\n"
        << "  -t, --threshold <value>   RMS speech threshold, or 'auto' (default: auto)\n"
        << "  -a, --speaker-a <label>   Label for the left channel (default: Human)\n"
        << "  -b, --speaker-b <label>   Label for the right channel (default: Maya)\n"
        << "  --frame-size <ms>         Energy frame size in ms (default: 30)\n"
        << "  --min-speech <ms>         Minimum speech segment in ms (default: 200)\n"
        << "  --min-silence <ms>        Minimum silence gap in ms (default: 300)\n"
        << "  --vad <energy|silero>     Segmentation strategy (default: energy)\n"
        << "  --model <onnx>            Silero VAD model path\n"
        << "  --config <json>           Configuration file\n"
        << "  --log-level <level>       DEBUG, INFO, WARN or ERROR\n"
        << "  --details                 Also print every turn and response time\n"
        << "  --help, -h                Show this help message\n";
}

CommandLineOptions parseCommandLine(int argc, const char* const argv[], Config& config) {
    CommandLineOptions options;

    // --config has to be known before any override is applied
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                throw ConfigurationException("Missing value for --config", "command line");
            }
            options.configPath = argv[++i];
        }
    }
    config = Config::load(options.configPath);

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigurationException("Missing value for " + arg, "command line");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--details") {
            options.showDetails = true;
        } else if (arg == "-o" || arg == "--output") {
            options.output = next();
        } else if (arg == "-t" || arg == "--threshold") {
            config.setThreshold(parseThreshold(next()));
        } else if (arg == "-a" || arg == "--speaker-a") {
            config.setSpeakerA(next());
        } else if (arg == "-b" || arg == "--speaker-b") {
            config.setSpeakerB(next());
        } else if (arg == "--frame-size") {
            config.setFrameMs(parseInt(arg, next()));
        } else if (arg == "--min-speech") {
            config.setMinSpeechMs(parseInt(arg, next()));
        } else if (arg == "--min-silence") {
            config.setMinSilenceMs(parseInt(arg, next()));
        } else if (arg == "--vad") {
            config.setVadStrategy(next());
        } else if (arg == "--model") {
            config.setModelPath(next());
        } else if (arg == "--log-level") {
            config.setLogLevel(next());
        } else if (arg == "--config") {
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigurationException("Unknown option: " + arg, "command line");
        } else if (options.input.empty()) {
            options.input = arg;
        } else {
            throw ConfigurationException("Unexpected argument: " + arg, "command line");
        }
    }

    if (options.output.empty() && !options.input.empty()) {
        options.output = defaultOutputPath(options.input);
    }
    return options;
}

} // namespace utils
} // namespace convo
