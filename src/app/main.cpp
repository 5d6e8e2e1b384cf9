#include <iostream>
#include <memory>
#include <string>

#include "analysis/conversation_analyzer.hpp"
#include "analysis/stats_report.hpp"
#include "audio/speech_segmenter.hpp"
#include "audio/wav_reader.hpp"
#include "utils/command_line.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

int main(int argc, char* argv[]) {
    using namespace convo;

    utils::Logger::initialize();
    utils::ErrorContext context("convo-analyzer");

    try {
        utils::Config config;
        utils::CommandLineOptions options = utils::parseCommandLine(argc, argv, config);
        if (options.showHelp) {
            utils::printUsage(std::cout, argv[0]);
            return 0;
        }
        if (options.input.empty()) {
            utils::printUsage(std::cerr, argv[0]);
            return 1;
        }

        config.validate();
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

        utils::Logger::info("Loading " + options.input);
        audio::StereoAudio recording = audio::WavReader::loadStereo(options.input);
        utils::Logger::info("Sample rate: " + std::to_string(recording.sampleRate) +
                            " Hz, duration: " + std::to_string(recording.durationSeconds()) + "s");

        audio::SegmenterConfig segmenterConfig;
        segmenterConfig.frameMs = config.getFrameMs();
        segmenterConfig.threshold = config.getThreshold();
        segmenterConfig.minSpeechMs = config.getMinSpeechMs();
        segmenterConfig.minSilenceMs = config.getMinSilenceMs();

        std::shared_ptr<const audio::SpeechSegmenter> segmenter =
            audio::createSegmenter(config.getVadStrategy(), config.getModelPath());
        utils::Logger::info("Detecting speech with " + segmenter->name() + " segmentation");

        analysis::ConversationAnalyzer analyzer(segmenter, segmenterConfig, config.getSpeakerA(),
                                                config.getSpeakerB());
        analysis::ChannelSegments segments =
            analyzer.segmentChannels(recording.left, recording.right, recording.sampleRate);
        utils::Logger::info(config.getSpeakerA() + ": " +
                            std::to_string(segments.speakerA.size()) + " speech segments");
        utils::Logger::info(config.getSpeakerB() + ": " +
                            std::to_string(segments.speakerB.size()) + " speech segments");

        analysis::ConversationStats stats =
            analysis::computeStats(segments.speakerA, segments.speakerB,
                                   recording.durationSeconds(), config.getSpeakerA(),
                                   config.getSpeakerB());

        std::cout << analysis::StatsReport::formatSummary(stats) << std::endl;
        if (options.showDetails) {
            std::cout << "Turns (" << stats.turns.size() << ")\n"
                      << analysis::StatsReport::formatTurns(stats) << "\n"
                      << "Response times\n"
                      << analysis::StatsReport::formatResponseTimes(stats) << std::endl;
        }

        analysis::StatsReport::writeJson(stats, options.output);
        utils::Logger::info("Stats written to " + options.output);

    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, utils::ErrorContext::getCurrentContext());
        return 1;
    }

    return 0;
}
