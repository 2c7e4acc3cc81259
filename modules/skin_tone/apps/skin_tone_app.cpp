#include <opencv2/core.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../interface/SkinToneAPI.hpp"
#include "../internal/advice/ColorAdvisor.hpp"
#include "../internal/config/Configuration.hpp"
#include <shared/utils/Logger.hpp>

using namespace SkinTone;

enum class Command { NONE, DETECT, MODIFY, RECOMMEND, COMPLEMENT };

struct AppSettings {
    Command command = Command::NONE;
    std::vector<std::string> arguments;
    std::string configFile;
    std::string outputDirectory;
    bool verbose = false;
};

void printUsage(const char* programName) {
    std::cout << "Skin Tone Color Advisor\n";
    std::cout << "Usage: " << programName << " [options] <command> <arguments>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  detect <image>                 Detect the dominant skin tone\n";
    std::cout << "  modify <image> <tone>          Shift skin pixels to Fair|Light|Medium|Dark|Deep\n";
    std::cout << "  recommend <tone>               Show colour palettes for a skin tone\n";
    std::cout << "  complement <r> <g> <b> [n]     Generate n complementary colours (1-360, default: 4)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (yml|json|xml)\n";
    std::cout << "  -o, --output-dir <dir>  Folder for modified images (default: upload folder)\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " detect portrait.jpg\n";
    std::cout << "  " << programName << " -o out/ modify portrait.jpg Light\n";
    std::cout << "  " << programName << " recommend Dark\n";
}

Command parseCommand(const std::string& name) {
    if (name == "detect") return Command::DETECT;
    if (name == "modify") return Command::MODIFY;
    if (name == "recommend") return Command::RECOMMEND;
    if (name == "complement") return Command::COMPLEMENT;
    return Command::NONE;
}

AppSettings parseArguments(int argc, char* argv[]) {
    AppSettings settings;
    std::vector<std::string> positionalArgs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                settings.configFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a value\n";
                exit(1);
            }
        } else if (arg == "-o" || arg == "--output-dir") {
            if (i + 1 < argc) {
                settings.outputDirectory = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a value\n";
                exit(1);
            }
        } else if (arg[0] != '-' || arg.size() == 1) {
            positionalArgs.push_back(arg);
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            exit(1);
        }
    }

    if (positionalArgs.empty()) {
        std::cerr << "Error: Expected a command\n";
        printUsage(argv[0]);
        exit(1);
    }

    settings.command = parseCommand(positionalArgs[0]);
    settings.arguments.assign(positionalArgs.begin() + 1, positionalArgs.end());

    size_t expectedMin = 0, expectedMax = 0;
    switch (settings.command) {
        case Command::DETECT:
            expectedMin = expectedMax = 1;
            break;
        case Command::MODIFY:
            expectedMin = expectedMax = 2;
            break;
        case Command::RECOMMEND:
            expectedMin = expectedMax = 1;
            break;
        case Command::COMPLEMENT:
            expectedMin = 3;
            expectedMax = 4;
            break;
        case Command::NONE:
            std::cerr << "Error: Unknown command " << positionalArgs[0] << "\n";
            printUsage(argv[0]);
            exit(1);
    }

    if (settings.arguments.size() < expectedMin || settings.arguments.size() > expectedMax) {
        std::cerr << "Error: Wrong number of arguments for " << positionalArgs[0] << "\n";
        printUsage(argv[0]);
        exit(1);
    }

    return settings;
}

void printRecommendation(const Domain::Recommendation& recommendation) {
    std::cout << "Recommended colours for " << Types::toString(recommendation.band) << " skin:\n";
    for (const auto& palette : recommendation.palettes) {
        std::cout << "  " << palette.name << ":";
        for (const auto& color : palette.colors) std::cout << " " << color;
        std::cout << "\n";
    }

    std::cout << "Colours to avoid:";
    for (const auto& color : recommendation.avoid) std::cout << " " << color;
    std::cout << "\n";
}

int reportFailure(Types::ErrorKind error, const std::string& details) {
    std::cerr << "Error: " << Interface::describeError(error) << "\n";
    LOG_DEBUG("Failure details: ", details);
    return 2;
}

int runDetect(const Interface::ISkinToneService& service, const AppSettings& settings) {
    Domain::ToneSession session;
    Domain::ToneAnalysis analysis = service.detectFromFile(session, settings.arguments[0]);
    if (!analysis.isSuccess()) {
        return reportFailure(analysis.getError(), analysis.getErrorMessage());
    }

    const Types::RGBColor& rgb = analysis.getAverageRGB();
    const Types::HSVColor& hsv = analysis.getAverageHSV();

    std::cout << "Skin tone: " << analysis.getToneName() << "\n";
    std::cout << "  Average RGB: (" << rgb[0] << ", " << rgb[1] << ", " << rgb[2] << ")\n";
    std::cout << "  Average HSV: (" << hsv[0] << ", " << hsv[1] << ", " << hsv[2] << ")\n";
    std::cout << "  Skin pixels: " << analysis.getSkinPixelCount() << " ("
              << analysis.getSkinCoverage() * 100.0f << "% of image)\n\n";

    printRecommendation(service.recommend(analysis.getTone()));
    return 0;
}

int runModify(const Interface::ISkinToneService& service, const AppSettings& settings) {
    Domain::ToneSession session(settings.arguments[0]);
    Interface::ModifyResult result = service.modifySessionImage(session, settings.arguments[1]);
    if (!result.success) {
        return reportFailure(result.error, result.errorMessage);
    }

    std::cout << "Modified image saved to " << result.outputPath << "\n";
    std::cout << "  Target tone: " << Types::toString(result.targetTone) << "\n";
    std::cout << "  Pixels changed: " << result.modifiedPixels << "\n";
    return 0;
}

int runRecommend(const Interface::ISkinToneService& service, const AppSettings& settings) {
    printRecommendation(service.recommend(settings.arguments[0]));
    return 0;
}

int runComplement(const Interface::ISkinToneService& service, const AppSettings& settings) {
    Types::RGBColor base;
    int count = 4;
    try {
        for (int i = 0; i < 3; ++i) {
            int channel = std::stoi(settings.arguments[i]);
            if (channel < 0 || channel > 255) {
                std::cerr << "Error: Colour channels must be between 0 and 255\n";
                return 1;
            }
            base[i] = channel;
        }
        if (settings.arguments.size() == 4) count = std::stoi(settings.arguments[3]);
    } catch (const std::exception&) {
        std::cerr << "Error: Colour channels and count must be integers\n";
        return 1;
    }

    const int maxCount = Internal::Advice::ColorAdvisor::MAX_COMPLEMENTARY_COUNT;
    if (count < 1 || count > maxCount) {
        std::cerr << "Error: Colour count must be between 1 and " << maxCount << "\n";
        return 1;
    }

    for (const auto& color : service.generateComplementaryColors(base, count)) {
        std::cout << color << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    AppSettings settings = parseArguments(argc, argv);

    auto config = std::make_shared<Internal::Config::Configuration>();
    if (!settings.configFile.empty() && !config->loadFromFile(settings.configFile)) {
        std::cerr << "Error: Cannot load configuration " << settings.configFile << "\n";
        return 1;
    }
    if (!settings.outputDirectory.empty()) {
        config->setUploadFolder(settings.outputDirectory);
    }
    config->validate();

    if (settings.verbose || config->isDebug()) {
        Shared::Logger::getInstance().setLevel(Shared::LogLevel::DEBUG);
    } else if (!Shared::Logger::getInstance().setLevel(config->getLogLevel())) {
        LOG_WARN("Ignoring unknown log level ", config->getLogLevel());
    }

    auto service = Interface::createSkinToneService(config);

    switch (settings.command) {
        case Command::DETECT:
            return runDetect(*service, settings);
        case Command::MODIFY:
            return runModify(*service, settings);
        case Command::RECOMMEND:
            return runRecommend(*service, settings);
        case Command::COMPLEMENT:
            return runComplement(*service, settings);
        case Command::NONE:
            break;
    }
    return 1;
}
