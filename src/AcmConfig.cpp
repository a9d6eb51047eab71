#include "AcmConfig.h"
#include "AcMapExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw AcMap::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const AcMap::AcMapException&) {
        throw;
    } catch (const std::exception& ex) {
        throw AcMap::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    if (!value.empty() && value.front() == '-') {
        throw AcMap::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw AcMap::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw AcMap::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw AcMap::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw AcMap::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw AcMap::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(maybeUnquote(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(AcmConfig& config, const std::string& key, const std::string& value) {
    static const std::unordered_map<std::string, std::string AcmConfig::*> rawStringFields = {
        {"assets_dir", &AcmConfig::assetsDir},
        {"report", &AcmConfig::reportFile}
    };
    static const std::unordered_map<std::string, bool AcmConfig::*> boolFields = {
        {"plot", &AcmConfig::plotGraph},
        {"print_weights", &AcmConfig::printWeights},
        {"verbose", &AcmConfig::verbose}
    };
    static const std::unordered_map<std::string, size_t AcmConfig::*> sizeFields = {
        {"dimensions", &AcmConfig::dimensions},
        {"samples", &AcmConfig::sampleCount}
    };
    static const std::unordered_map<std::string, double AcmConfig::*> doubleFields = {
        {"contraction", &AcmConfig::contraction},
        {"convergence_threshold", &AcmConfig::convergenceThreshold}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second) = parseSizeStrict(value, key, 1);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (key == "fixture") {
        config.fixture = CommonUtils::toLower(value);
        return;
    }
    if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
        return;
    }
    if (key == "plot_format") {
        config.plot.format = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_theme") {
        config.plot.theme = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_width" || key == "plot_height") {
        const size_t px = parseSizeStrict(value, key, 64);
        if (px > 16384) throw AcMap::ConfigurationException("Value for " + key + " must be <= 16384");
        (key == "plot_width" ? config.plot.width : config.plot.height) = static_cast<int>(px);
        return;
    }
    throw AcMap::ConfigurationException("Unknown configuration key: " + key);
}
} // namespace

std::string AcmConfig::usage() {
    return "Usage: acmap [--config path] [--dimensions N] [--contraction C>1] [--samples N] "
           "[--fixture correlated|random] [--seed N] [--convergence-threshold 0..1] "
           "[--plot true|false] [--assets-dir dir] [--report file.md] [--plot-format png|svg|pdf] "
           "[--plot-theme light|dark] [--print-weights true|false] [--verbose true|false] [--help]";
}

AcmConfig AcmConfig::fromFile(const std::string& configPath, const AcmConfig& base) {
    std::ifstream in(configPath);
    if (!in) {
        throw AcMap::ConfigurationException("Unable to open config file: " + configPath);
    }

    AcmConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = CommonUtils::trim(line);
        if (line.empty() || line == "{" || line == "}") continue;
        if (line.back() == ',') line.pop_back();

        const size_t sep = line.find(':');
        if (sep == std::string::npos) {
            throw AcMap::ConfigurationException("Malformed line " + std::to_string(lineNo) + " in " + configPath +
                                                " (expected key: value)");
        }
        const std::string key = normalizeConfigKey(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        assignKeyValue(config, key, value);
    }
    return config;
}

AcmConfig AcmConfig::fromArgs(int argc, char* argv[]) {
    AcmConfig config;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw AcMap::ConfigurationException("--config expects a path");
            config = fromFile(argv[i + 1], config);
            break;
        }
    }

    static const std::unordered_map<std::string, std::string> flagToKey = {
        {"--dimensions", "dimensions"},
        {"--contraction", "contraction"},
        {"--samples", "samples"},
        {"--fixture", "fixture"},
        {"--seed", "seed"},
        {"--convergence-threshold", "convergence_threshold"},
        {"--plot", "plot"},
        {"--assets-dir", "assets_dir"},
        {"--report", "report"},
        {"--plot-format", "plot_format"},
        {"--plot-theme", "plot_theme"},
        {"--print-weights", "print_weights"},
        {"--verbose", "verbose"}
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        const auto it = flagToKey.find(arg);
        if (it == flagToKey.end()) {
            throw AcMap::ConfigurationException("Unknown argument: " + arg + "\n" + usage());
        }
        if (i + 1 >= argc) {
            throw AcMap::ConfigurationException(arg + " expects a value");
        }
        assignKeyValue(config, it->second, argv[++i]);
    }

    if (!config.showHelp) config.validate();
    return config;
}

void AcmConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (dimensions < 1) {
        throw AcMap::ConfigurationException("dimensions must be >= 1");
    }
    if (!(contraction > 1.0) || !std::isfinite(contraction)) {
        throw AcMap::ConfigurationException("contraction must be finite and > 1");
    }
    if (sampleCount < 1) {
        throw AcMap::ConfigurationException("samples must be >= 1");
    }
    if (!(convergenceThreshold > 0.0 && convergenceThreshold < 1.0)) {
        throw AcMap::ConfigurationException("convergence_threshold must be within (0,1)");
    }
    if (!isIn(fixture, {"correlated", "random"})) {
        throw AcMap::ConfigurationException("fixture must be one of: correlated, random");
    }
    if (fixture == "random" && dimensions < 2) {
        throw AcMap::ConfigurationException("random fixture needs dimensions >= 2");
    }
    if (!isIn(plot.format, {"png", "svg", "pdf"})) {
        throw AcMap::ConfigurationException("plot_format must be one of: png, svg, pdf");
    }
    if (!isIn(plot.theme, {"light", "dark"})) {
        throw AcMap::ConfigurationException("plot_theme must be one of: light, dark");
    }
    if (plot.pointSize <= 0.0 || plot.lineWidth <= 0.0) {
        throw AcMap::ConfigurationException("plot point size and line width must be > 0");
    }
    if (assetsDir.empty() && (plotGraph || !reportFile.empty())) {
        throw AcMap::ConfigurationException("assets_dir must not be empty when plotting or reporting");
    }
}
