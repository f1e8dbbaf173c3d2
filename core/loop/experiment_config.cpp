#include "loop/experiment_config.hpp"
#include "errors/errors.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace specsel {

void ExperimentConfig::validate() const {
    if (batch_size <= 0) {
        throw InvariantError("batch_size must be positive, got " + std::to_string(batch_size));
    }
    if (max_iterations && *max_iterations <= 0) {
        throw InvariantError("max_iterations must be positive, got " +
                             std::to_string(*max_iterations));
    }
    if (diversity_shortlist_size <= 0) {
        throw InvariantError("diversity_shortlist_size must be positive, got " +
                             std::to_string(diversity_shortlist_size));
    }
    if (posterior_samples <= 0) {
        throw InvariantError("posterior_samples must be positive, got " +
                             std::to_string(posterior_samples));
    }
    if (joint_samples <= 0) {
        throw InvariantError("joint_samples must be positive, got " +
                             std::to_string(joint_samples));
    }
    if (label_budget && !(*label_budget > 0.0)) {
        throw InvariantError("label_budget must be positive");
    }
    if (fom_penalty < 0.0) {
        throw InvariantError("fom_penalty must not be negative");
    }
}

std::string ExperimentConfig::describe() const {
    std::ostringstream ss;
    ss << "query_strategy=" << strategyName()
       << " batch_size=" << batch_size
       << " max_iterations=";
    if (max_iterations) ss << *max_iterations; else ss << "until-pool-empty";
    ss << " random_seed=" << random_seed;
    if (query_strategy == StrategyKind::DIVERSITY) {
        ss << " diversity_shortlist_size=" << diversity_shortlist_size
           << " distance_metric=" << distanceMetricName(distance_metric);
    }
    if (query_strategy == StrategyKind::BATCH_BALD) {
        ss << " posterior_samples=" << posterior_samples
           << " joint_samples=" << joint_samples;
    }
    if (label_budget) ss << " label_budget=" << *label_budget;
    return ss.str();
}

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

long long parseInteger(const std::string& key, const std::string& value) {
    size_t used = 0;
    long long out = 0;
    try {
        out = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw InvariantError(key + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw InvariantError(key + ": expected an integer, got '" + value + "'");
    }
    return out;
}

int parseInt(const std::string& key, const std::string& value) {
    long long out = parseInteger(key, value);
    if (out < std::numeric_limits<int>::min() || out > std::numeric_limits<int>::max()) {
        throw InvariantError(key + ": " + value + " is out of range");
    }
    return static_cast<int>(out);
}

uint64_t parseSeed(const std::string& key, const std::string& value) {
    if (value[0] == '-') {
        throw InvariantError(key + ": expected a non-negative integer, got '" + value + "'");
    }
    size_t used = 0;
    unsigned long long out = 0;
    try {
        out = std::stoull(value, &used);
    } catch (const std::out_of_range&) {
        throw InvariantError(key + ": " + value + " is out of range");
    } catch (const std::exception&) {
        throw InvariantError(key + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw InvariantError(key + ": expected an integer, got '" + value + "'");
    }
    return static_cast<uint64_t>(out);
}

double parseReal(const std::string& key, const std::string& value) {
    size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(value, &used);
    } catch (const std::exception&) {
        throw InvariantError(key + ": expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw InvariantError(key + ": expected a number, got '" + value + "'");
    }
    return out;
}

} // namespace

ExperimentConfig parseConfig(const std::string& text) {
    ExperimentConfig config;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw InvariantError("config line " + std::to_string(line_no) +
                                 ": expected 'key = value'");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty() || value.empty()) {
            throw InvariantError("config line " + std::to_string(line_no) +
                                 ": empty key or value");
        }

        if (key == "query_strategy") {
            config.query_strategy = parseStrategyKind(value);
        } else if (key == "batch_size") {
            config.batch_size = parseInt(key, value);
        } else if (key == "max_iterations") {
            if (value == "until-pool-empty") {
                config.max_iterations.reset();
            } else {
                config.max_iterations = parseInt(key, value);
            }
        } else if (key == "random_seed") {
            config.random_seed = parseSeed(key, value);
        } else if (key == "diversity_shortlist_size") {
            config.diversity_shortlist_size = parseInt(key, value);
        } else if (key == "distance_metric") {
            config.distance_metric = parseDistanceMetric(value);
        } else if (key == "label_budget") {
            if (value == "unlimited") {
                config.label_budget.reset();
            } else {
                config.label_budget = parseReal(key, value);
            }
        } else if (key == "target_class") {
            config.target_class = parseInt(key, value);
        } else if (key == "fom_penalty") {
            config.fom_penalty = parseReal(key, value);
        } else if (key == "posterior_samples") {
            config.posterior_samples = parseInt(key, value);
        } else if (key == "joint_samples") {
            config.joint_samples = parseInt(key, value);
        } else {
            throw InvariantError("config line " + std::to_string(line_no) +
                                 ": unknown key '" + key + "'");
        }
    }

    config.validate();
    return config;
}

ExperimentConfig loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw Error("IOError", "cannot open config file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseConfig(buffer.str());
}

} // namespace specsel
