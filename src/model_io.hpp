#pragma once

// model_io.hpp — single-file persistence for TrainedModel
//
// File layout (text header, binary payload):
//
//   ANOMALY_MODEL 1
//   kind <classifier kind>
//   features <n>
//   <feature name>            (n lines, training order)
//   importance <n>            (optional section)
//   <feature name> <weight>   (n lines, descending)
//   state <byte count>
//   <classifier state bytes>
//
// Readers treat a missing importance section as "no ranking recorded".

#include "anomaly_errors.hpp"
#include "classifier.hpp"
#include "trained_model.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace model_io {

constexpr const char* MODEL_MAGIC = "ANOMALY_MODEL";
constexpr int MODEL_FORMAT_VERSION = 1;

namespace detail {

inline std::runtime_error corrupt(const std::string& path, const std::string& why) {
    return std::runtime_error("Corrupt model file " + path + ": " + why);
}

// Reads "<key> <value>" and checks the key.
inline std::string read_keyed_line(std::istream& in, const std::string& key,
                                   const std::string& path) {
    std::string line;
    if (!std::getline(in, line)) throw corrupt(path, "missing '" + key + "' line");
    std::istringstream ls(line);
    std::string k, value;
    ls >> k >> value;
    if (k != key || value.empty()) {
        throw corrupt(path, "expected '" + key + "', found '" + line + "'");
    }
    return value;
}

inline size_t parse_count(const std::string& text, const std::string& path) {
    try {
        size_t consumed = 0;
        long long v = std::stoll(text, &consumed);
        if (consumed != text.size() || v < 0) throw std::invalid_argument(text);
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        throw corrupt(path, "invalid count '" + text + "'");
    }
}

}  // namespace detail

// Writes model to path, creating parent directories. Throws on any failure.
inline void save_model(const TrainedModel& model, const std::string& path) {
    if (!model.classifier) {
        throw ModelNotTrained();
    }

    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::string state = model.classifier->serialize();

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open model file for writing: " + path);
        }

        out << MODEL_MAGIC << " " << MODEL_FORMAT_VERSION << "\n";
        out << "kind " << model.classifier->kind() << "\n";
        out << "features " << model.features.size() << "\n";
        for (const auto& f : model.features) out << f << "\n";
        if (model.importance) {
            out << "importance " << model.importance->size() << "\n";
            out << std::setprecision(9);
            for (const auto& fi : *model.importance) out << fi.feature << " " << fi.weight << "\n";
        }
        out << "state " << state.size() << "\n";
        out.write(state.data(), static_cast<std::streamsize>(state.size()));
        out.flush();

        if (!out) {
            throw std::runtime_error("Failed to save model to: " + path);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error saving anomaly model to {}: {}", path, e.what());
        throw;
    }

    spdlog::info("Anomaly model saved to {} ({} features)", path, model.features.size());
}

// Restores a model written by save_model. The classifier is created through
// factory using the kind recorded in the file.
inline TrainedModel load_model(const std::string& path, const ClassifierFactory& factory) {
    if (!std::filesystem::exists(path)) {
        spdlog::error("Model file {} does not exist", path);
        throw ModelFileNotFound(path);
    }

    TrainedModel model;
    try {
        spdlog::info("Loading anomaly model from {}", path);

        std::ifstream in(path, std::ios::binary);
        if (!in) throw std::runtime_error("Failed to open model file: " + path);

        auto version = detail::read_keyed_line(in, MODEL_MAGIC, path);
        if (detail::parse_count(version, path) > static_cast<size_t>(MODEL_FORMAT_VERSION)) {
            throw detail::corrupt(path, "unsupported format version " + version);
        }

        auto kind = detail::read_keyed_line(in, "kind", path);

        size_t n_features = detail::parse_count(detail::read_keyed_line(in, "features", path), path);
        if (n_features == 0) throw detail::corrupt(path, "empty feature list");
        for (size_t i = 0; i < n_features; ++i) {
            std::string name;
            if (!std::getline(in, name) || name.empty()) {
                throw detail::corrupt(path, "truncated feature list");
            }
            model.features.push_back(name);
        }

        std::string line;
        if (!std::getline(in, line)) throw detail::corrupt(path, "missing state section");
        std::istringstream section(line);
        std::string key, count_text;
        section >> key >> count_text;

        if (key == "importance") {
            size_t n = detail::parse_count(count_text, path);
            std::vector<FeatureImportance> ranked;
            for (size_t i = 0; i < n; ++i) {
                if (!std::getline(in, line)) throw detail::corrupt(path, "truncated importance");
                std::istringstream ls(line);
                FeatureImportance fi;
                if (!(ls >> fi.feature >> fi.weight)) {
                    throw detail::corrupt(path, "bad importance line '" + line + "'");
                }
                ranked.push_back(fi);
            }
            model.importance = std::move(ranked);

            if (!std::getline(in, line)) throw detail::corrupt(path, "missing state section");
            section.clear();
            section.str(line);
            section >> key >> count_text;
        }

        if (key != "state") throw detail::corrupt(path, "expected 'state', found '" + line + "'");
        size_t n_bytes = detail::parse_count(count_text, path);
        std::string state(n_bytes, '\0');
        in.read(state.data(), static_cast<std::streamsize>(n_bytes));
        if (static_cast<size_t>(in.gcount()) != n_bytes) {
            throw detail::corrupt(path, "truncated classifier state");
        }

        model.classifier = factory(kind);
        if (!model.classifier) {
            throw std::runtime_error("Unknown classifier kind '" + kind + "' in " + path);
        }
        model.classifier->deserialize(state);
    } catch (const std::exception& e) {
        spdlog::error("Error loading anomaly model from {}: {}", path, e.what());
        throw;
    }

    spdlog::info("Anomaly model loaded: features [{}], importance {}",
                 join_names(model.features), model.importance ? "present" : "absent");
    return model;
}

}  // namespace model_io
