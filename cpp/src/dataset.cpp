#include "riskscore/dataset.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <stdexcept>

#include "riskscore/common.hpp"
#include "riskscore/errors.hpp"

namespace riskscore {

namespace {

std::optional<double> parse_cell(const std::string& raw) {
    const auto cell = strip_quotes(trim(raw));
    if (cell.empty()) {
        return std::nullopt;
    }
    const auto lowered = to_lower(cell);
    if (lowered == "true") {
        return 1.0;
    }
    if (lowered == "false") {
        return 0.0;
    }
    try {
        size_t consumed = 0;
        const double value = std::stod(cell, &consumed);
        if (consumed != cell.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

}  // namespace

std::size_t Dataset::positives() const {
    return static_cast<std::size_t>(std::count_if(examples.begin(), examples.end(),
                                                  [](const LabeledExample& e) { return e.label == 1; }));
}

Dataset parse_dataset_csv(std::istream& input, const std::string& source) {
    std::string line;
    if (!std::getline(input, line)) {
        throw SchemaError("dataset " + source + " is empty");
    }

    std::vector<std::string> header;
    for (auto& column : split(line, ',')) {
        header.push_back(strip_quotes(trim(column)));
    }

    std::array<std::optional<size_t>, kFeatureCount> feature_columns{};
    std::optional<size_t> label_column;
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == kLabelColumn) {
            label_column = i;
        } else if (auto feature = feature_from_name(header[i])) {
            feature_columns[feature_index(*feature)] = i;
        }
    }

    std::vector<std::string> missing;
    for (Feature feature : all_features()) {
        if (!feature_columns[feature_index(feature)].has_value()) {
            missing.push_back(feature_name(feature));
        }
    }
    if (!label_column.has_value()) {
        missing.push_back(kLabelColumn);
    }
    if (!missing.empty()) {
        throw SchemaError("missing required columns: " + join(missing, ", "), missing);
    }

    Dataset dataset;
    size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        auto cells = split(line, ',');
        if (cells.size() != header.size()) {
            throw SchemaError(source + ":" + std::to_string(line_number) + ": expected " +
                              std::to_string(header.size()) + " columns, found " + std::to_string(cells.size()));
        }

        LabeledExample example;
        for (Feature feature : all_features()) {
            const size_t column = *feature_columns[feature_index(feature)];
            auto value = parse_cell(cells[column]);
            if (!value.has_value()) {
                throw SchemaError(source + ":" + std::to_string(line_number) + ": invalid value '" +
                                      trim(cells[column]) + "' in column " + feature_name(feature),
                                  {feature_name(feature)});
            }
            example.features[feature_index(feature)] = *value;
        }

        auto label = parse_cell(cells[*label_column]);
        if (!label.has_value() || (*label != 0.0 && *label != 1.0)) {
            throw SchemaError(source + ":" + std::to_string(line_number) + ": label " + kLabelColumn +
                                  " must be 0 or 1",
                              {kLabelColumn});
        }
        example.label = static_cast<int>(*label);
        dataset.examples.push_back(example);
    }

    if (dataset.examples.empty()) {
        throw SchemaError("dataset " + source + " has no rows");
    }
    return dataset;
}

Dataset load_dataset_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open dataset: " + path);
    }
    return parse_dataset_csv(file, path);
}

}  // namespace riskscore
