// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/filter_registry.hpp"
#include "logship/errors.hpp"

#include <glog/logging.h>

namespace logship {

std::vector<FilterSpec> parse_filter_description(const std::string& description) {
    std::vector<std::string> clauses = split_clauses(description, ',');
    if (clauses.empty()) {
        throw ConfigError("Empty filter description");
    }

    std::vector<FilterSpec> specs;
    specs.reserve(clauses.size());

    for (const auto& clause : clauses) {
        std::vector<std::string> parts = split_clauses(clause, ':');
        FilterSpec spec;
        if (!parts.empty()) {
            spec.name = parts[0];
            for (size_t i = 1; i < parts.size(); ++i) {
                spec.args.add(parts[i]);
            }
        }
        specs.push_back(std::move(spec));
    }

    return specs;
}

// =============================================================================
// Pipeline
// =============================================================================

Pipeline::Pipeline(std::vector<PipelineStage> stages)
    : stages_(std::move(stages)) {
}

void Pipeline::push(Event item, const Emit& emit) const {
    feed(0, std::move(item), emit);
}

void Pipeline::push_line(const std::string& line, const Emit& emit) const {
    feed(0, Event(line), emit);
}

size_t Pipeline::run(std::istream& input, const Emit& emit) const {
    size_t lines = 0;
    std::string line;
    while (std::getline(input, line)) {
        ++lines;
        push_line(line, emit);
    }
    VLOG(1) << "Pipeline consumed " << lines << " lines";
    return lines;
}

std::vector<std::string> Pipeline::stage_names() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage.name);
    }
    return names;
}

void Pipeline::feed(size_t index, Event item, const Emit& emit) const {
    if (index == stages_.size()) {
        emit(std::move(item));
        return;
    }

    stages_[index].filter(std::move(item), [this, index, &emit](Event next) {
        feed(index + 1, std::move(next), emit);
    });
}

// =============================================================================
// FilterRegistry
// =============================================================================

void FilterRegistry::add(const std::string& name, ParameterShape shape, FilterFactory factory) {
    if (filters_.count(name)) {
        throw DuplicateFilterError(name);
    }
    filters_.emplace(name, Entry{std::move(shape), std::move(factory)});
}

void FilterRegistry::add(const std::string& name, Filter filter) {
    add(name, ParameterShape{}, [filter](const Arguments&) { return filter; });
}

bool FilterRegistry::contains(const std::string& name) const {
    return filters_.count(name) > 0;
}

std::vector<std::string> FilterRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(filters_.size());
    for (const auto& kv : filters_) {
        out.push_back(kv.first);
    }
    return out;
}

Filter FilterRegistry::get(const FilterSpec& spec) const {
    auto it = filters_.find(spec.name);
    if (it == filters_.end()) {
        throw UnknownFilterError(spec.name);
    }

    validate_arguments(spec.name, it->second.shape, spec.args);
    return it->second.factory(spec.args);
}

Pipeline FilterRegistry::build(const std::string& description) const {
    std::vector<FilterSpec> specs = parse_filter_description(description);

    // Resolve every name before binding anything, so the error names the
    // first unknown filter even when an earlier clause has bad arguments
    for (const auto& spec : specs) {
        if (!contains(spec.name)) {
            throw UnknownFilterError(spec.name);
        }
    }

    std::vector<PipelineStage> stages;
    stages.reserve(specs.size());
    for (const auto& spec : specs) {
        stages.push_back(PipelineStage{spec.name, get(spec)});
    }

    LOG(INFO) << "Built filter pipeline: " << description;
    return Pipeline(std::move(stages));
}

}  // namespace logship
