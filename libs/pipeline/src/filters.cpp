// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/filters.hpp"

#include <glog/logging.h>

#include <cctype>

namespace logship {
namespace filters {

namespace {

// Event filters only operate on mappings; a raw line here means the
// pipeline is missing its init filter
bool require_event(const char* filter, const Event& item) {
    if (item.is_object()) {
        return true;
    }
    LOG(WARNING) << filter << ": skipping item that is not an event: " << dump_event(item);
    return false;
}

bool require_line(const char* filter, const Event& item) {
    if (item.is_string()) {
        return true;
    }
    LOG(WARNING) << filter << ": skipping item that is not a raw line: " << dump_event(item);
    return false;
}

// Returns @fields, creating it when absent. nullptr if it exists but is not
// a mapping.
Event* fields_of(const char* filter, Event& item) {
    auto it = item.find(keys::kFields);
    if (it == item.end()) {
        item[keys::kFields] = Event::object();
        return &item[keys::kFields];
    }
    if (!it->is_object()) {
        LOG(WARNING) << filter << ": skipping item whose " << keys::kFields
                     << " is not a mapping: " << dump_event(item);
        return nullptr;
    }
    return &*it;
}

}  // namespace

Filter init_txt() {
    return [](Event item, const Emit& emit) {
        if (!require_line("init_txt", item)) {
            return;
        }
        std::string line = item.get<std::string>();
        while (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        Event event = Event::object();
        event[keys::kMessage] = std::move(line);
        emit(std::move(event));
    };
}

Filter init_json() {
    return [](Event item, const Emit& emit) {
        if (!require_line("init_json", item)) {
            return;
        }
        const std::string& line = item.get_ref<const std::string&>();

        Event parsed;
        try {
            parsed = Event::parse(line);
        } catch (const Event::parse_error& e) {
            LOG(WARNING) << "init_json: could not parse JSON message \"" << line << "\"";
            LOG(WARNING) << "init_json: error was \"" << e.what() << "\"";
            return;
        }

        if (!parsed.is_object()) {
            LOG(WARNING) << "init_json: skipping message \"" << line << "\" (not a JSON object)";
            return;
        }
        emit(std::move(parsed));
    };
}

Filter add_timestamp(bool override_existing, Clock clock) {
    return [override_existing, clock](Event item, const Emit& emit) {
        if (!require_event("add_timestamp", item)) {
            return;
        }
        if (override_existing || !item.contains(keys::kTimestamp)) {
            item[keys::kTimestamp] = clock();
        }
        emit(std::move(item));
    };
}

Filter add_source_host(bool override_existing, std::string host) {
    return [override_existing, host](Event item, const Emit& emit) {
        if (!require_event("add_source_host", item)) {
            return;
        }
        if (override_existing || !item.contains(keys::kSourceHost)) {
            item[keys::kSourceHost] = host;
        }
        emit(std::move(item));
    };
}

Filter add_fields(std::vector<std::pair<std::string, std::string>> fields) {
    return [fields](Event item, const Emit& emit) {
        if (!require_event("add_fields", item)) {
            return;
        }
        Event* target = fields_of("add_fields", item);
        if (!target) {
            return;
        }
        for (const auto& [key, value] : fields) {
            (*target)[key] = value;
        }
        emit(std::move(item));
    };
}

Filter add_tags(std::vector<std::string> tags) {
    return [tags](Event item, const Emit& emit) {
        if (!require_event("add_tags", item)) {
            return;
        }
        auto it = item.find(keys::kTags);
        if (it == item.end() || !it->is_array()) {
            item[keys::kTags] = Event::array();
        }
        Event& target = item[keys::kTags];
        for (const auto& tag : tags) {
            target.push_back(tag);
        }
        emit(std::move(item));
    };
}

Filter parse_lograge() {
    return [](Event item, const Emit& emit) {
        if (!require_event("parse_lograge", item)) {
            return;
        }
        auto message = item.find(keys::kMessage);
        if (message == item.end()) {
            LOG(WARNING) << "parse_lograge: skipping item missing \"" << keys::kMessage
                         << "\" key (\"" << dump_event(item) << "\")";
            return;
        }
        if (!message->is_string()) {
            LOG(WARNING) << "parse_lograge: skipping item whose " << keys::kMessage
                         << " is not a string (\"" << dump_event(item) << "\")";
            return;
        }
        std::string text = message->get<std::string>();

        Event* target = fields_of("parse_lograge", item);
        if (!target) {
            return;
        }

        size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            size_t end = pos;
            while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
                ++end;
            }
            if (end > pos) {
                std::string token = text.substr(pos, end - pos);
                size_t eq = token.find('=');
                if (eq != std::string::npos) {
                    (*target)[token.substr(0, eq)] = token.substr(eq + 1);
                }
            }
            pos = end;
        }
        emit(std::move(item));
    };
}

}  // namespace filters

void register_builtin_filters(FilterRegistry& registry) {
    ParameterShape overridable;
    overridable.keywords = {"override"};

    ParameterShape any_keywords;
    any_keywords.any_keyword = true;

    ParameterShape any_positional;
    any_positional.max_positional = ParameterShape::kUnbounded;

    registry.add("init_txt", filters::init_txt());
    registry.add("init_json", filters::init_json());

    registry.add("add_timestamp", overridable, [](const Arguments& args) {
        return filters::add_timestamp(args.get_bool("override", false));
    });

    registry.add("add_source_host", overridable, [](const Arguments& args) {
        return filters::add_source_host(args.get_bool("override", false), source_host_fqdn());
    });

    registry.add("add_fields", any_keywords, [](const Arguments& args) {
        return filters::add_fields(args.keywords);
    });

    registry.add("add_tags", any_positional, [](const Arguments& args) {
        return filters::add_tags(args.positional);
    });

    registry.add("parse_lograge", filters::parse_lograge());
}

}  // namespace logship
